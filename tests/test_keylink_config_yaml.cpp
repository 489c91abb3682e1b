#include "doctest.h"

#include "keylink/config/keylink_config_yaml_store.h"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using keylink::config::KeylinkConfig;
using keylink::config::YamlConfigStore;
using keylink::config::config_from_yaml;
using keylink::config::config_to_yaml;

namespace {

// Scratch file under /tmp, removed on scope exit.
struct TempPath {
    std::string path;

    explicit TempPath(const char* stem)
        : path(std::string("/tmp/") + stem + "_" + std::to_string(::getpid()) + ".yaml")
    {
        std::remove(path.c_str());
    }

    ~TempPath() { std::remove(path.c_str()); }
};

void write_file(const std::string& path, const std::string& text)
{
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

} // namespace

TEST_CASE("Empty document yields defaults")
{
    const KeylinkConfig cfg = config_from_yaml("");
    REQUIRE(cfg.device.filters.size() == 1);
    CHECK(cfg.device.filters[0].usagePage == std::optional<std::uint16_t>(0xFF60));
    CHECK(cfg.device.filters[0].usage == std::optional<std::uint16_t>(0x61));
    CHECK(cfg.protocol.commandTimeout == std::chrono::milliseconds(1000));
    CHECK(cfg.protocol.chunkSize == 22);
    CHECK(cfg.protocol.renewFraction == doctest::Approx(0.9));
}

TEST_CASE("Filters accept hex and decimal ids")
{
    const KeylinkConfig cfg = config_from_yaml(R"(
device:
  filters:
    - vendor_id: 0x4653
      product_id: 1
      usage_page: 0xFF60
      usage: 97
    - usage_page: 65376
)");

    REQUIRE(cfg.device.filters.size() == 2);
    const auto& a = cfg.device.filters[0];
    CHECK(a.vendorId == std::optional<std::uint16_t>(0x4653));
    CHECK(a.productId == std::optional<std::uint16_t>(1));
    CHECK(a.usagePage == std::optional<std::uint16_t>(0xFF60));
    CHECK(a.usage == std::optional<std::uint16_t>(0x61));

    const auto& b = cfg.device.filters[1];
    CHECK_FALSE(b.vendorId.has_value());
    CHECK_FALSE(b.usage.has_value());
    CHECK(b.usagePage == std::optional<std::uint16_t>(0xFF60));
}

TEST_CASE("Bad ids are rejected")
{
    CHECK_THROWS_AS(config_from_yaml("device:\n  filters:\n    - vendor_id: 0x10000\n"), std::runtime_error);
    CHECK_THROWS_AS(config_from_yaml("device:\n  filters:\n    - vendor_id: abc\n"), std::exception);
}

TEST_CASE("Protocol section overrides and renew fraction clamp")
{
    KeylinkConfig cfg = config_from_yaml(R"(
protocol:
  command_timeout_ms: 250
  bootstrap_attempts: 2
  bootstrap_reads_per_attempt: 7
  bootstrap_read_timeout_ms: 40
  renew_fraction: 0.5
  chunk_size: 16
  max_definition_size: 4096
)");
    CHECK(cfg.protocol.commandTimeout == std::chrono::milliseconds(250));
    CHECK(cfg.protocol.bootstrapAttempts == 2);
    CHECK(cfg.protocol.bootstrapReadsPerAttempt == 7);
    CHECK(cfg.protocol.bootstrapReadTimeout == std::chrono::milliseconds(40));
    CHECK(cfg.protocol.renewFraction == doctest::Approx(0.5));
    CHECK(cfg.protocol.chunkSize == 16);
    CHECK(cfg.protocol.maxDefinitionSize == 4096);

    cfg = config_from_yaml("protocol:\n  renew_fraction: 1.5\n");
    CHECK(cfg.protocol.renewFraction == doctest::Approx(0.9));
}

TEST_CASE("Emitted YAML parses back to the same config")
{
    KeylinkConfig cfg;
    cfg.device.filters.clear();
    keylink::hid::HidFilter f;
    f.vendorId  = 0xFEED;
    f.usagePage = 0xFF60;
    cfg.device.filters.push_back(f);
    cfg.protocol.commandTimeout = std::chrono::milliseconds(750);
    cfg.protocol.chunkSize      = 20;

    const std::string text = config_to_yaml(cfg);
    CHECK(text.find("0xFEED") != std::string::npos);

    const KeylinkConfig back = config_from_yaml(text);
    REQUIRE(back.device.filters.size() == 1);
    CHECK(back.device.filters[0].vendorId == f.vendorId);
    CHECK(back.device.filters[0].usagePage == f.usagePage);
    CHECK_FALSE(back.device.filters[0].productId.has_value());
    CHECK(back.protocol.commandTimeout == std::chrono::milliseconds(750));
    CHECK(back.protocol.chunkSize == 20);
}

TEST_CASE("YamlConfigStore load and save")
{
    TempPath tmp("keylink_cfg");
    YamlConfigStore store(tmp.path);

    SUBCASE("missing file gives defaults") {
        const KeylinkConfig cfg = store.load();
        CHECK(cfg.device.filters.size() == 1);
        CHECK(cfg.protocol.chunkSize == 22);
    }

    SUBCASE("malformed file gives defaults") {
        write_file(tmp.path, "protocol: [unterminated\n");
        const KeylinkConfig cfg = store.load();
        CHECK(cfg.protocol.commandTimeout == std::chrono::milliseconds(1000));
    }

    SUBCASE("saved config is loaded back") {
        KeylinkConfig cfg;
        cfg.protocol.bootstrapAttempts = 9;
        store.save(cfg);

        const KeylinkConfig back = store.load();
        CHECK(back.protocol.bootstrapAttempts == 9);
    }

    SUBCASE("unwritable path throws") {
        YamlConfigStore bad("/nonexistent-dir/keylink.yaml");
        CHECK_THROWS_AS(bad.save(KeylinkConfig{}), std::runtime_error);
    }
}
