#include "keylink/config/keylink_config_yaml_store.h"
#include "keylink/core/logging.h"

#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace keylink::config {

static constexpr const char* TAG = "config";

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

// HID ids are conventionally written in hex; accept "0xFF60" or 65376.
static std::optional<std::uint16_t> get_id(const YAML::Node& obj, const char* key)
{
    auto n = obj[key];
    if (!n) {
        return std::nullopt;
    }
    const auto text = n.as<std::string>();
    std::size_t used = 0;
    const unsigned long v = std::stoul(text, &used, 0);
    if (used != text.size() || v > 0xFFFF) {
        throw std::runtime_error(std::string("bad HID id for '") + key + "': " + text);
    }
    return static_cast<std::uint16_t>(v);
}

static std::string hex16(std::uint16_t v)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%04X", v);
    return buf;
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, hid::HidFilter& out)
{
    out.vendorId  = get_id(node, "vendor_id");
    out.productId = get_id(node, "product_id");
    out.usagePage = get_id(node, "usage_page");
    out.usage     = get_id(node, "usage");
}

static void from_yaml(const YAML::Node& node, ProtocolConfig& out)
{
    const ProtocolConfig def{};

    out.commandTimeout = std::chrono::milliseconds(
        get_or<long>(node, "command_timeout_ms", static_cast<long>(def.commandTimeout.count())));
    out.bootstrapAttempts        = get_or<unsigned>(node, "bootstrap_attempts", def.bootstrapAttempts);
    out.bootstrapReadsPerAttempt = get_or<unsigned>(node, "bootstrap_reads_per_attempt",
                                                    def.bootstrapReadsPerAttempt);
    out.bootstrapReadTimeout = std::chrono::milliseconds(
        get_or<long>(node, "bootstrap_read_timeout_ms",
                     static_cast<long>(def.bootstrapReadTimeout.count())));
    out.renewFraction     = get_or<double>(node, "renew_fraction", def.renewFraction);
    out.chunkSize         = get_or<std::size_t>(node, "chunk_size", def.chunkSize);
    out.maxDefinitionSize = get_or<std::size_t>(node, "max_definition_size", def.maxDefinitionSize);

    if (out.renewFraction <= 0.0 || out.renewFraction > 1.0) {
        KL_LOGW(TAG, "renew_fraction %.3f out of (0, 1], using %.2f", out.renewFraction, def.renewFraction);
        out.renewFraction = def.renewFraction;
    }
}

// Top-level KeylinkConfig mapper.
static void from_yaml(const YAML::Node& root, KeylinkConfig& cfg)
{
    if (auto dev = root["device"]) {
        if (auto filters = dev["filters"]; filters && filters.IsSequence()) {
            cfg.device.filters.clear();
            for (const auto& fn : filters) {
                hid::HidFilter f{};
                from_yaml(fn, f);
                cfg.device.filters.push_back(f);
            }
        }
    }

    if (auto n = root["protocol"]) {
        from_yaml(n, cfg.protocol);
    }
}

// ---------- to_yaml ----------

static void to_yaml(YAML::Emitter& out, const KeylinkConfig& cfg)
{
    out << YAML::BeginMap;

    // device:
    out << YAML::Key << "device" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "filters" << YAML::Value << YAML::BeginSeq;
    for (const auto& f : cfg.device.filters) {
        out << YAML::BeginMap;
        if (f.vendorId)  out << YAML::Key << "vendor_id"  << YAML::Value << hex16(*f.vendorId);
        if (f.productId) out << YAML::Key << "product_id" << YAML::Value << hex16(*f.productId);
        if (f.usagePage) out << YAML::Key << "usage_page" << YAML::Value << hex16(*f.usagePage);
        if (f.usage)     out << YAML::Key << "usage"      << YAML::Value << hex16(*f.usage);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    // protocol:
    const auto& p = cfg.protocol;
    out << YAML::Key << "protocol" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "command_timeout_ms"          << YAML::Value << static_cast<long>(p.commandTimeout.count());
    out << YAML::Key << "bootstrap_attempts"          << YAML::Value << p.bootstrapAttempts;
    out << YAML::Key << "bootstrap_reads_per_attempt" << YAML::Value << p.bootstrapReadsPerAttempt;
    out << YAML::Key << "bootstrap_read_timeout_ms"   << YAML::Value << static_cast<long>(p.bootstrapReadTimeout.count());
    out << YAML::Key << "renew_fraction"              << YAML::Value << p.renewFraction;
    out << YAML::Key << "chunk_size"                  << YAML::Value << p.chunkSize;
    out << YAML::Key << "max_definition_size"         << YAML::Value << p.maxDefinitionSize;
    out << YAML::EndMap;

    out << YAML::EndMap; // root
}

KeylinkConfig config_from_yaml(const std::string& text)
{
    KeylinkConfig cfg{};
    if (text.empty()) {
        return cfg;
    }
    from_yaml(YAML::Load(text), cfg);
    return cfg;
}

std::string config_to_yaml(const KeylinkConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    return out.c_str();
}

// ---------- YamlConfigStore methods ----------

YamlConfigStore::YamlConfigStore(std::string path)
    : _path(std::move(path))
{
}

KeylinkConfig YamlConfigStore::load()
{
    std::ifstream in(_path);
    if (!in) {
        KL_LOGI(TAG, "Config '%s' not found; using defaults", _path.c_str());
        return KeylinkConfig{};
    }

    std::ostringstream text;
    text << in.rdbuf();

    try {
        KeylinkConfig cfg = config_from_yaml(text.str());
        KL_LOGI(TAG, "Loaded config from '%s'", _path.c_str());
        return cfg;
    } catch (const std::exception& ex) {
        KL_LOGE(TAG, "Failed to parse config '%s': %s; using defaults", _path.c_str(), ex.what());
        return KeylinkConfig{};
    }
}

void YamlConfigStore::save(const KeylinkConfig& cfg)
{
    const std::string text = config_to_yaml(cfg);

    std::ofstream out(_path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("open for write failed: " + _path);
    }
    out << text << '\n';
    if (!out) {
        throw std::runtime_error("short write while saving config: " + _path);
    }

    KL_LOGI(TAG, "Saved config to '%s'", _path.c_str());
}

} // namespace keylink::config
