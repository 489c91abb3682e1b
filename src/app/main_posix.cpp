#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "keylink/config/keylink_config_yaml_store.h"
#include "keylink/core/errors.h"
#include "keylink/core/logging.h"
#include "keylink/platform/posix/hidapi_backend.h"
#include "keylink/session/keyboard_commands.h"
#include "keylink/session/keyboard_device.h"
#include "keylink/session/nonce_source.h"

using namespace keylink;

static const char* TAG = "cli";

static void usage()
{
    std::printf(
        "usage: keylink-cli [--config <path>] <command> [args]\n"
        "\n"
        "commands:\n"
        "  list                     attached interfaces matching the filters\n"
        "  info                     protocol versions, uid, features, layers\n"
        "  definition [out-file]    dump the raw definition blob\n"
        "  keymap <rows> <cols>     print every layer's keycodes\n"
        "  macros                   macro count and buffer size\n"
        "  color <layer> [hue sat]  get or set a layer colour\n");
}

static unsigned long parse_number(const std::string& s, unsigned long max)
{
    std::size_t used = 0;
    const unsigned long v = std::stoul(s, &used, 0);
    if (used != s.size() || v > max) {
        throw std::invalid_argument("bad number: " + s);
    }
    return v;
}

static int cmd_list(hid::HidBackend& backend, const config::KeylinkConfig& cfg)
{
    unsigned n = 0;
    for (const auto& info : backend.enumerate()) {
        if (!hid::matches_any(cfg.device.filters, info)) {
            continue;
        }
        std::printf("%04x:%04x usage %04x/%04x  %-32s %s\n",
                    info.vendorId, info.productId, info.usagePage, info.usage,
                    info.product.c_str(), info.path.c_str());
        ++n;
    }
    std::printf("%u matching interface(s)\n", n);
    return n == 1 ? 0 : 1;
}

static int cmd_info(session::KeyboardCommands& kb, const session::KeyboardDevice& dev)
{
    std::printf("product:           %s\n", dev.productName().c_str());
    std::printf("protocol version:  %u\n", kb.protocolVersion());

    const auto ext = kb.extensionInfo();
    std::printf("extension version: %u\n", ext.protocolVersion);
    std::printf("uid:               %016llx\n", static_cast<unsigned long long>(ext.uid));
    std::printf("feature flags:     0x%02x\n", ext.featureFlags);
    std::printf("layers:            %u\n", kb.layerCount());
    return 0;
}

static int cmd_definition(session::KeyboardCommands& kb, const std::vector<std::string>& args)
{
    const auto blob = kb.definition();

    if (args.empty()) {
        std::printf("definition: %zu bytes\n", blob.size());
        return 0;
    }

    std::ofstream out(args[0], std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
    if (!out) {
        KL_ELOG("cannot write %s", args[0].c_str());
        return 1;
    }
    std::printf("wrote %zu bytes to %s\n", blob.size(), args[0].c_str());
    return 0;
}

static int cmd_keymap(session::KeyboardCommands& kb, const std::vector<std::string>& args)
{
    if (args.size() != 2) {
        usage();
        return 2;
    }
    const auto rows = parse_number(args[0], 255);
    const auto cols = parse_number(args[1], 255);

    const auto km = kb.keymap(rows, cols);
    for (std::size_t l = 0; l < km.layers; ++l) {
        std::printf("layer %zu:\n", l);
        for (std::size_t r = 0; r < km.rows; ++r) {
            std::printf("  ");
            for (std::size_t c = 0; c < km.cols; ++c) {
                std::printf(" %04x", km.at(l, r, c));
            }
            std::printf("\n");
        }
    }
    return 0;
}

static int cmd_macros(session::KeyboardCommands& kb)
{
    std::printf("macros:      %u\n", kb.macroCount());
    std::printf("buffer size: %u bytes\n", kb.macroBufferSize());
    return 0;
}

static int cmd_color(session::KeyboardCommands& kb, const std::vector<std::string>& args)
{
    if (args.size() != 1 && args.size() != 3) {
        usage();
        return 2;
    }
    const auto layer = static_cast<std::uint8_t>(parse_number(args[0], 15));

    if (args.size() == 3) {
        session::LayerColor c;
        c.hue = static_cast<std::uint8_t>(parse_number(args[1], 255));
        c.sat = static_cast<std::uint8_t>(parse_number(args[2], 255));
        kb.setLayerColor(layer, c);
    }

    const auto c = kb.layerColor(layer);
    std::printf("layer %u: hue %u sat %u\n", layer, c.hue, c.sat);
    return 0;
}

int main(int argc, char** argv)
{
    std::string configPath = "./keylink.yaml";
    std::vector<std::string> words;

    for (int i = 1; i < argc; ++i) {
        const std::string_view a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (a == "-h" || a == "--help") {
            usage();
            return 0;
        } else {
            words.emplace_back(a);
        }
    }

    if (words.empty()) {
        usage();
        return 2;
    }

    const std::string command = words.front();
    const std::vector<std::string> args(words.begin() + 1, words.end());

    config::YamlConfigStore store(configPath);
    const config::KeylinkConfig cfg = store.load();

    try {
        platform::posix::HidapiBackend backend;

        if (command == "list") {
            return cmd_list(backend, cfg);
        }

        session::SecureNonceSource nonces;
        session::KeyboardDevice device(backend, nonces, cfg.protocol);
        device.onDisconnect([] { KL_ELOG("keyboard disconnected"); });
        device.open(cfg.device.filters);

        KL_LOGI(TAG, "opened %s", device.productName().c_str());

        session::KeyboardCommands kb(device);

        if (command == "info")       return cmd_info(kb, device);
        if (command == "definition") return cmd_definition(kb, args);
        if (command == "keymap")     return cmd_keymap(kb, args);
        if (command == "macros")     return cmd_macros(kb);
        if (command == "color")      return cmd_color(kb, args);

        KL_ELOG("unknown command '%s'", command.c_str());
        usage();
        return 2;
    } catch (const Error& e) {
        KL_ELOG("%s: %s", to_string(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        KL_ELOG("error: %s", e.what());
        return 1;
    }
}
