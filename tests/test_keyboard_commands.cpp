#include "doctest.h"

#include "fake_hid.h"

#include "keylink/core/errors.h"
#include "keylink/io/protocol/command_ids.h"
#include "keylink/session/keyboard_commands.h"

using namespace keylink;
using keylink::io::protocol::ByteBuffer;
using keylink::io::protocol::ExtensionCommand;
using keylink::io::protocol::LegacyCommand;
using keylink::io::protocol::SubProtocol;
using keylink::io::protocol::to_byte;
using keylink::session::KeyboardCommands;
using keylink::session::KeyboardDevice;
using keylink::tests::FakeHidBackend;
using keylink::tests::FixedNonceSource;

namespace {

struct Rig {
    FakeHidBackend backend;
    std::shared_ptr<tests::FakeKeyboard> kb = backend.attach("/dev/hidraw1", 0x4653, 0x0001, "Svalboard");
    FixedNonceSource nonces;
    KeyboardDevice device;
    KeyboardCommands cmds{device};

    Rig()
        : device(backend, nonces, tests::fast_protocol())
    {
        REQUIRE(device.open({hid::default_vendor_filter()}));
    }

    std::vector<tests::SeenCommand> seen(std::uint8_t cmd) const
    {
        std::vector<tests::SeenCommand> out;
        for (const auto& c : kb->commands()) {
            if (c.cmd == cmd) {
                out.push_back(c);
            }
        }
        return out;
    }
};

std::vector<ByteBuffer> one(ByteBuffer p)
{
    return std::vector<ByteBuffer>{std::move(p)};
}

} // namespace

TEST_CASE("Product name after open")
{
    Rig rig;
    CHECK(rig.device.productName() == "Svalboard");
    rig.device.close();
    CHECK(rig.device.productName().empty());
}

TEST_CASE("Versions, info and layer count")
{
    Rig rig;
    rig.kb->on(SubProtocol::Legacy, to_byte(LegacyCommand::GetProtocolVersion),
               [](const ByteBuffer&) { return one({0x01, 0x00, 0x0C}); });
    rig.kb->on(SubProtocol::Extension, to_byte(ExtensionCommand::GetInfo), [](const ByteBuffer&) {
        return one({0x00,
                    0x01, 0x00, 0x00, 0x00,
                    0xEF, 0xCD, 0xAB, 0x89, 0x67, 0x45, 0x23, 0x01,
                    0x05});
    });
    rig.kb->on(SubProtocol::Legacy, to_byte(LegacyCommand::GetLayerCount),
               [](const ByteBuffer&) { return one({0x11, 0x10}); });

    CHECK(rig.cmds.protocolVersion() == 12);

    const auto info = rig.cmds.extensionInfo();
    CHECK(info.protocolVersion == 1);
    CHECK(info.uid == 0x0123456789ABCDEFull);
    CHECK(info.featureFlags == 0x05);
    CHECK(info.has(io::protocol::FEATURE_CAPS_WORD));
    CHECK(info.has(io::protocol::FEATURE_ONE_SHOT));
    CHECK_FALSE(info.has(io::protocol::FEATURE_LEADER));

    CHECK(rig.cmds.layerCount() == 16);
}

TEST_CASE("Keymap is fetched as big-endian keycodes per layer")
{
    Rig rig;
    rig.kb->on(SubProtocol::Legacy, to_byte(LegacyCommand::GetLayerCount),
               [](const ByteBuffer&) { return one({0x11, 0x02}); });

    // 2 layers x 3 rows x 4 cols = 24 keycodes = 48 bytes, three chunks.
    ByteBuffer blob;
    for (std::uint16_t i = 0; i < 24; ++i) {
        io::bytecodec::write_u16be(blob, static_cast<std::uint16_t>(0x7000 + i));
    }
    tests::serve_buffer(*rig.kb, to_byte(LegacyCommand::KeymapGetBuffer), blob);

    const auto km = rig.cmds.keymap(3, 4);
    CHECK(km.layers == 2);
    REQUIRE(km.keycodes.size() == 24);
    CHECK(km.at(0, 0, 0) == 0x7000);
    CHECK(km.at(0, 2, 3) == 0x700B);
    CHECK(km.at(1, 0, 0) == 0x700C);
    CHECK(km.at(1, 2, 3) == 0x7017);
    CHECK(rig.seen(to_byte(LegacyCommand::KeymapGetBuffer)).size() == 3);
}

TEST_CASE("Zero layers is refused before fetching the keymap")
{
    Rig rig;
    rig.kb->on(SubProtocol::Legacy, to_byte(LegacyCommand::GetLayerCount),
               [](const ByteBuffer&) { return one({0x11, 0x00}); });
    CHECK_THROWS_AS(rig.cmds.keymap(3, 4), DecodeError);
}

TEST_CASE("Set keycode sends layer, row, col and a big-endian keycode")
{
    Rig rig;
    rig.cmds.setKeycode(1, 2, 3, 0x5F10);

    const auto s = rig.seen(to_byte(LegacyCommand::SetKeycode));
    REQUIRE(s.size() == 1);
    CHECK(s[0].args[0] == 1);
    CHECK(s[0].args[1] == 2);
    CHECK(s[0].args[2] == 3);
    CHECK(s[0].args[3] == 0x5F);
    CHECK(s[0].args[4] == 0x10);
}

TEST_CASE("Macro count, size and buffer")
{
    Rig rig;
    rig.kb->on(SubProtocol::Legacy, to_byte(LegacyCommand::MacroGetCount),
               [](const ByteBuffer&) { return one({0x0C, 0x20}); });
    rig.kb->on(SubProtocol::Legacy, to_byte(LegacyCommand::MacroGetBufferSize),
               [](const ByteBuffer&) { return one({0x0D, 0x00, 0x28}); });
    const ByteBuffer macros = tests::iota_bytes(40, 0x41);
    tests::serve_buffer(*rig.kb, to_byte(LegacyCommand::MacroGetBuffer), macros);

    CHECK(rig.cmds.macroCount() == 32);
    CHECK(rig.cmds.macroBufferSize() == 40);
    CHECK(rig.cmds.macroBuffer() == macros);

    SUBCASE("push within capacity") {
        rig.cmds.setMacroBuffer(tests::iota_bytes(25));
        CHECK(rig.seen(to_byte(LegacyCommand::MacroSetBuffer)).size() == 2);
    }

    SUBCASE("push beyond capacity") {
        CHECK_THROWS_AS(rig.cmds.setMacroBuffer(ByteBuffer(41)), std::invalid_argument);
        CHECK(rig.seen(to_byte(LegacyCommand::MacroSetBuffer)).empty());
    }
}

TEST_CASE("Layer colours use custom-value channel 0, id 32 + layer")
{
    Rig rig;
    rig.kb->on(SubProtocol::Legacy, to_byte(LegacyCommand::CustomValueGet), [](const ByteBuffer& args) {
        // [echo][channel][valueId][hue][sat]
        return one({0x08, args[0], args[1], static_cast<std::uint8_t>(args[1] * 2), 0xC8});
    });

    const auto c = rig.cmds.layerColor(3);
    CHECK(c.hue == 70);
    CHECK(c.sat == 0xC8);

    const auto get = rig.seen(to_byte(LegacyCommand::CustomValueGet));
    REQUIRE(get.size() == 1);
    CHECK(get[0].args[0] == 0);
    CHECK(get[0].args[1] == 35);

    rig.cmds.setLayerColor(2, {10, 20});
    const auto set = rig.seen(to_byte(LegacyCommand::CustomValueSet));
    REQUIRE(set.size() == 1);
    CHECK(set[0].args[0] == 0);
    CHECK(set[0].args[1] == 34);
    CHECK(set[0].args[2] == 10);
    CHECK(set[0].args[3] == 20);

    // Set is followed by a save of the same channel.
    const auto save = rig.seen(to_byte(LegacyCommand::CustomValueSave));
    REQUIRE(save.size() == 1);
    CHECK(save[0].args[0] == 0);

    CHECK_THROWS_AS(rig.cmds.layerColor(16), std::invalid_argument);
}

TEST_CASE("Switch matrix poll decodes rows with reversed byte order")
{
    Rig rig;
    const std::uint8_t cmd = to_byte(LegacyCommand::GetKeyboardValue);
    rig.kb->on(SubProtocol::Legacy, cmd, [cmd](const ByteBuffer& args) {
        // 2 rows x 10 cols: 2 bytes per row, high byte first.
        // row 0: col 0 and col 9 pressed; row 1: col 3 pressed.
        return one({cmd, args[0], 0x00, 0x02, 0x01, 0x00, 0x08});
    });

    const auto m = rig.cmds.pollMatrix(2, 10);
    REQUIRE(m.size() == 2);
    CHECK(m[0][0]);
    CHECK(m[0][9]);
    CHECK_FALSE(m[0][1]);
    CHECK(m[1][3]);
    CHECK_FALSE(m[1][0]);
}

TEST_CASE("One-shot settings round trip through the extension set")
{
    Rig rig;
    rig.kb->on(SubProtocol::Extension, to_byte(ExtensionCommand::OneShotGet),
               [](const ByteBuffer&) { return one({0x09, 0xDC, 0x05, 0x01}); });

    const auto os = rig.cmds.oneShot();
    CHECK(os.timeoutMs == 1500);
    CHECK(os.tapToggle == 1);

    rig.cmds.setOneShot({3000, 2});
    const auto s = rig.seen(to_byte(ExtensionCommand::OneShotSet));
    REQUIRE(s.size() == 1);
    CHECK(s[0].tag == 0xDF);
    CHECK(s[0].args[0] == 0xB8);
    CHECK(s[0].args[1] == 0x0B);
    CHECK(s[0].args[2] == 2);
}

TEST_CASE("Definition blob and save")
{
    Rig rig;
    const ByteBuffer blob = tests::iota_bytes(70, 0x10);
    tests::serve_chunks(*rig.kb, to_byte(ExtensionCommand::DefinitionSize),
                        to_byte(ExtensionCommand::DefinitionChunk), blob);

    CHECK(rig.cmds.definition() == blob);

    rig.cmds.save();
    CHECK(rig.seen(to_byte(ExtensionCommand::Save)).size() == 1);
}
