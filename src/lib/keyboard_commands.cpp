#include "keylink/session/keyboard_commands.h"

#include "keylink/core/errors.h"
#include "keylink/core/logging.h"
#include "keylink/io/protocol/command_ids.h"

#include <stdexcept>
#include <string>

namespace keylink::session {

static constexpr const char* TAG = "keyboard";

using io::protocol::ByteBuffer;
using io::protocol::ExtensionCommand;
using io::protocol::KeyboardValueId;
using io::protocol::LegacyCommand;
using io::protocol::to_byte;
using io::protocol::value_as;

namespace {

constexpr std::uint8_t LAYER_COLOR_CHANNEL       = 0;
constexpr std::uint8_t LAYER_COLOR_VALUE_ID_BASE = 32;
constexpr std::uint8_t MAX_LAYER_COLORS          = 16;

// Custom value replies: [echo][channel][valueId][data...]
constexpr std::size_t CUSTOM_VALUE_DATA_POS = 3;

// Matrix replies: [echo][valueId][offset][rows...]
constexpr std::size_t MATRIX_DATA_POS = 3;

std::uint64_t scalar(const DecodedValue& v)
{
    return value_as<std::uint64_t>(v);
}

} // namespace

std::uint16_t KeyboardCommands::protocolVersion()
{
    return static_cast<std::uint16_t>(scalar(
        _device.sendLegacy(to_byte(LegacyCommand::GetProtocolVersion), {},
                           DecodeOptions::packed("B>H", 0, 1))
            .get()));
}

ExtensionInfo KeyboardCommands::extensionInfo()
{
    // [echo][protocolVersion:LE32][uid:LE64][featureFlags]
    const auto fields = value_as<std::vector<std::uint64_t>>(
        _device.sendExtension(to_byte(ExtensionCommand::GetInfo), {},
                              DecodeOptions::packed("<BIQB"))
            .get());

    ExtensionInfo info;
    info.protocolVersion = static_cast<std::uint32_t>(fields[1]);
    info.uid             = fields[2];
    info.featureFlags    = static_cast<std::uint8_t>(fields[3]);
    return info;
}

std::uint8_t KeyboardCommands::layerCount()
{
    return static_cast<std::uint8_t>(scalar(
        _device.sendLegacy(to_byte(LegacyCommand::GetLayerCount), {}, DecodeOptions::scalar(8, 1))
            .get()));
}

ByteBuffer KeyboardCommands::definition()
{
    return _device.fetchChunked(to_byte(ExtensionCommand::DefinitionSize),
                                to_byte(ExtensionCommand::DefinitionChunk))
        .get();
}

Keymap KeyboardCommands::keymap(std::size_t rows, std::size_t cols)
{
    Keymap km;
    km.layers = layerCount();
    km.rows   = rows;
    km.cols   = cols;
    if (km.layers == 0) {
        throw DecodeError("device reports zero layers");
    }

    km.keycodes = _device.transfer()
                      .fetchBuffer16(to_byte(LegacyCommand::KeymapGetBuffer), km.layers * rows * cols)
                      .get();

    KL_LOGI(TAG, "keymap: %zu layers of %zux%zu", km.layers, rows, cols);
    return km;
}

void KeyboardCommands::setKeycode(std::uint8_t layer, std::uint8_t row, std::uint8_t col, std::uint16_t keycode)
{
    ByteBuffer args{layer, row, col};
    io::bytecodec::write_u16be(args, keycode);
    _device.sendLegacy(to_byte(LegacyCommand::SetKeycode), std::move(args)).get();
}

std::uint8_t KeyboardCommands::macroCount()
{
    return static_cast<std::uint8_t>(scalar(
        _device.sendLegacy(to_byte(LegacyCommand::MacroGetCount), {}, DecodeOptions::scalar(8, 1))
            .get()));
}

std::uint16_t KeyboardCommands::macroBufferSize()
{
    return static_cast<std::uint16_t>(scalar(
        _device.sendLegacy(to_byte(LegacyCommand::MacroGetBufferSize), {},
                           DecodeOptions::packed("B>H", 0, 1))
            .get()));
}

ByteBuffer KeyboardCommands::macroBuffer()
{
    const std::uint16_t size = macroBufferSize();
    return _device.transfer().fetchBuffer(to_byte(LegacyCommand::MacroGetBuffer), size).get();
}

void KeyboardCommands::setMacroBuffer(const ByteBuffer& buffer)
{
    const std::uint16_t size = macroBufferSize();
    if (buffer.size() > size) {
        throw std::invalid_argument("macro buffer of " + std::to_string(buffer.size()) +
                                    " bytes exceeds device capacity " + std::to_string(size));
    }
    _device.pushChunked(to_byte(LegacyCommand::MacroSetBuffer), buffer, buffer.size()).get();
}

ByteBuffer KeyboardCommands::customValue(std::uint8_t channel, std::uint8_t valueId, std::size_t size)
{
    if (size > io::protocol::PAYLOAD_SIZE - CUSTOM_VALUE_DATA_POS) {
        throw std::invalid_argument("custom value size " + std::to_string(size) + " too large");
    }

    ByteBuffer data = value_as<ByteBuffer>(
        _device.sendLegacy(to_byte(LegacyCommand::CustomValueGet), {channel, valueId},
                           DecodeOptions::raw(CUSTOM_VALUE_DATA_POS),
                           [channel, valueId](const ByteBuffer& p) {
                               return p[1] == channel && p[2] == valueId;
                           })
            .get());
    data.resize(size);
    return data;
}

void KeyboardCommands::setCustomValue(std::uint8_t channel, std::uint8_t valueId, const ByteBuffer& data)
{
    ByteBuffer args{channel, valueId};
    args.insert(args.end(), data.begin(), data.end());
    _device.sendLegacy(to_byte(LegacyCommand::CustomValueSet), std::move(args)).get();
}

void KeyboardCommands::saveCustomValues(std::uint8_t channel)
{
    _device.sendLegacy(to_byte(LegacyCommand::CustomValueSave), {channel}).get();
}

LayerColor KeyboardCommands::layerColor(std::uint8_t layer)
{
    if (layer >= MAX_LAYER_COLORS) {
        throw std::invalid_argument("layer colour index " + std::to_string(layer) + " out of range");
    }
    const ByteBuffer hs = customValue(LAYER_COLOR_CHANNEL,
                                      static_cast<std::uint8_t>(LAYER_COLOR_VALUE_ID_BASE + layer), 2);
    return LayerColor{hs[0], hs[1]};
}

void KeyboardCommands::setLayerColor(std::uint8_t layer, LayerColor color)
{
    if (layer >= MAX_LAYER_COLORS) {
        throw std::invalid_argument("layer colour index " + std::to_string(layer) + " out of range");
    }
    setCustomValue(LAYER_COLOR_CHANNEL,
                   static_cast<std::uint8_t>(LAYER_COLOR_VALUE_ID_BASE + layer),
                   {color.hue, color.sat});
    saveCustomValues(LAYER_COLOR_CHANNEL);
    KL_LOGD(TAG, "layer %u colour set to hue=%u sat=%u", layer, color.hue, color.sat);
}

MatrixState KeyboardCommands::pollMatrix(std::size_t rows, std::size_t cols)
{
    const std::uint8_t cmd = to_byte(LegacyCommand::GetKeyboardValue);
    const std::uint8_t id  = to_byte(KeyboardValueId::SwitchMatrixState);

    const ByteBuffer data = value_as<ByteBuffer>(
        _device.sendLegacy(cmd, {id}, DecodeOptions::raw()).get());

    std::size_t offset = 0;
    if (data[0] == cmd && data[1] == id) {
        offset = MATRIX_DATA_POS;
    }

    // Each row is ceil(cols / 8) bytes, most significant byte first.
    const std::size_t rowBytes = (cols + 7) / 8;
    MatrixState state;
    for (std::size_t row = 0; row < rows; ++row) {
        if (offset + rowBytes > data.size()) {
            break;
        }
        std::vector<bool> pressed(cols, false);
        for (std::size_t col = 0; col < cols; ++col) {
            const std::size_t byte = rowBytes - 1 - col / 8;
            pressed[col] = (data[offset + byte] & (1u << (col % 8))) != 0;
        }
        state.push_back(std::move(pressed));
        offset += rowBytes;
    }
    return state;
}

OneShotSettings KeyboardCommands::oneShot()
{
    // [echo][timeout:LE16][tapToggle]
    const auto fields = value_as<std::vector<std::uint64_t>>(
        _device.sendExtension(to_byte(ExtensionCommand::OneShotGet), {},
                              DecodeOptions::packed("<BHB"))
            .get());
    return OneShotSettings{static_cast<std::uint16_t>(fields[1]),
                           static_cast<std::uint8_t>(fields[2])};
}

void KeyboardCommands::setOneShot(const OneShotSettings& settings)
{
    _device.sendExtension(to_byte(ExtensionCommand::OneShotSet),
                          io::protocol::pack("<HB", {settings.timeoutMs, settings.tapToggle}))
        .get();
}

void KeyboardCommands::save()
{
    _device.sendExtension(to_byte(ExtensionCommand::Save), {}).get();
}

} // namespace keylink::session
