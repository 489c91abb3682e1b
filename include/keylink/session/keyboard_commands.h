#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "keylink/io/protocol/wrapper_packet.h"
#include "keylink/session/keyboard_device.h"

namespace keylink::session {

struct ExtensionInfo {
    std::uint32_t protocolVersion{0};
    std::uint64_t uid{0};
    std::uint8_t  featureFlags{0};

    bool has(std::uint8_t flag) const noexcept { return (featureFlags & flag) != 0; }
};

struct Keymap {
    std::size_t layers{0};
    std::size_t rows{0};
    std::size_t cols{0};
    std::vector<std::uint16_t> keycodes;   // layer-major, then row, then col

    std::uint16_t at(std::size_t layer, std::size_t row, std::size_t col) const
    {
        return keycodes.at((layer * rows + row) * cols + col);
    }
};

struct LayerColor {
    std::uint8_t hue{0};
    std::uint8_t sat{0};
};

struct OneShotSettings {
    std::uint16_t timeoutMs{0};
    std::uint8_t  tapToggle{0};
};

// Per-key pressed state, [row][col].
using MatrixState = std::vector<std::vector<bool>>;

// Keyboard-level operations on top of the dispatcher. Each call blocks
// until its exchanges complete and throws the engine errors directly.
class KeyboardCommands {
public:
    explicit KeyboardCommands(KeyboardDevice& device)
        : _device(device)
    {}

    std::uint16_t protocolVersion();
    ExtensionInfo extensionInfo();
    std::uint8_t layerCount();

    // Raw definition blob as stored by the firmware.
    io::protocol::ByteBuffer definition();

    Keymap keymap(std::size_t rows, std::size_t cols);
    void setKeycode(std::uint8_t layer, std::uint8_t row, std::uint8_t col, std::uint16_t keycode);

    std::uint8_t macroCount();
    std::uint16_t macroBufferSize();
    io::protocol::ByteBuffer macroBuffer();
    void setMacroBuffer(const io::protocol::ByteBuffer& buffer);

    io::protocol::ByteBuffer customValue(std::uint8_t channel, std::uint8_t valueId, std::size_t size = 2);
    void setCustomValue(std::uint8_t channel, std::uint8_t valueId, const io::protocol::ByteBuffer& data);
    void saveCustomValues(std::uint8_t channel);

    // Layer colours live on custom-value channel 0, ids 32 + layer.
    LayerColor layerColor(std::uint8_t layer);
    void setLayerColor(std::uint8_t layer, LayerColor color);

    MatrixState pollMatrix(std::size_t rows, std::size_t cols);

    OneShotSettings oneShot();
    void setOneShot(const OneShotSettings& settings);

    // Persist extension-set state (combos, tap dances, ...) to EEPROM.
    void save();

private:
    KeyboardDevice& _device;
};

} // namespace keylink::session
