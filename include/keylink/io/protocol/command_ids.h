#pragma once
#include <cstdint>

namespace keylink::io::protocol {

// Legacy command set, carried under SubProtocol::Legacy (0xFE).
enum class LegacyCommand : std::uint8_t {
    GetProtocolVersion  = 0x01,
    GetKeyboardValue    = 0x02,
    SetKeyboardValue    = 0x03,
    GetKeycode          = 0x04,
    SetKeycode          = 0x05,
    CustomValueSet      = 0x07,
    CustomValueGet      = 0x08,
    CustomValueSave     = 0x09,
    MacroGetCount       = 0x0C,
    MacroGetBufferSize  = 0x0D,
    MacroGetBuffer      = 0x0E,
    MacroSetBuffer      = 0x0F,
    GetLayerCount       = 0x11,
    KeymapGetBuffer     = 0x12,
};

// Sub-ids for Get/SetKeyboardValue.
enum class KeyboardValueId : std::uint8_t {
    LayoutOptions     = 0x02,
    SwitchMatrixState = 0x03,
};

// Extension command set, carried under SubProtocol::Extension (0xDF).
enum class ExtensionCommand : std::uint8_t {
    GetInfo                 = 0x00,
    TapDanceGet             = 0x01,
    TapDanceSet             = 0x02,
    ComboGet                = 0x03,
    ComboSet                = 0x04,
    KeyOverrideGet          = 0x05,
    KeyOverrideSet          = 0x06,
    AltRepeatKeyGet         = 0x07,
    AltRepeatKeySet         = 0x08,
    OneShotGet              = 0x09,
    OneShotSet              = 0x0A,
    Save                    = 0x0B,
    Reset                   = 0x0C,
    DefinitionSize          = 0x0D,
    DefinitionChunk         = 0x0E,
    SettingsQuery           = 0x10,
    SettingsGet             = 0x11,
    SettingsSet             = 0x12,
    SettingsReset           = 0x13,
    LeaderGet               = 0x14,
    LeaderSet               = 0x15,
    LayerStateGet           = 0x16,
    LayerStateSet           = 0x17,
    FragmentGetHardware     = 0x18,
    FragmentGetSelections   = 0x19,
    FragmentSetSelections   = 0x1A,
};

// Extension info feature flags.
constexpr std::uint8_t FEATURE_CAPS_WORD  = 0x01;
constexpr std::uint8_t FEATURE_LAYER_LOCK = 0x02;
constexpr std::uint8_t FEATURE_ONE_SHOT   = 0x04;
constexpr std::uint8_t FEATURE_LEADER     = 0x08;

constexpr std::uint8_t to_byte(LegacyCommand c) noexcept { return static_cast<std::uint8_t>(c); }
constexpr std::uint8_t to_byte(ExtensionCommand c) noexcept { return static_cast<std::uint8_t>(c); }
constexpr std::uint8_t to_byte(KeyboardValueId v) noexcept { return static_cast<std::uint8_t>(v); }

} // namespace keylink::io::protocol
