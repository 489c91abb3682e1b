#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace keylink::io::protocol {

using ByteBuffer = std::vector<std::uint8_t>;
using ClientId   = std::uint32_t;

// Every report on the vendor interface is exactly this long.
constexpr std::size_t REPORT_SIZE = 32;

// [0xDD][clientId:LE32][tag][payload:26]
constexpr std::uint8_t WRAPPER_PREFIX      = 0xDD;
constexpr std::size_t  CLIENT_ID_OFFSET    = 1;
constexpr std::size_t  TAG_OFFSET          = 5;
constexpr std::size_t  HEADER_SIZE         = 6;
constexpr std::size_t  PAYLOAD_SIZE        = REPORT_SIZE - HEADER_SIZE;

// Command byte + arguments must fit the payload.
constexpr std::size_t  MAX_ARGS_SIZE       = PAYLOAD_SIZE - 1;

constexpr ClientId     NO_CLIENT           = 0;
constexpr ClientId     BOOTSTRAP_REFUSED   = 0xFFFFFFFFu;

// Explicit device error marker (payload byte 0 of an extension reply,
// or the tag byte itself on older firmware).
constexpr std::uint8_t DEVICE_ERROR_MARKER = 0xFF;

// Bootstrap frames carry no sub-protocol tag:
//   request : [0xDD][00 00 00 00][nonce:20]
//   response: [0xDD][00 00 00 00][nonce:20][newClientId:LE32][ttl:LE16]
// When newClientId is 0xFFFFFFFF the byte after it is an error code.
constexpr std::size_t  NONCE_SIZE          = 20;
constexpr std::size_t  NONCE_OFFSET        = 5;
constexpr std::size_t  NEW_CLIENT_OFFSET   = NONCE_OFFSET + NONCE_SIZE;   // 25
constexpr std::size_t  TTL_OFFSET          = NEW_CLIENT_OFFSET + 4;       // 29

enum class SubProtocol : std::uint8_t {
    Legacy    = 0xFE,
    Extension = 0xDF,
};

constexpr std::uint8_t to_byte(SubProtocol p) noexcept
{
    return static_cast<std::uint8_t>(p);
}

using Report = std::array<std::uint8_t, REPORT_SIZE>;
using Nonce  = std::array<std::uint8_t, NONCE_SIZE>;

// Fixed 32-byte wrapper frame. Immutable once built.
class WrapperPacket {
public:
    // Build a command frame: payload = [commandId][args...], zero padded.
    // Throws std::invalid_argument when args exceed MAX_ARGS_SIZE.
    static WrapperPacket command(ClientId client,
                                 SubProtocol proto,
                                 std::uint8_t commandId,
                                 const ByteBuffer& args);

    static WrapperPacket bootstrapRequest(const Nonce& nonce);

    // Wrap an inbound report. Short reports are zero padded; anything past
    // REPORT_SIZE is ignored.
    static WrapperPacket fromReport(const std::uint8_t* data, std::size_t len);

    const Report& bytes() const noexcept { return _bytes; }

    bool hasWrapperPrefix() const noexcept { return _bytes[0] == WRAPPER_PREFIX; }
    ClientId clientId() const noexcept;
    std::uint8_t tag() const noexcept { return _bytes[TAG_OFFSET]; }

    // Bytes after the tag (26 bytes).
    ByteBuffer payload() const;

    // Extension error reply: payload[0] == 0xFF (code in payload[1]), or the
    // tag byte itself 0xFF (code in the following byte).
    std::optional<std::uint8_t> deviceErrorCode() const noexcept;

private:
    WrapperPacket() { _bytes.fill(0); }

    void putClientId(ClientId id) noexcept;

    Report _bytes;
};

struct BootstrapReply {
    Nonce        nonce{};
    ClientId     newClientId{NO_CLIENT};
    std::uint16_t ttlSeconds{0};

    bool refused() const noexcept { return newClientId == BOOTSTRAP_REFUSED; }

    // Error code carried in the byte after newClientId when refused().
    std::uint8_t errorCode{0};
};

// Interpret a bootstrap-shaped frame. No validation beyond layout; the
// caller decides whether prefix / client id / nonce match.
BootstrapReply parse_bootstrap_reply(const WrapperPacket& pkt) noexcept;

} // namespace keylink::io::protocol
