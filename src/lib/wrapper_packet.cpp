#include "keylink/io/protocol/wrapper_packet.h"
#include "keylink/io/protocol/byte_codec.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace keylink::io::protocol {

using bytecodec::Reader;

WrapperPacket WrapperPacket::command(ClientId client,
                                     SubProtocol proto,
                                     std::uint8_t commandId,
                                     const ByteBuffer& args)
{
    if (args.size() > MAX_ARGS_SIZE) {
        throw std::invalid_argument("command arguments exceed " +
                                    std::to_string(MAX_ARGS_SIZE) + " bytes");
    }

    WrapperPacket pkt;
    pkt._bytes[0] = WRAPPER_PREFIX;
    pkt.putClientId(client);
    pkt._bytes[TAG_OFFSET] = to_byte(proto);
    pkt._bytes[HEADER_SIZE] = commandId;
    std::copy(args.begin(), args.end(), pkt._bytes.begin() + HEADER_SIZE + 1);
    return pkt;
}

WrapperPacket WrapperPacket::bootstrapRequest(const Nonce& nonce)
{
    WrapperPacket pkt;
    pkt._bytes[0] = WRAPPER_PREFIX;
    pkt.putClientId(NO_CLIENT);
    std::copy(nonce.begin(), nonce.end(), pkt._bytes.begin() + NONCE_OFFSET);
    return pkt;
}

WrapperPacket WrapperPacket::fromReport(const std::uint8_t* data, std::size_t len)
{
    WrapperPacket pkt;
    if (data && len > 0) {
        std::copy_n(data, std::min(len, REPORT_SIZE), pkt._bytes.begin());
    }
    return pkt;
}

void WrapperPacket::putClientId(ClientId id) noexcept
{
    for (std::size_t i = 0; i < 4; ++i) {
        _bytes[CLIENT_ID_OFFSET + i] = static_cast<std::uint8_t>((id >> (8U * i)) & 0xFF);
    }
}

ClientId WrapperPacket::clientId() const noexcept
{
    ClientId id = 0;
    Reader r(_bytes.data(), _bytes.size());
    r.skip(CLIENT_ID_OFFSET);
    r.read_u32le(id);
    return id;
}

ByteBuffer WrapperPacket::payload() const
{
    return ByteBuffer(_bytes.begin() + HEADER_SIZE, _bytes.end());
}

std::optional<std::uint8_t> WrapperPacket::deviceErrorCode() const noexcept
{
    if (tag() == DEVICE_ERROR_MARKER) {
        return _bytes[HEADER_SIZE];
    }
    if (tag() == to_byte(SubProtocol::Extension) && _bytes[HEADER_SIZE] == DEVICE_ERROR_MARKER) {
        return _bytes[HEADER_SIZE + 1];
    }
    return std::nullopt;
}

BootstrapReply parse_bootstrap_reply(const WrapperPacket& pkt) noexcept
{
    BootstrapReply reply;
    const Report& b = pkt.bytes();

    std::copy_n(b.begin() + NONCE_OFFSET, NONCE_SIZE, reply.nonce.begin());

    Reader r(b.data(), b.size());
    r.skip(NEW_CLIENT_OFFSET);
    r.read_u32le(reply.newClientId);

    // The error code and the TTL share the same position.
    reply.errorCode = b[TTL_OFFSET];
    r.read_u16le(reply.ttlSeconds);
    return reply;
}

} // namespace keylink::io::protocol
