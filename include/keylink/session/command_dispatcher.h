#pragma once

#include <cstdint>
#include <functional>
#include <future>

#include "keylink/config/keylink_config.h"
#include "keylink/io/core/pending_request.h"
#include "keylink/io/core/serial_queue.h"
#include "keylink/io/protocol/response_decoder.h"
#include "keylink/io/protocol/wrapper_packet.h"
#include "keylink/io/transport/hid_transport.h"
#include "keylink/session/lease_manager.h"

namespace keylink::session {

using io::protocol::ByteBuffer;
using io::protocol::DecodedValue;
using io::protocol::DecodeOptions;
using io::protocol::SubProtocol;

// Turns one command into one serialized request/response exchange.
//
// Every call is queued on the device FIFO behind whatever is already there
// (including a lease bootstrap it triggered), so at most one exchange is on
// the wire at any time and results complete in call order. A failed or
// timed-out exchange only fails its own future.
class CommandDispatcher {
public:
    // Extra reply check on the 26-byte payload, e.g. an echoed sub-index.
    // Never consulted for device error replies.
    using ReplyValidator = std::function<bool(const ByteBuffer& payload)>;

    CommandDispatcher(io::HidTransport& transport,
                      io::SerialQueue& queue,
                      io::PendingRequestSlot& slot,
                      LeaseManager& lease,
                      const config::ProtocolConfig& cfg);

    // Non-blocking. The future fails with ConnectionError, BootstrapFailure,
    // CommandTimeout, ProtocolError or DecodeError; argument overflow
    // (more than 25 bytes) throws std::invalid_argument right here.
    std::future<DecodedValue> sendCommand(SubProtocol proto,
                                          std::uint8_t commandId,
                                          ByteBuffer args,
                                          DecodeOptions options = {},
                                          ReplyValidator validator = {});

    std::future<DecodedValue> sendLegacy(std::uint8_t commandId,
                                         ByteBuffer args,
                                         DecodeOptions options = {},
                                         ReplyValidator validator = {})
    {
        return sendCommand(SubProtocol::Legacy, commandId, std::move(args),
                           std::move(options), std::move(validator));
    }

    std::future<DecodedValue> sendExtension(std::uint8_t commandId,
                                            ByteBuffer args,
                                            DecodeOptions options = {},
                                            ReplyValidator validator = {})
    {
        return sendCommand(SubProtocol::Extension, commandId, std::move(args),
                           std::move(options), std::move(validator));
    }

private:
    DecodedValue exchange(const std::shared_future<ClientLease>& lease,
                          SubProtocol proto,
                          std::uint8_t commandId,
                          const ByteBuffer& args,
                          const DecodeOptions& options,
                          const ReplyValidator& validator);

    io::HidTransport&             _transport;
    io::SerialQueue&              _queue;
    io::PendingRequestSlot&       _slot;
    LeaseManager&                 _lease;
    const config::ProtocolConfig& _cfg;
};

} // namespace keylink::session
