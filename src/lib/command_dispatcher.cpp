#include "keylink/session/command_dispatcher.h"

#include "keylink/core/errors.h"
#include "keylink/core/logging.h"

#include <memory>
#include <stdexcept>

namespace keylink::session {

static constexpr const char* TAG = "dispatch";

using io::ArmedListener;
using io::protocol::ClientId;
using io::protocol::MAX_ARGS_SIZE;
using io::protocol::NO_CLIENT;
using io::protocol::REPORT_SIZE;
using io::protocol::WrapperPacket;
using io::protocol::decode_payload;
using io::protocol::to_byte;

CommandDispatcher::CommandDispatcher(io::HidTransport& transport,
                                     io::SerialQueue& queue,
                                     io::PendingRequestSlot& slot,
                                     LeaseManager& lease,
                                     const config::ProtocolConfig& cfg)
    : _transport(transport)
    , _queue(queue)
    , _slot(slot)
    , _lease(lease)
    , _cfg(cfg)
{
}

std::future<DecodedValue> CommandDispatcher::sendCommand(SubProtocol proto,
                                                         std::uint8_t commandId,
                                                         ByteBuffer args,
                                                         DecodeOptions options,
                                                         ReplyValidator validator)
{
    if (args.size() > MAX_ARGS_SIZE) {
        throw std::invalid_argument("command " + std::to_string(commandId) + ": " +
                                    std::to_string(args.size()) + " argument bytes, max " +
                                    std::to_string(MAX_ARGS_SIZE));
    }

    auto promise = std::make_shared<std::promise<DecodedValue>>();
    auto result  = promise->get_future();

    if (!_transport.isOpen()) {
        promise->set_exception(std::make_exception_ptr(ConnectionError("device not open")));
        return result;
    }

    // Any bootstrap this triggers is queued ahead of the job below.
    std::shared_future<ClientLease> lease = _lease.ensureLease();

    _queue.post([this, promise, lease, proto, commandId,
                 args = std::move(args),
                 options = std::move(options),
                 validator = std::move(validator)]() {
        try {
            promise->set_value(exchange(lease, proto, commandId, args, options, validator));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    return result;
}

// Runs on the FIFO worker.
DecodedValue CommandDispatcher::exchange(const std::shared_future<ClientLease>& lease,
                                         SubProtocol proto,
                                         std::uint8_t commandId,
                                         const ByteBuffer& args,
                                         const DecodeOptions& options,
                                         const ReplyValidator& validator)
{
    // Already settled: its bootstrap job ran before this one.
    lease.get();

    // Use the current id, not the one captured at queue time: a renewal may
    // have replaced it since, and a close() leaves none.
    const ClientId client = _lease.current().clientId;
    if (client == NO_CLIENT) {
        throw ConnectionError("no client lease (device closed)");
    }

    const WrapperPacket request = WrapperPacket::command(client, proto, commandId, args);

    ArmedListener listen(_slot, [client, &validator](const WrapperPacket& in) {
        if (!in.hasWrapperPrefix() || in.clientId() != client) {
            return false;
        }
        if (in.deviceErrorCode()) {
            return true;
        }
        return !validator || validator(in.payload());
    });

    KL_LOGD(TAG, "send proto=0x%02x cmd=0x%02x args=%zu", to_byte(proto), commandId, args.size());
    KL_LOG_HEX(TAG, "tx", request.bytes().data(), REPORT_SIZE);
    _transport.send(request.bytes());

    auto reply = _slot.await(_cfg.commandTimeout);
    if (!reply) {
        if (!_transport.isOpen()) {
            throw ConnectionError("device disconnected");
        }
        KL_LOGW(TAG, "timeout proto=0x%02x cmd=0x%02x after %lld ms", to_byte(proto), commandId,
                static_cast<long long>(_cfg.commandTimeout.count()));
        throw CommandTimeout(to_byte(proto), commandId);
    }
    KL_LOG_HEX(TAG, "rx", reply->bytes().data(), REPORT_SIZE);

    if (auto code = reply->deviceErrorCode()) {
        KL_LOGE(TAG, "device error %u for proto=0x%02x cmd=0x%02x", *code, to_byte(proto), commandId);
        throw ProtocolError(*code);
    }

    return decode_payload(reply->payload(), options);
}

} // namespace keylink::session
