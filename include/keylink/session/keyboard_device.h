#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "keylink/config/keylink_config.h"
#include "keylink/hid/hid_device.h"
#include "keylink/io/core/pending_request.h"
#include "keylink/io/core/serial_queue.h"
#include "keylink/io/transport/hid_transport.h"
#include "keylink/session/chunked_transfer.h"
#include "keylink/session/command_dispatcher.h"
#include "keylink/session/lease_manager.h"
#include "keylink/session/nonce_source.h"

namespace keylink::session {

// One keyboard: transport, FIFO, listener slot, lease and dispatcher wired
// together. Instances share nothing, so several keyboards can be driven side
// by side.
class KeyboardDevice {
public:
    using DisconnectCallback = std::function<void()>;

    KeyboardDevice(hid::HidBackend& backend,
                   NonceSource& nonces,
                   const config::ProtocolConfig& cfg = {});
    ~KeyboardDevice();

    KeyboardDevice(const KeyboardDevice&) = delete;
    KeyboardDevice& operator=(const KeyboardDevice&) = delete;

    // Returns false if already open. Throws AmbiguousDeviceError or
    // ConnectionError. No lease is taken until the first command.
    bool open(const std::vector<hid::HidFilter>& filters);

    // Idempotent. Rejects the in-flight exchange and drops the lease.
    void close();

    bool isOpen() const;
    std::optional<hid::HidDeviceInfo> deviceInfo() const;

    // Empty when closed.
    std::string productName() const;

    std::future<DecodedValue> sendLegacy(std::uint8_t cmd,
                                         ByteBuffer args,
                                         DecodeOptions options = {},
                                         CommandDispatcher::ReplyValidator validator = {})
    {
        return _dispatcher.sendLegacy(cmd, std::move(args), std::move(options), std::move(validator));
    }

    std::future<DecodedValue> sendExtension(std::uint8_t cmd,
                                            ByteBuffer args,
                                            DecodeOptions options = {},
                                            CommandDispatcher::ReplyValidator validator = {})
    {
        return _dispatcher.sendExtension(cmd, std::move(args), std::move(options), std::move(validator));
    }

    std::future<ByteBuffer> fetchChunked(std::uint8_t sizeCmd,
                                         std::uint8_t chunkCmd,
                                         DecodeOptions sizeOptions = DecodeOptions::scalar(32, 1))
    {
        return _transfer.fetchChunked(sizeCmd, chunkCmd, std::move(sizeOptions));
    }

    std::future<void> pushChunked(std::uint8_t cmd, ByteBuffer buffer, std::size_t totalSize)
    {
        return _transfer.pushChunked(cmd, std::move(buffer), totalSize);
    }

    // Runs on the reader thread, once per connection, before teardown ends.
    void onDisconnect(DisconnectCallback cb);

    CommandDispatcher& dispatcher() noexcept { return _dispatcher; }
    ChunkedTransfer& transfer() noexcept { return _transfer; }
    LeaseManager& lease() noexcept { return _lease; }
    const config::ProtocolConfig& protocolConfig() const noexcept { return _cfg; }

private:
    void handleDisconnect();

    const config::ProtocolConfig _cfg;

    io::HidTransport       _transport;
    io::PendingRequestSlot _slot;
    LeaseManager           _lease;
    CommandDispatcher      _dispatcher;
    ChunkedTransfer        _transfer;

    // Declared last: destroyed first, draining queued jobs while everything
    // they touch is still alive.
    io::SerialQueue        _queue;

    std::mutex         _cbMx;
    DisconnectCallback _onDisconnect;
};

} // namespace keylink::session
