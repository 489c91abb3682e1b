#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "keylink/hid/hid_device.h"
#include "keylink/io/protocol/wrapper_packet.h"

namespace keylink::io {

// Owns exactly one opened HID interface.
//
// - open() succeeds only when exactly one attached interface matches.
// - Inbound reports are pushed from a reader thread to a single subscriber;
//   subscribe before sending or replies can be missed.
// - A read failure is a disconnect: the one-shot disconnect handler runs on
//   the reader thread, then the handle is closed.
class HidTransport {
public:
    using ReportHandler     = std::function<void(const protocol::WrapperPacket&)>;
    using DisconnectHandler = std::function<void()>;

    explicit HidTransport(hid::HidBackend& backend);
    ~HidTransport();

    HidTransport(const HidTransport&) = delete;
    HidTransport& operator=(const HidTransport&) = delete;

    // Returns false if already open. Throws AmbiguousDeviceError when the
    // filters match zero or several interfaces, ConnectionError when the
    // match cannot be opened.
    bool open(const std::vector<hid::HidFilter>& filters);

    // Idempotent. Safe to call from the disconnect handler.
    void close();

    bool isOpen() const;
    std::optional<hid::HidDeviceInfo> deviceInfo() const;

    // Throws ConnectionError when there is no handle or the write fails.
    void send(const protocol::Report& report);

    // Only one subscriber at a time; a second subscribe() is a logic_error.
    void subscribe(ReportHandler handler);
    void unsubscribe();

    // Fires at most once per connection.
    void setDisconnectHandler(DisconnectHandler handler);

private:
    void readerLoop(hid::HidDevice* device);
    void handleDisconnect();

    hid::HidBackend& _backend;

    mutable std::mutex                 _mx;        // guards _device, _info, writes
    std::unique_ptr<hid::HidDevice>    _device;
    std::optional<hid::HidDeviceInfo>  _info;
    std::thread                        _reader;
    std::atomic<bool>                  _running{false};

    std::mutex        _handlerMx;
    ReportHandler     _subscriber;
    DisconnectHandler _onDisconnect;
};

} // namespace keylink::io
