#include "keylink/session/keyboard_device.h"

#include "keylink/core/errors.h"
#include "keylink/core/logging.h"

namespace keylink::session {

static constexpr const char* TAG = "device";

KeyboardDevice::KeyboardDevice(hid::HidBackend& backend,
                               NonceSource& nonces,
                               const config::ProtocolConfig& cfg)
    : _cfg(cfg)
    , _transport(backend)
    , _lease(_transport, _queue, _slot, nonces, _cfg)
    , _dispatcher(_transport, _queue, _slot, _lease, _cfg)
    , _transfer(_dispatcher, _cfg)
{
    _transport.subscribe([this](const io::protocol::WrapperPacket& pkt) {
        _slot.offer(pkt);
    });
}

KeyboardDevice::~KeyboardDevice()
{
    close();
    _transport.unsubscribe();
}

bool KeyboardDevice::open(const std::vector<hid::HidFilter>& filters)
{
    if (_transport.isOpen()) {
        KL_LOGW(TAG, "open: already open");
        return false;
    }

    _transport.setDisconnectHandler([this]() { handleDisconnect(); });
    return _transport.open(filters);
}

void KeyboardDevice::close()
{
    // Abort and close first so a running bootstrap fails fast instead of
    // holding up the renewal cancel in reset().
    _slot.abort(std::make_exception_ptr(ConnectionError("device closed")));
    _transport.close();
    _lease.reset();
}

bool KeyboardDevice::isOpen() const
{
    return _transport.isOpen();
}

std::optional<hid::HidDeviceInfo> KeyboardDevice::deviceInfo() const
{
    return _transport.deviceInfo();
}

std::string KeyboardDevice::productName() const
{
    if (auto info = _transport.deviceInfo()) {
        return info->product;
    }
    return {};
}

void KeyboardDevice::onDisconnect(DisconnectCallback cb)
{
    std::lock_guard<std::mutex> g(_cbMx);
    _onDisconnect = std::move(cb);
}

// Reader thread. The transport closes itself after this returns.
void KeyboardDevice::handleDisconnect()
{
    KL_LOGW(TAG, "disconnected, failing in-flight request");

    _lease.reset();
    _slot.abort(std::make_exception_ptr(ConnectionError("device disconnected")));

    DisconnectCallback cb;
    {
        std::lock_guard<std::mutex> g(_cbMx);
        cb = _onDisconnect;
    }
    if (cb) {
        cb();
    }
}

} // namespace keylink::session
