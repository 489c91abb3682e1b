#include "keylink/io/transport/hid_transport.h"

#include "keylink/core/errors.h"
#include "keylink/core/logging.h"

#include <chrono>
#include <stdexcept>

namespace keylink::io {

static constexpr const char* TAG = "hid";

// Upper bound on how long close() waits for the reader to notice.
static constexpr std::chrono::milliseconds READ_POLL_INTERVAL{50};

using protocol::REPORT_SIZE;
using protocol::Report;
using protocol::WrapperPacket;

HidTransport::HidTransport(hid::HidBackend& backend)
    : _backend(backend)
{
}

HidTransport::~HidTransport()
{
    close();
}

bool HidTransport::open(const std::vector<hid::HidFilter>& filters)
{
    std::lock_guard<std::mutex> g(_mx);
    if (_device) {
        KL_LOGW(TAG, "open: already open");
        return false;
    }

    std::vector<hid::HidDeviceInfo> matches;
    for (auto& info : _backend.enumerate()) {
        if (hid::matches_any(filters, info)) {
            matches.push_back(std::move(info));
        }
    }

    if (matches.size() != 1) {
        KL_LOGE(TAG, "open: %u interfaces match the filters, need exactly 1",
                static_cast<unsigned>(matches.size()));
        throw AmbiguousDeviceError(matches.size());
    }

    auto device = _backend.open(matches.front());
    if (!device) {
        throw ConnectionError("failed to open HID device " + matches.front().path);
    }

    _device = std::move(device);
    _info   = matches.front();
    _running.store(true);
    _reader = std::thread(&HidTransport::readerLoop, this, _device.get());

    KL_LOGI(TAG, "open: %s (%04x:%04x)", _info->product.c_str(), _info->vendorId, _info->productId);
    return true;
}

void HidTransport::close()
{
    std::thread reader;
    std::unique_ptr<hid::HidDevice> device;
    {
        std::lock_guard<std::mutex> g(_mx);
        if (!_device) {
            return;
        }
        _running.store(false);
        reader = std::move(_reader);
        device = std::move(_device);
        _info.reset();
    }

    if (reader.joinable()) {
        if (reader.get_id() == std::this_thread::get_id()) {
            // Closing from the disconnect path; the loop exits on return.
            reader.detach();
        } else {
            reader.join();
        }
    }

    {
        std::lock_guard<std::mutex> g(_handlerMx);
        _onDisconnect = nullptr;
    }

    device.reset();
    KL_LOGI(TAG, "closed");
}

bool HidTransport::isOpen() const
{
    std::lock_guard<std::mutex> g(_mx);
    return _device != nullptr;
}

std::optional<hid::HidDeviceInfo> HidTransport::deviceInfo() const
{
    std::lock_guard<std::mutex> g(_mx);
    return _info;
}

void HidTransport::send(const Report& report)
{
    std::lock_guard<std::mutex> g(_mx);
    if (!_device) {
        throw ConnectionError("HID device not connected");
    }

    KL_LOG_HEX(TAG, "tx", report.data(), report.size());

    if (!_device->write(report.data(), report.size())) {
        throw ConnectionError("HID write failed");
    }
}

void HidTransport::subscribe(ReportHandler handler)
{
    std::lock_guard<std::mutex> g(_handlerMx);
    if (_subscriber) {
        throw std::logic_error("HidTransport already has a report subscriber");
    }
    _subscriber = std::move(handler);
}

void HidTransport::unsubscribe()
{
    std::lock_guard<std::mutex> g(_handlerMx);
    _subscriber = nullptr;
}

void HidTransport::setDisconnectHandler(DisconnectHandler handler)
{
    std::lock_guard<std::mutex> g(_handlerMx);
    _onDisconnect = std::move(handler);
}

void HidTransport::readerLoop(hid::HidDevice* device)
{
    Report buf{};

    while (_running.load()) {
        const int n = device->read(buf.data(), REPORT_SIZE, READ_POLL_INTERVAL);
        if (n == 0) {
            continue;
        }
        if (n < 0) {
            if (_running.load()) {
                handleDisconnect();
            }
            return;
        }

        KL_LOG_HEX(TAG, "rx", buf.data(), static_cast<std::size_t>(n));
        const WrapperPacket pkt = WrapperPacket::fromReport(buf.data(), static_cast<std::size_t>(n));

        ReportHandler handler;
        {
            std::lock_guard<std::mutex> g(_handlerMx);
            handler = _subscriber;
        }
        if (handler) {
            handler(pkt);
        }
    }
}

void HidTransport::handleDisconnect()
{
    KL_LOGW(TAG, "device disconnected");

    DisconnectHandler handler;
    {
        std::lock_guard<std::mutex> g(_handlerMx);
        handler = std::move(_onDisconnect);
        _onDisconnect = nullptr;
    }
    if (handler) {
        handler();
    }

    close();
}

} // namespace keylink::io
