#include "keylink/platform/posix/hidapi_backend.h"

#include "keylink/core/logging.h"

#include <algorithm>
#include <atomic>
#include <cwchar>
#include <string>

#include <hidapi/hidapi.h>

namespace keylink::platform::posix {

static constexpr const char* TAG = "hid";

// hid_init()/hid_exit() are process-wide.
static std::atomic<int> s_backendCount{0};

static std::string narrow(const wchar_t* ws)
{
    std::string out;
    if (!ws) {
        return out;
    }
    for (; *ws; ++ws) {
        const wchar_t c = *ws;
        out.push_back((c >= 0x20 && c < 0x7F) ? static_cast<char>(c) : '?');
    }
    return out;
}

class HidapiDevice : public hid::HidDevice {
public:
    explicit HidapiDevice(hid_device* handle)
        : _handle(handle)
    {}

    ~HidapiDevice() override
    {
        if (_handle) {
            ::hid_close(_handle);
        }
    }

    bool write(const std::uint8_t* data, std::size_t len) override
    {
        // hidapi expects the report id as the first byte; the vendor
        // interface does not use numbered reports.
        std::uint8_t buf[65] = {0};
        const std::size_t n = std::min(len, sizeof(buf) - 1);
        std::copy_n(data, n, buf + 1);

        const int wrote = ::hid_write(_handle, buf, n + 1);
        if (wrote < 0) {
            KL_LOGE(TAG, "hid_write failed: %s", narrow(::hid_error(_handle)).c_str());
            return false;
        }
        return true;
    }

    int read(std::uint8_t* buffer, std::size_t maxLen, std::chrono::milliseconds timeout) override
    {
        const int n = ::hid_read_timeout(_handle, buffer, maxLen, static_cast<int>(timeout.count()));
        if (n < 0) {
            KL_LOGW(TAG, "hid_read_timeout failed: %s", narrow(::hid_error(_handle)).c_str());
        }
        return n;
    }

private:
    hid_device* _handle;
};

HidapiBackend::HidapiBackend()
{
    if (s_backendCount.fetch_add(1) == 0) {
        if (::hid_init() != 0) {
            KL_LOGE(TAG, "hid_init failed");
            s_backendCount.fetch_sub(1);
            return;
        }
    }
    _initialized = true;
}

HidapiBackend::~HidapiBackend()
{
    if (_initialized && s_backendCount.fetch_sub(1) == 1) {
        ::hid_exit();
    }
}

std::vector<hid::HidDeviceInfo> HidapiBackend::enumerate()
{
    std::vector<hid::HidDeviceInfo> out;
    if (!_initialized) {
        return out;
    }

    hid_device_info* list = ::hid_enumerate(0, 0);
    for (hid_device_info* cur = list; cur; cur = cur->next) {
        hid::HidDeviceInfo info;
        info.path      = cur->path ? cur->path : "";
        info.vendorId  = cur->vendor_id;
        info.productId = cur->product_id;
        info.usagePage = cur->usage_page;
        info.usage     = cur->usage;
        info.product   = narrow(cur->product_string);
        info.serial    = narrow(cur->serial_number);
        out.push_back(std::move(info));
    }
    ::hid_free_enumeration(list);

    KL_LOGD(TAG, "enumerated %u HID interfaces", static_cast<unsigned>(out.size()));
    return out;
}

std::unique_ptr<hid::HidDevice> HidapiBackend::open(const hid::HidDeviceInfo& info)
{
    if (!_initialized) {
        return nullptr;
    }

    hid_device* handle = ::hid_open_path(info.path.c_str());
    if (!handle) {
        KL_LOGE(TAG, "hid_open_path(%s) failed", info.path.c_str());
        return nullptr;
    }

    KL_LOGI(TAG, "opened %04x:%04x '%s'", info.vendorId, info.productId, info.product.c_str());
    return std::make_unique<HidapiDevice>(handle);
}

} // namespace keylink::platform::posix
