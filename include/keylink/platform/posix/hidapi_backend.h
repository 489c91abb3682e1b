#pragma once

#include <memory>
#include <vector>

#include "keylink/hid/hid_device.h"

namespace keylink::platform::posix {

// hidapi-backed enumeration / open. hid_init() runs on first use and
// hid_exit() when the last backend goes away.
class HidapiBackend : public hid::HidBackend {
public:
    HidapiBackend();
    ~HidapiBackend() override;

    HidapiBackend(const HidapiBackend&) = delete;
    HidapiBackend& operator=(const HidapiBackend&) = delete;

    std::vector<hid::HidDeviceInfo> enumerate() override;
    std::unique_ptr<hid::HidDevice> open(const hid::HidDeviceInfo& info) override;

private:
    bool _initialized{false};
};

} // namespace keylink::platform::posix
