#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace keylink::hid {

// One HID interface as reported by enumeration.
struct HidDeviceInfo {
    std::string   path;          // backend-specific, used to open
    std::uint16_t vendorId{0};
    std::uint16_t productId{0};
    std::uint16_t usagePage{0};
    std::uint16_t usage{0};
    std::string   product;
    std::string   serial;
};

// Unset fields are wildcards; a device matches when every set field matches.
struct HidFilter {
    std::optional<std::uint16_t> vendorId;
    std::optional<std::uint16_t> productId;
    std::optional<std::uint16_t> usagePage;
    std::optional<std::uint16_t> usage;

    bool matches(const HidDeviceInfo& info) const noexcept;
};

// Raw-HID vendor interface used by the keyboard firmware.
HidFilter default_vendor_filter();

// True when `info` matches any filter. An empty filter list matches nothing.
bool matches_any(const std::vector<HidFilter>& filters, const HidDeviceInfo& info) noexcept;

// Abstract handle on one opened HID interface.
class HidDevice {
public:
    virtual ~HidDevice() = default;

    // Write one output report (without report id).
    // Returns false if the device is gone.
    virtual bool write(const std::uint8_t* data, std::size_t len) = 0;

    // Read one input report, waiting up to `timeout`.
    //  > 0 : bytes read
    //    0 : timeout, nothing available
    //  < 0 : device error / disconnected
    virtual int read(std::uint8_t* buffer, std::size_t maxLen, std::chrono::milliseconds timeout) = 0;
};

// Enumerates and opens devices (hidapi in production, fakes in tests).
class HidBackend {
public:
    virtual ~HidBackend() = default;

    virtual std::vector<HidDeviceInfo> enumerate() = 0;

    // nullptr if the path could not be opened.
    virtual std::unique_ptr<HidDevice> open(const HidDeviceInfo& info) = 0;
};

} // namespace keylink::hid
