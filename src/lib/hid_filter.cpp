#include "keylink/hid/hid_device.h"

namespace keylink::hid {

static constexpr std::uint16_t RAW_HID_USAGE_PAGE = 0xFF60;
static constexpr std::uint16_t RAW_HID_USAGE      = 0x61;

bool HidFilter::matches(const HidDeviceInfo& info) const noexcept
{
    if (vendorId && *vendorId != info.vendorId) return false;
    if (productId && *productId != info.productId) return false;
    if (usagePage && *usagePage != info.usagePage) return false;
    if (usage && *usage != info.usage) return false;
    return true;
}

HidFilter default_vendor_filter()
{
    HidFilter f;
    f.usagePage = RAW_HID_USAGE_PAGE;
    f.usage     = RAW_HID_USAGE;
    return f;
}

bool matches_any(const std::vector<HidFilter>& filters, const HidDeviceInfo& info) noexcept
{
    for (const auto& f : filters) {
        if (f.matches(info)) {
            return true;
        }
    }
    return false;
}

} // namespace keylink::hid
