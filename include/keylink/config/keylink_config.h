#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "keylink/hid/hid_device.h"

namespace keylink::config {

struct DeviceConfig {
    // Which HID interfaces count as "the keyboard". Matching any filter is
    // enough; open() still requires exactly one match overall.
    std::vector<hid::HidFilter> filters{hid::default_vendor_filter()};
};

struct ProtocolConfig {
    std::chrono::milliseconds commandTimeout{1000};

    unsigned                  bootstrapAttempts{5};
    unsigned                  bootstrapReadsPerAttempt{50};
    std::chrono::milliseconds bootstrapReadTimeout{500};

    // Fraction of the device TTL after which the lease counts as expired
    // and renewal fires.
    double                    renewFraction{0.9};

    // Data bytes per chunk: 26 payload - command echo - offset(2) - size.
    std::size_t               chunkSize{22};

    // Sanity cap on the definition blob size reported by the device.
    std::size_t               maxDefinitionSize{50u * 1024u * 1024u};
};

// Unified config for one keylink client.
struct KeylinkConfig {
    DeviceConfig   device;
    ProtocolConfig protocol;
};

// Abstract storage interface.
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    virtual KeylinkConfig load() = 0;
    virtual void          save(const KeylinkConfig& cfg) = 0;
};

} // namespace keylink::config
