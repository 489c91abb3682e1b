#pragma once

#include <string>

#include "keylink/config/keylink_config.h"

namespace keylink::config {

// File-backed YAML implementation of ConfigStore.
class YamlConfigStore : public ConfigStore {
public:
    explicit YamlConfigStore(std::string path);

    // Missing or unreadable file: defaults (logged).
    KeylinkConfig load() override;

    // Throws std::runtime_error when the file cannot be written.
    void save(const KeylinkConfig& cfg) override;

    const std::string& path() const noexcept { return _path; }

private:
    std::string _path;
};

// String-level mapping, shared with the tests.
KeylinkConfig config_from_yaml(const std::string& text);
std::string   config_to_yaml(const KeylinkConfig& cfg);

} // namespace keylink::config
