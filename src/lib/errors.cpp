#include "keylink/core/errors.h"

#include <cstdio>

namespace keylink {

const char* to_string(ErrorKind kind) noexcept
{
    switch (kind) {
    case ErrorKind::Connection:       return "ConnectionError";
    case ErrorKind::AmbiguousDevice:  return "AmbiguousDeviceError";
    case ErrorKind::BootstrapFailure: return "BootstrapFailure";
    case ErrorKind::CommandTimeout:   return "CommandTimeout";
    case ErrorKind::Protocol:         return "ProtocolError";
    case ErrorKind::Decode:           return "DecodeError";
    }
    return "Error";
}

static std::string hex_byte(std::uint8_t v)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(v));
    return buf;
}

AmbiguousDeviceError::AmbiguousDeviceError(std::size_t matches)
    : Error(ErrorKind::AmbiguousDevice,
            "expected exactly one matching HID device, found " + std::to_string(matches))
    , _matches(matches)
{
}

BootstrapFailure::BootstrapFailure(std::uint8_t deviceCode)
    : Error(ErrorKind::BootstrapFailure,
            "device refused client id bootstrap, code " + std::to_string(deviceCode))
    , _code(deviceCode)
{
}

CommandTimeout::CommandTimeout(std::uint8_t subProtocol, std::uint8_t commandId)
    : Error(ErrorKind::CommandTimeout,
            "no response to command " + hex_byte(commandId) +
            " (protocol " + hex_byte(subProtocol) + ")")
    , _subProtocol(subProtocol)
    , _commandId(commandId)
{
}

ProtocolError::ProtocolError(std::uint8_t code)
    : Error(ErrorKind::Protocol, "device reported protocol error, code " + std::to_string(code))
    , _code(code)
{
}

} // namespace keylink
