#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace keylink {

// Failure categories surfaced to callers of the protocol engine.
enum class ErrorKind : std::uint8_t {
    Connection,        // no handle, or the handle was lost
    AmbiguousDevice,   // open() matched zero or several devices
    BootstrapFailure,  // lease acquisition exhausted retries or was refused
    CommandTimeout,    // no matching response before the deadline
    Protocol,          // device answered with an explicit 0xFF error
    Decode,            // payload too short / malformed for the decode shape
};

const char* to_string(ErrorKind kind) noexcept;

// Base of every engine exception. Asynchronous calls store these in the
// returned future; synchronous calls throw them directly.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what)
        , _kind(kind)
    {}

    ErrorKind kind() const noexcept { return _kind; }

private:
    ErrorKind _kind;
};

class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& what)
        : Error(ErrorKind::Connection, what)
    {}
};

class AmbiguousDeviceError : public Error {
public:
    explicit AmbiguousDeviceError(std::size_t matches);

    std::size_t matches() const noexcept { return _matches; }

private:
    std::size_t _matches;
};

class BootstrapFailure : public Error {
public:
    explicit BootstrapFailure(const std::string& what)
        : Error(ErrorKind::BootstrapFailure, what)
    {}

    // Device refused the bootstrap (client id 0xFFFFFFFF) with this code.
    explicit BootstrapFailure(std::uint8_t deviceCode);

    const std::optional<std::uint8_t>& deviceCode() const noexcept { return _code; }

private:
    std::optional<std::uint8_t> _code;
};

class CommandTimeout : public Error {
public:
    CommandTimeout(std::uint8_t subProtocol, std::uint8_t commandId);

    std::uint8_t subProtocol() const noexcept { return _subProtocol; }
    std::uint8_t commandId() const noexcept { return _commandId; }

private:
    std::uint8_t _subProtocol;
    std::uint8_t _commandId;
};

class ProtocolError : public Error {
public:
    explicit ProtocolError(std::uint8_t code);

    std::uint8_t code() const noexcept { return _code; }

private:
    std::uint8_t _code;
};

class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& what)
        : Error(ErrorKind::Decode, what)
    {}
};

} // namespace keylink
