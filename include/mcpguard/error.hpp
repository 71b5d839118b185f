#pragma once
#include <stdexcept>
#include <string>

namespace mcpguard {

class GuardError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Payload is not a JSON-RPC shaped JSON object. Recovered by pass-through.
class ParseError : public GuardError {
public:
    using GuardError::GuardError;
};

/// Decision channel, socket or upstream I/O failure.
class TransportError : public GuardError {
public:
    using GuardError::GuardError;
};

/// The proxied server could not be started. The only fatal error.
class SpawnError : public GuardError {
public:
    using GuardError::GuardError;
};

class ConfigError : public GuardError {
public:
    using GuardError::GuardError;
};

namespace error {
    constexpr int BlockedByPolicy = -32001;
    constexpr int BadGateway      = -32000;
} // namespace error

} // namespace mcpguard
