#pragma once

#include <stdexcept>
#include <string>

namespace tlsneg {

/// Negotiation error taxonomy
enum class error_kind {
    configuration,       ///< Invalid endpoint configuration (fatal at bind)
    version_mismatch,    ///< No common TLS protocol version
    no_common_protocol,  ///< No common ALPN application protocol
    engine_unavailable,  ///< Requested TLS engine cannot be provided (fatal at bind)
    other                ///< Any other handshake-level failure
};

/// Convert error kind to string
constexpr const char* error_kind_to_string(error_kind kind) noexcept {
    switch (kind) {
        case error_kind::configuration:      return "configuration";
        case error_kind::version_mismatch:   return "version_mismatch";
        case error_kind::no_common_protocol: return "no_common_protocol";
        case error_kind::engine_unavailable: return "engine_unavailable";
        case error_kind::other:              return "other";
        default:                             return "unknown";
    }
}

/// Thrown for errors detected at configure/bind time
class negotiation_error : public std::runtime_error {
public:
    negotiation_error(error_kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

/// Throw a configuration error
[[noreturn]] inline void throw_configuration_error(const std::string& what) {
    throw negotiation_error(error_kind::configuration, what);
}

/// Throw an engine-unavailable error
[[noreturn]] inline void throw_engine_unavailable(const std::string& what) {
    throw negotiation_error(error_kind::engine_unavailable, what);
}

} // namespace tlsneg
