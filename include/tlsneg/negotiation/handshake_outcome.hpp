#pragma once

#include <tlsneg/negotiation/errors.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace tlsneg {

/// Why a connection attempt failed to negotiate
enum class failure_reason {
    version_mismatch,
    no_common_protocol,
    other
};

constexpr std::string_view failure_reason_name(failure_reason r) noexcept {
    switch (r) {
        case failure_reason::version_mismatch:   return "version_mismatch";
        case failure_reason::no_common_protocol: return "no_common_protocol";
        case failure_reason::other:              return "other";
    }
    return "unknown";
}

/// Map a failure reason onto the error taxonomy
constexpr error_kind to_error_kind(failure_reason r) noexcept {
    switch (r) {
        case failure_reason::version_mismatch:   return error_kind::version_mismatch;
        case failure_reason::no_common_protocol: return error_kind::no_common_protocol;
        case failure_reason::other:              return error_kind::other;
    }
    return error_kind::other;
}

/// Result of one connection attempt: a protocol tag or a failure reason
class handshake_outcome {
public:
    struct negotiated_t {
        std::string protocol;  ///< ALPN token, "http/1.1" when no ALPN took place
    };

    struct failed_t {
        failure_reason reason;
        std::string detail;    ///< Engine error text, may be empty
    };

    static handshake_outcome negotiated(std::string protocol) {
        return handshake_outcome(negotiated_t{std::move(protocol)});
    }

    static handshake_outcome failed(failure_reason reason, std::string detail = {}) {
        return handshake_outcome(failed_t{reason, std::move(detail)});
    }

    bool is_negotiated() const noexcept { return std::holds_alternative<negotiated_t>(state_); }
    explicit operator bool() const noexcept { return is_negotiated(); }

    /// Negotiated protocol tag (empty if failed)
    std::string_view protocol() const noexcept {
        if (auto* n = std::get_if<negotiated_t>(&state_)) {
            return n->protocol;
        }
        return {};
    }

    /// Failure reason; only meaningful when !is_negotiated()
    failure_reason reason() const noexcept {
        if (auto* f = std::get_if<failed_t>(&state_)) {
            return f->reason;
        }
        return failure_reason::other;
    }

    std::string_view detail() const noexcept {
        if (auto* f = std::get_if<failed_t>(&state_)) {
            return f->detail;
        }
        return {};
    }

    /// Access the underlying alternative for std::visit
    const std::variant<negotiated_t, failed_t>& value() const noexcept { return state_; }

private:
    explicit handshake_outcome(std::variant<negotiated_t, failed_t> state)
        : state_(std::move(state)) {}

    std::variant<negotiated_t, failed_t> state_;
};

} // namespace tlsneg
