#pragma once

#include <tlsneg/negotiation/alpn_resolver.hpp>
#include <tlsneg/negotiation/handshake_outcome.hpp>
#include <tlsneg/negotiation/protocol_set.hpp>
#include <tlsneg/negotiation/tls_version.hpp>
#include <tlsneg/log/macros.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tlsneg {

/// Raw error reported by the TLS engine for a failed handshake
struct engine_error {
    std::vector<unsigned long> codes;  ///< Packed OpenSSL error codes (ERR_get_error), both peers
    std::string message;               ///< Human-readable summary
};

/// What the TLS engine observed while running one handshake
struct handshake_report {
    std::optional<std::string> alpn;   ///< Selected ALPN token, none if no ALPN took place
    std::string version;               ///< Protocol version used ("TLSv1.3"), empty on failure
    std::optional<engine_error> error; ///< Set when the handshake did not complete
};

/// Choose the application protocol from two advertisements
/// @param local Selecting side, in preference order
/// @param peer Offering side
/// @return The agreed token, std::nullopt if there is none
///
/// A non-empty local list only agrees on a token the peer lists too. An empty
/// local list means that side sent no ALPN extension and speaks HTTP/1.1; it
/// agrees with a peer that offers nothing or lists "http/1.1".
inline std::optional<std::string> select_alpn(const alpn_advertisement& local,
                                              const alpn_advertisement& peer) {
    const std::string http11(alpn_token(http_protocol::http11));
    if (local.empty()) {
        if (peer.empty() || std::find(peer.begin(), peer.end(), http11) != peer.end()) {
            return http11;
        }
        return std::nullopt;
    }
    for (const auto& token : local) {
        if (std::find(peer.begin(), peer.end(), token) != peer.end()) {
            return token;
        }
    }
    return std::nullopt;
}

/// Classify a raw engine error into a failure reason
inline failure_reason classify_engine_error(const engine_error& err) noexcept {
    bool alpn = false;
    for (auto code : err.codes) {
        switch (ERR_GET_REASON(code)) {
            case SSL_R_UNSUPPORTED_PROTOCOL:
            case SSL_R_NO_PROTOCOLS_AVAILABLE:
            case SSL_R_TLSV1_ALERT_PROTOCOL_VERSION:
            case SSL_R_WRONG_VERSION_NUMBER:
            case SSL_R_VERSION_TOO_LOW:
            case SSL_R_VERSION_TOO_HIGH:
                return failure_reason::version_mismatch;
            case SSL_R_NO_APPLICATION_PROTOCOL:
            case SSL_R_TLSV1_ALERT_NO_APPLICATION_PROTOCOL:
                alpn = true;
                break;
            default:
                break;
        }
    }
    return alpn ? failure_reason::no_common_protocol : failure_reason::other;
}

/// Negotiation state of one connection attempt
enum class session_state {
    init,
    version_ok,
    negotiated,         ///< terminal
    version_mismatch,   ///< terminal
    no_common_protocol, ///< terminal
    failed              ///< terminal, lower-level error
};

constexpr std::string_view session_state_name(session_state s) noexcept {
    switch (s) {
        case session_state::init:               return "init";
        case session_state::version_ok:         return "version_ok";
        case session_state::negotiated:         return "negotiated";
        case session_state::version_mismatch:   return "version_mismatch";
        case session_state::no_common_protocol: return "no_common_protocol";
        case session_state::failed:             return "failed";
    }
    return "unknown";
}

/// One connection attempt's negotiation, seen from the local endpoint.
/// Not thread-safe; a new attempt needs a new session.
class negotiation_session {
public:
    negotiation_session(alpn_advertisement local_alpn, tls_version_set local_versions)
        : local_alpn_(std::move(local_alpn)), local_versions_(local_versions) {}

    session_state state() const noexcept { return state_; }

    bool is_terminal() const noexcept {
        return state_ != session_state::init && state_ != session_state::version_ok;
    }

    /// Outcome once terminal, std::nullopt before
    const std::optional<handshake_outcome>& outcome() const noexcept { return outcome_; }

    /// Step 1: intersect TLS versions with the peer's
    /// @return false if the session ended with a version mismatch
    bool check_versions(const tls_version_set& peer_versions) {
        expect(session_state::init, "check_versions");
        if (local_versions_.intersect(peer_versions).empty()) {
            finish(session_state::version_mismatch,
                   handshake_outcome::failed(failure_reason::version_mismatch,
                       fmt::format("no common TLS version: local {} vs peer {}",
                                   fmt::join(local_versions_.names(), ","),
                                   fmt::join(peer_versions.names(), ","))));
            return false;
        }
        state_ = session_state::version_ok;
        return true;
    }

    /// Step 2: agree on the application protocol
    const handshake_outcome& select_protocol(const alpn_advertisement& peer_alpn) {
        expect(session_state::version_ok, "select_protocol");
        if (auto selected = select_alpn(local_alpn_, peer_alpn)) {
            finish(session_state::negotiated, handshake_outcome::negotiated(std::move(*selected)));
        } else {
            finish(session_state::no_common_protocol,
                   handshake_outcome::failed(failure_reason::no_common_protocol,
                       fmt::format("no common application protocol: local {} vs peer {}",
                                   describe_alpn(local_alpn_), describe_alpn(peer_alpn))));
        }
        return *outcome_;
    }

    /// Abort with a lower-level error from any non-terminal state
    const handshake_outcome& fail(std::string detail) {
        if (is_terminal()) {
            throw std::logic_error("negotiation session already finished");
        }
        finish(session_state::failed, handshake_outcome::failed(failure_reason::other, std::move(detail)));
        return *outcome_;
    }

    /// Run both steps against a peer's declared configuration
    const handshake_outcome& negotiate(const alpn_advertisement& peer_alpn,
                                       const tls_version_set& peer_versions) {
        if (!check_versions(peer_versions)) {
            return *outcome_;
        }
        return select_protocol(peer_alpn);
    }

    /// Drive the session from what the TLS engine observed
    const handshake_outcome& complete(const handshake_report& report) {
        expect(session_state::init, "complete");
        if (report.error) {
            auto reason = classify_engine_error(*report.error);
            switch (reason) {
                case failure_reason::version_mismatch:
                    finish(session_state::version_mismatch,
                           handshake_outcome::failed(reason, report.error->message));
                    break;
                case failure_reason::no_common_protocol:
                    state_ = session_state::version_ok;
                    finish(session_state::no_common_protocol,
                           handshake_outcome::failed(reason, report.error->message));
                    break;
                case failure_reason::other:
                    finish(session_state::failed, handshake_outcome::failed(reason, report.error->message));
                    break;
            }
            return *outcome_;
        }

        state_ = session_state::version_ok;
        if (local_alpn_.empty()) {
            finish(session_state::negotiated, handshake_outcome::negotiated(
                report.alpn.value_or(std::string(alpn_token(http_protocol::http11)))));
            return *outcome_;
        }
        // Local side advertised: only a selected token it listed counts
        if (!report.alpn) {
            finish(session_state::no_common_protocol,
                   handshake_outcome::failed(failure_reason::no_common_protocol,
                       fmt::format("no ALPN protocol selected against local {}", describe_alpn(local_alpn_))));
            return *outcome_;
        }
        if (std::find(local_alpn_.begin(), local_alpn_.end(), *report.alpn) == local_alpn_.end()) {
            finish(session_state::no_common_protocol,
                   handshake_outcome::failed(failure_reason::no_common_protocol,
                       fmt::format("peer settled on {} outside local {}", *report.alpn, describe_alpn(local_alpn_))));
            return *outcome_;
        }
        finish(session_state::negotiated, handshake_outcome::negotiated(*report.alpn));
        return *outcome_;
    }

private:
    void expect(session_state s, const char* step) const {
        if (state_ != s) {
            throw std::logic_error(fmt::format("negotiation session: {} called in state {}",
                                               step, session_state_name(state_)));
        }
    }

    void finish(session_state s, handshake_outcome outcome) {
        state_ = s;
        if (!outcome.is_negotiated()) {
            TLSNEG_LOG_DEBUG("negotiation failed ({}): {}",
                             failure_reason_name(outcome.reason()), outcome.detail());
        }
        outcome_ = std::move(outcome);
    }

    alpn_advertisement local_alpn_;
    tls_version_set local_versions_;
    session_state state_ = session_state::init;
    std::optional<handshake_outcome> outcome_;
};

/// Negotiate a connection between two declared configurations
inline handshake_outcome negotiate(const alpn_advertisement& local_alpn,
                                   const alpn_advertisement& peer_alpn,
                                   const tls_version_set& local_versions,
                                   const tls_version_set& peer_versions) {
    negotiation_session session(local_alpn, local_versions);
    return session.negotiate(peer_alpn, peer_versions);
}

} // namespace tlsneg
