#pragma once

#include <tlsneg/http/http_server.hpp>
#include <tlsneg/negotiation/alpn_resolver.hpp>
#include <tlsneg/negotiation/engine_selector.hpp>
#include <tlsneg/negotiation/errors.hpp>
#include <tlsneg/negotiation/handshake_outcome.hpp>
#include <tlsneg/negotiation/negotiation_session.hpp>
#include <tlsneg/negotiation/protocol_set.hpp>
#include <tlsneg/tls/tls_config.hpp>
#include <tlsneg/tls/tls_context.hpp>
#include <tlsneg/tls/tls_handshake.hpp>
#include <tlsneg/log/macros.hpp>

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tlsneg::http {

/// Result of one connection attempt
struct connection_result {
    handshake_outcome outcome;
    std::string tls_version;                   ///< Version used, empty for cleartext or failures
    std::optional<tls_engine_variant> engine;  ///< Client engine, std::nullopt for cleartext
    alpn_advertisement advertisement;          ///< What the client offered

    explicit operator bool() const noexcept { return outcome.is_negotiated(); }
};

/// Fluent HTTP client configuration; connect() snapshots it per attempt
class http_client {
public:
    /// New client speaking HTTP/1.1 without TLS
    static http_client create() { return http_client(); }

    /// Enable exactly these protocols
    http_client& protocol(std::initializer_list<http_protocol> protocols) {
        protocols_.assign(protocols.begin(), protocols.end());
        return *this;
    }

    http_client& protocol(http_protocol p) {
        protocols_.assign(1, p);
        return *this;
    }

    /// Connect over TLS with these settings (mode is forced to client)
    http_client& secure(tls::tls_config cfg) {
        cfg.mode = tls::tls_mode::client;
        tls_ = std::move(cfg);
        return *this;
    }

    http_client& secure(const std::function<void(tls::tls_config&)>& configure) {
        tls::tls_config cfg = tls_.value_or(tls::tls_config::for_client_insecure());
        configure(cfg);
        return secure(std::move(cfg));
    }

    /// Server name sent in the handshake
    http_client& host(std::string name) {
        host_ = std::move(name);
        return *this;
    }

    /// Override the detected platform capabilities
    http_client& platform(platform_capabilities caps) {
        selector_ = engine_selector(caps);
        return *this;
    }

    /// Attempt one connection to a bound server. Failures are reported in the
    /// result and never retried.
    /// @throws negotiation_error (configuration, engine_unavailable) for an invalid client setup
    connection_result connect(const bound_server& server) const {
        protocol_set protocols(protocols_);
        if (protocols.requires_tls() && !tls_) {
            throw_configuration_error("HTTP/2 requires TLS; configure secure() before connect");
        }

        if (!tls_ || !server.is_secure()) {
            return connect_cleartext(server);
        }

        auto advertisement = resolve_alpn(protocols, tls_->require_alpn);
        auto engine = selector_.select(tls_->engine, !advertisement.empty());
        tls::tls_context client_ctx(*tls_, advertisement, engine);

        auto report = tls::perform_handshake(client_ctx, *server.tls_context(), host_);

        negotiation_session session(advertisement, tls_->versions);
        auto client_view = session.complete(report);
        auto server_view = server.on_handshake(report);

        // A side that rejects the connection decides the attempt
        auto outcome = !client_view.is_negotiated() ? std::move(client_view)
                     : !server_view.is_negotiated() ? std::move(server_view)
                     : std::move(client_view);

        if (outcome.is_negotiated()) {
            TLSNEG_LOG_DEBUG("Connected over {} using {}", report.version, outcome.protocol());
        } else {
            TLSNEG_LOG_FAILURE(warning, failure_reason_name(outcome.reason()),
                               "TLS handshake failed: {}", outcome.detail());
        }

        return connection_result{std::move(outcome),
                                 outcome_version(report),
                                 engine,
                                 std::move(advertisement)};
    }

private:
    http_client() = default;

    static std::string outcome_version(const handshake_report& report) {
        return report.error ? std::string{} : report.version;
    }

    connection_result connect_cleartext(const bound_server& server) const {
        if (tls_ || server.is_secure()) {
            auto outcome = handshake_outcome::failed(failure_reason::other,
                tls_ ? "server does not speak TLS" : "server requires TLS");
            TLSNEG_LOG_FAILURE(warning, failure_reason_name(outcome.reason()),
                               "Connection refused: {}", outcome.detail());
            return connection_result{std::move(outcome), {}, std::nullopt, {}};
        }
        return connection_result{server.on_cleartext(), {}, std::nullopt, {}};
    }

    std::vector<http_protocol> protocols_{http_protocol::http11};
    std::optional<tls::tls_config> tls_;
    std::string host_ = "localhost";
    engine_selector selector_;
};

} // namespace tlsneg::http
