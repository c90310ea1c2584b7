#pragma once

#include <tlsneg/negotiation/alpn_resolver.hpp>
#include <tlsneg/negotiation/engine_selector.hpp>
#include <tlsneg/negotiation/errors.hpp>
#include <tlsneg/negotiation/handshake_outcome.hpp>
#include <tlsneg/negotiation/negotiation_session.hpp>
#include <tlsneg/negotiation/protocol_set.hpp>
#include <tlsneg/tls/tls_config.hpp>
#include <tlsneg/tls/tls_context.hpp>
#include <tlsneg/log/macros.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tlsneg::http {

/// Per-endpoint handshake counters, safe to read while connections are negotiated
struct server_stats {
    std::atomic<uint64_t> negotiated_h2{0};
    std::atomic<uint64_t> negotiated_http11{0};
    std::atomic<uint64_t> version_mismatches{0};
    std::atomic<uint64_t> no_common_protocol{0};
    std::atomic<uint64_t> other_failures{0};
};

/// Immutable result of http_server::bind(): the negotiation policy of a listening endpoint
class bound_server {
public:
    bound_server(protocol_set protocols, alpn_advertisement advertisement,
                 std::optional<tls::tls_context> tls)
        : protocols_(std::move(protocols))
        , advertisement_(std::move(advertisement))
        , tls_(tls ? std::make_unique<tls::tls_context>(std::move(*tls)) : nullptr)
        , stats_(std::make_unique<server_stats>()) {}

    /// Protocols enabled at bind time
    const protocol_set& protocols() const noexcept { return protocols_; }

    /// ALPN tokens the server advertises, empty for HTTP/1.1-only endpoints
    const alpn_advertisement& advertisement() const noexcept { return advertisement_; }

    bool is_secure() const noexcept { return tls_ != nullptr; }

    /// Engine variant chosen at bind, std::nullopt for cleartext endpoints
    std::optional<tls_engine_variant> engine() const noexcept {
        if (!tls_) return std::nullopt;
        return tls_->engine();
    }

    /// TLS context of the endpoint, nullptr for cleartext endpoints
    tls::tls_context* tls_context() noexcept { return tls_.get(); }
    const tls::tls_context* tls_context() const noexcept { return tls_.get(); }

    const server_stats& stats() const noexcept { return *stats_; }

    /// Classify a handshake from the server's point of view and account for it
    handshake_outcome on_handshake(const handshake_report& report) const {
        negotiation_session session(advertisement_,
                                    tls_ ? tls_->versions() : tls_version_set{});
        auto outcome = session.complete(report);
        record(outcome);
        return outcome;
    }

    /// Account for a cleartext connection
    handshake_outcome on_cleartext() const {
        auto outcome = handshake_outcome::negotiated(std::string(alpn_token(http_protocol::http11)));
        record(outcome);
        return outcome;
    }

private:
    void record(const handshake_outcome& outcome) const {
        if (outcome.is_negotiated()) {
            auto& counter = outcome.protocol() == alpn_token(http_protocol::h2)
                ? stats_->negotiated_h2 : stats_->negotiated_http11;
            counter.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        switch (outcome.reason()) {
            case failure_reason::version_mismatch:
                stats_->version_mismatches.fetch_add(1, std::memory_order_relaxed);
                break;
            case failure_reason::no_common_protocol:
                stats_->no_common_protocol.fetch_add(1, std::memory_order_relaxed);
                break;
            case failure_reason::other:
                stats_->other_failures.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    }

    protocol_set protocols_;
    alpn_advertisement advertisement_;
    std::unique_ptr<tls::tls_context> tls_;
    std::unique_ptr<server_stats> stats_;
};

/// Invoked with the bound endpoint before bind() returns
using bind_hook = std::function<void(const bound_server&)>;

/// Fluent HTTP server configuration. Each protocol() call replaces the enabled
/// protocols; bind() snapshots the final configuration.
class http_server {
public:
    /// New server enabling HTTP/1.1 without TLS
    static http_server create() { return http_server(); }

    /// Enable exactly these protocols
    http_server& protocol(std::initializer_list<http_protocol> protocols) {
        protocols_.assign(protocols.begin(), protocols.end());
        return *this;
    }

    http_server& protocol(http_protocol p) {
        protocols_.assign(1, p);
        return *this;
    }

    /// Serve over TLS with these settings (mode is forced to server)
    http_server& secure(tls::tls_config cfg) {
        cfg.mode = tls::tls_mode::server;
        tls_ = std::move(cfg);
        return *this;
    }

    /// Adjust the current TLS settings in place, starting from defaults if none
    http_server& secure(const std::function<void(tls::tls_config&)>& configure) {
        tls::tls_config cfg = tls_.value_or(tls::tls_config{});
        configure(cfg);
        return secure(std::move(cfg));
    }

    /// Serve in cleartext again
    http_server& no_tls() {
        tls_.reset();
        return *this;
    }

    /// Register a hook observing the bound endpoint
    http_server& do_on_bind(bind_hook hook) {
        bind_hooks_.push_back(std::move(hook));
        return *this;
    }

    /// Override the detected platform capabilities
    http_server& platform(platform_capabilities caps) {
        selector_ = engine_selector(caps);
        return *this;
    }

    /// Snapshot the configuration and build the endpoint
    /// @throws negotiation_error (configuration, engine_unavailable); no hook runs on failure
    bound_server bind() const {
        try {
            auto bound = build();
            TLSNEG_LOG_DEBUG("HTTP server bound (alpn={}, engine={})",
                             describe_alpn(bound.advertisement()),
                             bound.engine() ? engine_variant_name(*bound.engine()) : "cleartext");
            for (const auto& hook : bind_hooks_) {
                hook(bound);
            }
            return bound;
        } catch (const negotiation_error& e) {
            TLSNEG_LOG_FAILURE(error, error_kind_to_string(e.kind()), "HTTP server bind failed: {}", e.what());
            throw;
        }
    }

private:
    http_server() = default;

    bound_server build() const {
        protocol_set protocols(protocols_);
        if (protocols.requires_tls() && !tls_) {
            throw_configuration_error("HTTP/2 requires TLS; configure secure() before bind");
        }
        if (!tls_) {
            return bound_server(std::move(protocols), {}, std::nullopt);
        }

        auto advertisement = resolve_alpn(protocols, tls_->require_alpn);
        auto engine = selector_.select(tls_->engine, !advertisement.empty());
        std::optional<tls::tls_context> ctx;
        ctx.emplace(*tls_, advertisement, engine);
        return bound_server(std::move(protocols), std::move(advertisement), std::move(ctx));
    }

    std::vector<http_protocol> protocols_{http_protocol::http11};
    std::optional<tls::tls_config> tls_;
    std::vector<bind_hook> bind_hooks_;
    engine_selector selector_;
};

} // namespace tlsneg::http
