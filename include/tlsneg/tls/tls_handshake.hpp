#pragma once

#include <tlsneg/tls/tls_context.hpp>
#include <tlsneg/negotiation/negotiation_session.hpp>
#include <tlsneg/log/macros.hpp>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tlsneg::tls {

/// TLS handshake step result
enum class handshake_result {
    success,
    want_read,
    want_write,
    error
};

/// One side of a TLS connection bound to an in-memory BIO
class tls_session {
public:
    /// Create a session for a context; the BIO is attached with attach()
    explicit tls_session(const tls_context& ctx)
        : mode_(ctx.mode()) {
        ssl_ = ctx.create_ssl();
        if (!ssl_) {
            throw std::runtime_error("Failed to create SSL object: " + drain_ssl_errors());
        }
        if (mode_ == tls_mode::client) {
            SSL_set_connect_state(ssl_);
        } else {
            SSL_set_accept_state(ssl_);
        }
    }

    ~tls_session() {
        if (ssl_) {
            SSL_free(ssl_);
        }
    }

    // Non-copyable
    tls_session(const tls_session&) = delete;
    tls_session& operator=(const tls_session&) = delete;

    // Movable
    tls_session(tls_session&& other) noexcept
        : ssl_(other.ssl_)
        , mode_(other.mode_)
        , handshake_complete_(other.handshake_complete_)
        , hostname_(std::move(other.hostname_))
        , errors_(std::move(other.errors_))
        , error_text_(std::move(other.error_text_)) {
        other.ssl_ = nullptr;
    }

    tls_session& operator=(tls_session&& other) noexcept {
        if (this != &other) {
            if (ssl_) SSL_free(ssl_);
            ssl_ = other.ssl_;
            mode_ = other.mode_;
            handshake_complete_ = other.handshake_complete_;
            hostname_ = std::move(other.hostname_);
            errors_ = std::move(other.errors_);
            error_text_ = std::move(other.error_text_);
            other.ssl_ = nullptr;
        }
        return *this;
    }

    /// Hand a BIO to the session (takes ownership)
    void attach(BIO* bio) noexcept {
        SSL_set_bio(ssl_, bio, bio);
    }

    /// Set SNI hostname (for client connections)
    void set_hostname(std::string_view hostname) {
        hostname_ = std::string(hostname);
        SSL_set_tlsext_host_name(ssl_, hostname_.c_str());
    }

    /// Advance the handshake as far as buffered input allows
    handshake_result step() {
        if (handshake_complete_) {
            return handshake_result::success;
        }

        ERR_clear_error();
        int ret = SSL_do_handshake(ssl_);
        if (ret == 1) {
            handshake_complete_ = true;
            TLSNEG_LOG_DEBUG("TLS handshake complete ({}, protocol: {}, cipher: {})",
                             mode_ == tls_mode::client ? "client" : "server",
                             SSL_get_version(ssl_), SSL_get_cipher_name(ssl_));
            return handshake_result::success;
        }

        int err = SSL_get_error(ssl_, ret);
        switch (err) {
            case SSL_ERROR_WANT_READ:
                return handshake_result::want_read;
            case SSL_ERROR_WANT_WRITE:
                return handshake_result::want_write;
            default:
                break;
        }

        // The error queue is per thread and shared with the peer session: collect it now
        while (unsigned long code = ERR_get_error()) {
            errors_.push_back(code);
        }
        error_text_ = get_ssl_error_string(err);
        return handshake_result::error;
    }

    /// Get negotiated ALPN protocol
    std::optional<std::string> alpn_protocol() const {
        const unsigned char* proto = nullptr;
        unsigned int len = 0;
        SSL_get0_alpn_selected(ssl_, &proto, &len);
        if (proto && len > 0) {
            return std::string(reinterpret_cast<const char*>(proto), len);
        }
        return std::nullopt;
    }

    /// Get TLS version string
    const char* version() const {
        return SSL_get_version(ssl_);
    }

    /// Get cipher name
    const char* cipher() const {
        return SSL_get_cipher_name(ssl_);
    }

    tls_mode mode() const noexcept { return mode_; }
    bool is_handshake_complete() const noexcept { return handshake_complete_; }

    /// Packed OpenSSL error codes collected from failed steps
    const std::vector<unsigned long>& errors() const noexcept { return errors_; }

    /// Description of the last failed step, empty if none failed
    const std::string& error_text() const noexcept { return error_text_; }

    SSL* native_handle() noexcept { return ssl_; }

private:
    std::string get_ssl_error_string(int err) const {
        switch (err) {
            case SSL_ERROR_NONE: return "none";
            case SSL_ERROR_SSL: {
                if (errors_.empty()) return "ssl error";
                char buf[256];
                ERR_error_string_n(errors_.back(), buf, sizeof(buf));
                return buf;
            }
            case SSL_ERROR_WANT_X509_LOOKUP: return "want_x509_lookup";
            case SSL_ERROR_SYSCALL: return "syscall error: " + std::string(strerror(errno));
            case SSL_ERROR_ZERO_RETURN: return "zero_return";
            case SSL_ERROR_WANT_CONNECT: return "want_connect";
            case SSL_ERROR_WANT_ACCEPT: return "want_accept";
            default: return "unknown(" + std::to_string(err) + ")";
        }
    }

    SSL* ssl_ = nullptr;
    tls_mode mode_ = tls_mode::client;
    bool handshake_complete_ = false;
    std::string hostname_;  // Stored for SNI
    std::vector<unsigned long> errors_;
    std::string error_text_;
};

/// Client and server sessions after a memory handshake
struct handshake_pair {
    tls_session client;
    tls_session server;
    handshake_report report;
};

/// Run a full handshake between a client and a server context over an in-memory BIO pair.
/// Both sessions are stepped until both complete, one fails and the other has consumed
/// its alert, or no further progress is possible.
/// @param sni Server name sent by the client, none if empty
inline handshake_pair run_memory_handshake(const tls_context& client_ctx, const tls_context& server_ctx,
                                           std::string_view sni = {}) {
    if (client_ctx.mode() != tls_mode::client || server_ctx.mode() != tls_mode::server) {
        throw std::invalid_argument("memory handshake needs a client and a server context");
    }

    tls_session client(client_ctx);
    tls_session server(server_ctx);

    BIO* client_bio = nullptr;
    BIO* server_bio = nullptr;
    if (BIO_new_bio_pair(&client_bio, 0, &server_bio, 0) != 1) {
        throw std::runtime_error("BIO_new_bio_pair failed: " + drain_ssl_errors());
    }
    client.attach(client_bio);
    server.attach(server_bio);
    if (!sni.empty()) {
        client.set_hostname(sni);
    }

    // Each flight needs one step per side; a full TLS 1.2 handshake takes a handful
    constexpr int max_rounds = 32;
    bool client_failed = false;
    bool server_failed = false;
    for (int round = 0; round < max_rounds; ++round) {
        if (!client_failed) {
            client_failed = client.step() == handshake_result::error;
        }
        if (!server_failed) {
            server_failed = server.step() == handshake_result::error;
        }
        if (client.is_handshake_complete() && server.is_handshake_complete()) {
            break;
        }
        if (client_failed && server_failed) {
            break;
        }
        // One side failed; give the other a final step to read the alert
        if (client_failed || server_failed) {
            if (!client_failed && !client.is_handshake_complete()) {
                client_failed = client.step() == handshake_result::error;
            }
            if (!server_failed && !server.is_handshake_complete()) {
                server_failed = server.step() == handshake_result::error;
            }
            break;
        }
    }

    handshake_report report;
    if (client.is_handshake_complete() && server.is_handshake_complete()) {
        report.alpn = client.alpn_protocol();
        report.version = client.version();
    } else {
        engine_error err;
        err.codes = client.errors();
        err.codes.insert(err.codes.end(), server.errors().begin(), server.errors().end());
        if (!client_failed && !server_failed) {
            err.message = "handshake stalled";
        } else {
            err.message = fmt::format("client: {}; server: {}",
                                      client.error_text().empty() ? "ok" : client.error_text(),
                                      server.error_text().empty() ? "ok" : server.error_text());
        }
        report.error = std::move(err);
    }

    return handshake_pair{std::move(client), std::move(server), std::move(report)};
}

/// Handshake primitive: run a memory handshake and keep only what the engine observed
inline handshake_report perform_handshake(const tls_context& client_ctx, const tls_context& server_ctx,
                                          std::string_view sni = {}) {
    return run_memory_handshake(client_ctx, server_ctx, sni).report;
}

} // namespace tlsneg::tls
