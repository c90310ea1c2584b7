#pragma once

#include <tlsneg/tls/tls_config.hpp>
#include <tlsneg/negotiation/alpn_resolver.hpp>
#include <tlsneg/negotiation/engine_selector.hpp>
#include <tlsneg/negotiation/errors.hpp>
#include <tlsneg/negotiation/negotiation_session.hpp>
#include <tlsneg/log/macros.hpp>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace tlsneg::tls {

/// RAII wrapper for OpenSSL initialization
class openssl_init {
public:
    openssl_init() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    }

    static openssl_init& instance() {
        static openssl_init init;
        return init;
    }
};

/// OpenSSL protocol version constant for a TLS version
constexpr int to_openssl_version(tls_version v) noexcept {
    switch (v) {
        case tls_version::tls_1_0: return TLS1_VERSION;
        case tls_version::tls_1_1: return TLS1_1_VERSION;
        case tls_version::tls_1_2: return TLS1_2_VERSION;
        case tls_version::tls_1_3: return TLS1_3_VERSION;
    }
    return 0;
}

/// Drain the calling thread's OpenSSL error queue into one line
inline std::string drain_ssl_errors() {
    std::string out;
    char buf[256];
    while (unsigned long code = ERR_get_error()) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

/// SSL_CTX built from an endpoint's TLS configuration, ALPN advertisement and engine variant
class tls_context {
public:
    /// Create a TLS context
    /// @param cfg Endpoint TLS settings
    /// @param alpn Advertisement from resolve_alpn(), may be empty
    /// @param engine Engine variant chosen for the endpoint
    /// @throws negotiation_error (configuration) for bad settings or key material,
    ///         (engine_unavailable) if OpenSSL cannot create a context
    tls_context(const tls_config& cfg, alpn_advertisement alpn, tls_engine_variant engine)
        : mode_(cfg.mode)
        , engine_(engine)
        , versions_(cfg.versions)
        , alpn_(std::make_unique<alpn_state>()) {
        openssl_init::instance();

        if (cfg.versions.empty()) {
            throw_configuration_error("TLS configuration enables no protocol version");
        }

        const SSL_METHOD* method = mode_ == tls_mode::client ? TLS_client_method() : TLS_server_method();
        ctx_ = SSL_CTX_new(method);
        if (!ctx_) {
            throw_engine_unavailable("failed to create SSL context: " + drain_ssl_errors());
        }

        try {
            configure(cfg, std::move(alpn));
        } catch (...) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
            throw;
        }

        TLSNEG_LOG_DEBUG("TLS context created (mode={}, engine={}, versions={}, alpn={})",
                         mode_ == tls_mode::client ? "client" : "server",
                         engine_variant_name(engine_),
                         fmt::join(versions_.names(), ","),
                         describe_alpn(alpn_->tokens));
    }

    ~tls_context() {
        if (ctx_) {
            SSL_CTX_free(ctx_);
        }
    }

    // Non-copyable
    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    // Movable; callbacks point at the heap-held ALPN state, not at this object.
    // A moved-from context has no SSL_CTX, advertises nothing and counts no mismatches.
    tls_context(tls_context&& other) noexcept
        : ctx_(other.ctx_)
        , mode_(other.mode_)
        , engine_(other.engine_)
        , versions_(other.versions_)
        , alpn_(std::move(other.alpn_)) {
        other.ctx_ = nullptr;
    }

    tls_context& operator=(tls_context&& other) noexcept {
        if (this != &other) {
            if (ctx_) SSL_CTX_free(ctx_);
            ctx_ = other.ctx_;
            mode_ = other.mode_;
            engine_ = other.engine_;
            versions_ = other.versions_;
            alpn_ = std::move(other.alpn_);
            other.ctx_ = nullptr;
        }
        return *this;
    }

    /// Get the underlying SSL_CTX pointer
    SSL_CTX* native_handle() noexcept { return ctx_; }
    const SSL_CTX* native_handle() const noexcept { return ctx_; }

    /// New connection object sharing this context; the caller owns it
    SSL* create_ssl() const { return SSL_new(ctx_); }

    tls_mode mode() const noexcept { return mode_; }
    tls_engine_variant engine() const noexcept { return engine_; }
    const tls_version_set& versions() const noexcept { return versions_; }

    /// Advertised ALPN tokens, in preference order
    const alpn_advertisement& alpn() const noexcept {
        static const alpn_advertisement none;
        return alpn_ ? alpn_->tokens : none;
    }

    /// Handshakes the server side refused for lack of a common protocol
    uint64_t alpn_mismatches() const noexcept {
        return alpn_ ? alpn_->mismatches.load(std::memory_order_relaxed) : 0;
    }

    /// Kernel TLS offload is requested on connections of this context
    bool ktls_enabled() const noexcept {
#if TLSNEG_HAS_KTLS
        return ctx_ && (SSL_CTX_get_options(ctx_) & SSL_OP_ENABLE_KTLS) != 0;
#else
        return false;
#endif
    }

private:
    struct alpn_state {
        alpn_advertisement tokens;
        std::string wire;
        std::atomic<uint64_t> mismatches{0};
    };

    void configure(const tls_config& cfg, alpn_advertisement alpn) {
        SSL_CTX_set_min_proto_version(ctx_, to_openssl_version(versions_.lowest()));
        SSL_CTX_set_max_proto_version(ctx_, to_openssl_version(versions_.highest()));

        // Disable versions inside [lowest, highest] that are not in the set
        uint64_t holes = 0;
        if (!versions_.contains(tls_version::tls_1_1)) holes |= SSL_OP_NO_TLSv1_1;
        if (!versions_.contains(tls_version::tls_1_2)) holes |= SSL_OP_NO_TLSv1_2;
        SSL_CTX_set_options(ctx_, SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3 | SSL_OP_NO_COMPRESSION | holes);

        switch (engine_) {
            case tls_engine_variant::native_accelerated:
#if TLSNEG_HAS_KTLS
                SSL_CTX_set_options(ctx_, SSL_OP_ENABLE_KTLS);
#endif
                break;
            case tls_engine_variant::generic:
#if TLSNEG_HAS_KTLS
                SSL_CTX_clear_options(ctx_, SSL_OP_ENABLE_KTLS);
#endif
                break;
        }

        if (!cfg.ciphers.empty() && SSL_CTX_set_cipher_list(ctx_, cfg.ciphers.c_str()) != 1) {
            throw_configuration_error("invalid cipher list '" + cfg.ciphers + "': " + drain_ssl_errors());
        }
        if (!cfg.ciphersuites.empty() && SSL_CTX_set_ciphersuites(ctx_, cfg.ciphersuites.c_str()) != 1) {
            throw_configuration_error("invalid TLS 1.3 ciphersuites '" + cfg.ciphersuites + "': " +
                                      drain_ssl_errors());
        }

        if (!cfg.certificate_pem.empty() || !cfg.private_key_pem.empty()) {
            load_key_material(cfg.certificate_pem, cfg.private_key_pem);
        } else if (mode_ == tls_mode::server) {
            throw_configuration_error("server TLS configuration requires a certificate and private key");
        }

        set_verify(cfg);
        set_alpn(std::move(alpn));
    }

    void load_key_material(const std::string& cert_pem, const std::string& key_pem) {
        std::unique_ptr<BIO, decltype(&BIO_free)> cert_bio(
            BIO_new_mem_buf(cert_pem.data(), static_cast<int>(cert_pem.size())), &BIO_free);
        std::unique_ptr<X509, decltype(&X509_free)> leaf(
            PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr), &X509_free);
        if (!leaf || SSL_CTX_use_certificate(ctx_, leaf.get()) != 1) {
            throw_configuration_error("failed to load certificate: " + drain_ssl_errors());
        }
        // Remaining certificates form the chain
        while (X509* extra = PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr)) {
            if (SSL_CTX_add0_chain_cert(ctx_, extra) != 1) {
                X509_free(extra);
                throw_configuration_error("failed to add chain certificate: " + drain_ssl_errors());
            }
        }
        ERR_clear_error();  // end-of-PEM marker

        std::unique_ptr<BIO, decltype(&BIO_free)> key_bio(
            BIO_new_mem_buf(key_pem.data(), static_cast<int>(key_pem.size())), &BIO_free);
        std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(
            PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
        if (!key || SSL_CTX_use_PrivateKey(ctx_, key.get()) != 1) {
            throw_configuration_error("failed to load private key: " + drain_ssl_errors());
        }
        if (SSL_CTX_check_private_key(ctx_) != 1) {
            throw_configuration_error("private key does not match certificate: " + drain_ssl_errors());
        }
    }

    void set_verify(const tls_config& cfg) {
        int ssl_mode = SSL_VERIFY_NONE;
        switch (cfg.verify) {
            case verify_mode::none:
                ssl_mode = SSL_VERIFY_NONE;
                break;
            case verify_mode::peer:
                ssl_mode = SSL_VERIFY_PEER;
                break;
            case verify_mode::fail_if_no_cert:
                ssl_mode = SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
                break;
        }
        SSL_CTX_set_verify(ctx_, ssl_mode, nullptr);
        SSL_CTX_set_verify_depth(ctx_, 10);

        if (cfg.ca_pem.empty()) {
            return;
        }
        std::unique_ptr<BIO, decltype(&BIO_free)> bio(
            BIO_new_mem_buf(cfg.ca_pem.data(), static_cast<int>(cfg.ca_pem.size())), &BIO_free);
        X509_STORE* store = SSL_CTX_get_cert_store(ctx_);
        int loaded = 0;
        while (X509* ca = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) {
            X509_STORE_add_cert(store, ca);
            X509_free(ca);
            ++loaded;
        }
        ERR_clear_error();
        if (loaded == 0) {
            throw_configuration_error("no trust anchor found in CA material");
        }
        X509_STORE_set_flags(store, X509_V_FLAG_PARTIAL_CHAIN);
    }

    void set_alpn(alpn_advertisement alpn) {
        alpn_->wire = encode_alpn_wire(alpn);
        alpn_->tokens = std::move(alpn);
        if (alpn_->tokens.empty()) {
            return;
        }

        if (mode_ == tls_mode::client) {
            // Unlike most OpenSSL calls, 0 means success here
            if (SSL_CTX_set_alpn_protos(ctx_,
                    reinterpret_cast<const unsigned char*>(alpn_->wire.data()),
                    static_cast<unsigned>(alpn_->wire.size())) != 0) {
                throw_configuration_error("failed to set ALPN protocols: " + drain_ssl_errors());
            }
        } else {
            SSL_CTX_set_alpn_select_cb(ctx_, alpn_select_callback, alpn_.get());
        }
    }

    static int alpn_select_callback(SSL* ssl, const unsigned char** out, unsigned char* outlen,
                                    const unsigned char* in, unsigned int inlen, void* arg) {
        (void)ssl;  // Unused but required by callback signature
        auto* state = static_cast<alpn_state*>(arg);

        auto offered = decode_alpn_wire(std::span<const unsigned char>(in, inlen));
        if (!offered) {
            TLSNEG_LOG_WARNING("Malformed ALPN list from client");
            return SSL_TLSEXT_ERR_ALERT_FATAL;
        }

        auto selected = select_alpn(state->tokens, *offered);
        if (!selected) {
            state->mismatches.fetch_add(1, std::memory_order_relaxed);
            TLSNEG_LOG_FAILURE(warning, failure_reason_name(failure_reason::no_common_protocol),
                               "No common ALPN protocol: server {} vs client {}",
                               describe_alpn(state->tokens), describe_alpn(*offered));
            return SSL_TLSEXT_ERR_ALERT_FATAL;
        }

        // Point into the server's own wire list, which outlives the handshake
        size_t pos = 0;
        while (pos < state->wire.size()) {
            auto len = static_cast<unsigned char>(state->wire[pos]);
            if (std::string_view(state->wire).substr(pos + 1, len) == *selected) {
                *out = reinterpret_cast<const unsigned char*>(state->wire.data() + pos + 1);
                *outlen = len;
                return SSL_TLSEXT_ERR_OK;
            }
            pos += 1 + len;
        }
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    }

    SSL_CTX* ctx_ = nullptr;
    tls_mode mode_;
    tls_engine_variant engine_;
    tls_version_set versions_;
    std::unique_ptr<alpn_state> alpn_;
};

} // namespace tlsneg::tls
