#pragma once

#include <tlsneg/negotiation/errors.hpp>
#include <tlsneg/log/macros.hpp>

#include <openssl/opensslv.h>
#include <openssl/ssl.h>

#include <fstream>
#include <string>
#include <string_view>

/// OpenSSL can switch records to kernel TLS (3.0+ built without no-ktls)
#if defined(SSL_OP_ENABLE_KTLS) && !defined(OPENSSL_NO_KTLS)
#define TLSNEG_HAS_KTLS 1
#else
#define TLSNEG_HAS_KTLS 0
#endif

namespace tlsneg {

/// Concrete TLS engine backing an endpoint
enum class tls_engine_variant {
    native_accelerated,  ///< OpenSSL with kernel TLS offload
    generic              ///< OpenSSL user-space record layer
};

constexpr std::string_view engine_variant_name(tls_engine_variant v) noexcept {
    switch (v) {
        case tls_engine_variant::native_accelerated: return "native_accelerated";
        case tls_engine_variant::generic:            return "generic";
    }
    return "unknown";
}

/// How an endpoint wants its engine chosen
enum class engine_preference {
    automatic,        ///< Native when the platform allows it, generic otherwise
    generic,          ///< Always the generic engine
    native_required   ///< Native or fail the bind
};

/// What the running platform offers the native engine
struct platform_capabilities {
    bool native_available = false;      ///< OpenSSL kTLS build + kernel "tls" ULP
    bool native_supports_alpn = false;  ///< ALPN usable together with the native engine

    /// Inspect the current process/kernel. The result is computed once.
    static const platform_capabilities& detect() {
        static const platform_capabilities caps = inspect();
        return caps;
    }

private:
    static platform_capabilities inspect() {
        platform_capabilities caps;
#if TLSNEG_HAS_KTLS
        caps.native_available = kernel_has_tls_ulp();
#endif
        // ALPN landed in OpenSSL 1.0.2
        caps.native_supports_alpn = OPENSSL_VERSION_NUMBER >= 0x10002000L;
        TLSNEG_LOG_DEBUG("TLS engine capabilities: native={}, native_alpn={}",
                         caps.native_available, caps.native_supports_alpn);
        return caps;
    }

    static bool kernel_has_tls_ulp() {
        std::ifstream ulp("/proc/sys/net/ipv4/tcp_available_ulp");
        std::string name;
        while (ulp >> name) {
            if (name == "tls") {
                return true;
            }
        }
        return false;
    }
};

/// Pick the engine variant for an endpoint
/// @param requires_alpn The endpoint advertises ALPN tokens
/// @param native_available Platform offers the native engine
/// @param native_supports_alpn Native engine can negotiate ALPN here
constexpr tls_engine_variant select_engine(bool requires_alpn, bool native_available,
                                           bool native_supports_alpn) noexcept {
    if (native_available && (!requires_alpn || native_supports_alpn)) {
        return tls_engine_variant::native_accelerated;
    }
    return tls_engine_variant::generic;
}

constexpr tls_engine_variant select_engine(bool requires_alpn, const platform_capabilities& caps) noexcept {
    return select_engine(requires_alpn, caps.native_available, caps.native_supports_alpn);
}

/// Applies an endpoint's engine preference on top of the platform decision
class engine_selector {
public:
    engine_selector() : caps_(platform_capabilities::detect()) {}
    explicit engine_selector(platform_capabilities caps) : caps_(caps) {}

    /// @throws negotiation_error (engine_unavailable) when native is required but not selectable
    tls_engine_variant select(engine_preference pref, bool requires_alpn) const {
        switch (pref) {
            case engine_preference::generic:
                return tls_engine_variant::generic;
            case engine_preference::automatic:
                return select_engine(requires_alpn, caps_);
            case engine_preference::native_required: {
                auto v = select_engine(requires_alpn, caps_);
                if (v != tls_engine_variant::native_accelerated) {
                    throw_engine_unavailable(std::string("native TLS engine unavailable") +
                        (caps_.native_available ? " (no ALPN support)" : ""));
                }
                return v;
            }
        }
        return tls_engine_variant::generic;
    }

    const platform_capabilities& capabilities() const noexcept { return caps_; }

private:
    platform_capabilities caps_;
};

} // namespace tlsneg
