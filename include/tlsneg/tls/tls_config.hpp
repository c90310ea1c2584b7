#pragma once

#include <tlsneg/negotiation/engine_selector.hpp>
#include <tlsneg/negotiation/tls_version.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tlsneg::tls {

/// TLS context mode
enum class tls_mode {
    client,
    server
};

/// TLS verification mode
enum class verify_mode {
    none,           ///< No verification
    peer,           ///< Verify peer certificate
    fail_if_no_cert ///< Fail if no peer certificate (server mode)
};

/// TLS settings of one endpoint. Certificate and key material stay owned by the caller's copy.
struct tls_config {
    tls_mode mode = tls_mode::client;
    std::string certificate_pem;                        ///< Certificate chain (PEM), server leaf first
    std::string private_key_pem;                        ///< Private key (PEM)
    std::string ca_pem;                                 ///< Trust anchors (PEM) when verifying peers
    verify_mode verify = verify_mode::none;
    tls_version_set versions{tls_version::tls_1_2};     ///< Enabled protocol versions
    std::string ciphers;                                ///< TLS <= 1.2 cipher list, OpenSSL default if empty
    std::string ciphersuites;                           ///< TLS 1.3 suites, OpenSSL default if empty
    engine_preference engine = engine_preference::automatic;
    bool require_alpn = false;                          ///< Advertise ALPN even for HTTP/1.1-only endpoints

    /// Server settings with certificate and key
    static tls_config for_server(std::string certificate_pem, std::string private_key_pem) {
        tls_config cfg;
        cfg.mode = tls_mode::server;
        cfg.certificate_pem = std::move(certificate_pem);
        cfg.private_key_pem = std::move(private_key_pem);
        return cfg;
    }

    /// Client settings trusting any server certificate
    static tls_config for_client_insecure() {
        tls_config cfg;
        cfg.mode = tls_mode::client;
        cfg.verify = verify_mode::none;
        return cfg;
    }

    /// Replace enabled versions by standard names, e.g. protocols({"TLSv1.3"})
    /// @throws negotiation_error (configuration) on unknown names
    tls_config& protocols(const std::vector<std::string>& names) {
        versions = tls_version_set::parse(names);
        return *this;
    }

    tls_config& protocols(tls_version_set set) {
        versions = set;
        return *this;
    }

    tls_config& trust(std::string pem) {
        ca_pem = std::move(pem);
        verify = verify_mode::peer;
        return *this;
    }

    tls_config& prefer_engine(engine_preference pref) {
        engine = pref;
        return *this;
    }
};

} // namespace tlsneg::tls
