#pragma once

/// tlsneg - TLS/ALPN negotiation for HTTP endpoints
///
/// Version: 0.1.0
///
/// Include this file to use the whole library.

// Version information
#define TLSNEG_VERSION_MAJOR 0
#define TLSNEG_VERSION_MINOR 1
#define TLSNEG_VERSION_PATCH 0

// Negotiation policy
#include "negotiation/negotiation.hpp"

// OpenSSL engine adapter
#include "tls/tls.hpp"

// HTTP endpoint builders
#include "http/http_server.hpp"
#include "http/http_client.hpp"

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

#include <tuple>

/// Root namespace for the tlsneg library
namespace tlsneg {

/// Get library version string
inline const char* version() noexcept {
    return "0.1.0";
}

/// Get library version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(TLSNEG_VERSION_MAJOR, TLSNEG_VERSION_MINOR, TLSNEG_VERSION_PATCH);
}

} // namespace tlsneg

/// Quick Start Example:
///
/// ```cpp
/// #include <tlsneg/tlsneg.hpp>
///
/// using namespace tlsneg;
///
/// int main() {
///     auto server = http::http_server::create()
///         .protocol({http_protocol::h2, http_protocol::http11})
///         .secure(tls::tls_config::for_server(cert_pem, key_pem))
///         .bind();
///
///     auto result = http::http_client::create()
///         .protocol({http_protocol::h2, http_protocol::http11})
///         .secure(tls::tls_config::for_client_insecure())
///         .connect(server);
///
///     // result.outcome.protocol() == "h2"
/// }
/// ```
