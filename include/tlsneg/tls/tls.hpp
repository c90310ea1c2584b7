#pragma once

/// @file tls.hpp
/// @brief OpenSSL engine adapter for tlsneg
///
/// This header provides:
/// - TLS endpoint settings (certificates, versions, verification, engine preference)
/// - SSL_CTX construction with ALPN advertisement and server-side selection
/// - Memory-transport handshakes between a client and a server context
/// - Kernel TLS offload for the native engine variant

#include <tlsneg/tls/tls_config.hpp>
#include <tlsneg/tls/tls_context.hpp>
#include <tlsneg/tls/tls_handshake.hpp>

namespace tlsneg::tls {

/// @example Handshake between two contexts
/// @code
/// #include <tlsneg/tls/tls.hpp>
///
/// using namespace tlsneg;
/// using namespace tlsneg::tls;
///
/// void handshake(std::string cert_pem, std::string key_pem) {
///     auto server_cfg = tls_config::for_server(cert_pem, key_pem).protocols({"TLSv1.3"});
///     tls_context server(server_cfg, {"h2", "http/1.1"}, tls_engine_variant::generic);
///
///     auto client_cfg = tls_config::for_client_insecure().protocols({"TLSv1.3"});
///     tls_context client(client_cfg, {"h2"}, tls_engine_variant::generic);
///
///     auto report = perform_handshake(client, server, "localhost");
///     if (!report.error) {
///         // report.alpn == "h2", report.version == "TLSv1.3"
///     }
/// }
/// @endcode

} // namespace tlsneg::tls
