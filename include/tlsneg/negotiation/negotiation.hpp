#pragma once

/// @file negotiation.hpp
/// @brief Protocol negotiation policy
///
/// Pure decisions taken when an endpoint binds or a connection is attempted:
/// - which ALPN tokens an endpoint advertises (resolve_alpn)
/// - which TLS engine variant serves it (engine_selector)
/// - how a handshake ends (negotiation_session, negotiate)

#include <tlsneg/negotiation/errors.hpp>
#include <tlsneg/negotiation/protocol_set.hpp>
#include <tlsneg/negotiation/tls_version.hpp>
#include <tlsneg/negotiation/alpn_resolver.hpp>
#include <tlsneg/negotiation/engine_selector.hpp>
#include <tlsneg/negotiation/handshake_outcome.hpp>
#include <tlsneg/negotiation/negotiation_session.hpp>

namespace tlsneg {

/// @example Negotiating two declared endpoints
/// @code
/// using namespace tlsneg;
///
/// auto server_alpn = resolve_alpn({http_protocol::h2, http_protocol::http11});
/// auto client_alpn = resolve_alpn({http_protocol::http11}, true);  // ["http/1.1"]
///
/// auto outcome = negotiate(server_alpn, client_alpn,
///                          {tls_version::tls_1_3}, {tls_version::tls_1_2, tls_version::tls_1_3});
/// // outcome.protocol() == "http/1.1"
/// @endcode

} // namespace tlsneg
