/// @file alpn_negotiation.cpp
/// @brief ALPN Negotiation Example
///
/// This example shows how endpoint protocol sets turn into ALPN
/// advertisements and which protocol two endpoints agree on, without
/// running a TLS handshake.
///
/// Usage: ./alpn_negotiation [--debug]

#include <tlsneg/tlsneg.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace tlsneg;

namespace {

struct endpoint {
    const char* name;
    protocol_set protocols;
    tls_version_set versions;
};

void print_outcome(const endpoint& server, const endpoint& client) {
    auto server_alpn = resolve_alpn(server.protocols);
    auto client_alpn = resolve_alpn(client.protocols);
    auto outcome = negotiate(server_alpn, client_alpn, server.versions, client.versions);

    if (outcome) {
        TLSNEG_LOG_INFO("{:<14} <- {:<14} negotiated {}", server.name, client.name, outcome.protocol());
    } else {
        TLSNEG_LOG_INFO("{:<14} <- {:<14} failed ({}): {}", server.name, client.name,
                        failure_reason_name(outcome.reason()), outcome.detail());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 1 && std::string(argv[1]) == "--debug") {
        log::logger::instance().set_level(log::level::debug);
    }

    std::cout << "=== tlsneg ALPN Negotiation Example ===" << std::endl;

    const tls_version_set tls12{tls_version::tls_1_2};
    const tls_version_set tls13{tls_version::tls_1_3};
    const tls_version_set modern{tls_version::tls_1_2, tls_version::tls_1_3};

    std::vector<endpoint> servers{
        {"http11", protocol_set::http11_only(), tls12},
        {"h2+http11", {http_protocol::h2, http_protocol::http11}, modern},
        {"h2/tls13", {http_protocol::h2}, tls13},
    };
    std::vector<endpoint> clients{
        {"http11", protocol_set::http11_only(), tls12},
        {"h2", {http_protocol::h2}, modern},
        {"http11+h2", {http_protocol::http11, http_protocol::h2}, tls13},
    };

    for (const auto& server : servers) {
        TLSNEG_LOG_INFO("Server {} advertises {}", server.name, describe_alpn(resolve_alpn(server.protocols)));
    }
    for (const auto& server : servers) {
        for (const auto& client : clients) {
            print_outcome(server, client);
        }
    }

    const auto& caps = platform_capabilities::detect();
    TLSNEG_LOG_INFO("Platform: native engine {}, engine for h2 endpoints: {}",
                    caps.native_available ? "available" : "unavailable",
                    engine_variant_name(select_engine(true, caps)));

    std::cout << "=== Example completed ===" << std::endl;
    return 0;
}
