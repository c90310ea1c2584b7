/// @file tls_handshake.cpp
/// @brief TLS Handshake Example
///
/// This example binds a TLS endpoint from a certificate and key, then
/// connects a few differently configured clients to it over in-memory
/// handshakes and reports what each attempt negotiated.
///
/// Usage: ./tls_handshake cert.pem key.pem [--tls13]

#include <tlsneg/tlsneg.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace tlsneg;
using namespace tlsneg::http;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void report(const char* label, const connection_result& result) {
    if (result) {
        TLSNEG_LOG_INFO("{}: {} over {} ({} engine)", label, result.outcome.protocol(), result.tls_version,
                        result.engine ? engine_variant_name(*result.engine) : "no");
    } else {
        TLSNEG_LOG_INFO("{}: failed ({})", label, failure_reason_name(result.outcome.reason()));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " cert.pem key.pem [--tls13]" << std::endl;
        return 1;
    }
    bool tls13_only = argc > 3 && std::string(argv[3]) == "--tls13";

    std::cout << "=== tlsneg TLS Handshake Example ===" << std::endl;

    try {
        auto cfg = tls::tls_config::for_server(read_file(argv[1]), read_file(argv[2]));
        cfg.protocols({"TLSv1.2", "TLSv1.3"});
        if (tls13_only) {
            cfg.protocols({"TLSv1.3"});
        }

        auto server = http_server::create()
            .protocol({http_protocol::h2, http_protocol::http11})
            .secure(cfg)
            .do_on_bind([](const bound_server& s) {
                TLSNEG_LOG_INFO("Bound: advertising {} with the {} engine",
                                describe_alpn(s.advertisement()), engine_variant_name(*s.engine()));
            })
            .bind();

        report("h2 client", http_client::create()
            .protocol(http_protocol::h2)
            .secure(tls::tls_config::for_client_insecure())
            .connect(server));

        report("http/1.1 client", http_client::create()
            .secure([](tls::tls_config& c) { c.require_alpn = true; })
            .connect(server));

        // The server advertises ALPN, so a client without it is refused
        report("client without ALPN", http_client::create()
            .secure(tls::tls_config::for_client_insecure())
            .connect(server));

        report("TLS 1.2 client", http_client::create()
            .protocol({http_protocol::h2, http_protocol::http11})
            .secure(tls::tls_config::for_client_insecure().protocols({"TLSv1.2"}))
            .connect(server));

        const auto& stats = server.stats();
        TLSNEG_LOG_INFO("Server stats: h2={} http/1.1={} version_mismatch={} no_common_protocol={} other={}",
                        stats.negotiated_h2.load(), stats.negotiated_http11.load(),
                        stats.version_mismatches.load(), stats.no_common_protocol.load(),
                        stats.other_failures.load());
    } catch (const std::exception& e) {
        TLSNEG_LOG_ERROR("Example failed: {}", e.what());
        return 1;
    }

    std::cout << "=== Example completed ===" << std::endl;
    return 0;
}
