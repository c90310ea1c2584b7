#include <catch2/catch.hpp>
#include <tlsneg/negotiation/negotiation_session.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <stdexcept>
#include <type_traits>
#include <variant>

using namespace tlsneg;

namespace {

const tls_version_set tls13{tls_version::tls_1_3};
const tls_version_set tls12{tls_version::tls_1_2};
const tls_version_set tls12_13{tls_version::tls_1_2, tls_version::tls_1_3};

unsigned long ssl_reason(int reason) {
    return ERR_PACK(ERR_LIB_SSL, 0, reason);
}

} // namespace

TEST_CASE("Matching TLS 1.3 peers negotiate h2", "[negotiation]") {
    auto outcome = negotiate({"h2"}, {"h2"}, tls13, tls13);
    REQUIRE(outcome.is_negotiated());
    REQUIRE(outcome.protocol() == "h2");
}

TEST_CASE("Disjoint TLS versions fail before ALPN", "[negotiation]") {
    SECTION("Matching advertisements") {
        auto outcome = negotiate({"h2"}, {"h2"}, tls13, tls12);
        REQUIRE_FALSE(outcome.is_negotiated());
        REQUIRE(outcome.reason() == failure_reason::version_mismatch);
    }

    SECTION("Disjoint advertisements") {
        auto outcome = negotiate({"h2"}, {"http/1.1"}, tls12, tls13);
        REQUIRE(outcome.reason() == failure_reason::version_mismatch);
    }
}

TEST_CASE("Local preference order decides", "[negotiation]") {
    SECTION("Falls back to http/1.1") {
        auto outcome = negotiate({"h2", "http/1.1"}, {"http/1.1"}, tls12_13, tls13);
        REQUIRE(outcome.protocol() == "http/1.1");
    }

    SECTION("Local order beats peer order") {
        auto outcome = negotiate({"h2", "http/1.1"}, {"http/1.1", "h2"}, tls12_13, tls12_13);
        REQUIRE(outcome.protocol() == "h2");
    }

    SECTION("No overlap") {
        auto outcome = negotiate({"h2"}, {"http/1.1"}, tls13, tls13);
        REQUIRE_FALSE(outcome);
        REQUIRE(outcome.reason() == failure_reason::no_common_protocol);
        REQUIRE_FALSE(outcome.detail().empty());
    }
}

TEST_CASE("Empty advertisements", "[negotiation]") {
    SECTION("Neither side uses ALPN") {
        auto outcome = negotiate({}, {}, tls12, tls12);
        REQUIRE(outcome.protocol() == "http/1.1");
    }

    SECTION("Peer without ALPN against an endpoint that advertises HTTP/1.1") {
        auto outcome = negotiate({"h2", "http/1.1"}, {}, tls13, tls13);
        REQUIRE_FALSE(outcome.is_negotiated());
        REQUIRE(outcome.reason() == failure_reason::no_common_protocol);
        REQUIRE(negotiate({"http/1.1"}, {}, tls12, tls12).reason() == failure_reason::no_common_protocol);
    }

    SECTION("Peer without ALPN against an h2-only endpoint") {
        REQUIRE(negotiate({"h2"}, {}, tls12, tls12).reason() == failure_reason::no_common_protocol);
    }

    SECTION("Local without ALPN against an h2-only peer") {
        REQUIRE(negotiate({}, {"h2"}, tls12, tls12).reason() == failure_reason::no_common_protocol);
        REQUIRE(negotiate({}, {"h2", "http/1.1"}, tls12, tls12).protocol() == "http/1.1");
    }
}

TEST_CASE("Session state machine", "[negotiation]") {
    negotiation_session session({"h2", "http/1.1"}, tls12_13);
    REQUIRE(session.state() == session_state::init);
    REQUIRE_FALSE(session.outcome().has_value());

    SECTION("Version check then ALPN") {
        REQUIRE(session.check_versions(tls13));
        REQUIRE(session.state() == session_state::version_ok);
        REQUIRE_FALSE(session.is_terminal());

        const auto& outcome = session.select_protocol({"http/1.1"});
        REQUIRE(outcome.protocol() == "http/1.1");
        REQUIRE(session.state() == session_state::negotiated);
        REQUIRE(session.is_terminal());
    }

    SECTION("Version mismatch is terminal") {
        REQUIRE_FALSE(session.check_versions(tls_version_set{tls_version::tls_1_1}));
        REQUIRE(session.state() == session_state::version_mismatch);
        REQUIRE_THROWS_AS(session.select_protocol({"h2"}), std::logic_error);
    }

    SECTION("ALPN before the version check is rejected") {
        REQUIRE_THROWS_AS(session.select_protocol({"h2"}), std::logic_error);
    }

    SECTION("Lower-level failure from a running session") {
        REQUIRE(session.check_versions(tls12));
        const auto& outcome = session.fail("connection reset");
        REQUIRE(outcome.reason() == failure_reason::other);
        REQUIRE(outcome.detail() == "connection reset");
        REQUIRE(session.state() == session_state::failed);
        REQUIRE_THROWS_AS(session.fail("again"), std::logic_error);
    }

    SECTION("Terminal sessions cannot be reused") {
        (void)session.negotiate({"h2"}, tls13);
        REQUIRE_THROWS_AS(session.negotiate({"h2"}, tls13), std::logic_error);
    }
}

TEST_CASE("Outcome alternatives can be visited", "[negotiation]") {
    auto outcome = negotiate({"h2"}, {"h2"}, tls13, tls13);
    bool visited_negotiated = std::visit([](const auto& v) {
        return std::is_same_v<std::decay_t<decltype(v)>, handshake_outcome::negotiated_t>;
    }, outcome.value());
    REQUIRE(visited_negotiated);
}

TEST_CASE("Engine errors are classified", "[negotiation]") {
    SECTION("Version errors") {
        REQUIRE(classify_engine_error({{ssl_reason(SSL_R_UNSUPPORTED_PROTOCOL)}, ""}) ==
                failure_reason::version_mismatch);
        REQUIRE(classify_engine_error({{ssl_reason(SSL_R_TLSV1_ALERT_PROTOCOL_VERSION)}, ""}) ==
                failure_reason::version_mismatch);
    }

    SECTION("ALPN errors") {
        REQUIRE(classify_engine_error({{ssl_reason(SSL_R_TLSV1_ALERT_NO_APPLICATION_PROTOCOL)}, ""}) ==
                failure_reason::no_common_protocol);
    }

    SECTION("Version errors win over ALPN errors") {
        engine_error err{{ssl_reason(SSL_R_NO_APPLICATION_PROTOCOL), ssl_reason(SSL_R_WRONG_VERSION_NUMBER)}, ""};
        REQUIRE(classify_engine_error(err) == failure_reason::version_mismatch);
    }

    SECTION("Anything else") {
        REQUIRE(classify_engine_error({{ssl_reason(SSL_R_NO_SHARED_CIPHER)}, ""}) == failure_reason::other);
        REQUIRE(classify_engine_error({{}, "stalled"}) == failure_reason::other);
    }
}

TEST_CASE("Sessions complete from engine reports", "[negotiation]") {
    SECTION("Selected token") {
        negotiation_session session({"h2", "http/1.1"}, tls13);
        handshake_report report{std::string("h2"), "TLSv1.3", std::nullopt};
        REQUIRE(session.complete(report).protocol() == "h2");
    }

    SECTION("No ALPN means HTTP/1.1") {
        negotiation_session session({}, tls12);
        handshake_report report{std::nullopt, "TLSv1.2", std::nullopt};
        REQUIRE(session.complete(report).protocol() == "http/1.1");
    }

    SECTION("Advertising endpoint without ALPN result") {
        negotiation_session session({"h2", "http/1.1"}, tls12);
        handshake_report report{std::nullopt, "TLSv1.2", std::nullopt};
        REQUIRE(session.complete(report).reason() == failure_reason::no_common_protocol);
        REQUIRE(session.state() == session_state::no_common_protocol);
    }

    SECTION("Token the endpoint never advertised") {
        negotiation_session session({"h2"}, tls12);
        handshake_report report{std::string("http/1.1"), "TLSv1.2", std::nullopt};
        REQUIRE(session.complete(report).reason() == failure_reason::no_common_protocol);
    }

    SECTION("h2-only endpoint without ALPN result") {
        negotiation_session session({"h2"}, tls12);
        handshake_report report{std::nullopt, "TLSv1.2", std::nullopt};
        REQUIRE(session.complete(report).reason() == failure_reason::no_common_protocol);
        REQUIRE(session.state() == session_state::no_common_protocol);
    }

    SECTION("Version failure") {
        negotiation_session session({}, tls13);
        handshake_report report;
        report.error = engine_error{{ssl_reason(SSL_R_UNSUPPORTED_PROTOCOL)}, "unsupported protocol"};
        const auto& outcome = session.complete(report);
        REQUIRE(outcome.reason() == failure_reason::version_mismatch);
        REQUIRE(outcome.detail() == "unsupported protocol");
        REQUIRE(session.state() == session_state::version_mismatch);
    }
}

TEST_CASE("Failure reasons map onto the error taxonomy", "[negotiation]") {
    REQUIRE(to_error_kind(failure_reason::version_mismatch) == error_kind::version_mismatch);
    REQUIRE(to_error_kind(failure_reason::no_common_protocol) == error_kind::no_common_protocol);
    REQUIRE(to_error_kind(failure_reason::other) == error_kind::other);
    REQUIRE(std::string(error_kind_to_string(error_kind::engine_unavailable)) == "engine_unavailable");
}
