#include <catch2/catch.hpp>
#include <tlsneg/log/logger.hpp>
#include <tlsneg/log/macros.hpp>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace tlsneg::log;

namespace {

struct captured {
    std::vector<std::pair<level, std::string>> records;
    std::vector<std::string> reasons;
};

} // namespace

TEST_CASE("Logger singleton", "[logger]") {
    auto& logger1 = logger::instance();
    auto& logger2 = logger::instance();

    REQUIRE(&logger1 == &logger2);
}

TEST_CASE("Log level filtering", "[logger]") {
    auto& log = logger::instance();
    captured out;
    log.set_sink([&out](const record& r) {
        out.records.emplace_back(r.lvl, std::string(r.message));
        out.reasons.emplace_back(r.reason);
    });

    log.set_level(level::warning);
    REQUIRE(log.get_level() == level::warning);
    REQUIRE_FALSE(TLSNEG_LOG_ENABLED(info));
    REQUIRE(TLSNEG_LOG_ENABLED(error));

    TLSNEG_LOG_INFO("filtered");
    TLSNEG_LOG_WARNING("kept {}", 1);
    TLSNEG_LOG_ERROR("kept {}", 2);

    log.reset_sink();
    log.set_level(level::info);

    REQUIRE(out.records.size() == 2);
    REQUIRE(out.records[0].first == level::warning);
    REQUIRE(out.records[0].second == "kept 1");
    REQUIRE(out.records[1].first == level::error);
    REQUIRE(out.records[1].second == "kept 2");
    REQUIRE(out.reasons[0].empty());
}

TEST_CASE("Failure records carry their reason", "[logger]") {
    auto& log = logger::instance();
    captured out;
    int line = 0;
    log.set_sink([&out, &line](const record& r) {
        out.records.emplace_back(r.lvl, std::string(r.message));
        out.reasons.emplace_back(r.reason);
        line = r.line;
    });
    log.set_level(level::info);

    TLSNEG_LOG_FAILURE(warning, "version_mismatch", "handshake failed: {}", "unsupported protocol");
    TLSNEG_LOG_FAILURE(error, "configuration", "bind failed");

    log.set_level(level::error);
    TLSNEG_LOG_FAILURE(warning, "no_common_protocol", "filtered");

    log.reset_sink();
    log.set_level(level::info);

    REQUIRE(out.records.size() == 2);
    REQUIRE(out.records[0].first == level::warning);
    REQUIRE(out.records[0].second == "handshake failed: unsupported protocol");
    REQUIRE(out.reasons[0] == "version_mismatch");
    REQUIRE(out.records[1].first == level::error);
    REQUIRE(out.reasons[1] == "configuration");
    REQUIRE(line > 0);
}

TEST_CASE("Log level conversion", "[logger]") {
    REQUIRE(std::string(level_to_string(level::debug)) == "DEBUG");
    REQUIRE(std::string(level_to_string(level::info)) == "INFO");
    REQUIRE(std::string(level_to_string(level::warning)) == "WARN");
    REQUIRE(std::string(level_to_string(level::error)) == "ERROR");
}

TEST_CASE("Concurrent logging into a sink", "[logger]") {
    auto& log = logger::instance();
    log.set_level(level::info);

    size_t count = 0;  // sink calls are serialized by the logger
    log.set_sink([&count](const record&) { ++count; });

    std::vector<std::thread> threads;
    const int num_threads = 8;
    const int logs_per_thread = 50;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                TLSNEG_LOG_INFO("Thread {} log {}", i, j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }
    log.reset_sink();

    REQUIRE(count == static_cast<size_t>(num_threads * logs_per_thread));
}

TEST_CASE("Stderr output after sink reset", "[logger]") {
    auto& log = logger::instance();
    log.reset_sink();
    log.set_level(level::info);

    TLSNEG_LOG_INFO("Integer: {}", 42);
    TLSNEG_LOG_INFO("Multiple: {} {} {}", 1, "two", 3.0);
    TLSNEG_LOG_FAILURE(warning, "other", "Tagged: {}", 7);

    REQUIRE(log.get_level() == level::info);
}
