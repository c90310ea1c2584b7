#pragma once

#include <tlsneg/negotiation/errors.hpp>

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tlsneg {

/// TLS protocol versions an endpoint may enable
enum class tls_version : uint8_t {
    tls_1_0,
    tls_1_1,
    tls_1_2,
    tls_1_3
};

inline constexpr std::array<tls_version, 4> all_tls_versions{
    tls_version::tls_1_0, tls_version::tls_1_1, tls_version::tls_1_2, tls_version::tls_1_3};

/// Standard protocol name ("TLSv1.2"), as printed by OpenSSL
constexpr std::string_view tls_version_name(tls_version v) noexcept {
    switch (v) {
        case tls_version::tls_1_0: return "TLSv1";
        case tls_version::tls_1_1: return "TLSv1.1";
        case tls_version::tls_1_2: return "TLSv1.2";
        case tls_version::tls_1_3: return "TLSv1.3";
    }
    return "unknown";
}

/// Parse a standard protocol name; "TLSv1.0" is accepted as an alias of "TLSv1"
constexpr std::optional<tls_version> parse_tls_version(std::string_view name) noexcept {
    if (name == "TLSv1" || name == "TLSv1.0") return tls_version::tls_1_0;
    if (name == "TLSv1.1") return tls_version::tls_1_1;
    if (name == "TLSv1.2") return tls_version::tls_1_2;
    if (name == "TLSv1.3") return tls_version::tls_1_3;
    return std::nullopt;
}

/// Set of enabled TLS protocol versions
class tls_version_set {
public:
    constexpr tls_version_set() noexcept = default;

    constexpr tls_version_set(std::initializer_list<tls_version> versions) noexcept {
        for (auto v : versions) {
            bits_ |= bit(v);
        }
    }

    /// Parse standard names, e.g. {"TLSv1.2", "TLSv1.3"}
    /// @throws negotiation_error (configuration) on unknown names
    static tls_version_set parse(const std::vector<std::string>& names) {
        tls_version_set set;
        for (const auto& name : names) {
            auto v = parse_tls_version(name);
            if (!v) {
                throw_configuration_error("unsupported TLS protocol: " + name);
            }
            set.bits_ |= bit(*v);
        }
        return set;
    }

    constexpr bool contains(tls_version v) const noexcept { return (bits_ & bit(v)) != 0; }
    constexpr bool empty() const noexcept { return bits_ == 0; }

    constexpr tls_version_set intersect(const tls_version_set& other) const noexcept {
        tls_version_set out;
        out.bits_ = bits_ & other.bits_;
        return out;
    }

    /// Lowest enabled version (set must not be empty)
    constexpr tls_version lowest() const noexcept {
        for (auto v : all_tls_versions) {
            if (contains(v)) return v;
        }
        return tls_version::tls_1_3;
    }

    /// Highest enabled version (set must not be empty)
    constexpr tls_version highest() const noexcept {
        for (auto it = all_tls_versions.rbegin(); it != all_tls_versions.rend(); ++it) {
            if (contains(*it)) return *it;
        }
        return tls_version::tls_1_0;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (auto v : all_tls_versions) {
            if (contains(v)) out.emplace_back(tls_version_name(v));
        }
        return out;
    }

    constexpr bool operator==(const tls_version_set&) const noexcept = default;

private:
    static constexpr uint8_t bit(tls_version v) noexcept {
        return static_cast<uint8_t>(1u << static_cast<unsigned>(v));
    }

    uint8_t bits_ = 0;
};

} // namespace tlsneg
