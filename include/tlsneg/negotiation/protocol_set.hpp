#pragma once

#include <tlsneg/negotiation/errors.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace tlsneg {

/// Application protocols an HTTP endpoint can speak
enum class http_protocol : uint8_t {
    http11,  ///< HTTP/1.1
    h2       ///< HTTP/2 over TLS
};

/// Human-readable protocol name
constexpr std::string_view protocol_name(http_protocol p) noexcept {
    switch (p) {
        case http_protocol::http11: return "HTTP/1.1";
        case http_protocol::h2:     return "HTTP/2";
    }
    return "unknown";
}

/// ALPN token identifying the protocol on the wire (RFC 7301 registry)
constexpr std::string_view alpn_token(http_protocol p) noexcept {
    switch (p) {
        case http_protocol::http11: return "http/1.1";
        case http_protocol::h2:     return "h2";
    }
    return {};
}

/// Immutable, ordered and deduplicated set of enabled application protocols
class protocol_set {
public:
    /// Build from a protocol list; duplicates keep their first position
    /// @throws negotiation_error (configuration) if the list is empty
    protocol_set(std::initializer_list<http_protocol> protocols)
        : protocol_set(std::vector<http_protocol>(protocols)) {}

    explicit protocol_set(const std::vector<http_protocol>& protocols) {
        for (auto p : protocols) {
            if (!contains(p)) {
                protocols_.push_back(p);
            }
        }
        if (protocols_.empty()) {
            throw_configuration_error("protocol set must enable at least one protocol");
        }
    }

    /// Default endpoint protocols: HTTP/1.1 only
    static protocol_set http11_only() { return {http_protocol::http11}; }

    bool contains(http_protocol p) const noexcept {
        return std::find(protocols_.begin(), protocols_.end(), p) != protocols_.end();
    }

    /// HTTP/2 is only offered over TLS
    bool requires_tls() const noexcept { return contains(http_protocol::h2); }

    /// True when HTTP/1.1 is the only enabled protocol
    bool is_http11_only() const noexcept {
        return protocols_.size() == 1 && protocols_.front() == http_protocol::http11;
    }

    size_t size() const noexcept { return protocols_.size(); }
    auto begin() const noexcept { return protocols_.begin(); }
    auto end() const noexcept { return protocols_.end(); }

    /// Same members, independent of configuration order
    friend bool operator==(const protocol_set& a, const protocol_set& b) noexcept {
        return a.size() == b.size() &&
               std::all_of(a.begin(), a.end(), [&b](http_protocol p) { return b.contains(p); });
    }

private:
    std::vector<http_protocol> protocols_;
};

} // namespace tlsneg
