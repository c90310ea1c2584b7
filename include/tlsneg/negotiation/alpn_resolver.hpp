#pragma once

#include <tlsneg/negotiation/protocol_set.hpp>
#include <tlsneg/negotiation/errors.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tlsneg {

/// Ordered ALPN tokens offered during the handshake, most preferred first
using alpn_advertisement = std::vector<std::string>;

/// Derive the ALPN advertisement of a protocol set
/// @param protocols Enabled protocols
/// @param require_alpn Advertise "http/1.1" even when it is the only protocol
/// @return Empty for HTTP/1.1-only endpoints without ALPN, otherwise h2 first
inline alpn_advertisement resolve_alpn(const protocol_set& protocols, bool require_alpn = false) {
    if (protocols.is_http11_only() && !require_alpn) {
        return {};
    }

    alpn_advertisement adv;
    if (protocols.contains(http_protocol::h2)) {
        adv.emplace_back(alpn_token(http_protocol::h2));
    }
    if (protocols.contains(http_protocol::http11)) {
        adv.emplace_back(alpn_token(http_protocol::http11));
    }
    return adv;
}

/// Encode an advertisement in RFC 7301 wire format ([len][token]...)
/// @throws negotiation_error (configuration) on empty or oversized tokens
inline std::string encode_alpn_wire(const alpn_advertisement& adv) {
    std::string wire;
    for (const auto& token : adv) {
        if (token.empty() || token.size() > 255) {
            throw_configuration_error("invalid ALPN token length: " + std::to_string(token.size()));
        }
        wire += static_cast<char>(token.size());
        wire += token;
    }
    return wire;
}

/// Parse a wire-format protocol list received from a peer
/// @return Tokens in peer order, std::nullopt if the list is malformed
inline std::optional<alpn_advertisement> decode_alpn_wire(std::span<const unsigned char> wire) {
    alpn_advertisement adv;
    size_t pos = 0;
    while (pos < wire.size()) {
        size_t len = wire[pos++];
        if (len == 0 || pos + len > wire.size()) {
            return std::nullopt;
        }
        adv.emplace_back(reinterpret_cast<const char*>(wire.data() + pos), len);
        pos += len;
    }
    return adv;
}

/// Render an advertisement for logs, e.g. "[h2, http/1.1]"
inline std::string describe_alpn(const alpn_advertisement& adv) {
    return fmt::format("[{}]", fmt::join(adv, ", "));
}

} // namespace tlsneg
