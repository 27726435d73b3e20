#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mping {

/**
 * 16-bit one's-complement Internet checksum (RFC 1071) over an
 * ICMP Echo header plus payload.
 */
uint16_t checksum16(const void* data, size_t len);

/**
 * Resolve a host token (dotted quad or name) to its first IPv4
 * address in text form. std::nullopt when resolution fails.
 */
std::optional<std::string> resolve_ipv4(const std::string& host);

/**
 * Trim ASCII whitespace from both ends.
 */
std::string trim(const std::string& s);

} // namespace mping
