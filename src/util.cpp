#include "mping/util.hpp"

#include <cctype>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace mping {

/**
 * Classic 16-bit one's-complement sum:
 *   - sum words
 *   - fold carries
 *   - invert result
 */
uint16_t checksum16(const void* data, size_t len) {
    uint32_t sum = 0;
    const uint8_t* p = static_cast<const uint8_t*>(data);

    while (len > 1) {
        uint16_t word;
        std::memcpy(&word, p, sizeof(word));
        sum += word;
        p += 2;
        len -= 2;
    }

    // Odd trailing byte
    if (len)
        sum += *p;

    while (sum >> 16)
        sum = (sum & 0xFFFF) + (sum >> 16);

    return static_cast<uint16_t>(~sum);
}

std::optional<std::string> resolve_ipv4(const std::string& host) {
    in_addr direct{};
    if (inet_pton(AF_INET, host.c_str(), &direct) == 1)
        return host;

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res)
        return std::nullopt;

    char buf[INET_ADDRSTRLEN] = {0};
    const auto* sa = reinterpret_cast<const sockaddr_in*>(res->ai_addr);
    const bool ok = inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf)) != nullptr;
    ::freeaddrinfo(res);

    if (!ok)
        return std::nullopt;
    return std::string(buf);
}

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace mping
