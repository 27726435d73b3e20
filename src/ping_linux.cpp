#if !defined(__linux__)
#include "mping/ping.hpp"

namespace mping {

// Stub for non-Linux builds
PingProbeResult IcmpProber::probe(const std::string&, int) {
    PingProbeResult r{};
    r.error_msg = "unsupported platform";
    return r;
}

} // namespace mping

#else

/**
 * Linux ICMP Echo prober.
 *
 * One blocking Echo Request/Reply exchange per call using:
 *   - DATAGRAM ICMP sockets (SOCK_DGRAM + IPPROTO_ICMP, no root needed
 *     when net.ipv4.ping_group_range allows it)
 *   - recvmsg() with IP_RECVTTL to extract hop count
 *   - manual checksum + timestamp payload
 *
 * Each call owns its socket, so probes for different hosts run in
 * parallel from the orchestrator's worker threads without sharing
 * state.
 */

#include "mping/ping.hpp"
#include "mping/util.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <string>
#include <vector>
#include <algorithm>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>

namespace mping {

static std::atomic<uint16_t> g_seq{1};

// Closes the socket on every return path
struct SocketGuard {
    int fd;
    explicit SocketGuard(int s) : fd(s) {}
    ~SocketGuard() { if (fd >= 0) ::close(fd); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
};


// ============================================================================
// Single Echo exchange
// ============================================================================
PingProbeResult IcmpProber::probe(const std::string& host, int timeout_ms) {
    PingProbeResult probe{};

    // ---------------------------------------------------------------------
    // Resolve target
    // ---------------------------------------------------------------------
    auto ip = resolve_ipv4(host);
    if (!ip) {
        probe.error_msg = "Name resolution failed";
        return probe;
    }

    sockaddr_in dst{};
    dst.sin_family = AF_INET;
    if (inet_pton(AF_INET, ip->c_str(), &dst.sin_addr) != 1) {
        probe.error_msg = "Invalid IP address";
        return probe;
    }

    // ---------------------------------------------------------------------
    // ICMP datagram socket
    // ---------------------------------------------------------------------
    SocketGuard sock(::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP));
    if (sock.fd < 0) {
        probe.error_msg = "socket() failed";
        return probe;
    }
    const int s = sock.fd;

    // Must connect() for consistent recvmsg() semantics
    if (::connect(s, reinterpret_cast<sockaddr*>(&dst), sizeof(dst)) < 0) {
        probe.error_msg = "connect() failed";
        return probe;
    }

    int one = 1;
    ::setsockopt(s, IPPROTO_IP, IP_RECVTTL, &one, sizeof(one));

    const int wait_ms = std::max(1, timeout_ms);
    timeval tv{};
    tv.tv_sec  = wait_ms / 1000;
    tv.tv_usec = (wait_ms % 1000) * 1000;
    ::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // ---------------------------------------------------------------------
    // Build ICMP Echo Request
    // ---------------------------------------------------------------------
    const uint16_t seq = g_seq.fetch_add(1, std::memory_order_relaxed);
    std::vector<unsigned char> packet(sizeof(icmphdr) + sizeof(uint64_t), 0);

    auto* hdr = reinterpret_cast<icmphdr*>(packet.data());
    hdr->type = ICMP_ECHO;
    hdr->code = 0;
    hdr->un.echo.id = 0;                 // kernel assigns the id on ping sockets
    hdr->un.echo.sequence = htons(seq);

    uint64_t ticks = (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now().time_since_epoch())
                         .count();
    std::memcpy(packet.data() + sizeof(icmphdr), &ticks, sizeof(ticks));

    hdr->checksum = 0;
    hdr->checksum = checksum16(packet.data(), packet.size());

    // ---------------------------------------------------------------------
    // Send
    // ---------------------------------------------------------------------
    const auto t_send = std::chrono::steady_clock::now();

    if (::send(s, packet.data(), packet.size(), 0) < 0) {
        probe.error_msg = std::string("send() failed: ") + std::strerror(errno);
        return probe;
    }

    // ---------------------------------------------------------------------
    // Receive loop
    // ---------------------------------------------------------------------
    uint8_t recv_buf[1500];
    char cbuf[256];

    const auto deadline = t_send + std::chrono::milliseconds(wait_ms);

    while (std::chrono::steady_clock::now() < deadline) {
        iovec iov{ recv_buf, sizeof(recv_buf) };
        sockaddr_in src{};

        msghdr msg{};
        msg.msg_name       = &src;
        msg.msg_namelen    = sizeof(src);
        msg.msg_iov        = &iov;
        msg.msg_iovlen     = 1;
        msg.msg_control    = cbuf;
        msg.msg_controllen = sizeof(cbuf);

        ssize_t n = ::recvmsg(s, &msg, 0);

        if (n < 0) {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                break;
            probe.error_msg = std::string("recvmsg() failed: ") + std::strerror(errno);
            return probe;
        }

        if (n < (ssize_t)sizeof(icmphdr))
            continue;

        const icmphdr* ricmp = reinterpret_cast<const icmphdr*>(recv_buf);
        if (ricmp->type != ICMP_ECHOREPLY || ntohs(ricmp->un.echo.sequence) != seq)
            continue;

        const auto t_recv = std::chrono::steady_clock::now();
        probe.rtt_ms = (long)std::chrono::duration_cast<std::chrono::milliseconds>(
                           t_recv - t_send)
                           .count();

        int ttl = -1;
        for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg);
             cmsg;
             cmsg = CMSG_NXTHDR(&msg, cmsg))
        {
            if (cmsg->cmsg_level == IPPROTO_IP &&
                cmsg->cmsg_type == IP_TTL)
            {
                std::memcpy(&ttl, CMSG_DATA(cmsg), sizeof(ttl));
                break;
            }
        }

        probe.ttl = ttl;
        probe.success = true;
        return probe;
    }

    probe.error_msg = "Timeout";
    return probe;
}

} // namespace mping

#endif // __linux__
