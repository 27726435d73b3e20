#pragma once
#include <string>
#include "mping/visibility.hpp"

namespace mping {

/**
 * Result of a single echo probe.
 */
struct PingProbeResult {
    bool success{false};           // Whether a valid reply was received
    long rtt_ms{-1};               // RTT in milliseconds (-1 = invalid)
    int  ttl{-1};                  // Observed TTL (-1 = invalid)
    std::string error_msg;         // Error detail (empty if success=true)
};

/**
 * Reachability probe capability.
 *
 * probe() blocks the calling thread for at most timeout_ms and must
 * not throw for ordinary network failures (timeout, unreachable,
 * name resolution): those are reported with success=false.
 * Implementations are called concurrently from several worker threads.
 */
class Prober {
public:
    virtual ~Prober() = default;
    virtual PingProbeResult probe(const std::string& host, int timeout_ms) = 0;
};

/**
 * ICMP Echo prober over an unprivileged datagram ICMP socket
 * (SOCK_DGRAM + IPPROTO_ICMP). Host names are resolved per probe.
 *
 * On non-Linux builds every probe fails with "unsupported platform".
 */
class MPING_API IcmpProber : public Prober {
public:
    PingProbeResult probe(const std::string& host, int timeout_ms) override;
};

} // namespace mping
