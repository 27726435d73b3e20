#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "mping/channel.hpp"
#include "mping/visibility.hpp"

namespace mping {

using AsnClock = std::chrono::steady_clock;

/**
 * Parse a Team Cymru verbose whois reply.
 *
 * Blank lines are skipped; the second remaining line is split on '|'
 * and its first field (optional "AS" prefix stripped) is the ASN.
 * Returns "AS<number>", or std::nullopt for short replies and "NA".
 */
MPING_API std::optional<std::string> parse_asn_response(const std::string& response);

/**
 * Look up the ASN announcing ip via whois.cymru.com:43.
 *
 * Reads at most max_bytes of reply. Timeouts, connection errors and
 * malformed replies all yield std::nullopt.
 */
MPING_API std::optional<std::string> resolve_asn(const std::string& ip,
                                                 int timeout_ms = 3000,
                                                 std::size_t max_bytes = 65536);

/**
 * Cached lookup outcome. value == std::nullopt records a failed
 * lookup; an absent map key means "never attempted".
 */
struct AsnCacheEntry {
    std::optional<std::string> value;
    AsnClock::time_point fetched_at;
};

/**
 * IP -> last lookup outcome. All access is serialized by an internal
 * mutex; get() returns a copy.
 */
class MPING_API AsnCache {
public:
    void put(const std::string& ip,
             const std::optional<std::string>& value,
             AsnClock::time_point fetched_at);

    std::optional<AsnCacheEntry> get(const std::string& ip) const;
    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, AsnCacheEntry> entries_;
};

/**
 * Whether ip should be (re)looked up:
 *   no entry                        -> true
 *   cached success                  -> false (kept for the whole run)
 *   cached failure, aged >= ttl     -> true
 *   cached failure, younger than ttl -> false
 */
MPING_API bool should_retry_asn(const std::string& ip,
                                const AsnCache& cache,
                                AsnClock::time_point now,
                                AsnClock::duration failure_ttl);

/**
 * Pool of lookup threads fed through a request channel.
 *
 * Workers wait on the request channel with a short timeout so a
 * stop() is noticed within one poll interval. A lookup already in
 * progress when stop() is called finishes and its result is posted.
 */
class MPING_API AsnResolver {
public:
    using LookupFn = std::function<std::optional<std::string>(const std::string& ip)>;

    struct Request {
        std::string host;
        std::string ip;
    };

    struct Result {
        std::string host;
        std::string ip;
        std::optional<std::string> asn;
    };

    static constexpr std::chrono::milliseconds kPollInterval{100};

    /**
     * lookup defaults to resolve_asn(ip, timeout_ms).
     */
    explicit AsnResolver(std::size_t workers = 2,
                         int timeout_ms = 3000,
                         LookupFn lookup = nullptr);
    ~AsnResolver();

    AsnResolver(const AsnResolver&) = delete;
    AsnResolver& operator=(const AsnResolver&) = delete;

    void start();
    void stop();

    void request(const std::string& host, const std::string& ip);
    std::optional<Result> poll_result();
    std::optional<Result> wait_result(std::chrono::milliseconds timeout);

    bool running() const { return running_.load(); }

private:
    void worker_loop();

    std::size_t worker_count_;
    LookupFn lookup_;
    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;

    // std::nullopt is the per-worker shutdown sentinel
    Channel<std::optional<Request>> requests_;
    Channel<Result> results_;
};

} // namespace mping
