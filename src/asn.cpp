/**
 * ASN lookup via Team Cymru's whois service.
 *
 * Wire format (TCP port 43):
 *   query:  " -v <ip>\n"
 *   reply:  header line, then
 *           "AS | IP | BGP Prefix | CC | Registry | Allocated | AS Name"
 *
 * Lookups are cheap and silent: every failure maps to std::nullopt
 * and the caller's retry policy decides when to ask again.
 */

#include "mping/asn.hpp"
#include "mping/util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace mping {

static constexpr const char* kWhoisHost = "whois.cymru.com";
static constexpr const char* kWhoisPort = "43";


// ============================================================================
// Reply parsing
// ============================================================================
std::optional<std::string> parse_asn_response(const std::string& response) {
    std::vector<std::string> lines;
    std::istringstream in(response);
    std::string line;
    while (std::getline(in, line)) {
        if (!trim(line).empty())
            lines.push_back(line);
    }
    if (lines.size() < 2)
        return std::nullopt;

    const std::string& row = lines[1];
    std::string field = trim(row.substr(0, row.find('|')));

    // Strip every "AS" occurrence, as the service may or may not prefix it
    std::string::size_type pos;
    while ((pos = field.find("AS")) != std::string::npos)
        field.erase(pos, 2);
    field = trim(field);

    std::string upper = field;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (field.empty() || upper == "NA")
        return std::nullopt;
    return "AS" + field;
}


// ============================================================================
// Network lookup
// ============================================================================

// Connect with a deadline: non-blocking connect() + poll(), then back to
// blocking mode with SO_RCVTIMEO/SO_SNDTIMEO for the exchange.
static int connect_with_timeout(const addrinfo* ai, int timeout_ms) {
    int s = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (s < 0)
        return -1;

    const int flags = ::fcntl(s, F_GETFL, 0);
    ::fcntl(s, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(s, ai->ai_addr, ai->ai_addrlen);
    if (rc < 0 && errno != EINPROGRESS) {
        ::close(s);
        return -1;
    }

    if (rc < 0) {
        pollfd pfd{ s, POLLOUT, 0 };
        rc = ::poll(&pfd, 1, timeout_ms);
        if (rc <= 0) {
            ::close(s);
            return -1;
        }
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &err, &len) < 0 || err != 0) {
            ::close(s);
            return -1;
        }
    }

    ::fcntl(s, F_SETFL, flags);

    timeval tv{};
    tv.tv_sec  = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    ::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    return s;
}

std::optional<std::string> resolve_asn(const std::string& ip,
                                       int timeout_ms,
                                       std::size_t max_bytes)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    if (::getaddrinfo(kWhoisHost, kWhoisPort, &hints, &res) != 0 || !res)
        return std::nullopt;

    int s = -1;
    for (addrinfo* p = res; p && s < 0; p = p->ai_next)
        s = connect_with_timeout(p, timeout_ms);
    ::freeaddrinfo(res);

    if (s < 0)
        return std::nullopt;

    const std::string query = " -v " + ip + "\n";
    std::size_t off = 0;
    while (off < query.size()) {
        ssize_t n = ::send(s, query.data() + off, query.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(s);
            return std::nullopt;
        }
        off += static_cast<std::size_t>(n);
    }

    std::string response;
    char chunk[4096];
    while (response.size() < max_bytes) {
        const std::size_t want = std::min(sizeof(chunk), max_bytes - response.size());
        ssize_t n = ::recv(s, chunk, want, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(s);
            return std::nullopt;  // timeout or socket error
        }
        if (n == 0)
            break;
        response.append(chunk, static_cast<std::size_t>(n));
    }

    ::close(s);
    return parse_asn_response(response);
}


// ============================================================================
// Cache and retry policy
// ============================================================================
void AsnCache::put(const std::string& ip,
                   const std::optional<std::string>& value,
                   AsnClock::time_point fetched_at)
{
    std::lock_guard<std::mutex> lk(mtx_);
    entries_[ip] = AsnCacheEntry{ value, fetched_at };
}

std::optional<AsnCacheEntry> AsnCache::get(const std::string& ip) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = entries_.find(ip);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

std::size_t AsnCache::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.size();
}

bool should_retry_asn(const std::string& ip,
                      const AsnCache& cache,
                      AsnClock::time_point now,
                      AsnClock::duration failure_ttl)
{
    auto entry = cache.get(ip);
    if (!entry)
        return true;
    if (!entry->value && (now - entry->fetched_at) >= failure_ttl)
        return true;
    return false;
}


// ============================================================================
// Worker pool
// ============================================================================
AsnResolver::AsnResolver(std::size_t workers, int timeout_ms, LookupFn lookup)
    : worker_count_(std::max<std::size_t>(1, workers)),
      lookup_(std::move(lookup))
{
    if (!lookup_) {
        lookup_ = [timeout_ms](const std::string& ip) {
            return resolve_asn(ip, timeout_ms);
        };
    }
}

AsnResolver::~AsnResolver() {
    stop();
}

void AsnResolver::start() {
    if (running_.exchange(true))
        return;
    for (std::size_t i = 0; i < worker_count_; ++i)
        workers_.emplace_back(&AsnResolver::worker_loop, this);
}

void AsnResolver::stop() {
    if (!running_.exchange(false))
        return;
    for (std::size_t i = 0; i < workers_.size(); ++i)
        requests_.push(std::nullopt);
    for (auto& t : workers_) {
        if (t.joinable())
            t.join();
    }
    workers_.clear();

    // Sentinels left by workers that exited on the stop flag, and
    // requests nobody picked up, must not reach a restarted pool.
    while (requests_.try_pop()) {}
}

void AsnResolver::request(const std::string& host, const std::string& ip) {
    requests_.push(Request{ host, ip });
}

std::optional<AsnResolver::Result> AsnResolver::poll_result() {
    return results_.try_pop();
}

std::optional<AsnResolver::Result> AsnResolver::wait_result(std::chrono::milliseconds timeout) {
    return results_.pop_for(timeout);
}

void AsnResolver::worker_loop() {
    while (running_.load()) {
        auto item = requests_.pop_for(kPollInterval);
        if (!item)
            continue;          // poll timeout, re-check the stop flag
        if (!*item)
            break;             // sentinel

        const Request& req = **item;
        results_.push(Result{ req.host, req.ip, lookup_(req.ip) });
    }
}

} // namespace mping
