#pragma once
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "mping/channel.hpp"
#include "mping/observation.hpp"
#include "mping/ping.hpp"
#include "mping/visibility.hpp"

namespace mping {

/**
 * Options for a multi-host probe run.
 */
struct ProbeOptions {
    int timeout_ms{1000};                 // Timeout per attempt (ms)
    int count{4};                         // Sequential attempts per host
    long slow_threshold_ms{500};          // Replies at or above this are Slow
    int max_workers{10};                  // Concurrently probed hosts
};

/**
 * Map a prober result to a status:
 *   reply with rtt >= slow_threshold_ms -> Slow
 *   reply below the threshold           -> Success
 *   no reply                            -> Fail
 */
MPING_API ProbeStatus classify_reply(const PingProbeResult& r, long slow_threshold_ms);

/**
 * Probe every host count times, blocking until all hosts are done.
 *
 * For each host the channel receives exactly opt.count observations
 * (in attempt order) followed by one Done event. Hosts are spread
 * over min(hosts.size(), opt.max_workers) threads; the rest wait
 * for a free worker. Prober exceptions become Fail observations.
 *
 * Once *cancel is set no new attempt starts: attempts in progress
 * finish, and every host still gets its Done event, possibly after
 * fewer than opt.count observations.
 */
MPING_API void run_probes(const std::vector<std::string>& hosts,
                          const ProbeOptions& opt,
                          Prober& prober,
                          Channel<ProbeEvent>& out,
                          const std::atomic<bool>* cancel = nullptr);

/**
 * Background variant of run_probes(): start() returns immediately,
 * the caller drains the channel. The destructor joins the workers.
 *
 * hosts, prober and cancel must outlive the ProbeRun.
 */
class MPING_API ProbeRun {
public:
    ProbeRun(const std::vector<std::string>& hosts,
             const ProbeOptions& opt,
             Prober& prober,
             Channel<ProbeEvent>& out,
             const std::atomic<bool>* cancel = nullptr);
    ~ProbeRun();

    ProbeRun(const ProbeRun&) = delete;
    ProbeRun& operator=(const ProbeRun&) = delete;

    void start();
    void join();

private:
    const std::vector<std::string>& hosts_;
    ProbeOptions opt_;
    Prober& prober_;
    Channel<ProbeEvent>& out_;
    const std::atomic<bool>* cancel_;
    std::thread runner_;
};

} // namespace mping
