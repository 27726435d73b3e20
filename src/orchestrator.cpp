/**
 * Probe orchestrator: bounded worker pool over the host list.
 *
 * Workers claim host indices from a shared atomic cursor, run the
 * configured number of sequential probes through the Prober and
 * push every classified attempt onto the result channel, followed
 * by a completion marker. Workers share nothing else.
 */

#include "mping/orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <vector>

namespace mping {

ProbeStatus classify_reply(const PingProbeResult& r, long slow_threshold_ms) {
    if (!r.success)
        return ProbeStatus::Fail;
    return r.rtt_ms >= slow_threshold_ms ? ProbeStatus::Slow : ProbeStatus::Success;
}


// ============================================================================
// Per-host sequence
// ============================================================================
static void probe_one_host(std::size_t index,
                           const std::string& host,
                           const ProbeOptions& opt,
                           Prober& prober,
                           Channel<ProbeEvent>& out,
                           const std::atomic<bool>* cancel)
{
    for (int seq = 1; seq <= opt.count; ++seq) {
        if (cancel && cancel->load())
            break;

        PingProbeResult res{};
        try {
            res = prober.probe(host, opt.timeout_ms);
        } catch (const std::exception& e) {
            res = PingProbeResult{};
            res.error_msg = e.what();
        }

        ProbeEvent ev;
        ev.observation.host_index = index;
        ev.observation.host = host;
        ev.observation.sequence = seq;
        ev.observation.status = classify_reply(res, opt.slow_threshold_ms);
        if (ev.observation.status != ProbeStatus::Fail)
            ev.observation.rtt_ms = res.rtt_ms;
        else
            ev.observation.error = res.error_msg.empty() ? "No reply" : res.error_msg;

        out.push(std::move(ev));
    }

    out.push(ProbeEvent::done(index, host));
}


// ============================================================================
// Pool
// ============================================================================
void run_probes(const std::vector<std::string>& hosts,
                const ProbeOptions& opt,
                Prober& prober,
                Channel<ProbeEvent>& out,
                const std::atomic<bool>* cancel)
{
    if (hosts.empty())
        return;

    const std::size_t workers = std::min<std::size_t>(
        hosts.size(), static_cast<std::size_t>(std::max(1, opt.max_workers)));

    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            const std::size_t i = next.fetch_add(1);
            if (i >= hosts.size())
                return;
            probe_one_host(i, hosts[i], opt, prober, out, cancel);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w)
        pool.emplace_back(worker);

    for (auto& t : pool)
        t.join();
}


// ============================================================================
// Background run
// ============================================================================
ProbeRun::ProbeRun(const std::vector<std::string>& hosts,
                   const ProbeOptions& opt,
                   Prober& prober,
                   Channel<ProbeEvent>& out,
                   const std::atomic<bool>* cancel)
    : hosts_(hosts), opt_(opt), prober_(prober), out_(out), cancel_(cancel) {}

ProbeRun::~ProbeRun() {
    join();
}

void ProbeRun::start() {
    if (runner_.joinable())
        return;
    runner_ = std::thread([this] { run_probes(hosts_, opt_, prober_, out_, cancel_); });
}

void ProbeRun::join() {
    if (runner_.joinable())
        runner_.join();
}

} // namespace mping
