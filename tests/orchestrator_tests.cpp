#include "mping/orchestrator.hpp"
#include "mping/render.hpp"
#include "test_util.hpp"

#include <atomic>
#include <map>
#include <thread>
#include <vector>

using namespace mping;

// Drain everything run_probes() produced (it has returned already).
static std::vector<ProbeEvent> drain(Channel<ProbeEvent>& ch) {
    std::vector<ProbeEvent> out;
    while (auto ev = ch.try_pop())
        out.push_back(std::move(*ev));
    return out;
}

bool test_classify_reply() {
    if (classify_reply(reply(10), 500) != ProbeStatus::Success) return false;
    if (classify_reply(reply(499), 500) != ProbeStatus::Success) return false;
    if (classify_reply(reply(500), 500) != ProbeStatus::Slow) return false;
    if (classify_reply(reply(900), 500) != ProbeStatus::Slow) return false;
    if (classify_reply(no_reply(), 500) != ProbeStatus::Fail) return false;
    return true;
}

bool test_three_hosts_all_success() {
    ScriptedProber prober;
    std::vector<std::string> hosts{ "h1", "h2", "h3" };
    for (const auto& h : hosts) prober.script[h] = { reply(5) };

    ProbeOptions opt;
    opt.count = 4;
    opt.slow_threshold_ms = 100;

    Channel<ProbeEvent> ch;
    run_probes(hosts, opt, prober, ch);

    RenderState state(hosts, 70);
    std::map<std::string, int> done;
    for (const auto& ev : drain(ch)) {
        if (ev.kind == ProbeEvent::Kind::Done) done[ev.observation.host]++;
        else state.apply(ev.observation);
    }

    for (std::size_t i = 0; i < hosts.size(); ++i) {
        const HostStats& s = state.stats(i);
        if (s.success != 4) return false;
        if (s.slow != 0) return false;
        if (s.fail != 0) return false;
        if (s.total != 4) return false;
        if (done[hosts[i]] != 1) return false;
    }
    return true;
}

bool test_exact_count_and_single_done_per_host() {
    ScriptedProber prober;
    prober.script["ok"]    = { reply(1) };
    prober.script["slow"]  = { reply(800) };
    prober.script["mixed"] = { reply(1), no_reply(), reply(700), throws() };
    // "dead" has no script: always times out

    std::vector<std::string> hosts{ "ok", "slow", "mixed", "dead" };
    ProbeOptions opt;
    opt.count = 7;
    opt.slow_threshold_ms = 500;

    Channel<ProbeEvent> ch;
    run_probes(hosts, opt, prober, ch);

    std::map<std::string, int> obs, done;
    std::map<std::string, bool> obs_after_done;
    for (const auto& ev : drain(ch)) {
        const auto& h = ev.observation.host;
        if (ev.kind == ProbeEvent::Kind::Done) {
            done[h]++;
        } else {
            if (done[h] > 0) obs_after_done[h] = true;
            obs[h]++;
        }
    }

    for (const auto& h : hosts) {
        if (obs[h] != 7) return false;
        if (done[h] != 1) return false;
        if (obs_after_done[h]) return false;
        if (prober.calls(h) != 7) return false;
    }
    return true;
}

bool test_status_rtt_consistency() {
    ScriptedProber prober;
    prober.script["m"] = { reply(10), reply(500), no_reply("Name resolution failed"), throws() };

    ProbeOptions opt;
    opt.count = 4;
    opt.slow_threshold_ms = 500;

    Channel<ProbeEvent> ch;
    run_probes({ "m" }, opt, prober, ch);

    std::vector<ProbeObservation> seen;
    for (const auto& ev : drain(ch))
        if (ev.kind == ProbeEvent::Kind::Observation) seen.push_back(ev.observation);

    if (seen.size() != 4) return false;
    for (const auto& o : seen) {
        if (o.status == ProbeStatus::Fail) {
            if (o.rtt_ms.has_value()) return false;
            if (o.error.empty()) return false;
        } else {
            if (!o.rtt_ms.has_value()) return false;
            if ((o.status == ProbeStatus::Slow) != (*o.rtt_ms >= 500)) return false;
        }
    }
    if (seen[0].status != ProbeStatus::Success) return false;
    if (seen[1].status != ProbeStatus::Slow) return false;
    if (seen[2].status != ProbeStatus::Fail) return false;
    if (seen[2].error != "Name resolution failed") return false;
    if (seen[3].status != ProbeStatus::Fail) return false;
    if (seen[3].error != "transport failure") return false;
    return true;
}

bool test_per_host_sequence_order() {
    ScriptedProber prober;
    std::vector<std::string> hosts;
    for (int i = 0; i < 6; ++i) {
        hosts.push_back("host" + std::to_string(i));
        prober.script[hosts.back()] = { reply(i), no_reply() };
    }

    ProbeOptions opt;
    opt.count = 5;

    Channel<ProbeEvent> ch;
    run_probes(hosts, opt, prober, ch);

    std::map<std::size_t, int> last_seq;
    for (const auto& ev : drain(ch)) {
        if (ev.kind != ProbeEvent::Kind::Observation) continue;
        const auto& o = ev.observation;
        if (o.sequence != last_seq[o.host_index] + 1) return false;
        if (hosts[o.host_index] != o.host) return false;
        last_seq[o.host_index] = o.sequence;
    }
    for (std::size_t i = 0; i < hosts.size(); ++i)
        if (last_seq[i] != 5) return false;
    return true;
}

bool test_concurrency_bound() {
    ScriptedProber prober;
    prober.delay = std::chrono::milliseconds(20);

    std::vector<std::string> hosts;
    for (int i = 0; i < 25; ++i) {
        hosts.push_back("10.0.0." + std::to_string(i));
        prober.script[hosts.back()] = { reply(1) };
    }

    ProbeOptions opt;
    opt.count = 2;

    Channel<ProbeEvent> ch;
    run_probes(hosts, opt, prober, ch);

    if (prober.max_active() > 10) return false;
    if (prober.max_active() <= 1) return false;
    if (ch.size() != hosts.size() * 3) return false;
    return true;
}

bool test_background_run_drained_by_consumer() {
    ScriptedProber prober;
    prober.delay = std::chrono::milliseconds(2);
    std::vector<std::string> hosts{ "a", "b", "c", "d" };
    for (const auto& h : hosts) prober.script[h] = { reply(3), no_reply() };

    ProbeOptions opt;
    opt.count = 3;

    Channel<ProbeEvent> ch;
    ProbeRun run(hosts, opt, prober, ch);
    run.start();

    std::size_t finished = 0, observations = 0;
    while (finished < hosts.size()) {
        auto ev = ch.pop_for(std::chrono::seconds(5));
        if (!ev.has_value()) return false;
        if (ev->kind == ProbeEvent::Kind::Done) ++finished;
        else ++observations;
    }
    run.join();

    if (observations != hosts.size() * 3) return false;
    if (ch.size() != 0) return false;
    return true;
}

bool test_cancel_stops_new_attempts() {
    ScriptedProber prober;
    prober.delay = std::chrono::milliseconds(50);
    std::vector<std::string> hosts{ "a", "b", "c" };
    for (const auto& h : hosts) prober.script[h] = { reply(1) };

    ProbeOptions opt;
    opt.count = 20;

    std::atomic<bool> cancel{false};
    Channel<ProbeEvent> ch;
    ProbeRun run(hosts, opt, prober, ch, &cancel);
    run.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    cancel = true;

    const auto t0 = std::chrono::steady_clock::now();
    run.join();
    if (std::chrono::steady_clock::now() - t0 > std::chrono::milliseconds(500)) return false;

    std::map<std::string, int> obs, done;
    for (const auto& ev : drain(ch)) {
        if (ev.kind == ProbeEvent::Kind::Done) done[ev.observation.host]++;
        else obs[ev.observation.host]++;
    }
    for (const auto& h : hosts) {
        if (done[h] != 1) return false;
        if (obs[h] >= 20) return false;
        if (obs[h] != prober.calls(h)) return false;
    }
    return true;
}

bool test_empty_host_list() {
    ScriptedProber prober;
    Channel<ProbeEvent> ch;
    run_probes({}, ProbeOptions{}, prober, ch);
    if (ch.size() != 0) return false;
    return true;
}

int main() {
    std::cout << "Running orchestrator tests...\n";

    run_test("Reply classification", test_classify_reply);
    run_test("Three hosts all succeed", test_three_hosts_all_success);
    run_test("Exact count and one completion per host", test_exact_count_and_single_done_per_host);
    run_test("Status and RTT consistency", test_status_rtt_consistency);
    run_test("Per-host sequence order", test_per_host_sequence_order);
    run_test("At most ten concurrent hosts", test_concurrency_bound);
    run_test("Background run drained by consumer", test_background_run_drained_by_consumer);
    run_test("Cancel stops new attempts", test_cancel_stops_new_attempts);
    run_test("Empty host list", test_empty_host_list);

    return finish_tests("Orchestrator");
}
