/**
 * Runner: orchestrates a multi-host probe session.
 *
 * This module handles:
 * - Pre-flight validation of options and host list
 * - Starting the probe workers and, with --asn, the ASN resolver
 * - Draining the result channel into the dashboard state
 * - Live redraws, scrolling keys and terminal resizes
 * - The end-of-run summary and optional export
 */

#include "runner.hpp"
#include "hosts.hpp"
#include "stats.hpp"
#include "terminal.hpp"
#include "export.hpp"

#include "mping/asn.hpp"
#include "mping/keys.hpp"
#include "mping/orchestrator.hpp"
#include "mping/render.hpp"
#include "mping/util.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <unistd.h>

using namespace mping;

namespace {

// Header lines plus the "(N more not shown)" line
constexpr int kReservedLines = RenderState::kHeaderLines + 1;

// Upper bound on how long the loop waits for a probe event before it
// services keys, ASN results and resizes.
constexpr std::chrono::milliseconds kLoopTick{100};

volatile std::sig_atomic_t g_interrupted = 0;

/**
 * SIGINT handler.
 * Only records the request; the loop cancels the run.
 */
void handle_sigint(int) {
    g_interrupted = 1;
}

/**
 * Per-run ASN bookkeeping: resolved IPs, the shared cache and the set
 * of IPs with a lookup queued or in flight, so each decision to
 * (re)lookup queues exactly one request.
 */
struct AsnTracker {
    AsnResolver resolver;
    AsnCache cache;
    AsnClock::duration failure_ttl;
    std::vector<std::optional<std::string>> host_ip;
    std::unordered_set<std::string> pending;

    AsnTracker(const CliOptions& opt, std::size_t hosts, AsnResolver::LookupFn lookup)
        : resolver(static_cast<std::size_t>(opt.asn_workers), opt.asn_timeout_ms,
                   std::move(lookup)),
          failure_ttl(std::chrono::seconds(opt.asn_failure_ttl_s)),
          host_ip(hosts) {}

    void schedule(const std::vector<std::string>& hosts) {
        const auto now = AsnClock::now();
        for (std::size_t i = 0; i < hosts.size(); ++i) {
            const auto& ip = host_ip[i];
            if (!ip || pending.count(*ip))
                continue;
            if (!should_retry_asn(*ip, cache, now, failure_ttl))
                continue;
            resolver.request(hosts[i], *ip);
            pending.insert(*ip);
        }
    }

    // Applies finished lookups to the cache and labels; true if any arrived.
    bool drain(RenderState& state) {
        bool changed = false;
        while (auto r = resolver.poll_result()) {
            cache.put(r->ip, r->asn, AsnClock::now());
            pending.erase(r->ip);
            for (std::size_t i = 0; i < host_ip.size(); ++i) {
                if (host_ip[i] && *host_ip[i] == r->ip) {
                    state.set_asn(i, r->asn);
                    changed = true;
                }
            }
        }
        return changed;
    }
};

} // namespace


RunEnvironment terminal_environment() {
    RunEnvironment env;
    env.live = term::stdout_is_tty();
    env.input_fd = (env.live && term::stdin_is_tty()) ? STDIN_FILENO : -1;
    env.window_size = [] {
        TerminalSize size;
        term::window_size(size.width, size.height);
        return size;
    };
    return env;
}


/**
 * Main execution entry for a multi-host run.
 *
 * Loop invariant: `finished` counts hosts whose completion marker has
 * been seen; the loop exits once it equals the host count.
 */
int run_multiping(const CliOptions& opt, Prober& prober,
                  std::ostream& out, std::ostream& err,
                  const RunEnvironment& env)
{
    term::g_enabled = !opt.no_color;

    // -------------------------------------------------------------
    // PRE-FLIGHT
    // -------------------------------------------------------------
    if (!opt.error.empty()) {
        err << "Error: " << opt.error << "\n";
        print_usage(err);
        return 1;
    }

    if (opt.probe.count <= 0) {
        err << "Error: Count must be a positive number.\n";
        return 1;
    }

    const std::vector<std::string> hosts = collect_hosts(opt, err);
    if (hosts.empty()) {
        err << "Error: No hosts specified. Provide hosts as arguments or use -f/--input option.\n";
        return 1;
    }

    const bool live = env.live && !opt.summary_only;
    if (!live) {
        out << "mping - Pinging " << hosts.size() << " host(s) with timeout="
            << opt.probe.timeout_ms << "ms, count=" << opt.probe.count << "\n"
            << std::string(60, '-') << "\n";
    }

    // -------------------------------------------------------------
    // SETUP
    // -------------------------------------------------------------
    auto window_size = [&env]() {
        return env.window_size ? env.window_size() : TerminalSize{};
    };
    TerminalSize size = window_size();

    // Buffers start at the first frame's width so nothing applied
    // before that frame is dropped
    RenderState state(hosts, compute_layout(hosts, size.width, size.height,
                                            kReservedLines).timeline_width);
    RenderHeader header{ opt.probe.timeout_ms, opt.probe.count, opt.probe.slow_threshold_ms };

    std::optional<RawTerminal> raw;
    std::optional<KeyReader> keys;
    if (live && env.input_fd >= 0) {
        raw.emplace(env.input_fd);
        keys.emplace(env.input_fd);
    }

    g_interrupted = 0;
    std::atomic<bool> cancel{false};
    auto previous_sigint = std::signal(SIGINT, handle_sigint);

    bool display = live;

    // Leaves the terminal as it was; probing carries on
    auto stop_display = [&]() {
        display = false;
        keys.reset();
        raw.reset();
    };

    auto redraw = [&]() {
        if (display)
            state.render(out, size, header, kReservedLines);
    };

    redraw();

    Channel<ProbeEvent> results;
    ProbeRun run(hosts, opt.probe, prober, results, &cancel);
    run.start();

    std::unique_ptr<AsnTracker> asn;
    if (opt.asn) {
        asn = std::make_unique<AsnTracker>(opt, hosts.size(), env.asn_lookup);
        asn->resolver.start();
        for (std::size_t i = 0; i < hosts.size(); ++i)
            asn->host_ip[i] = resolve_ipv4(hosts[i]);
        asn->schedule(hosts);
    }

    // -------------------------------------------------------------
    // MAIN LOOP
    // -------------------------------------------------------------
    std::vector<bool> done(hosts.size(), false);
    std::size_t finished = 0;

    while (finished < hosts.size()) {
        bool dirty = false;

        if (auto ev = results.pop_for(kLoopTick)) {
            const ProbeObservation& obs = ev->observation;
            if (ev->kind == ProbeEvent::Kind::Done) {
                if (obs.host_index < done.size() && !done[obs.host_index]) {
                    done[obs.host_index] = true;
                    ++finished;
                }
            } else {
                state.apply(obs);
                redraw();
            }
        }

        if (asn) {
            dirty |= asn->drain(state);
            asn->schedule(hosts);
        }

        if (keys) {
            const int visible = compute_layout(state.labels(), size.width,
                                               size.height, kReservedLines)
                                    .visible_host_count;
            while (auto k = keys->read_key()) {
                if (k->kind == KeyEvent::Kind::ArrowUp) {
                    state.scroll_by(-1, visible);
                    dirty = true;
                } else if (k->kind == KeyEvent::Kind::ArrowDown) {
                    state.scroll_by(1, visible);
                    dirty = true;
                } else if (k->is_char('q') || k->is_char('Q')) {
                    stop_display();
                    break;
                }
            }
        }

        if (g_interrupted && !cancel) {
            // No new attempts; a second SIGINT terminates.
            cancel = true;
            stop_display();
            std::signal(SIGINT, SIG_DFL);
            err << "\nInterrupted: finishing attempts in flight...\n";
        }

        const TerminalSize now_size = window_size();
        if (now_size.width != size.width || now_size.height != size.height) {
            size = now_size;
            dirty = true;
        }

        if (dirty)
            redraw();
    }

    run.join();

    // -------------------------------------------------------------
    // TEARDOWN
    // -------------------------------------------------------------
    if (asn) {
        asn->resolver.stop();
        asn->drain(state);
    }

    redraw();
    raw.reset();
    if (!cancel)
        std::signal(SIGINT, previous_sigint == SIG_ERR ? SIG_DFL : previous_sigint);

    print_summary(out, state.labels(), state.all_stats(), opt.verbose);

    if (!opt.export_path.empty()) {
        std::vector<std::string> asns;
        for (std::size_t i = 0; i < hosts.size(); ++i)
            asns.push_back(state.asn(i).value_or(""));
        if (!export_summary(opt.export_path, opt.export_format, hosts, asns,
                            state.all_stats(), opt.export_append))
            err << "Error: cannot write export file '" << opt.export_path << "'\n";
    }

    for (const auto& s : state.all_stats()) {
        if (s.replies() > 0)
            return 0;
    }
    return 1;
}

int run_multiping(const CliOptions& opt) {
    IcmpProber prober;
    return run_multiping(opt, prober, std::cout, std::cerr, terminal_environment());
}
