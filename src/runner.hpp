/**
 * Multi-host run orchestration.
 *
 * Exposes the entry point used by the CLI frontend. Probing is
 * delegated to a mping::Prober; the default is the ICMP prober.
 */

#pragma once
#include <functional>
#include <iosfwd>
#include "cli.hpp"
#include "mping/asn.hpp"
#include "mping/ping.hpp"
#include "mping/render.hpp"

/**
 * Terminal side of a run: whether frames are drawn, where keys come
 * from, the window size and the ASN lookup.
 *
 * A default-constructed environment is a plain non-interactive run:
 * no frames, no keys, 80x24, whois lookups.
 */
struct RunEnvironment {
    bool live{false};                                   // Draw dashboard frames on `out`
    int input_fd{-1};                                   // Key input, -1 for none
    std::function<mping::TerminalSize()> window_size;   // Empty: 80x24
    mping::AsnResolver::LookupFn asn_lookup;            // Empty: resolve_asn
};

/**
 * Environment of the controlling terminal: live when stdout is a TTY,
 * keys from stdin when it is a TTY too.
 */
RunEnvironment terminal_environment();

/**
 * Validate options, probe every host, drive the live dashboard and
 * print the summary.
 *
 * Returns 1 on a user error (non-positive count, no hosts, malformed
 * argument) before any probe is sent, 1 when no host replied at all,
 * 0 otherwise. --summary turns the dashboard off whatever env says.
 */
int run_multiping(const CliOptions& opt,
                  mping::Prober& prober,
                  std::ostream& out,
                  std::ostream& err,
                  const RunEnvironment& env = RunEnvironment{});

/**
 * Same as above with the ICMP prober on std::cout / std::cerr and the
 * controlling terminal.
 */
int run_multiping(const CliOptions& opt);
