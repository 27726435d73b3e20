#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include "mping/observation.hpp"

/**
 * Derived RTT metrics over the replies of one host.
 */
struct RttSummary {
    int  count{0};
    long min{0};
    long max{0};
    double avg{0.0};
    double median{0.0};
    double stddev{0.0};   // mdev
    double jitter{0.0};   // mean |rtt[i] - rtt[i-1]|, temporal order
};

/**
 * Compute min / avg / max / median / mdev / jitter.
 * rtts must be in temporal order.
 */
RttSummary summarize_rtts(const std::vector<long>& rtts);

/**
 * Share of attempts that got any reply (success or slow), 0..100.
 */
double reply_percentage(const mping::HostStats& s);

/**
 * Print the end-of-run summary block: one line per host with its
 * reply ratio and success/slow/fail counts. With verbose, each host
 * also gets its RTT statistics and last probe error.
 */
void print_summary(std::ostream& os,
                   const std::vector<std::string>& labels,
                   const std::vector<mping::HostStats>& stats,
                   bool verbose);
