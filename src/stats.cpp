#include "stats.hpp"
#include "terminal.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <ostream>
#include <sstream>

using namespace mping;

RttSummary summarize_rtts(const std::vector<long>& rtts) {
    RttSummary s{};
    s.count = static_cast<int>(rtts.size());
    if (rtts.empty()) return s;

    s.min = *std::min_element(rtts.begin(), rtts.end());
    s.max = *std::max_element(rtts.begin(), rtts.end());

    long sum = 0;
    for (auto r : rtts) sum += r;
    s.avg = static_cast<double>(sum) / rtts.size();

    // --- Jitter (temporal variation; no sorting)
    if (rtts.size() > 1) {
        long sum_diff = 0;
        for (size_t i = 1; i < rtts.size(); ++i)
            sum_diff += std::labs(rtts[i] - rtts[i - 1]);
        s.jitter = static_cast<double>(sum_diff) / (rtts.size() - 1);
    }

    // --- Median (requires sorted copy)
    auto sorted = rtts;
    std::sort(sorted.begin(), sorted.end());
    s.median = (sorted.size() % 2 == 0)
        ? (sorted[sorted.size()/2 - 1] + sorted[sorted.size()/2]) / 2.0
        : sorted[sorted.size()/2];

    // --- Standard deviation (mdev)
    double var = 0.0;
    for (auto r : rtts) var += (r - s.avg) * (r - s.avg);
    var /= rtts.size();
    s.stddev = std::sqrt(var);

    return s;
}

double reply_percentage(const HostStats& s) {
    if (s.total <= 0) return 0.0;
    return static_cast<double>(s.replies()) / s.total * 100.0;
}

/**
 * Summary layout:
 *
 *   ============================================================
 *   SUMMARY
 *   ============================================================
 *   8.8.8.8                        4/4 replies (100.0%) ok=4 slow=0 fail=0 [OK]
 */
void print_summary(std::ostream& os,
                   const std::vector<std::string>& labels,
                   const std::vector<HostStats>& stats,
                   bool verbose)
{
    os << "\n" << std::string(60, '=') << "\n"
       << "SUMMARY\n"
       << std::string(60, '=') << "\n";

    const std::size_t n = std::min(labels.size(), stats.size());
    for (std::size_t i = 0; i < n; ++i) {
        const HostStats& s = stats[i];
        const bool ok = s.replies() > 0;

        std::ostringstream pct;
        pct << std::fixed << std::setprecision(1) << reply_percentage(s);

        os << std::left << std::setw(30) << labels[i] << std::right << " "
           << s.replies() << "/" << s.total << " replies (" << pct.str() << "%)"
           << " ok=" << s.success << " slow=" << s.slow << " fail=" << s.fail << " "
           << (ok ? term::colorize("[OK]", term::green())
                  : term::colorize("[FAILED]", term::red()))
           << "\n";

        if (!verbose) continue;

        if (!s.rtts.empty()) {
            const RttSummary r = summarize_rtts(s.rtts);
            os << "    rtt min/avg/max/median/mdev/jitter = "
               << r.min << "/" << r.avg << "/" << r.max << "/"
               << r.median << "/" << r.stddev << "/" << r.jitter << " ms\n";
        }
        if (!s.last_error.empty())
            os << "    last error: " << s.last_error << "\n";
    }
}
