#include "export.hpp"
#include "stats.hpp"

#include <algorithm>
#include <fstream>

using namespace mping;

// ------------------------------------------------------------
// CSV Support
// ------------------------------------------------------------

static void write_csv_header(std::ofstream& f) {
    f << "host,asn,total,success,slow,fail,reply_pct,min,avg,max,median,stddev,jitter\n";
}

static void write_csv_row(std::ofstream& f, const std::string& host,
                          const std::string& asn, const HostStats& s,
                          const RttSummary& r)
{
    f << host << "," << (asn.empty() ? "-" : asn) << ","
      << s.total << "," << s.success << "," << s.slow << "," << s.fail << ","
      << reply_percentage(s) << ","
      << r.min << "," << r.avg << "," << r.max << ","
      << r.median << "," << r.stddev << "," << r.jitter << "\n";
}


// ------------------------------------------------------------
// JSON Support
// ------------------------------------------------------------

static std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

static void write_json_row(std::ofstream& f, const std::string& host,
                           const std::string& asn, const HostStats& s,
                           const RttSummary& r)
{
    f << "{"
      << "\"host\":\"" << json_escape(host) << "\","
      << "\"asn\":" << (asn.empty() ? std::string("null") : "\"" + json_escape(asn) + "\"") << ","
      << "\"total\":" << s.total << ","
      << "\"success\":" << s.success << ","
      << "\"slow\":" << s.slow << ","
      << "\"fail\":" << s.fail << ","
      << "\"reply_pct\":" << reply_percentage(s) << ","
      << "\"rtt\":{"
        << "\"min\":" << r.min << ","
        << "\"avg\":" << r.avg << ","
        << "\"max\":" << r.max << ","
        << "\"median\":" << r.median << ","
        << "\"stddev\":" << r.stddev << ","
        << "\"jitter\":" << r.jitter
      << "}"
      << "}\n";
}


// ------------------------------------------------------------
// Summary export
// ------------------------------------------------------------

bool export_summary(const std::string& path, ExportFormat fmt,
                    const std::vector<std::string>& hosts,
                    const std::vector<std::string>& asns,
                    const std::vector<HostStats>& stats,
                    bool append)
{
    std::ofstream f(path, std::ios::out |
                            (append ? std::ios::app : std::ios::trunc));
    if (!f) return false;

    if (fmt == ExportFormat::CSV && !append)
        write_csv_header(f);

    const std::size_t n = std::min(hosts.size(), stats.size());
    for (std::size_t i = 0; i < n; ++i) {
        const std::string asn = i < asns.size() ? asns[i] : std::string();
        const RttSummary r = summarize_rtts(stats[i].rtts);
        if (fmt == ExportFormat::CSV)
            write_csv_row(f, hosts[i], asn, stats[i], r);
        else
            write_json_row(f, hosts[i], asn, stats[i], r);
    }
    return static_cast<bool>(f);
}
