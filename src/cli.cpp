#include "cli.hpp"
#include <climits>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

void print_usage(std::ostream& os) {
    os << "Usage:\n"
       << "  mping [options] [host ...]\n"
       << "\n"
       << "Options:\n"
       << "  -t, --timeout SEC         Timeout per attempt in seconds (default 1)\n"
       << "  -c, --count N             Attempts per host (default 4)\n"
       << "  -s, --slow-threshold MS   Replies at or above MS are slow (default 500)\n"
       << "  -f, --input FILE          Read hosts from FILE, one per line\n"
       << "  -v, --verbose             RTT statistics and last error in the summary\n"
       << "      --summary             Skip the live dashboard, print the summary only\n"
       << "      --asn                 Look up the AS number of each host\n"
       << "      --asn-ttl SEC         Retry failed ASN lookups after SEC (default 300)\n"
       << "      --no-color            Disable ANSI colors\n"
       << "      --csv FILE            Export the summary as CSV\n"
       << "      --json FILE           Export the summary as JSON lines\n"
       << "      --export-append       Append to the export file\n"
       << "  -h, --help                Show this help\n";
}

// std::stoi/stod wrappers: a malformed value is recorded, not thrown
static bool to_int(const std::string& flag, const std::string& v, int& out, CliOptions& opt) {
    try {
        std::size_t used = 0;
        int n = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        out = n;
        return true;
    } catch (const std::exception&) {
        opt.error = "Invalid value for " + flag + ": '" + v + "'";
        return false;
    }
}

static bool to_double(const std::string& flag, const std::string& v, double& out, CliOptions& opt) {
    try {
        std::size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size() || !std::isfinite(d)) throw std::invalid_argument(v);
        out = d;
        return true;
    } catch (const std::exception&) {
        opt.error = "Invalid value for " + flag + ": '" + v + "'";
        return false;
    }
}

static bool takes_value(const std::string& a) {
    return a == "-t" || a == "--timeout" || a == "-c" || a == "--count" ||
           a == "-s" || a == "--slow-threshold" || a == "-f" || a == "--input" ||
           a == "--asn-ttl" || a == "--csv" || a == "--json";
}

/**
 * Parse command-line arguments into a CliOptions struct.
 *
 * The CLI follows classic ping/fping conventions: flags with a value
 * take the next argument, everything not starting with '-' is a host.
 * Unknown flags are reported but do not stop parsing. A malformed or
 * out-of-range value, or a value flag with nothing after it, is
 * recorded in opt.error.
 */
CliOptions parse_args(int argc, char** argv) {
    CliOptions opt{};
    double timeout_s = 1.0;
    int slow_ms = static_cast<int>(opt.probe.slow_threshold_ms);

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        if (takes_value(a) && i + 1 >= argc) {
            opt.error = "Missing value for " + a;
            break;
        }

        // ------------------------------
        // Probe options
        // ------------------------------
        if (a == "-t" || a == "--timeout") {
            to_double(a, argv[++i], timeout_s, opt);

        } else if (a == "-c" || a == "--count") {
            to_int(a, argv[++i], opt.probe.count, opt);

        } else if (a == "-s" || a == "--slow-threshold") {
            to_int(a, argv[++i], slow_ms, opt);

        } else if (a == "-f" || a == "--input") {
            opt.input_path = argv[++i];

        // ------------------------------
        // Output
        // ------------------------------
        } else if (a == "-v" || a == "--verbose") {
            opt.verbose = true;

        } else if (a == "--summary") {
            opt.summary_only = true;

        } else if (a == "--no-color") {
            opt.no_color = true;

        } else if (a == "-h" || a == "--help") {
            opt.help = true;

        // ------------------------------
        // ASN lookups
        // ------------------------------
        } else if (a == "--asn") {
            opt.asn = true;

        } else if (a == "--asn-ttl") {
            to_int(a, argv[++i], opt.asn_failure_ttl_s, opt);
            if (opt.asn_failure_ttl_s < 0) opt.asn_failure_ttl_s = 0;

        // ------------------------------
        // Export
        // ------------------------------
        } else if (a == "--csv") {
            opt.export_path = argv[++i];
            opt.export_format = ExportFormat::CSV;

        } else if (a == "--json") {
            opt.export_path = argv[++i];
            opt.export_format = ExportFormat::JSON;

        } else if (a == "--export-append") {
            opt.export_append = true;

        // ------------------------------
        // Hosts / unknown
        // ------------------------------
        } else if (!a.empty() && a[0] != '-') {
            opt.hosts.push_back(a);

        } else {
            std::cerr << "Unknown arg: " << a << "\n";
        }
    }

    // Final propagation into ProbeOptions; sub-millisecond timeouts
    // round up to 1 ms
    if (timeout_s <= 0.0 || timeout_s * 1000.0 > static_cast<double>(INT_MAX)) {
        if (opt.error.empty())
            opt.error = "Timeout out of range: must be positive and at most "
                      + std::to_string(INT_MAX / 1000) + " seconds";
    } else {
        opt.probe.timeout_ms = static_cast<int>(std::lround(timeout_s * 1000.0));
        if (opt.probe.timeout_ms < 1) opt.probe.timeout_ms = 1;
    }
    opt.probe.slow_threshold_ms = slow_ms < 0 ? 0 : slow_ms;

    return opt;
}
