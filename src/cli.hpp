#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include "mping/orchestrator.hpp"
#include "export.hpp"

/**
 * Parsed command-line options for the mping executable.
 *
 * This struct is intentionally flat and CLI-oriented, while the
 * probe engine uses mping::ProbeOptions. Fields are synchronized
 * after parsing.
 */
struct CliOptions {
    std::vector<std::string> hosts;   // Positional host tokens
    std::string input_path;           // -f/--input host list file

    mping::ProbeOptions probe;        // Timeout, count, slow threshold

    bool verbose{false};              // RTT statistics and errors in summary
    bool summary_only{false};         // No live dashboard
    bool no_color{false};             // Disable ANSI colors in the summary
    bool help{false};

    bool asn{false};                  // Enable ASN lookups
    int asn_failure_ttl_s{300};       // Retry failed lookups after this long
    int asn_timeout_ms{3000};         // Per-lookup socket timeout
    int asn_workers{2};

    std::string export_path;          // CSV/JSON summary export file path
    ExportFormat export_format{ExportFormat::CSV};
    bool export_append{false};        // Append instead of overwrite

    std::string error;                // Set when an argument is malformed
};

/**
 * Parse all command-line arguments into a CliOptions struct.
 * Unknown flags produce warnings but parsing continues; malformed
 * numeric values set CliOptions::error.
 */
CliOptions parse_args(int argc, char** argv);

/**
 * Usage text for -h/--help and argument errors.
 */
void print_usage(std::ostream& os);
