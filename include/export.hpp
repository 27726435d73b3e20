#pragma once
#include <string>
#include <vector>
#include "mping/observation.hpp"

/**
 * Supported export formats.
 */
enum class ExportFormat {
    CSV,
    JSON
};

/**
 * Write one summary record per host.
 *
 * CSV gets a header row unless appending; JSON writes one object per
 * line. Returns false when the file cannot be opened.
 */
bool export_summary(const std::string& path,
                    ExportFormat fmt,
                    const std::vector<std::string>& hosts,
                    const std::vector<std::string>& asns,
                    const std::vector<mping::HostStats>& stats,
                    bool append = false);
