#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include "cli.hpp"

/**
 * Read a host list: one host per line, surrounding whitespace trimmed,
 * blank lines and '#' comments skipped, order and duplicates kept.
 *
 * On any I/O error a message goes to err and the list is empty.
 */
std::vector<std::string> read_host_file(const std::string& path, std::ostream& err);

/**
 * Positional hosts followed by the hosts of opt.input_path (if set).
 */
std::vector<std::string> collect_hosts(const CliOptions& opt, std::ostream& err);
