/**
 * Entry point for the mping CLI.
 *
 * Responsible only for:
 * - Parsing command-line options
 * - Delegating execution to `run_multiping`
 */

#include "cli.hpp"
#include "runner.hpp"

#include <iostream>

int main(int argc, char** argv) {
    auto options = parse_args(argc, argv);
    if (options.help) {
        print_usage(std::cout);
        return 0;
    }
    return run_multiping(options);
}
