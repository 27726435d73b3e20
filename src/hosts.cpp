#include "hosts.hpp"
#include "mping/util.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <ostream>

std::vector<std::string> read_host_file(const std::string& path, std::ostream& err) {
    std::vector<std::string> hosts;

    errno = 0;
    std::ifstream in(path);
    if (!in) {
        const int e = errno;
        if (e == ENOENT)
            err << "Error: Input file '" << path << "' not found.\n";
        else if (e == EACCES)
            err << "Error: Permission denied reading file '" << path << "'.\n";
        else
            err << "Error reading input file '" << path << "': "
                << (e ? std::strerror(e) : "open failed") << "\n";
        return {};
    }

    std::string line;
    while (std::getline(in, line)) {
        line = mping::trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        hosts.push_back(line);
    }

    if (in.bad()) {
        err << "Error reading input file '" << path << "': read failed\n";
        return {};
    }
    return hosts;
}

std::vector<std::string> collect_hosts(const CliOptions& opt, std::ostream& err) {
    std::vector<std::string> all = opt.hosts;
    if (!opt.input_path.empty()) {
        auto from_file = read_host_file(opt.input_path, err);
        all.insert(all.end(), from_file.begin(), from_file.end());
    }
    return all;
}
