#include "cli.hpp"
#include "export.hpp"
#include "hosts.hpp"
#include "runner.hpp"
#include "stats.hpp"
#include "test_util.hpp"

#include <atomic>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

using namespace mping;

static CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "mping");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

/**
 * Temporary file removed on scope exit.
 */
struct TempFile {
    std::string path;

    explicit TempFile(const std::string& content) {
        char tmpl[] = "/tmp/mping_test_XXXXXX";
        int fd = ::mkstemp(tmpl);
        if (fd >= 0) ::close(fd);
        path = tmpl;
        std::ofstream(path) << content;
    }
    ~TempFile() { std::remove(path.c_str()); }
};

static std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::size_t count_of(const std::string& text, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size()))
        ++n;
    return n;
}

// ============================================================================
// Argument parsing
// ============================================================================
bool test_parse_defaults() {
    auto opt = parse({ "8.8.8.8" });
    if (!opt.error.empty()) return false;
    if (opt.hosts.size() != 1) return false;
    if (opt.probe.timeout_ms != 1000) return false;
    if (opt.probe.count != 4) return false;
    if (opt.probe.slow_threshold_ms != 500) return false;
    if (opt.probe.max_workers != 10) return false;
    if (opt.verbose) return false;
    if (opt.summary_only) return false;
    if (opt.asn) return false;
    if (opt.asn_failure_ttl_s != 300) return false;
    if (!opt.export_path.empty()) return false;
    return true;
}

bool test_parse_flags() {
    auto opt = parse({ "-t", "0.5", "-c", "10", "-s", "200", "-v", "--summary",
                       "--asn", "--asn-ttl", "60", "--no-color",
                       "--json", "out.json", "--export-append",
                       "a.example", "b.example" });
    if (!opt.error.empty()) return false;
    if (opt.probe.timeout_ms != 500) return false;
    if (opt.probe.count != 10) return false;
    if (opt.probe.slow_threshold_ms != 200) return false;
    if (!opt.verbose) return false;
    if (!opt.summary_only) return false;
    if (!opt.asn) return false;
    if (opt.asn_failure_ttl_s != 60) return false;
    if (!opt.no_color) return false;
    if (opt.export_path != "out.json") return false;
    if (opt.export_format != ExportFormat::JSON) return false;
    if (!opt.export_append) return false;
    if (opt.hosts != std::vector<std::string>{ "a.example", "b.example" }) return false;
    return true;
}

bool test_parse_long_forms() {
    auto opt = parse({ "--timeout", "2", "--count", "3", "--input", "hosts.txt",
                       "--csv", "out.csv", "--help" });
    if (opt.probe.timeout_ms != 2000) return false;
    if (opt.probe.count != 3) return false;
    if (opt.input_path != "hosts.txt") return false;
    if (opt.export_format != ExportFormat::CSV) return false;
    if (!opt.help) return false;
    if (!opt.hosts.empty()) return false;
    return true;
}

bool test_parse_malformed_number() {
    auto opt = parse({ "-c", "four", "8.8.8.8" });
    if (opt.error.empty()) return false;
    if (opt.error.find("-c") == std::string::npos) return false;

    opt = parse({ "-t", "1s" });
    if (opt.error.empty()) return false;
    return true;
}

bool test_parse_timeout_range() {
    auto opt = parse({ "-t", "3000000", "h" });
    if (opt.error.find("Timeout out of range") == std::string::npos) return false;

    opt = parse({ "-t", "0", "h" });
    if (opt.error.empty()) return false;
    opt = parse({ "-t", "-1", "h" });
    if (opt.error.empty()) return false;

    // Largest accepted value and a sub-millisecond one
    opt = parse({ "-t", "2147483", "h" });
    if (!opt.error.empty()) return false;
    if (opt.probe.timeout_ms != 2147483000) return false;
    opt = parse({ "-t", "0.0001", "h" });
    if (!opt.error.empty()) return false;
    if (opt.probe.timeout_ms != 1) return false;
    return true;
}

bool test_parse_missing_value() {
    auto opt = parse({ "h", "-c" });
    if (opt.error != "Missing value for -c") return false;

    opt = parse({ "h", "--json" });
    if (opt.error != "Missing value for --json") return false;
    if (!opt.export_path.empty()) return false;
    return true;
}

bool test_run_reports_missing_value() {
    ScriptedProber prober;
    std::ostringstream out, err;
    CliOptions opt = parse({ "h", "-t" });
    if (run_multiping(opt, prober, out, err) != 1) return false;
    if (err.str().find("Missing value for -t") == std::string::npos) return false;
    if (prober.calls("h") != 0) return false;
    return true;
}

// ============================================================================
// Host list input
// ============================================================================
bool test_host_file_skips_comments_and_blanks() {
    TempFile f("# resolvers\n8.8.8.8\n\n   1.1.1.1  \n# lan\n\t\nexample.com\n8.8.8.8\n");
    std::ostringstream err;
    auto hosts = read_host_file(f.path, err);
    if (hosts != std::vector<std::string>{ "8.8.8.8", "1.1.1.1", "example.com", "8.8.8.8" }) return false;
    if (!err.str().empty()) return false;
    return true;
}

bool test_host_file_missing() {
    std::ostringstream err;
    auto hosts = read_host_file("/nonexistent/mping/hosts.txt", err);
    if (!hosts.empty()) return false;
    if (err.str().find("not found") == std::string::npos) return false;
    return true;
}

bool test_collect_hosts_order() {
    TempFile f("c\nd\n");
    CliOptions opt;
    opt.hosts = { "a", "b" };
    opt.input_path = f.path;

    std::ostringstream err;
    auto hosts = collect_hosts(opt, err);
    if (hosts != std::vector<std::string>{ "a", "b", "c", "d" }) return false;
    return true;
}

// ============================================================================
// Summary statistics
// ============================================================================
bool test_rtt_summary() {
    auto r = summarize_rtts({ 10, 30, 20, 40 });
    if (r.count != 4) return false;
    if (r.min != 10) return false;
    if (r.max != 40) return false;
    if (std::fabs(r.avg - 25.0) >= 1e-9) return false;
    if (std::fabs(r.median - 25.0) >= 1e-9) return false;
    // |30-10| + |20-30| + |40-20| = 50 over 3 gaps
    if (std::fabs(r.jitter - 50.0 / 3.0) >= 1e-9) return false;

    auto empty = summarize_rtts({});
    if (empty.count != 0) return false;
    return true;
}

bool test_reply_percentage() {
    HostStats s;
    if (reply_percentage(s) != 0.0) return false;
    s.success = 2; s.slow = 1; s.fail = 1; s.total = 4;
    if (std::fabs(reply_percentage(s) - 75.0) >= 1e-9) return false;
    return true;
}

bool test_export_csv() {
    TempFile f("");
    HostStats s;
    s.success = 1; s.fail = 1; s.total = 2; s.rtts = { 12 };

    if (!export_summary(f.path, ExportFormat::CSV, { "8.8.8.8" }, { "AS15133" }, { s })) return false;
    const std::string text = slurp(f.path);
    if (text.compare(0, 10, "host,asn,t") != 0) return false;
    if (text.find("\n8.8.8.8,AS15133,2,1,0,1,50,") == std::string::npos) return false;

    if (!export_summary(f.path, ExportFormat::CSV, { "1.1.1.1" }, { "" }, { s }, true)) return false;
    const std::string appended = slurp(f.path);
    if (count_of(appended, "host,asn") != 1) return false;
    if (appended.find("\n1.1.1.1,-,") == std::string::npos) return false;
    return true;
}

// ============================================================================
// Full runs with a scripted prober
// ============================================================================
static CliOptions summary_run(const std::vector<std::string>& hosts, int count) {
    CliOptions opt;
    opt.hosts = hosts;
    opt.probe.count = count;
    opt.probe.timeout_ms = 100;
    opt.summary_only = true;
    opt.no_color = true;
    return opt;
}

bool test_run_three_hosts_all_reply() {
    ScriptedProber prober;
    for (auto h : { "h1", "h2", "h3" }) prober.script[h] = { reply(5) };

    std::ostringstream out, err;
    int rc = run_multiping(summary_run({ "h1", "h2", "h3" }, 4), prober, out, err);
    if (rc != 0) return false;
    if (count_of(out.str(), "4/4 replies (100.0%)") != 3) return false;
    if (count_of(out.str(), "[OK]") != 3) return false;
    if (out.str().find("SUMMARY") == std::string::npos) return false;
    return true;
}

bool test_run_partial_and_failed_hosts() {
    ScriptedProber prober;
    prober.script["up"] = { reply(5), no_reply() };
    // "down" never replies

    std::ostringstream out, err;
    int rc = run_multiping(summary_run({ "up", "down" }, 4), prober, out, err);
    if (rc != 0) return false;
    if (out.str().find("2/4 replies (50.0%)") == std::string::npos) return false;
    if (out.str().find("0/4 replies (0.0%)") == std::string::npos) return false;
    if (out.str().find("[FAILED]") == std::string::npos) return false;
    return true;
}

bool test_run_nothing_replies() {
    ScriptedProber prober;
    std::ostringstream out, err;
    if (run_multiping(summary_run({ "down" }, 2), prober, out, err) != 1) return false;
    return true;
}

bool test_run_rejects_zero_count() {
    ScriptedProber prober;
    std::ostringstream out, err;
    if (run_multiping(summary_run({ "8.8.8.8" }, 0), prober, out, err) != 1) return false;
    if (err.str().find("Count must be a positive number") == std::string::npos) return false;
    if (prober.calls("8.8.8.8") != 0) return false;
    return true;
}

bool test_run_rejects_empty_host_list() {
    ScriptedProber prober;
    std::ostringstream out, err;
    if (run_multiping(summary_run({}, 4), prober, out, err) != 1) return false;
    if (err.str().find("No hosts specified") == std::string::npos) return false;
    return true;
}

bool test_run_missing_file_with_positional_hosts() {
    ScriptedProber prober;
    prober.script["h"] = { reply(1) };

    CliOptions opt = summary_run({ "h" }, 1);
    opt.input_path = "/nonexistent/mping/hosts.txt";

    std::ostringstream out, err;
    if (run_multiping(opt, prober, out, err) != 0) return false;
    if (err.str().find("not found") == std::string::npos) return false;
    if (out.str().find("1/1 replies") == std::string::npos) return false;
    return true;
}

bool test_run_verbose_and_export() {
    ScriptedProber prober;
    prober.script["h"] = { reply(10), reply(700), no_reply("Timeout") };

    TempFile f("");
    CliOptions opt = summary_run({ "h" }, 3);
    opt.verbose = true;
    opt.export_path = f.path;
    opt.export_format = ExportFormat::JSON;

    std::ostringstream out, err;
    if (run_multiping(opt, prober, out, err) != 0) return false;
    if (out.str().find("ok=1 slow=1 fail=1") == std::string::npos) return false;
    if (out.str().find("last error: Timeout") == std::string::npos) return false;

    const std::string json = slurp(f.path);
    if (json.find("\"host\":\"h\"") == std::string::npos) return false;
    if (json.find("\"asn\":null") == std::string::npos) return false;
    if (json.find("\"slow\":1") == std::string::npos) return false;
    return true;
}

bool test_run_interrupt_in_summary_mode() {
    ScriptedProber prober;
    prober.delay = std::chrono::milliseconds(100);
    prober.script["h"] = { reply(5) };

    std::thread interrupter([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        std::raise(SIGINT);
    });

    std::ostringstream out, err;
    const auto t0 = std::chrono::steady_clock::now();
    int rc = run_multiping(summary_run({ "h" }, 10), prober, out, err);
    const auto took = std::chrono::steady_clock::now() - t0;
    interrupter.join();
    std::signal(SIGINT, SIG_DFL);

    if (rc != 0) return false;
    if (took >= std::chrono::milliseconds(800)) return false;
    if (prober.calls("h") >= 10) return false;
    if (err.str().find("Interrupted") == std::string::npos) return false;
    if (out.str().find("SUMMARY") == std::string::npos) return false;
    return true;
}

// ============================================================================
// Live dashboard
// ============================================================================
static const char* const kClear = "\x1b[2J\x1b[H";

static RunEnvironment live_env(int input_fd = -1) {
    RunEnvironment env;
    env.live = true;
    env.input_fd = input_fd;
    env.window_size = [] { return TerminalSize{ 80, 24 }; };
    return env;
}

bool test_live_frame_per_observation() {
    ScriptedProber prober;
    prober.script["h"] = { reply(5) };
    CliOptions opt = summary_run({ "h" }, 3);
    opt.summary_only = false;

    std::ostringstream out, err;
    if (run_multiping(opt, prober, out, err, live_env()) != 0) return false;

    // One before the first observation, one per observation, one final
    if (count_of(out.str(), kClear) != 5) return false;
    if (out.str().find("mping - 1 host(s), timeout=100ms, count=3") == std::string::npos) return false;
    if (out.str().find("Pinging") != std::string::npos) return false;
    if (out.str().find("3/3 replies") == std::string::npos) return false;

    // --summary wins over a live environment
    std::ostringstream quiet;
    if (run_multiping(summary_run({ "h" }, 3), prober, quiet, err, live_env()) != 0) return false;
    if (count_of(quiet.str(), kClear) != 0) return false;
    return true;
}

bool test_live_quit_key_stops_frames() {
    int fds[2];
    if (::pipe(fds) != 0) return false;
    const bool wrote = ::write(fds[1], "q", 1) == 1;

    ScriptedProber prober;
    prober.delay = std::chrono::milliseconds(30);
    prober.script["h"] = { reply(5) };
    CliOptions opt = summary_run({ "h" }, 5);
    opt.summary_only = false;

    std::ostringstream out, err;
    int rc = run_multiping(opt, prober, out, err, live_env(fds[0]));
    ::close(fds[0]);
    ::close(fds[1]);

    if (!wrote || rc != 0) return false;
    // The key is read right after the first observation
    const std::size_t frames = count_of(out.str(), kClear);
    if (frames < 1 || frames > 2) return false;
    if (prober.calls("h") != 5) return false;
    if (out.str().find("5/5 replies") == std::string::npos) return false;
    return true;
}

/**
 * Records whether the terminal behind `tty` is in canonical mode at
 * every attempt. The first attempt types 'q' on the other side.
 */
class TtyModeProber : public Prober {
public:
    TtyModeProber(int master, int tty) : master_(master), tty_(tty) {}

    PingProbeResult probe(const std::string&, int) override {
        termios t{};
        canonical.push_back(::tcgetattr(tty_, &t) == 0 && (t.c_lflag & ICANON) != 0);
        if (canonical.size() == 1)
            typed = ::write(master_, "q", 1) == 1;
        std::this_thread::sleep_for(std::chrono::milliseconds(40));
        return reply(5);
    }

    std::vector<bool> canonical;
    bool typed{false};

private:
    int master_;
    int tty_;
};

bool test_live_quit_key_restores_terminal() {
    int master = ::posix_openpt(O_RDWR | O_NOCTTY);
    if (master < 0) {
        std::cout << "(no pseudo-terminal, skipped) ";
        return true;
    }
    if (::grantpt(master) != 0 || ::unlockpt(master) != 0) {
        ::close(master);
        return false;
    }
    int tty = ::open(::ptsname(master), O_RDWR | O_NOCTTY);
    if (tty < 0) {
        ::close(master);
        return false;
    }

    TtyModeProber prober(master, tty);
    CliOptions opt = summary_run({ "h" }, 5);
    opt.summary_only = false;

    std::ostringstream out, err;
    int rc = run_multiping(opt, prober, out, err, live_env(tty));

    termios after{};
    const bool restored = ::tcgetattr(tty, &after) == 0 && (after.c_lflag & ICANON) != 0;
    ::close(tty);
    ::close(master);

    if (rc != 0 || !prober.typed || !restored) return false;
    if (prober.canonical.size() != 5) return false;
    // Raw while the dashboard is up, canonical again once 'q' is handled
    if (prober.canonical.front()) return false;
    if (!prober.canonical.back()) return false;
    return true;
}

// ============================================================================
// ASN lookups during a run
// ============================================================================
struct LookupLog {
    std::mutex mtx;
    std::map<std::string, int> calls;
    int active{0};
    int max_active{0};

    int count(const std::string& ip) {
        std::lock_guard<std::mutex> lk(mtx);
        return calls[ip];
    }
};

bool test_run_asn_one_lookup_per_ip() {
    auto log = std::make_shared<LookupLog>();
    RunEnvironment env;
    env.asn_lookup = [log](const std::string& ip) -> std::optional<std::string> {
        std::lock_guard<std::mutex> lk(log->mtx);
        log->calls[ip]++;
        if (ip == "192.0.2.1") return std::string("AS64500");
        return std::nullopt;
    };

    ScriptedProber prober;
    prober.delay = std::chrono::milliseconds(50);
    prober.script["192.0.2.1"] = { reply(5) };
    prober.script["192.0.2.2"] = { reply(5) };

    TempFile f("");
    CliOptions opt = summary_run({ "192.0.2.1", "192.0.2.1", "192.0.2.2" }, 3);
    opt.asn = true;
    opt.asn_failure_ttl_s = 3600;
    opt.export_path = f.path;
    opt.export_format = ExportFormat::JSON;

    std::ostringstream out, err;
    if (run_multiping(opt, prober, out, err, env) != 0) return false;

    if (log->count("192.0.2.1") != 1) return false;
    if (log->count("192.0.2.2") != 1) return false;
    if (count_of(out.str(), "192.0.2.1 AS64500") != 2) return false;
    if (out.str().find("192.0.2.2 AS") != std::string::npos) return false;

    const std::string json = slurp(f.path);
    if (count_of(json, "\"asn\":\"AS64500\"") != 2) return false;
    if (count_of(json, "\"asn\":null") != 1) return false;
    return true;
}

bool test_run_asn_failure_requeued_after_ttl() {
    auto log = std::make_shared<LookupLog>();
    RunEnvironment env;
    env.asn_lookup = [log](const std::string& ip) -> std::optional<std::string> {
        {
            std::lock_guard<std::mutex> lk(log->mtx);
            log->calls[ip]++;
            log->max_active = std::max(log->max_active, ++log->active);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::lock_guard<std::mutex> lk(log->mtx);
        --log->active;
        return std::nullopt;
    };

    ScriptedProber prober;
    prober.delay = std::chrono::milliseconds(50);
    prober.script["192.0.2.7"] = { reply(5) };

    CliOptions opt = summary_run({ "192.0.2.7" }, 6);
    opt.asn = true;
    opt.asn_failure_ttl_s = 0;
    opt.asn_workers = 3;

    std::ostringstream out, err;
    if (run_multiping(opt, prober, out, err, env) != 0) return false;

    // Expired failures are retried, one lookup at a time per IP
    if (log->count("192.0.2.7") < 2) return false;
    if (log->max_active != 1) return false;
    if (out.str().find("192.0.2.7 AS") != std::string::npos) return false;
    return true;
}

int main() {
    std::cout << "Running CLI tests...\n";

    run_test("Parse defaults", test_parse_defaults);
    run_test("Parse short flags", test_parse_flags);
    run_test("Parse long flags", test_parse_long_forms);
    run_test("Parse malformed number", test_parse_malformed_number);
    run_test("Timeout range checked", test_parse_timeout_range);
    run_test("Value flag without value", test_parse_missing_value);
    run_test("Missing value stops the run", test_run_reports_missing_value);
    run_test("Host file comments and blanks", test_host_file_skips_comments_and_blanks);
    run_test("Host file missing", test_host_file_missing);
    run_test("Positional hosts before file hosts", test_collect_hosts_order);
    run_test("RTT summary", test_rtt_summary);
    run_test("Reply percentage", test_reply_percentage);
    run_test("CSV export", test_export_csv);
    run_test("Three hosts all reply", test_run_three_hosts_all_reply);
    run_test("Partial and failed hosts", test_run_partial_and_failed_hosts);
    run_test("Nothing replies", test_run_nothing_replies);
    run_test("Zero count rejected", test_run_rejects_zero_count);
    run_test("Empty host list rejected", test_run_rejects_empty_host_list);
    run_test("Missing file with positional hosts", test_run_missing_file_with_positional_hosts);
    run_test("Verbose summary and export", test_run_verbose_and_export);
    run_test("Interrupt ends a summary run", test_run_interrupt_in_summary_mode);
    run_test("Live frame per observation", test_live_frame_per_observation);
    run_test("Quit key stops frames", test_live_quit_key_stops_frames);
    run_test("Quit key restores terminal", test_live_quit_key_restores_terminal);
    run_test("ASN looked up once per IP", test_run_asn_one_lookup_per_ip);
    run_test("ASN failure retried after TTL", test_run_asn_failure_requeued_after_ttl);

    return finish_tests("CLI");
}
