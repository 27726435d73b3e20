#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mping {

/**
 * Classification of one probe attempt.
 */
enum class ProbeStatus {
    Success,
    Slow,
    Fail
};

/**
 * Timeline glyph for a status: '.' success, '!' slow, 'x' fail.
 */
inline char status_symbol(ProbeStatus s) {
    switch (s) {
        case ProbeStatus::Success: return '.';
        case ProbeStatus::Slow:    return '!';
        case ProbeStatus::Fail:    return 'x';
    }
    return '?';
}

/**
 * One classified probe attempt. Immutable once emitted by a worker.
 */
struct ProbeObservation {
    std::size_t host_index{0};     // Position of the host in the run's host list
    std::string host;
    int sequence{0};               // 1-based attempt index
    ProbeStatus status{ProbeStatus::Fail};
    std::optional<long> rtt_ms;    // Absent for Fail
    std::string error;             // Prober error detail (Fail only)
};

/**
 * Payload of the probe result channel: either an observation or the
 * per-host completion marker.
 */
struct ProbeEvent {
    enum class Kind { Observation, Done };

    Kind kind{Kind::Observation};
    ProbeObservation observation;  // For Done only host/host_index are set

    static ProbeEvent done(std::size_t host_index, const std::string& host) {
        ProbeEvent ev;
        ev.kind = Kind::Done;
        ev.observation.host_index = host_index;
        ev.observation.host = host;
        return ev;
    }
};

/**
 * Running per-host counters for the end-of-run summary.
 * total == success + slow + fail after every record().
 */
struct HostStats {
    int success{0};
    int slow{0};
    int fail{0};
    int total{0};
    std::vector<long> rtts;        // Reply RTTs in temporal order
    std::string last_error;

    void record(const ProbeObservation& obs) {
        switch (obs.status) {
            case ProbeStatus::Success: ++success; break;
            case ProbeStatus::Slow:    ++slow;    break;
            case ProbeStatus::Fail:
                ++fail;
                if (!obs.error.empty()) last_error = obs.error;
                break;
        }
        ++total;
        if (obs.rtt_ms) rtts.push_back(*obs.rtt_ms);
    }

    int replies() const { return success + slow; }
};

} // namespace mping
