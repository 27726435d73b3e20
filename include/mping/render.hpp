#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "mping/observation.hpp"
#include "mping/ring_buffer.hpp"
#include "mping/visibility.hpp"

namespace mping {

/**
 * Dashboard geometry derived from the terminal size.
 */
struct Layout {
    int label_width{0};
    int timeline_width{1};
    int visible_host_count{1};
};

struct TerminalSize {
    int width{80};
    int height{24};
};

/**
 * label_width        = min(longest label, max(10, width / 3))
 * timeline_width     = max(1, width - label_width - 3)
 * visible_host_count = max(1, height - header_lines)
 */
MPING_API Layout compute_layout(const std::vector<std::string>& labels,
                                int terminal_width,
                                int terminal_height,
                                int header_lines);

/**
 * Recent outcome history of one host: the symbol timeline plus, per
 * status, the attempt numbers that produced it. All four rings share
 * one capacity.
 */
struct HostRenderBuffer {
    RingBuffer<char> timeline;
    RingBuffer<int>  success_seq;
    RingBuffer<int>  slow_seq;
    RingBuffer<int>  fail_seq;

    explicit HostRenderBuffer(std::size_t capacity = 1)
        : timeline(capacity), success_seq(capacity),
          slow_seq(capacity), fail_seq(capacity) {}

    void push(const ProbeObservation& obs);
    void resize(std::size_t capacity);
    std::size_t capacity() const { return timeline.capacity(); }

    const RingBuffer<int>& sequences(ProbeStatus s) const;
};

/**
 * Static text shown in the dashboard header.
 */
struct RenderHeader {
    int timeout_ms{1000};
    int count{4};
    long slow_threshold_ms{500};
};

/**
 * Everything the live dashboard shows: per-host buffers and stats,
 * labels (host plus resolved ASN) and the scroll position.
 *
 * Owned and mutated by the main loop only.
 */
class MPING_API RenderState {
public:
    static constexpr int kHeaderLines = 2;

    /**
     * timeline_width is the initial ring capacity. Observations applied
     * before the first render are kept up to that many per host.
     */
    RenderState(const std::vector<std::string>& hosts, int timeline_width);

    void apply(const ProbeObservation& obs);

    /**
     * Bring every host's rings to timeline_width, keeping the most
     * recent entries. Must run before each render.
     */
    void resize_buffers(int timeline_width);

    /**
     * Clear the screen and draw the header and the visible window of
     * host rows. reserved_lines is the number of terminal rows not
     * available for host rows (header plus overflow notice).
     */
    void render(std::ostream& out,
                const TerminalSize& term,
                const RenderHeader& header,
                int reserved_lines = kHeaderLines + 1);

    void set_asn(std::size_t host_index, const std::optional<std::string>& asn);
    void scroll_by(int delta, int visible_host_count);

    std::string label(std::size_t host_index) const;
    std::vector<std::string> labels() const;

    std::size_t host_count() const { return hosts_.size(); }
    const std::string& host(std::size_t i) const { return hosts_[i]; }
    const HostStats& stats(std::size_t i) const { return stats_[i]; }
    const std::vector<HostStats>& all_stats() const { return stats_; }
    const std::optional<std::string>& asn(std::size_t i) const { return asn_[i]; }
    const HostRenderBuffer& buffer(std::size_t i) const { return buffers_[i]; }
    int scroll_offset() const { return offset_; }

private:
    std::vector<std::string> hosts_;
    std::vector<std::optional<std::string>> asn_;
    std::vector<HostRenderBuffer> buffers_;
    std::vector<HostStats> stats_;
    int offset_{0};
};

} // namespace mping
