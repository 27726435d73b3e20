/**
 * Live dashboard state and layout.
 *
 * One row per host: the label column, a " | " separator and the
 * outcome timeline, newest symbol at the right edge. The whole frame
 * is assembled in memory and written with a single stream insert.
 */

#include "mping/render.hpp"
#include "terminal.hpp"

#include <algorithm>
#include <sstream>

namespace mping {

Layout compute_layout(const std::vector<std::string>& labels,
                      int terminal_width,
                      int terminal_height,
                      int header_lines)
{
    int longest = 0;
    for (const auto& l : labels)
        longest = std::max(longest, static_cast<int>(l.size()));

    Layout lay;
    lay.label_width = std::min(longest, std::max(10, terminal_width / 3));
    lay.timeline_width = std::max(1, terminal_width - lay.label_width - 3);
    lay.visible_host_count = std::max(1, terminal_height - header_lines);
    return lay;
}


// ============================================================================
// HostRenderBuffer
// ============================================================================
void HostRenderBuffer::push(const ProbeObservation& obs) {
    timeline.push(status_symbol(obs.status));
    switch (obs.status) {
        case ProbeStatus::Success: success_seq.push(obs.sequence); break;
        case ProbeStatus::Slow:    slow_seq.push(obs.sequence);    break;
        case ProbeStatus::Fail:    fail_seq.push(obs.sequence);    break;
    }
}

void HostRenderBuffer::resize(std::size_t capacity) {
    timeline.resize(capacity);
    success_seq.resize(capacity);
    slow_seq.resize(capacity);
    fail_seq.resize(capacity);
}

const RingBuffer<int>& HostRenderBuffer::sequences(ProbeStatus s) const {
    switch (s) {
        case ProbeStatus::Success: return success_seq;
        case ProbeStatus::Slow:    return slow_seq;
        case ProbeStatus::Fail:    return fail_seq;
    }
    return fail_seq;
}


// ============================================================================
// RenderState
// ============================================================================
RenderState::RenderState(const std::vector<std::string>& hosts, int timeline_width)
    : hosts_(hosts),
      asn_(hosts.size()),
      buffers_(hosts.size(),
               HostRenderBuffer(static_cast<std::size_t>(std::max(1, timeline_width)))),
      stats_(hosts.size()) {}

void RenderState::apply(const ProbeObservation& obs) {
    if (obs.host_index >= hosts_.size())
        return;
    buffers_[obs.host_index].push(obs);
    stats_[obs.host_index].record(obs);
}

void RenderState::resize_buffers(int timeline_width) {
    const auto cap = static_cast<std::size_t>(std::max(1, timeline_width));
    for (auto& b : buffers_) {
        if (b.capacity() != cap)
            b.resize(cap);
    }
}

void RenderState::set_asn(std::size_t host_index, const std::optional<std::string>& asn) {
    if (host_index < asn_.size())
        asn_[host_index] = asn;
}

void RenderState::scroll_by(int delta, int visible_host_count) {
    const int max_offset = std::max(0, static_cast<int>(hosts_.size()) - visible_host_count);
    offset_ = std::clamp(offset_ + delta, 0, max_offset);
}

std::string RenderState::label(std::size_t host_index) const {
    if (host_index >= hosts_.size())
        return {};
    if (asn_[host_index])
        return hosts_[host_index] + " " + *asn_[host_index];
    return hosts_[host_index];
}

std::vector<std::string> RenderState::labels() const {
    std::vector<std::string> out;
    out.reserve(hosts_.size());
    for (std::size_t i = 0; i < hosts_.size(); ++i)
        out.push_back(label(i));
    return out;
}

void RenderState::render(std::ostream& out,
                         const TerminalSize& term,
                         const RenderHeader& header,
                         int reserved_lines)
{
    const Layout lay = compute_layout(labels(), term.width, term.height, reserved_lines);
    resize_buffers(lay.timeline_width);

    const int n = static_cast<int>(hosts_.size());
    offset_ = std::clamp(offset_, 0, std::max(0, n - lay.visible_host_count));

    std::ostringstream frame;
    frame << term::clear_screen();

    frame << "mping - " << n << " host(s), timeout=" << header.timeout_ms
          << "ms, count=" << header.count
          << ", slow>=" << header.slow_threshold_ms << "ms\n";
    frame << "legend: . ok  ! slow  x fail   (up/down: scroll, q: stop display)\n";

    const int end = std::min(n, offset_ + lay.visible_host_count);
    const auto lw = static_cast<std::size_t>(lay.label_width);
    const auto tw = static_cast<std::size_t>(lay.timeline_width);

    for (int i = offset_; i < end; ++i) {
        std::string name = label(static_cast<std::size_t>(i));
        if (name.size() > lw) name.resize(lw);
        name.append(lw - name.size(), ' ');

        const auto syms = buffers_[static_cast<std::size_t>(i)].timeline.values();
        std::string line(syms.begin(), syms.end());
        if (line.size() > tw) line.erase(0, line.size() - tw);

        frame << name << " | " << std::string(tw - line.size(), ' ') << line << "\n";
    }

    if (end < n)
        frame << "(" << (n - end) << " more not shown)\n";

    out << frame.str();
    out.flush();
}

} // namespace mping
