/**
 * Keyboard input for the dashboard.
 *
 * Arrow keys arrive as ESC followed by '[' or 'O' and a letter. Over
 * SSH and similar transports those bytes may be split across reads,
 * so after an ESC the reader waits a little for more bytes instead of
 * reporting a bare ESC straight away.
 */

#include "mping/keys.hpp"

#include <algorithm>
#include <cerrno>

#include <sys/select.h>
#include <sys/time.h>
#include <unistd.h>

namespace mping {

using std::chrono::milliseconds;

static std::optional<KeyEvent::Kind> arrow_for(char terminator) {
    switch (terminator) {
        case 'A': return KeyEvent::Kind::ArrowUp;
        case 'B': return KeyEvent::Kind::ArrowDown;
        case 'C': return KeyEvent::Kind::ArrowRight;
        case 'D': return KeyEvent::Kind::ArrowLeft;
        default:  return std::nullopt;
    }
}

static bool is_introducer(char c) {
    return c == '[' || c == 'O';
}

std::optional<KeyEvent> parse_escape_sequence(const std::string& seq) {
    if (seq.empty())
        return std::nullopt;

    if (seq.size() == 2 && is_introducer(seq[0])) {
        if (auto k = arrow_for(seq[1]))
            return KeyEvent::arrow(*k);
        return std::nullopt;
    }

    if (is_introducer(seq.front())) {
        if (auto k = arrow_for(seq.back()))
            return KeyEvent::arrow(*k);
    }
    return std::nullopt;
}


// ============================================================================
// Collection state machine
// ============================================================================
static EscapeDecode finish(const std::string& seq) {
    EscapeDecode d;
    d.complete = true;
    auto k = parse_escape_sequence(seq);
    d.key = k ? *k : KeyEvent::character(kEscape);
    return d;
}

EscapeDecode decode_escape(const std::vector<TimedByte>& history, milliseconds elapsed) {
    std::string seq;
    milliseconds last{0};

    for (const auto& b : history) {
        if (b.at >= kEscapeHardCap || b.at - last > kInterByteTimeout)
            return finish(seq);

        seq.push_back(b.byte);
        last = b.at;

        if (seq.size() >= 2 && is_introducer(seq.front()) && arrow_for(seq.back()))
            return finish(seq);
    }

    if (elapsed >= kEscapeHardCap || elapsed - last >= kInterByteTimeout)
        return finish(seq);

    EscapeDecode d;
    d.wait = std::min(kInterByteTimeout - (elapsed - last), kEscapeHardCap - elapsed);
    return d;
}


// ============================================================================
// KeyReader
// ============================================================================
bool KeyReader::wait_readable(milliseconds timeout) const {
    for (;;) {
        fd_set rfds;
        FD_ZERO(&rfds);
        FD_SET(fd_, &rfds);

        timeval tv{};
        tv.tv_sec  = static_cast<long>(timeout.count() / 1000);
        tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

        int rc = ::select(fd_ + 1, &rfds, nullptr, nullptr, &tv);
        if (rc < 0 && errno == EINTR)
            continue;
        return rc > 0 && FD_ISSET(fd_, &rfds);
    }
}

bool KeyReader::read_byte(char& c) const {
    for (;;) {
        ssize_t n = ::read(fd_, &c, 1);
        if (n < 0 && errno == EINTR)
            continue;
        return n == 1;
    }
}

std::optional<KeyEvent> KeyReader::read_key() {
    if (!wait_readable(milliseconds{0}))
        return std::nullopt;

    char c = 0;
    if (!read_byte(c))
        return std::nullopt;

    if (c != kEscape)
        return KeyEvent::character(c);

    using Clock = std::chrono::steady_clock;
    const auto esc_time = Clock::now();
    std::vector<TimedByte> history;

    auto since_esc = [&]() {
        return std::chrono::duration_cast<milliseconds>(Clock::now() - esc_time);
    };

    for (;;) {
        EscapeDecode d = decode_escape(history, since_esc());
        if (d.complete)
            return d.key;

        if (!wait_readable(std::max(d.wait, milliseconds{1})))
            continue;          // decode_escape() sees the elapsed timeout

        char next = 0;
        if (!read_byte(next))
            return KeyEvent::character(kEscape);

        // select() reported the byte inside the wait window; clamp so
        // wakeup latency cannot push it past either timeout.
        const milliseconds prev = history.empty() ? milliseconds{0} : history.back().at;
        milliseconds at = std::min(since_esc(), prev + kInterByteTimeout);
        at = std::min(at, kEscapeHardCap - milliseconds{1});
        history.push_back(TimedByte{ next, at });
    }
}


// ============================================================================
// RawTerminal
// ============================================================================
RawTerminal::RawTerminal(int fd) : fd_(fd) {
    if (!::isatty(fd_) || ::tcgetattr(fd_, &saved_) != 0)
        return;

    termios raw = saved_;
    raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    active_ = (::tcsetattr(fd_, TCSANOW, &raw) == 0);
}

RawTerminal::~RawTerminal() {
    if (active_)
        ::tcsetattr(fd_, TCSANOW, &saved_);
}

} // namespace mping
