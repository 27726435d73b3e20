#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <termios.h>

#include "mping/visibility.hpp"

namespace mping {

/**
 * A decoded keystroke: an arrow key or a literal character.
 */
struct KeyEvent {
    enum class Kind { Char, ArrowUp, ArrowDown, ArrowLeft, ArrowRight };

    Kind kind{Kind::Char};
    char ch{0};                    // Valid for Kind::Char

    static KeyEvent character(char c) { return KeyEvent{ Kind::Char, c }; }
    static KeyEvent arrow(Kind k) { return KeyEvent{ k, 0 }; }

    bool is_char(char c) const { return kind == Kind::Char && ch == c; }
    bool operator==(const KeyEvent& o) const { return kind == o.kind && ch == o.ch; }
    bool operator!=(const KeyEvent& o) const { return !(*this == o); }
};

constexpr char kEscape = '\x1b';

// Max gap between two bytes of one escape sequence.
constexpr std::chrono::milliseconds kInterByteTimeout{50};
// Max total time spent collecting after ESC.
constexpr std::chrono::milliseconds kEscapeHardCap{500};

/**
 * Map the bytes that followed ESC to an arrow key.
 *
 * "[A"/"OA" up, "[B"/"OB" down, "[C"/"OC" right, "[D"/"OD" left;
 * longer sequences starting with '[' or 'O' map by their final byte
 * (e.g. "[1;5A" -> up). Anything else is std::nullopt.
 */
MPING_API std::optional<KeyEvent> parse_escape_sequence(const std::string& seq);

/**
 * A byte received after ESC and when it arrived, relative to the ESC.
 */
struct TimedByte {
    char byte;
    std::chrono::milliseconds at;
};

struct EscapeDecode {
    bool complete{false};
    std::optional<KeyEvent> key;       // Set when complete
    std::chrono::milliseconds wait{0}; // Next wait bound when still collecting
};

/**
 * Escape-sequence state machine as a pure function.
 *
 * history holds the bytes seen after ESC in arrival order, elapsed is
 * the time since ESC. A byte arriving more than kInterByteTimeout
 * after the previous one (or the ESC), or at/after kEscapeHardCap,
 * ends the sequence before it. Collection also ends at once when the
 * sequence starts with '[' or 'O' and its last byte is A-D. A
 * complete but unrecognised sequence decodes to the literal ESC.
 */
MPING_API EscapeDecode decode_escape(const std::vector<TimedByte>& history,
                                     std::chrono::milliseconds elapsed);

/**
 * Non-blocking key reader over a file descriptor (stdin by default).
 *
 * read_key() returns std::nullopt at once when no byte is ready. After
 * an ESC it keeps reading for at most kEscapeHardCap, following
 * decode_escape(), so arrow keys split over several reads still
 * decode as one event.
 */
class MPING_API KeyReader {
public:
    explicit KeyReader(int fd = 0) : fd_(fd) {}

    std::optional<KeyEvent> read_key();

private:
    bool wait_readable(std::chrono::milliseconds timeout) const;
    bool read_byte(char& c) const;

    int fd_;
};

/**
 * Puts a TTY into non-canonical, no-echo mode for the lifetime of the
 * object and restores the saved settings afterwards. A no-op when fd
 * is not a terminal.
 */
class MPING_API RawTerminal {
public:
    explicit RawTerminal(int fd = 0);
    ~RawTerminal();

    RawTerminal(const RawTerminal&) = delete;
    RawTerminal& operator=(const RawTerminal&) = delete;

    bool active() const { return active_; }

private:
    int fd_;
    bool active_{false};
    termios saved_{};
};

} // namespace mping
