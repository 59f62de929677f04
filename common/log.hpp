#pragma once

#include <ostream>

// Leveled logging on top of plain iostream lines.
// Usage: log::warn() << "gatt: timeout after " << ms << "ms";
// The line is terminated when the statement ends; nothing is written
// when the level is disabled.

namespace btbatt::log {

enum class Level {
    Off = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4,
};

void set_level(Level level);
Level level();

inline bool enabled(Level l) {
    return l != Level::Off && static_cast<int>(l) <= static_cast<int>(level());
}

// Output stream for log lines, std::cerr unless redirected
void set_sink(std::ostream* sink);
std::ostream& sink();

const char* prefix(Level l);

// One log line, written to sink() with its prefix
class Line {
public:
    explicit Line(Level l) : out_(enabled(l) ? &sink() : nullptr) {
        if (out_) *out_ << prefix(l);
    }

    ~Line() {
        if (out_) *out_ << std::endl;
    }

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <typename T>
    Line& operator<<(const T& value) {
        if (out_) *out_ << value;
        return *this;
    }

private:
    std::ostream* out_;
};

inline Line error() { return Line(Level::Error); }
inline Line warn() { return Line(Level::Warn); }
inline Line info() { return Line(Level::Info); }
inline Line debug() { return Line(Level::Debug); }

} // namespace btbatt::log
