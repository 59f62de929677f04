#include "log.hpp"
#include <iostream>

namespace btbatt::log {

static Level g_level = Level::Off;
static std::ostream* g_sink = nullptr;

void set_level(Level level) {
    g_level = level;
}

Level level() {
    return g_level;
}

void set_sink(std::ostream* sink) {
    g_sink = sink;
}

std::ostream& sink() {
    return g_sink ? *g_sink : std::cerr;
}

const char* prefix(Level l) {
    switch (l) {
        case Level::Error: return "[error] ";
        case Level::Warn: return "[warn] ";
        case Level::Info: return "[info] ";
        case Level::Debug: return "[debug] ";
        case Level::Off: break;
    }
    return "";
}

} // namespace btbatt::log
