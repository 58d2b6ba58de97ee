// ============================================================================
// log.cpp — implementation for meshlink/log.hpp
// ============================================================================

#include "meshlink/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace meshlink {
namespace log {

static std::atomic<int> g_level{static_cast<int>(Level::Warn)};
static std::mutex       g_out_mu;

static const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Error: return "error";
        case Level::Warn:  return "warn";
        case Level::Info:  return "info";
        case Level::Debug: return "debug";
    }
    return "info";
}

void set_level(Level lvl) { g_level.store(static_cast<int>(lvl)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool enabled(Level lvl) { return static_cast<int>(lvl) <= g_level.load(); }

void write(Level lvl, const std::string& line) {
    if (!enabled(lvl)) return;
    std::lock_guard<std::mutex> lk(g_out_mu);
    std::cerr << line << "\n";
}

Line::Line(Level lvl, const char* what)
: lvl_(lvl), on_(enabled(lvl)) {
    if (on_) os_ << "level=" << level_name(lvl) << " what=" << what;
}

Line::~Line() {
    if (on_) write(lvl_, os_.str());
}

} // namespace log
} // namespace meshlink
