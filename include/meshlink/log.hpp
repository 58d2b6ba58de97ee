#pragma once
/**
 * @file log.hpp
 * @brief Leveled diagnostic lines on stderr, in the same key=value shape the CLI prints.
 *
 * @details
 * Lines look like:
 *   level=warn what=close_failed target=serial:/dev/ttyACM0 reason=...
 *
 * One process-wide threshold, one mutex. Poll workers and discovery probes
 * log from their own threads, so each line is written under the lock and
 * never interleaves with another.
 *
 * Nothing here writes to stdout; stdout belongs to command results.
 */

#include <sstream>
#include <string>

namespace meshlink {
namespace log {

enum class Level { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void  set_level(Level lvl);
Level level();
bool  enabled(Level lvl);

/// Write one already-formatted line if @p lvl passes the threshold.
void write(Level lvl, const std::string& line);

/**
 * @brief Line builder: collects key=value pairs and emits on destruction.
 *
 * @code
 *   log::Line(log::Level::Warn, "close_failed").kv("target", id).kv("reason", e.what());
 * @endcode
 */
class Line {
public:
    Line(Level lvl, const char* what);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <typename T>
    Line& kv(const char* key, const T& value) {
        if (on_) os_ << ' ' << key << '=' << value;
        return *this;
    }

private:
    Level              lvl_;
    bool               on_;
    std::ostringstream os_;
};

inline Line error(const char* what) { return Line(Level::Error, what); }
inline Line warn (const char* what) { return Line(Level::Warn,  what); }
inline Line info (const char* what) { return Line(Level::Info,  what); }
inline Line debug(const char* what) { return Line(Level::Debug, what); }

} // namespace log
} // namespace meshlink
