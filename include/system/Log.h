#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace movehub::system {

/**
 * @brief Emit one tagged log line.
 *
 * The line is formatted as "[TAG] message". Under ARDUINO it is written to
 * Serial; on every platform it is kept in a bounded history so a debug view
 * can show recent activity.
 *
 * @code
 * system::logf("CONN", "Reconnect attempt %u/%u", attempt, maxAttempts);
 * @endcode
 */
void logf(const char* tag, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

/**
 * @brief Copy of the retained log lines, oldest first.
 */
std::vector<std::string> logHistory();

/**
 * @brief True when any retained line contains @p needle.
 */
bool logContains(const std::string& needle);

void clearLogHistory();

/**
 * @brief Change how many lines are retained. Older lines are evicted first.
 */
void setLogHistoryLimit(size_t lines);

}  // namespace movehub::system
