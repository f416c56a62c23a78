#include "system/Log.h"

#include "Config.h"

#include <cstdarg>
#include <cstdio>
#include <deque>
#include <mutex>

#ifdef ARDUINO
#include <Arduino.h>
#endif

namespace movehub::system {

namespace {

constexpr size_t kMaxLineBytes = 192;

std::mutex g_logMutex;
std::deque<std::string> g_history;
size_t g_historyLimit = LOG_HISTORY_SIZE;

void trimLocked() {
    while (g_history.size() > g_historyLimit) {
        g_history.pop_front();
    }
}

}  // namespace

void logf(const char* tag, const char* format, ...) {
    char message[kMaxLineBytes] = {0};
    va_list args;
    va_start(args, format);
    std::vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    char line[kMaxLineBytes + 16] = {0};
    const char* safeTag = (tag && tag[0] != '\0') ? tag : "LOG";
    std::snprintf(line, sizeof(line), "[%s] %s", safeTag, message);

#ifdef ARDUINO
    Serial.println(line);
#endif

    std::lock_guard<std::mutex> lock(g_logMutex);
    g_history.emplace_back(line);
    trimLocked();
}

std::vector<std::string> logHistory() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return std::vector<std::string>(g_history.begin(), g_history.end());
}

bool logContains(const std::string& needle) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    for (const auto& line : g_history) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void clearLogHistory() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_history.clear();
}

void setLogHistoryLimit(size_t lines) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_historyLimit = lines;
    trimLocked();
}

}  // namespace movehub::system
