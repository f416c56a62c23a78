#include "system/TaskScheduler.h"

#include <algorithm>
#include <limits>

namespace movehub::system {

TaskScheduler::Token TaskScheduler::scheduleAt(uint64_t dueMs, Task task) {
    if (!task) {
        return kInvalidToken;
    }
    const Token token = nextToken_++;
    if (nextToken_ == kInvalidToken) {
        nextToken_ = 1;
    }
    entries_.push_back({token, dueMs, std::move(task)});
    return token;
}

bool TaskScheduler::cancel(Token token) {
    if (token == kInvalidToken) {
        return false;
    }
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [token](const Entry& entry) { return entry.token == token; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

void TaskScheduler::cancelAll() {
    entries_.clear();
}

size_t TaskScheduler::service(uint64_t nowMs) {
    size_t executed = 0;
    for (;;) {
        // Entries are kept in scheduling order, so the first minimum is also
        // the earliest-scheduled among equal due times.
        auto due = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->dueMs <= nowMs && (due == entries_.end() || it->dueMs < due->dueMs)) {
                due = it;
            }
        }
        if (due == entries_.end()) {
            break;
        }
        Task task = std::move(due->task);
        entries_.erase(due);
        task(nowMs);
        ++executed;
    }
    return executed;
}

bool TaskScheduler::pending(Token token) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [token](const Entry& entry) { return entry.token == token; });
}

uint64_t TaskScheduler::nextDueMs() const {
    uint64_t next = std::numeric_limits<uint64_t>::max();
    for (const auto& entry : entries_) {
        next = std::min(next, entry.dueMs);
    }
    return next;
}

}  // namespace movehub::system
