#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace movehub::system {

/**
 * @brief Cooperative one-shot timers driven from the owner's loop.
 *
 * Nothing runs on its own: service() executes every task whose due time has
 * been reached, in due-time order. Tokens are never reused, so cancelling a
 * token that already fired (or was cancelled) is a harmless no-op.
 *
 * Usage example:
 * @code
 * TaskScheduler scheduler;
 * auto token = scheduler.scheduleAt(millis() + 2000, [](uint64_t nowMs) {
 *     reconnect(nowMs);
 * });
 *
 * scheduler.service(millis());
 * scheduler.cancel(token);
 * @endcode
 */
class TaskScheduler {
public:
    using Token = uint32_t;
    using Task = std::function<void(uint64_t nowMs)>;

    static constexpr Token kInvalidToken = 0;

    Token scheduleAt(uint64_t dueMs, Task task);
    Token scheduleAfter(uint64_t nowMs, uint64_t delayMs, Task task) {
        return scheduleAt(nowMs + delayMs, std::move(task));
    }

    /**
     * @brief Drop a pending task.
     * @return true when the token referred to a task that had not run yet.
     */
    bool cancel(Token token);
    void cancelAll();

    /**
     * @brief Run every task due at or before @p nowMs.
     *
     * Tasks may schedule or cancel other tasks while running; a task scheduled
     * with a due time not after @p nowMs runs within the same call.
     * @return number of tasks executed.
     */
    size_t service(uint64_t nowMs);

    [[nodiscard]] bool pending(Token token) const;
    [[nodiscard]] size_t size() const { return entries_.size(); }

    /**
     * @brief Due time of the earliest pending task, or UINT64_MAX when idle.
     */
    [[nodiscard]] uint64_t nextDueMs() const;

private:
    struct Entry {
        Token token;
        uint64_t dueMs;
        Task task;
    };

    std::vector<Entry> entries_;
    Token nextToken_ = 1;
};

}  // namespace movehub::system
