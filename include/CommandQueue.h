#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>

#include "Commands.h"
#include "Config.h"
#include "Link.h"
#include "system/TaskScheduler.h"

namespace movehub {

struct CommandQueueStats {
    uint32_t sent = 0;
    uint32_t failed = 0;
    uint32_t dropped = 0;
};

/**
 * @brief FIFO of outbound commands written one at a time with a minimum
 * spacing between writes.
 *
 * Commands enqueued while no link is attached wait until attach(). A failed
 * write drops that command; the next one goes out after the usual spacing.
 * When the queue is full the newest command is rejected.
 *
 * Usage example:
 * @code
 * CommandQueue queue(scheduler);
 * queue.enqueue(systemInfoCommand(), millis());
 * queue.attach(link, millis());
 * // loop: scheduler.service(millis());
 * @endcode
 */
class CommandQueue {
public:
    CommandQueue(system::TaskScheduler& scheduler, uint32_t spacingMs = COMMAND_SPACING_MS,
                 size_t capacity = COMMAND_QUEUE_CAPACITY);
    ~CommandQueue();

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    /**
     * @return false when the queue is full and the command was rejected.
     */
    bool enqueue(Command command, uint64_t nowMs);

    void attach(Link& link, uint64_t nowMs);

    /**
     * @brief Stop dispatching. A write still in flight is forgotten; its
     * completion is ignored when it arrives.
     */
    void detach();

    // Drop every queued command and forget the in-flight one.
    void clear();

    /**
     * @brief Dispatch the head command if the link is idle and the spacing
     * has elapsed; otherwise arm a timer for when it will have.
     */
    void pump(uint64_t nowMs);

    size_t size() const { return pending_.size(); }
    bool empty() const { return pending_.empty(); }
    bool attached() const { return link_ != nullptr; }
    bool inFlight() const { return inFlight_; }
    const CommandQueueStats& stats() const { return stats_; }
    uint32_t spacingMs() const { return spacingMs_; }

private:
    void onWriteComplete(uint32_t generation, bool ok, const std::string& error);
    void cancelTimer();

    system::TaskScheduler& scheduler_;
    uint32_t spacingMs_;
    size_t capacity_;

    std::deque<Command> pending_;
    Link* link_ = nullptr;
    bool inFlight_ = false;
    bool haveWritten_ = false;
    uint64_t lastWriteMs_ = 0;
    uint32_t generation_ = 0;
    system::TaskScheduler::Token timer_ = system::TaskScheduler::kInvalidToken;
    CommandQueueStats stats_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace movehub
