#include "CommandQueue.h"

#include <utility>

#include "system/Log.h"

namespace movehub {

CommandQueue::CommandQueue(system::TaskScheduler& scheduler, uint32_t spacingMs, size_t capacity)
    : scheduler_(scheduler), spacingMs_(spacingMs), capacity_(capacity > 0 ? capacity : 1) {}

CommandQueue::~CommandQueue() {
    cancelTimer();
}

bool CommandQueue::enqueue(Command command, uint64_t nowMs) {
    if (pending_.size() >= capacity_) {
        ++stats_.dropped;
        system::logf("QUEUE", "Queue full (%u), dropping %s", static_cast<unsigned>(capacity_), command.label.c_str());
        return false;
    }
    pending_.push_back(std::move(command));
    pump(nowMs);
    return true;
}

void CommandQueue::attach(Link& link, uint64_t nowMs) {
    link_ = &link;
    inFlight_ = false;
    ++generation_;
    pump(nowMs);
}

void CommandQueue::detach() {
    link_ = nullptr;
    inFlight_ = false;
    ++generation_;
    cancelTimer();
}

void CommandQueue::clear() {
    pending_.clear();
    inFlight_ = false;
    ++generation_;
    cancelTimer();
}

void CommandQueue::pump(uint64_t nowMs) {
    if (link_ == nullptr || inFlight_ || pending_.empty()) {
        return;
    }

    const uint64_t dueMs = haveWritten_ ? lastWriteMs_ + spacingMs_ : nowMs;
    if (nowMs < dueMs) {
        if (!scheduler_.pending(timer_)) {
            timer_ = scheduler_.scheduleAt(dueMs, [this](uint64_t firedMs) {
                timer_ = system::TaskScheduler::kInvalidToken;
                pump(firedMs);
            });
        }
        return;
    }

    cancelTimer();
    Command command = std::move(pending_.front());
    pending_.pop_front();
    inFlight_ = true;
    haveWritten_ = true;
    lastWriteMs_ = nowMs;

    const uint32_t generation = generation_;
    std::weak_ptr<bool> alive = alive_;
    std::string label = command.label;
    link_->write(command.payload, [this, alive, generation, label](bool ok, const std::string& error) {
        if (alive.expired()) {
            return;
        }
        if (!ok) {
            system::logf("QUEUE", "Write failed for %s: %s", label.c_str(), error.c_str());
        }
        onWriteComplete(generation, ok, error);
    });
}

void CommandQueue::onWriteComplete(uint32_t generation, bool ok, const std::string& error) {
    (void)error;
    if (generation != generation_) {
        return;
    }
    inFlight_ = false;
    if (ok) {
        ++stats_.sent;
    } else {
        ++stats_.failed;
    }
    if (pending_.empty() || scheduler_.pending(timer_)) {
        return;
    }
    timer_ = scheduler_.scheduleAt(lastWriteMs_ + spacingMs_, [this](uint64_t firedMs) {
        timer_ = system::TaskScheduler::kInvalidToken;
        pump(firedMs);
    });
}

void CommandQueue::cancelTimer() {
    scheduler_.cancel(timer_);
    timer_ = system::TaskScheduler::kInvalidToken;
}

}  // namespace movehub
