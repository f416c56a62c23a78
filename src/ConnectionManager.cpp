#include "ConnectionManager.h"

#include <algorithm>
#include <utility>

#include "system/Log.h"

namespace movehub {

void ConnectionManager::Inbox::post(InboxItem item) {
    std::lock_guard<std::mutex> lock(mutex);
    if (items.size() >= capacity) {
        // Evict the oldest frame; drop notices are never evicted.
        auto oldest = std::find_if(items.begin(), items.end(),
                                   [](const InboxItem& queued) { return queued.type == InboxItem::Type::Frame; });
        if (oldest != items.end()) {
            items.erase(oldest);
            ++dropped;
        }
    }
    items.push_back(std::move(item));
}

std::deque<ConnectionManager::InboxItem> ConnectionManager::Inbox::takeAll() {
    std::lock_guard<std::mutex> lock(mutex);
    std::deque<InboxItem> taken;
    taken.swap(items);
    return taken;
}

void ConnectionManager::Inbox::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    items.clear();
}

ConnectionManager::ConnectionManager(const ConnectionConfig& config, LinkProvider& provider, CommandQueue& queue,
                                     system::TaskScheduler& scheduler, ConnectionCallbacks callbacks)
    : config_(config),
      provider_(provider),
      queue_(queue),
      scheduler_(scheduler),
      callbacks_(std::move(callbacks)),
      inbox_(std::make_shared<Inbox>()) {
    inbox_->capacity = config_.inboxCapacity > 0 ? config_.inboxCapacity : 1;
}

ConnectionManager::~ConnectionManager() {
    scheduler_.cancel(reconnectTimer_);
    scheduler_.cancel(graceTimer_);
    if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Reconnecting) {
        provider_.cancelOpen();
    }
    closeLink();
}

bool ConnectionManager::connect(uint64_t nowMs) {
    clockMs_ = nowMs;
    if (state_ != ConnectionState::Disconnected) {
        system::logf("CONN", "Connect ignored, already %s", connectionStateLabel(state_));
        return false;
    }

    scheduler_.cancel(graceTimer_);
    graceTimer_ = system::TaskScheduler::kInvalidToken;
    intentional_ = false;
    attempt_ = 0;
    lastError_.clear();
    system::logf("CONN", "Connecting to %s*", config_.target.namePrefix.c_str());
    setState(ConnectionState::Connecting);
    openLink();
    return true;
}

void ConnectionManager::disconnect(uint64_t nowMs) {
    clockMs_ = nowMs;
    if (state_ == ConnectionState::Disconnected) {
        return;
    }

    system::logf("CONN", "Disconnect requested");
    intentional_ = true;
    scheduler_.cancel(graceTimer_);
    graceTimer_ = scheduler_.scheduleAfter(nowMs, config_.disconnectGraceMs, [this](uint64_t) {
        graceTimer_ = system::TaskScheduler::kInvalidToken;
        intentional_ = false;
    });

    scheduler_.cancel(reconnectTimer_);
    reconnectTimer_ = system::TaskScheduler::kInvalidToken;
    if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Reconnecting) {
        provider_.cancelOpen();
    }
    closeLink();
    ++generation_;
    attempt_ = 0;
    setState(ConnectionState::Disconnected);
    resetSession();
}

size_t ConnectionManager::service(uint64_t nowMs) {
    clockMs_ = nowMs;
    size_t delivered = 0;
    for (auto& item : inbox_->takeAll()) {
        if (item.generation != generation_) {
            continue;
        }
        if (item.type == InboxItem::Type::Drop) {
            handleDrop(item.reason);
            continue;
        }
        if (!link_) {
            continue;
        }
        if (callbacks_.onFrame) {
            callbacks_.onFrame(item.bytes.data(), item.bytes.size(), nowMs);
        }
        ++delivered;
    }
    return delivered;
}

void ConnectionManager::resubscribe(uint64_t nowMs) {
    clockMs_ = nowMs;
    for (auto& command : subscriptionSet(config_.imuRateHz, config_.ecgRateHz)) {
        queue_.enqueue(std::move(command), nowMs);
    }
}

void ConnectionManager::setRates(uint32_t imuRateHz, uint32_t ecgRateHz) {
    config_.imuRateHz = imuRateHz;
    config_.ecgRateHz = ecgRateHz;
}

uint32_t ConnectionManager::droppedFrames() const {
    std::lock_guard<std::mutex> lock(inbox_->mutex);
    return inbox_->dropped;
}

void ConnectionManager::openLink() {
    const uint32_t generation = ++generation_;
    std::weak_ptr<Inbox> inbox = inbox_;
    std::weak_ptr<bool> alive = alive_;

    auto onDrop = [inbox, generation](const std::string& reason) {
        if (auto target = inbox.lock()) {
            InboxItem item;
            item.type = InboxItem::Type::Drop;
            item.generation = generation;
            item.reason = reason;
            target->post(std::move(item));
        }
    };
    auto onOpen = [this, alive, generation](std::unique_ptr<Link> link, const std::string& error) {
        if (alive.expired()) {
            if (link) {
                link->close();
            }
            return;
        }
        onOpened(generation, std::move(link), error);
    };
    provider_.open(config_.target, std::move(onDrop), std::move(onOpen));
}

void ConnectionManager::onOpened(uint32_t generation, std::unique_ptr<Link> link, const std::string& error) {
    const bool opening = state_ == ConnectionState::Connecting || state_ == ConnectionState::Reconnecting;
    if (generation != generation_ || !opening) {
        if (link) {
            link->close();
        }
        return;
    }
    if (!link) {
        onOpenFailed(error.empty() ? "Device not found" : error);
        return;
    }

    link_ = std::move(link);
    std::weak_ptr<Inbox> inbox = inbox_;
    std::weak_ptr<bool> alive = alive_;
    auto onFrame = [inbox, generation](const uint8_t* data, size_t length) {
        if (data == nullptr || length == 0) {
            return;
        }
        if (auto target = inbox.lock()) {
            InboxItem item;
            item.generation = generation;
            item.bytes.assign(data, data + length);
            target->post(std::move(item));
        }
    };
    link_->subscribe(std::move(onFrame), [this, alive, generation](bool ok, const std::string& subscribeError) {
        if (!alive.expired()) {
            onSubscribed(generation, ok, subscribeError);
        }
    });
}

void ConnectionManager::onSubscribed(uint32_t generation, bool ok, const std::string& error) {
    if (generation != generation_ || !link_) {
        return;
    }
    if (!ok) {
        closeLink();
        ++generation_;
        onOpenFailed("Notification subscribe failed: " + error);
        return;
    }

    deviceName_ = link_->name();
    if (deviceName_.empty()) {
        deviceName_ = MOVESENSE_DEFAULT_DEVICE_NAME;
    }
    const bool reconnected = state_ == ConnectionState::Reconnecting;
    attempt_ = 0;
    lastError_.clear();
    system::logf("CONN", "%s %s", reconnected ? "Reconnected to" : "Connected to", deviceName_.c_str());
    setState(ConnectionState::Connected);
    queue_.attach(*link_, clockMs_);
    resubscribe(clockMs_);
}

void ConnectionManager::onOpenFailed(const std::string& error) {
    lastError_ = error;
    system::logf("CONN", "Open failed: %s", error.c_str());

    if (state_ != ConnectionState::Reconnecting) {
        setState(ConnectionState::Disconnected);
        return;
    }
    if (attempt_ < config_.maxReconnectAttempts) {
        ++attempt_;
        notifyStatus();
        scheduleReconnect(config_.reconnectDelayMs);
        return;
    }

    lastError_ = "Reconnect failed after " + std::to_string(attempt_) + " attempts: " + error;
    system::logf("CONN", "Giving up after %u attempts", static_cast<unsigned>(attempt_));
    ++generation_;
    attempt_ = 0;
    setState(ConnectionState::Disconnected);
    resetSession();
}

void ConnectionManager::handleDrop(const std::string& reason) {
    if (intentional_) {
        system::logf("CONN", "Link closed (%s)", reason.c_str());
        return;
    }

    if (state_ == ConnectionState::Connected) {
        system::logf("CONN", "Link dropped: %s", reason.c_str());
        closeLink();
        ++generation_;
        attempt_ = 1;
        lastError_ = reason.empty() ? "Link lost" : reason;
        setState(ConnectionState::Reconnecting);
        scheduleReconnect(config_.firstReconnectDelayMs);
        return;
    }

    // Dropped while still opening: counts as a failed open.
    closeLink();
    ++generation_;
    onOpenFailed(reason.empty() ? "Link dropped during connect" : reason);
}

void ConnectionManager::scheduleReconnect(uint32_t delayMs) {
    scheduler_.cancel(reconnectTimer_);
    system::logf("CONN", "Reconnect attempt %u/%u in %u ms", static_cast<unsigned>(attempt_),
                 static_cast<unsigned>(config_.maxReconnectAttempts), static_cast<unsigned>(delayMs));
    reconnectTimer_ = scheduler_.scheduleAfter(clockMs_, delayMs, [this](uint64_t nowMs) {
        reconnectTimer_ = system::TaskScheduler::kInvalidToken;
        clockMs_ = nowMs;
        if (state_ == ConnectionState::Reconnecting) {
            openLink();
        }
    });
}

void ConnectionManager::closeLink() {
    queue_.detach();
    if (link_) {
        link_->close();
        link_.reset();
    }
}

void ConnectionManager::resetSession() {
    queue_.clear();
    inbox_->clear();
    if (callbacks_.onSessionReset) {
        callbacks_.onSessionReset(clockMs_);
    }
}

void ConnectionManager::setState(ConnectionState state) {
    state_ = state;
    notifyStatus();
}

void ConnectionManager::notifyStatus() {
    if (callbacks_.onStatusChanged) {
        callbacks_.onStatusChanged(clockMs_);
    }
}

const char* connectionStateLabel(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Reconnecting:
            return "reconnecting";
    }
    return "unknown";
}

}  // namespace movehub
