#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "CommandQueue.h"
#include "Config.h"
#include "Link.h"
#include "system/TaskScheduler.h"

namespace movehub {

enum class ConnectionState : uint8_t { Disconnected, Connecting, Connected, Reconnecting };

struct ConnectionConfig {
    LinkTarget target;
    uint32_t firstReconnectDelayMs = FIRST_RECONNECT_DELAY_MS;
    uint32_t reconnectDelayMs = RECONNECT_DELAY_MS;
    uint32_t maxReconnectAttempts = MAX_RECONNECT_ATTEMPTS;
    uint32_t disconnectGraceMs = DISCONNECT_GRACE_MS;
    size_t inboxCapacity = FRAME_INBOX_CAPACITY;
    uint32_t imuRateHz = DEFAULT_IMU_RATE_HZ;
    uint32_t ecgRateHz = DEFAULT_ECG_RATE_HZ;
};

struct ConnectionCallbacks {
    // Fires whenever state, reconnect attempt or last error change.
    std::function<void(uint64_t nowMs)> onStatusChanged;
    std::function<void(const uint8_t* data, size_t length, uint64_t nowMs)> onFrame;
    // Per-session state must be discarded (explicit disconnect or retries exhausted).
    std::function<void(uint64_t nowMs)> onSessionReset;
};

/**
 * @brief Owns the link lifecycle and the reconnect policy.
 *
 * Transitions:
 *   Disconnected -> Connecting -> Connected
 *   Connected -> Reconnecting -> Connected | Disconnected
 *
 * An unexpected drop while Connected schedules up to maxReconnectAttempts
 * reopen attempts (first after firstReconnectDelayMs, later ones after
 * reconnectDelayMs). Frames and drop notices are posted into an inbox from
 * whatever thread the transport uses and handled in service(), so callbacks
 * always run on the caller's thread. Timers run on the shared scheduler.
 */
class ConnectionManager {
public:
    ConnectionManager(const ConnectionConfig& config, LinkProvider& provider, CommandQueue& queue,
                      system::TaskScheduler& scheduler, ConnectionCallbacks callbacks);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @return false when a connection is already open or in progress.
     */
    bool connect(uint64_t nowMs);
    void disconnect(uint64_t nowMs);

    /**
     * @brief Deliver frames and drop notices received since the last call.
     * @return number of frames handed to onFrame.
     */
    size_t service(uint64_t nowMs);

    /**
     * @brief Re-enqueue the subscription set on the command queue.
     */
    void resubscribe(uint64_t nowMs);
    void setRates(uint32_t imuRateHz, uint32_t ecgRateHz);

    ConnectionState state() const { return state_; }
    uint32_t reconnectAttempt() const { return attempt_; }
    const std::string& lastError() const { return lastError_; }
    const std::string& deviceName() const { return deviceName_; }
    bool intentionalDisconnect() const { return intentional_; }
    uint32_t droppedFrames() const;
    const ConnectionConfig& config() const { return config_; }

private:
    struct InboxItem {
        enum class Type : uint8_t { Frame, Drop };
        Type type = Type::Frame;
        uint32_t generation = 0;
        std::vector<uint8_t> bytes;
        std::string reason;
    };

    // Shared with transport callbacks so a late callback never touches a
    // destroyed manager.
    struct Inbox {
        std::mutex mutex;
        std::deque<InboxItem> items;
        size_t capacity = FRAME_INBOX_CAPACITY;
        uint32_t dropped = 0;

        void post(InboxItem item);
        std::deque<InboxItem> takeAll();
        void clear();
    };

    void openLink();
    void onOpened(uint32_t generation, std::unique_ptr<Link> link, const std::string& error);
    void onSubscribed(uint32_t generation, bool ok, const std::string& error);
    void onOpenFailed(const std::string& error);
    void handleDrop(const std::string& reason);
    void scheduleReconnect(uint32_t delayMs);
    void closeLink();
    void resetSession();
    void setState(ConnectionState state);
    void notifyStatus();

    ConnectionConfig config_;
    LinkProvider& provider_;
    CommandQueue& queue_;
    system::TaskScheduler& scheduler_;
    ConnectionCallbacks callbacks_;

    ConnectionState state_ = ConnectionState::Disconnected;
    std::unique_ptr<Link> link_;
    uint32_t generation_ = 0;
    uint32_t attempt_ = 0;
    bool intentional_ = false;
    std::string lastError_;
    std::string deviceName_;
    uint64_t clockMs_ = 0;

    system::TaskScheduler::Token reconnectTimer_ = system::TaskScheduler::kInvalidToken;
    system::TaskScheduler::Token graceTimer_ = system::TaskScheduler::kInvalidToken;

    std::shared_ptr<Inbox> inbox_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

const char* connectionStateLabel(ConnectionState state);

}  // namespace movehub
