#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ActivityEngine.h"
#include "CommandQueue.h"
#include "Config.h"
#include "ConnectionManager.h"
#include "EcgStore.h"
#include "FrameDecoder.h"
#include "Link.h"
#include "SensorTypes.h"
#include "proto/movehub.pb.h"
#include "system/TaskScheduler.h"

namespace movehub {

struct SessionConfig {
    ConnectionConfig connection;
    ActivityConfig activity;
    uint32_t commandSpacingMs = COMMAND_SPACING_MS;
    size_t commandQueueCapacity = COMMAND_QUEUE_CAPACITY;
    uint32_t sensorMonitorIntervalMs = SENSOR_MONITOR_INTERVAL_MS;
    size_t minActiveSensors = MIN_ACTIVE_SENSORS;
    float ecgRecordingSampleRateHz = ECG_RECORDING_SAMPLE_RATE_HZ;
    size_t ecgRecordingMaxSamples = ECG_RECORDING_MAX_SAMPLES;
    // Placeholder readings are published but kept out of activity metrics
    // and recordings unless this is set.
    bool syntheticFeedsMetrics = false;
    bool heartRateFromEcg = true;
    bool usePersistentSettings = true;
};

struct EcgRecording {
    std::vector<int16_t> samples;
    uint64_t startedAtMs = 0;
    bool active = false;
    uint32_t droppedSamples = 0;
};

using DecodeFn = std::function<DecodeResult(const uint8_t* data, size_t length, const DecodeContext& context)>;

/**
 * @brief The device session as seen from outside: connection status, the
 * latest reading and status per sensor, activity metrics and ECG recording.
 *
 * Every externally visible change is published as a movehub_SessionEvent.
 * The owner drives the session by calling service() with a monotonic clock;
 * frames, timers and reconnects are all processed from inside that call.
 *
 * Usage example:
 * @code
 * Session session(SessionConfig{}, transport, [](const movehub_SessionEvent& evt) {
 *     publish(evt);
 * });
 * session.connect(millis());
 * // loop:
 * session.service(millis());
 * @endcode
 */
class Session {
public:
    using EventCallback = std::function<void(const movehub_SessionEvent&)>;

    Session(const SessionConfig& config, LinkProvider& provider, EventCallback sendFn, EcgStore* store = nullptr);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    bool connect(uint64_t nowMs);
    void disconnect(uint64_t nowMs);
    void service(uint64_t nowMs);

    bool sendCommand(Command command, uint64_t nowMs);
    void subscribeToSensors(uint64_t nowMs);
    void unsubscribeFromSensors(uint64_t nowMs);

    /**
     * @brief Change and persist the IMU sample rate (13, 26, 52 or 104 Hz).
     * The subscription set is re-issued when connected.
     */
    bool setImuRate(uint32_t hz, uint64_t nowMs);
    bool setEcgRate(uint32_t hz, uint64_t nowMs);
    uint32_t imuRateHz() const { return connection_.config().imuRateHz; }
    uint32_t ecgRateHz() const { return connection_.config().ecgRateHz; }

    SensorStatus status(SensorKind kind) const { return statuses_[indexOf(kind)]; }
    const std::optional<SensorReading>& reading(SensorKind kind) const { return readings_[indexOf(kind)]; }
    size_t activeSensorCount() const;

    const ActivityState& activityState() const { return activity_.state(); }
    void setUserProfile(const UserProfile& profile) { activity_.setProfile(profile); }

    void startEcgRecording(uint64_t nowMs);

    /**
     * @brief Disarm recording and hand back what was captured.
     *
     * The record is also saved to the attached store when it has samples.
     * @return nullopt when no recording was active.
     */
    std::optional<EcgRecord> stopEcgRecording(uint64_t nowMs);
    const EcgRecording& ecgRecording() const { return recording_; }

    ConnectionState connectionState() const { return connection_.state(); }
    const std::string& lastError() const { return connection_.lastError(); }
    const std::string& deviceName() const { return connection_.deviceName(); }
    uint32_t reconnectAttempt() const { return connection_.reconnectAttempt(); }

    void setDecoder(DecodeFn decoder);
    void setSendCallback(EventCallback cb) { send_ = std::move(cb); }

    const CommandQueue& commandQueue() const { return queue_; }
    uint32_t unrecognizedFrames() const { return unrecognizedFrames_; }

private:
    void handleFrame(const uint8_t* data, size_t length, uint64_t nowMs);
    void applyReading(const SensorReading& reading, uint64_t nowMs);
    void markFailed(SensorKind kind, uint64_t nowMs);
    void appendEcg(const std::vector<int16_t>& samples);
    void deriveHeartRateFromEcg(const SensorReading& ecg, uint64_t nowMs);
    void handleStatusChange(uint64_t nowMs);
    void resetSessionState(uint64_t nowMs);
    void armSensorMonitor(uint64_t nowMs);
    void checkSensors(uint64_t nowMs);
    bool feedsMetrics(const SensorReading& reading) const;

    void sendStatus(uint64_t nowMs);
    void sendSensor(SensorKind kind, uint64_t nowMs);
    void sendActivity(const ActivityState& state, uint64_t nowMs);
    void sendEcgState(const std::string& recordId, uint64_t nowMs);

    SessionConfig config_;
    EventCallback send_;
    EcgStore* store_;
    DecodeFn decoder_;

    system::TaskScheduler scheduler_;
    CommandQueue queue_;
    ActivityEngine activity_;
    ConnectionManager connection_;

    std::array<std::optional<SensorReading>, kSensorKindCount> readings_;
    std::array<SensorStatus, kSensorKindCount> statuses_;
    EcgRecording recording_;
    system::TaskScheduler::Token monitorToken_ = system::TaskScheduler::kInvalidToken;
    ConnectionState lastState_ = ConnectionState::Disconnected;
    uint32_t unrecognizedFrames_ = 0;
};

}  // namespace movehub
