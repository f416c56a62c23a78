#include "Session.h"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <utility>

#include "PersistentConfig.h"
#include "system/Log.h"

namespace movehub {

namespace {

constexpr double kEcgHeartRateBase = 60.0;
constexpr double kEcgHeartRateSpan = 40.0;

void copyString(const std::string& source, char* dest, size_t capacity) {
    if (capacity == 0) {
        return;
    }
    std::memset(dest, 0, capacity);
    std::strncpy(dest, source.c_str(), capacity - 1);
}

movehub_ConnectionState toProto(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:
            return movehub_ConnectionState_CONNECTION_STATE_DISCONNECTED;
        case ConnectionState::Connecting:
            return movehub_ConnectionState_CONNECTION_STATE_CONNECTING;
        case ConnectionState::Connected:
            return movehub_ConnectionState_CONNECTION_STATE_CONNECTED;
        case ConnectionState::Reconnecting:
            return movehub_ConnectionState_CONNECTION_STATE_RECONNECTING;
    }
    return movehub_ConnectionState_CONNECTION_STATE_DISCONNECTED;
}

movehub_SensorStatus toProto(SensorStatus status) {
    switch (status) {
        case SensorStatus::Inactive:
            return movehub_SensorStatus_SENSOR_STATUS_INACTIVE;
        case SensorStatus::Active:
            return movehub_SensorStatus_SENSOR_STATUS_ACTIVE;
        case SensorStatus::Error:
            return movehub_SensorStatus_SENSOR_STATUS_ERROR;
    }
    return movehub_SensorStatus_SENSOR_STATUS_INACTIVE;
}

movehub_SensorKind toProto(SensorKind kind) {
    switch (kind) {
        case SensorKind::Temperature:
            return movehub_SensorKind_SENSOR_KIND_TEMPERATURE;
        case SensorKind::Accelerometer:
            return movehub_SensorKind_SENSOR_KIND_ACCELEROMETER;
        case SensorKind::HeartRate:
            return movehub_SensorKind_SENSOR_KIND_HEART_RATE;
        case SensorKind::Ecg:
            return movehub_SensorKind_SENSOR_KIND_ECG;
        case SensorKind::Gyroscope:
            return movehub_SensorKind_SENSOR_KIND_GYROSCOPE;
        case SensorKind::Magnetometer:
            return movehub_SensorKind_SENSOR_KIND_MAGNETOMETER;
    }
    return movehub_SensorKind_SENSOR_KIND_TEMPERATURE;
}

movehub_Posture toProto(Posture posture) {
    switch (posture) {
        case Posture::Unknown:
            return movehub_Posture_POSTURE_UNKNOWN;
        case Posture::Standing:
            return movehub_Posture_POSTURE_STANDING;
        case Posture::Stooped:
            return movehub_Posture_POSTURE_STOOPED;
        case Posture::Lying:
            return movehub_Posture_POSTURE_LYING;
    }
    return movehub_Posture_POSTURE_UNKNOWN;
}

bool hasPayload(const SensorReading& reading) {
    switch (reading.kind) {
        case SensorKind::Temperature:
        case SensorKind::HeartRate:
            return true;
        case SensorKind::Ecg:
            return !reading.ecgSamples.empty();
        case SensorKind::Accelerometer:
        case SensorKind::Gyroscope:
        case SensorKind::Magnetometer:
            return !reading.samples.empty();
    }
    return false;
}

}  // namespace

Session::Session(const SessionConfig& config, LinkProvider& provider, EventCallback sendFn, EcgStore* store)
    : config_(config),
      send_(std::move(sendFn)),
      store_(store),
      decoder_([](const uint8_t* data, size_t length, const DecodeContext& context) {
          return decodeFrame(data, length, context);
      }),
      queue_(scheduler_, config.commandSpacingMs, config.commandQueueCapacity),
      activity_(scheduler_, config.activity),
      connection_(
          [&config]() {
              ConnectionConfig connection = config.connection;
              PersistentSettings stored;
              if (config.usePersistentSettings && loadPersistentSettings(stored)) {
                  if (stored.hasImuRateHz && isSupportedImuRate(stored.imuRateHz)) {
                      connection.imuRateHz = stored.imuRateHz;
                  }
                  if (stored.hasEcgRateHz && isSupportedEcgRate(stored.ecgRateHz)) {
                      connection.ecgRateHz = stored.ecgRateHz;
                  }
              }
              return connection;
          }(),
          provider, queue_, scheduler_,
          ConnectionCallbacks{
              [this](uint64_t nowMs) { handleStatusChange(nowMs); },
              [this](const uint8_t* data, size_t length, uint64_t nowMs) { handleFrame(data, length, nowMs); },
              [this](uint64_t nowMs) { resetSessionState(nowMs); },
          }) {
    statuses_.fill(SensorStatus::Inactive);
    activity_.setChangeCallback([this](const ActivityState& state, uint64_t nowMs) { sendActivity(state, nowMs); });
}

Session::~Session() {
    scheduler_.cancel(monitorToken_);
}

bool Session::connect(uint64_t nowMs) {
    return connection_.connect(nowMs);
}

void Session::disconnect(uint64_t nowMs) {
    connection_.disconnect(nowMs);
}

void Session::service(uint64_t nowMs) {
    connection_.service(nowMs);
    scheduler_.service(nowMs);
}

bool Session::sendCommand(Command command, uint64_t nowMs) {
    return queue_.enqueue(std::move(command), nowMs);
}

void Session::subscribeToSensors(uint64_t nowMs) {
    connection_.resubscribe(nowMs);
}

void Session::unsubscribeFromSensors(uint64_t nowMs) {
    for (auto& command : unsubscriptionSet()) {
        queue_.enqueue(std::move(command), nowMs);
    }
}

bool Session::setImuRate(uint32_t hz, uint64_t nowMs) {
    if (!isSupportedImuRate(hz)) {
        system::logf("SESSION", "Unsupported IMU rate %u Hz", static_cast<unsigned>(hz));
        return false;
    }
    storeImuRateHz(hz);
    connection_.setRates(hz, connection_.config().ecgRateHz);
    if (connection_.state() == ConnectionState::Connected) {
        connection_.resubscribe(nowMs);
    }
    return true;
}

bool Session::setEcgRate(uint32_t hz, uint64_t nowMs) {
    if (!isSupportedEcgRate(hz)) {
        system::logf("SESSION", "Unsupported ECG rate %u Hz", static_cast<unsigned>(hz));
        return false;
    }
    storeEcgRateHz(hz);
    connection_.setRates(connection_.config().imuRateHz, hz);
    if (connection_.state() == ConnectionState::Connected) {
        connection_.resubscribe(nowMs);
    }
    return true;
}

size_t Session::activeSensorCount() const {
    size_t count = 0;
    for (SensorStatus value : statuses_) {
        if (value == SensorStatus::Active) {
            ++count;
        }
    }
    return count;
}

void Session::startEcgRecording(uint64_t nowMs) {
    recording_ = EcgRecording{};
    recording_.active = true;
    recording_.startedAtMs = nowMs;
    system::logf("ECG", "Recording started");
    sendEcgState(std::string(), nowMs);
}

std::optional<EcgRecord> Session::stopEcgRecording(uint64_t nowMs) {
    if (!recording_.active) {
        return std::nullopt;
    }
    recording_.active = false;

    EcgRecord record;
    record.id = "ecg-" + std::to_string(recording_.startedAtMs);
    record.timestampMs = recording_.startedAtMs;
    record.samples = recording_.samples;
    record.durationSeconds = config_.ecgRecordingSampleRateHz > 0.0f
                                 ? static_cast<float>(record.samples.size()) / config_.ecgRecordingSampleRateHz
                                 : 0.0f;
    system::logf("ECG", "Recording stopped: %u samples, %.2f s", static_cast<unsigned>(record.samples.size()),
                 record.durationSeconds);

    std::string savedId;
    if (store_ != nullptr && !record.samples.empty()) {
        if (saveEcgRecord(*store_, record)) {
            savedId = record.id;
        } else {
            system::logf("ECG", "Failed to save %s", record.id.c_str());
        }
    }
    sendEcgState(savedId, nowMs);
    return record;
}

void Session::setDecoder(DecodeFn decoder) {
    if (decoder) {
        decoder_ = std::move(decoder);
    }
}

void Session::handleFrame(const uint8_t* data, size_t length, uint64_t nowMs) {
    DecodeContext context;
    context.nowMs = nowMs;
    context.haveTemperature = readings_[indexOf(SensorKind::Temperature)].has_value();

    DecodeResult result;
    try {
        result = decoder_(data, length, context);
    } catch (const std::exception& e) {
        system::logf("DECODE", "Decoder threw on %u-byte frame: %s", static_cast<unsigned>(length), e.what());
        if (auto kind = resourceKind(data, length)) {
            markFailed(*kind, nowMs);
        } else {
            ++unrecognizedFrames_;
        }
        return;
    }
    if (result.failed()) {
        markFailed(*result.failedKind, nowMs);
        return;
    }
    if (!result.matched()) {
        ++unrecognizedFrames_;
        return;
    }
    for (const auto& reading : result.readings) {
        applyReading(reading, nowMs);
    }
}

void Session::applyReading(const SensorReading& reading, uint64_t nowMs) {
    if (!hasPayload(reading)) {
        return;
    }
    const size_t index = indexOf(reading.kind);
    readings_[index] = reading;
    statuses_[index] = SensorStatus::Active;
    sendSensor(reading.kind, nowMs);

    const bool metrics = feedsMetrics(reading);
    switch (reading.kind) {
        case SensorKind::Accelerometer:
            if (metrics) {
                for (const auto& sample : reading.samples) {
                    activity_.processAccelSample(sample, nowMs);
                }
            }
            break;
        case SensorKind::HeartRate:
            if (metrics) {
                activity_.updateCalories(reading.bpm, nowMs);
            }
            break;
        case SensorKind::Ecg:
            if (recording_.active && metrics) {
                appendEcg(reading.ecgSamples);
            }
            deriveHeartRateFromEcg(reading, nowMs);
            break;
        default:
            break;
    }
}

void Session::markFailed(SensorKind kind, uint64_t nowMs) {
    const size_t index = indexOf(kind);
    if (statuses_[index] != SensorStatus::Error) {
        system::logf("DECODE", "Malformed %s frame", sensorKindLabel(kind));
    }
    statuses_[index] = SensorStatus::Error;
    sendSensor(kind, nowMs);
}

void Session::appendEcg(const std::vector<int16_t>& samples) {
    const size_t cap = config_.ecgRecordingMaxSamples;
    for (int16_t sample : samples) {
        if (cap > 0 && recording_.samples.size() >= cap) {
            ++recording_.droppedSamples;
            continue;
        }
        recording_.samples.push_back(sample);
    }
}

void Session::deriveHeartRateFromEcg(const SensorReading& ecg, uint64_t nowMs) {
    if (!config_.heartRateFromEcg || status(SensorKind::HeartRate) == SensorStatus::Active) {
        return;
    }
    double sum = 0.0;
    for (int16_t sample : ecg.ecgSamples) {
        sum += std::abs(static_cast<int>(sample));
    }
    const double mean = sum / static_cast<double>(ecg.ecgSamples.size());
    const double bpm = kEcgHeartRateBase + std::round(std::fmod(mean, kEcgHeartRateSpan));
    applyReading(SensorReading::heartRate(bpm, nowMs, ReadingOrigin::Synthetic), nowMs);
}

bool Session::feedsMetrics(const SensorReading& reading) const {
    return !reading.synthetic() || config_.syntheticFeedsMetrics;
}

void Session::handleStatusChange(uint64_t nowMs) {
    const ConnectionState state = connection_.state();
    if (state != lastState_) {
        if (state == ConnectionState::Connected) {
            armSensorMonitor(nowMs);
        } else {
            scheduler_.cancel(monitorToken_);
            monitorToken_ = system::TaskScheduler::kInvalidToken;
        }
        lastState_ = state;
    }
    sendStatus(nowMs);
}

void Session::resetSessionState(uint64_t nowMs) {
    system::logf("SESSION", "Session state cleared");
    readings_.fill(std::nullopt);
    statuses_.fill(SensorStatus::Inactive);
    activity_.reset();
    unrecognizedFrames_ = 0;
    const bool wasRecording = recording_.active;
    recording_ = EcgRecording{};
    scheduler_.cancel(monitorToken_);
    monitorToken_ = system::TaskScheduler::kInvalidToken;

    for (SensorKind kind : kAllSensorKinds) {
        sendSensor(kind, nowMs);
    }
    sendActivity(activity_.state(), nowMs);
    if (wasRecording) {
        sendEcgState(std::string(), nowMs);
    }
}

void Session::armSensorMonitor(uint64_t nowMs) {
    scheduler_.cancel(monitorToken_);
    monitorToken_ = scheduler_.scheduleAfter(nowMs, config_.sensorMonitorIntervalMs, [this](uint64_t firedMs) {
        monitorToken_ = system::TaskScheduler::kInvalidToken;
        checkSensors(firedMs);
    });
}

void Session::checkSensors(uint64_t nowMs) {
    if (connection_.state() != ConnectionState::Connected) {
        return;
    }
    const size_t active = activeSensorCount();
    if (active < config_.minActiveSensors) {
        system::logf("SESSION", "Only %u sensors active, re-subscribing", static_cast<unsigned>(active));
        connection_.resubscribe(nowMs);
    }
    armSensorMonitor(nowMs);
}

void Session::sendStatus(uint64_t nowMs) {
    if (!send_) {
        return;
    }

    movehub_SessionEvent evt = movehub_SessionEvent_init_default;
    evt.timestamp_ms = nowMs;
    evt.which_event = movehub_SessionEvent_status_tag;

    auto& statusMsg = evt.event.status;
    statusMsg.state = toProto(connection_.state());
    statusMsg.reconnect_attempt = connection_.reconnectAttempt();
    if (!connection_.lastError().empty()) {
        statusMsg.has_last_error = true;
        copyString(connection_.lastError(), statusMsg.last_error, sizeof(statusMsg.last_error));
    }
    if (!connection_.deviceName().empty()) {
        statusMsg.has_device_name = true;
        copyString(connection_.deviceName(), statusMsg.device_name, sizeof(statusMsg.device_name));
    }

    send_(evt);
}

void Session::sendSensor(SensorKind kind, uint64_t nowMs) {
    if (!send_) {
        return;
    }

    movehub_SessionEvent evt = movehub_SessionEvent_init_default;
    evt.timestamp_ms = nowMs;
    evt.which_event = movehub_SessionEvent_sensor_tag;

    auto& sensor = evt.event.sensor;
    sensor.kind = toProto(kind);
    sensor.status = toProto(status(kind));

    const auto& cached = reading(kind);
    if (cached) {
        sensor.synthetic = cached->synthetic();
        switch (kind) {
            case SensorKind::Temperature:
                sensor.value = static_cast<float>(cached->celsius);
                sensor.sample_count = 1;
                break;
            case SensorKind::HeartRate:
                sensor.value = static_cast<float>(cached->bpm);
                sensor.sample_count = 1;
                break;
            case SensorKind::Ecg:
                sensor.value = cached->ecgSamples.empty() ? 0.0f : cached->ecgSamples.back();
                sensor.sample_count = static_cast<uint32_t>(cached->ecgSamples.size());
                break;
            case SensorKind::Accelerometer:
            case SensorKind::Gyroscope:
            case SensorKind::Magnetometer: {
                const Vector3 first = cached->samples.empty() ? Vector3{} : cached->samples.front();
                sensor.value = static_cast<float>(kind == SensorKind::Accelerometer ? cached->magnitude : first.norm());
                sensor.x = static_cast<float>(first.x);
                sensor.y = static_cast<float>(first.y);
                sensor.z = static_cast<float>(first.z);
                sensor.sample_count = static_cast<uint32_t>(cached->samples.size());
                break;
            }
        }
    }

    send_(evt);
}

void Session::sendActivity(const ActivityState& state, uint64_t nowMs) {
    if (!send_) {
        return;
    }

    movehub_SessionEvent evt = movehub_SessionEvent_init_default;
    evt.timestamp_ms = nowMs;
    evt.which_event = movehub_SessionEvent_activity_tag;

    auto& activity = evt.event.activity;
    activity.steps = state.steps;
    activity.distance_m = static_cast<float>(state.distanceMeters);
    activity.posture = toProto(state.posture);
    activity.dribbles = state.dribbleCount;
    activity.calories = static_cast<float>(std::round(state.caloriesBurned));
    activity.fall_detected = state.fallDetected;
    if (state.lastFallMs) {
        activity.has_last_fall_ms = true;
        activity.last_fall_ms = *state.lastFallMs;
    }

    send_(evt);
}

void Session::sendEcgState(const std::string& recordId, uint64_t nowMs) {
    if (!send_) {
        return;
    }

    movehub_SessionEvent evt = movehub_SessionEvent_init_default;
    evt.timestamp_ms = nowMs;
    evt.which_event = movehub_SessionEvent_ecg_tag;

    auto& ecg = evt.event.ecg;
    ecg.active = recording_.active;
    ecg.sample_count = static_cast<uint32_t>(recording_.samples.size());
    ecg.duration_s = config_.ecgRecordingSampleRateHz > 0.0f
                         ? static_cast<float>(recording_.samples.size()) / config_.ecgRecordingSampleRateHz
                         : 0.0f;
    if (!recordId.empty()) {
        ecg.has_record_id = true;
        copyString(recordId, ecg.record_id, sizeof(ecg.record_id));
    }

    send_(evt);
}

}  // namespace movehub
