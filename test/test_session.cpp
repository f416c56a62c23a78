#include <unity.h>

#include "Commands.h"
#include "EcgStore.h"
#include "FakeTransport.h"
#include "PersistentConfig.h"
#include "Session.h"
#include "system/Log.h"

#include <cmath>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" void setUp(void) {
    movehub::clearPersistentSettings();
    movehub::system::clearLogHistory();
}
extern "C" void tearDown(void) {}

using namespace movehub;
using movehub::fake::FakeTransport;

namespace {

struct Harness {
    FakeTransport transport;
    MemoryEcgStore store;
    std::vector<movehub_SessionEvent> events;
    std::unique_ptr<Session> session;

    explicit Harness(bool persistent = false) {
        SessionConfig config;
        config.usePersistentSettings = persistent;
        session = std::make_unique<Session>(
            config, transport, [this](const movehub_SessionEvent& evt) { events.push_back(evt); }, &store);
    }

    void runUntil(uint64_t endMs) {
        while (transport.clockMs < endMs) {
            transport.clockMs += 10;
            session->service(transport.clockMs);
        }
    }

    void deliver(const std::vector<uint8_t>& frame) {
        TEST_ASSERT_TRUE(transport.notify(frame));
        runUntil(transport.clockMs + 10);
    }

    const movehub_SessionEvent* last(pb_size_t tag) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->which_event == tag) {
                return &*it;
            }
        }
        return nullptr;
    }

    const movehub_SessionEvent* lastSensor(movehub_SensorKind kind) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->which_event == movehub_SessionEvent_sensor_tag && it->event.sensor.kind == kind) {
                return &*it;
            }
        }
        return nullptr;
    }
};

std::vector<uint8_t> ecgFrame(int16_t first, size_t count) {
    std::vector<uint8_t> frame = {0x01, 0x63};
    for (size_t i = 0; i < count; ++i) {
        const uint16_t raw = static_cast<uint16_t>(first + static_cast<int16_t>(i));
        frame.push_back(static_cast<uint8_t>(raw & 0xFF));
        frame.push_back(static_cast<uint8_t>(raw >> 8));
    }
    return frame;
}

std::vector<uint8_t> accelFrame(int16_t raw) {
    const uint16_t bits = static_cast<uint16_t>(raw);
    return {0x02, 0x62, 0x00, 0x00, 0x00, 0x00, static_cast<uint8_t>(bits & 0xFF), static_cast<uint8_t>(bits >> 8)};
}

const std::vector<uint8_t> kTemperatureFrame = {0x01, 0x62, 0x01, 10};
const std::vector<uint8_t> kHeartRateFrame = {0x01, 0x63, 0x01, 72};
const std::vector<uint8_t> kEcgValueFrame = {0x01, 0x63, 0x01, 10};
const std::vector<uint8_t> kHelloHeartRateFrame = {0x00, 0x63, 0x48, 0x65, 0x6C, 0x6C, 0x6F};

}  // namespace

static void test_connect_publishes_status_with_device_name() {
    Harness h;
    TEST_ASSERT_TRUE(h.session->connect(0));
    TEST_ASSERT_EQUAL(ConnectionState::Connected, h.session->connectionState());

    const auto* status = h.last(movehub_SessionEvent_status_tag);
    TEST_ASSERT_NOT_NULL(status);
    TEST_ASSERT_EQUAL(movehub_ConnectionState_CONNECTION_STATE_CONNECTED, status->event.status.state);
    TEST_ASSERT_TRUE(status->event.status.has_device_name);
    TEST_ASSERT_EQUAL_STRING("Movesense 233830000123", status->event.status.device_name);
    TEST_ASSERT_FALSE(status->event.status.has_last_error);
    TEST_ASSERT_EQUAL_UINT32(0, status->event.status.reconnect_attempt);
}

static void test_commands_sent_before_connect_go_out_first() {
    Harness h;
    TEST_ASSERT_TRUE(h.session->sendCommand(systemInfoCommand(), 0));
    TEST_ASSERT_EQUAL_UINT(0, h.transport.writes.size());

    h.session->connect(0);
    h.runUntil(2000);
    TEST_ASSERT_EQUAL_UINT(7, h.transport.writes.size());
    TEST_ASSERT_TRUE(systemInfoCommand().payload == h.transport.writes[0].payload);
    TEST_ASSERT_TRUE(subscribeCommand(SensorKind::Temperature, 104, 125).payload == h.transport.writes[1].payload);
}

static void test_readings_update_cache_and_events() {
    Harness h;
    h.session->connect(0);
    h.deliver(kTemperatureFrame);

    TEST_ASSERT_EQUAL(SensorStatus::Active, h.session->status(SensorKind::Temperature));
    TEST_ASSERT_TRUE(h.session->reading(SensorKind::Temperature).has_value());
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 30.0f, static_cast<float>(h.session->reading(SensorKind::Temperature)->celsius));

    const auto* sensor = h.lastSensor(movehub_SensorKind_SENSOR_KIND_TEMPERATURE);
    TEST_ASSERT_NOT_NULL(sensor);
    TEST_ASSERT_EQUAL(movehub_SensorStatus_SENSOR_STATUS_ACTIVE, sensor->event.sensor.status);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 30.0f, sensor->event.sensor.value);
    TEST_ASSERT_FALSE(sensor->event.sensor.synthetic);
}

static void test_hello_frame_marks_heart_rate_active_without_calories() {
    Harness h;
    h.session->connect(0);
    h.deliver(kHelloHeartRateFrame);

    TEST_ASSERT_EQUAL(SensorStatus::Active, h.session->status(SensorKind::HeartRate));
    const auto& hr = h.session->reading(SensorKind::HeartRate);
    TEST_ASSERT_TRUE(hr.has_value());
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 72.0f, static_cast<float>(hr->bpm));
    TEST_ASSERT_TRUE(hr->synthetic());
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, static_cast<float>(h.session->activityState().caloriesBurned));

    const auto* sensor = h.lastSensor(movehub_SensorKind_SENSOR_KIND_HEART_RATE);
    TEST_ASSERT_NOT_NULL(sensor);
    TEST_ASSERT_TRUE(sensor->event.sensor.synthetic);
}

static void test_decode_failure_marks_only_that_sensor() {
    Harness h;
    h.session->connect(0);
    h.deliver(kTemperatureFrame);
    h.deliver(kHeartRateFrame);

    h.session->setDecoder([](const uint8_t*, size_t, const DecodeContext&) {
        DecodeResult result;
        result.rule = DecodeRule::SimpleValue;
        result.failedKind = SensorKind::Temperature;
        return result;
    });
    h.deliver(kTemperatureFrame);

    TEST_ASSERT_EQUAL(SensorStatus::Error, h.session->status(SensorKind::Temperature));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 30.0f, static_cast<float>(h.session->reading(SensorKind::Temperature)->celsius));
    TEST_ASSERT_EQUAL(SensorStatus::Active, h.session->status(SensorKind::HeartRate));
    TEST_ASSERT_EQUAL(ConnectionState::Connected, h.session->connectionState());

    const auto* sensor = h.lastSensor(movehub_SensorKind_SENSOR_KIND_TEMPERATURE);
    TEST_ASSERT_EQUAL(movehub_SensorStatus_SENSOR_STATUS_ERROR, sensor->event.sensor.status);
}

static void test_decoder_throw_marks_only_that_kind_error() {
    Harness h;
    h.session->connect(0);
    h.runUntil(100);

    h.session->setDecoder([](const uint8_t* data, size_t length, const DecodeContext& context) {
        if (length > 1 && data[1] == kResourceTempAcc) {
            throw std::runtime_error("bad temperature layout");
        }
        return decodeFrame(data, length, context);
    });
    // Both frames land in one inbox batch
    TEST_ASSERT_TRUE(h.transport.notify(kTemperatureFrame));
    TEST_ASSERT_TRUE(h.transport.notify(kHeartRateFrame));
    h.runUntil(h.transport.clockMs + 10);

    TEST_ASSERT_EQUAL(SensorStatus::Error, h.session->status(SensorKind::Temperature));
    TEST_ASSERT_FALSE(h.session->reading(SensorKind::Temperature).has_value());
    TEST_ASSERT_EQUAL(SensorStatus::Active, h.session->status(SensorKind::HeartRate));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 72.0f, static_cast<float>(h.session->reading(SensorKind::HeartRate)->bpm));
    TEST_ASSERT_EQUAL(SensorStatus::Inactive, h.session->status(SensorKind::Accelerometer));
    TEST_ASSERT_EQUAL(ConnectionState::Connected, h.session->connectionState());
    TEST_ASSERT_EQUAL_UINT32(0, h.session->unrecognizedFrames());

    const auto* sensor = h.lastSensor(movehub_SensorKind_SENSOR_KIND_TEMPERATURE);
    TEST_ASSERT_NOT_NULL(sensor);
    TEST_ASSERT_EQUAL(movehub_SensorStatus_SENSOR_STATUS_ERROR, sensor->event.sensor.status);

    bool logged = false;
    for (const auto& line : movehub::system::logHistory()) {
        if (line.find("DECODE") != std::string::npos && line.find("bad temperature layout") != std::string::npos) {
            logged = true;
        }
    }
    TEST_ASSERT_TRUE(logged);
}

static void test_unrecognized_frame_changes_nothing() {
    Harness h;
    h.session->connect(0);
    const size_t before = h.events.size();
    h.deliver({0x09, 0x09});

    TEST_ASSERT_EQUAL_UINT32(1, h.session->unrecognizedFrames());
    TEST_ASSERT_EQUAL_UINT(0, h.session->activeSensorCount());
    TEST_ASSERT_EQUAL_UINT(before, h.events.size());
}

static void test_disconnect_resets_unrecognized_count() {
    Harness h;
    h.session->connect(0);
    h.deliver({0x09, 0x09});
    TEST_ASSERT_EQUAL_UINT32(1, h.session->unrecognizedFrames());

    h.session->disconnect(h.transport.clockMs);
    TEST_ASSERT_EQUAL_UINT32(0, h.session->unrecognizedFrames());
}

static void test_accelerometer_frames_drive_activity() {
    Harness h;
    h.session->connect(0);
    h.deliver(accelFrame(0));
    h.deliver(accelFrame(70));

    TEST_ASSERT_EQUAL_UINT32(1, h.session->activityState().steps);
    const auto* activity = h.last(movehub_SessionEvent_activity_tag);
    TEST_ASSERT_NOT_NULL(activity);
    TEST_ASSERT_EQUAL_UINT32(1, activity->event.activity.steps);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.7f, activity->event.activity.distance_m);
}

static void test_ecg_recording_keeps_arrival_order() {
    Harness h;
    h.session->connect(0);
    h.runUntil(100);

    h.session->startEcgRecording(100);
    TEST_ASSERT_TRUE(h.session->ecgRecording().active);
    TEST_ASSERT_TRUE(h.transport.notify(ecgFrame(1, 13)));
    TEST_ASSERT_TRUE(h.transport.notify(ecgFrame(14, 13)));
    h.runUntil(110);
    h.deliver(ecgFrame(27, 14));

    auto record = h.session->stopEcgRecording(120);
    TEST_ASSERT_TRUE(record.has_value());
    TEST_ASSERT_EQUAL_UINT(40, record->samples.size());
    for (size_t i = 0; i < record->samples.size(); ++i) {
        TEST_ASSERT_EQUAL_INT16(static_cast<int16_t>(i + 1), record->samples[i]);
    }
    TEST_ASSERT_EQUAL_STRING("ecg-100", record->id.c_str());
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 40.0f / 128.0f, record->durationSeconds);

    // Samples after stop are not captured
    h.deliver(ecgFrame(100, 13));
    TEST_ASSERT_EQUAL_UINT(40, h.session->ecgRecording().samples.size());
    TEST_ASSERT_FALSE(h.session->stopEcgRecording(200).has_value());

    TEST_ASSERT_EQUAL_UINT(1, h.store.size());
    auto stored = loadEcgRecord(h.store, "ecg-100");
    TEST_ASSERT_TRUE(stored.has_value());
    TEST_ASSERT_TRUE(stored->samples == record->samples);

    const auto* ecg = h.last(movehub_SessionEvent_ecg_tag);
    TEST_ASSERT_NOT_NULL(ecg);
    TEST_ASSERT_FALSE(ecg->event.ecg.active);
    TEST_ASSERT_EQUAL_UINT32(40, ecg->event.ecg.sample_count);
    TEST_ASSERT_TRUE(ecg->event.ecg.has_record_id);
    TEST_ASSERT_EQUAL_STRING("ecg-100", ecg->event.ecg.record_id);
}

static void test_frames_after_stop_leave_stored_record_unchanged() {
    Harness h;
    h.session->connect(0);
    h.runUntil(100);

    h.session->startEcgRecording(100);
    h.deliver(ecgFrame(1, 13));
    auto record = h.session->stopEcgRecording(h.transport.clockMs);
    TEST_ASSERT_TRUE(record.has_value());
    TEST_ASSERT_EQUAL_UINT(13, record->samples.size());

    h.deliver(ecgFrame(50, 13));
    h.deliver(ecgFrame(80, 14));

    auto stored = loadEcgRecord(h.store, record->id);
    TEST_ASSERT_TRUE(stored.has_value());
    TEST_ASSERT_EQUAL_UINT(13, stored->samples.size());
    for (size_t i = 0; i < stored->samples.size(); ++i) {
        TEST_ASSERT_EQUAL_INT16(static_cast<int16_t>(i + 1), stored->samples[i]);
    }
    TEST_ASSERT_EQUAL_UINT(13, h.session->ecgRecording().samples.size());
    TEST_ASSERT_EQUAL(SensorStatus::Active, h.session->status(SensorKind::Ecg));
}

static void test_published_calories_are_whole_numbers() {
    Harness h;
    h.session->connect(0);
    h.deliver(kHeartRateFrame);
    h.runUntil(90000);
    h.deliver(kHeartRateFrame);

    const double total = h.session->activityState().caloriesBurned;
    TEST_ASSERT_TRUE(total > 1.0);
    const auto* activity = h.last(movehub_SessionEvent_activity_tag);
    TEST_ASSERT_NOT_NULL(activity);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, static_cast<float>(std::round(total)), activity->event.activity.calories);
}

static void test_ecg_without_heart_rate_derives_placeholder() {
    Harness h;
    h.session->connect(0);
    // mean |s| = 7, so 60 + 7
    h.deliver(ecgFrame(1, 13));

    TEST_ASSERT_EQUAL(SensorStatus::Active, h.session->status(SensorKind::Ecg));
    const auto& hr = h.session->reading(SensorKind::HeartRate);
    TEST_ASSERT_TRUE(hr.has_value());
    TEST_ASSERT_TRUE(hr->synthetic());
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 67.0f, static_cast<float>(hr->bpm));
}

static void test_retries_exhausted_clears_session_state() {
    Harness h;
    h.session->connect(0);
    h.deliver(kTemperatureFrame);
    h.deliver(kHeartRateFrame);
    h.session->startEcgRecording(h.transport.clockMs);
    TEST_ASSERT_EQUAL_UINT(2, h.session->activeSensorCount());

    h.transport.failOpen = true;
    h.transport.drop("supervision timeout");
    h.runUntil(h.transport.clockMs + 10);
    TEST_ASSERT_EQUAL(ConnectionState::Reconnecting, h.session->connectionState());
    TEST_ASSERT_TRUE(h.session->reading(SensorKind::Temperature).has_value());

    h.runUntil(20000);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, h.session->connectionState());
    TEST_ASSERT_EQUAL_UINT(0, h.session->activeSensorCount());
    for (SensorKind kind : kAllSensorKinds) {
        TEST_ASSERT_FALSE(h.session->reading(kind).has_value());
        TEST_ASSERT_EQUAL(SensorStatus::Inactive, h.session->status(kind));
    }
    TEST_ASSERT_FALSE(h.session->ecgRecording().active);
    TEST_ASSERT_TRUE(h.session->commandQueue().empty());

    const auto* status = h.last(movehub_SessionEvent_status_tag);
    TEST_ASSERT_EQUAL(movehub_ConnectionState_CONNECTION_STATE_DISCONNECTED, status->event.status.state);
    TEST_ASSERT_TRUE(status->event.status.has_last_error);
    TEST_ASSERT_NOT_NULL(std::strstr(status->event.status.last_error, "Reconnect failed after 3 attempts"));
}

static void test_disconnect_clears_state() {
    Harness h;
    h.session->connect(0);
    h.deliver(kTemperatureFrame);
    h.session->startEcgRecording(h.transport.clockMs);

    h.session->disconnect(h.transport.clockMs);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, h.session->connectionState());
    TEST_ASSERT_FALSE(h.session->reading(SensorKind::Temperature).has_value());
    TEST_ASSERT_FALSE(h.session->ecgRecording().active);
    TEST_ASSERT_TRUE(h.session->lastError().empty());

    h.transport.drop("peer closed");
    h.runUntil(15000);
    TEST_ASSERT_EQUAL(ConnectionState::Disconnected, h.session->connectionState());
    TEST_ASSERT_EQUAL_INT(1, h.transport.openCalls);
}

static void test_sensor_monitor_resubscribes_when_few_sensors_active() {
    Harness h;
    h.session->connect(0);
    h.runUntil(2000);
    TEST_ASSERT_EQUAL_UINT(6, h.transport.writes.size());

    h.runUntil(12000);
    TEST_ASSERT_EQUAL_UINT(12, h.transport.writes.size());
    TEST_ASSERT_TRUE(system::logContains("re-subscribing"));

    h.deliver(kTemperatureFrame);
    h.deliver(kHeartRateFrame);
    h.deliver(kEcgValueFrame);
    TEST_ASSERT_EQUAL_UINT(3, h.session->activeSensorCount());

    h.runUntil(22000);
    TEST_ASSERT_EQUAL_UINT(12, h.transport.writes.size());
}

static void test_imu_rate_is_validated_and_persisted() {
    {
        Harness h(true);
        TEST_ASSERT_FALSE(h.session->setImuRate(100, 0));
        TEST_ASSERT_FALSE(h.session->setEcgRate(128, 0));
        TEST_ASSERT_EQUAL_UINT32(104, h.session->imuRateHz());

        h.session->connect(0);
        h.runUntil(2000);
        TEST_ASSERT_TRUE(h.session->setImuRate(26, 2000));
        h.runUntil(4000);
        TEST_ASSERT_EQUAL_UINT(12, h.transport.writes.size());
        TEST_ASSERT_TRUE(subscribeCommand(SensorKind::Accelerometer, 26, 125).payload == h.transport.writes[7].payload);
    }

    PersistentSettings stored;
    TEST_ASSERT_TRUE(loadPersistentSettings(stored));
    TEST_ASSERT_TRUE(stored.hasImuRateHz);
    TEST_ASSERT_EQUAL_UINT32(26, stored.imuRateHz);

    Harness restored(true);
    TEST_ASSERT_EQUAL_UINT32(26, restored.session->imuRateHz());
    TEST_ASSERT_EQUAL_UINT32(125, restored.session->ecgRateHz());

    Harness ignoring(false);
    TEST_ASSERT_EQUAL_UINT32(104, ignoring.session->imuRateHz());
}

static void test_unsubscribe_enqueues_full_set() {
    Harness h;
    h.session->connect(0);
    h.runUntil(2000);
    h.session->unsubscribeFromSensors(2000);
    h.runUntil(4000);
    TEST_ASSERT_EQUAL_UINT(12, h.transport.writes.size());
    for (size_t i = 6; i < 12; ++i) {
        TEST_ASSERT_EQUAL_HEX8(0x00, h.transport.writes[i].payload[0]);
    }
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_connect_publishes_status_with_device_name);
    RUN_TEST(test_commands_sent_before_connect_go_out_first);
    RUN_TEST(test_readings_update_cache_and_events);
    RUN_TEST(test_hello_frame_marks_heart_rate_active_without_calories);
    RUN_TEST(test_decode_failure_marks_only_that_sensor);
    RUN_TEST(test_decoder_throw_marks_only_that_kind_error);
    RUN_TEST(test_unrecognized_frame_changes_nothing);
    RUN_TEST(test_disconnect_resets_unrecognized_count);
    RUN_TEST(test_accelerometer_frames_drive_activity);
    RUN_TEST(test_ecg_recording_keeps_arrival_order);
    RUN_TEST(test_frames_after_stop_leave_stored_record_unchanged);
    RUN_TEST(test_published_calories_are_whole_numbers);
    RUN_TEST(test_ecg_without_heart_rate_derives_placeholder);
    RUN_TEST(test_retries_exhausted_clears_session_state);
    RUN_TEST(test_disconnect_clears_state);
    RUN_TEST(test_sensor_monitor_resubscribes_when_few_sensors_active);
    RUN_TEST(test_imu_rate_is_validated_and_persisted);
    RUN_TEST(test_unsubscribe_enqueues_full_set);
    return UNITY_END();
}
