#ifdef ARDUINO

#include <Arduino.h>
#include <NimBLEDevice.h>
#include <pb_encode.h>

#include <array>
#include <cstring>
#include <memory>
#include <string>

#include "proto/movehub.pb.h"
#include "Config.h"
#include "EcgStore.h"
#include "NimBleLink.h"
#include "Session.h"
#include "system/Log.h"

#include <esp_task_wdt.h>

namespace {

constexpr const char* kFirmwareVersion = "0.3.0";
constexpr size_t kLengthPrefixBytes = 2;
constexpr size_t kProtoBufferSize = 192;
constexpr uint32_t kStatusIntervalMs = 10000;

std::unique_ptr<movehub::NimBleTransport> g_transport;
std::unique_ptr<movehub::MemoryEcgStore> g_ecgStore;
std::unique_ptr<movehub::Session> g_session;

}  // namespace

static const char* sessionEventLabel(uint32_t which) {
    switch (which) {
        case movehub_SessionEvent_status_tag: return "status";
        case movehub_SessionEvent_sensor_tag: return "sensor";
        case movehub_SessionEvent_activity_tag: return "activity";
        case movehub_SessionEvent_ecg_tag: return "ecg";
        default: return "unknown";
    }
}

static const char* protoStateLabel(movehub_ConnectionState state) {
    switch (state) {
        case movehub_ConnectionState_CONNECTION_STATE_DISCONNECTED: return "Disconnected";
        case movehub_ConnectionState_CONNECTION_STATE_CONNECTING: return "Connecting";
        case movehub_ConnectionState_CONNECTION_STATE_CONNECTED: return "Connected";
        case movehub_ConnectionState_CONNECTION_STATE_RECONNECTING: return "Reconnecting";
    }
    return "Unknown";
}

static const char* boolLabel(bool value) {
    return value ? "true" : "false";
}

static bool encodeWithLength(const movehub_SessionEvent& event, std::array<uint8_t, kLengthPrefixBytes + kProtoBufferSize>& buffer, size_t& totalLen) {
    pb_ostream_t stream = pb_ostream_from_buffer(buffer.data() + kLengthPrefixBytes, kProtoBufferSize);
    if (!pb_encode(&stream, movehub_SessionEvent_fields, &event)) {
        Serial.print("encode error: ");
        Serial.println(PB_GET_ERROR(&stream));
        return false;
    }
    const size_t payloadLen = stream.bytes_written;
    buffer[0] = static_cast<uint8_t>(payloadLen & 0xFF);
    buffer[1] = static_cast<uint8_t>((payloadLen >> 8) & 0xFF);
    totalLen = payloadLen + kLengthPrefixBytes;
    return true;
}

static void logEventSummary(const movehub_SessionEvent& event) {
    // Sensor updates arrive at IMU rate; only errors are worth a line.
    if (event.which_event == movehub_SessionEvent_sensor_tag &&
        event.event.sensor.status != movehub_SensorStatus_SENSOR_STATUS_ERROR) {
        return;
    }

    Serial.print("[EVT] event=");
    Serial.println(sessionEventLabel(event.which_event));

    switch (event.which_event) {
        case movehub_SessionEvent_status_tag: {
            const auto& status = event.event.status;
            Serial.print("[EVT]   state=");
            Serial.println(protoStateLabel(status.state));
            Serial.print("[EVT]   reconnect_attempt=");
            Serial.println(status.reconnect_attempt);
            if (status.has_device_name) {
                Serial.print("[EVT]   device=");
                Serial.println(status.device_name);
            }
            if (status.has_last_error) {
                Serial.print("[EVT]   last_error=");
                Serial.println(status.last_error);
            }
            break;
        }
        case movehub_SessionEvent_sensor_tag:
            Serial.print("[EVT]   sensor_error kind=");
            Serial.println(static_cast<int>(event.event.sensor.kind));
            break;
        case movehub_SessionEvent_activity_tag: {
            const auto& activity = event.event.activity;
            Serial.print("[EVT]   steps=");
            Serial.println(activity.steps);
            Serial.print("[EVT]   calories=");
            Serial.println(activity.calories, 2);
            Serial.print("[EVT]   fall_detected=");
            Serial.println(boolLabel(activity.fall_detected));
            break;
        }
        case movehub_SessionEvent_ecg_tag: {
            const auto& ecg = event.event.ecg;
            Serial.print("[EVT]   recording=");
            Serial.println(boolLabel(ecg.active));
            Serial.print("[EVT]   samples=");
            Serial.println(ecg.sample_count);
            if (ecg.has_record_id) {
                Serial.print("[EVT]   record_id=");
                Serial.println(ecg.record_id);
            }
            break;
        }
        default:
            break;
    }

    std::array<uint8_t, kLengthPrefixBytes + kProtoBufferSize> buffer{};
    size_t len = 0;
    if (encodeWithLength(event, buffer, len)) {
        Serial.print("-> [");
        Serial.print(len);
        Serial.println(" bytes]");
    }
}

static void printStatus(uint64_t now) {
    Serial.println("[STATUS] --------------------------------");
    Serial.print("[STATUS] Uptime_s=");
    Serial.println(static_cast<uint32_t>(now / 1000));
    Serial.print("[STATUS] connection=");
    Serial.println(movehub::connectionStateLabel(g_session->connectionState()));
    Serial.print("[STATUS] device=");
    Serial.println(g_session->deviceName().c_str());
    for (movehub::SensorKind kind : movehub::kAllSensorKinds) {
        Serial.print("[STATUS] ");
        Serial.print(movehub::sensorKindLabel(kind));
        Serial.print("=");
        Serial.println(movehub::sensorStatusLabel(g_session->status(kind)));
    }
    const auto& activity = g_session->activityState();
    Serial.print("[STATUS] steps=");
    Serial.println(activity.steps);
    Serial.print("[STATUS] posture=");
    Serial.println(movehub::postureLabel(activity.posture));
    Serial.print("[STATUS] stored_ecg=");
    Serial.println(static_cast<uint32_t>(g_ecgStore->size()));
    Serial.print("[STATUS] free_heap=");
    Serial.println(ESP.getFreeHeap());
    Serial.println("[STATUS] --------------------------------");
}

static void handleSerialCommand(char command, uint64_t now) {
    switch (command) {
        case 'c':
            g_session->connect(now);
            break;
        case 'd':
            g_session->disconnect(now);
            break;
        case 'r':
            if (g_session->ecgRecording().active) {
                g_session->stopEcgRecording(now);
            } else {
                g_session->startEcgRecording(now);
            }
            break;
        case 's':
            printStatus(now);
            break;
        case '\r':
        case '\n':
            break;
        default:
            Serial.println("Commands: c=connect d=disconnect r=record ECG s=status");
            break;
    }
}

void setup() {
    Serial.begin(115200);
    delay(100);
    Serial.println();
    Serial.println("========================================");
    Serial.println("    MoveHub - Booting");
    Serial.println("========================================");
    Serial.print("Firmware version: ");
    Serial.println(kFirmwareVersion);
    Serial.print("Free heap: ");
    Serial.print(ESP.getFreeHeap());
    Serial.println(" bytes");

    esp_task_wdt_init(30, true);
    esp_task_wdt_add(NULL);

    NimBLEDevice::init("MoveHub");
    NimBLEDevice::setPower(ESP_PWR_LVL_P3);

    g_transport = std::make_unique<movehub::NimBleTransport>();
    g_ecgStore = std::make_unique<movehub::MemoryEcgStore>();
    g_session = std::make_unique<movehub::Session>(movehub::SessionConfig{}, *g_transport, logEventSummary, g_ecgStore.get());

    Serial.println("Commands: c=connect d=disconnect r=record ECG s=status");
    g_session->connect(millis());
}

void loop() {
    uint64_t now = millis();

    while (Serial.available() > 0) {
        handleSerialCommand(static_cast<char>(Serial.read()), now);
    }

    g_session->service(now);

    static uint64_t lastStatus = 0;
    if (now - lastStatus > kStatusIntervalMs) {
        printStatus(now);
        lastStatus = now;
    }

    static uint64_t lastWdtReset = 0;
    if (now - lastWdtReset > 5000) {
        esp_task_wdt_reset();
        lastWdtReset = now;
    }

    delay(5);
}

#endif  // ARDUINO
