#pragma once

// Movesense GATT layout (command = write, notify = subscribe)
#define MOVESENSE_SERVICE_UUID "34802252-7185-4d5d-b431-630e7050e8f0"
#define MOVESENSE_COMMAND_CHAR_UUID "34800001-7185-4d5d-b431-630e7050e8f0"
#define MOVESENSE_NOTIFY_CHAR_UUID "34800002-7185-4d5d-b431-630e7050e8f0"
#define MOVESENSE_NAME_PREFIX "Movesense"
#define MOVESENSE_DEFAULT_DEVICE_NAME "Movesense Device"

// Discovery window used by the NimBLE transport
#define SCAN_DURATION_MS 5000

// Command queue
#define COMMAND_SPACING_MS 200
#define COMMAND_QUEUE_CAPACITY 32

// Reconnection: first attempt after FIRST_RECONNECT_DELAY_MS, later ones after RECONNECT_DELAY_MS
#define FIRST_RECONNECT_DELAY_MS 2000
#define RECONNECT_DELAY_MS 3000
#define MAX_RECONNECT_ATTEMPTS 3

// The transport reports our own disconnect asynchronously; drops inside this
// window after disconnect() are not treated as link failures.
#define DISCONNECT_GRACE_MS 500

// Inbound frames queued between service() calls
#define FRAME_INBOX_CAPACITY 128

// Re-subscribe when fewer than MIN_ACTIVE_SENSORS report data
#define SENSOR_MONITOR_INTERVAL_MS 10000
#define MIN_ACTIVE_SENSORS 3

// Activity engine
#define FALL_CLEAR_MS 1000
#define STRIDE_LENGTH_M 0.7

// Default calorie profile
#define PROFILE_WEIGHT_KG 70.0
#define PROFILE_AGE_YEARS 30.0
#define PROFILE_MALE true

// Sensor rates requested by the subscription sequence
#define DEFAULT_IMU_RATE_HZ 104
#define DEFAULT_ECG_RATE_HZ 125

// Sample rate assumed when converting a recording's sample count to seconds
#define ECG_RECORDING_SAMPLE_RATE_HZ 128.0f

// 0 = recording buffer grows until stopEcgRecording()
#define ECG_RECORDING_MAX_SAMPLES 0

#define LOG_HISTORY_SIZE 100
