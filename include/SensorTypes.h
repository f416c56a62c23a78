#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace movehub {

enum class SensorKind : uint8_t { Temperature, Accelerometer, HeartRate, Ecg, Gyroscope, Magnetometer };

constexpr size_t kSensorKindCount = 6;

constexpr std::array<SensorKind, kSensorKindCount> kAllSensorKinds = {
    SensorKind::Temperature, SensorKind::Accelerometer, SensorKind::HeartRate,
    SensorKind::Ecg,         SensorKind::Gyroscope,     SensorKind::Magnetometer};

constexpr size_t indexOf(SensorKind kind) {
    return static_cast<size_t>(kind);
}

enum class SensorStatus : uint8_t { Inactive, Active, Error };

// Synthetic readings are placeholders the decoder emits for status and
// handshake frames; they never carry a physical measurement.
enum class ReadingOrigin : uint8_t { Measured, Synthetic };

struct Vector3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    double norm() const { return std::sqrt(x * x + y * y + z * z); }
};

/**
 * @brief One decoded reading, tagged by kind.
 *
 * Only the fields of the reading's kind are meaningful:
 * - Temperature: celsius
 * - HeartRate: bpm
 * - Accelerometer: vector (first sample), magnitude, samples
 * - Gyroscope / Magnetometer: samples
 * - Ecg: ecgSamples
 *
 * Use the factory functions; they keep magnitude consistent with the vector
 * and never produce an empty sample list.
 */
struct SensorReading {
    SensorKind kind = SensorKind::Temperature;
    uint64_t timestampMs = 0;
    ReadingOrigin origin = ReadingOrigin::Measured;

    double celsius = 0.0;
    double bpm = 0.0;
    Vector3 vector;
    double magnitude = 0.0;
    std::vector<Vector3> samples;
    std::vector<int16_t> ecgSamples;

    bool synthetic() const { return origin == ReadingOrigin::Synthetic; }

    static SensorReading temperature(double celsius, uint64_t timestampMs, ReadingOrigin origin);
    static SensorReading heartRate(double bpm, uint64_t timestampMs, ReadingOrigin origin);
    static SensorReading accelerometer(const Vector3& sample, uint64_t timestampMs, ReadingOrigin origin);
    static SensorReading gyroscope(const Vector3& sample, uint64_t timestampMs, ReadingOrigin origin);
    static SensorReading magnetometer(const Vector3& sample, uint64_t timestampMs, ReadingOrigin origin);
    static SensorReading ecg(std::vector<int16_t> samples, uint64_t timestampMs, ReadingOrigin origin);
};

const char* sensorKindLabel(SensorKind kind);
const char* sensorStatusLabel(SensorStatus status);

}  // namespace movehub
