#include "SensorTypes.h"

#include <utility>

namespace movehub {

namespace {

SensorReading makeBase(SensorKind kind, uint64_t timestampMs, ReadingOrigin origin) {
    SensorReading reading;
    reading.kind = kind;
    reading.timestampMs = timestampMs;
    reading.origin = origin;
    return reading;
}

}  // namespace

SensorReading SensorReading::temperature(double celsius, uint64_t timestampMs, ReadingOrigin origin) {
    SensorReading reading = makeBase(SensorKind::Temperature, timestampMs, origin);
    reading.celsius = celsius;
    return reading;
}

SensorReading SensorReading::heartRate(double bpm, uint64_t timestampMs, ReadingOrigin origin) {
    SensorReading reading = makeBase(SensorKind::HeartRate, timestampMs, origin);
    reading.bpm = bpm;
    return reading;
}

SensorReading SensorReading::accelerometer(const Vector3& sample, uint64_t timestampMs, ReadingOrigin origin) {
    SensorReading reading = makeBase(SensorKind::Accelerometer, timestampMs, origin);
    reading.vector = sample;
    reading.magnitude = sample.norm();
    reading.samples.push_back(sample);
    return reading;
}

SensorReading SensorReading::gyroscope(const Vector3& sample, uint64_t timestampMs, ReadingOrigin origin) {
    SensorReading reading = makeBase(SensorKind::Gyroscope, timestampMs, origin);
    reading.samples.push_back(sample);
    return reading;
}

SensorReading SensorReading::magnetometer(const Vector3& sample, uint64_t timestampMs, ReadingOrigin origin) {
    SensorReading reading = makeBase(SensorKind::Magnetometer, timestampMs, origin);
    reading.samples.push_back(sample);
    return reading;
}

SensorReading SensorReading::ecg(std::vector<int16_t> samples, uint64_t timestampMs, ReadingOrigin origin) {
    SensorReading reading = makeBase(SensorKind::Ecg, timestampMs, origin);
    reading.ecgSamples = std::move(samples);
    return reading;
}

const char* sensorKindLabel(SensorKind kind) {
    switch (kind) {
        case SensorKind::Temperature:
            return "temperature";
        case SensorKind::Accelerometer:
            return "accelerometer";
        case SensorKind::HeartRate:
            return "heartRate";
        case SensorKind::Ecg:
            return "ecg";
        case SensorKind::Gyroscope:
            return "gyroscope";
        case SensorKind::Magnetometer:
            return "magnetometer";
    }
    return "unknown";
}

const char* sensorStatusLabel(SensorStatus status) {
    switch (status) {
        case SensorStatus::Inactive:
            return "inactive";
        case SensorStatus::Active:
            return "active";
        case SensorStatus::Error:
            return "error";
    }
    return "unknown";
}

}  // namespace movehub
