#include "FrameDecoder.h"

#include <cmath>
#include <cstdlib>
#include <utility>

namespace movehub {

namespace {

// Frame layouts (offsets in bytes, all int16 fields little-endian)
constexpr size_t kResourceOffset = 1;
constexpr size_t kSimpleValueOffset = 3;
constexpr size_t kSingleAxisOffset = 6;
constexpr size_t kEcgPayloadOffset = 2;

struct AxisLayout {
    size_t x;
    size_t y;
    size_t z;
};

constexpr AxisLayout kThreeAxisLayout{6, 8, 10};
constexpr AxisLayout kFallbackLayout{0, 2, 4};

constexpr size_t kStatusFrameLength = 4;
constexpr size_t kHelloFrameLength = 7;
constexpr size_t kSingleAxisMinLength = 8;
constexpr size_t kThreeAxisMinLength = 10;
constexpr size_t kThreeAxisWithZLength = 12;
constexpr size_t kFallbackMinLength = 6;

// Raw int16 counts per physical unit
constexpr double kAxisScale = 0.01;
constexpr double kHelloAccelScale = 0.001;

// Classification bands on the raw*0.01 vector magnitude
constexpr double kAccelMagnitudeLimit = 20.0;
constexpr double kGyroMagnitudeLimit = 2000.0;

constexpr int kHeartRateMin = 40;
constexpr int kHeartRateMax = 200;
constexpr double kTemperatureBias = 20.0;
constexpr double kFallbackTemperatureMin = 0.0;
constexpr double kFallbackTemperatureMax = 50.0;

constexpr double kSingleAxisY = 0.01;

constexpr int8_t kIdleSentinel = static_cast<int8_t>(kIdleStatusByte);

DecodeResult matchedWith(DecodeRule rule) {
    DecodeResult result;
    result.rule = rule;
    return result;
}

DecodeResult failedWith(DecodeRule rule, SensorKind kind) {
    DecodeResult result;
    result.rule = rule;
    result.failedKind = kind;
    return result;
}

bool header(const FrameReader& frame, uint8_t& msgType, uint8_t& resource) {
    const auto first = frame.u8(0);
    const auto second = frame.u8(kResourceOffset);
    if (!first || !second) {
        return false;
    }
    msgType = *first;
    resource = *second;
    return true;
}

bool byteEquals(const FrameReader& frame, size_t offset, uint8_t expected) {
    const auto value = frame.u8(offset);
    return value && *value == expected;
}

std::optional<Vector3> readAxes(const FrameReader& frame, const AxisLayout& layout, bool requireZ) {
    const auto x = frame.i16le(layout.x);
    const auto y = frame.i16le(layout.y);
    if (!x || !y) {
        return std::nullopt;
    }
    Vector3 raw{static_cast<double>(*x), static_cast<double>(*y), 0.0};
    const auto z = frame.i16le(layout.z);
    if (z) {
        raw.z = static_cast<double>(*z);
    } else if (requireZ) {
        return std::nullopt;
    }
    return raw;
}

Vector3 scaled(const Vector3& raw, double factor) {
    return Vector3{raw.x * factor, raw.y * factor, raw.z * factor};
}

// Magnetometer fallback keeps 0.1 uT resolution.
Vector3 magnetometerFromRaw(const Vector3& raw) {
    return Vector3{std::trunc(raw.x * 0.1) * 0.1, std::trunc(raw.y * 0.1) * 0.1, std::trunc(raw.z * 0.1) * 0.1};
}

}  // namespace

std::optional<uint8_t> FrameReader::u8(size_t offset) const {
    if (!has(offset, 1)) {
        return std::nullopt;
    }
    return data_[offset];
}

std::optional<int8_t> FrameReader::i8(size_t offset) const {
    if (!has(offset, 1)) {
        return std::nullopt;
    }
    return static_cast<int8_t>(data_[offset]);
}

std::optional<int16_t> FrameReader::i16le(size_t offset) const {
    if (!has(offset, 2)) {
        return std::nullopt;
    }
    const uint16_t raw = static_cast<uint16_t>(data_[offset]) | (static_cast<uint16_t>(data_[offset + 1]) << 8);
    return static_cast<int16_t>(raw);
}

Vector3 idleMagnetometerSample(uint64_t nowMs) {
    const double t = static_cast<double>(nowMs);
    return Vector3{std::trunc(std::sin(t / 1000.0) * 500.0) / 10.0,
                   std::trunc(std::cos(t / 1000.0) * 300.0) / 10.0,
                   std::trunc(std::sin(t / 2000.0) * 200.0) / 10.0};
}

namespace rules {

std::optional<DecodeResult> statusFrame(const FrameReader& frame, const DecodeContext& context) {
    uint8_t msgType = 0;
    uint8_t resource = 0;
    if (frame.size() != kStatusFrameLength || !header(frame, msgType, resource) || msgType != 0x01 ||
        !byteEquals(frame, 2, 0x01) || !byteEquals(frame, 3, kIdleStatusByte)) {
        return std::nullopt;
    }

    DecodeResult result = matchedWith(DecodeRule::StatusFrame);
    const auto now = context.nowMs;
    switch (resource) {
        case kResourceTempAcc:
            result.readings.push_back(SensorReading::temperature(kIdleTemperatureC, now, ReadingOrigin::Synthetic));
            break;
        case kResourceHrEcg:
            result.readings.push_back(
                SensorReading::ecg({static_cast<int16_t>(kIdleSentinel)}, now, ReadingOrigin::Synthetic));
            break;
        case kResourceGyro:
            result.readings.push_back(SensorReading::gyroscope(Vector3{}, now, ReadingOrigin::Synthetic));
            break;
        case kResourceMagn:
            result.readings.push_back(
                SensorReading::magnetometer(idleMagnetometerSample(now), now, ReadingOrigin::Synthetic));
            break;
        default:
            break;
    }
    return result;
}

std::optional<DecodeResult> helloFrame(const FrameReader& frame, const DecodeContext& context) {
    if (frame.size() != kHelloFrameLength || !byteEquals(frame, 2, 'H') || !byteEquals(frame, 3, 'e')) {
        return std::nullopt;
    }

    DecodeResult result = matchedWith(DecodeRule::HelloFrame);
    const auto now = context.nowMs;
    const uint8_t resource = *frame.u8(kResourceOffset);
    switch (resource) {
        case kResourceTempAcc:
            result.readings.push_back(SensorReading::accelerometer(
                scaled(Vector3{1000.0, 2000.0, 3000.0}, kHelloAccelScale), now, ReadingOrigin::Synthetic));
            break;
        case kResourceHrEcg:
            result.readings.push_back(SensorReading::heartRate(kHelloHeartRateBpm, now, ReadingOrigin::Synthetic));
            break;
        case kResourceGyro: {
            // Pairwise byte averages, truncated like an int16 store.
            const auto b = [&frame](size_t offset) { return static_cast<int>(*frame.u8(offset)); };
            const Vector3 raw{static_cast<double>((b(2) + b(3)) / 2), static_cast<double>((b(4) + b(5)) / 2),
                              static_cast<double>((b(6) + b(1)) / 2)};
            result.readings.push_back(SensorReading::gyroscope(scaled(raw, kAxisScale), now, ReadingOrigin::Synthetic));
            break;
        }
        case kResourceMagn:
            result.readings.push_back(
                SensorReading::magnetometer(Vector3{50.0, 30.0, 10.0}, now, ReadingOrigin::Synthetic));
            break;
        default:
            break;
    }
    return result;
}

std::optional<DecodeResult> singleAxisAccel(const FrameReader& frame, const DecodeContext& context) {
    uint8_t msgType = 0;
    uint8_t resource = 0;
    if (frame.size() < kSingleAxisMinLength || !header(frame, msgType, resource) || msgType != 0x02 ||
        resource != kResourceTempAcc) {
        return std::nullopt;
    }

    const auto raw = frame.i16le(kSingleAxisOffset);
    if (!raw) {
        return failedWith(DecodeRule::SingleAxisAccel, SensorKind::Accelerometer);
    }
    DecodeResult result = matchedWith(DecodeRule::SingleAxisAccel);
    const Vector3 sample{*raw * kAxisScale, kSingleAxisY, 0.0};
    result.readings.push_back(SensorReading::accelerometer(sample, context.nowMs, ReadingOrigin::Measured));
    return result;
}

std::optional<DecodeResult> simpleValue(const FrameReader& frame, const DecodeContext& context) {
    uint8_t msgType = 0;
    uint8_t resource = 0;
    if (frame.size() != kStatusFrameLength || !header(frame, msgType, resource) || msgType != 0x01 ||
        !byteEquals(frame, 2, 0x01)) {
        return std::nullopt;
    }

    const auto value = frame.i8(kSimpleValueOffset);
    DecodeResult result = matchedWith(DecodeRule::SimpleValue);
    const auto now = context.nowMs;
    switch (resource) {
        case kResourceTempAcc:
            if (!value) {
                return failedWith(DecodeRule::SimpleValue, SensorKind::Temperature);
            }
            result.readings.push_back(SensorReading::temperature(*value + kTemperatureBias, now, ReadingOrigin::Measured));
            break;
        case kResourceHrEcg: {
            if (!value) {
                return failedWith(DecodeRule::SimpleValue, SensorKind::HeartRate);
            }
            const int magnitude = std::abs(static_cast<int>(*value));
            if (magnitude >= kHeartRateMin && magnitude <= kHeartRateMax) {
                result.readings.push_back(SensorReading::heartRate(magnitude, now, ReadingOrigin::Measured));
            } else {
                result.readings.push_back(SensorReading::ecg({static_cast<int16_t>(*value)}, now, ReadingOrigin::Measured));
            }
            break;
        }
        case kResourceMagn:
            if (value && *value == kIdleSentinel) {
                result.readings.push_back(
                    SensorReading::magnetometer(idleMagnetometerSample(now), now, ReadingOrigin::Synthetic));
            }
            break;
        default:
            break;
    }
    return result;
}

std::optional<DecodeResult> threeAxis(const FrameReader& frame, const DecodeContext& context) {
    uint8_t msgType = 0;
    uint8_t resource = 0;
    if (frame.size() < kThreeAxisMinLength || !header(frame, msgType, resource) || msgType != 0x02 ||
        resource != kResourceTempAcc) {
        return std::nullopt;
    }

    const auto raw = readAxes(frame, kThreeAxisLayout, frame.size() >= kThreeAxisWithZLength);
    if (!raw) {
        return failedWith(DecodeRule::ThreeAxis, SensorKind::Gyroscope);
    }
    const Vector3 vector = scaled(*raw, kAxisScale);
    DecodeResult result = matchedWith(DecodeRule::ThreeAxis);
    result.readings.push_back(SensorReading::gyroscope(vector, context.nowMs, ReadingOrigin::Measured));
    if (vector.norm() < kAccelMagnitudeLimit) {
        result.readings.push_back(SensorReading::accelerometer(vector, context.nowMs, ReadingOrigin::Measured));
    }
    return result;
}

std::optional<DecodeResult> extendedEcg(const FrameReader& frame, const DecodeContext& context) {
    uint8_t msgType = 0;
    uint8_t resource = 0;
    if (frame.size() <= kStatusFrameLength || !header(frame, msgType, resource) || msgType != 0x01 ||
        resource != kResourceHrEcg) {
        return std::nullopt;
    }

    std::vector<int16_t> samples;
    samples.reserve((frame.size() - kEcgPayloadOffset) / 2);
    for (size_t offset = kEcgPayloadOffset; frame.has(offset, 2); offset += 2) {
        samples.push_back(*frame.i16le(offset));
    }
    if (samples.empty()) {
        return failedWith(DecodeRule::ExtendedEcg, SensorKind::Ecg);
    }
    DecodeResult result = matchedWith(DecodeRule::ExtendedEcg);
    result.readings.push_back(SensorReading::ecg(std::move(samples), context.nowMs, ReadingOrigin::Measured));
    return result;
}

std::optional<DecodeResult> temperatureFallback(const FrameReader& frame, const DecodeContext& context) {
    uint8_t msgType = 0;
    uint8_t resource = 0;
    if (context.haveTemperature || frame.size() != kStatusFrameLength || !header(frame, msgType, resource) ||
        resource != kResourceTempAcc || !byteEquals(frame, 2, 0x01)) {
        return std::nullopt;
    }

    const auto value = frame.i8(kSimpleValueOffset);
    if (!value) {
        return std::nullopt;
    }
    const double celsius = *value / 10.0 + kTemperatureBias;
    if (celsius < kFallbackTemperatureMin || celsius > kFallbackTemperatureMax) {
        return std::nullopt;
    }
    DecodeResult result = matchedWith(DecodeRule::TemperatureFallback);
    result.readings.push_back(SensorReading::temperature(std::round(celsius), context.nowMs, ReadingOrigin::Measured));
    return result;
}

std::optional<DecodeResult> magnitudeFallback(const FrameReader& frame, const DecodeContext& context) {
    if (frame.size() < kFallbackMinLength) {
        return std::nullopt;
    }

    const auto raw = readAxes(frame, kFallbackLayout, true);
    if (!raw) {
        return std::nullopt;
    }
    const Vector3 vector = scaled(*raw, kAxisScale);
    const double magnitude = vector.norm();
    DecodeResult result = matchedWith(DecodeRule::MagnitudeFallback);
    if (magnitude < kAccelMagnitudeLimit) {
        result.readings.push_back(SensorReading::accelerometer(vector, context.nowMs, ReadingOrigin::Measured));
    } else if (magnitude < kGyroMagnitudeLimit) {
        result.readings.push_back(SensorReading::gyroscope(vector, context.nowMs, ReadingOrigin::Measured));
    } else {
        result.readings.push_back(
            SensorReading::magnetometer(magnetometerFromRaw(*raw), context.nowMs, ReadingOrigin::Measured));
    }
    return result;
}

}  // namespace rules

DecodeResult decodeFrame(const uint8_t* data, size_t length, const DecodeContext& context) {
    using Stage = std::optional<DecodeResult> (*)(const FrameReader&, const DecodeContext&);
    static constexpr Stage kCascade[] = {
        &rules::statusFrame, &rules::helloFrame,  &rules::singleAxisAccel,     &rules::simpleValue,
        &rules::threeAxis,   &rules::extendedEcg, &rules::temperatureFallback, &rules::magnitudeFallback,
    };

    const FrameReader frame(data, length);
    if (frame.size() == 0) {
        return DecodeResult{};
    }
    for (Stage stage : kCascade) {
        if (auto result = stage(frame, context)) {
            return std::move(*result);
        }
    }
    return DecodeResult{};
}

std::optional<SensorKind> resourceKind(const uint8_t* data, size_t length) {
    if (data == nullptr || length < 2) {
        return std::nullopt;
    }
    switch (data[1]) {
        case kResourceTempAcc:
            return data[0] == 0x02 ? SensorKind::Accelerometer : SensorKind::Temperature;
        case kResourceHrEcg:
            return length > 4 ? SensorKind::Ecg : SensorKind::HeartRate;
        case kResourceGyro:
            return SensorKind::Gyroscope;
        case kResourceMagn:
            return SensorKind::Magnetometer;
        default:
            return std::nullopt;
    }
}

const char* decodeRuleLabel(DecodeRule rule) {
    switch (rule) {
        case DecodeRule::None:
            return "none";
        case DecodeRule::StatusFrame:
            return "status";
        case DecodeRule::HelloFrame:
            return "hello";
        case DecodeRule::SingleAxisAccel:
            return "singleAxisAccel";
        case DecodeRule::SimpleValue:
            return "simpleValue";
        case DecodeRule::ThreeAxis:
            return "threeAxis";
        case DecodeRule::ExtendedEcg:
            return "extendedEcg";
        case DecodeRule::TemperatureFallback:
            return "temperatureFallback";
        case DecodeRule::MagnitudeFallback:
            return "magnitudeFallback";
    }
    return "unknown";
}

}  // namespace movehub
