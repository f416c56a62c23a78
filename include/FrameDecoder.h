#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "SensorTypes.h"

namespace movehub {

// Resource ids carried in byte 1 of a notification frame. These are
// empirical values observed on one firmware family, not protocol constants.
constexpr uint8_t kResourceTempAcc = 0x62;
constexpr uint8_t kResourceHrEcg = 0x63;
constexpr uint8_t kResourceGyro = 0x64;
constexpr uint8_t kResourceMagn = 0x65;

constexpr uint8_t kIdleStatusByte = 0xFB;

// Placeholder values used for status/handshake frames
constexpr double kIdleTemperatureC = 15.0;
constexpr double kHelloHeartRateBpm = 72.0;

struct DecodeContext {
    uint64_t nowMs = 0;
    bool haveTemperature = false;
};

enum class DecodeRule : uint8_t {
    None,
    StatusFrame,
    HelloFrame,
    SingleAxisAccel,
    SimpleValue,
    ThreeAxis,
    ExtendedEcg,
    TemperatureFallback,
    MagnitudeFallback,
};

/**
 * @brief Outcome of classifying one frame.
 *
 * A frame yields zero, one or (for three-axis frames) two readings. When a
 * rule matched but its fields could not be extracted, failedKind names the
 * sensor the frame belonged to and readings is empty.
 */
struct DecodeResult {
    DecodeRule rule = DecodeRule::None;
    std::vector<SensorReading> readings;
    std::optional<SensorKind> failedKind;

    bool matched() const { return rule != DecodeRule::None; }
    bool failed() const { return failedKind.has_value(); }
};

/**
 * @brief Bounds-checked little-endian view over one frame.
 *
 * Every accessor validates the requested range first and returns nullopt
 * instead of reading past the end.
 */
class FrameReader {
public:
    FrameReader(const uint8_t* data, size_t length) : data_(data), length_(data ? length : 0) {}

    size_t size() const { return length_; }
    bool has(size_t offset, size_t width) const { return offset <= length_ && width <= length_ - offset; }

    std::optional<uint8_t> u8(size_t offset) const;
    std::optional<int8_t> i8(size_t offset) const;
    std::optional<int16_t> i16le(size_t offset) const;

private:
    const uint8_t* data_;
    size_t length_;
};

/**
 * @brief Classify and decode one notification frame.
 *
 * Rules are tried in a fixed order and the first match wins:
 *  1. 4-byte idle status frames (01 id 01 FB)        -> synthetic placeholder
 *  2. 7-byte "He" handshake frames                   -> synthetic placeholder
 *  3. 02 62 frames of 8+ bytes                       -> one accelerometer sample
 *  4. 4-byte 01 id 01 vv value frames                -> temp / HR / ECG
 *  5. 02 62 frames of 10+ bytes, three axes          -> gyroscope (+ accelerometer)
 *  6. 01 63 frames longer than 4 bytes               -> ECG int16 samples
 *  7. fallbacks: temperature guess, then magnitude banding of three int16 axes
 *
 * Never throws. Unrecognized frames produce a result with rule None.
 */
DecodeResult decodeFrame(const uint8_t* data, size_t length, const DecodeContext& context);

inline DecodeResult decodeFrame(const std::vector<uint8_t>& frame, const DecodeContext& context) {
    return decodeFrame(frame.data(), frame.size(), context);
}

// Individual cascade stages. Each returns nullopt when its guard does not
// match. decodeFrame() is the only caller in production; the stages are
// exposed so layouts shadowed by earlier rules can still be verified.
namespace rules {
std::optional<DecodeResult> statusFrame(const FrameReader& frame, const DecodeContext& context);
std::optional<DecodeResult> helloFrame(const FrameReader& frame, const DecodeContext& context);
std::optional<DecodeResult> singleAxisAccel(const FrameReader& frame, const DecodeContext& context);
std::optional<DecodeResult> simpleValue(const FrameReader& frame, const DecodeContext& context);
std::optional<DecodeResult> threeAxis(const FrameReader& frame, const DecodeContext& context);
std::optional<DecodeResult> extendedEcg(const FrameReader& frame, const DecodeContext& context);
std::optional<DecodeResult> temperatureFallback(const FrameReader& frame, const DecodeContext& context);
std::optional<DecodeResult> magnitudeFallback(const FrameReader& frame, const DecodeContext& context);
}  // namespace rules

/**
 * @brief Placeholder magnetometer vector derived from a time oscillator.
 *
 * Used for idle magnetometer frames; it is not a measurement.
 */
Vector3 idleMagnetometerSample(uint64_t nowMs);

// Sensor a frame belongs to judging only by its resource byte. 0x62 frames
// with a 0x02 type byte are accelerometer, 0x63 frames longer than 4 bytes
// are ECG. nullopt for unknown resources or frames shorter than 2 bytes.
std::optional<SensorKind> resourceKind(const uint8_t* data, size_t length);

const char* decodeRuleLabel(DecodeRule rule);

}  // namespace movehub
