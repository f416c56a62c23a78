#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "SensorTypes.h"

namespace movehub {

/**
 * @brief One outbound request: raw payload bytes plus a label for logs.
 */
struct Command {
    std::vector<uint8_t> payload;
    std::string label;
};

enum class RequestVerb : uint8_t {
    Unsubscribe = 0x00,
    Get = 0x01,
    Put = 0x02,
    Post = 0x03,
    Delete = 0x04,
    Subscribe = 0x0C,
};

// Resource references carried in byte 1 of a request
constexpr uint8_t kRefTempAcc = 0x62;
constexpr uint8_t kRefHrEcg = 0x63;
constexpr uint8_t kRefGyro = 0x64;
constexpr uint8_t kRefMagn = 0x65;
constexpr uint8_t kRefSystem = 0x11;

constexpr std::array<uint32_t, 4> kSupportedImuRatesHz = {13, 26, 52, 104};
constexpr std::array<uint32_t, 3> kSupportedEcgRatesHz = {125, 250, 500};

// Order in which the subscription set is issued after connecting.
constexpr std::array<SensorKind, kSensorKindCount> kSubscriptionOrder = {
    SensorKind::Temperature, SensorKind::Accelerometer, SensorKind::HeartRate,
    SensorKind::Gyroscope,   SensorKind::Magnetometer,  SensorKind::Ecg};

/**
 * @brief Build a request of the form [verb, ref, path bytes...].
 */
Command makeCommand(RequestVerb verb, uint8_t ref, const std::string& path, const std::string& label);

bool isSupportedImuRate(uint32_t hz);
bool isSupportedEcgRate(uint32_t hz);

/**
 * @brief Request that starts streaming one sensor.
 *
 * At the default rates (104 Hz IMU, 125 Hz ECG) the payloads are the legacy
 * byte sequences, e.g. 0C 62 "/Meas/Acc/104" for the accelerometer.
 * Temperature and ECG use GET; the others SUBSCRIBE.
 */
Command subscribeCommand(SensorKind kind, uint32_t imuRateHz, uint32_t ecgRateHz);
Command unsubscribeCommand(SensorKind kind);

std::vector<Command> subscriptionSet(uint32_t imuRateHz, uint32_t ecgRateHz);
std::vector<Command> unsubscriptionSet();

Command systemInfoCommand();
Command batteryLevelCommand();

uint8_t resourceRefFor(SensorKind kind);

}  // namespace movehub
