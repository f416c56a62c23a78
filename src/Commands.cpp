#include "Commands.h"

#include <algorithm>

namespace movehub {

namespace {

std::string measurePath(SensorKind kind) {
    switch (kind) {
        case SensorKind::Temperature:
            return "/Meas/Temp";
        case SensorKind::Accelerometer:
            return "/Meas/Acc";
        case SensorKind::HeartRate:
            return "/Meas/HR";
        case SensorKind::Ecg:
            return "/Meas/ECG";
        case SensorKind::Gyroscope:
            return "/Meas/Gyro";
        case SensorKind::Magnetometer:
            return "/Meas/Magn";
    }
    return "/Meas";
}

}  // namespace

Command makeCommand(RequestVerb verb, uint8_t ref, const std::string& path, const std::string& label) {
    Command command;
    command.payload.reserve(2 + path.size());
    command.payload.push_back(static_cast<uint8_t>(verb));
    command.payload.push_back(ref);
    command.payload.insert(command.payload.end(), path.begin(), path.end());
    command.label = label;
    return command;
}

bool isSupportedImuRate(uint32_t hz) {
    return std::find(kSupportedImuRatesHz.begin(), kSupportedImuRatesHz.end(), hz) != kSupportedImuRatesHz.end();
}

bool isSupportedEcgRate(uint32_t hz) {
    return std::find(kSupportedEcgRatesHz.begin(), kSupportedEcgRatesHz.end(), hz) != kSupportedEcgRatesHz.end();
}

uint8_t resourceRefFor(SensorKind kind) {
    switch (kind) {
        case SensorKind::Temperature:
        case SensorKind::Accelerometer:
            return kRefTempAcc;
        case SensorKind::HeartRate:
        case SensorKind::Ecg:
            return kRefHrEcg;
        case SensorKind::Gyroscope:
            return kRefGyro;
        case SensorKind::Magnetometer:
            return kRefMagn;
    }
    return kRefTempAcc;
}

Command subscribeCommand(SensorKind kind, uint32_t imuRateHz, uint32_t ecgRateHz) {
    const std::string base = measurePath(kind);
    const uint8_t ref = resourceRefFor(kind);
    const std::string label = std::string("subscribe ") + sensorKindLabel(kind);
    switch (kind) {
        case SensorKind::Temperature:
            return makeCommand(RequestVerb::Get, ref, base, label);
        case SensorKind::HeartRate:
            return makeCommand(RequestVerb::Subscribe, ref, base, label);
        case SensorKind::Ecg:
            return makeCommand(RequestVerb::Get, ref, base + "/" + std::to_string(ecgRateHz), label);
        case SensorKind::Accelerometer:
        case SensorKind::Gyroscope:
        case SensorKind::Magnetometer:
            return makeCommand(RequestVerb::Subscribe, ref, base + "/" + std::to_string(imuRateHz), label);
    }
    return makeCommand(RequestVerb::Subscribe, ref, base, label);
}

Command unsubscribeCommand(SensorKind kind) {
    return makeCommand(RequestVerb::Unsubscribe, resourceRefFor(kind), measurePath(kind),
                       std::string("unsubscribe ") + sensorKindLabel(kind));
}

std::vector<Command> subscriptionSet(uint32_t imuRateHz, uint32_t ecgRateHz) {
    std::vector<Command> commands;
    commands.reserve(kSubscriptionOrder.size());
    for (SensorKind kind : kSubscriptionOrder) {
        commands.push_back(subscribeCommand(kind, imuRateHz, ecgRateHz));
    }
    return commands;
}

std::vector<Command> unsubscriptionSet() {
    std::vector<Command> commands;
    commands.reserve(kSubscriptionOrder.size());
    for (SensorKind kind : kSubscriptionOrder) {
        commands.push_back(unsubscribeCommand(kind));
    }
    return commands;
}

Command systemInfoCommand() {
    return makeCommand(RequestVerb::Get, kRefSystem, "/System/Info", "system info");
}

Command batteryLevelCommand() {
    return makeCommand(RequestVerb::Get, kRefSystem, "/System/Energy/Level", "battery level");
}

}  // namespace movehub
