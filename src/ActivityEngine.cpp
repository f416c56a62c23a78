#include "ActivityEngine.h"

#include <algorithm>
#include <cmath>

#include "system/Log.h"

namespace movehub {

namespace {

constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;
constexpr double kKcalPerKj = 4.184;
constexpr double kFemaleFactor = 0.85;
constexpr double kMsPerMinute = 60000.0;

bool cooledDown(const std::optional<uint64_t>& lastMs, uint64_t nowMs, uint64_t cooldownMs) {
    return !lastMs || nowMs < *lastMs || nowMs - *lastMs >= cooldownMs;
}

}  // namespace

ActivityEngine::ActivityEngine(system::TaskScheduler& scheduler, const ActivityConfig& config)
    : scheduler_(scheduler), config_(config) {}

ActivityEngine::~ActivityEngine() {
    scheduler_.cancel(fallClearToken_);
}

bool ActivityEngine::processAccelSample(const Vector3& sample, uint64_t nowMs) {
    if (!gravity_) {
        gravity_ = sample;
    } else {
        const double a = config_.gravityAlpha;
        gravity_->x = (1.0 - a) * gravity_->x + a * sample.x;
        gravity_->y = (1.0 - a) * gravity_->y + a * sample.y;
        gravity_->z = (1.0 - a) * gravity_->z + a * sample.z;
    }

    const Vector3 linear{sample.x - gravity_->x, sample.y - gravity_->y, sample.z - gravity_->z};
    const double magnitude = linear.norm();
    bool changed = false;

    if (magnitude > config_.stepThresholdG && cooledDown(lastStepMs_, nowMs, config_.stepCooldownMs)) {
        ++state_.steps;
        state_.distanceMeters = state_.steps * config_.strideLengthM;
        lastStepMs_ = nowMs;
        changed = true;
    }

    if (magnitude > config_.dribbleThresholdG && cooledDown(lastDribbleMs_, nowMs, config_.dribbleCooldownMs)) {
        ++state_.dribbleCount;
        lastDribbleMs_ = nowMs;
        changed = true;
    }

    const Posture posture = classifyPosture(*gravity_);
    if (posture != state_.posture) {
        state_.posture = posture;
        changed = true;
    }

    if (magnitude > config_.fallThresholdG) {
        state_.fallDetected = true;
        state_.lastFallMs = nowMs;
        scheduleFallClear(nowMs);
        system::logf("ACT", "Fall detected (%.2f g)", magnitude);
        changed = true;
    }

    if (changed) {
        notifyChange(nowMs);
    }
    return changed;
}

bool ActivityEngine::updateCalories(double bpm, uint64_t nowMs) {
    if (!std::isfinite(bpm) || bpm < config_.minHeartRate || bpm > config_.maxHeartRate) {
        return false;
    }
    if (!activityStartMs_) {
        activityStartMs_ = nowMs;
    }
    const uint64_t elapsedMs = nowMs > *activityStartMs_ ? nowMs - *activityStartMs_ : 0;
    const double minutes = static_cast<double>(elapsedMs) / kMsPerMinute;
    const double computed = keytelKcalPerMinute(bpm, config_.profile) * minutes;

    const double total = std::max({state_.caloriesBurned, computed, 0.0});
    if (total != state_.caloriesBurned) {
        state_.caloriesBurned = total;
        notifyChange(nowMs);
    }
    return true;
}

void ActivityEngine::reset() {
    scheduler_.cancel(fallClearToken_);
    fallClearToken_ = system::TaskScheduler::kInvalidToken;
    state_ = ActivityState{};
    gravity_.reset();
    lastStepMs_.reset();
    lastDribbleMs_.reset();
    activityStartMs_.reset();
}

double ActivityEngine::verticalAngleDeg(const Vector3& gravity) {
    return std::atan2(std::sqrt(gravity.x * gravity.x + gravity.y * gravity.y), gravity.z) * kRadToDeg;
}

Posture ActivityEngine::classifyPosture(const Vector3& gravity) const {
    const double angle = verticalAngleDeg(gravity);
    if (angle < config_.standingMaxDeg) {
        return Posture::Standing;
    }
    if (angle < config_.stoopedMaxDeg) {
        return Posture::Stooped;
    }
    return Posture::Lying;
}

double ActivityEngine::keytelKcalPerMinute(double bpm, const UserProfile& profile) {
    const double rate = (-55.0969 + 0.6309 * bpm + 0.1988 * profile.weightKg + 0.2017 * profile.ageYears) / kKcalPerKj;
    return profile.male ? rate : rate * kFemaleFactor;
}

void ActivityEngine::scheduleFallClear(uint64_t fallMs) {
    scheduler_.cancel(fallClearToken_);
    fallClearToken_ = scheduler_.scheduleAt(fallMs + config_.fallClearMs, [this, fallMs](uint64_t nowMs) {
        fallClearToken_ = system::TaskScheduler::kInvalidToken;
        // A newer fall owns the flag now.
        if (!state_.lastFallMs || *state_.lastFallMs != fallMs) {
            return;
        }
        state_.fallDetected = false;
        notifyChange(nowMs);
    });
}

void ActivityEngine::notifyChange(uint64_t nowMs) {
    if (onChange_) {
        onChange_(state_, nowMs);
    }
}

const char* postureLabel(Posture posture) {
    switch (posture) {
        case Posture::Unknown:
            return "unknown";
        case Posture::Standing:
            return "standing";
        case Posture::Stooped:
            return "stooped";
        case Posture::Lying:
            return "lying";
    }
    return "unknown";
}

}  // namespace movehub
