#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include "Config.h"
#include "SensorTypes.h"
#include "system/TaskScheduler.h"

namespace movehub {

enum class Posture : uint8_t { Unknown, Standing, Stooped, Lying };

struct UserProfile {
    double weightKg = PROFILE_WEIGHT_KG;
    double ageYears = PROFILE_AGE_YEARS;
    bool male = PROFILE_MALE;
};

struct ActivityState {
    uint32_t steps = 0;
    double distanceMeters = 0.0;
    Posture posture = Posture::Unknown;
    uint32_t dribbleCount = 0;
    double caloriesBurned = 0.0;
    bool fallDetected = false;
    std::optional<uint64_t> lastFallMs;
};

struct ActivityConfig {
    double gravityAlpha = 0.1;
    double stepThresholdG = 0.5;
    uint64_t stepCooldownMs = 350;
    double strideLengthM = STRIDE_LENGTH_M;
    double dribbleThresholdG = 1.8;
    uint64_t dribbleCooldownMs = 150;
    double fallThresholdG = 2.5;
    uint64_t fallClearMs = FALL_CLEAR_MS;
    double standingMaxDeg = 30.0;
    double stoopedMaxDeg = 75.0;
    double minHeartRate = 40.0;
    double maxHeartRate = 240.0;
    UserProfile profile;
};

/**
 * @brief Derives steps, posture, dribbles, falls and calories from the
 * accelerometer and heart-rate streams.
 *
 * The engine keeps a low-pass gravity estimate; everything else is computed
 * from the linear acceleration left after subtracting it. The fall flag is
 * cleared by a task on the shared scheduler, so the owner must keep calling
 * scheduler.service(nowMs).
 *
 * Usage example:
 * @code
 * system::TaskScheduler scheduler;
 * ActivityEngine engine(scheduler);
 * engine.processAccelSample({0.0, 0.0, 1.0}, millis());
 * engine.updateCalories(120.0, millis());
 * auto steps = engine.state().steps;
 * @endcode
 */
class ActivityEngine {
public:
    using ChangeCallback = std::function<void(const ActivityState&, uint64_t nowMs)>;

    explicit ActivityEngine(system::TaskScheduler& scheduler, const ActivityConfig& config = ActivityConfig{});
    ~ActivityEngine();

    ActivityEngine(const ActivityEngine&) = delete;
    ActivityEngine& operator=(const ActivityEngine&) = delete;

    /**
     * @brief Feed one accelerometer sample (in g).
     * @return true when the published state changed.
     */
    bool processAccelSample(const Vector3& sample, uint64_t nowMs);

    /**
     * @brief Recompute the calorie total for the current heart rate.
     *
     * Heart rates outside the plausible band are ignored. The total is the
     * Keytel rate for @p bpm times the minutes since the first accepted
     * call, and never decreases.
     * @return true when the call was accepted.
     */
    bool updateCalories(double bpm, uint64_t nowMs);

    void reset();

    const ActivityState& state() const { return state_; }
    const ActivityConfig& config() const { return config_; }
    const std::optional<Vector3>& gravity() const { return gravity_; }
    void setProfile(const UserProfile& profile) { config_.profile = profile; }

    // Invoked after every state change, including the scheduled fall clear.
    void setChangeCallback(ChangeCallback cb) { onChange_ = std::move(cb); }

    /**
     * @brief Posture for a gravity vector, from its angle to the z axis.
     */
    static double verticalAngleDeg(const Vector3& gravity);
    Posture classifyPosture(const Vector3& gravity) const;

    static double keytelKcalPerMinute(double bpm, const UserProfile& profile);

private:
    void scheduleFallClear(uint64_t fallMs);
    void notifyChange(uint64_t nowMs);

    system::TaskScheduler& scheduler_;
    ActivityConfig config_;
    ActivityState state_;
    ChangeCallback onChange_;

    std::optional<Vector3> gravity_;
    std::optional<uint64_t> lastStepMs_;
    std::optional<uint64_t> lastDribbleMs_;
    std::optional<uint64_t> activityStartMs_;
    system::TaskScheduler::Token fallClearToken_ = system::TaskScheduler::kInvalidToken;
};

const char* postureLabel(Posture posture);

}  // namespace movehub
