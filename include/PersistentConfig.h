#pragma once

#include <cstdint>

namespace movehub {

struct PersistentSettings {
    bool hasImuRateHz = false;
    uint32_t imuRateHz = 0;
    bool hasEcgRateHz = false;
    uint32_t ecgRateHz = 0;
};

bool loadPersistentSettings(PersistentSettings& out);
void storeImuRateHz(uint32_t value);
void storeEcgRateHz(uint32_t value);
void clearPersistentSettings();

}  // namespace movehub
