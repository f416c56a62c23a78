#include "PersistentConfig.h"

#ifdef ARDUINO
#include <Preferences.h>

namespace movehub {
namespace {
constexpr const char* kNamespace = "movehub";
constexpr const char* kKeyImuRate = "imurate";
constexpr const char* kKeyEcgRate = "ecgrate";

bool readUInt(Preferences& prefs, const char* key, uint32_t& out) {
    if (!prefs.isKey(key)) {
        return false;
    }
    out = prefs.getUInt(key, 0U);
    return true;
}

void writeUInt(const char* key, uint32_t value) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putUInt(key, value);
    prefs.end();
}

}  // namespace

bool loadPersistentSettings(PersistentSettings& out) {
    Preferences prefs;
    if (!prefs.begin(kNamespace, true)) {
        return false;
    }
    bool any = false;
    if (readUInt(prefs, kKeyImuRate, out.imuRateHz)) {
        out.hasImuRateHz = true;
        any = true;
    }
    if (readUInt(prefs, kKeyEcgRate, out.ecgRateHz)) {
        out.hasEcgRateHz = true;
        any = true;
    }
    prefs.end();
    return any;
}

void storeImuRateHz(uint32_t value) {
    writeUInt(kKeyImuRate, value);
}

void storeEcgRateHz(uint32_t value) {
    writeUInt(kKeyEcgRate, value);
}

void clearPersistentSettings() {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.clear();
    prefs.end();
}

}  // namespace movehub
#else

namespace movehub {
namespace {
PersistentSettings g_settings;
}

bool loadPersistentSettings(PersistentSettings& out) {
    out = g_settings;
    return g_settings.hasImuRateHz || g_settings.hasEcgRateHz;
}

void storeImuRateHz(uint32_t value) {
    g_settings.imuRateHz = value;
    g_settings.hasImuRateHz = true;
}

void storeEcgRateHz(uint32_t value) {
    g_settings.ecgRateHz = value;
    g_settings.hasEcgRateHz = true;
}

void clearPersistentSettings() {
    g_settings = PersistentSettings{};
}

}  // namespace movehub

#endif  // ARDUINO
