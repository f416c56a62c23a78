#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace movehub {

/**
 * @brief One finished ECG capture as handed to storage.
 */
struct EcgRecord {
    std::string id;
    uint64_t timestampMs = 0;
    std::vector<int16_t> samples;
    float durationSeconds = 0.0f;
    std::string name;
};

struct EcgStoreEntry {
    std::string id;
    uint64_t timestampMs = 0;
    size_t sizeBytes = 0;
};

/**
 * @brief Durable home for recordings. Blobs are opaque to the store.
 */
class EcgStore {
public:
    virtual ~EcgStore() = default;

    virtual bool save(const std::string& id, uint64_t timestampMs, const std::vector<uint8_t>& blob) = 0;
    virtual std::optional<std::vector<uint8_t>> load(const std::string& id) const = 0;
    // Newest first.
    virtual std::vector<EcgStoreEntry> list() const = 0;
    virtual bool remove(const std::string& id) = 0;
};

class MemoryEcgStore : public EcgStore {
public:
    bool save(const std::string& id, uint64_t timestampMs, const std::vector<uint8_t>& blob) override;
    std::optional<std::vector<uint8_t>> load(const std::string& id) const override;
    std::vector<EcgStoreEntry> list() const override;
    bool remove(const std::string& id) override;

    size_t size() const { return blobs_.size(); }

private:
    struct Stored {
        uint64_t timestampMs = 0;
        std::vector<uint8_t> blob;
    };
    std::map<std::string, Stored> blobs_;
};

/**
 * @brief Serialize a record as a movehub.EcgRecord protobuf message.
 * @return false when the id or name does not fit the message limits.
 */
bool encodeEcgRecord(const EcgRecord& record, std::vector<uint8_t>& out);
std::optional<EcgRecord> decodeEcgRecord(const uint8_t* data, size_t length);

bool saveEcgRecord(EcgStore& store, const EcgRecord& record);
std::optional<EcgRecord> loadEcgRecord(const EcgStore& store, const std::string& id);

/**
 * @brief Rewrite the stored record's display name. An empty name clears it.
 */
bool renameEcgRecord(EcgStore& store, const std::string& id, const std::string& name);

}  // namespace movehub
