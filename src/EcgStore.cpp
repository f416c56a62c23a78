#include "EcgStore.h"

#include <algorithm>
#include <cstring>
#include <limits>

#include <pb_decode.h>
#include <pb_encode.h>

#include "proto/movehub.pb.h"
#include "system/Log.h"

namespace movehub {

namespace {

bool copyString(const std::string& source, char* dest, size_t capacity) {
    if (capacity == 0 || source.size() >= capacity) {
        return false;
    }
    std::memset(dest, 0, capacity);
    std::memcpy(dest, source.data(), source.size());
    return true;
}

bool encodeSamples(pb_ostream_t* stream, const pb_field_t* field, void* const* arg) {
    const auto* samples = static_cast<const std::vector<int16_t>*>(*arg);
    if (samples == nullptr || samples->empty()) {
        return true;
    }

    pb_ostream_t sizing = PB_OSTREAM_SIZING;
    for (int16_t sample : *samples) {
        if (!pb_encode_svarint(&sizing, sample)) {
            return false;
        }
    }

    // Packed encoding: one length-delimited run of zigzag varints.
    if (!pb_encode_tag(stream, PB_WT_STRING, field->tag) || !pb_encode_varint(stream, sizing.bytes_written)) {
        return false;
    }
    for (int16_t sample : *samples) {
        if (!pb_encode_svarint(stream, sample)) {
            return false;
        }
    }
    return true;
}

// Called once per element, for both packed and unpacked encodings.
bool decodeSamples(pb_istream_t* stream, const pb_field_t* field, void** arg) {
    (void)field;
    auto* samples = static_cast<std::vector<int16_t>*>(*arg);
    int64_t value = 0;
    if (!pb_decode_svarint(stream, &value)) {
        return false;
    }
    if (value < std::numeric_limits<int16_t>::min() || value > std::numeric_limits<int16_t>::max()) {
        PB_RETURN_ERROR(stream, "ecg sample out of range");
    }
    samples->push_back(static_cast<int16_t>(value));
    return true;
}

}  // namespace

bool MemoryEcgStore::save(const std::string& id, uint64_t timestampMs, const std::vector<uint8_t>& blob) {
    if (id.empty()) {
        return false;
    }
    blobs_[id] = Stored{timestampMs, blob};
    return true;
}

std::optional<std::vector<uint8_t>> MemoryEcgStore::load(const std::string& id) const {
    auto it = blobs_.find(id);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return it->second.blob;
}

std::vector<EcgStoreEntry> MemoryEcgStore::list() const {
    std::vector<EcgStoreEntry> entries;
    entries.reserve(blobs_.size());
    for (const auto& item : blobs_) {
        entries.push_back({item.first, item.second.timestampMs, item.second.blob.size()});
    }
    std::stable_sort(entries.begin(), entries.end(), [](const EcgStoreEntry& a, const EcgStoreEntry& b) {
        return a.timestampMs > b.timestampMs;
    });
    return entries;
}

bool MemoryEcgStore::remove(const std::string& id) {
    return blobs_.erase(id) > 0;
}

bool encodeEcgRecord(const EcgRecord& record, std::vector<uint8_t>& out) {
    movehub_EcgRecord message = movehub_EcgRecord_init_default;
    if (!copyString(record.id, message.id, sizeof(message.id))) {
        system::logf("ECG", "Record id too long: %s", record.id.c_str());
        return false;
    }
    message.timestamp_ms = record.timestampMs;
    message.duration_s = record.durationSeconds;
    if (!record.name.empty()) {
        if (!copyString(record.name, message.name, sizeof(message.name))) {
            system::logf("ECG", "Record name too long for %s", record.id.c_str());
            return false;
        }
        message.has_name = true;
    }
    message.samples.funcs.encode = &encodeSamples;
    message.samples.arg = const_cast<std::vector<int16_t>*>(&record.samples);

    size_t size = 0;
    if (!pb_get_encoded_size(&size, movehub_EcgRecord_fields, &message)) {
        return false;
    }
    out.assign(size, 0);
    pb_ostream_t stream = pb_ostream_from_buffer(out.data(), out.size());
    if (!pb_encode(&stream, movehub_EcgRecord_fields, &message)) {
        system::logf("ECG", "Encode failed: %s", PB_GET_ERROR(&stream));
        out.clear();
        return false;
    }
    out.resize(stream.bytes_written);
    return true;
}

std::optional<EcgRecord> decodeEcgRecord(const uint8_t* data, size_t length) {
    if (data == nullptr && length > 0) {
        return std::nullopt;
    }
    EcgRecord record;
    movehub_EcgRecord message = movehub_EcgRecord_init_default;
    message.samples.funcs.decode = &decodeSamples;
    message.samples.arg = &record.samples;

    pb_istream_t stream = pb_istream_from_buffer(data, length);
    if (!pb_decode(&stream, movehub_EcgRecord_fields, &message)) {
        system::logf("ECG", "Decode failed: %s", PB_GET_ERROR(&stream));
        return std::nullopt;
    }
    record.id = message.id;
    record.timestampMs = message.timestamp_ms;
    record.durationSeconds = message.duration_s;
    if (message.has_name) {
        record.name = message.name;
    }
    return record;
}

bool saveEcgRecord(EcgStore& store, const EcgRecord& record) {
    std::vector<uint8_t> blob;
    if (!encodeEcgRecord(record, blob)) {
        return false;
    }
    return store.save(record.id, record.timestampMs, blob);
}

std::optional<EcgRecord> loadEcgRecord(const EcgStore& store, const std::string& id) {
    auto blob = store.load(id);
    if (!blob) {
        return std::nullopt;
    }
    return decodeEcgRecord(blob->data(), blob->size());
}

bool renameEcgRecord(EcgStore& store, const std::string& id, const std::string& name) {
    auto record = loadEcgRecord(store, id);
    if (!record) {
        return false;
    }
    record->name = name;
    return saveEcgRecord(store, *record);
}

}  // namespace movehub
