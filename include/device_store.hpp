#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "device_attributes.hpp"

struct sqlite3;

namespace ykmon::server {

class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DeviceStore {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    struct DeviceRecord {
        std::int64_t id{0};
        Serial serial{0};
        AttributeValue firmware_version;
        AttributeValue form_factor;
        std::string device_type;
        bool is_fips{false};
        bool is_sky{false};
        TimePoint first_seen{};
        TimePoint last_seen{};
        std::string raw_info;
    };

    struct DetectionEvent {
        std::int64_t id{0};
        Serial serial{0};
        TimePoint detected_at{};
        nlohmann::json info_snapshot;
        // Current values of the owning record, not of the snapshot.
        std::string device_type;
        AttributeValue form_factor;
    };

    struct Stats {
        std::int64_t total_yubikeys{0};
        std::int64_t total_detections{0};
        std::int64_t recent_detections_24h{0};
    };

    // Opens or creates the database at `path` (":memory:" is accepted) and
    // creates the schema when missing.
    explicit DeviceStore(const std::string& path);
    ~DeviceStore();

    DeviceStore(const DeviceStore&) = delete;
    DeviceStore& operator=(const DeviceStore&) = delete;

    void initialize_schema();

    // Inserts or updates the record for attributes.serial and appends one
    // detection event, atomically. Throws PersistenceError after rolling back.
    DeviceRecord upsert_and_log(const DeviceAttributes& attributes, const std::string& raw_info,
                                TimePoint now = std::chrono::system_clock::now());

    std::vector<DeviceRecord> list_devices() const;
    std::optional<DeviceRecord> find(Serial serial) const;
    std::vector<DetectionEvent> recent_detections(std::size_t limit = 100) const;
    Stats stats(TimePoint now = std::chrono::system_clock::now()) const;
    std::string engine_version() const;

private:
    void execute(const std::string& sql) const;
    std::optional<DeviceRecord> find_locked(Serial serial) const;

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
};

std::string format_timestamp(std::chrono::system_clock::time_point tp);
nlohmann::json record_to_json(const DeviceStore::DeviceRecord& record);
nlohmann::json detection_to_json(const DeviceStore::DetectionEvent& detection);

}  // namespace ykmon::server
