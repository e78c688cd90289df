#include "device_store.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>

#include <sqlite3.h>

#include "util/logging.hpp"

namespace ykmon::server {

namespace {

constexpr auto kRecentWindow = std::chrono::hours(24);
constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kSchemaSql = R"sql(
CREATE TABLE IF NOT EXISTS yubikeys (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    serial INTEGER NOT NULL UNIQUE,
    version TEXT,
    form_factor TEXT,
    device_type TEXT,
    is_fips INTEGER NOT NULL DEFAULT 0,
    is_sky INTEGER NOT NULL DEFAULT 0,
    first_seen INTEGER NOT NULL,
    last_seen INTEGER NOT NULL,
    raw_info TEXT
);
CREATE TABLE IF NOT EXISTS yubikey_detections (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    serial INTEGER NOT NULL REFERENCES yubikeys(serial),
    detected_at INTEGER NOT NULL,
    info_snapshot TEXT
);
CREATE INDEX IF NOT EXISTS idx_yubikeys_last_seen ON yubikeys(last_seen);
CREATE INDEX IF NOT EXISTS idx_detections_detected_at ON yubikey_detections(detected_at);
)sql";

constexpr const char* kUpsertSql = R"sql(
INSERT INTO yubikeys (serial, version, form_factor, device_type, is_fips, is_sky, first_seen, last_seen, raw_info)
VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?7, ?8)
ON CONFLICT(serial) DO UPDATE SET
    version = excluded.version,
    form_factor = excluded.form_factor,
    device_type = excluded.device_type,
    is_fips = excluded.is_fips,
    is_sky = excluded.is_sky,
    last_seen = MAX(yubikeys.last_seen, excluded.last_seen),
    raw_info = excluded.raw_info
)sql";

constexpr const char* kSelectRecordColumns =
    "SELECT id, serial, version, form_factor, device_type, is_fips, is_sky, first_seen, last_seen, raw_info "
    "FROM yubikeys";

constexpr const char* kSelectDetectionColumns =
    "SELECT d.id, d.serial, d.detected_at, d.info_snapshot, y.device_type, y.form_factor "
    "FROM yubikey_detections d JOIN yubikeys y ON d.serial = y.serial";

std::int64_t to_micros(DeviceStore::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

DeviceStore::TimePoint from_micros(std::int64_t micros) {
    return DeviceStore::TimePoint(
        std::chrono::duration_cast<DeviceStore::TimePoint::duration>(std::chrono::microseconds(micros)));
}

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, std::int64_t value) { check(sqlite3_bind_int64(stmt_, index, value)); }

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind(int index, const AttributeValue& value) {
        if (value.is_known()) {
            bind(index, value.value());
        } else {
            check(sqlite3_bind_null(stmt_, index));
        }
    }

    // True while rows remain.
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw PersistenceError(std::string("Statement failed: ") + sqlite3_errmsg(db_));
    }

    std::int64_t int64_at(int column) const { return sqlite3_column_int64(stmt_, column); }

    bool is_null(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }

    std::string text_at(int column) const {
        const auto* text = sqlite3_column_text(stmt_, column);
        if (text == nullptr) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
    }

    AttributeValue attribute_at(int column) const {
        if (is_null(column)) {
            return AttributeValue::unknown();
        }
        return AttributeValue::known(text_at(column));
    }

private:
    void check(int rc) const {
        if (rc != SQLITE_OK) {
            throw PersistenceError(std::string("Failed to bind parameter: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

// Rolls back unless commit() succeeded.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec("BEGIN IMMEDIATE"); }

    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec("COMMIT");
        committed_ = true;
    }

private:
    void exec(const char* sql) {
        char* error = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
            std::string message = error != nullptr ? error : sqlite3_errmsg(db_);
            sqlite3_free(error);
            throw PersistenceError(std::string(sql) + " failed: " + message);
        }
    }

    sqlite3* db_;
    bool committed_{false};
};

DeviceStore::DeviceRecord read_record(const Statement& stmt) {
    DeviceStore::DeviceRecord record;
    record.id = stmt.int64_at(0);
    record.serial = static_cast<Serial>(stmt.int64_at(1));
    record.firmware_version = stmt.attribute_at(2);
    record.form_factor = stmt.attribute_at(3);
    record.device_type = stmt.is_null(4) ? DeviceAttributes::kDefaultDeviceType : stmt.text_at(4);
    record.is_fips = stmt.int64_at(5) != 0;
    record.is_sky = stmt.int64_at(6) != 0;
    record.first_seen = from_micros(stmt.int64_at(7));
    record.last_seen = from_micros(stmt.int64_at(8));
    record.raw_info = stmt.text_at(9);
    return record;
}

DeviceStore::DetectionEvent read_detection(const Statement& stmt) {
    DeviceStore::DetectionEvent detection;
    detection.id = stmt.int64_at(0);
    detection.serial = static_cast<Serial>(stmt.int64_at(1));
    detection.detected_at = from_micros(stmt.int64_at(2));
    if (!stmt.is_null(3)) {
        detection.info_snapshot = nlohmann::json::parse(stmt.text_at(3), nullptr, false);
        if (detection.info_snapshot.is_discarded()) {
            detection.info_snapshot = nullptr;
        }
    }
    detection.device_type = stmt.is_null(4) ? DeviceAttributes::kDefaultDeviceType : stmt.text_at(4);
    detection.form_factor = stmt.attribute_at(5);
    return detection;
}

}  // namespace

DeviceStore::DeviceStore(const std::string& path) {
    if (path != ":memory:") {
        const auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw PersistenceError("Failed to create database directory " + parent.string() + ": " +
                                       ec.message());
            }
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw PersistenceError("Failed to open database " + path + ": " + message);
    }
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);

    try {
        execute("PRAGMA foreign_keys = ON");
        initialize_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    util::log::info("Opened device database " + path);
}

DeviceStore::~DeviceStore() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

void DeviceStore::initialize_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    execute(kSchemaSql);
}

void DeviceStore::execute(const std::string& sql) const {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error != nullptr ? error : sqlite3_errmsg(db_);
        sqlite3_free(error);
        throw PersistenceError("SQL execution failed: " + message);
    }
}

DeviceStore::DeviceRecord DeviceStore::upsert_and_log(const DeviceAttributes& attributes,
                                                      const std::string& raw_info, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Transaction transaction(db_);
        const auto serial = static_cast<std::int64_t>(attributes.serial);
        const auto now_micros = to_micros(now);

        {
            Statement upsert(db_, kUpsertSql);
            upsert.bind(1, serial);
            upsert.bind(2, attributes.firmware_version);
            upsert.bind(3, attributes.form_factor);
            upsert.bind(4, attributes.device_type);
            upsert.bind(5, static_cast<std::int64_t>(attributes.is_fips));
            upsert.bind(6, static_cast<std::int64_t>(attributes.is_sky));
            upsert.bind(7, now_micros);
            upsert.bind(8, raw_info);
            upsert.step();
        }

        {
            Statement detection(db_,
                                "INSERT INTO yubikey_detections (serial, detected_at, info_snapshot) "
                                "VALUES (?1, ?2, ?3)");
            detection.bind(1, serial);
            detection.bind(2, now_micros);
            detection.bind(3, attributes_to_json(attributes).dump(-1, ' ', false,
                                                                  nlohmann::json::error_handler_t::replace));
            detection.step();
        }

        auto record = find_locked(attributes.serial);
        if (!record) {
            throw PersistenceError("Record for serial " + std::to_string(attributes.serial) +
                                   " missing after upsert");
        }
        transaction.commit();
        util::log::info("YubiKey " + std::to_string(attributes.serial) + " saved to database");
        return *record;
    } catch (const PersistenceError& ex) {
        util::log::error("Database save error: " + std::string(ex.what()));
        throw;
    } catch (const std::exception& ex) {
        util::log::error("Database save error: " + std::string(ex.what()));
        throw PersistenceError(ex.what());
    }
}

std::optional<DeviceStore::DeviceRecord> DeviceStore::find(Serial serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(serial);
}

std::optional<DeviceStore::DeviceRecord> DeviceStore::find_locked(Serial serial) const {
    Statement stmt(db_, (std::string(kSelectRecordColumns) + " WHERE serial = ?1").c_str());
    stmt.bind(1, static_cast<std::int64_t>(serial));
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_record(stmt);
}

std::vector<DeviceStore::DeviceRecord> DeviceStore::list_devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, (std::string(kSelectRecordColumns) + " ORDER BY last_seen DESC, id DESC").c_str());
    std::vector<DeviceRecord> records;
    while (stmt.step()) {
        records.push_back(read_record(stmt));
    }
    return records;
}

std::vector<DeviceStore::DetectionEvent> DeviceStore::recent_detections(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   (std::string(kSelectDetectionColumns) + " ORDER BY d.detected_at DESC, d.id DESC LIMIT ?1").c_str());
    stmt.bind(1, static_cast<std::int64_t>(limit));
    std::vector<DetectionEvent> detections;
    while (stmt.step()) {
        detections.push_back(read_detection(stmt));
    }
    return detections;
}

DeviceStore::Stats DeviceStore::stats(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    {
        Statement stmt(db_, "SELECT COUNT(*) FROM yubikeys");
        if (stmt.step()) {
            stats.total_yubikeys = stmt.int64_at(0);
        }
    }
    {
        Statement stmt(db_, "SELECT COUNT(*) FROM yubikey_detections");
        if (stmt.step()) {
            stats.total_detections = stmt.int64_at(0);
        }
    }
    {
        Statement stmt(db_, "SELECT COUNT(*) FROM yubikey_detections WHERE detected_at >= ?1");
        stmt.bind(1, to_micros(now - kRecentWindow));
        if (stmt.step()) {
            stats.recent_detections_24h = stmt.int64_at(0);
        }
    }
    return stats;
}

std::string DeviceStore::engine_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT sqlite_version()");
    if (!stmt.step()) {
        throw PersistenceError("sqlite_version() returned no rows");
    }
    return stmt.text_at(0);
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_value = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time_t_value, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) % 1'000'000;
    if (micros.count() < 0) {
        micros += std::chrono::seconds(1);
    }
    std::ostringstream oss;
    oss << buffer << "." << std::setw(6) << std::setfill('0') << micros.count() << "Z";
    return oss.str();
}

nlohmann::json record_to_json(const DeviceStore::DeviceRecord& record) {
    return nlohmann::json{
        {"id", record.id},
        {"serial", record.serial},
        {"version", attribute_to_json(record.firmware_version)},
        {"form_factor", attribute_to_json(record.form_factor)},
        {"device_type", record.device_type},
        {"is_fips", record.is_fips},
        {"is_sky", record.is_sky},
        {"first_seen", format_timestamp(record.first_seen)},
        {"last_seen", format_timestamp(record.last_seen)},
        {"raw_info", record.raw_info},
    };
}

nlohmann::json detection_to_json(const DeviceStore::DetectionEvent& detection) {
    return nlohmann::json{
        {"id", detection.id},
        {"serial", detection.serial},
        {"detected_at", format_timestamp(detection.detected_at)},
        {"info_snapshot", detection.info_snapshot},
        {"device_type", detection.device_type},
        {"form_factor", attribute_to_json(detection.form_factor)},
    };
}

}  // namespace ykmon::server
