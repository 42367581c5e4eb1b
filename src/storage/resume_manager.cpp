#include "puresend/storage/resume_manager.hpp"
#include "puresend/storage/chunk_manager.hpp"
#include "puresend/storage/storage_config.hpp"
#include "puresend/crypto/hash.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/utils.hpp"
#include <sqlite3.h>

namespace puresend::storage {

using core::utils::TimeUtils;

namespace {
    const char* direction_column(ResumeRecord::Direction direction) {
        return direction == ResumeRecord::Direction::Send ? "send" : "receive";
    }

    const char* state_column(ResumeRecord::State state) {
        return state == ResumeRecord::State::Active ? "active" : "interrupted";
    }

    std::string column_text(sqlite3_stmt* stmt, int column) {
        const auto* text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }
}

std::uint32_t ResumeRecord::first_missing_chunk() const {
    std::uint32_t index = 0;
    while (index < file.chunk_count() && completed_chunks.count(index) > 0) {
        ++index;
    }
    return index;
}

std::uint64_t ResumeRecord::contiguous_offset() const {
    return file.bytes_before(first_missing_chunk());
}

const char* to_string(ResumeRecord::Direction direction) {
    return direction_column(direction);
}

ResumeManager::ResumeManager(const std::filesystem::path& database_path, std::chrono::hours expiry)
    : db_path_(database_path), expiry_(expiry), db_(nullptr) {
}

ResumeManager::~ResumeManager() {
    if (db_) {
        sqlite3_close(db_);
    }
}

core::Result ResumeManager::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        return core::Result();
    }

    auto parent = db_path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        auto error = sqlite_error("Cannot open resume database " + db_path_.string());
        sqlite3_close(db_);
        db_ = nullptr;
        return error;
    }

    return create_tables();
}

core::Result ResumeManager::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        std::string message = error_msg ? error_msg : sqlite3_errstr(result);
        sqlite3_free(error_msg);
        return core::Result(core::ErrorCode::IO_ERROR, "Resume ledger: " + message);
    }
    return core::Result();
}

void ResumeManager::rollback() {
    auto result = exec("ROLLBACK;");
    if (!result) {
        LOG_ERROR("Resume ledger rollback failed: {}", result.message);
    }
}

core::Result ResumeManager::sqlite_error(const std::string& context) const {
    return core::Result(core::ErrorCode::IO_ERROR,
                        context + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open"));
}

core::Result ResumeManager::create_tables() {
    // A committed chunk must survive a crash, so every transaction is fully synced.
    const char* pragmas = R"(
        PRAGMA journal_mode = WAL;
        PRAGMA synchronous = FULL;
        PRAGMA foreign_keys = ON;
    )";

    const char* create_records_table = R"(
        CREATE TABLE IF NOT EXISTS resume_records (
            task_id TEXT PRIMARY KEY,
            direction TEXT NOT NULL,
            state TEXT NOT NULL,
            file_hash TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            resume_offset INTEGER NOT NULL DEFAULT 0,
            metadata_blob BLOB NOT NULL,
            peer_id TEXT,
            peer_name TEXT,
            peer_ip TEXT,
            peer_port INTEGER,
            source_path TEXT,
            save_path TEXT,
            encrypted INTEGER DEFAULT 0,
            created_at INTEGER NOT NULL,
            interrupted_at INTEGER,
            expires_at INTEGER
        );
    )";

    const char* create_chunks_table = R"(
        CREATE TABLE IF NOT EXISTS resume_chunks (
            task_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            chunk_hash TEXT NOT NULL,
            PRIMARY KEY (task_id, chunk_index),
            FOREIGN KEY (task_id) REFERENCES resume_records(task_id) ON DELETE CASCADE
        );
    )";

    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_resume_state ON resume_records(state);
        CREATE INDEX IF NOT EXISTS idx_resume_expires ON resume_records(expires_at);
    )";

    for (const char* sql : {pragmas, create_records_table, create_chunks_table, create_indexes}) {
        auto result = exec(sql);
        if (!result) {
            return result;
        }
    }

    return core::Result();
}

core::Result ResumeManager::save(const ResumeRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Resume ledger");
    }

    const char* insert_record_sql = R"(
        INSERT OR REPLACE INTO resume_records
        (task_id, direction, state, file_hash, file_size, resume_offset, metadata_blob,
         peer_id, peer_name, peer_ip, peer_port, source_path, save_path, encrypted,
         created_at, interrupted_at, expires_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    auto result = exec("BEGIN IMMEDIATE;");
    if (!result) {
        return result;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, insert_record_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        auto error = sqlite_error("Prepare resume record");
        rollback();
        return error;
    }

    auto blob = record.file.serialize();
    auto offset = record.completed_chunks.empty() ? record.resume_offset : record.contiguous_offset();

    sqlite3_bind_text(stmt, 1, record.task_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, direction_column(record.direction), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, state_column(record.state), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, record.file_hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(record.file.size));
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(offset));
    sqlite3_bind_blob(stmt, 7, blob.data(), static_cast<int>(blob.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 8, record.peer_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 9, record.peer_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 10, record.peer_ip.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 11, record.peer_port);
    sqlite3_bind_text(stmt, 12, record.source_path.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 13, record.save_path.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 14, record.encrypted ? 1 : 0);
    sqlite3_bind_int64(stmt, 15, TimeUtils::to_unix_millis(record.created_at));
    sqlite3_bind_int64(stmt, 16, TimeUtils::to_unix_millis(record.interrupted_at));
    sqlite3_bind_int64(stmt, 17, TimeUtils::to_unix_millis(record.expires_at));

    int step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (step != SQLITE_DONE) {
        auto error = sqlite_error("Save resume record " + record.task_id);
        rollback();
        return error;
    }

    const char* clear_chunks_sql = "DELETE FROM resume_chunks WHERE task_id = ?;";
    if (sqlite3_prepare_v2(db_, clear_chunks_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        auto error = sqlite_error("Prepare chunk reset");
        rollback();
        return error;
    }
    sqlite3_bind_text(stmt, 1, record.task_id.c_str(), -1, SQLITE_STATIC);
    step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (step != SQLITE_DONE) {
        auto error = sqlite_error("Reset resume chunks " + record.task_id);
        rollback();
        return error;
    }

    const char* insert_chunk_sql = R"(
        INSERT OR REPLACE INTO resume_chunks (task_id, chunk_index, chunk_hash) VALUES (?, ?, ?);
    )";
    if (sqlite3_prepare_v2(db_, insert_chunk_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        auto error = sqlite_error("Prepare resume chunk");
        rollback();
        return error;
    }

    for (const auto& [index, hash] : record.completed_chunks) {
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, record.task_id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 2, index);
        sqlite3_bind_text(stmt, 3, hash.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            auto error = sqlite_error("Save resume chunk " + std::to_string(index));
            sqlite3_finalize(stmt);
            rollback();
            return error;
        }
    }
    sqlite3_finalize(stmt);

    return exec("COMMIT;");
}

core::Result ResumeManager::commit_chunk(const std::string& task_id, std::uint32_t chunk_index,
                                         const std::string& chunk_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Resume ledger");
    }

    auto result = exec("BEGIN IMMEDIATE;");
    if (!result) {
        return result;
    }

    const char* insert_chunk_sql = R"(
        INSERT OR REPLACE INTO resume_chunks (task_id, chunk_index, chunk_hash) VALUES (?, ?, ?);
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, insert_chunk_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        auto error = sqlite_error("Prepare resume chunk");
        rollback();
        return error;
    }

    sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, chunk_index);
    sqlite3_bind_text(stmt, 3, chunk_hash.c_str(), -1, SQLITE_STATIC);

    int step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (step != SQLITE_DONE) {
        // Most likely a foreign key failure: no record for this task.
        auto error = core::Result(core::ErrorCode::NOT_FOUND,
                                  "No resume record for " + task_id + ": " + sqlite3_errmsg(db_));
        rollback();
        return error;
    }

    result = update_offset_locked(task_id);
    if (!result) {
        rollback();
        return result;
    }

    return exec("COMMIT;");
}

core::Result ResumeManager::forget_chunks(const std::string& task_id,
                                          const std::vector<std::uint32_t>& chunk_indices) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Resume ledger");
    }

    auto result = exec("BEGIN IMMEDIATE;");
    if (!result) {
        return result;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* delete_sql = "DELETE FROM resume_chunks WHERE task_id = ? AND chunk_index = ?;";
    if (sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        auto error = sqlite_error("Prepare chunk removal");
        rollback();
        return error;
    }

    for (auto index : chunk_indices) {
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 2, index);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            auto error = sqlite_error("Remove resume chunk");
            sqlite3_finalize(stmt);
            rollback();
            return error;
        }
    }
    sqlite3_finalize(stmt);

    result = update_offset_locked(task_id);
    if (!result) {
        rollback();
        return result;
    }

    return exec("COMMIT;");
}

core::Result ResumeManager::update_offset_locked(const std::string& task_id) {
    sqlite3_stmt* stmt = nullptr;
    const char* select_sql = "SELECT metadata_blob FROM resume_records WHERE task_id = ?;";
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error("Prepare offset lookup");
    }

    sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return core::Result(core::ErrorCode::NOT_FOUND, "No resume record for " + task_id);
    }

    ResumeRecord record;
    try {
        const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, 0));
        auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, 0));
        record.file = FileMetadata::deserialize(std::span<const std::uint8_t>(data, size));
    } catch (const std::exception& e) {
        sqlite3_finalize(stmt);
        return core::Result(core::ErrorCode::IO_ERROR, "Corrupt resume metadata for " + task_id + ": " + e.what());
    }
    sqlite3_finalize(stmt);

    record.completed_chunks = load_chunks_locked(task_id);

    const char* update_sql = "UPDATE resume_records SET resume_offset = ? WHERE task_id = ?;";
    if (sqlite3_prepare_v2(db_, update_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error("Prepare offset update");
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(record.contiguous_offset()));
    sqlite3_bind_text(stmt, 2, task_id.c_str(), -1, SQLITE_STATIC);
    int step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (step != SQLITE_DONE) {
        return sqlite_error("Update resume offset");
    }
    return core::Result();
}

std::map<std::uint32_t, std::string> ResumeManager::load_chunks_locked(const std::string& task_id) {
    std::map<std::uint32_t, std::string> chunks;

    sqlite3_stmt* stmt = nullptr;
    const char* select_sql = "SELECT chunk_index, chunk_hash FROM resume_chunks WHERE task_id = ?;";
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Cannot read resume chunks for {}: {}", task_id, sqlite3_errmsg(db_));
        return chunks;
    }

    sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_STATIC);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto index = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 0));
        chunks[index] = column_text(stmt, 1);
    }
    sqlite3_finalize(stmt);

    return chunks;
}

core::Result ResumeManager::mark_interrupted(const std::string& task_id,
                                             std::chrono::system_clock::time_point when) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Resume ledger");
    }

    const char* update_sql = R"(
        UPDATE resume_records SET state = 'interrupted', interrupted_at = ?, expires_at = ?
        WHERE task_id = ?;
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, update_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error("Prepare interrupt");
    }

    sqlite3_bind_int64(stmt, 1, TimeUtils::to_unix_millis(when));
    sqlite3_bind_int64(stmt, 2, TimeUtils::to_unix_millis(when + expiry_));
    sqlite3_bind_text(stmt, 3, task_id.c_str(), -1, SQLITE_STATIC);

    int step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (step != SQLITE_DONE) {
        return sqlite_error("Mark interrupted " + task_id);
    }
    if (sqlite3_changes(db_) == 0) {
        return core::Result(core::ErrorCode::NOT_FOUND, "No resume record for " + task_id);
    }
    return core::Result();
}

core::Result ResumeManager::mark_active(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Resume ledger");
    }

    sqlite3_stmt* stmt = nullptr;
    const char* update_sql = "UPDATE resume_records SET state = 'active' WHERE task_id = ?;";
    if (sqlite3_prepare_v2(db_, update_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error("Prepare activate");
    }

    sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_STATIC);
    int step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (step != SQLITE_DONE) {
        return sqlite_error("Mark active " + task_id);
    }
    if (sqlite3_changes(db_) == 0) {
        return core::Result(core::ErrorCode::NOT_FOUND, "No resume record for " + task_id);
    }
    return core::Result();
}

std::size_t ResumeManager::recover_after_restart() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    auto now = TimeUtils::now();
    const char* update_sql = R"(
        UPDATE resume_records SET state = 'interrupted', interrupted_at = ?, expires_at = ?
        WHERE state = 'active';
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, update_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Cannot recover resume records: {}", sqlite3_errmsg(db_));
        return 0;
    }

    sqlite3_bind_int64(stmt, 1, TimeUtils::to_unix_millis(now));
    sqlite3_bind_int64(stmt, 2, TimeUtils::to_unix_millis(now + expiry_));
    int step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (step != SQLITE_DONE) {
        LOG_ERROR("Cannot recover resume records: {}", sqlite3_errmsg(db_));
        return 0;
    }

    auto recovered = static_cast<std::size_t>(sqlite3_changes(db_));
    if (recovered > 0) {
        LOG_INFO("Recovered {} transfers left active by a previous run", recovered);
    }
    return recovered;
}

std::optional<ResumeRecord> ResumeManager::load(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }

    const char* select_sql = R"(
        SELECT task_id, direction, state, file_hash, resume_offset, metadata_blob,
               peer_id, peer_name, peer_ip, peer_port, source_path, save_path, encrypted,
               created_at, interrupted_at, expires_at
        FROM resume_records WHERE task_id = ?;
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Cannot read resume record {}: {}", task_id, sqlite3_errmsg(db_));
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    ResumeRecord record;
    record.task_id = column_text(stmt, 0);
    record.direction = column_text(stmt, 1) == "send" ? ResumeRecord::Direction::Send
                                                      : ResumeRecord::Direction::Receive;
    record.state = column_text(stmt, 2) == "active" ? ResumeRecord::State::Active
                                                    : ResumeRecord::State::Interrupted;
    record.file_hash = column_text(stmt, 3);
    record.resume_offset = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 4));

    try {
        const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, 5));
        auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, 5));
        record.file = FileMetadata::deserialize(std::span<const std::uint8_t>(data, size));
    } catch (const std::exception& e) {
        LOG_WARN("Discarding corrupt resume record {}: {}", task_id, e.what());
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    record.peer_id = column_text(stmt, 6);
    record.peer_name = column_text(stmt, 7);
    record.peer_ip = column_text(stmt, 8);
    record.peer_port = static_cast<std::uint16_t>(sqlite3_column_int(stmt, 9));
    record.source_path = column_text(stmt, 10);
    record.save_path = column_text(stmt, 11);
    record.encrypted = sqlite3_column_int(stmt, 12) != 0;
    record.created_at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt, 13));
    record.interrupted_at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt, 14));
    record.expires_at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt, 15));
    sqlite3_finalize(stmt);

    record.completed_chunks = load_chunks_locked(task_id);
    return record;
}

std::vector<ResumeRecord> ResumeManager::list(bool interrupted_only) {
    std::vector<std::string> task_ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) {
            return {};
        }

        const char* select_sql = interrupted_only
            ? "SELECT task_id FROM resume_records WHERE state = 'interrupted' ORDER BY interrupted_at;"
            : "SELECT task_id FROM resume_records ORDER BY created_at;";

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR("Cannot list resume records: {}", sqlite3_errmsg(db_));
            return {};
        }
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            task_ids.push_back(column_text(stmt, 0));
        }
        sqlite3_finalize(stmt);
    }

    std::vector<ResumeRecord> records;
    records.reserve(task_ids.size());
    for (const auto& task_id : task_ids) {
        if (auto record = load(task_id)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

core::Result ResumeManager::remove(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Resume ledger");
    }

    sqlite3_stmt* stmt = nullptr;
    const char* delete_sql = "DELETE FROM resume_records WHERE task_id = ?;";
    if (sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error("Prepare resume removal");
    }

    sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_STATIC);
    int step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    // Removing an absent record is not an error.
    if (step != SQLITE_DONE) {
        return sqlite_error("Remove resume record " + task_id);
    }
    return core::Result();
}

core::Result ResumeManager::remove_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Resume ledger");
    }
    return exec("DELETE FROM resume_records;");
}

std::size_t ResumeManager::purge_expired(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* delete_sql = "DELETE FROM resume_records WHERE state = 'interrupted' AND expires_at <= ?;";
    if (sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Cannot purge resume records: {}", sqlite3_errmsg(db_));
        return 0;
    }

    sqlite3_bind_int64(stmt, 1, TimeUtils::to_unix_millis(now));
    int step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (step != SQLITE_DONE) {
        LOG_ERROR("Cannot purge resume records: {}", sqlite3_errmsg(db_));
        return 0;
    }

    auto purged = static_cast<std::size_t>(sqlite3_changes(db_));
    if (purged > 0) {
        LOG_INFO("Purged {} expired resume records", purged);
    }
    return purged;
}

core::Result ResumeManager::validate(ResumeRecord& record, const ChunkManager& chunk_manager) {
    if (!record.file.is_consistent() || record.file.hash != record.file_hash) {
        return core::Result(core::ErrorCode::VERIFICATION_ERROR,
                            "Resume record " + record.task_id + " has an inconsistent chunk table");
    }

    if (record.direction == ResumeRecord::Direction::Send) {
        auto size = core::utils::FileUtils::file_size(record.source_path);
        if (!size) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Source file gone: " + record.source_path);
        }
        if (*size != record.file.size) {
            return core::Result(core::ErrorCode::VERIFICATION_ERROR,
                                "Source file size changed: " + record.source_path);
        }

        crypto::Sha256Hash hash;
        auto result = crypto::Sha256Hasher::hash_file(record.source_path, hash);
        if (!result) {
            return result;
        }
        if (crypto::hash_utils::hash_to_hex(hash) != record.file_hash) {
            return core::Result(core::ErrorCode::VERIFICATION_ERROR,
                                "Source file content changed: " + record.source_path);
        }
        return core::Result();
    }

    auto partial = StorageConfig::get_partial_path(record.save_path);
    if (!core::utils::FileUtils::exists(partial)) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Partial file gone: " + partial.string());
    }

    std::vector<std::uint32_t> indices;
    indices.reserve(record.completed_chunks.size());
    for (const auto& [index, hash] : record.completed_chunks) {
        const auto* info = record.file.chunk(index);
        if (!info || info->hash != hash) {
            return core::Result(core::ErrorCode::VERIFICATION_ERROR,
                                "Chunk " + std::to_string(index) + " does not belong to " + record.file.name);
        }
        indices.push_back(index);
    }

    std::vector<std::uint32_t> failed;
    auto result = chunk_manager.verify_written_chunks(partial, record.file, indices, failed);
    if (!result) {
        return result;
    }
    if (failed.empty()) {
        return core::Result();
    }

    LOG_WARN("Resume record {}: {} committed chunks of {} no longer verify and will be received again",
             record.task_id, failed.size(), record.file.name);
    result = forget_chunks(record.task_id, failed);
    if (!result) {
        return result;
    }
    for (auto index : failed) {
        record.completed_chunks.erase(index);
    }
    return core::Result();
}

std::size_t ResumeManager::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM resume_records;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    std::size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

} // namespace puresend::storage
