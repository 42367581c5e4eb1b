#pragma once

#include "file_metadata.hpp"
#include "../core/error.hpp"
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <cstdint>

struct sqlite3;

namespace puresend::storage {

class ChunkManager;

// Persisted state of one transfer that may be continued later.
//
// The three resume concerns are kept apart: `resume_offset` is the durably committed
// contiguous prefix, `completed_chunks` maps every committed chunk to the hash it was
// verified against, and `file_hash` pins the identity of the source content.
struct ResumeRecord {
    enum class Direction { Send, Receive };
    enum class State { Active, Interrupted };

    std::string task_id;
    Direction direction = Direction::Send;
    State state = State::Active;

    FileMetadata file;
    std::string file_hash;
    std::uint64_t resume_offset = 0;
    std::map<std::uint32_t, std::string> completed_chunks;

    std::string peer_id;
    std::string peer_name;
    std::string peer_ip;
    std::uint16_t peer_port = 0;

    std::string source_path; // sending side
    std::string save_path;   // receiving side, final destination
    bool encrypted = false;

    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point interrupted_at;
    std::chrono::system_clock::time_point expires_at;

    // Index of the first chunk not yet committed; equals the chunk count when nothing is missing.
    std::uint32_t first_missing_chunk() const;

    // Bytes covered by the contiguous committed prefix.
    std::uint64_t contiguous_offset() const;
};

const char* to_string(ResumeRecord::Direction direction);

class ResumeManager {
public:
    explicit ResumeManager(const std::filesystem::path& database_path,
                           std::chrono::hours expiry = std::chrono::hours(24));
    ~ResumeManager();

    ResumeManager(const ResumeManager&) = delete;
    ResumeManager& operator=(const ResumeManager&) = delete;

    core::Result initialize();

    // Inserts or replaces the record header together with its completed chunk set.
    core::Result save(const ResumeRecord& record);

    // Adds one durably written (receiver) or acknowledged (sender) chunk and advances the offset.
    core::Result commit_chunk(const std::string& task_id, std::uint32_t chunk_index,
                              const std::string& chunk_hash);

    // Drops chunks that failed re-verification and recomputes the offset.
    core::Result forget_chunks(const std::string& task_id, const std::vector<std::uint32_t>& chunk_indices);

    core::Result mark_interrupted(const std::string& task_id,
                                  std::chrono::system_clock::time_point when = std::chrono::system_clock::now());
    core::Result mark_active(const std::string& task_id);

    // Records left Active by a previous process are turned into Interrupted ones.
    std::size_t recover_after_restart();

    std::optional<ResumeRecord> load(const std::string& task_id);
    std::vector<ResumeRecord> list(bool interrupted_only = false);

    core::Result remove(const std::string& task_id);
    core::Result remove_all();
    std::size_t purge_expired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Source file unchanged (send) or partial file still present (receive). Committed receive
    // chunks that no longer verify are forgotten here and in `record`, so they arrive again.
    core::Result validate(ResumeRecord& record, const ChunkManager& chunk_manager);

    std::size_t count();

    std::chrono::hours expiry() const { return expiry_; }

private:
    core::Result exec(const char* sql);
    void rollback();
    core::Result create_tables();
    core::Result update_offset_locked(const std::string& task_id);
    std::map<std::uint32_t, std::string> load_chunks_locked(const std::string& task_id);
    core::Result sqlite_error(const std::string& context) const;

    std::filesystem::path db_path_;
    std::chrono::hours expiry_;
    sqlite3* db_;
    std::mutex mutex_;
};

} // namespace puresend::storage
