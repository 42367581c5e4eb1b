#include "puresend/storage/chunk_manager.hpp"
#include "puresend/crypto/hash.hpp"
#include "puresend/crypto/random.hpp"
#include "puresend/core/logger.hpp"
#include <fstream>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace puresend::storage {

namespace {
    // Owns a POSIX descriptor for the positional I/O paths.
    class FileDescriptor {
    public:
        explicit FileDescriptor(int fd) : fd_(fd) {}
        ~FileDescriptor() {
            if (fd_ >= 0) {
                ::close(fd_);
            }
        }

        FileDescriptor(const FileDescriptor&) = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        int get() const { return fd_; }
        bool valid() const { return fd_ >= 0; }

        int release_and_close() {
            int rc = ::close(fd_);
            fd_ = -1;
            return rc;
        }

    private:
        int fd_;
    };

    std::string errno_message(const std::string& what, const std::filesystem::path& path) {
        return what + " " + path.string() + ": " + std::strerror(errno);
    }
}

ChunkBitmap::ChunkBitmap(std::size_t chunk_count) {
    reset(chunk_count);
}

void ChunkBitmap::reset(std::size_t chunk_count) {
    bits_.assign(chunk_count, false);
    count_ = 0;
}

bool ChunkBitmap::mark(std::size_t index) {
    if (index >= bits_.size()) {
        return false;
    }
    if (!bits_[index]) {
        bits_[index] = true;
        ++count_;
    }
    return true;
}

void ChunkBitmap::clear(std::size_t index) {
    if (index < bits_.size() && bits_[index]) {
        bits_[index] = false;
        --count_;
    }
}

bool ChunkBitmap::test(std::size_t index) const {
    return index < bits_.size() && bits_[index];
}

std::optional<std::size_t> ChunkBitmap::first_missing() const {
    for (std::size_t i = 0; i < bits_.size(); ++i) {
        if (!bits_[i]) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<std::uint32_t> ChunkBitmap::set_indices() const {
    std::vector<std::uint32_t> indices;
    indices.reserve(count_);
    for (std::size_t i = 0; i < bits_.size(); ++i) {
        if (bits_[i]) {
            indices.push_back(static_cast<std::uint32_t>(i));
        }
    }
    return indices;
}

ChunkManager::ChunkManager(std::uint32_t chunk_size) : chunk_size_(chunk_size) {
}

ChunkManager::ChunkManager(const StorageConfig& config)
    : chunk_size_(config.chunk_size) {
}

core::Result ChunkManager::chunk_file(const std::filesystem::path& file_path,
                                      FileMetadata& metadata,
                                      const std::atomic<bool>* cancel_flag) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return core::Result(core::ErrorCode::IO_ERROR, "Not a readable regular file: " + file_path.string());
    }

    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot stat " + file_path.string() + ": " + ec.message());
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot open " + file_path.string());
    }

    auto chunks = build_chunk_table(file_size, chunk_size_);

    crypto::Sha256Hasher file_hasher;
    auto result = file_hasher.initialize();
    if (!result) {
        return result;
    }

    std::vector<std::uint8_t> buffer(chunk_size_);
    for (auto& info : chunks) {
        if (cancel_flag && cancel_flag->load()) {
            return core::Result(core::ErrorCode::CANCELLED, "Hashing cancelled");
        }

        auto length = static_cast<std::size_t>(info.size);
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::size_t>(file.gcount()) != length) {
            return core::Result(core::ErrorCode::IO_ERROR,
                                "File changed while hashing: " + file_path.string());
        }

        std::span<const std::uint8_t> data(buffer.data(), length);
        info.hash = crypto::hash_utils::hash_hex(data);
        result = file_hasher.update(data);
        if (!result) {
            return result;
        }
    }

    metadata.name = file_path.filename().string();
    metadata.size = file_size;
    metadata.mime_type = infer_mime_type(metadata.name);
    metadata.hash = crypto::hash_utils::hash_to_hex(file_hasher.finalize());
    metadata.chunk_size = chunk_size_;
    metadata.chunks = std::move(chunks);
    metadata.path = std::filesystem::absolute(file_path, ec).string();
    // Identity is per prepared file, not per content: two copies of the same bytes
    // must stay distinct entries in a share.
    if (metadata.id.empty()) {
        metadata.id = crypto::SecureRandom::generate_id(16);
    }

    return core::Result();
}

core::Result ChunkManager::read_chunk(const std::filesystem::path& file_path,
                                      const FileMetadata& metadata,
                                      std::size_t chunk_index,
                                      std::vector<std::uint8_t>& chunk_data) const {
    const auto* info = metadata.chunk(chunk_index);
    if (!info) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                            "Chunk index " + std::to_string(chunk_index) + " out of range");
    }

    FileDescriptor fd(::open(file_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return core::Result(core::ErrorCode::IO_ERROR, errno_message("Cannot open", file_path));
    }

    chunk_data.resize(static_cast<std::size_t>(info->size));
    std::size_t done = 0;
    while (done < chunk_data.size()) {
        auto n = ::pread(fd.get(), chunk_data.data() + done, chunk_data.size() - done,
                         static_cast<off_t>(info->offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return core::Result(core::ErrorCode::IO_ERROR, errno_message("Read failed on", file_path));
        }
        if (n == 0) {
            return core::Result(core::ErrorCode::IO_ERROR,
                                "Unexpected end of file in chunk " + std::to_string(chunk_index));
        }
        done += static_cast<std::size_t>(n);
    }

    return core::Result();
}

core::Result ChunkManager::write_chunk(const std::filesystem::path& file_path,
                                       const FileMetadata& metadata,
                                       std::size_t chunk_index,
                                       std::span<const std::uint8_t> chunk_data) const {
    const auto* info = metadata.chunk(chunk_index);
    if (!info) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                            "Chunk index " + std::to_string(chunk_index) + " out of range");
    }
    return write_chunk(file_path, *info, chunk_data);
}

core::Result ChunkManager::write_chunk(const std::filesystem::path& file_path,
                                       const ChunkInfo& info,
                                       std::span<const std::uint8_t> chunk_data) const {
    if (chunk_data.size() != info.size) {
        return core::Result(core::ErrorCode::VERIFICATION_ERROR,
                            "Chunk " + std::to_string(info.index) + " has " +
                            std::to_string(chunk_data.size()) + " bytes, expected " +
                            std::to_string(info.size));
    }

    FileDescriptor fd(::open(file_path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        return core::Result(core::ErrorCode::IO_ERROR, errno_message("Cannot open", file_path));
    }

    std::size_t done = 0;
    while (done < chunk_data.size()) {
        auto n = ::pwrite(fd.get(), chunk_data.data() + done, chunk_data.size() - done,
                          static_cast<off_t>(info.offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return core::Result(core::ErrorCode::IO_ERROR, errno_message("Write failed on", file_path));
        }
        done += static_cast<std::size_t>(n);
    }

    if (::fsync(fd.get()) != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, errno_message("fsync failed on", file_path));
    }

    if (fd.release_and_close() != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, errno_message("Close failed on", file_path));
    }

    return core::Result();
}

core::Result ChunkManager::prepare_destination(const std::filesystem::path& file_path,
                                               std::uint64_t file_size) const {
    std::error_code ec;
    auto parent = file_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return core::Result(core::ErrorCode::IO_ERROR,
                                "Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    FileDescriptor fd(::open(file_path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        return core::Result(core::ErrorCode::IO_ERROR, errno_message("Cannot create", file_path));
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, errno_message("Cannot stat", file_path));
    }

    if (static_cast<std::uint64_t>(st.st_size) != file_size &&
        ::ftruncate(fd.get(), static_cast<off_t>(file_size)) != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, errno_message("Cannot size", file_path));
    }

    return core::Result();
}

bool ChunkManager::verify_chunk(std::span<const std::uint8_t> chunk_data,
                                const std::string& expected_hash) {
    return crypto::hash_utils::verify_hash_hex(chunk_data, expected_hash);
}

core::Result ChunkManager::verify_written_chunks(const std::filesystem::path& file_path,
                                                 const FileMetadata& metadata,
                                                 const std::vector<std::uint32_t>& chunk_indices,
                                                 std::vector<std::uint32_t>& failed) const {
    failed.clear();
    if (!std::filesystem::exists(file_path)) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Partial file missing: " + file_path.string());
    }

    std::vector<std::uint8_t> buffer;
    for (auto index : chunk_indices) {
        const auto* info = metadata.chunk(index);
        if (!info) {
            failed.push_back(index);
            continue;
        }

        auto result = read_chunk(file_path, metadata, index, buffer);
        if (!result || !verify_chunk(buffer, info->hash)) {
            LOG_DEBUG("Chunk {} of {} failed re-verification", index, file_path.string());
            failed.push_back(index);
        }
    }

    return core::Result();
}

} // namespace puresend::storage
