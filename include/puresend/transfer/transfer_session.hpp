#pragma once

#include "transfer_manager.hpp"
#include "../network/connection.hpp"
#include "../storage/chunk_manager.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace puresend::transfer {

// Receiving half of one incoming connection: reads the offer, waits for approval, then
// verifies, writes and acknowledges chunks until the file is complete.
class TransferSession {
public:
    explicit TransferSession(TransferManager& manager);

    void run(network::tcp::socket& socket);

private:
    enum class Decision { Accepted, Rejected, TimedOut, Cancelled };

    void handle_offer(const network::FileOfferMessage& offer, storage::FileMetadata file);

    // False when the task id is taken by a task that cannot take this connection.
    bool register_task(const network::FileOfferMessage& offer, bool resume);
    Decision wait_for_decision(const network::FileOfferMessage& offer);

    // Streams chunks after the offer was accepted; returns the status the task ends in.
    TaskStatus receive_chunks(std::uint32_t start_chunk, core::Result& cause);
    core::Result finalize();

    void reject(const std::string& task_id, const std::string& reason);
    void send_error(network::ErrorCode code, const std::string& message);
    core::Result send_ack(std::uint32_t chunk_index, bool ok, const std::string& reason = "");
    void drop_ledger_record();

    // Ends the task; `runtime_` is gone once this returns.
    void finish(TaskStatus status, const core::Result& cause);

    TransferManager& manager_;
    network::Connection connection_;
    std::string peer_ip_;

    std::string task_id_;
    storage::FileMetadata file_;
    std::filesystem::path destination_;
    std::filesystem::path partial_;
    storage::ChunkBitmap received_;
    std::uint64_t received_bytes_ = 0;
    std::unique_ptr<crypto::SessionCipher> cipher_;
    bool inflate_ = false;
    TransferManager::TaskRuntime* runtime_ = nullptr;
};

} // namespace puresend::transfer
