#include "puresend/transfer/transfer_session.hpp"
#include "puresend/crypto/hash.hpp"
#include "puresend/crypto/session_cipher.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/utils.hpp"
#include <algorithm>

namespace puresend::transfer {

using core::utils::FileUtils;
using storage::ResumeRecord;

namespace {
    std::span<const std::uint8_t> as_bytes(const std::string& text) {
        return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
    }
}

TransferSession::TransferSession(TransferManager& manager)
    : manager_(manager)
    , connection_(manager.settings_.io_timeout) {
}

void TransferSession::run(network::tcp::socket& socket) {
    auto result = connection_.adopt(socket);
    if (!result) {
        LOG_WARN("Dropping incoming connection: {}", result.describe());
        return;
    }

    manager_.register_connection(&connection_);
    peer_ip_ = connection_.get_remote_address();

    network::Frame frame;
    result = connection_.receive(frame);
    if (!result) {
        // Liveness probes connect and hang up without an offer.
        LOG_DEBUG("Connection from {} closed before an offer: {}", peer_ip_, result.describe());
    } else if (frame.header.type != network::MessageType::FILE_OFFER) {
        send_error(network::ErrorCode::INVALID_MESSAGE,
                   std::string("Expected FILE_OFFER, got ") + network::to_string(frame.header.type));
    } else {
        std::optional<network::FileOfferMessage> offer;
        storage::FileMetadata file;
        try {
            offer = network::FileOfferMessage::deserialize(frame.payload);
            file = storage::FileMetadata::deserialize(offer->metadata);
        } catch (const std::exception& e) {
            LOG_WARN("Malformed offer from {}: {}", peer_ip_, e.what());
            send_error(network::ErrorCode::INVALID_MESSAGE, e.what());
            offer.reset();
        }

        if (offer) {
            handle_offer(*offer, std::move(file));
        }
    }

    connection_.close();
    manager_.unregister_connection(&connection_);
}

void TransferSession::handle_offer(const network::FileOfferMessage& offer, storage::FileMetadata file) {
    if (offer.task_id.empty() || !file.is_consistent()) {
        send_error(network::ErrorCode::INVALID_MESSAGE, "Offer carries an inconsistent chunk table");
        return;
    }

    file.path.reset();
    task_id_ = offer.task_id;
    file_ = file;

    std::optional<ResumeRecord> record;
    if (offer.resume) {
        record = manager_.ledger_->load(task_id_);
        if (record && record->direction != ResumeRecord::Direction::Receive) {
            record.reset();
        }
        if (record && record->file_hash != file_.hash) {
            LOG_WARN("Task {}: resume offer for different content, dropping resume state", task_id_);
            drop_ledger_record();
            record.reset();
        }
    }

    if (!register_task(offer, record.has_value())) {
        reject(task_id_, "Task " + task_id_ + " already exists");
        return;
    }

    LOG_INFO("Task {}: {} offers {} ({}){}", task_id_, peer_ip_, file_.name,
             core::utils::StringUtils::format_bytes(file_.size), record ? " to resume" : "");

    bool auto_receive = false;
    bool overwrite = false;
    std::filesystem::path directory;
    {
        std::lock_guard<std::mutex> lock(manager_.receive_mutex_);
        auto_receive = manager_.settings_.auto_receive;
        overwrite = manager_.settings_.overwrite;
        directory = manager_.storage_.receive_directory;
    }

    // Resume offers for a known record are taken without asking again.
    auto decision = (record || auto_receive) ? Decision::Accepted : wait_for_decision(offer);
    if (decision != Decision::Accepted) {
        std::string reason;
        switch (decision) {
            case Decision::Rejected: reason = "Rejected by receiver"; break;
            case Decision::TimedOut: reason = "Offer was not answered in time"; break;
            default: reason = "Cancelled by receiver"; break;
        }
        reject(task_id_, reason);
        finish(decision == Decision::TimedOut ? TaskStatus::Failed : TaskStatus::Cancelled,
               core::Result(core::ErrorCode::REJECTED, reason));
        return;
    }

    if (record) {
        destination_ = record->save_path;
    } else {
        if (!FileUtils::create_directories(directory)) {
            reject(task_id_, "Receive directory unavailable");
            finish(TaskStatus::Failed, core::Result(core::ErrorCode::IO_ERROR,
                                                    "Cannot create " + directory.string()));
            return;
        }

        storage::StorageConfig target_storage = manager_.storage_;
        target_storage.receive_directory = directory;
        if (!target_storage.has_sufficient_space(file_.size)) {
            reject(task_id_, "Not enough disk space");
            finish(TaskStatus::Failed, core::Result(core::ErrorCode::CAPACITY_ERROR,
                                                    "Not enough disk space for " + file_.name));
            return;
        }

        auto name = FileUtils::sanitize_filename(file_.name);
        if (name.empty()) {
            name = "received_file";
        }
        destination_ = overwrite ? directory / name : FileUtils::unique_path(directory / name);
    }
    partial_ = storage::StorageConfig::get_partial_path(destination_);

    auto result = manager_.chunk_manager_.prepare_destination(partial_, file_.size);
    if (!result) {
        reject(task_id_, "Cannot write destination file");
        drop_ledger_record();
        finish(TaskStatus::Failed, result);
        return;
    }

    received_.reset(file_.chunk_count());
    received_bytes_ = 0;
    if (record) {
        std::vector<std::uint32_t> indices;
        for (const auto& [index, hash] : record->completed_chunks) {
            indices.push_back(index);
        }

        std::vector<std::uint32_t> failed;
        result = manager_.chunk_manager_.verify_written_chunks(partial_, file_, indices, failed);
        if (!result) {
            failed = indices;
        }
        if (!failed.empty()) {
            LOG_WARN("Task {}: {} written chunks failed re-verification", task_id_, failed.size());
            auto forgotten = manager_.ledger_->forget_chunks(task_id_, failed);
            if (!forgotten) {
                LOG_WARN("Task {}: {}", task_id_, forgotten.describe());
            }
        }

        for (auto index : indices) {
            const auto* info = file_.chunk(index);
            if (info && std::find(failed.begin(), failed.end(), index) == failed.end() && received_.mark(index)) {
                received_bytes_ += info->size;
            }
        }
    }

    auto start_chunk = static_cast<std::uint32_t>(received_.first_missing().value_or(file_.chunk_count()));

    network::FileResponseMessage reply;
    reply.task_id = task_id_;
    reply.accepted = true;
    reply.start_chunk = start_chunk;
    reply.compressed = offer.compressed;
    inflate_ = offer.compressed;

    if (offer.encrypted) {
        crypto::X25519PublicKey peer_key{};
        if (offer.public_key.size() != peer_key.size()) {
            reject(task_id_, "Missing session key");
            finish(TaskStatus::Failed, core::Result(core::ErrorCode::PROTOCOL_ERROR, "Offer carries no session key"));
            return;
        }
        std::copy(offer.public_key.begin(), offer.public_key.end(), peer_key.begin());

        cipher_ = std::make_unique<crypto::SessionCipher>(crypto::SessionCipher::Role::Responder);
        result = cipher_->establish(peer_key);
        if (!result) {
            reject(task_id_, "Key exchange failed");
            finish(TaskStatus::Failed, result);
            return;
        }
        reply.public_key.assign(cipher_->public_key().begin(), cipher_->public_key().end());
    }

    manager_.update_task(task_id_, [&](TransferTask& task) {
        task.save_path = destination_.string();
        task.encrypted = cipher_ != nullptr;
    }, false);

    auto snapshot = manager_.get_task(task_id_);
    if (!snapshot) {
        reject(task_id_, "Task vanished");
        return;
    }
    ResumeRecord ledger_record = record ? *record : manager_.make_ledger_record(*snapshot);
    ledger_record.state = ResumeRecord::State::Active;
    ledger_record.save_path = destination_.string();
    ledger_record.completed_chunks.clear();
    for (auto index : received_.set_indices()) {
        ledger_record.completed_chunks.emplace(index, file_.chunks[index].hash);
    }
    auto saved = manager_.ledger_->save(ledger_record);
    if (!saved) {
        LOG_WARN("Task {}: resume state not persisted: {}", task_id_, saved.describe());
    }

    // Nothing left to receive: settle the file before confirming.
    core::Result cause;
    bool already_complete = received_.complete();
    if (already_complete) {
        cause = finalize();
        if (!cause) {
            reject(task_id_, cause.message);
            drop_ledger_record();
            finish(TaskStatus::Failed, cause);
            return;
        }
    }

    result = connection_.send(network::MessageType::FILE_RESPONSE, reply);
    if (!result) {
        if (record) {
            auto marked = manager_.ledger_->mark_interrupted(task_id_);
            if (!marked) {
                LOG_WARN("Task {}: {}", task_id_, marked.describe());
            }
            finish(TaskStatus::Interrupted, result);
        } else {
            drop_ledger_record();
            finish(TaskStatus::Failed, result);
        }
        return;
    }

    manager_.monitor_.start_session(task_id_, file_.size, received_bytes_);
    manager_.update_task(task_id_, [&](TransferTask& task) {
        task.status = TaskStatus::Transferring;
        task.resumed = record.has_value();
        task.resume_offset = received_bytes_;
        task.error.reset();
        task.set_transferred(received_bytes_);
    }, true);

    TaskStatus status = already_complete ? TaskStatus::Completed : receive_chunks(start_chunk, cause);
    manager_.monitor_.end_session(task_id_);

    if (status == TaskStatus::Interrupted) {
        auto marked = manager_.ledger_->mark_interrupted(task_id_);
        if (!marked) {
            LOG_ERROR("Task {}: failed to persist interruption: {}", task_id_, marked.describe());
        }
        LOG_WARN("Task {}: interrupted: {}", task_id_, cause.describe());
    } else {
        drop_ledger_record();
        if (status == TaskStatus::Completed) {
            LOG_INFO("Task {}: received {} into {}", task_id_, file_.name, destination_.string());
        } else {
            LOG_WARN("Task {}: {}: {}", task_id_, to_string(status), cause.describe());
        }
    }

    finish(status, cause);
}

bool TransferSession::register_task(const network::FileOfferMessage& offer, bool resume) {
    std::optional<TransferProgress> event;
    {
        std::lock_guard<std::mutex> lock(manager_.tasks_mutex_);
        auto it = manager_.tasks_.find(task_id_);
        if (it != manager_.tasks_.end()) {
            auto& entry = it->second;
            bool reusable = resume &&
                            entry.task.direction == TransferDirection::Receive &&
                            !entry.runtime->active &&
                            (entry.task.status == TaskStatus::Pending ||
                             entry.task.status == TaskStatus::Interrupted);
            if (!reusable) {
                return false;
            }

            entry.runtime = std::make_unique<TransferManager::TaskRuntime>();
            entry.task.status = TaskStatus::Pending;
            entry.task.resumed = true;
            entry.task.error.reset();
            entry.task.peer = TaskPeer{offer.sender_id, offer.sender_name, peer_ip_, 0};
        } else {
            TransferTask task;
            task.id = task_id_;
            task.file = file_;
            task.direction = TransferDirection::Receive;
            task.peer = TaskPeer{offer.sender_id, offer.sender_name, peer_ip_, 0};
            task.status = TaskStatus::Pending;
            task.encrypted = offer.encrypted;
            task.resumable = true;
            task.resumed = resume;
            task.created_at = core::utils::TimeUtils::now();

            TransferManager::TaskEntry entry;
            entry.task = std::move(task);
            entry.runtime = std::make_unique<TransferManager::TaskRuntime>();
            it = manager_.tasks_.emplace(task_id_, std::move(entry)).first;
        }

        runtime_ = it->second.runtime.get();
        runtime_->active = true;
        event = make_progress(it->second.task);
    }

    manager_.emit(*event);
    return true;
}

TransferSession::Decision TransferSession::wait_for_decision(const network::FileOfferMessage& offer) {
    {
        std::lock_guard<std::mutex> lock(manager_.tasks_mutex_);
        runtime_->awaiting_decision = true;
    }

    IncomingOffer incoming;
    incoming.task_id = task_id_;
    incoming.sender_id = offer.sender_id;
    incoming.sender_name = offer.sender_name;
    incoming.sender_ip = peer_ip_;
    incoming.file = file_;
    incoming.encrypted = offer.encrypted;
    manager_.emit_offer(incoming);

    std::unique_lock<std::mutex> lock(manager_.tasks_mutex_);
    bool answered = manager_.decision_cv_.wait_for(lock, manager_.settings_.offer_timeout, [this] {
        return runtime_->decision.has_value() || runtime_->cancel_requested || manager_.shutting_down_;
    });
    runtime_->awaiting_decision = false;

    if (runtime_->cancel_requested || manager_.shutting_down_) {
        return Decision::Cancelled;
    }
    if (!answered) {
        return Decision::TimedOut;
    }
    return *runtime_->decision ? Decision::Accepted : Decision::Rejected;
}

TaskStatus TransferSession::receive_chunks(std::uint32_t start_chunk, core::Result& cause) {
    LOG_DEBUG("Task {}: expecting chunks from {}", task_id_, start_chunk);

    std::vector<std::uint8_t> plaintext;
    std::vector<std::uint8_t> inflated;
    std::uint64_t raw_bytes = 0;
    std::uint64_t wire_bytes = 0;

    while (true) {
        network::Frame frame;
        auto result = connection_.receive(frame);
        if (!result) {
            cause = result;
            if (runtime_->cancel_requested) {
                cause = core::Result(core::ErrorCode::CANCELLED, "Cancelled");
                return TaskStatus::Cancelled;
            }
            if (result.error == core::ErrorCode::NETWORK_ERROR || result.error == core::ErrorCode::CANCELLED) {
                return TaskStatus::Interrupted;
            }
            return TaskStatus::Failed;
        }

        if (frame.header.type == network::MessageType::HEARTBEAT) {
            continue;
        }

        if (frame.header.type == network::MessageType::CANCEL) {
            std::string reason;
            try {
                reason = network::CancelMessage::deserialize(frame.payload).reason;
            } catch (const std::exception& e) {
                LOG_DEBUG("Task {}: unreadable cancel notice: {}", task_id_, e.what());
            }
            cause = core::Result(core::ErrorCode::CANCELLED,
                                 "Cancelled by sender" + (reason.empty() ? "" : ": " + reason));
            return TaskStatus::Cancelled;
        }

        if (frame.header.type != network::MessageType::CHUNK_DATA) {
            send_error(network::ErrorCode::INVALID_MESSAGE,
                       std::string("Unexpected ") + network::to_string(frame.header.type));
            cause = core::Result(core::ErrorCode::PROTOCOL_ERROR,
                                 std::string("Unexpected ") + network::to_string(frame.header.type));
            return TaskStatus::Failed;
        }

        network::ChunkDataMessage chunk;
        try {
            chunk = network::ChunkDataMessage::deserialize(frame.payload);
        } catch (const std::exception& e) {
            send_error(network::ErrorCode::INVALID_MESSAGE, e.what());
            cause = core::Result(core::ErrorCode::PROTOCOL_ERROR, std::string("Bad CHUNK_DATA: ") + e.what());
            return TaskStatus::Failed;
        }

        if (runtime_->cancel_requested) {
            network::CancelMessage cancel{task_id_, "Cancelled by receiver"};
            auto notified = connection_.send(network::MessageType::CANCEL, cancel);
            if (!notified) {
                LOG_DEBUG("Task {}: cancel notice not delivered: {}", task_id_, notified.describe());
            }
            cause = core::Result(core::ErrorCode::CANCELLED, "Cancelled");
            return TaskStatus::Cancelled;
        }

        const auto* info = file_.chunk(chunk.chunk_index);
        if (chunk.task_id != task_id_ || !info) {
            send_error(network::ErrorCode::UNKNOWN_TASK, "Chunk does not belong to task " + task_id_);
            cause = core::Result(core::ErrorCode::PROTOCOL_ERROR,
                                 "Unexpected chunk " + std::to_string(chunk.chunk_index));
            return TaskStatus::Failed;
        }

        bool sealed = network::has_flag(frame.header.flags, network::MessageFlags::ENCRYPTED);
        if (sealed != (cipher_ != nullptr)) {
            send_error(network::ErrorCode::INVALID_MESSAGE, "Encryption flag does not match the session");
            cause = core::Result(core::ErrorCode::PROTOCOL_ERROR, "Encryption flag does not match the session");
            return TaskStatus::Failed;
        }

        std::span<const std::uint8_t> data = chunk.data;
        if (cipher_) {
            result = cipher_->open(chunk.chunk_index, chunk.data, as_bytes(task_id_), plaintext);
            if (!result) {
                auto acked = send_ack(chunk.chunk_index, false, "Chunk failed authentication");
                if (!acked) {
                    LOG_DEBUG("Task {}: negative acknowledgement not delivered: {}", task_id_, acked.describe());
                }
                cause = core::Result(core::ErrorCode::VERIFICATION_ERROR,
                                     "Chunk " + std::to_string(chunk.chunk_index) + " failed authentication");
                return TaskStatus::Failed;
            }
            data = plaintext;
        }

        std::size_t payload_size = data.size();
        if (network::has_flag(frame.header.flags, network::MessageFlags::COMPRESSED)) {
            if (!inflate_) {
                send_error(network::ErrorCode::INVALID_MESSAGE, "Compressed chunk in an uncompressed session");
                cause = core::Result(core::ErrorCode::PROTOCOL_ERROR, "Compressed chunk in an uncompressed session");
                return TaskStatus::Failed;
            }
            result = Compressor::decompress(data, info->size, inflated);
            if (!result) {
                auto acked = send_ack(chunk.chunk_index, false, "Chunk failed to inflate");
                if (!acked) {
                    LOG_DEBUG("Task {}: negative acknowledgement not delivered: {}", task_id_, acked.describe());
                }
                cause = core::Result(core::ErrorCode::VERIFICATION_ERROR,
                                     "Chunk " + std::to_string(chunk.chunk_index) + ": " + result.message);
                return TaskStatus::Failed;
            }
            data = inflated;
        }

        if (!storage::ChunkManager::verify_chunk(data, info->hash)) {
            auto acked = send_ack(chunk.chunk_index, false, "Chunk hash mismatch");
            if (!acked) {
                LOG_DEBUG("Task {}: negative acknowledgement not delivered: {}", task_id_, acked.describe());
            }
            cause = core::Result(core::ErrorCode::VERIFICATION_ERROR,
                                 "Chunk " + std::to_string(chunk.chunk_index) + " hash mismatch");
            return TaskStatus::Failed;
        }

        result = manager_.chunk_manager_.write_chunk(partial_, file_, chunk.chunk_index, data);
        if (!result) {
            send_error(network::ErrorCode::STORAGE_FAILED, result.message);
            cause = result;
            return TaskStatus::Failed;
        }

        auto committed = manager_.ledger_->commit_chunk(task_id_, chunk.chunk_index, info->hash);
        if (!committed) {
            LOG_WARN("Task {}: chunk {} not recorded: {}", task_id_, chunk.chunk_index, committed.describe());
        }

        if (!received_.test(chunk.chunk_index) && received_.mark(chunk.chunk_index)) {
            received_bytes_ += info->size;
        }

        raw_bytes += info->size;
        wire_bytes += payload_size;
        std::optional<double> ratio;
        if (inflate_) {
            ratio = static_cast<double>(wire_bytes) / static_cast<double>(raw_bytes);
        }

        if (received_.complete()) {
            auto settled = finalize();
            if (!settled) {
                auto acked = send_ack(chunk.chunk_index, false, settled.message);
                if (!acked) {
                    LOG_DEBUG("Task {}: negative acknowledgement not delivered: {}", task_id_, acked.describe());
                }
                cause = settled;
                return TaskStatus::Failed;
            }

            if (ratio) {
                manager_.update_task(task_id_, [&](TransferTask& task) {
                    task.compression_ratio = ratio;
                }, false);
            }

            // The file is in place; a lost final acknowledgement does not undo that.
            auto acked = send_ack(chunk.chunk_index, true);
            if (!acked) {
                LOG_WARN("Task {}: final acknowledgement not delivered: {}", task_id_, acked.describe());
            }
            cause = core::Result();
            return TaskStatus::Completed;
        }

        result = send_ack(chunk.chunk_index, true);
        if (!result) {
            cause = result;
            return result.error == core::ErrorCode::PROTOCOL_ERROR ? TaskStatus::Failed : TaskStatus::Interrupted;
        }

        manager_.record_bytes(task_id_, info->size, received_bytes_, ratio);
    }
}

core::Result TransferSession::finalize() {
    crypto::Sha256Hash hash{};
    auto result = crypto::Sha256Hasher::hash_file(partial_, hash);
    if (!result) {
        return result;
    }
    if (crypto::hash_utils::hash_to_hex(hash) != file_.hash) {
        return core::Result(core::ErrorCode::VERIFICATION_ERROR, "Whole-file hash mismatch for " + file_.name);
    }

    bool overwrite = false;
    {
        std::lock_guard<std::mutex> lock(manager_.receive_mutex_);
        overwrite = manager_.settings_.overwrite;
    }

    auto target = destination_;
    if (!overwrite && FileUtils::exists(target)) {
        target = FileUtils::unique_path(destination_);
    }

    std::error_code ec;
    std::filesystem::rename(partial_, target, ec);
    if (ec) {
        return core::Result(core::ErrorCode::IO_ERROR,
                            "Cannot move " + partial_.string() + " into place: " + ec.message());
    }

    destination_ = target;
    manager_.update_task(task_id_, [&](TransferTask& task) {
        task.save_path = destination_.string();
    }, false);
    return core::Result();
}

void TransferSession::reject(const std::string& task_id, const std::string& reason) {
    network::FileResponseMessage reply;
    reply.task_id = task_id;
    reply.accepted = false;
    reply.reason = reason;

    auto result = connection_.send(network::MessageType::FILE_RESPONSE, reply);
    if (!result) {
        LOG_DEBUG("Rejection of {} not delivered: {}", task_id, result.describe());
    }
}

void TransferSession::send_error(network::ErrorCode code, const std::string& message) {
    network::ErrorMessage error;
    error.error_code = static_cast<std::uint32_t>(code);
    error.error_message = message;

    auto result = connection_.send(network::MessageType::ERROR_RESPONSE, error);
    if (!result) {
        LOG_DEBUG("Error report to {} not delivered: {}", peer_ip_, result.describe());
    }
}

core::Result TransferSession::send_ack(std::uint32_t chunk_index, bool ok, const std::string& reason) {
    network::ChunkAckMessage ack;
    ack.task_id = task_id_;
    ack.chunk_index = chunk_index;
    ack.ok = ok;
    ack.reason = reason;
    return connection_.send(network::MessageType::CHUNK_ACK, ack);
}

void TransferSession::drop_ledger_record() {
    auto removed = manager_.ledger_->remove(task_id_);
    if (!removed) {
        LOG_WARN("Failed to drop resume record of {}: {}", task_id_, removed.describe());
    }
}

void TransferSession::finish(TaskStatus status, const core::Result& cause) {
    manager_.finish_task(task_id_, status, cause);
    runtime_ = nullptr;
}

} // namespace puresend::transfer
