#include "puresend/transfer/transfer_manager.hpp"
#include "puresend/transfer/transfer_session.hpp"
#include "puresend/network/connection.hpp"
#include "puresend/network/network_info.hpp"
#include "puresend/crypto/random.hpp"
#include "puresend/crypto/session_cipher.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace puresend::transfer {

using storage::ResumeRecord;

namespace {
    std::span<const std::uint8_t> as_bytes(const std::string& text) {
        return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
    }
}

void to_json(nlohmann::json& j, const ReceivingState& state) {
    j = nlohmann::json{
        {"isReceiving", state.is_receiving},
        {"port", state.port},
        {"networkAddress", state.network_address},
        {"shareCode", state.share_code},
        {"autoReceive", state.auto_receive},
        {"fileOverwrite", state.file_overwrite}
    };
}

TransferManager::TransferManager(TransferSettings settings,
                                 storage::StorageConfig storage,
                                 std::shared_ptr<storage::ResumeManager> ledger,
                                 network::ChannelFactory channel_factory)
    : settings_(std::move(settings))
    , storage_(std::move(storage))
    , chunk_manager_(storage_)
    , ledger_(std::move(ledger))
    , channel_factory_(std::move(channel_factory))
    , monitor_()
    , shutting_down_(false) {
    if (!channel_factory_) {
        // The sender also waits while the receiving user decides.
        channel_factory_ = network::make_tcp_channel_factory(
            network::ChannelTimeouts{settings_.io_timeout, settings_.offer_timeout + std::chrono::seconds(15)});
    }
    receiving_.auto_receive = settings_.auto_receive;
    receiving_.file_overwrite = settings_.overwrite;
}

TransferManager::~TransferManager() {
    shutting_down_ = true;

    {
        std::lock_guard<std::mutex> lock(receive_mutex_);
        if (server_) {
            server_->stop();
            server_.reset();
        }
    }

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (auto& [id, entry] : tasks_) {
            if (entry.runtime->channel) {
                entry.runtime->channel->abort();
            }
            if (entry.runtime->worker.joinable()) {
                workers.push_back(std::move(entry.runtime->worker));
            }
        }
    }
    decision_cv_.notify_all();

    {
        std::lock_guard<std::mutex> lock(session_threads_mutex_);
        for (auto* connection : open_connections_) {
            connection->abort();
        }
    }

    for (auto& worker : workers) {
        worker.join();
    }
    reap_session_threads(true);
}

core::Result TransferManager::initialize() {
    if (!ledger_) {
        return core::Result(core::ErrorCode::STATE_ERROR, "Resume ledger missing");
    }

    auto recovered = ledger_->recover_after_restart();
    auto purged = ledger_->purge_expired();
    if (recovered > 0 || purged > 0) {
        LOG_INFO("Resume ledger: {} records recovered as interrupted, {} expired records purged",
                 recovered, purged);
    }
    return core::Result();
}

core::Result TransferManager::send(const storage::FileMetadata& metadata, const TaskPeer& peer,
                                   std::string& task_id) {
    if (!metadata.path || metadata.path->empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "File metadata carries no source path");
    }
    if (!metadata.is_consistent()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Inconsistent chunk table for " + metadata.name);
    }
    if (peer.ip.empty() || peer.port == 0) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Peer address and port are required");
    }

    TransferTask task;
    task.id = crypto::SecureRandom::generate_id(16);
    task.file = metadata;
    task.direction = TransferDirection::Send;
    task.peer = peer;
    task.status = TaskStatus::Pending;
    task.encrypted = settings_.encryption;
    task.resumable = true;
    task.created_at = core::utils::TimeUtils::now();
    task.source_path = *metadata.path;

    auto progress = make_progress(task);
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        TaskEntry entry;
        entry.task = task;
        entry.runtime = std::make_unique<TaskRuntime>();
        entry.runtime->active = true;
        auto& runtime = *entry.runtime;
        tasks_.emplace(task.id, std::move(entry));
        runtime.worker = std::thread(&TransferManager::run_send, this, task.id, false);
    }

    LOG_INFO("Sending {} ({}) to {}:{} as task {}", metadata.name,
             core::utils::StringUtils::format_bytes(metadata.size), peer.ip, peer.port, task.id);
    emit(progress);
    task_id = task.id;
    return core::Result();
}

void TransferManager::run_send(const std::string& task_id, bool resume) {
    TransferTask task;
    TaskRuntime* runtime = nullptr;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return;
        }
        task = it->second.task;
        runtime = it->second.runtime.get();
    }

    auto channel = channel_factory_();
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        runtime->channel = channel.get();
    }

    // A resume attempt that cannot get going leaves the task resumable.
    auto setup_failed = [&](const core::Result& cause) {
        channel->close();
        if (runtime->cancel_requested) {
            auto removed = ledger_->remove(task_id);
            if (!removed) {
                LOG_WARN("Failed to drop resume record of {}: {}", task_id, removed.describe());
            }
            finish_task(task_id, TaskStatus::Cancelled, core::Result(core::ErrorCode::CANCELLED, "Cancelled"));
        } else if (resume && (cause.error == core::ErrorCode::NETWORK_ERROR ||
                              cause.error == core::ErrorCode::CANCELLED)) {
            finish_task(task_id, TaskStatus::Interrupted, cause);
        } else {
            auto removed = ledger_->remove(task_id);
            if (!removed) {
                LOG_WARN("Failed to drop resume record of {}: {}", task_id, removed.describe());
            }
            finish_task(task_id, TaskStatus::Failed, cause);
        }
    };

    if (runtime->cancel_requested) {
        setup_failed(core::Result(core::ErrorCode::CANCELLED, "Cancelled"));
        return;
    }

    auto result = channel->open(task.peer->ip, task.peer->port);
    if (!result) {
        LOG_WARN("Task {}: cannot reach {}:{}: {}", task_id, task.peer->ip, task.peer->port, result.describe());
        setup_failed(result);
        return;
    }

    std::optional<ResumeRecord> record;
    if (resume) {
        record = ledger_->load(task_id);
    }

    network::FileOfferMessage offer;
    offer.task_id = task_id;
    offer.sender_id = settings_.local_id;
    offer.sender_name = settings_.local_name;
    auto wire_file = task.file;
    wire_file.path.reset();
    offer.metadata = wire_file.serialize();
    offer.resume = resume;
    offer.resume_chunk = record ? record->first_missing_chunk() : 0;

    auto deflate_level = Compressor(settings_.compression).level_for(task.file.mime_type);
    offer.compressed = deflate_level.has_value();

    std::unique_ptr<crypto::SessionCipher> cipher;
    if (task.encrypted) {
        cipher = std::make_unique<crypto::SessionCipher>(crypto::SessionCipher::Role::Initiator);
        offer.encrypted = true;
        offer.public_key.assign(cipher->public_key().begin(), cipher->public_key().end());
    }

    network::FileResponseMessage reply;
    result = channel->send_offer(offer, reply);
    if (!result) {
        LOG_WARN("Task {}: offer not accepted: {}", task_id, result.describe());
        setup_failed(result);
        return;
    }

    if (cipher) {
        crypto::X25519PublicKey peer_key{};
        if (reply.public_key.size() != peer_key.size()) {
            setup_failed(core::Result(core::ErrorCode::PROTOCOL_ERROR, "Receiver sent no session key"));
            return;
        }
        std::copy(reply.public_key.begin(), reply.public_key.end(), peer_key.begin());
        result = cipher->establish(peer_key);
        if (!result) {
            setup_failed(result);
            return;
        }
    }

    // An older or unwilling receiver leaves the flag unset.
    if (!reply.compressed) {
        deflate_level.reset();
    }

    std::uint32_t start_chunk = reply.start_chunk;
    if (start_chunk > task.file.chunk_count()) {
        setup_failed(core::Result(core::ErrorCode::PROTOCOL_ERROR,
                                  "Receiver asked to start at chunk " + std::to_string(start_chunk)));
        return;
    }

    // The receiver's view of what it holds is authoritative.
    ResumeRecord ledger_record = record ? *record : make_ledger_record(task);
    ledger_record.state = ResumeRecord::State::Active;
    for (auto it = ledger_record.completed_chunks.begin(); it != ledger_record.completed_chunks.end();) {
        it = it->first >= start_chunk ? ledger_record.completed_chunks.erase(it) : std::next(it);
    }
    for (std::uint32_t i = 0; i < start_chunk; ++i) {
        ledger_record.completed_chunks.emplace(i, task.file.chunks[i].hash);
    }
    auto saved = ledger_->save(ledger_record);
    if (!saved) {
        LOG_WARN("Task {}: resume state not persisted: {}", task_id, saved.describe());
    }

    auto offset = task.file.bytes_before(start_chunk);
    monitor_.start_session(task_id, task.file.size, offset);
    update_task(task_id, [&](TransferTask& t) {
        t.status = TaskStatus::Transferring;
        t.resumed = resume;
        t.resume_offset = offset;
        t.encrypted = cipher != nullptr;
        t.error.reset();
        t.set_transferred(offset);
    }, true);

    if (resume) {
        LOG_INFO("Task {}: resuming at chunk {}/{}", task_id, start_chunk, task.file.chunk_count());
    }
    if (deflate_level) {
        LOG_DEBUG("Task {}: deflating chunks at level {}", task_id, *deflate_level);
    }

    result = stream_chunks(task_id, *channel, task.file, task.source_path, start_chunk, cipher.get(),
                           deflate_level, *runtime);
    monitor_.end_session(task_id);

    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        runtime->channel = nullptr;
    }

    if (result) {
        channel->close();
        auto removed = ledger_->remove(task_id);
        if (!removed) {
            LOG_WARN("Failed to drop resume record of {}: {}", task_id, removed.describe());
        }
        LOG_INFO("Task {}: sent {} to {}", task_id, task.file.name, task.peer->ip);
        finish_task(task_id, TaskStatus::Completed, result);
        return;
    }

    bool interrupted = result.error == core::ErrorCode::NETWORK_ERROR ||
                       (result.error == core::ErrorCode::CANCELLED && shutting_down_ && !runtime->cancel_requested);
    if (interrupted) {
        channel->close();
        auto marked = ledger_->mark_interrupted(task_id);
        if (!marked) {
            LOG_ERROR("Task {}: failed to persist interruption: {}", task_id, marked.describe());
        }
        LOG_WARN("Task {}: interrupted: {}", task_id, result.describe());
        finish_task(task_id, TaskStatus::Interrupted, result);
        return;
    }

    if (result.error != core::ErrorCode::CANCELLED) {
        network::CancelMessage notice{task_id, result.message};
        auto notified = channel->send_cancel(notice);
        if (!notified) {
            LOG_DEBUG("Task {}: receiver not notified: {}", task_id, notified.describe());
        }
    }
    channel->close();

    auto removed = ledger_->remove(task_id);
    if (!removed) {
        LOG_WARN("Failed to drop resume record of {}: {}", task_id, removed.describe());
    }

    if (result.error == core::ErrorCode::CANCELLED) {
        LOG_INFO("Task {}: {}", task_id, result.message);
        finish_task(task_id, TaskStatus::Cancelled, result);
    } else {
        LOG_ERROR("Task {}: failed: {}", task_id, result.describe());
        finish_task(task_id, TaskStatus::Failed, result);
    }
}

core::Result TransferManager::stream_chunks(const std::string& task_id, network::TransferChannel& channel,
                                            const storage::FileMetadata& file, const std::string& source_path,
                                            std::uint32_t start_chunk, const crypto::SessionCipher* cipher,
                                            std::optional<int> deflate_level, TaskRuntime& runtime) {
    std::vector<std::uint8_t> data;
    std::vector<std::uint8_t> deflated;
    std::uint64_t raw_bytes = 0;
    std::uint64_t wire_bytes = 0;

    for (std::uint32_t index = start_chunk; index < file.chunk_count(); ++index) {
        if (runtime.cancel_requested) {
            network::CancelMessage cancel{task_id, "Cancelled by sender"};
            auto notified = channel.send_cancel(cancel);
            if (!notified) {
                LOG_DEBUG("Task {}: cancel notice not delivered: {}", task_id, notified.describe());
            }
            return core::Result(core::ErrorCode::CANCELLED, "Cancelled");
        }

        auto result = chunk_manager_.read_chunk(source_path, file, index, data);
        if (!result) {
            return result;
        }

        const auto& info = file.chunks[index];
        if (!storage::ChunkManager::verify_chunk(data, info.hash)) {
            return core::Result(core::ErrorCode::VERIFICATION_ERROR,
                                "Source file changed while sending (chunk " + std::to_string(index) + ")");
        }

        // A chunk that does not shrink goes as it is.
        bool compressed = false;
        if (deflate_level) {
            result = Compressor::compress(data, *deflate_level, deflated);
            if (!result) {
                return result;
            }
            if (deflated.size() < data.size()) {
                data.swap(deflated);
                compressed = true;
            }
        }
        raw_bytes += info.size;
        wire_bytes += data.size();

        network::ChunkDataMessage message;
        message.task_id = task_id;
        message.chunk_index = index;
        message.chunk_hash = info.hash;
        if (cipher) {
            result = cipher->seal(index, data, as_bytes(task_id), message.data);
            if (!result) {
                return result;
            }
        } else {
            message.data = std::move(data);
            data.clear();
        }

        network::ChunkAckMessage ack;
        result = channel.send_chunk(message, compressed, ack);
        if (!result) {
            return result;
        }
        if (!ack.ok) {
            return core::Result(core::ErrorCode::VERIFICATION_ERROR,
                                "Receiver rejected chunk " + std::to_string(index) +
                                (ack.reason.empty() ? "" : ": " + ack.reason));
        }

        auto committed = ledger_->commit_chunk(task_id, index, info.hash);
        if (!committed) {
            LOG_WARN("Task {}: chunk {} not recorded: {}", task_id, index, committed.describe());
        }

        std::optional<double> ratio;
        if (deflate_level && raw_bytes > 0) {
            ratio = static_cast<double>(wire_bytes) / static_cast<double>(raw_bytes);
        }
        record_bytes(task_id, info.size, file.bytes_before(index + 1), ratio);
    }

    return core::Result();
}

core::Result TransferManager::cancel(const std::string& task_id) {
    std::optional<TransferProgress> event;
    bool drop_record = false;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Unknown task " + task_id);
        }

        auto& task = it->second.task;
        auto& runtime = *it->second.runtime;
        if (is_terminal(task.status)) {
            return core::Result(core::ErrorCode::STATE_ERROR,
                                std::string("Task already ") + to_string(task.status));
        }

        if (!runtime.active) {
            // Interrupted, or a receive task waiting for the sender to come back.
            task.status = TaskStatus::Cancelled;
            task.resumable = false;
            task.error = "Cancelled";
            task.completed_at = core::utils::TimeUtils::now();
            event = make_progress(task);
            drop_record = true;
        } else {
            runtime.cancel_requested = true;
            if (task.status == TaskStatus::Pending && runtime.channel) {
                runtime.channel->abort();
            }
            if (runtime.awaiting_decision) {
                runtime.decision = false;
            }
        }
    }
    decision_cv_.notify_all();

    if (drop_record) {
        auto removed = ledger_->remove(task_id);
        if (!removed) {
            LOG_WARN("Failed to drop resume record of {}: {}", task_id, removed.describe());
        }
    }
    if (event) {
        emit(*event);
    }

    LOG_INFO("Task {}: cancellation requested", task_id);
    return core::Result();
}

core::Result TransferManager::remove_task(const std::string& task_id) {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Unknown task " + task_id);
        }

        // Interrupted tasks hold the resume record; cancel() them first.
        auto status = it->second.task.status;
        if (!is_terminal(status)) {
            return core::Result(core::ErrorCode::STATE_ERROR,
                                std::string("Cannot remove a ") + to_string(status) + " task");
        }
        if (it->second.runtime->active) {
            return core::Result(core::ErrorCode::STATE_ERROR, "Task " + task_id + " is still winding down");
        }

        worker = std::move(it->second.runtime->worker);
        tasks_.erase(it);
    }

    if (worker.joinable()) {
        worker.join();
    }
    LOG_DEBUG("Task {} removed", task_id);
    return core::Result();
}

std::size_t TransferManager::cleanup() {
    std::vector<std::thread> workers;
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (is_terminal(it->second.task.status) && !it->second.runtime->active) {
                if (it->second.runtime->worker.joinable()) {
                    workers.push_back(std::move(it->second.runtime->worker));
                }
                it = tasks_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    for (auto& worker : workers) {
        worker.join();
    }
    return removed;
}

std::vector<TransferTask> TransferManager::get_tasks() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);

    std::vector<TransferTask> tasks;
    tasks.reserve(tasks_.size());
    for (const auto& [id, entry] : tasks_) {
        tasks.push_back(entry.task);
    }
    std::sort(tasks.begin(), tasks.end(),
              [](const TransferTask& a, const TransferTask& b) { return a.created_at < b.created_at; });
    return tasks;
}

std::optional<TransferTask> TransferManager::get_task(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.task;
}

std::vector<TransferTask> TransferManager::get_resumable_tasks() {
    ledger_->purge_expired();

    std::vector<TransferTask> resumable;
    for (auto record : ledger_->list(true)) {
        auto valid = ledger_->validate(record, chunk_manager_);
        if (!valid) {
            LOG_WARN("Discarding resume record {}: {}", record.task_id, valid.describe());
            auto removed = ledger_->remove(record.task_id);
            if (!removed) {
                LOG_WARN("Failed to drop resume record of {}: {}", record.task_id, removed.describe());
            }

            std::optional<TransferProgress> event;
            {
                std::lock_guard<std::mutex> lock(tasks_mutex_);
                auto it = tasks_.find(record.task_id);
                if (it != tasks_.end() && it->second.task.status == TaskStatus::Interrupted &&
                    !it->second.runtime->active) {
                    auto& task = it->second.task;
                    task.status = TaskStatus::Failed;
                    task.resumable = false;
                    task.error = "Resume state invalid: " + valid.message;
                    task.completed_at = core::utils::TimeUtils::now();
                    event = make_progress(task);
                }
            }
            if (event) {
                emit(*event);
            }
            continue;
        }

        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(record.task_id);
        if (it == tasks_.end()) {
            auto rebuilt = rebuild_from_ledger(record);
            if (!rebuilt) {
                continue;
            }
            TaskEntry entry;
            entry.task = *rebuilt;
            entry.runtime = std::make_unique<TaskRuntime>();
            it = tasks_.emplace(record.task_id, std::move(entry)).first;
        }

        if (it->second.task.status != TaskStatus::Interrupted) {
            continue;
        }
        it->second.task.resumable = true;
        it->second.task.resume_offset = record.contiguous_offset();
        resumable.push_back(it->second.task);
    }

    return resumable;
}

core::Result TransferManager::resume_transfer(const std::string& task_id) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(task_id);
        if (it != tasks_.end() &&
            (it->second.task.status != TaskStatus::Interrupted || it->second.runtime->active)) {
            return core::Result(core::ErrorCode::STATE_ERROR,
                                std::string("Only interrupted tasks can be resumed; task is ") +
                                to_string(it->second.task.status));
        }
    }

    auto record = ledger_->load(task_id);
    if (!record) {
        return core::Result(core::ErrorCode::NOT_FOUND, "No resume state for task " + task_id);
    }

    auto invalidate = [&](const core::Result& cause) {
        auto removed = ledger_->remove(task_id);
        if (!removed) {
            LOG_WARN("Failed to drop resume record of {}: {}", task_id, removed.describe());
        }

        std::optional<TransferProgress> event;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            auto it = tasks_.find(task_id);
            if (it != tasks_.end()) {
                auto& task = it->second.task;
                task.status = TaskStatus::Failed;
                task.resumable = false;
                task.error = "Resume rejected: " + cause.message;
                task.completed_at = core::utils::TimeUtils::now();
                event = make_progress(task);
            }
        }
        if (event) {
            emit(*event);
        }
        return cause;
    };

    if (record->expires_at <= core::utils::TimeUtils::now()) {
        return invalidate(core::Result(core::ErrorCode::STATE_ERROR, "Resume state expired"));
    }

    // Receive chunks that no longer verify are dropped from the record and will be sent again.
    auto valid = ledger_->validate(*record, chunk_manager_);
    if (!valid) {
        LOG_WARN("Task {}: cannot resume: {}", task_id, valid.describe());
        return invalidate(valid);
    }

    std::thread previous;
    std::optional<TransferProgress> event;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            auto rebuilt = rebuild_from_ledger(*record);
            if (!rebuilt) {
                return core::Result(core::ErrorCode::VERIFICATION_ERROR, "Resume record of " + task_id + " is unusable");
            }
            TaskEntry entry;
            entry.task = *rebuilt;
            entry.runtime = std::make_unique<TaskRuntime>();
            it = tasks_.emplace(task_id, std::move(entry)).first;
        }

        auto& task = it->second.task;
        if (task.status != TaskStatus::Interrupted || it->second.runtime->active) {
            return core::Result(core::ErrorCode::STATE_ERROR, "Task " + task_id + " changed state");
        }

        previous = std::move(it->second.runtime->worker);
        it->second.runtime = std::make_unique<TaskRuntime>();

        task.status = TaskStatus::Pending;
        task.resumed = true;
        task.error.reset();
        task.speed = 0;
        task.estimated_time_remaining.reset();
        task.resume_offset = record->contiguous_offset();
        task.set_transferred(task.resume_offset);
        event = make_progress(task);

        if (task.direction == TransferDirection::Send) {
            it->second.runtime->active = true;
            it->second.runtime->worker = std::thread(&TransferManager::run_send, this, task_id, true);
        }
    }

    if (previous.joinable()) {
        previous.join();
    }
    emit(*event);

    LOG_INFO("Task {}: resuming from offset {}", task_id, record->contiguous_offset());
    return core::Result();
}

core::Result TransferManager::cleanup_resume_info(const std::optional<std::string>& task_id) {
    if (task_id) {
        return ledger_->remove(*task_id);
    }
    return ledger_->remove_all();
}

core::Result TransferManager::start_receiving(ReceivingState& state) {
    std::lock_guard<std::mutex> lock(receive_mutex_);

    if (server_ && server_->is_running()) {
        state = receiving_;
        return core::Result();
    }

    if (!core::utils::FileUtils::create_directories(storage_.receive_directory)) {
        return core::Result(core::ErrorCode::IO_ERROR,
                            "Cannot create receive directory " + storage_.receive_directory.string());
    }

    auto server = std::make_unique<network::TcpServer>("transfer", settings_.port);
    server->set_connection_handler([this](network::tcp::socket socket) {
        handle_connection(std::move(socket));
    });

    auto result = server->start();
    if (!result) {
        return result;
    }

    server_ = std::move(server);
    receiving_.is_receiving = true;
    receiving_.port = server_->get_port();
    receiving_.network_address = network::get_network_info().primary_address;
    receiving_.share_code = crypto::SecureRandom::generate_digits(6);
    state = receiving_;

    LOG_INFO("Receiving on {}:{} into {}", receiving_.network_address, receiving_.port,
             storage_.receive_directory.string());
    return core::Result();
}

core::Result TransferManager::stop_receiving() {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (auto& [id, entry] : tasks_) {
            if (entry.task.direction == TransferDirection::Receive &&
                entry.task.status == TaskStatus::Transferring) {
                return core::Result(core::ErrorCode::STATE_ERROR, "Receive transfers are in progress");
            }
        }
        for (auto& [id, entry] : tasks_) {
            if (entry.runtime->awaiting_decision) {
                entry.runtime->decision = false;
            }
        }
    }
    decision_cv_.notify_all();

    std::lock_guard<std::mutex> lock(receive_mutex_);
    if (server_) {
        server_->stop();
        server_.reset();
        LOG_INFO("Stopped receiving");
    }
    receiving_.is_receiving = false;
    receiving_.port = 0;
    receiving_.share_code.clear();
    return core::Result();
}

ReceivingState TransferManager::get_receiving_state() const {
    std::lock_guard<std::mutex> lock(receive_mutex_);
    return receiving_;
}

core::Result TransferManager::update_receive_directory(const std::filesystem::path& directory) {
    if (directory.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Receive directory must not be empty");
    }
    if (!core::utils::FileUtils::create_directories(directory)) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot create " + directory.string());
    }

    std::lock_guard<std::mutex> lock(receive_mutex_);
    storage_.receive_directory = directory;
    LOG_INFO("Receive directory set to {}", directory.string());
    return core::Result();
}

std::filesystem::path TransferManager::get_receive_directory() const {
    std::lock_guard<std::mutex> lock(receive_mutex_);
    return storage_.receive_directory;
}

void TransferManager::set_auto_receive(bool enabled) {
    std::lock_guard<std::mutex> lock(receive_mutex_);
    settings_.auto_receive = enabled;
    receiving_.auto_receive = enabled;
}

void TransferManager::set_overwrite(bool enabled) {
    std::lock_guard<std::mutex> lock(receive_mutex_);
    settings_.overwrite = enabled;
    receiving_.file_overwrite = enabled;
}

core::Result TransferManager::accept_incoming(const std::string& task_id) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto* runtime = find_runtime_locked(task_id);
        if (!runtime) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Unknown task " + task_id);
        }
        if (!runtime->awaiting_decision || runtime->decision) {
            return core::Result(core::ErrorCode::STATE_ERROR, "Task " + task_id + " is not waiting for approval");
        }
        runtime->decision = true;
    }
    decision_cv_.notify_all();
    return core::Result();
}

core::Result TransferManager::reject_incoming(const std::string& task_id) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto* runtime = find_runtime_locked(task_id);
        if (!runtime) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Unknown task " + task_id);
        }
        if (!runtime->awaiting_decision || runtime->decision) {
            return core::Result(core::ErrorCode::STATE_ERROR, "Task " + task_id + " is not waiting for approval");
        }
        runtime->decision = false;
    }
    decision_cv_.notify_all();
    return core::Result();
}

void TransferManager::set_progress_handler(ProgressHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    progress_handler_ = std::move(handler);
}

void TransferManager::set_offer_handler(OfferHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    offer_handler_ = std::move(handler);
}

void TransferManager::handle_connection(network::tcp::socket socket) {
    if (shutting_down_) {
        return;
    }

    reap_session_threads(false);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, done, socket = std::move(socket)]() mutable {
        TransferSession session(*this);
        session.run(socket);
        *done = true;
    });

    std::lock_guard<std::mutex> lock(session_threads_mutex_);
    session_threads_.push_back(SessionThread{std::move(thread), done});
}

void TransferManager::reap_session_threads(bool wait_all) {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(session_threads_mutex_);
        for (auto it = session_threads_.begin(); it != session_threads_.end();) {
            if (wait_all || *it->done) {
                finished.push_back(std::move(it->thread));
                it = session_threads_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& thread : finished) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void TransferManager::register_connection(network::Connection* connection) {
    std::lock_guard<std::mutex> lock(session_threads_mutex_);
    open_connections_.insert(connection);
    if (shutting_down_) {
        connection->abort();
    }
}

void TransferManager::unregister_connection(network::Connection* connection) {
    std::lock_guard<std::mutex> lock(session_threads_mutex_);
    open_connections_.erase(connection);
}

void TransferManager::update_task(const std::string& task_id,
                                  const std::function<void(TransferTask&)>& update,
                                  bool force_event) {
    std::optional<TransferProgress> event;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return;
        }

        update(it->second.task);

        auto now = std::chrono::steady_clock::now();
        auto& runtime = *it->second.runtime;
        if (force_event || now - runtime.last_progress >= settings_.progress_interval) {
            runtime.last_progress = now;
            event = make_progress(it->second.task);
        }
    }

    if (event) {
        emit(*event);
    }
}

void TransferManager::finish_task(const std::string& task_id, TaskStatus status, const core::Result& cause) {
    std::optional<TransferProgress> event;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return;
        }

        auto& task = it->second.task;
        auto& runtime = *it->second.runtime;
        runtime.active = false;
        runtime.channel = nullptr;
        runtime.awaiting_decision = false;

        task.status = status;
        task.speed = 0;
        if (status == TaskStatus::Completed) {
            task.set_transferred(task.file.size);
            task.estimated_time_remaining = std::chrono::milliseconds(0);
            task.resumable = false;
            task.error.reset();
        } else {
            task.estimated_time_remaining.reset();
            task.error = cause.success() ? std::string(to_string(status)) : cause.describe();
        }

        if (status == TaskStatus::Interrupted) {
            task.resumable = true;
            task.resume_offset = task.transferred_bytes;
        } else {
            task.completed_at = core::utils::TimeUtils::now();
            if (status != TaskStatus::Completed) {
                task.resumable = false;
            }
        }

        event = make_progress(task);
    }

    emit(*event);
}

void TransferManager::record_bytes(const std::string& task_id, std::uint64_t chunk_bytes,
                                   std::uint64_t transferred, std::optional<double> compression_ratio) {
    monitor_.on_bytes_transferred(task_id, chunk_bytes);
    auto stats = monitor_.get_session_stats(task_id);

    update_task(task_id, [&](TransferTask& task) {
        task.set_transferred(transferred);
        if (stats) {
            task.speed = stats->current_speed_bps;
            task.estimated_time_remaining = stats->estimated_time_remaining;
        }
        if (compression_ratio) {
            task.compression_ratio = compression_ratio;
        }
    }, false);
}

TransferManager::TaskRuntime* TransferManager::find_runtime_locked(const std::string& task_id) {
    auto it = tasks_.find(task_id);
    return it == tasks_.end() ? nullptr : it->second.runtime.get();
}

std::optional<TransferTask> TransferManager::rebuild_from_ledger(const ResumeRecord& record) const {
    if (!record.file.is_consistent()) {
        return std::nullopt;
    }

    TransferTask task;
    task.id = record.task_id;
    task.file = record.file;
    task.direction = record.direction == ResumeRecord::Direction::Send ? TransferDirection::Send
                                                                      : TransferDirection::Receive;
    task.peer = TaskPeer{record.peer_id, record.peer_name, record.peer_ip, record.peer_port};
    task.status = TaskStatus::Interrupted;
    task.resumable = true;
    task.resume_offset = record.contiguous_offset();
    task.encrypted = record.encrypted;
    task.created_at = record.created_at;
    task.error = "Interrupted";
    task.set_transferred(task.resume_offset);

    if (task.direction == TransferDirection::Send) {
        task.source_path = record.source_path;
        task.file.path = record.source_path;
    } else {
        task.save_path = record.save_path;
    }
    return task;
}

ResumeRecord TransferManager::make_ledger_record(const TransferTask& task) const {
    ResumeRecord record;
    record.task_id = task.id;
    record.direction = task.direction == TransferDirection::Send ? ResumeRecord::Direction::Send
                                                                 : ResumeRecord::Direction::Receive;
    record.state = ResumeRecord::State::Active;
    record.file = task.file;
    record.file_hash = task.file.hash;
    if (task.peer) {
        record.peer_id = task.peer->id;
        record.peer_name = task.peer->name;
        record.peer_ip = task.peer->ip;
        record.peer_port = task.peer->port;
    }
    record.source_path = task.source_path;
    record.save_path = task.save_path.value_or("");
    record.encrypted = task.encrypted;
    record.created_at = task.created_at;
    return record;
}

void TransferManager::emit(const TransferProgress& progress) {
    ProgressHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = progress_handler_;
    }
    if (handler) {
        handler(progress);
    }
}

void TransferManager::emit_offer(const IncomingOffer& offer) {
    OfferHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = offer_handler_;
    }
    if (handler) {
        handler(offer);
    }
}

} // namespace puresend::transfer
