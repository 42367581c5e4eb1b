#include "puresend/share/web_upload_server.hpp"
#include "puresend/share/html_pages.hpp"
#include "puresend/network/network_info.hpp"
#include "puresend/storage/storage_config.hpp"
#include "puresend/crypto/hash.hpp"
#include "puresend/crypto/random.hpp"
#include "puresend/core/config.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <span>
#include <stdexcept>

namespace puresend::share {

using core::utils::FileUtils;
using core::utils::StringUtils;

namespace {
    constexpr const char* STATUS_PREFIX = "/upload/status/";

    std::optional<std::string> user_agent_of(const network::HttpExchange& exchange) {
        auto agent = exchange.header("User-Agent");
        if (agent.empty()) {
            return std::nullopt;
        }
        return agent;
    }

    nlohmann::json init_failure(const std::string& message) {
        return {
            {"success", false},
            {"uploadId", ""},
            {"chunkSize", 0},
            {"chunkCount", 0},
            {"message", message}
        };
    }

    nlohmann::json chunk_reply(bool success, const std::string& message, bool complete,
                               const std::optional<std::string>& file_hash = std::nullopt) {
        nlohmann::json reply{
            {"success", success},
            {"message", message},
            {"complete", complete}
        };
        reply["fileHash"] = file_hash ? nlohmann::json(*file_hash) : nlohmann::json(nullptr);
        return reply;
    }

    double percent(std::uint64_t done, std::uint64_t total) {
        return total == 0 ? 100.0 : 100.0 * static_cast<double>(done) / static_cast<double>(total);
    }

    void remove_quietly(const std::filesystem::path& path) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            LOG_WARN("Cannot remove {}: {}", path.string(), ec.message());
        }
    }
}

WebUploadConfig WebUploadConfig::from_config(const core::Config& config) {
    WebUploadConfig result;
    result.port = static_cast<std::uint16_t>(config.get_int("web_upload.port", 0));
    result.receive_directory = config.get_string("receive.directory", "received");
    result.auto_receive = config.get_bool("receive.auto_accept", false);
    result.overwrite = config.get_bool("receive.overwrite", false);
    result.chunk_size = static_cast<std::uint32_t>(config.get_uint64("transfer.chunk_size", result.chunk_size));
    result.max_file_size = config.get_uint64("transfer.max_file_size", result.max_file_size);
    result.session_expiry = std::chrono::hours(config.get_int("resume.expiry_hours", 24));
    return result;
}

const char* to_string(UploadEventKind kind) {
    switch (kind) {
        case UploadEventKind::Started: return "start";
        case UploadEventKind::Progress: return "progress";
        case UploadEventKind::Completed: return "complete";
        case UploadEventKind::Failed: return "failed";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const WebUploadInfo& info) {
    j = nlohmann::json{
        {"urls", info.urls},
        {"port", info.port}
    };
}

void to_json(nlohmann::json& j, const WebUploadEvent& event) {
    j = nlohmann::json{
        {"kind", to_string(event.kind)},
        {"requestId", event.request_id},
        {"recordId", event.upload_id},
        {"clientIp", event.client_ip},
        {"fileName", event.file_name},
        {"uploadedBytes", event.uploaded_bytes},
        {"totalBytes", event.total_bytes},
        {"progress", event.progress},
        {"speed", event.speed}
    };
    if (event.saved_path) {
        j["savedPath"] = *event.saved_path;
    }
    if (event.file_hash) {
        j["fileHash"] = *event.file_hash;
    }
    if (event.error) {
        j["error"] = *event.error;
    }
}

WebUploadServer::WebUploadServer(WebUploadConfig config, AccessRegistry::Clock clock)
    : config_(std::move(config))
    , access_(AccessPolicy{}, std::move(clock))
    , chunk_manager_(config_.chunk_size)
    , running_(false) {
    ShareSettings settings;
    settings.auto_accept = config_.auto_receive;
    access_.set_settings(settings);
}

WebUploadServer::~WebUploadServer() {
    stop();
}

core::Result WebUploadServer::start(WebUploadInfo& info) {
    if (running_) {
        return core::Result(core::ErrorCode::STATE_ERROR, "Web upload is already running");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!FileUtils::create_directories(config_.receive_directory)) {
            return core::Result(core::ErrorCode::IO_ERROR,
                                "Cannot create receive directory " + config_.receive_directory.string());
        }
    }

    access_.clear();
    auto http = std::make_unique<network::HttpServer>(
        "web-upload", config_.port,
        [this](network::HttpExchange& exchange) { handle(exchange); },
        config_.max_chunk_size + 4096);

    running_ = true;
    auto result = http->start();
    if (!result) {
        running_ = false;
        LOG_ERROR("Failed to start web upload server: {}", result.describe());
        return result;
    }

    info = WebUploadInfo{};
    info.port = http->get_port();
    for (const auto& address : network::local_ipv4_addresses()) {
        info.urls.push_back("http://" + address + ":" + std::to_string(info.port));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        http_ = std::move(http);
    }
    LOG_INFO("Web upload listening on port {}", info.port);
    return core::Result();
}

void WebUploadServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::unique_ptr<network::HttpServer> http;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        http = std::move(http_);
    }
    if (http) {
        http->stop();
    }

    std::unordered_map<std::string, UploadSession> unfinished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        unfinished.swap(sessions_);
    }
    for (const auto& [id, session] : unfinished) {
        monitor_.end_session(id);
        remove_quietly(session.partial_path);
        access_.finish_record(id, RecordStatus::Cancelled, "Web upload stopped");
    }
    LOG_INFO("Web upload stopped, {} unfinished upload(s) dropped", unfinished.size());
}

core::Result WebUploadServer::accept_request(const std::string& request_id) {
    return access_.accept(request_id);
}

core::Result WebUploadServer::reject_request(const std::string& request_id) {
    return access_.reject(request_id);
}

std::vector<AccessRequest> WebUploadServer::get_requests() const {
    return access_.list();
}

void WebUploadServer::set_auto_receive(bool enabled) {
    auto settings = access_.settings();
    settings.auto_accept = enabled;
    access_.update_settings(settings);
}

void WebUploadServer::set_overwrite(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.overwrite = enabled;
}

void WebUploadServer::set_receive_directory(const std::filesystem::path& directory) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.receive_directory = directory;
}

void WebUploadServer::set_request_handler(AccessRegistry::ChangeHandler handler) {
    access_.set_change_handler(std::move(handler));
}

void WebUploadServer::set_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    event_handler_ = std::move(handler);
}

void WebUploadServer::handle(network::HttpExchange& exchange) {
    namespace http = network::http;
    const auto& path = exchange.path();
    auto method = exchange.method();

    core::Result result;
    if (method == http::verb::get && path == "/") {
        result = handle_index(exchange);
    } else if (method == http::verb::get && path == "/request-status") {
        result = handle_request_status(exchange);
    } else if (method == http::verb::get && path == "/capabilities") {
        result = handle_capabilities(exchange);
    } else if (method == http::verb::post && path == "/upload/init") {
        result = handle_init(exchange);
    } else if (method == http::verb::post && path == "/upload/chunk") {
        result = handle_chunk(exchange);
    } else if (method == http::verb::get && path.starts_with(STATUS_PREFIX)) {
        result = handle_status(exchange, path.substr(std::string(STATUS_PREFIX).size()));
    } else {
        return;
    }

    if (!result) {
        LOG_DEBUG("Web upload response not delivered: {}", result.describe());
    }
}

core::Result WebUploadServer::handle_index(network::HttpExchange& exchange) {
    namespace http = network::http;
    const auto& ip = exchange.client_ip();

    if (access_.is_rejected(ip)) {
        return exchange.send_html(http::status::forbidden, pages::rejected());
    }

    auto request = access_.touch(ip, user_agent_of(exchange));
    if (request && request->status == RequestStatus::Accepted) {
        return exchange.send_html(http::status::ok, pages::upload_form(config_.chunk_size));
    }
    return exchange.send_html(http::status::ok, pages::waiting());
}

core::Result WebUploadServer::handle_request_status(network::HttpExchange& exchange) {
    namespace http = network::http;

    auto request = access_.find_by_ip(exchange.client_ip());
    if (!request && !access_.is_rejected(exchange.client_ip())) {
        request = access_.touch(exchange.client_ip(), user_agent_of(exchange));
    }

    if (!request) {
        return exchange.send_json(http::status::ok, {{"hasRequest", false}});
    }
    return exchange.send_json(http::status::ok, {
        {"hasRequest", true},
        {"status", to_string(request->status)}
    });
}

core::Result WebUploadServer::handle_capabilities(network::HttpExchange& exchange) {
    return exchange.send_json(network::http::status::ok, {
        {"encryption", false},
        {"compression", false},
        {"chunk_size", config_.chunk_size}
    });
}

core::Result WebUploadServer::handle_init(network::HttpExchange& exchange) {
    namespace http = network::http;
    const auto& ip = exchange.client_ip();

    auto request = access_.find_by_ip(ip);
    if (!request || request->status != RequestStatus::Accepted) {
        return exchange.send_json(http::status::forbidden, init_failure("Upload not authorized"));
    }

    auto body = exchange.json_body();
    if (body.is_discarded() || !body.is_object() ||
        !body.contains("fileName") || !body["fileName"].is_string() ||
        !body.contains("fileSize") || !body["fileSize"].is_number_unsigned()) {
        return exchange.send_json(http::status::bad_request, init_failure("fileName and fileSize are required"));
    }

    auto file_name = FileUtils::sanitize_filename(body["fileName"].get<std::string>());
    auto file_size = body["fileSize"].get<std::uint64_t>();
    std::uint64_t chunk_size = config_.chunk_size;
    if (body.contains("chunkSize") && body["chunkSize"].is_number_unsigned() &&
        body["chunkSize"].get<std::uint64_t>() > 0) {
        chunk_size = body["chunkSize"].get<std::uint64_t>();
    }

    if (chunk_size > config_.max_chunk_size) {
        return exchange.send_json(http::status::bad_request,
                                  init_failure("chunkSize above " + std::to_string(config_.max_chunk_size)));
    }
    if (chunk_size < config_.min_chunk_size) {
        return exchange.send_json(http::status::bad_request,
                                  init_failure("chunkSize below " + std::to_string(config_.min_chunk_size)));
    }
    if (file_size > config_.max_file_size) {
        return exchange.send_json(http::status::payload_too_large,
                                  init_failure("File exceeds " + StringUtils::format_bytes(config_.max_file_size)));
    }
    if ((file_size + chunk_size - 1) / chunk_size > config_.max_chunk_count) {
        return exchange.send_json(http::status::bad_request,
                                  init_failure("More than " + std::to_string(config_.max_chunk_count) +
                                               " chunks; use a larger chunkSize"));
    }

    std::filesystem::path directory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        directory = config_.receive_directory;
    }

    storage::StorageConfig space;
    space.receive_directory = directory;
    if (!space.has_sufficient_space(file_size)) {
        return exchange.send_json(http::status::insufficient_storage, init_failure("Not enough disk space"));
    }

    purge_expired_sessions();

    UploadSession session;
    session.id = crypto::SecureRandom::generate_id(16);
    session.request_id = request->id;
    session.client_ip = ip;
    session.file_name = file_name;
    session.layout.name = file_name;
    session.layout.size = file_size;
    session.layout.chunk_size = static_cast<std::uint32_t>(chunk_size);
    session.layout.chunks = storage::build_chunk_table(file_size, static_cast<std::uint32_t>(chunk_size));
    session.received.reset(session.layout.chunks.size());
    session.directory = directory;
    session.partial_path = storage::StorageConfig::get_partial_path(directory / ("." + session.id));
    session.created_at = std::chrono::steady_clock::now();
    session.last_event = session.created_at;

    auto prepared = chunk_manager_.prepare_destination(session.partial_path, file_size);
    if (!prepared) {
        LOG_ERROR("Cannot prepare upload of {}: {}", file_name, prepared.describe());
        return exchange.send_json(http::status::internal_server_error, init_failure(prepared.message));
    }

    std::string record_id = session.id;
    auto recorded = access_.start_record(ip, file_name, file_size, record_id);
    if (!recorded) {
        remove_quietly(session.partial_path);
        return exchange.send_json(http::status::forbidden, init_failure(recorded.message));
    }
    monitor_.start_session(session.id, file_size);

    WebUploadEvent started;
    started.kind = UploadEventKind::Started;
    started.request_id = session.request_id;
    started.upload_id = session.id;
    started.client_ip = ip;
    started.file_name = file_name;
    started.total_bytes = file_size;
    emit(started);

    LOG_INFO("Upload {} of {} ({}) from {} started", session.id, file_name,
             StringUtils::format_bytes(file_size), ip);

    nlohmann::json reply{
        {"success", true},
        {"uploadId", session.id},
        {"chunkSize", chunk_size},
        {"chunkCount", session.layout.chunks.size()}
    };

    if (session.layout.chunks.empty()) {
        std::filesystem::path saved;
        std::string hash;
        auto finished = finish_upload(session, saved, hash);
        if (!finished) {
            return exchange.send_json(http::status::internal_server_error, init_failure(finished.message));
        }
        reply["complete"] = true;
        reply["fileHash"] = hash;
        return exchange.send_json(http::status::ok, reply);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.emplace(session.id, std::move(session));
    }
    return exchange.send_json(http::status::ok, reply);
}

core::Result WebUploadServer::handle_chunk(network::HttpExchange& exchange) {
    namespace http = network::http;
    const auto& ip = exchange.client_ip();

    auto upload_id = exchange.header("x-upload-id");
    if (upload_id.empty()) {
        return exchange.send_json(http::status::bad_request, chunk_reply(false, "Missing x-upload-id", false));
    }

    std::uint64_t index = 0;
    try {
        auto text = exchange.header("x-chunk-index");
        std::size_t used = 0;
        index = std::stoull(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        return exchange.send_json(http::status::bad_request, chunk_reply(false, "Invalid x-chunk-index", false));
    }

    if (!access_.is_allowed(ip)) {
        return exchange.send_json(http::status::forbidden, chunk_reply(false, "Upload not authorized", false));
    }

    storage::ChunkInfo chunk;
    std::filesystem::path partial;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end() || it->second.client_ip != ip) {
            return exchange.send_json(http::status::not_found, chunk_reply(false, "Unknown upload session", false));
        }
        const auto* info = it->second.layout.chunk(index);
        if (!info) {
            return exchange.send_json(http::status::bad_request,
                                      chunk_reply(false, "Chunk index " + std::to_string(index) + " out of range", false));
        }
        chunk = *info;
        partial = it->second.partial_path;
    }

    const auto& body = exchange.body();
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(body.data()), body.size());
    auto written = chunk_manager_.write_chunk(partial, chunk, data);
    if (!written) {
        LOG_WARN("Upload {} chunk {} rejected: {}", upload_id, index, written.describe());
        auto status = written.error == core::ErrorCode::IO_ERROR ? http::status::internal_server_error
                                                                 : http::status::bad_request;
        return exchange.send_json(status, chunk_reply(false, written.message, false));
    }

    WebUploadEvent progress;
    bool complete = false;
    bool report = false;
    UploadSession finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end()) {
            return exchange.send_json(http::status::gone, chunk_reply(false, "Upload session ended", false));
        }

        auto& session = it->second;
        if (!session.received.test(index)) {
            session.received.mark(index);
            session.received_bytes += chunk.size;
            monitor_.on_bytes_transferred(upload_id, chunk.size);
        }

        progress.kind = UploadEventKind::Progress;
        progress.request_id = session.request_id;
        progress.upload_id = session.id;
        progress.client_ip = ip;
        progress.file_name = session.file_name;
        progress.uploaded_bytes = session.received_bytes;
        progress.total_bytes = session.layout.size;
        progress.progress = percent(session.received_bytes, session.layout.size);
        auto stats = monitor_.get_session_stats(upload_id);
        progress.speed = stats ? stats->current_speed_bps : 0;

        auto now = std::chrono::steady_clock::now();
        if (session.received.complete() && !session.finishing) {
            session.finishing = true;
            complete = true;
            finished = session;
            sessions_.erase(it);
        } else if (now - session.last_event >= config_.progress_interval) {
            session.last_event = now;
            report = true;
        }
    }

    access_.update_record(upload_id, progress.uploaded_bytes, progress.speed);
    if (report || complete) {
        emit(progress);
    }

    if (!complete) {
        return exchange.send_json(http::status::ok,
                                  chunk_reply(true, "Chunk " + std::to_string(index) + " received", false));
    }

    std::filesystem::path saved;
    std::string hash;
    auto result = finish_upload(finished, saved, hash);
    if (!result) {
        return exchange.send_json(http::status::internal_server_error, chunk_reply(false, result.message, false));
    }
    return exchange.send_json(http::status::ok, chunk_reply(true, "Upload complete", true, hash));
}

core::Result WebUploadServer::handle_status(network::HttpExchange& exchange, const std::string& upload_id) {
    namespace http = network::http;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(upload_id);
    bool visible = it != sessions_.end() && it->second.client_ip == exchange.client_ip() &&
                   std::chrono::steady_clock::now() - it->second.created_at <= config_.session_expiry;

    if (!visible) {
        return exchange.send_json(http::status::ok, {
            {"found", false},
            {"uploadId", upload_id},
            {"fileName", nullptr},
            {"receivedChunks", nlohmann::json::array()},
            {"totalChunks", 0},
            {"complete", false}
        });
    }

    const auto& session = it->second;
    return exchange.send_json(http::status::ok, {
        {"found", true},
        {"uploadId", session.id},
        {"fileName", session.file_name},
        {"receivedChunks", session.received.set_indices()},
        {"totalChunks", session.received.size()},
        {"complete", session.received.complete()}
    });
}

core::Result WebUploadServer::finish_upload(const UploadSession& session, std::filesystem::path& saved_path,
                                            std::string& file_hash) {
    WebUploadEvent event;
    event.request_id = session.request_id;
    event.upload_id = session.id;
    event.client_ip = session.client_ip;
    event.file_name = session.file_name;
    event.total_bytes = session.layout.size;
    monitor_.end_session(session.id);

    auto fail = [&](const core::Result& cause) {
        LOG_ERROR("Upload {} of {} failed: {}", session.id, session.file_name, cause.describe());
        remove_quietly(session.partial_path);
        access_.finish_record(session.id, RecordStatus::Failed, cause.message);
        event.kind = UploadEventKind::Failed;
        event.error = cause.message;
        emit(event);
        return cause;
    };

    crypto::Sha256Hash digest{};
    auto hashed = crypto::Sha256Hasher::hash_file(session.partial_path, digest);
    if (!hashed) {
        return fail(hashed);
    }
    file_hash = crypto::hash_utils::hash_to_hex(digest);

    bool overwrite = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        overwrite = config_.overwrite;
    }

    auto target = session.directory / session.file_name;
    saved_path = overwrite ? target : FileUtils::unique_path(target);

    std::error_code ec;
    std::filesystem::rename(session.partial_path, saved_path, ec);
    if (ec) {
        return fail(core::Result(core::ErrorCode::IO_ERROR,
                                 "Cannot move upload to " + saved_path.string() + ": " + ec.message()));
    }

    access_.finish_record(session.id, RecordStatus::Completed);

    event.kind = UploadEventKind::Completed;
    event.uploaded_bytes = session.layout.size;
    event.progress = 100.0;
    event.saved_path = saved_path.string();
    event.file_hash = file_hash;
    emit(event);

    LOG_INFO("Upload {} saved as {}", session.id, saved_path.string());
    return core::Result();
}

void WebUploadServer::purge_expired_sessions() {
    std::vector<UploadSession> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second.created_at > config_.session_expiry) {
                expired.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& session : expired) {
        LOG_INFO("Upload {} of {} expired", session.id, session.file_name);
        monitor_.end_session(session.id);
        remove_quietly(session.partial_path);
        access_.finish_record(session.id, RecordStatus::Failed, "Upload expired");
    }
}

void WebUploadServer::emit(const WebUploadEvent& event) {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = event_handler_;
    }
    if (handler) {
        handler(event);
    }
}

} // namespace puresend::share
