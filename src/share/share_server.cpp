#include "puresend/share/share_server.hpp"
#include "puresend/share/html_pages.hpp"
#include "puresend/network/network_info.hpp"
#include "puresend/core/config.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <unordered_set>

namespace puresend::share {

namespace {
    constexpr const char* DOWNLOAD_PREFIX = "/download/";

    std::optional<std::string> user_agent_of(const network::HttpExchange& exchange) {
        auto agent = exchange.header("User-Agent");
        if (agent.empty()) {
            return std::nullopt;
        }
        return agent;
    }

    void log_failed_response(const core::Result& result) {
        if (!result) {
            LOG_DEBUG("Share response not delivered: {}", result.describe());
        }
    }

    nlohmann::json files_response(const nlohmann::json& files, bool waiting) {
        nlohmann::json body{{"files", files}};
        body["waiting_response"] = waiting ? nlohmann::json(true) : nlohmann::json(nullptr);
        return body;
    }
}

ShareServerConfig ShareServerConfig::from_config(const core::Config& config) {
    ShareServerConfig result;
    result.port = static_cast<std::uint16_t>(config.get_int("share.port", 0));
    result.max_files = static_cast<std::size_t>(config.get_uint64("share.max_files", result.max_files));
    result.max_total_size = config.get_uint64("share.max_total_size", result.max_total_size);
    result.access.max_pin_attempts = static_cast<std::uint32_t>(
        config.get_int("share.pin_max_attempts", static_cast<int>(result.access.max_pin_attempts)));
    result.access.lock_duration = std::chrono::seconds(
        config.get_int("share.pin_lock_seconds", static_cast<int>(result.access.lock_duration.count())));
    return result;
}

void to_json(nlohmann::json& j, const DownloadProgress& progress) {
    j = nlohmann::json{
        {"requestId", progress.request_id},
        {"recordId", progress.record_id},
        {"clientIp", progress.client_ip},
        {"fileName", progress.file_name},
        {"transferredBytes", progress.transferred_bytes},
        {"totalBytes", progress.total_bytes},
        {"progress", progress.progress},
        {"speed", progress.speed},
        {"status", to_string(progress.status)}
    };
}

ShareServer::ShareServer(ShareServerConfig config, AccessRegistry::Clock clock)
    : config_(config)
    , access_(config.access, std::move(clock))
    , active_(false) {
}

ShareServer::~ShareServer() {
    stop();
}

core::Result ShareServer::check_capacity(const std::vector<storage::FileMetadata>& files) const {
    if (files.size() > config_.max_files) {
        return core::Result(core::ErrorCode::CAPACITY_ERROR,
                            "Too many files to share: " + std::to_string(files.size()) +
                            " (limit " + std::to_string(config_.max_files) + ")");
    }

    std::uint64_t total = 0;
    std::unordered_set<std::string> ids;
    for (const auto& file : files) {
        if (!file.path || file.path->empty()) {
            return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Shared file has no path: " + file.name);
        }
        if (file.id.empty() || !ids.insert(file.id).second) {
            return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                                "Shared file needs a unique id: " + file.name);
        }
        total += file.size;
    }

    if (total > config_.max_total_size) {
        return core::Result(core::ErrorCode::CAPACITY_ERROR,
                            "Shared files are too large: " + core::utils::StringUtils::format_bytes(total) +
                            " (limit " + core::utils::StringUtils::format_bytes(config_.max_total_size) + ")");
    }
    return core::Result();
}

core::Result ShareServer::start(const std::vector<storage::FileMetadata>& files,
                                const ShareSettings& settings,
                                ShareLinkInfo& info) {
    if (active_) {
        return core::Result(core::ErrorCode::STATE_ERROR, "A share is already running");
    }

    auto capacity = check_capacity(files);
    if (!capacity) {
        return capacity;
    }

    access_.clear();
    access_.set_settings(settings);

    auto http = std::make_unique<network::HttpServer>(
        "share", config_.port, [this](network::HttpExchange& exchange) { handle(exchange); });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        files_by_id_.clear();
        for (const auto& file : files) {
            files_by_id_[file.id] = file;
        }
    }

    active_ = true;
    auto result = http->start();
    if (!result) {
        active_ = false;
        LOG_ERROR("Failed to start share server: {}", result.describe());
        return result;
    }

    ShareLinkInfo link;
    link.port = http->get_port();
    for (const auto& address : network::local_ipv4_addresses()) {
        link.links.push_back("http://" + address + ":" + std::to_string(link.port));
    }
    link.files = files;
    link.created_at = core::utils::TimeUtils::now();
    link.pin_enabled = settings.pin_enabled;
    link.pin = settings.pin;
    link.auto_accept = settings.auto_accept;
    link.status = ShareStatus::Active;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        http_ = std::move(http);
        info_ = link;
    }

    LOG_INFO("Sharing {} file(s) on port {}", files.size(), link.port);
    info = link;
    return core::Result();
}

void ShareServer::stop() {
    if (!active_.exchange(false)) {
        return;
    }

    std::unique_ptr<network::HttpServer> http;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        http = std::move(http_);
        if (info_) {
            info_->status = ShareStatus::Stopped;
        }
    }

    // Downloads notice active_ at their next block and the sockets are shut down underneath them.
    if (http) {
        http->stop();
    }
    LOG_INFO("Share stopped");
}

std::optional<ShareLinkInfo> ShareServer::get_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_;
}

core::Result ShareServer::update_files(const std::vector<storage::FileMetadata>& files) {
    if (!active_) {
        return core::Result(core::ErrorCode::STATE_ERROR, "No share is running");
    }

    auto capacity = check_capacity(files);
    if (!capacity) {
        return capacity;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    files_by_id_.clear();
    for (const auto& file : files) {
        files_by_id_[file.id] = file;
    }
    if (info_) {
        info_->files = files;
    }
    LOG_INFO("Share now offers {} file(s)", files.size());
    return core::Result();
}

core::Result ShareServer::update_settings(const ShareSettings& settings) {
    if (!active_) {
        return core::Result(core::ErrorCode::STATE_ERROR, "No share is running");
    }

    access_.update_settings(settings);

    std::lock_guard<std::mutex> lock(mutex_);
    if (info_) {
        info_->pin_enabled = settings.pin_enabled;
        info_->pin = settings.pin;
        info_->auto_accept = settings.auto_accept;
    }
    return core::Result();
}

core::Result ShareServer::accept_request(const std::string& request_id) {
    return access_.accept(request_id);
}

core::Result ShareServer::reject_request(const std::string& request_id) {
    return access_.reject(request_id);
}

std::vector<AccessRequest> ShareServer::get_requests() const {
    return access_.list();
}

void ShareServer::set_request_handler(AccessRegistry::ChangeHandler handler) {
    access_.set_change_handler(std::move(handler));
}

void ShareServer::set_download_handler(DownloadHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    download_handler_ = std::move(handler);
}

void ShareServer::handle(network::HttpExchange& exchange) {
    const auto& path = exchange.path();
    auto method = exchange.method();

    core::Result result;
    if (method == network::http::verb::get && path == "/") {
        result = handle_index(exchange);
    } else if (method == network::http::verb::get && path == "/files") {
        result = handle_files(exchange);
    } else if (method == network::http::verb::post && path == "/verify-pin") {
        result = handle_verify_pin(exchange);
    } else if (method == network::http::verb::get && path == "/request-status") {
        result = handle_request_status(exchange);
    } else if (method == network::http::verb::get &&
               path.starts_with(DOWNLOAD_PREFIX)) {
        result = handle_download(exchange, path.substr(std::string(DOWNLOAD_PREFIX).size()));
    } else {
        return;
    }
    log_failed_response(result);
}

core::Result ShareServer::handle_index(network::HttpExchange& exchange) {
    namespace http = network::http;
    const auto& ip = exchange.client_ip();

    if (!active_) {
        return exchange.send_html(http::status::not_found, pages::message("Share ended", "This share is no longer available."));
    }
    if (access_.is_rejected(ip)) {
        return exchange.send_html(http::status::forbidden, pages::rejected());
    }

    if (access_.check(ip) == AccessDecision::PinRequired) {
        if (auto until = access_.locked_until(ip)) {
            auto left = std::chrono::duration_cast<std::chrono::seconds>(*until - std::chrono::system_clock::now());
            return exchange.send_html(http::status::ok,
                                      pages::share_locked(static_cast<std::uint64_t>(std::max<std::int64_t>(left.count(), 1))));
        }
        return exchange.send_html(http::status::ok, pages::share_pin());
    }

    auto request = access_.touch(ip, user_agent_of(exchange));
    if (request && request->status == RequestStatus::Accepted) {
        return exchange.send_html(http::status::ok, pages::share_files());
    }
    return exchange.send_html(http::status::ok, pages::waiting());
}

core::Result ShareServer::handle_files(network::HttpExchange& exchange) {
    namespace http = network::http;
    const auto& ip = exchange.client_ip();

    if (!active_) {
        return exchange.send_json(http::status::not_found, files_response(nlohmann::json::array(), false));
    }

    auto decision = access_.check(ip);
    if (decision == AccessDecision::NoRequest) {
        auto request = access_.touch(ip, user_agent_of(exchange));
        decision = request && request->status == RequestStatus::Accepted ? AccessDecision::Allowed
                                                                         : AccessDecision::Pending;
    }

    switch (decision) {
        case AccessDecision::Rejected:
            return exchange.send_json(http::status::forbidden, files_response(nlohmann::json::array(), false));
        case AccessDecision::PinRequired:
            return exchange.send_json(http::status::unauthorized, files_response(nlohmann::json::array(), false));
        case AccessDecision::Pending:
        case AccessDecision::NoRequest:
            return exchange.send_json(http::status::accepted, files_response(nlohmann::json::array(), true));
        case AccessDecision::Allowed:
            break;
    }

    auto files = nlohmann::json::array();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, file] : files_by_id_) {
            files.push_back({
                {"id", id},
                {"name", file.name},
                {"size", file.size},
                {"mimeType", file.mime_type}
            });
        }
    }
    return exchange.send_json(http::status::ok, files_response(files, false));
}

core::Result ShareServer::handle_verify_pin(network::HttpExchange& exchange) {
    namespace http = network::http;

    auto body = exchange.json_body();
    if (body.is_discarded() || !body.is_object() || !body.contains("pin") || !body["pin"].is_string()) {
        return exchange.send_json(http::status::bad_request, PinVerifyResult{});
    }

    PinVerifyResult verdict;
    auto result = access_.verify_pin(exchange.client_ip(), body["pin"].get<std::string>(),
                                     user_agent_of(exchange), verdict);

    auto status = http::status::ok;
    switch (result.error) {
        case core::ErrorCode::SUCCESS: status = http::status::ok; break;
        case core::ErrorCode::REJECTED: status = http::status::forbidden; break;
        case core::ErrorCode::AUTH_ERROR: status = http::status::unauthorized; break;
        default: status = http::status::bad_request; break;
    }
    return exchange.send_json(status, verdict);
}

core::Result ShareServer::handle_request_status(network::HttpExchange& exchange) {
    namespace http = network::http;
    const auto& ip = exchange.client_ip();

    auto request = access_.find_by_ip(ip);
    if (!request) {
        auto settings = access_.settings();
        bool verified = access_.is_verified(ip);
        if (settings.auto_accept && (!settings.requires_pin() || verified)) {
            request = access_.touch(ip, user_agent_of(exchange));
        } else if (verified) {
            return exchange.send_json(http::status::ok, {
                {"has_request", true}, {"status", "accepted"}, {"waiting_response", false}});
        }
    }

    if (!request) {
        return exchange.send_json(http::status::ok, {
            {"has_request", false}, {"status", nullptr}, {"waiting_response", false}});
    }
    return exchange.send_json(http::status::ok, {
        {"has_request", true},
        {"status", to_string(request->status)},
        {"waiting_response", request->status == RequestStatus::Pending}
    });
}

core::Result ShareServer::handle_download(network::HttpExchange& exchange, const std::string& file_id) {
    namespace http = network::http;
    const auto& ip = exchange.client_ip();

    if (!active_) {
        return exchange.send_text(http::status::not_found, "Share ended");
    }

    switch (access_.check(ip)) {
        case AccessDecision::Rejected:
            return exchange.send_text(http::status::forbidden, "Access denied");
        case AccessDecision::PinRequired:
            return exchange.send_text(http::status::unauthorized, "PIN required");
        case AccessDecision::Pending:
        case AccessDecision::NoRequest:
            return exchange.send_text(http::status::forbidden, "Waiting for the owner to accept your request");
        case AccessDecision::Allowed:
            break;
    }

    std::optional<storage::FileMetadata> file;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_by_id_.find(file_id);
        if (it != files_by_id_.end()) {
            file = it->second;
        }
    }
    if (!file || !core::utils::FileUtils::is_file(*file->path)) {
        return exchange.send_text(http::status::not_found, "File not found");
    }

    auto request = access_.find_by_ip(ip);
    std::string record_id;
    auto started = access_.start_record(ip, file->name, file->size, record_id);
    if (!started || !request) {
        return exchange.send_text(http::status::forbidden, "Access denied");
    }

    LOG_INFO("Download of {} by {} started", file->name, ip);
    monitor_.start_session(record_id, file->size);

    DownloadProgress progress;
    progress.request_id = request->id;
    progress.record_id = record_id;
    progress.client_ip = ip;
    progress.file_name = file->name;
    progress.total_bytes = file->size;
    emit(progress);

    std::uint64_t reported = 0;
    auto last_event = std::chrono::steady_clock::now();
    auto result = exchange.send_file(*file->path, file->name, file->mime_type,
        [&](std::uint64_t sent) {
            monitor_.on_bytes_transferred(record_id, sent - reported);
            reported = sent;

            auto stats = monitor_.get_session_stats(record_id);
            std::uint64_t speed = stats ? stats->current_speed_bps : 0;
            access_.update_record(record_id, sent, speed);

            auto now = std::chrono::steady_clock::now();
            if (now - last_event >= config_.progress_interval) {
                last_event = now;
                progress.transferred_bytes = sent;
                progress.speed = speed;
                progress.progress = stats ? stats->percentage_complete : 0.0;
                emit(progress);
            }
            return active_.load();
        });
    monitor_.end_session(record_id);

    progress.transferred_bytes = reported;
    progress.speed = 0;
    if (result) {
        progress.status = RecordStatus::Completed;
        progress.transferred_bytes = file->size;
        progress.progress = 100.0;
        access_.finish_record(record_id, RecordStatus::Completed);
        LOG_INFO("Download of {} by {} completed", file->name, ip);
    } else if (result.error == core::ErrorCode::CANCELLED) {
        progress.status = RecordStatus::Cancelled;
        access_.finish_record(record_id, RecordStatus::Cancelled, "Share stopped");
        LOG_INFO("Download of {} by {} aborted", file->name, ip);
    } else {
        progress.status = RecordStatus::Failed;
        access_.finish_record(record_id, RecordStatus::Failed, result.describe());
        LOG_WARN("Download of {} by {} failed: {}", file->name, ip, result.describe());
    }
    emit(progress);
    return result;
}

void ShareServer::emit(const DownloadProgress& progress) {
    DownloadHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = download_handler_;
    }
    if (handler) {
        handler(progress);
    }
}

} // namespace puresend::share
