#include "puresend/core/command_handler.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/utils.hpp"
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace puresend::core {

namespace {

std::mutex output_mutex;

void print_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << line << std::endl;
}

void print_event(const AppEvent& event) {
    print_line(nlohmann::json(event).dump());
}

bool parse_port(const std::string& text, std::uint16_t& port) {
    try {
        std::size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size() || value <= 0 || value > 65535) {
            return false;
        }
        port = static_cast<std::uint16_t>(value);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

CommandResult from_result(const Result& result, const std::string& success_message = "") {
    if (!result) {
        return CommandResult::error(result.describe());
    }
    return CommandResult::ok(success_message);
}

} // namespace

void CommandHandler::run_interactive(const EventCallback& on_event, const LineCallback& on_line,
                                     std::shared_ptr<Application::Subscription> subscription) {
    if (!subscription) {
        subscription = context_.app.subscribe();
    }
    std::atomic<bool> stop{false};

    boost::asio::io_context io_context;
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&stop](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Signal {} received, shutting down", signal_number);
            stop = true;
        }
    });

    boost::asio::posix::stream_descriptor input(io_context);
    boost::asio::streambuf input_buffer;
    std::function<void()> read_line;

    int input_fd = ::dup(STDIN_FILENO);
    if (input_fd >= 0) {
        boost::system::error_code assign_error;
        input.assign(input_fd, assign_error);
        if (assign_error) {
            // Regular files and closed terminals cannot be polled; run without commands.
            LOG_DEBUG("stdin commands unavailable: {}", assign_error.message());
            ::close(input_fd);
        }
    }

    read_line = [&]() {
        boost::asio::async_read_until(input, input_buffer, '\n',
            [&](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                        LOG_WARN("Reading commands failed: {}", ec.message());
                    }
                    return;
                }

                std::istream stream(&input_buffer);
                std::string line;
                std::getline(stream, line);

                std::vector<std::string> words;
                for (auto& word : utils::StringUtils::split(utils::StringUtils::trim(line), ' ')) {
                    if (!word.empty()) {
                        words.push_back(word);
                    }
                }

                if (!words.empty()) {
                    if (words[0] == "quit" || words[0] == "exit") {
                        stop = true;
                        return;
                    }
                    on_line(words);
                }
                read_line();
            });
    };
    if (input.is_open()) {
        read_line();
    }

    std::thread io_thread([&io_context] { io_context.run(); });

    while (!stop) {
        auto event = subscription->next(std::chrono::milliseconds(200));
        if (event && !on_event(*event)) {
            break;
        }
    }

    io_context.stop();
    io_thread.join();
}

CommandResult CommandHandler::follow_task(const std::string& task_id,
                                          std::shared_ptr<Application::Subscription> subscription) {
    auto& app = context_.app;
    std::optional<transfer::TransferProgress> last;

    auto running = [](transfer::TaskStatus status) {
        return status == transfer::TaskStatus::Pending || status == transfer::TaskStatus::Transferring;
    };

    run_interactive([&](const AppEvent& event) {
            const auto* progress = std::get_if<transfer::TransferProgress>(&event);
            if (!progress || progress->task_id != task_id) {
                return true;
            }
            print_event(event);
            last = *progress;
            return running(progress->status);
        },
        [&](const std::vector<std::string>& words) {
            if (words[0] == "cancel") {
                auto result = app.cancel(task_id);
                if (!result) {
                    print_line("cancel failed: " + result.describe());
                }
            } else {
                print_line("commands: cancel, quit");
            }
        },
        std::move(subscription));

    auto task = app.get_task(task_id);
    auto status = task ? task->status : (last ? last->status : transfer::TaskStatus::Pending);
    if (status == transfer::TaskStatus::Completed) {
        return CommandResult::ok("Transfer " + task_id + " completed");
    }

    std::string reason;
    if (task && task->error) {
        reason = ": " + *task->error;
    }
    if (status == transfer::TaskStatus::Interrupted) {
        return CommandResult::error("Transfer " + task_id + " interrupted" + reason +
                                    " (continue with 'puresend resume " + task_id + "')");
    }
    return CommandResult::error("Transfer " + task_id + " " + transfer::to_string(status) + reason);
}

// PrepareCommandHandler

CommandResult PrepareCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    for (std::size_t i = 1; i < args.size(); ++i) {
        storage::FileMetadata metadata;
        auto result = context_.app.prepare_transfer(args[i], metadata);
        if (!result) {
            return CommandResult::error(args[i] + ": " + result.describe());
        }

        print_line(nlohmann::json(metadata).dump(2));
        LOG_INFO("Prepared {} ({}, {} chunks)", metadata.name,
                 utils::StringUtils::format_bytes(metadata.size), metadata.chunk_count());
    }
    return CommandResult::ok();
}

// SendCommandHandler

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 4) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::uint16_t port = 0;
    if (!parse_port(args[3], port)) {
        return CommandResult::error("Invalid port: " + args[3]);
    }

    auto& app = context_.app;
    auto result = app.initialize();
    if (!result) {
        return from_result(result);
    }

    storage::FileMetadata metadata;
    result = app.prepare_transfer(args[1], metadata);
    if (!result) {
        return from_result(result);
    }

    std::string peer_id;
    if (args.size() > 4) {
        peer_id = args[4];
    } else {
        network::PeerInfo peer;
        result = app.add_manual(args[2], port, peer);
        if (!result) {
            return from_result(result);
        }
        peer_id = peer.id;
    }

    auto subscription = app.subscribe();
    std::string task_id;
    result = app.send(metadata, peer_id, args[2], port, task_id);
    if (!result) {
        return from_result(result);
    }

    std::cout << "Sending " << metadata.name << " (" << utils::StringUtils::format_bytes(metadata.size)
              << ") to " << args[2] << ":" << port << " as task " << task_id << "\n";

    return follow_task(task_id, std::move(subscription));
}

// ReceiveCommandHandler

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>&) {
    auto& app = context_.app;
    auto result = app.initialize();
    if (!result) {
        return from_result(result);
    }

    transfer::ReceivingState state;
    result = app.start_receiving(state);
    if (!result) {
        return from_result(result);
    }

    std::cout << "Receiving on " << state.network_address << ":" << state.port
              << " (share code " << state.share_code << ")\n";
    std::cout << "Saving to " << app.settings().storage.receive_directory.string() << "\n";
    if (!state.auto_receive) {
        std::cout << "Offers wait for 'accept <task>' or 'reject <task>'\n";
    }
    std::cout << "Press Ctrl+C to stop\n";

    run_interactive(
        [](const AppEvent& event) {
            print_event(event);
            return true;
        },
        [&app](const std::vector<std::string>& words) {
            if (words.size() < 2) {
                print_line("commands: accept <task>, reject <task>, cancel <task>, quit");
                return;
            }

            Result outcome;
            if (words[0] == "accept") {
                outcome = app.accept_incoming(words[1]);
            } else if (words[0] == "reject") {
                outcome = app.reject_incoming(words[1]);
            } else if (words[0] == "cancel") {
                outcome = app.cancel(words[1]);
            } else {
                print_line("unknown command: " + words[0]);
                return;
            }
            print_line(outcome ? words[0] + " " + words[1] + ": ok" : outcome.describe());
        });

    result = app.stop_receiving();
    return from_result(result, "Receiver stopped");
}

// ShareCommandHandler

CommandResult ShareCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto& app = context_.app;
    std::vector<storage::FileMetadata> files;
    for (std::size_t i = 1; i < args.size(); ++i) {
        storage::FileMetadata metadata;
        auto result = app.prepare_transfer(args[i], metadata);
        if (!result) {
            return CommandResult::error(args[i] + ": " + result.describe());
        }
        files.push_back(std::move(metadata));
    }

    share::ShareSettings settings;
    auto pin = context_.options.get_option("pin");
    if (!pin.empty()) {
        settings.pin_enabled = true;
        settings.pin = pin;
    }
    settings.auto_accept = context_.options.get_flag("auto-accept");

    share::ShareLinkInfo info;
    auto result = app.start_share(files, settings, info);
    if (!result) {
        return from_result(result);
    }

    std::cout << "Sharing " << files.size() << " file(s)";
    if (settings.requires_pin()) {
        std::cout << ", PIN " << *settings.pin;
    }
    std::cout << "\n";
    for (const auto& link : info.links) {
        std::cout << "  " << link << "\n";
    }
    std::cout << "Requests wait for 'accept <request>' or 'reject <request>' unless --auto-accept is set\n";
    std::cout << "Press Ctrl+C to stop\n";

    run_interactive(
        [](const AppEvent& event) {
            print_event(event);
            return true;
        },
        [&app](const std::vector<std::string>& words) {
            if (words[0] == "requests") {
                print_line(nlohmann::json(app.get_share_requests()).dump(2));
                return;
            }
            if (words.size() < 2 || (words[0] != "accept" && words[0] != "reject")) {
                print_line("commands: accept <request>, reject <request>, requests, quit");
                return;
            }
            auto outcome = words[0] == "accept" ? app.accept_request(words[1]) : app.reject_request(words[1]);
            print_line(outcome ? words[0] + " " + words[1] + ": ok" : outcome.describe());
        });

    app.stop_share();
    return CommandResult::ok("Share stopped");
}

// WebUploadCommandHandler

CommandResult WebUploadCommandHandler::execute(const std::vector<std::string>&) {
    auto& app = context_.app;
    share::WebUploadInfo info;
    auto result = app.start_web_upload(info);
    if (!result) {
        return from_result(result);
    }

    std::cout << "Upload page ready, files go to "
              << app.settings().web_upload.receive_directory.string() << "\n";
    for (const auto& url : info.urls) {
        std::cout << "  " << url << "\n";
    }
    std::cout << "Press Ctrl+C to stop\n";

    run_interactive(
        [](const AppEvent& event) {
            print_event(event);
            return true;
        },
        [&app](const std::vector<std::string>& words) {
            if (words[0] == "requests") {
                print_line(nlohmann::json(app.get_web_upload_requests()).dump(2));
                return;
            }
            if (words.size() < 2 || (words[0] != "accept" && words[0] != "reject")) {
                print_line("commands: accept <request>, reject <request>, requests, quit");
                return;
            }
            auto outcome = words[0] == "accept" ? app.accept_web_upload_request(words[1])
                                                : app.reject_web_upload_request(words[1]);
            print_line(outcome ? words[0] + " " + words[1] + ": ok" : outcome.describe());
        });

    app.stop_web_upload();
    return CommandResult::ok("Web upload stopped");
}

// PeersCommandHandler

CommandResult PeersCommandHandler::execute(const std::vector<std::string>& args) {
    auto& app = context_.app;
    auto result = app.initialize();
    if (!result) {
        return from_result(result);
    }

    if (args.size() >= 2 && args[1] == "remove") {
        if (args.size() < 3) {
            return CommandResult::error("Usage: " + get_usage());
        }
        return from_result(app.remove_peer(args[2]), "Removed " + args[2]);
    }

    if (args.size() >= 2 && (args[1] == "add" || args[1] == "check")) {
        std::uint16_t port = 0;
        if (args.size() < 4 || !parse_port(args[3], port)) {
            return CommandResult::error("Usage: " + get_usage());
        }

        network::PeerInfo peer;
        result = app.add_manual(args[2], port, peer);
        if (!result) {
            return from_result(result);
        }

        if (args[1] == "check") {
            bool online = false;
            result = app.check_online(peer.id, online);
            if (!result) {
                return from_result(result);
            }
            std::cout << peer.id << " is " << (online ? "online" : "offline") << "\n";
            return CommandResult::ok();
        }

        print_line(nlohmann::json(peer).dump(2));
        return CommandResult::ok();
    }

    result = app.refresh();
    if (!result) {
        LOG_WARN("Peer query failed: {}", result.describe());
    }

    // One announce interval is enough for every live node to answer the query.
    std::this_thread::sleep_for(app.settings().discovery.announce_interval);

    auto peers = app.get_peers();
    if (peers.empty()) {
        std::cout << "No peers found.\n";
        return CommandResult::ok();
    }

    for (const auto& peer : peers) {
        std::cout << "  " << peer.name << " [" << peer.id << "] " << peer.ip << ":" << peer.port
                  << " " << network::to_string(peer.device_type)
                  << " " << network::to_string(peer.status) << "\n";
    }
    return CommandResult::ok();
}

// ResumableCommandHandler

CommandResult ResumableCommandHandler::execute(const std::vector<std::string>&) {
    auto& app = context_.app;
    auto result = app.initialize();
    if (!result) {
        return from_result(result);
    }

    auto tasks = app.get_resumable_tasks();
    if (tasks.empty()) {
        std::cout << "No resumable transfers.\n";
        return CommandResult::ok();
    }

    for (const auto& task : tasks) {
        std::cout << "  " << task.id << "  " << transfer::to_string(task.direction) << "  "
                  << task.file.name << "  "
                  << utils::StringUtils::format_bytes(task.resume_offset) << " / "
                  << utils::StringUtils::format_bytes(task.file.size) << " (" << task.progress << "%)\n";
    }
    return CommandResult::ok();
}

// ResumeCommandHandler

CommandResult ResumeCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto& app = context_.app;
    auto result = app.initialize();
    if (!result) {
        return from_result(result);
    }

    auto subscription = app.subscribe();
    result = app.resume_transfer(args[1]);
    if (!result) {
        return from_result(result);
    }

    auto task = app.get_task(args[1]);
    if (task && task->direction == transfer::TransferDirection::Receive) {
        // The sender reconnects; keep the listener up until it does.
        transfer::ReceivingState state;
        result = app.start_receiving(state);
        if (!result && result.error != ErrorCode::STATE_ERROR) {
            return from_result(result);
        }
        std::cout << "Waiting for the sender on port " << state.port << "\n";
    }

    return follow_task(args[1], std::move(subscription));
}

// CleanupResumeCommandHandler

CommandResult CleanupResumeCommandHandler::execute(const std::vector<std::string>& args) {
    auto& app = context_.app;
    auto result = app.initialize();
    if (!result) {
        return from_result(result);
    }

    std::optional<std::string> task_id;
    if (args.size() > 1) {
        task_id = args[1];
    }
    return from_result(app.cleanup_resume_info(task_id),
                       task_id ? "Resume state of " + *task_id + " removed" : "All resume state removed");
}

// NetworkCommandHandler

CommandResult NetworkCommandHandler::execute(const std::vector<std::string>&) {
    auto info = context_.app.get_network_info();

    std::cout << "Host: " << info.host_name << "\n";
    std::cout << "Primary address: " << info.primary_address << "\n";
    for (const auto& address : info.addresses) {
        std::cout << "  " << address << "\n";
    }
    return CommandResult::ok();
}

} // namespace puresend::core
