#pragma once

#include "application.hpp"
#include "cli.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace puresend::core {

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;

    static CommandResult ok(const std::string& message = "") {
        return CommandResult{true, message, 0};
    }

    static CommandResult error(const std::string& message) {
        return CommandResult{false, message, 1};
    }
};

// What every command works against: the engine and the parsed global options.
struct CommandContext {
    Application& app;
    const CommandLineParser& options;
};

class CommandHandler {
public:
    explicit CommandHandler(CommandContext context) : context_(context) {}
    virtual ~CommandHandler() = default;

    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;

protected:
    // Runs until `on_event` returns false, the user types "quit" or SIGINT/SIGTERM arrives.
    // Every stdin line is split on spaces and handed to `on_line`. Without a subscription
    // a new one is taken, so events published before the call are not seen.
    using EventCallback = std::function<bool(const AppEvent&)>;
    using LineCallback = std::function<void(const std::vector<std::string>&)>;
    void run_interactive(const EventCallback& on_event, const LineCallback& on_line,
                         std::shared_ptr<Application::Subscription> subscription = nullptr);

    // Blocks until the task leaves pending/transferring, printing its progress events.
    // `subscription` must predate the call that started the task.
    CommandResult follow_task(const std::string& task_id,
                              std::shared_ptr<Application::Subscription> subscription);

    CommandContext context_;
};

class PrepareCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Hash a file and print its transfer metadata"; }
    std::string get_usage() const override { return "prepare <file>..."; }
};

class SendCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send a file to a peer and wait for the result"; }
    std::string get_usage() const override { return "send <file> <ip> <port> [peer-id]"; }
};

class ReceiveCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Listen for incoming transfers"; }
    std::string get_usage() const override { return "receive (stdin: accept <task>, reject <task>, cancel <task>, quit)"; }
};

class ShareCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Serve files to browsers on the LAN"; }
    std::string get_usage() const override { return "share [--pin <pin>] [--auto-accept] <file>..."; }
};

class WebUploadCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Accept uploads from browsers on the LAN"; }
    std::string get_usage() const override { return "web-upload (stdin: accept <request>, reject <request>, quit)"; }
};

class PeersCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Discover, add, probe or forget peers"; }
    std::string get_usage() const override { return "peers [add <ip> <port> | check <ip> <port> | remove <id>]"; }
};

class ResumableCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List interrupted transfers that can be resumed"; }
    std::string get_usage() const override { return "resumable"; }
};

class ResumeCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Continue an interrupted transfer"; }
    std::string get_usage() const override { return "resume <task-id>"; }
};

class CleanupResumeCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Delete resume state of one or all transfers"; }
    std::string get_usage() const override { return "cleanup-resume [task-id]"; }
};

class NetworkCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show host name and LAN addresses"; }
    std::string get_usage() const override { return "network"; }
};

} // namespace puresend::core
