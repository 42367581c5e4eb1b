#include "puresend/core/command_registry.hpp"
#include "puresend/core/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace puresend::core {

CommandRegistry::CommandRegistry(CommandContext context) {
    register_command("prepare", std::make_unique<PrepareCommandHandler>(context));
    register_command("send", std::make_unique<SendCommandHandler>(context));
    register_command("receive", std::make_unique<ReceiveCommandHandler>(context));
    register_command("share", std::make_unique<ShareCommandHandler>(context));
    register_command("web-upload", std::make_unique<WebUploadCommandHandler>(context));
    register_command("peers", std::make_unique<PeersCommandHandler>(context));
    register_command("resumable", std::make_unique<ResumableCommandHandler>(context));
    register_command("resume", std::make_unique<ResumeCommandHandler>(context));
    register_command("cleanup-resume", std::make_unique<CleanupResumeCommandHandler>(context));
    register_command("network", std::make_unique<NetworkCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    if (std::find(order_.begin(), order_.end(), name) == order_.end()) {
        order_.push_back(name);
    }
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    if (command == "help") {
        return help(args);
    }

    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }

    LOG_DEBUG("Running command '{}' with {} argument(s)", command, args.empty() ? 0 : args.size() - 1);
    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return command == "help" || handlers_.contains(command);
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    for (const auto& name : order_) {
        const auto& handler = handlers_.at(name);
        std::cout << "  " << std::left << std::setw(16) << name << handler->get_description() << "\n";
    }
    std::cout << "\nRun 'help <command>' for its arguments.\n";
}

CommandResult CommandRegistry::help(const std::vector<std::string>& args) const {
    if (args.size() < 2) {
        print_help();
        return CommandResult::ok();
    }

    auto it = handlers_.find(args[1]);
    if (it == handlers_.end()) {
        return CommandResult::error("No help for unknown command: " + args[1]);
    }
    return CommandResult::ok(it->second->get_description() + "\nUsage: puresend " + it->second->get_usage());
}

} // namespace puresend::core
