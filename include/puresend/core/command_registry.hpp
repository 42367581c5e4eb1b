#pragma once

#include "command_handler.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace puresend::core {

// Maps a command word to its handler. "help [command]" is answered here.
class CommandRegistry {
public:
    explicit CommandRegistry(CommandContext context);

    // Replaces any handler already registered under `name`.
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);

    // `args[0]` must be the command word.
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);

    bool has_command(const std::string& command) const;
    std::vector<std::string> command_names() const { return order_; }

    void print_help() const;

private:
    CommandResult help(const std::vector<std::string>& args) const;

    std::unordered_map<std::string, std::unique_ptr<CommandHandler>> handlers_;
    std::vector<std::string> order_;
};

} // namespace puresend::core
