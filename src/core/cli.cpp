#include "puresend/core/cli.hpp"
#include "puresend/core/config.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace puresend::core {

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {
    add_option('h', "help", "Show this help message");
    add_option('v', "version", "Show version information");
    add_option('c', "config", "Configuration file (key=value lines)", true, "~/.puresend.conf");
    add_option(0, "verbose", "Log at debug level");

    add_option('d', "directory", "Receive directory", true);
    add_option('p', "port", "Listen port for receive, share and web-upload", true);
    add_option(0, "pin", "PIN required to open a share", true);
    add_option(0, "auto-accept", "Accept incoming files and share requests without asking");
    add_option(0, "overwrite", "Replace existing files instead of picking a new name");
    add_option(0, "encrypt", "Encrypt chunks of outgoing transfers");
    add_option(0, "no-compression", "Send chunk payloads uncompressed");
    add_option(0, "no-discovery", "Do not announce or listen for peers");
}

void CommandLineParser::add_option(char short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    options_[long_name] = Option{short_name, description, has_value, default_value};
}

Result CommandLineParser::parse(int argc, const char* const argv[]) {
    parsed_.clear();
    positional_args_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg.size() < 2 || arg[0] != '-') {
            positional_args_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        std::string name;
        std::optional<std::string> inline_value;
        if (arg.starts_with("--")) {
            auto eq = arg.find('=');
            name = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
            }
        } else {
            auto long_name = long_name_of(arg[1]);
            if (!long_name) {
                return Result(ErrorCode::INVALID_ARGUMENT, "Unknown option: " + arg.substr(0, 2));
            }
            name = *long_name;
            if (arg.size() > 2) {
                inline_value = arg.substr(2);
            }
        }

        auto it = options_.find(name);
        if (it == options_.end()) {
            return Result(ErrorCode::INVALID_ARGUMENT, "Unknown option: --" + name);
        }

        if (!it->second.has_value) {
            if (inline_value) {
                return Result(ErrorCode::INVALID_ARGUMENT, "Option --" + name + " takes no value");
            }
            parsed_[name] = "true";
        } else if (inline_value) {
            parsed_[name] = *inline_value;
        } else if (i + 1 < argc) {
            parsed_[name] = argv[++i];
        } else {
            return Result(ErrorCode::INVALID_ARGUMENT, "Option --" + name + " requires a value");
        }
    }

    return Result();
}

bool CommandLineParser::has_option(const std::string& long_name) const {
    return parsed_.contains(long_name);
}

std::string CommandLineParser::get_option(const std::string& long_name, const std::string& default_value) const {
    if (auto it = parsed_.find(long_name); it != parsed_.end()) {
        return it->second;
    }
    if (auto it = options_.find(long_name); it != options_.end() && !it->second.default_value.empty()) {
        return it->second.default_value;
    }
    return default_value;
}

Result CommandLineParser::get_port(const std::string& long_name, std::uint16_t& port) const {
    if (!has_option(long_name)) {
        return Result();
    }

    auto text = get_option(long_name);
    unsigned value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || value == 0 || value > 65535) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Invalid port for --" + long_name + ": " + text);
    }
    port = static_cast<std::uint16_t>(value);
    return Result();
}

Result CommandLineParser::apply_to(Config& config) const {
    if (has_option("directory")) {
        config.set("receive.directory", get_option("directory"));
    }

    std::uint16_t port = 0;
    auto result = get_port("port", port);
    if (!result) {
        return result;
    }
    if (port != 0) {
        config.set("transfer.port", std::to_string(port));
        config.set("share.port", std::to_string(port));
        config.set("web_upload.port", std::to_string(port));
    }

    if (get_flag("auto-accept")) {
        config.set("receive.auto_accept", "true");
    }
    if (get_flag("overwrite")) {
        config.set("receive.overwrite", "true");
    }
    if (get_flag("encrypt")) {
        config.set("transfer.encryption", "true");
    }
    if (get_flag("no-compression")) {
        config.set("transfer.compression", "false");
    }
    if (get_flag("no-discovery")) {
        config.set("discovery.enabled", "false");
    }
    if (get_flag("verbose")) {
        config.set("log.level", "debug");
    }
    return Result();
}

std::string CommandLineParser::command() const {
    return positional_args_.empty() ? std::string() : positional_args_.front();
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& [name, option] : options_) {
        std::ostringstream flag;
        if (option.short_name) {
            flag << '-' << option.short_name << ", ";
        }
        flag << "--" << name;
        if (option.has_value) {
            flag << " <value>";
        }

        std::cout << "  " << std::left << std::setw(26) << flag.str() << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " 1.0.0 (protocol PSND v1)\n";
}

std::optional<std::string> CommandLineParser::long_name_of(char short_name) const {
    for (const auto& [name, option] : options_) {
        if (option.short_name == short_name) {
            return name;
        }
    }
    return std::nullopt;
}

} // namespace puresend::core
