#pragma once

#include "error.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace puresend::core {

class Config;

// Parses `puresend [options] <command> [args]`.
//
// Options take "--name value", "--name=value" or "-n value"; everything after "--" is
// positional. The first positional argument is the command.
class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name);

    void add_option(char short_name, const std::string& long_name, const std::string& description,
                    bool has_value = false, const std::string& default_value = "");

    // INVALID_ARGUMENT for unknown options or a missing value.
    Result parse(int argc, const char* const argv[]);

    bool has_option(const std::string& long_name) const;
    std::string get_option(const std::string& long_name, const std::string& default_value = "") const;
    bool get_flag(const std::string& long_name) const { return has_option(long_name); }

    // INVALID_ARGUMENT unless the value is a port in 1..65535. `port` is untouched when absent.
    Result get_port(const std::string& long_name, std::uint16_t& port) const;

    // Copies directory, port and receive/discovery switches into the matching config keys.
    Result apply_to(Config& config) const;

    // "" when no command was given.
    std::string command() const;
    // Positional arguments, the command included at index 0.
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        char short_name = 0;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };

    std::optional<std::string> long_name_of(char short_name) const;

    std::string program_name_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> parsed_;
    std::vector<std::string> positional_args_;
};

} // namespace puresend::core
