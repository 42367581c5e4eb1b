#include <iostream>
#include <string>
#include "puresend/core/application.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/config.hpp"
#include "puresend/core/cli.hpp"
#include "puresend/core/utils.hpp"
#include "puresend/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    using namespace puresend::core;

    CommandLineParser parser("puresend");
    auto parsed = parser.parse(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.message << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = Config::instance();
    config.set_defaults();

    std::string config_file = parser.get_option("config");
    if (config_file.starts_with("~/")) {
        config_file = (utils::FileUtils::get_home_dir() / config_file.substr(2)).string();
    }
    // The default file is optional; one named with --config is not.
    auto loaded = config.load_from_file(config_file);
    if (!loaded && (loaded.error != ErrorCode::NOT_FOUND || parser.has_option("config"))) {
        std::cerr << "Error: " << loaded.message << "\n";
        return 1;
    }

    auto applied = parser.apply_to(config);
    if (applied) {
        applied = config.validate();
    }
    if (!applied) {
        std::cerr << "Error: " << applied.message << "\n";
        return 1;
    }

    auto logging = Logger::initialize(config.get_string("log.file", "puresend.log"),
                                      Logger::parse_level(config.get_string("log.level", "info")));
    if (!logging) {
        std::cerr << "Warning: " << logging.message << "\n";
    }

    LOG_INFO("PureSend starting up");

    Application app(ApplicationSettings::from_config(config));
    CommandRegistry command_registry({app, parser});

    auto command = parser.command();
    if (command.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    auto result = command_registry.execute_command(command, parser.get_positional_args());

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }

    app.shutdown();
    Logger::shutdown();
    return result.exit_code;
}
