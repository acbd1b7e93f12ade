#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "s3xfer/core/app_context.hpp"
#include "s3xfer/core/cli.hpp"
#include "s3xfer/core/command_registry.hpp"
#include "s3xfer/core/config.hpp"
#include "s3xfer/core/logger.hpp"
#include "s3xfer/core/utils.hpp"

int main(int argc, char* argv[]) {
    s3xfer::core::CommandLineParser parser("s3xfer");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
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
    
    auto& config = s3xfer::core::Config::instance();
    config.set_defaults();
    
    auto config_file = s3xfer::core::utils::FileUtils::expand_user(parser.get_option("config"));
    if (s3xfer::core::utils::FileUtils::exists(config_file)) {
        config.load_from_file(config_file.string());
    }
    
    auto log_level = parser.has_option("verbose")
        ? s3xfer::core::LogLevel::Debug
        : s3xfer::core::Logger::parse_level(config.get_string("log.level", "info"));
    auto log_file = s3xfer::core::utils::FileUtils::expand_user(config.get_string("log.file", "~/.s3xfer/s3xfer.log"));
    s3xfer::core::Logger::initialize(log_file.string(), log_level);
    
    LOG_INFO("s3xfer starting up");
    
    auto context = std::make_shared<s3xfer::core::AppContext>(config, parser.get_option("bucket"));
    s3xfer::core::CommandRegistry command_registry(context);
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        return 0;
    }
    
    std::string command = args[0];
    if (!command_registry.has_command(command)) {
        std::cerr << "Error: Unknown command: " << command << "\n";
        std::cout << "\nAvailable commands:\n";
        command_registry.print_help();
        return 1;
    }
    
    if (!context->initialize()) {
        std::cerr << "Error: " << context->error() << "\n";
        return 1;
    }
    
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    
    return result.exit_code;
}
