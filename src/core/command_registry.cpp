#include "s3xfer/core/command_registry.hpp"
#include <iomanip>
#include <iostream>

namespace s3xfer::core {

CommandRegistry::CommandRegistry(std::shared_ptr<AppContext> context) {
    register_command("upload", std::make_unique<UploadCommandHandler>(context));
    register_command("download", std::make_unique<DownloadCommandHandler>(context));
    register_command("ls", std::make_unique<LsCommandHandler>(context));
    register_command("rm", std::make_unique<RmCommandHandler>(context));
    register_command("transfers", std::make_unique<TransfersCommandHandler>(context));
    register_command("restore", std::make_unique<RestoreCommandHandler>(context));
    register_command("retry", std::make_unique<RetryCommandHandler>(context));
    register_command("cancel", std::make_unique<CancelCommandHandler>(context));
    register_command("cleanup", std::make_unique<CleanupCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(15) << name
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(15) << " "
                  << "Usage: " << handler->get_usage() << "\n\n";
    }
}

} // namespace s3xfer::core
