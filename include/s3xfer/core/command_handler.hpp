#pragma once

#include "app_context.hpp"
#include <memory>
#include <string>
#include <vector>

namespace s3xfer::core {

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;
    
    static CommandResult ok(const std::string& message = "") {
        return CommandResult{true, message, 0};
    }
    
    static CommandResult error(const std::string& message, int exit_code = 1) {
        return CommandResult{false, message, exit_code};
    }
};

class CommandHandler {
public:
    explicit CommandHandler(std::shared_ptr<AppContext> context) : context_(std::move(context)) {}
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;

protected:
    std::shared_ptr<AppContext> context_;
};

class UploadCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Upload a local file to the bucket"; }
    std::string get_usage() const override { return "s3xfer upload <local-file> <key>"; }
};

class DownloadCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download an object from the bucket"; }
    std::string get_usage() const override { return "s3xfer download <key> <local-path>"; }
};

class LsCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List objects and folders under a prefix"; }
    std::string get_usage() const override { return "s3xfer ls [prefix]"; }
};

class RmCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Delete one or more objects"; }
    std::string get_usage() const override { return "s3xfer rm <key> [key...]"; }
};

class TransfersCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show recorded transfers for the bucket"; }
    std::string get_usage() const override { return "s3xfer transfers"; }
};

class RestoreCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Resume transfers left unfinished by an earlier run"; }
    std::string get_usage() const override { return "s3xfer restore"; }
};

class RetryCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run a failed transfer again"; }
    std::string get_usage() const override { return "s3xfer retry <transfer-id>"; }
};

class CancelCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Cancel a queued or paused transfer"; }
    std::string get_usage() const override { return "s3xfer cancel <transfer-id>"; }
};

class CleanupCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Abort multipart uploads no transfer refers to"; }
    std::string get_usage() const override { return "s3xfer cleanup"; }
};

} // namespace s3xfer::core
