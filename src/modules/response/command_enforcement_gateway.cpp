#include "modules/response/command_enforcement_gateway.hpp"
#include <arpa/inet.h>
#include <cstdlib>
#include <stdexcept>

namespace sovereign_defense {
namespace response {

using event_management::SourceIdentity;
using event_management::SourceKind;
using logging::LogLevel;

namespace {

void replaceAll(std::string& text, const std::string& placeholder, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
}

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

bool isValidAddress(const std::string& address) {
    unsigned char buffer[16];
    return inet_pton(AF_INET, address.c_str(), buffer) == 1 ||
           inet_pton(AF_INET6, address.c_str(), buffer) == 1;
}

} // namespace

CommandEnforcementGateway::CommandEnforcementGateway(const config::EnforcementConfig& config,
                                                     std::shared_ptr<logging::LoggingModule> logging_module,
                                                     CommandRunner runner)
    : config_(config)
    , logging_module_(std::move(logging_module))
    , runner_(std::move(runner)) {
    if (!runner_) {
        runner_ = [](const std::string& command) {
            return std::system(command.c_str());
        };
    }
}

std::string CommandEnforcementGateway::renderCommand(const std::string& command_template,
                                                     const SourceIdentity& source,
                                                     std::chrono::seconds duration) {
    std::string value;
    if (source.getKind() == SourceKind::NETWORK_ADDRESS) {
        if (!isValidAddress(source.getValue())) {
            throw std::invalid_argument("Not a valid address: " + source.getValue());
        }
        value = source.getValue();
    } else {
        value = shellQuote(source.getValue());
    }

    std::string command = command_template;
    replaceAll(command, "{address}", value);
    replaceAll(command, "{value}", value);
    replaceAll(command, "{duration}", std::to_string(duration.count()));
    return command;
}

bool CommandEnforcementGateway::execute(const std::string& action, const std::string& command_template,
                                        const SourceIdentity& source, std::chrono::seconds duration) {
    if (command_template.empty()) {
        if (logging_module_) {
            logging_module_->log(LogLevel::INFO, "CommandEnforcementGateway", action,
                                 "No " + action + " command configured for " + source.key(),
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
        return true;
    }

    std::string command;
    try {
        command = renderCommand(command_template, source, duration);
    } catch (const std::invalid_argument& e) {
        if (logging_module_) {
            logging_module_->log(LogLevel::ERROR, "CommandEnforcementGateway", action, e.what(),
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
        return false;
    }

    if (config_.dry_run) {
        if (logging_module_) {
            logging_module_->log(LogLevel::INFO, "CommandEnforcementGateway", action,
                                 "Dry run: " + command,
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
        return true;
    }

    int status = runner_(command);
    if (status != 0) {
        if (logging_module_) {
            logging_module_->log(LogLevel::ERROR, "CommandEnforcementGateway", action,
                                 "Command failed with status " + std::to_string(status) + ": " + command,
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
        return false;
    }

    if (logging_module_) {
        logging_module_->log(LogLevel::INFO, "CommandEnforcementGateway", action, command,
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
    return true;
}

bool CommandEnforcementGateway::block(const SourceIdentity& source, std::chrono::seconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blocked_.count(source)) {
        return true;
    }

    const std::string& command_template = source.getKind() == SourceKind::NETWORK_ADDRESS
        ? config_.block_command : config_.process_block_command;
    if (!execute("block", command_template, source, duration)) {
        return false;
    }
    blocked_.insert(source);
    return true;
}

bool CommandEnforcementGateway::unblock(const SourceIdentity& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!blocked_.count(source)) {
        return true;
    }

    const std::string& command_template = source.getKind() == SourceKind::NETWORK_ADDRESS
        ? config_.unblock_command : config_.process_unblock_command;
    if (!execute("unblock", command_template, source, std::chrono::seconds(0))) {
        return false;
    }
    blocked_.erase(source);
    return true;
}

bool CommandEnforcementGateway::isBlocked(const SourceIdentity& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_.count(source) > 0;
}

} // namespace response
} // namespace sovereign_defense
