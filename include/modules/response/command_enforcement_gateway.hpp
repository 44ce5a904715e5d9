#pragma once

#include "modules/config/defense_config.hpp"
#include "modules/logging/logging_module.hpp"
#include "modules/response/enforcement_gateway.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace sovereign_defense {
namespace response {

/**
 * @brief Runs a shell command and returns its exit status
 */
using CommandRunner = std::function<int(const std::string&)>;

/**
 * @brief Enforcement gateway driving a host firewall through command templates
 *
 * Templates may use the {address}, {value} and {duration} placeholders.
 * Network sources use block_command / unblock_command, process sources use
 * the process_* templates; an empty template is a logged no-op. In dry-run
 * mode commands are only logged.
 */
class CommandEnforcementGateway : public EnforcementGateway {
public:
    CommandEnforcementGateway(const config::EnforcementConfig& config,
                              std::shared_ptr<logging::LoggingModule> logging_module = nullptr,
                              CommandRunner runner = nullptr);

    bool block(const event_management::SourceIdentity& source, std::chrono::seconds duration) override;
    bool unblock(const event_management::SourceIdentity& source) override;

    bool isBlocked(const event_management::SourceIdentity& source) const;

    /**
     * @brief Expands the placeholders of a command template
     *
     * Process paths are single-quoted for the shell.
     *
     * @throws std::invalid_argument if a network source is not a valid address
     */
    static std::string renderCommand(const std::string& command_template,
                                     const event_management::SourceIdentity& source,
                                     std::chrono::seconds duration);

private:
    bool execute(const std::string& action, const std::string& command_template,
                 const event_management::SourceIdentity& source, std::chrono::seconds duration);

    config::EnforcementConfig config_;
    std::shared_ptr<logging::LoggingModule> logging_module_;
    CommandRunner runner_;
    mutable std::mutex mutex_;
    std::unordered_set<event_management::SourceIdentity> blocked_;
};

} // namespace response
} // namespace sovereign_defense
