#pragma once

#include <fstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

namespace sovereign_defense {
namespace logging {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * @brief Output settings; module_files routes a module to its own file
 */
struct LoggingConfig {
    bool enabled = true;
    bool console_logging = true;
    bool file_logging = true;
    LogLevel min_level = LogLevel::INFO;
    std::string default_log_file;
    std::unordered_set<std::string> modules;
    std::unordered_map<std::string, std::string> module_files;
};

/**
 * @brief Parses a level name ("DEBUG", "warning", ...) into a LogLevel
 *
 * @param name Level name, case insensitive
 * @return Parsed level, INFO when the name is unknown
 */
LogLevel parseLogLevel(const std::string& name);

/**
 * @brief Logging module shared by every component of the pipeline
 *
 * Writes are serialised internally, so a single instance can be shared
 * between detector workers, the ledger writer and the dispatchers.
 */
class LoggingModule {
public:
    /**
     * @brief Builds the module from the logging_module section of a YAML file
     */
    explicit LoggingModule(const std::string& config_path);

    explicit LoggingModule(const LoggingConfig& config);

    virtual ~LoggingModule();

    /**
     * @brief Writes one entry to the console and to the module's log file
     *
     * Entries below the configured level, or from modules outside the
     * configured list, are dropped. DEBUG and TRACE entries carry the
     * file:line of the call site.
     *
     * @param module Component emitting the entry, used for filtering and file routing
     * @param function Operation name shown in the entry
     * @param data Structured context appended as compact JSON
     */
    virtual void log(
        LogLevel level,
        const std::string& module,
        const std::string& function,
        const std::string& message,
        const std::string& file,
        const std::string& func,
        const std::string& line,
        const std::optional<nlohmann::json>& data = std::nullopt
    );

    // Re-reads the config file and reopens log files; no-op without a path
    void reloadConfig();

    bool isModuleLoggingEnabled(const std::string& module) const;

    // Dedicated file of a module, else the default log file
    std::optional<std::string> getModuleLogFile(const std::string& module) const;

    static std::string getLevelString(LogLevel level);

private:
    std::string formatEntry(LogLevel level, const std::string& module, const std::string& function,
                            const std::string& message, const std::string& file, const std::string& line,
                            const std::optional<nlohmann::json>& data) const;
    std::ofstream* streamFor(const std::string& path);
    void prepareLogFile();

    std::string config_path_;
    LoggingConfig config_;
    // Open handles per target file, closed on reload
    std::unordered_map<std::string, std::ofstream> streams_;
    mutable std::mutex write_mutex_;
};

/**
 * @brief Reads the logging_module section of a YAML configuration file
 *
 * Missing keys keep their defaults. An unreadable file yields the defaults
 * with logs/sovereign_defense.log as the log file.
 */
LoggingConfig readLoggingConfig(const std::string& config_path);

} // namespace logging
} // namespace sovereign_defense
