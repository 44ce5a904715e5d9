#include "modules/logging/logging_module.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace sovereign_defense {
namespace logging {

namespace {

const char* const kFallbackLogFile = "logs/sovereign_defense.log";

const std::array<std::pair<LogLevel, const char*>, 6> kLevelNames = {{
    {LogLevel::TRACE, "TRACE"},
    {LogLevel::DEBUG, "DEBUG"},
    {LogLevel::INFO, "INFO"},
    {LogLevel::WARNING, "WARNING"},
    {LogLevel::ERROR, "ERROR"},
    {LogLevel::CRITICAL, "CRITICAL"},
}};

std::string timestampNow() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

template <typename T>
T valueOr(const YAML::Node& node, const char* key, T fallback) {
    return node[key] ? node[key].as<T>() : fallback;
}

} // namespace

LogLevel parseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARN") {
        return LogLevel::WARNING;
    }
    for (const auto& entry : kLevelNames) {
        if (upper == entry.second) {
            return entry.first;
        }
    }
    return LogLevel::INFO;
}

LoggingConfig readLoggingConfig(const std::string& config_path) {
    LoggingConfig config;
    try {
        YAML::Node section = YAML::LoadFile(config_path)["logging_module"];

        config.enabled = valueOr(section, "enabled", true);
        config.console_logging = valueOr(section, "console_logging", true);
        config.file_logging = valueOr(section, "file_logging", true);
        config.min_level = parseLogLevel(valueOr<std::string>(section, "log_level", "INFO"));
        config.default_log_file = valueOr<std::string>(section, "log_file", kFallbackLogFile);

        for (const auto& module : section["modules"]) {
            config.modules.insert(module.as<std::string>());
        }
        for (const auto& entry : section["module_files"]) {
            config.module_files.emplace(entry.first.as<std::string>(), entry.second.as<std::string>());
        }
    } catch (const std::exception& e) {
        std::cerr << "Logging config unreadable (" << config_path << "): " << e.what() << std::endl;
        config = LoggingConfig();
        config.default_log_file = kFallbackLogFile;
    }
    return config;
}

LoggingModule::LoggingModule(const std::string& config_path)
    : config_path_(config_path), config_(readLoggingConfig(config_path)) {
    prepareLogFile();
}

LoggingModule::LoggingModule(const LoggingConfig& config)
    : config_(config) {
    prepareLogFile();
}

LoggingModule::~LoggingModule() = default;

void LoggingModule::prepareLogFile() {
    if (!config_.file_logging || config_.default_log_file.empty()) {
        return;
    }

    try {
        config_.default_log_file = std::filesystem::absolute(config_.default_log_file).string();
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Cannot resolve log file " << config_.default_log_file << ": " << e.what() << std::endl;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (auto* stream = streamFor(config_.default_log_file)) {
        *stream << formatEntry(LogLevel::INFO, "LoggingModule", "constructor", "Logging started",
                               "", "", std::nullopt) << std::endl;
    } else {
        config_.file_logging = false;
    }
}

std::ofstream* LoggingModule::streamFor(const std::string& path) {
    auto it = streams_.find(path);
    if (it != streams_.end() && it->second.good()) {
        return &it->second;
    }

    try {
        std::filesystem::path target(path);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Cannot create log directory for " << path << ": " << e.what() << std::endl;
        return nullptr;
    }

    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        std::cerr << "Cannot open log file " << path << std::endl;
        return nullptr;
    }
    auto& slot = streams_[path];
    slot = std::move(stream);
    return &slot;
}

std::string LoggingModule::formatEntry(LogLevel level, const std::string& module, const std::string& function,
                                       const std::string& message, const std::string& file,
                                       const std::string& line,
                                       const std::optional<nlohmann::json>& data) const {
    std::ostringstream entry;
    entry << '[' << timestampNow() << "] [" << getLevelString(level) << "] [" << module << "] ["
          << function << "] " << message;

    // Verbose levels carry the call site
    if (level <= LogLevel::DEBUG && !file.empty()) {
        entry << " (" << std::filesystem::path(file).filename().string() << ':' << line << ')';
    }
    if (data) {
        entry << " - Data: " << data->dump();
    }
    return entry.str();
}

void LoggingModule::log(
    LogLevel level,
    const std::string& module,
    const std::string& function,
    const std::string& message,
    const std::string& file,
    const std::string& func,
    const std::string& line,
    const std::optional<nlohmann::json>& data
) {
    (void)func;

    if (!config_.enabled || level < config_.min_level || !isModuleLoggingEnabled(module)) {
        return;
    }

    const std::string entry = formatEntry(level, module, function, message, file, line, data);

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (config_.console_logging) {
        (level >= LogLevel::ERROR ? std::cerr : std::cout) << entry << std::endl;
    }

    if (!config_.file_logging) {
        return;
    }
    auto target = getModuleLogFile(module);
    if (!target) {
        return;
    }
    if (auto* stream = streamFor(*target)) {
        *stream << entry << std::endl;
    }
}

void LoggingModule::reloadConfig() {
    if (config_path_.empty()) {
        return;
    }
    LoggingConfig fresh = readLoggingConfig(config_path_);
    if (!fresh.default_log_file.empty()) {
        fresh.default_log_file = std::filesystem::absolute(fresh.default_log_file).string();
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    config_ = std::move(fresh);
    streams_.clear();
}

bool LoggingModule::isModuleLoggingEnabled(const std::string& module) const {
    // No module list means every module logs
    return config_.modules.empty() || config_.modules.count(module) > 0;
}

std::optional<std::string> LoggingModule::getModuleLogFile(const std::string& module) const {
    auto it = config_.module_files.find(module);
    if (it != config_.module_files.end()) {
        return it->second;
    }
    if (config_.default_log_file.empty()) {
        return std::nullopt;
    }
    return config_.default_log_file;
}

std::string LoggingModule::getLevelString(LogLevel level) {
    for (const auto& entry : kLevelNames) {
        if (entry.first == level) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

} // namespace logging
} // namespace sovereign_defense
