#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

namespace sovereign_defense {
namespace config {

/**
 * @brief Loads the daemon's YAML configuration file
 *
 * Module sections live under the top-level "modules" key; daemon wide
 * settings live under "general".
 */
class ConfigReader {
public:
    /**
     * @throws std::runtime_error if the file is missing or is not valid YAML
     */
    explicit ConfigReader(const std::string& config_path);
    ~ConfigReader() = default;

    // Section of one module, throws when it is absent
    YAML::Node getModuleConfig(const std::string& module_name) const;

    bool hasModuleConfig(const std::string& module_name) const;

    // Daemon wide settings, throws when the section is absent
    YAML::Node getGeneralConfig() const;

    const std::string& getConfigPath() const { return config_path_; }

    void reloadConfig();

private:
    std::string config_path_;
    YAML::Node config_;

    void loadConfig();
};

} // namespace config
} // namespace sovereign_defense
