#include "modules/config/config_reader.hpp"
#include <stdexcept>
#include <filesystem>

namespace sovereign_defense {
namespace config {

ConfigReader::ConfigReader(const std::string& config_path)
    : config_path_(config_path) {
    loadConfig();
}

void ConfigReader::loadConfig() {
    if (!std::filesystem::exists(config_path_)) {
        throw std::runtime_error("Configuration file not found: " + config_path_);
    }

    try {
        config_ = YAML::LoadFile(config_path_);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load YAML configuration: " + std::string(e.what()));
    }
}

YAML::Node ConfigReader::getModuleConfig(const std::string& module_name) const {
    if (!hasModuleConfig(module_name)) {
        throw std::runtime_error("Module configuration not found: " + module_name);
    }
    return config_["modules"][module_name];
}

bool ConfigReader::hasModuleConfig(const std::string& module_name) const {
    return config_["modules"] && config_["modules"][module_name];
}

YAML::Node ConfigReader::getGeneralConfig() const {
    if (!config_["general"]) {
        throw std::runtime_error("General configuration not found");
    }
    return config_["general"];
}

void ConfigReader::reloadConfig() {
    loadConfig();
}

} // namespace config
} // namespace sovereign_defense
