#include "modules/event_management/source_identity.hpp"
#include <stdexcept>
#include <limits>

namespace sovereign_defense {
namespace event_management {

std::string sourceKindToString(SourceKind kind) {
    switch (kind) {
        case SourceKind::NETWORK_ADDRESS: return "network";
        case SourceKind::PROCESS: return "process";
        case SourceKind::FILE_OWNER: return "file_owner";
    }
    return "network";
}

std::optional<SourceKind> sourceKindFromString(const std::string& name) {
    if (name == "network") {
        return SourceKind::NETWORK_ADDRESS;
    } else if (name == "process") {
        return SourceKind::PROCESS;
    } else if (name == "file_owner") {
        return SourceKind::FILE_OWNER;
    }
    return std::nullopt;
}

int64_t readBoundedInteger(const nlohmann::json& json, const std::string& key,
                           int64_t min_value, int64_t max_value) {
    const auto& field = json.at(key);
    if (!field.is_number_integer()) {
        throw std::invalid_argument("Field " + key + " is not an integer");
    }
    if (field.is_number_unsigned() &&
        field.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("Field " + key + " out of range");
    }
    int64_t value = field.get<int64_t>();
    if (value < min_value || value > max_value) {
        throw std::out_of_range("Field " + key + " out of range: " + std::to_string(value));
    }
    return value;
}

SourceIdentity::SourceIdentity(SourceKind kind, std::string value,
                               std::optional<uint16_t> port, std::optional<int> pid)
    : kind_(kind), value_(std::move(value)), port_(port), pid_(pid) {}

SourceIdentity SourceIdentity::network(const std::string& address, std::optional<uint16_t> port) {
    return SourceIdentity(SourceKind::NETWORK_ADDRESS, address, port, std::nullopt);
}

SourceIdentity SourceIdentity::process(const std::string& executable_path, std::optional<int> pid) {
    return SourceIdentity(SourceKind::PROCESS, executable_path, std::nullopt, pid);
}

SourceIdentity SourceIdentity::fileOwner(const std::string& owner) {
    return SourceIdentity(SourceKind::FILE_OWNER, owner, std::nullopt, std::nullopt);
}

std::string SourceIdentity::key() const {
    switch (kind_) {
        case SourceKind::NETWORK_ADDRESS: return "net:" + value_;
        case SourceKind::PROCESS: return "proc:" + value_;
        case SourceKind::FILE_OWNER: return "owner:" + value_;
    }
    return value_;
}

nlohmann::json SourceIdentity::toJson() const {
    nlohmann::json json;
    json["kind"] = sourceKindToString(kind_);
    json["value"] = value_;
    if (port_) {
        json["port"] = *port_;
    }
    if (pid_) {
        json["pid"] = *pid_;
    }
    return json;
}

SourceIdentity SourceIdentity::fromJson(const nlohmann::json& json) {
    auto kind = sourceKindFromString(json.at("kind").get<std::string>());
    if (!kind) {
        throw std::invalid_argument("Unknown source kind: " + json.at("kind").get<std::string>());
    }

    std::optional<uint16_t> port;
    if (json.contains("port")) {
        port = static_cast<uint16_t>(readBoundedInteger(json, "port", 0, 65535));
    }
    std::optional<int> pid;
    if (json.contains("pid")) {
        pid = static_cast<int>(readBoundedInteger(json, "pid", 0, std::numeric_limits<int>::max()));
    }
    return SourceIdentity(*kind, json.at("value").get<std::string>(), port, pid);
}

bool SourceIdentity::operator==(const SourceIdentity& other) const {
    return kind_ == other.kind_ && value_ == other.value_;
}

} // namespace event_management
} // namespace sovereign_defense
