#include "modules/event_management/observation.hpp"
#include <stdexcept>
#include <cmath>
#include <limits>

namespace sovereign_defense {
namespace event_management {

namespace {

constexpr int64_t kMaxPort = 65535;
constexpr int64_t kMaxPid = std::numeric_limits<int>::max();

TimePoint readTimestamp(const nlohmann::json& json) {
    return fromMillis(readBoundedInteger(json, "timestamp", 0, maxMillis()));
}

} // namespace

int64_t maxMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max()).count();
}

int64_t toMillis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint fromMillis(int64_t millis) {
    if (millis > maxMillis() || millis < -maxMillis()) {
        throw std::out_of_range("Timestamp out of range: " + std::to_string(millis) + " ms");
    }
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

std::string protocolToString(NetworkProtocol protocol) {
    switch (protocol) {
        case NetworkProtocol::TCP: return "tcp";
        case NetworkProtocol::UDP: return "udp";
        case NetworkProtocol::ICMP: return "icmp";
        case NetworkProtocol::OTHER: return "other";
    }
    return "other";
}

NetworkProtocol protocolFromString(const std::string& name) {
    if (name == "tcp" || name == "TCP") {
        return NetworkProtocol::TCP;
    } else if (name == "udp" || name == "UDP") {
        return NetworkProtocol::UDP;
    } else if (name == "icmp" || name == "ICMP") {
        return NetworkProtocol::ICMP;
    }
    return NetworkProtocol::OTHER;
}

std::string directionToString(TrafficDirection direction) {
    return direction == TrafficDirection::INBOUND ? "inbound" : "outbound";
}

std::string accessKindToString(FileAccessKind kind) {
    switch (kind) {
        case FileAccessKind::READ: return "read";
        case FileAccessKind::WRITE: return "write";
        case FileAccessKind::EXECUTE: return "execute";
        case FileAccessKind::DELETE: return "delete";
    }
    return "read";
}

std::optional<FileAccessKind> accessKindFromString(const std::string& name) {
    if (name == "read") {
        return FileAccessKind::READ;
    } else if (name == "write") {
        return FileAccessKind::WRITE;
    } else if (name == "execute") {
        return FileAccessKind::EXECUTE;
    } else if (name == "delete") {
        return FileAccessKind::DELETE;
    }
    return std::nullopt;
}

nlohmann::json NetworkEvent::toJson() const {
    nlohmann::json j;
    j["source"] = source.toJson();
    j["destination_address"] = destination_address;
    j["destination_port"] = destination_port;
    j["protocol"] = protocolToString(protocol);
    j["timestamp"] = toMillis(timestamp);
    j["direction"] = directionToString(direction);
    return j;
}

NetworkEvent NetworkEvent::fromJson(const nlohmann::json& json) {
    NetworkEvent event;
    // Feeds may send a bare address string instead of a full identity object
    if (json.at("source").is_string()) {
        std::optional<uint16_t> port;
        if (json.contains("source_port")) {
            port = static_cast<uint16_t>(readBoundedInteger(json, "source_port", 0, kMaxPort));
        }
        event.source = SourceIdentity::network(json["source"].get<std::string>(), port);
    } else {
        event.source = SourceIdentity::fromJson(json["source"]);
    }
    event.destination_address = json.value("destination_address", "");
    event.destination_port = static_cast<uint16_t>(readBoundedInteger(json, "destination_port", 0, kMaxPort));
    event.protocol = protocolFromString(json.value("protocol", "tcp"));
    event.timestamp = readTimestamp(json);
    event.direction = json.value("direction", "inbound") == "outbound" ?
        TrafficDirection::OUTBOUND : TrafficDirection::INBOUND;
    return event;
}

nlohmann::json ProcessFootprint::toJson() const {
    return nlohmann::json{
        {"cpu_percent", cpu_percent},
        {"memory_percent", memory_percent},
        {"connection_count", connection_count},
        {"thread_count", thread_count}
    };
}

ProcessFootprint ProcessFootprint::fromJson(const nlohmann::json& json) {
    ProcessFootprint footprint;
    footprint.cpu_percent = json.value("cpu_percent", 0.0);
    footprint.memory_percent = json.value("memory_percent", 0.0);
    footprint.connection_count = json.value("connection_count", 0.0);
    footprint.thread_count = json.value("thread_count", 0.0);
    return footprint;
}

SourceIdentity ProcessObservation::source() const {
    return SourceIdentity::process(executable_path, pid);
}

nlohmann::json ProcessObservation::toJson() const {
    nlohmann::json j;
    j["pid"] = pid;
    j["parent_pid"] = parent_pid;
    j["executable_path"] = executable_path;
    j["user"] = user;
    j["timestamp"] = toMillis(timestamp);
    j["footprint"] = footprint.toJson();
    return j;
}

ProcessObservation ProcessObservation::fromJson(const nlohmann::json& json) {
    ProcessObservation observation;
    observation.pid = static_cast<int>(readBoundedInteger(json, "pid", 0, kMaxPid));
    if (json.contains("parent_pid")) {
        observation.parent_pid = static_cast<int>(readBoundedInteger(json, "parent_pid", 0, kMaxPid));
    }
    observation.executable_path = json.at("executable_path").get<std::string>();
    observation.user = json.value("user", "");
    observation.timestamp = readTimestamp(json);
    if (json.contains("footprint")) {
        observation.footprint = ProcessFootprint::fromJson(json["footprint"]);
    }
    return observation;
}

SourceIdentity FileAccessEvent::source() const {
    if (process_path && !process_path->empty()) {
        return SourceIdentity::process(*process_path, pid);
    }
    return SourceIdentity::process("pid:" + std::to_string(pid), pid);
}

nlohmann::json FileAccessEvent::toJson() const {
    nlohmann::json j;
    j["path"] = path;
    j["pid"] = pid;
    if (process_path) {
        j["process_path"] = *process_path;
    }
    j["access_kind"] = accessKindToString(access_kind);
    j["timestamp"] = toMillis(timestamp);
    return j;
}

FileAccessEvent FileAccessEvent::fromJson(const nlohmann::json& json) {
    FileAccessEvent event;
    event.path = json.at("path").get<std::string>();
    if (json.contains("pid")) {
        event.pid = static_cast<int>(readBoundedInteger(json, "pid", 0, kMaxPid));
    }
    if (json.contains("process_path")) {
        event.process_path = json["process_path"].get<std::string>();
    }
    auto kind_name = json.at("access_kind").get<std::string>();
    auto kind = accessKindFromString(kind_name);
    if (!kind) {
        throw std::invalid_argument("Unknown access kind: " + kind_name);
    }
    event.access_kind = *kind;
    event.timestamp = readTimestamp(json);
    return event;
}

ObservationType observationType(const Observation& observation) {
    if (std::holds_alternative<NetworkEvent>(observation)) {
        return ObservationType::NETWORK;
    } else if (std::holds_alternative<ProcessObservation>(observation)) {
        return ObservationType::PROCESS;
    }
    return ObservationType::FILE;
}

SourceIdentity observationSource(const Observation& observation) {
    if (auto network = std::get_if<NetworkEvent>(&observation)) {
        return network->source;
    } else if (auto process = std::get_if<ProcessObservation>(&observation)) {
        return process->source();
    }
    return std::get<FileAccessEvent>(observation).source();
}

TimePoint observationTime(const Observation& observation) {
    return std::visit([](const auto& item) { return item.timestamp; }, observation);
}

namespace {

bool invalidMetric(double value) {
    return std::isnan(value) || std::isinf(value) || value < 0.0;
}

} // namespace

std::optional<std::string> validateObservation(const Observation& observation) {
    if (observationTime(observation).time_since_epoch().count() < 0) {
        return "negative timestamp";
    }

    if (auto network = std::get_if<NetworkEvent>(&observation)) {
        if (network->source.empty()) {
            return "empty source";
        }
        if (network->source.getKind() != SourceKind::NETWORK_ADDRESS) {
            return "network event with non-network source";
        }
        if (network->destination_port == 0 &&
            (network->protocol == NetworkProtocol::TCP || network->protocol == NetworkProtocol::UDP)) {
            return "destination port 0";
        }
    } else if (auto process = std::get_if<ProcessObservation>(&observation)) {
        if (process->executable_path.empty()) {
            return "empty executable path";
        }
        if (process->pid <= 0) {
            return "invalid pid";
        }
        const auto& footprint = process->footprint;
        if (invalidMetric(footprint.cpu_percent) || invalidMetric(footprint.memory_percent) ||
            invalidMetric(footprint.connection_count) || invalidMetric(footprint.thread_count)) {
            return "invalid footprint";
        }
    } else {
        const auto& file = std::get<FileAccessEvent>(observation);
        if (file.path.empty()) {
            return "empty path";
        }
        if (file.pid < 0) {
            return "invalid pid";
        }
        if (file.pid == 0 && (!file.process_path || file.process_path->empty())) {
            return "empty source";
        }
    }
    return std::nullopt;
}

Observation observationFromJson(const nlohmann::json& json) {
    auto type = json.at("type").get<std::string>();
    if (type == "network") {
        return NetworkEvent::fromJson(json);
    } else if (type == "process") {
        return ProcessObservation::fromJson(json);
    } else if (type == "file") {
        return FileAccessEvent::fromJson(json);
    }
    throw std::invalid_argument("Unknown observation type: " + type);
}

nlohmann::json observationToJson(const Observation& observation) {
    nlohmann::json j = std::visit([](const auto& item) { return item.toJson(); }, observation);
    switch (observationType(observation)) {
        case ObservationType::NETWORK: j["type"] = "network"; break;
        case ObservationType::PROCESS: j["type"] = "process"; break;
        case ObservationType::FILE: j["type"] = "file"; break;
    }
    return j;
}

} // namespace event_management
} // namespace sovereign_defense
