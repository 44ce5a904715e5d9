#pragma once

#include "modules/event_management/source_identity.hpp"
#include <string>
#include <chrono>
#include <optional>
#include <variant>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace sovereign_defense {
namespace event_management {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

int64_t toMillis(TimePoint time);

// Largest millisecond count a TimePoint can hold
int64_t maxMillis();

// Throws std::out_of_range beyond +/- maxMillis()
TimePoint fromMillis(int64_t millis);

/**
 * @brief Transport protocol of a network observation
 */
enum class NetworkProtocol {
    TCP,
    UDP,
    ICMP,
    OTHER
};

/**
 * @brief Direction of a network observation relative to this host
 */
enum class TrafficDirection {
    INBOUND,
    OUTBOUND
};

/**
 * @brief File access kind, ordered by impact
 */
enum class FileAccessKind {
    READ,
    WRITE,
    EXECUTE,
    DELETE
};

std::string protocolToString(NetworkProtocol protocol);
NetworkProtocol protocolFromString(const std::string& name);
std::string directionToString(TrafficDirection direction);
std::string accessKindToString(FileAccessKind kind);
std::optional<FileAccessKind> accessKindFromString(const std::string& name);

/**
 * @brief Connection attempt or packet seen by the capture source
 */
struct NetworkEvent {
    SourceIdentity source;
    std::string destination_address;
    uint16_t destination_port = 0;
    NetworkProtocol protocol = NetworkProtocol::TCP;
    TimePoint timestamp;
    TrafficDirection direction = TrafficDirection::INBOUND;

    nlohmann::json toJson() const;
    static NetworkEvent fromJson(const nlohmann::json& json);
};

/**
 * @brief Resource and network footprint of a process at one sampling instant
 */
struct ProcessFootprint {
    double cpu_percent = 0.0;
    double memory_percent = 0.0;
    double connection_count = 0.0;
    double thread_count = 0.0;

    nlohmann::json toJson() const;
    static ProcessFootprint fromJson(const nlohmann::json& json);
};

/**
 * @brief Snapshot of one process taken from the process table
 */
struct ProcessObservation {
    int pid = 0;
    int parent_pid = 0;
    std::string executable_path;
    std::string user;
    TimePoint timestamp;
    ProcessFootprint footprint;

    /**
     * @brief Source identity of the observed process (keyed by executable)
     */
    SourceIdentity source() const;

    nlohmann::json toJson() const;
    static ProcessObservation fromJson(const nlohmann::json& json);
};

/**
 * @brief File-system access reported by the watcher
 */
struct FileAccessEvent {
    std::string path;
    int pid = 0;
    std::optional<std::string> process_path;
    FileAccessKind access_kind = FileAccessKind::READ;
    TimePoint timestamp;

    /**
     * @brief Source identity of the accessing process
     *
     * The executable path is used when the watcher resolved it; otherwise
     * the pid stands in for it.
     */
    SourceIdentity source() const;

    nlohmann::json toJson() const;
    static FileAccessEvent fromJson(const nlohmann::json& json);
};

using Observation = std::variant<NetworkEvent, ProcessObservation, FileAccessEvent>;

/**
 * @brief Observation stream an item belongs to
 */
enum class ObservationType {
    NETWORK,
    PROCESS,
    FILE
};

ObservationType observationType(const Observation& observation);
SourceIdentity observationSource(const Observation& observation);
TimePoint observationTime(const Observation& observation);

/**
 * @brief Checks an observation for malformed or inconsistent fields
 *
 * @param observation Observation to check
 * @return Reason for rejection, or std::nullopt when the observation is usable
 */
std::optional<std::string> validateObservation(const Observation& observation);

/**
 * @brief Parses a feed line of the form {"type": "network"|"process"|"file", ...}
 *
 * @throws nlohmann::json::exception or std::invalid_argument on malformed input
 */
Observation observationFromJson(const nlohmann::json& json);
nlohmann::json observationToJson(const Observation& observation);

} // namespace event_management
} // namespace sovereign_defense
