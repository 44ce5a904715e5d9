#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace sovereign_defense {
namespace event_management {

/**
 * @brief Kind of actor a SourceIdentity refers to
 */
enum class SourceKind {
    NETWORK_ADDRESS,
    PROCESS,
    FILE_OWNER
};

std::string sourceKindToString(SourceKind kind);
std::optional<SourceKind> sourceKindFromString(const std::string& name);

/**
 * @brief Reads an integer field and checks it lies in [min_value, max_value]
 *
 * @throws nlohmann::json::exception if the field is missing
 * @throws std::invalid_argument if the field is not an integer
 * @throws std::out_of_range if the value is outside the range
 */
int64_t readBoundedInteger(const nlohmann::json& json, const std::string& key,
                           int64_t min_value, int64_t max_value);

/**
 * @brief Key under which all per-source detection and enforcement state is tracked
 *
 * Immutable once created. The port and pid are carried as context only;
 * they are not part of the key, so every connection from one address (or
 * every run of one executable) shares the same threat state.
 */
class SourceIdentity {
public:
    SourceIdentity() = default;

    static SourceIdentity network(const std::string& address, std::optional<uint16_t> port = std::nullopt);
    static SourceIdentity process(const std::string& executable_path, std::optional<int> pid = std::nullopt);
    static SourceIdentity fileOwner(const std::string& owner);

    SourceKind getKind() const { return kind_; }
    const std::string& getValue() const { return value_; }
    std::optional<uint16_t> getPort() const { return port_; }
    std::optional<int> getPid() const { return pid_; }

    /**
     * @brief Stable key, e.g. "net:10.0.0.5" or "proc:/usr/bin/nc"
     */
    std::string key() const;

    bool empty() const { return value_.empty(); }

    nlohmann::json toJson() const;
    static SourceIdentity fromJson(const nlohmann::json& json);

    bool operator==(const SourceIdentity& other) const;
    bool operator!=(const SourceIdentity& other) const { return !(*this == other); }

private:
    SourceIdentity(SourceKind kind, std::string value,
                   std::optional<uint16_t> port, std::optional<int> pid);

    SourceKind kind_ = SourceKind::NETWORK_ADDRESS;
    std::string value_;
    std::optional<uint16_t> port_;
    std::optional<int> pid_;
};

} // namespace event_management
} // namespace sovereign_defense

namespace std {
template <>
struct hash<sovereign_defense::event_management::SourceIdentity> {
    size_t operator()(const sovereign_defense::event_management::SourceIdentity& identity) const {
        return std::hash<std::string>()(identity.key());
    }
};
} // namespace std
