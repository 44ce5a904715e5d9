#pragma once

#include <string>
#include <vector>
#include <array>
#include <optional>
#include <cstdint>

namespace sovereign_defense {
namespace detection {

/**
 * @brief Single IPv4/IPv6 address or CIDR block
 */
struct AddressPattern {
    int family = 0;
    std::array<uint8_t, 16> bytes{};
    int prefix_length = 0;
    std::string text;

    /**
     * @brief Parses "10.0.0.5", "10.0.0.0/8", "fe80::/10", ...
     *
     * @return std::nullopt when the entry is malformed
     */
    static std::optional<AddressPattern> parse(const std::string& entry);

    bool matches(const std::string& address) const;
};

/**
 * @brief Set of address patterns checked with any-match semantics
 */
class AddressMatcher {
public:
    AddressMatcher() = default;

    /**
     * @throws std::invalid_argument on a malformed entry
     */
    explicit AddressMatcher(const std::vector<std::string>& entries);

    bool matches(const std::string& address) const;
    bool empty() const { return patterns_.empty(); }
    size_t size() const { return patterns_.size(); }

private:
    std::vector<AddressPattern> patterns_;
};

/**
 * @brief true for 127.0.0.0/8, ::1 and IPv4-mapped loopback
 */
bool isLoopbackAddress(const std::string& address);

} // namespace detection
} // namespace sovereign_defense
