#include "modules/detection/address_matcher.hpp"
#include <arpa/inet.h>
#include <stdexcept>
#include <cstring>

namespace sovereign_defense {
namespace detection {

namespace {

bool parseAddress(const std::string& text, int& family, std::array<uint8_t, 16>& bytes) {
    bytes.fill(0);
    if (inet_pton(AF_INET, text.c_str(), bytes.data()) == 1) {
        family = AF_INET;
        return true;
    }
    if (inet_pton(AF_INET6, text.c_str(), bytes.data()) == 1) {
        family = AF_INET6;
        return true;
    }
    return false;
}

// Unwraps ::ffff:a.b.c.d into a plain IPv4 address
void normalizeMapped(int& family, std::array<uint8_t, 16>& bytes) {
    static const uint8_t mapped_prefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
    if (family == AF_INET6 && std::memcmp(bytes.data(), mapped_prefix, sizeof(mapped_prefix)) == 0) {
        std::array<uint8_t, 16> v4{};
        std::memcpy(v4.data(), bytes.data() + 12, 4);
        bytes = v4;
        family = AF_INET;
    }
}

bool prefixEqual(const std::array<uint8_t, 16>& a, const std::array<uint8_t, 16>& b, int prefix_length) {
    int full_bytes = prefix_length / 8;
    int remaining_bits = prefix_length % 8;
    if (std::memcmp(a.data(), b.data(), static_cast<size_t>(full_bytes)) != 0) {
        return false;
    }
    if (remaining_bits == 0) {
        return true;
    }
    uint8_t mask = static_cast<uint8_t>(0xff << (8 - remaining_bits));
    return (a[full_bytes] & mask) == (b[full_bytes] & mask);
}

} // namespace

std::optional<AddressPattern> AddressPattern::parse(const std::string& entry) {
    AddressPattern pattern;
    pattern.text = entry;

    std::string address = entry;
    std::optional<int> prefix;
    auto slash = entry.find('/');
    if (slash != std::string::npos) {
        address = entry.substr(0, slash);
        std::string prefix_text = entry.substr(slash + 1);
        if (prefix_text.empty() || prefix_text.size() > 3 ||
            prefix_text.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        prefix = std::stoi(prefix_text);
    }

    if (!parseAddress(address, pattern.family, pattern.bytes)) {
        return std::nullopt;
    }

    int max_prefix = pattern.family == AF_INET ? 32 : 128;
    pattern.prefix_length = prefix ? *prefix : max_prefix;
    if (pattern.prefix_length > max_prefix) {
        return std::nullopt;
    }
    return pattern;
}

bool AddressPattern::matches(const std::string& address) const {
    int candidate_family = 0;
    std::array<uint8_t, 16> candidate{};
    if (!parseAddress(address, candidate_family, candidate)) {
        return false;
    }
    normalizeMapped(candidate_family, candidate);
    if (candidate_family != family) {
        return false;
    }
    return prefixEqual(bytes, candidate, prefix_length);
}

AddressMatcher::AddressMatcher(const std::vector<std::string>& entries) {
    for (const auto& entry : entries) {
        auto pattern = AddressPattern::parse(entry);
        if (!pattern) {
            throw std::invalid_argument("Malformed address entry: " + entry);
        }
        patterns_.push_back(*pattern);
    }
}

bool AddressMatcher::matches(const std::string& address) const {
    for (const auto& pattern : patterns_) {
        if (pattern.matches(address)) {
            return true;
        }
    }
    return false;
}

bool isLoopbackAddress(const std::string& address) {
    int family = 0;
    std::array<uint8_t, 16> bytes{};
    if (!parseAddress(address, family, bytes)) {
        return false;
    }
    normalizeMapped(family, bytes);
    if (family == AF_INET) {
        return bytes[0] == 127;
    }
    static const std::array<uint8_t, 16> loopback6 = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1};
    return bytes == loopback6;
}

} // namespace detection
} // namespace sovereign_defense
