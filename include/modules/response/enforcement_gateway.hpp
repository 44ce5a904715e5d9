#pragma once

#include "modules/event_management/source_identity.hpp"
#include <chrono>

namespace sovereign_defense {
namespace response {

/**
 * @brief Boundary towards the mechanism that physically blocks a source
 *
 * Implementations must be idempotent: blocking an already blocked identity
 * (or unblocking one that is not blocked) succeeds without side effects.
 * Calls may be slow and may fail; they are only issued from the
 * enforcement dispatcher thread.
 */
class EnforcementGateway {
public:
    virtual ~EnforcementGateway() = default;

    /**
     * @brief Blocks the identity
     *
     * @param source Identity to block
     * @param duration Intended block duration, zero for a permanent block
     * @return true on success
     */
    virtual bool block(const event_management::SourceIdentity& source, std::chrono::seconds duration) = 0;

    /**
     * @brief Lifts a block
     *
     * @return true on success
     */
    virtual bool unblock(const event_management::SourceIdentity& source) = 0;
};

} // namespace response
} // namespace sovereign_defense
