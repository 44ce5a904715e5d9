#pragma once

#include "modules/event_management/observation.hpp"
#include <functional>
#include <string>

namespace sovereign_defense {
namespace monitoring {

/**
 * @brief Receives observations from a capture source
 *
 * @return false if the observation was rejected
 */
using ObservationSink = std::function<bool(const event_management::Observation&)>;

/**
 * @brief Feed of network, process and file observations into the core
 *
 * Delivery is at-least-once; the detectors deduplicate where it matters.
 */
class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    virtual std::string name() const = 0;
    virtual void start(ObservationSink sink) = 0;
    virtual void stop() = 0;
};

} // namespace monitoring
} // namespace sovereign_defense
