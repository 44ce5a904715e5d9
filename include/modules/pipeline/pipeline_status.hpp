#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace sovereign_defense {
namespace pipeline {

/**
 * @brief Overall health
 *
 * DEGRADED covers transient conditions (enforcement pending retry, boundary
 * drops). HALTED means the evidence ledger failed and ingestion stopped.
 */
enum class PipelineHealth {
    HEALTHY,
    DEGRADED,
    HALTED
};

std::string healthToString(PipelineHealth health);

struct PipelineStatus {
    PipelineHealth health = PipelineHealth::HEALTHY;
    std::string halt_reason;

    uint64_t observations_accepted = 0;
    uint64_t observations_rejected = 0;
    uint64_t detector_errors = 0;
    uint64_t events_emitted = 0;
    uint64_t records_committed = 0;
    uint64_t events_discarded = 0;

    uint64_t enforcement_completed = 0;
    uint64_t enforcement_failed = 0;
    uint64_t enforcement_dropped = 0;
    uint64_t enforcement_pending = 0;

    uint64_t alerts_delivered = 0;
    uint64_t alert_failures = 0;
    uint64_t alerts_dropped = 0;

    uint64_t tracked_sources = 0;
    uint64_t ledger_size = 0;

    nlohmann::json toJson() const;
};

} // namespace pipeline
} // namespace sovereign_defense
