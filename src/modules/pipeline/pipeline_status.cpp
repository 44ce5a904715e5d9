#include "modules/pipeline/pipeline_status.hpp"

namespace sovereign_defense {
namespace pipeline {

std::string healthToString(PipelineHealth health) {
    switch (health) {
        case PipelineHealth::HEALTHY: return "healthy";
        case PipelineHealth::DEGRADED: return "degraded";
        case PipelineHealth::HALTED: return "halted";
    }
    return "healthy";
}

nlohmann::json PipelineStatus::toJson() const {
    nlohmann::json j;
    j["health"] = healthToString(health);
    if (!halt_reason.empty()) {
        j["halt_reason"] = halt_reason;
    }
    j["observations"] = {
        {"accepted", observations_accepted},
        {"rejected", observations_rejected},
        {"detector_errors", detector_errors}
    };
    j["evidence"] = {
        {"events_emitted", events_emitted},
        {"records_committed", records_committed},
        {"events_discarded", events_discarded},
        {"ledger_size", ledger_size}
    };
    j["enforcement"] = {
        {"completed", enforcement_completed},
        {"failed", enforcement_failed},
        {"dropped", enforcement_dropped},
        {"pending", enforcement_pending}
    };
    j["alerts"] = {
        {"delivered", alerts_delivered},
        {"failed", alert_failures},
        {"dropped", alerts_dropped}
    };
    j["tracked_sources"] = tracked_sources;
    return j;
}

} // namespace pipeline
} // namespace sovereign_defense
