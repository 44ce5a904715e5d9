#include "modules/alerting/alert_dispatcher.hpp"
#include "modules/config/config_reader.hpp"
#include "modules/config/defense_config.hpp"
#include "modules/evidence/evidence_ledger.hpp"
#include "modules/evidence/ledger_storage.hpp"
#include "modules/logging/logging_module.hpp"
#include "modules/monitoring/json_feed_source.hpp"
#include "modules/pipeline/defense_pipeline.hpp"
#include "modules/response/command_enforcement_gateway.hpp"

#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>
#include <vector>
#include <memory>
#include <string>
#include <mutex>
#include <condition_variable>

using namespace sovereign_defense;

namespace {

std::atomic<bool> running(true);
std::mutex main_mutex;
std::condition_variable main_cv;

void signalHandler(int) {
    running = false;
    main_cv.notify_all();
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <config_file> [--verify | --export [kind]]" << std::endl;
}

std::shared_ptr<evidence::EvidenceLedger> openLedger(const config::DefenseConfig& defense_config,
                                                     std::shared_ptr<logging::LoggingModule> logging_module) {
    auto storage = evidence::createLedgerStorage(defense_config.evidence, logging_module);
    return std::make_shared<evidence::EvidenceLedger>(storage, defense_config.evidence, logging_module);
}

// Verifies the whole chain, prints the result and returns 0 when intact, 2 otherwise
int verifyLedger(const config::DefenseConfig& defense_config,
                 std::shared_ptr<logging::LoggingModule> logging_module) {
    auto ledger = openLedger(defense_config, logging_module);
    auto result = ledger->verifyChain();

    nlohmann::json report = {
        {"intact", result.intact},
        {"records_checked", result.records_checked},
        {"ledger_size", ledger->size()},
        {"head_hash", ledger->headHash()}
    };
    if (result.first_broken_sequence) {
        report["first_broken_sequence"] = *result.first_broken_sequence;
        report["reason"] = result.reason;
    }
    std::cout << report.dump() << std::endl;
    return result.intact ? 0 : 2;
}

// Streams committed records as JSON lines
int exportLedger(const config::DefenseConfig& defense_config,
                 std::shared_ptr<logging::LoggingModule> logging_module,
                 const std::string& kind) {
    evidence::EvidenceQuery query;
    if (!kind.empty()) {
        query.kind = event_management::eventKindFromString(kind);
        if (!query.kind) {
            std::cerr << "Unknown event kind: " << kind << std::endl;
            return 1;
        }
    }

    auto ledger = openLedger(defense_config, logging_module);
    auto cursor = ledger->query(query);
    while (auto record = cursor.next()) {
        std::cout << record->toJson().dump() << "\n";
    }
    std::cout.flush();
    return 0;
}

int runDaemon(const config::DefenseConfig& defense_config,
              std::shared_ptr<logging::LoggingModule> logging_module) {
    logging_module->log(logging::LogLevel::INFO, "Main", "runDaemon", "Sovereign Defense starting",
                        __FILE__, __FUNCTION__, std::to_string(__LINE__));

    auto ledger = openLedger(defense_config, logging_module);
    auto gateway = std::make_shared<response::CommandEnforcementGateway>(defense_config.enforcement, logging_module);

    pipeline::DefensePipeline defense_pipeline(defense_config, ledger, gateway, logging_module);
    for (auto& sink : alerting::createAlertSinks(defense_config.alerting, logging_module)) {
        defense_pipeline.addAlertSink(sink);
    }
    defense_pipeline.start();

    std::vector<std::unique_ptr<monitoring::JsonFeedSource>> feeds;
    for (const auto& feed_path : defense_config.capture.feeds) {
        auto feed = std::make_unique<monitoring::JsonFeedSource>(feed_path, defense_config.capture.poll_interval,
                                                                 defense_config.capture.start_at_end, logging_module);
        feed->start([&defense_pipeline](const event_management::Observation& observation) {
            return defense_pipeline.submit(observation);
        });
        feeds.push_back(std::move(feed));
    }

    std::cout << "Sovereign Defense running. Press Ctrl+C to stop." << std::endl;

    while (running) {
        {
            std::unique_lock<std::mutex> lock(main_mutex);
            main_cv.wait_for(lock, defense_config.pipeline.status_interval, [] { return !running.load(); });
            if (!running) {
                break;
            }
        }

        auto status = defense_pipeline.status();
        logging_module->log(status.health == pipeline::PipelineHealth::HEALTHY ? logging::LogLevel::INFO
                                                                               : logging::LogLevel::WARNING,
                            "Main", "runDaemon", "Status: " + pipeline::healthToString(status.health),
                            __FILE__, __FUNCTION__, std::to_string(__LINE__), status.toJson());
    }

    logging_module->log(logging::LogLevel::INFO, "Main", "runDaemon", "Sovereign Defense shutting down",
                        __FILE__, __FUNCTION__, std::to_string(__LINE__));

    for (auto& feed : feeds) {
        feed->stop();
    }
    defense_pipeline.stop();

    return defense_pipeline.isHalted() ? 2 : 0;
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string config_path = argv[1];
    std::string command = argc > 2 ? argv[2] : "";

    try {
        config::ConfigReader reader(config_path);
        auto defense_config = config::loadDefenseConfig(reader);

        if (command == "--verify" || command == "--export") {
            // Keep stdout for the report, log to the file only
            logging::LoggingConfig quiet;
            quiet.console_logging = false;
            quiet.default_log_file = "logs/sovereign_defense.log";
            auto logging_module = std::make_shared<logging::LoggingModule>(quiet);

            if (command == "--verify") {
                return verifyLedger(defense_config, logging_module);
            }
            return exportLedger(defense_config, logging_module, argc > 3 ? argv[3] : "");
        }
        if (!command.empty()) {
            printUsage(argv[0]);
            return 1;
        }
        return runDaemon(defense_config, std::make_shared<logging::LoggingModule>(config_path));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
