#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "foresight/cancellation.hpp"
#include "foresight/clock.hpp"
#include "foresight/config.hpp"
#include "foresight/engine/prediction_engine.hpp"
#include "foresight/errors.hpp"
#include "foresight/evaluator/market_data.hpp"
#include "foresight/evaluator/outcome_evaluator.hpp"
#include "foresight/guard/temporal_guard.hpp"
#include "foresight/ledger/prediction_ledger.hpp"
#include "foresight/logging.hpp"
#include "foresight/model/model_registry.hpp"
#include "foresight/trainer/model_trainer.hpp"

using namespace foresight;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_TEMPORAL_VIOLATION = 2;
constexpr int EXIT_DUPLICATE = 3;
constexpr int EXIT_NOT_PROMOTED = 4;

std::atomic<bool> g_running{true};
CancellationToken g_cancel;

void signalHandler(int) {
    g_running = false;
    g_cancel.cancel();
}

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config config.json] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  predict --features <snapshot.json>   Predict from a feature snapshot and record it\n"
              << "  evaluate-pending                     Compute outcomes for due predictions\n"
              << "  train [--cutoff <epoch_s>]           Train, validate and maybe promote a model bundle\n"
              << "  audit [--from <epoch_s>] [--to <epoch_s>]\n"
              << "                                       Run the temporal integrity audit\n"
              << "  rollback <model_version>             Re-promote a retained model bundle\n"
              << "  history                              List model bundles, newest first\n"
              << "  serve                                Run evaluation and training on schedule\n";
}

void printJson(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

std::optional<std::string> optionValue(const std::vector<std::string>& args, const std::string& name) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == name) {
            return args[i + 1];
        }
    }
    return std::nullopt;
}

std::optional<Timestamp> timeOption(const std::vector<std::string>& args, const std::string& name) {
    auto value = optionValue(args, name);
    if (!value) {
        return std::nullopt;
    }
    try {
        return from_epoch_seconds(std::stoll(*value));
    } catch (const std::logic_error&) {
        throw std::invalid_argument(name + " expects epoch seconds, got " + *value);
    }
}

/**
 * @brief Long-lived collaborators shared by all commands
 */
struct Pipeline {
    explicit Pipeline(const PipelineConfig& cfg)
        : config(cfg),
          ledger(cfg.database_path, cfg.temporal),
          registry(cfg.database_path, cfg.models_dir, clock),
          guard(cfg.temporal, clock) {}

    PipelineConfig config;
    SystemClock clock;
    PredictionLedger ledger;
    ModelRegistry registry;
    TemporalGuard guard;
};

int runPredict(Pipeline& p, const std::vector<std::string>& args) {
    auto path = optionValue(args, "--features");
    if (!path) {
        throw std::invalid_argument("predict requires --features <snapshot.json>");
    }

    std::ifstream in(*path);
    if (!in.is_open()) {
        throw std::invalid_argument("cannot open feature snapshot " + *path);
    }
    FeatureVector features;
    try {
        nlohmann::json j;
        in >> j;
        features = j.get<FeatureVector>();
    } catch (const nlohmann::json::exception& e) {
        throw FeatureSchemaError("invalid feature snapshot " + *path + ": " + e.what());
    }

    p.registry.load_promoted();
    PredictionEngine engine(p.ledger, p.registry, p.clock, p.config.engine);
    Prediction prediction = engine.predict(features.symbol, features);
    printJson(prediction);
    return EXIT_OK;
}

EvaluationReport evaluateOnce(Pipeline& p) {
    auto market_data = std::make_shared<CsvMarketDataSource>(p.config.market_data.csv_path,
                                                             p.config.market_data.max_staleness);
    OutcomeEvaluator evaluator(p.ledger, market_data, p.guard, p.clock, p.config.evaluator);
    return evaluator.evaluate_pending(&g_cancel);
}

int runEvaluate(Pipeline& p) {
    printJson(evaluateOnce(p));
    return EXIT_OK;
}

int runTrain(Pipeline& p, const std::vector<std::string>& args) {
    p.registry.load_promoted();
    ModelTrainer trainer(p.ledger, p.registry, p.guard, p.clock, p.config);
    TrainingReport report = trainer.train(timeOption(args, "--cutoff"), &g_cancel);
    printJson(report);
    return report.promoted ? EXIT_OK : EXIT_NOT_PROMOTED;
}

int runAudit(Pipeline& p, const std::vector<std::string>& args) {
    Timestamp now = p.clock.now();
    Timestamp from = timeOption(args, "--from").value_or(now - p.config.evaluator.audit_lookback);
    Timestamp to = timeOption(args, "--to").value_or(Timestamp::max());
    AuditReport report = p.guard.audit(p.ledger, from, to);
    printJson(report);
    return report.passed ? EXIT_OK : EXIT_TEMPORAL_VIOLATION;
}

int runRollback(Pipeline& p, const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("rollback requires a model version");
    }
    p.registry.rollback(args[0]);
    printJson({{"promoted_version", args[0]}});
    return EXIT_OK;
}

int runHistory(Pipeline& p) {
    printJson(p.registry.history());
    return EXIT_OK;
}

int runServe(Pipeline& p) {
    auto logger = log::get();
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (!p.registry.load_promoted()) {
        logger->warn("Serving without a promoted model; the first training run will promote one");
    }
    ModelTrainer trainer(p.ledger, p.registry, p.guard, p.clock, p.config);

    logger->info("Scheduler running: evaluate every {} s, train every {} s",
                 p.config.scheduler.evaluate_interval.count(), p.config.scheduler.train_interval.count());
    logger->info("Press Ctrl+C to stop");

    auto next_evaluate = std::chrono::steady_clock::now();
    auto next_train = next_evaluate + p.config.scheduler.train_interval;

    while (g_running) {
        auto now = std::chrono::steady_clock::now();

        if (now >= next_evaluate) {
            try {
                auto report = evaluateOnce(p);
                logger->info("Evaluation tick: {}", nlohmann::json(report).dump());
            } catch (const TemporalIntegrityViolation& e) {
                logger->critical("Evaluation halted: {}", e.what());
            } catch (const std::exception& e) {
                logger->error("Evaluation tick failed: {}", e.what());
            }
            next_evaluate = now + p.config.scheduler.evaluate_interval;
        }

        if (g_running && now >= next_train) {
            try {
                auto report = trainer.train(std::nullopt, &g_cancel);
                logger->info("Training tick: {}", nlohmann::json(report).dump());
            } catch (const TemporalIntegrityViolation& e) {
                logger->critical("Training halted: {}", e.what());
            } catch (const std::exception& e) {
                logger->error("Training tick failed: {}", e.what());
            }
            next_train = now + p.config.scheduler.train_interval;
        }

        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    logger->info("Shutdown complete");
    return EXIT_OK;
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_file = "config.json";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return EXIT_OK;
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage(argv[0]);
        return EXIT_ERROR;
    }
    const std::string command = args.front();
    args.erase(args.begin());

    try {
        PipelineConfig config = load_config(config_file);
        log::init(config.log_file, config.log_level);

        auto logger = log::get();
        logger->debug("foresight {} (config {}, database {})", command, config_file, config.database_path);

        Pipeline pipeline(config);

        int rc = EXIT_ERROR;
        if (command == "predict") {
            rc = runPredict(pipeline, args);
        } else if (command == "evaluate-pending") {
            rc = runEvaluate(pipeline);
        } else if (command == "train") {
            rc = runTrain(pipeline, args);
        } else if (command == "audit") {
            rc = runAudit(pipeline, args);
        } else if (command == "rollback") {
            rc = runRollback(pipeline, args);
        } else if (command == "history") {
            rc = runHistory(pipeline);
        } else if (command == "serve") {
            rc = runServe(pipeline);
        } else {
            logger->error("Unknown command: {}", command);
            printUsage(argv[0]);
        }
        spdlog::shutdown();
        return rc;

    } catch (const TemporalIntegrityViolation& e) {
        log::get()->critical("Temporal integrity violation: {}", e.what());
        nlohmann::json out{{"error", "TemporalIntegrityViolation"}, {"message", e.what()}};
        if (e.report()) {
            out["audit"] = *e.report();
        }
        printJson(out);
        spdlog::shutdown();
        return EXIT_TEMPORAL_VIOLATION;
    } catch (const DuplicatePredictionError& e) {
        log::get()->warn("Already predicted: {}", e.what());
        printJson({{"error", "DuplicatePredictionError"},
                   {"message", e.what()},
                   {"symbol", e.symbol()},
                   {"time_bucket", e.time_bucket()}});
        spdlog::shutdown();
        return EXIT_DUPLICATE;
    } catch (const InsufficientTrainingDataError& e) {
        log::get()->warn("Training aborted: {}", e.what());
        printJson({{"error", "InsufficientTrainingDataError"}, {"message", e.what()}});
        spdlog::shutdown();
        return EXIT_NOT_PROMOTED;
    } catch (const NoPromotedModelError& e) {
        log::get()->error("{}", e.what());
        printJson({{"error", "NoPromotedModelError"}, {"message", e.what()}});
        spdlog::shutdown();
        return EXIT_NOT_PROMOTED;
    } catch (const std::exception& e) {
        log::get()->error("Fatal error: {}", e.what());
        printJson({{"error", "PipelineError"}, {"message", e.what()}});
        spdlog::shutdown();
        return EXIT_ERROR;
    }
}
