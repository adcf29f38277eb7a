/**
 * @file terrasplit.cpp
 * @brief Split one Terraform/Terragrunt state into per-module states
 */

#include <config/split_config.hpp>
#include <backend/command_backend.hpp>
#include <transfer/split_orchestrator.hpp>
#include <transfer/split_report.hpp>
#include <state/module_path.hpp>
#include <state/errors.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <unistd.h>

using namespace Terrasplit;

namespace {

constexpr int kExitError = 1;
constexpr int kExitPartial = 2;
constexpr int kExitInconsistent = 3;

} // namespace

int main(int argc, char** argv) {
    SplitConfig config;
    try {
        config = SplitConfig::parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitError;
    }

    if (config.show_help) {
        std::cout << SplitConfig::usage(argv[0]);
        return 0;
    }

    Logger::set_verbose(config.verbose);
    if (config.json_output) Logger::set_stream(std::cerr);
    Logger::set_color(::isatty(config.json_output ? STDERR_FILENO : STDOUT_FILENO) != 0);

    Logger::info("Source module: " + config.source);
    for (const auto& mapping : config.mappings) {
        Logger::info("Split mapping: " + format_module_path(mapping.module) + " -> " + mapping.destination +
                     " as " + display_module_path(mapping.new_prefix));
    }

    CommandBackend backend(config.backend_config());
    SplitOrchestrator orchestrator(backend, config.split_options());

    try {
        std::optional<ApplyOutcome> outcome = orchestrator.run(config.source, config.mappings);
        const SplitPlan& plan = orchestrator.current_plan();

        if (config.json_output) {
            Json report = Json::object();
            report["plan"] = SplitReport::plan_to_json(plan, config.dry_run);
            if (outcome) report["outcome"] = SplitReport::outcome_to_json(*outcome, plan);
            std::cout << report.dump(2) << std::endl;
        }

        if (!outcome) return 0;

        SplitReport::log_outcome(*outcome, plan);
        if (outcome->terminal_inconsistency) return kExitInconsistent;
        if (!outcome->ok()) return kExitPartial;
        return 0;
    } catch (const std::exception& e) {
        Logger::error(std::string("Error: ") + e.what());
        Logger::error("No state was modified");
        return kExitError;
    }
}
