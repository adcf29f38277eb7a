#include <transfer/split_report.hpp>
#include <state/module_path.hpp>
#include <utils/logger.hpp>

namespace Terrasplit {

Json SplitReport::plan_to_json(const SplitPlan& plan, bool dry_run) {
    Json root = Json::object();
    root["source"] = plan.source;
    root["dry_run"] = dry_run;
    root["destinations"] = plan.destinations;
    root["resources_removed_from_source"] = plan.resources_removed;
    root["instances_moved"] = plan.instances_moved;
    root["source_changed"] = plan.source_changed;

    Json mappings = Json::array();
    for (const auto& mp : plan.mappings) {
        Json node = Json::object();
        node["module"] = format_module_path(mp.mapping.module);
        node["destination"] = mp.mapping.destination;
        node["new_prefix"] = format_module_path(mp.mapping.new_prefix);

        Json resources = Json::array();
        for (const auto& moved : mp.resources) {
            resources.push_back({
                {"from", moved.from},
                {"to", moved.to},
                {"instances_moved", moved.instances_moved},
                {"instances_kept", moved.instances_kept}
            });
        }
        node["resources"] = std::move(resources);

        Json conflicts = Json::array();
        for (const auto& conflict : mp.conflicts) {
            conflicts.push_back({
                {"address", conflict.address},
                {"resolution", resolution_name(conflict.resolution)},
                {"identical", conflict.identical}
            });
        }
        node["conflicts"] = std::move(conflicts);

        Json dangling = Json::array();
        for (const auto& ref : mp.dangling) {
            dangling.push_back({
                {"instance", ref.instance_address},
                {"dependency", ref.dependency},
                {"reason", ref.reason}
            });
        }
        node["dangling_dependencies"] = std::move(dangling);

        mappings.push_back(std::move(node));
    }
    root["mappings"] = std::move(mappings);
    return root;
}

Json SplitReport::outcome_to_json(const ApplyOutcome& outcome, const SplitPlan& plan) {
    Json root = Json::object();
    root["phase"] = phase_name(outcome.phase);
    root["source"] = plan.source;
    root["pushed"] = outcome.pushed;
    root["unchanged"] = outcome.unchanged;
    root["failed"] = outcome.failed ? Json(*outcome.failed) : Json(nullptr);
    root["not_attempted"] = outcome.not_attempted;
    root["source_pushed"] = outcome.source_pushed;
    root["source_unchanged"] = outcome.source_unchanged;
    root["terminal_inconsistency"] = outcome.terminal_inconsistency;
    if (!outcome.error.empty()) root["error"] = outcome.error;
    return root;
}

void SplitReport::log_plan(const SplitPlan& plan, bool dry_run) {
    const std::string lead = dry_run ? "DRY RUN: would move " : "Moving ";

    for (const auto& mp : plan.mappings) {
        size_t moving = 0;
        for (const auto& moved : mp.resources) moving += moved.instances_moved;

        Logger::info(lead + std::to_string(moving) + " instance(s) of " + format_module_path(mp.mapping.module) +
                     " from " + plan.source + " to " + mp.mapping.destination);
        for (const auto& moved : mp.resources) {
            std::string line = "  - " + moved.from;
            if (moved.to != moved.from) line += " -> " + moved.to;
            if (moved.instances_kept > 0) {
                line += " (" + std::to_string(moved.instances_kept) + " instance(s) stay in source)";
            }
            Logger::info(line);
        }
        for (const auto& conflict : mp.conflicts) {
            Logger::warn("  conflict " + conflict.address + ": " + resolution_name(conflict.resolution));
        }
        if (!mp.dangling.empty()) {
            Logger::warn("  " + std::to_string(mp.dangling.size()) + " dangling dependency reference(s)");
            for (const auto& ref : mp.dangling) {
                Logger::warn("    " + ref.instance_address + " -> " + ref.dependency);
            }
        }
    }
}

void SplitReport::log_outcome(const ApplyOutcome& outcome, const SplitPlan& plan) {
    if (outcome.ok()) {
        Logger::success("Terraform state splitting completed");
        return;
    }

    for (const auto& dir : outcome.pushed) Logger::error("  written:       " + dir);
    if (outcome.failed) Logger::error("  failed:        " + *outcome.failed);
    for (const auto& dir : outcome.not_attempted) Logger::error("  not attempted: " + dir);

    if (outcome.terminal_inconsistency) {
        Logger::error("Source " + plan.source + " still holds the moved resources. Remove them by hand "
                      "(terraform state rm) once the destinations are verified; do not re-run the split.");
    } else {
        Logger::error("Source " + plan.source + " was not modified. Resources in written destinations "
                      "are duplicated until reconciled by hand.");
    }
}

} // namespace Terrasplit
