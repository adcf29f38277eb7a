/**
 * @file split_orchestrator.cpp
 * @brief Pull, plan and apply of a split run
 */

#include <transfer/split_orchestrator.hpp>
#include <transfer/module_matcher.hpp>
#include <transfer/split_report.hpp>
#include <state/module_path.hpp>
#include <state/state_codec.hpp>
#include <state/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <set>

namespace Terrasplit {

namespace {

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

const char* phase_name(RunPhase phase) {
    switch (phase) {
        case RunPhase::Idle:        return "Idle";
        case RunPhase::Pulled:      return "Pulled";
        case RunPhase::Planned:     return "Planned";
        case RunPhase::DryReported: return "DryReported";
        case RunPhase::Applying:    return "Applying";
        case RunPhase::Applied:     return "Applied";
        case RunPhase::Failed:      return "Failed";
    }
    return "Unknown";
}

SplitOrchestrator::SplitOrchestrator(StateBackend& backend, SplitOptions options)
    : backend_(backend), options_(options) {}

void SplitOrchestrator::require_phase(RunPhase expected, const char* operation) const {
    if (phase_ != expected) {
        throw std::logic_error(std::string(operation) + " requires phase " + phase_name(expected) +
                               ", run is in phase " + phase_name(phase_));
    }
}

const StateDocument* SplitOrchestrator::destination_document(const std::string& directory) const {
    auto it = destinations_.find(normalize_directory(directory));
    return it == destinations_.end() ? nullptr : &it->second.doc;
}

void SplitOrchestrator::validate(const std::string& source_directory,
                                 const std::vector<SplitMapping>& mappings) const {
    if (source_directory.empty()) {
        throw ConfigError("no source directory given");
    }
    if (mappings.empty()) {
        throw ConfigError("no split mappings given");
    }

    const std::string source = normalize_directory(source_directory);
    std::set<ModulePath> seen;

    for (const auto& mapping : mappings) {
        if (mapping.module.empty()) {
            throw ConfigError("cannot split the root module; name a module path");
        }
        if (mapping.destination.empty()) {
            throw ConfigError("mapping for " + format_module_path(mapping.module) + " has no destination");
        }
        if (normalize_directory(mapping.destination) == source) {
            throw ConfigError("mapping for " + format_module_path(mapping.module) +
                              " targets the source directory itself");
        }
        if (!seen.insert(mapping.module).second) {
            throw ConfigError("module " + format_module_path(mapping.module) + " is mapped more than once");
        }
    }
}

SplitOrchestrator::WorkingDocument SplitOrchestrator::pull_document(const std::string& directory,
                                                                    const std::string& tool_version) {
    std::string text = backend_.pull(directory);

    WorkingDocument working;
    if (is_blank(text)) {
        Logger::warn(directory + " has no state yet");
        working.doc = SerialPolicy::initial_document(tool_version);
        working.pulled = SerialPolicy::snapshot(directory, working.doc, false);
        return working;
    }

    try {
        working.doc = StateCodec::decode(text);
    } catch (const ParseError&) {
        Logger::error("State pulled from " + directory + " could not be decoded");
        throw;
    }
    working.pulled = SerialPolicy::snapshot(directory, working.doc);

    Logger::debug(directory + ": serial " + std::to_string(working.doc.serial) +
                  ", lineage " + working.doc.lineage + ", " +
                  std::to_string(working.doc.resources.size()) + " resources");
    return working;
}

const SplitPlan& SplitOrchestrator::plan(const std::string& source_directory,
                                         const std::vector<SplitMapping>& mappings) {
    require_phase(RunPhase::Idle, "plan");
    validate(source_directory, mappings);

    // A failed earlier attempt may have left pulled documents behind.
    plan_ = SplitPlan();
    source_ = WorkingDocument();
    destinations_.clear();
    moved_out_.clear();
    plan_.source = normalize_directory(source_directory);

    Logger::step("Pulling source state from " + plan_.source);
    source_ = pull_document(plan_.source, "");

    for (const auto& mapping : mappings) {
        std::string destination = normalize_directory(mapping.destination);
        if (destinations_.count(destination)) continue;

        Logger::step("Pulling destination state from " + destination);
        destinations_.emplace(destination, pull_document(destination, source_.doc.tool_version));
        plan_.destinations.push_back(destination);
    }
    phase_ = RunPhase::Pulled;

    for (const auto& mapping : mappings) {
        plan_.mappings.push_back(plan_mapping(mapping));
    }
    flag_source_dependencies();
    plan_.source_changed = source_.changed;

    phase_ = RunPhase::Planned;
    Logger::info("Planned " + std::to_string(plan_.instances_moved) + " instance move(s) across " +
                 std::to_string(plan_.mappings.size()) + " mapping(s)");
    return plan_;
}

MappingPlan SplitOrchestrator::plan_mapping(const SplitMapping& mapping) {
    const size_t mapping_index = plan_.mappings.size();
    MappingPlan result;
    result.mapping = mapping;
    result.mapping.destination = normalize_directory(mapping.destination);

    Logger::step("Processing " + format_module_path(mapping.module) + " -> " +
                 result.mapping.destination + " as " + display_module_path(mapping.new_prefix));

    std::vector<size_t> selected = ModuleMatcher::select(source_.doc, mapping.module, plan_.source);
    Logger::info("Found " + std::to_string(selected.size()) + " resource(s) under " +
                 format_module_path(mapping.module));

    AddressRewriter rewriter(mapping.module, mapping.new_prefix);
    std::vector<ResourceEntry> relocated;
    relocated.reserve(selected.size());
    for (size_t index : selected) {
        relocated.push_back(rewriter.rewrite(source_.doc.resources[index], result.dangling));
    }

    WorkingDocument& destination = destinations_.at(result.mapping.destination);
    MergeResult merged = MergeEngine::merge(destination.doc, relocated, options_.overwrite);
    if (merged.changed()) destination.changed = true;
    result.conflicts = merged.conflicts;

    // Rebuild the source without the instances that landed in the destination.
    std::vector<ResourceEntry> remaining;
    remaining.reserve(source_.doc.resources.size());
    size_t next = 0;

    for (size_t i = 0; i < source_.doc.resources.size(); ++i) {
        ResourceEntry& entry = source_.doc.resources[i];
        if (next >= selected.size() || selected[next] != i) {
            remaining.push_back(std::move(entry));
            continue;
        }

        const size_t e = next++;
        MovedResource moved;
        moved.from = entry.address();
        moved.to = relocated[e].address();

        std::vector<ResourceInstance> kept;
        for (size_t k = 0; k < entry.instances.size(); ++k) {
            if (merged.rejected(e, k)) {
                kept.push_back(std::move(entry.instances[k]));
            } else {
                moved.instances_moved++;
            }
        }
        moved.instances_kept = kept.size();
        plan_.instances_moved += moved.instances_moved;

        Logger::debug("  " + moved.from + " -> " + moved.to + " (" +
                      std::to_string(moved.instances_moved) + " moved, " +
                      std::to_string(moved.instances_kept) + " kept)");
        result.resources.push_back(std::move(moved));

        if (kept.empty()) {
            moved_out_.emplace(moved.from, mapping_index);
            plan_.resources_removed++;
            source_.changed = true;
            continue;
        }
        for (size_t k = 0; k < entry.instances.size(); ++k) {
            const ResourceInstance& instance = entry.instances[k];
            if (!merged.rejected(e, k) && instance.index_key) {
                moved_out_.emplace(moved.from + format_index_key(*instance.index_key), mapping_index);
            }
        }
        if (kept.size() != entry.instances.size()) {
            source_.changed = true;
        }
        entry.instances = std::move(kept);
        remaining.push_back(std::move(entry));
    }
    source_.doc.resources = std::move(remaining);

    for (const auto& conflict : result.conflicts) {
        Logger::warn("Conflict on " + conflict.address + " in " + result.mapping.destination + ": " +
                     resolution_name(conflict.resolution) +
                     (conflict.identical ? " (instances identical)" : ""));
    }
    for (const auto& ref : result.dangling) {
        Logger::warn("Dangling dependency " + ref.dependency + " of " + ref.instance_address + ": " + ref.reason);
    }

    return result;
}

void SplitOrchestrator::flag_source_dependencies() {
    if (moved_out_.empty()) return;

    for (const auto& entry : source_.doc.resources) {
        for (const auto& instance : entry.instances) {
            if (!instance.dependencies) continue;

            for (const auto& dep : *instance.dependencies) {
                ResourceAddress target;
                try {
                    target = parse_resource_address(dep);
                } catch (const ParseError&) {
                    continue;   // never pointed at anything this run moved
                }

                auto hit = moved_out_.find(target.to_string());
                if (hit == moved_out_.end() && target.index_key) {
                    target.index_key.reset();
                    hit = moved_out_.find(target.to_string());
                }
                if (hit == moved_out_.end()) continue;

                MappingPlan& owner = plan_.mappings[hit->second];
                DanglingReference ref{entry.instance_address(instance), dep,
                                      "refers to a resource moved to " + owner.mapping.destination};
                Logger::warn("Dangling dependency " + ref.dependency + " of " + ref.instance_address +
                             " (left in source): " + ref.reason);
                owner.dangling.push_back(std::move(ref));
            }
        }
    }
}

const SplitPlan& SplitOrchestrator::report() {
    require_phase(RunPhase::Planned, "report");
    phase_ = RunPhase::DryReported;
    Logger::info("DRY RUN: no state was pushed");
    return plan_;
}

void SplitOrchestrator::push_document(WorkingDocument& working) {
    SerialPolicy::finalize(working.doc, working.pulled);
    Logger::step("Pushing " + working.pulled.directory + " with serial " + std::to_string(working.doc.serial));
    backend_.push(working.pulled.directory, StateCodec::encode(working.doc));
}

ApplyOutcome SplitOrchestrator::apply() {
    require_phase(RunPhase::Planned, "apply");
    phase_ = RunPhase::Applying;

    ApplyOutcome outcome;

    for (size_t i = 0; i < plan_.destinations.size(); ++i) {
        const std::string& directory = plan_.destinations[i];
        WorkingDocument& working = destinations_.at(directory);

        if (!working.changed) {
            Logger::info(directory + " received nothing new; not pushing");
            outcome.unchanged.push_back(directory);
            continue;
        }

        try {
            push_document(working);
        } catch (const std::exception& e) {
            outcome.failed = directory;
            outcome.error = e.what();
            for (size_t j = i + 1; j < plan_.destinations.size(); ++j) {
                outcome.not_attempted.push_back(plan_.destinations[j]);
            }
            phase_ = RunPhase::Failed;
            outcome.phase = phase_;
            Logger::error("Push to " + directory + " failed: " + outcome.error);
            Logger::error("Source " + plan_.source + " left untouched");
            return outcome;
        }
        outcome.pushed.push_back(directory);
        Logger::success("Pushed " + directory);
    }

    if (!source_.changed) {
        Logger::info("Nothing left the source; not pushing " + plan_.source);
        outcome.source_unchanged = true;
    } else {
        try {
            push_document(source_);
        } catch (const std::exception& e) {
            outcome.failed = plan_.source;
            outcome.error = e.what();
            outcome.terminal_inconsistency = true;
            phase_ = RunPhase::Failed;
            outcome.phase = phase_;
            Logger::error("Push to source " + plan_.source + " failed: " + outcome.error);
            Logger::error("Moved resources now exist in both the source and the destinations; "
                          "manual recovery required");
            return outcome;
        }
        outcome.source_pushed = true;
        Logger::success("Pushed source " + plan_.source);
    }

    phase_ = RunPhase::Applied;
    outcome.phase = phase_;
    return outcome;
}

std::optional<ApplyOutcome> SplitOrchestrator::run(const std::string& source_directory,
                                                    const std::vector<SplitMapping>& mappings) {
    plan(source_directory, mappings);
    SplitReport::log_plan(plan_, options_.dry_run);
    if (options_.dry_run) {
        report();
        return std::nullopt;
    }
    return apply();
}

} // namespace Terrasplit
