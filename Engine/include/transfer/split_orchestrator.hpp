/**
 * @file split_orchestrator.hpp
 * @brief Sequencing of one split run across a source and N destinations
 *
 * Run phases:
 *   Idle -> Pulled -> Planned -> DryReported
 *                             -> Applying -> Applied | Failed
 *
 * The source and every distinct destination are pulled exactly once; two
 * mappings into the same destination share one in-memory document. Apply is
 * a saga without rollback: destinations are pushed first in mapping order,
 * and the reduced source is pushed only after every destination push
 * succeeded. A failed push stops the run and the outcome records precisely
 * which directories were written.
 *
 * Resources left in the source whose dependencies name a resource that moved
 * out are reported as dangling references of the mapping that moved it.
 */

#pragma once

#include <backend/state_backend.hpp>
#include <state/state_document.hpp>
#include <transfer/address_rewriter.hpp>
#include <transfer/merge_engine.hpp>
#include <transfer/serial_policy.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Terrasplit {

/**
 * @brief One unit of work: move the subtree at `module` into `destination` under `new_prefix`.
 */
struct SplitMapping {
    ModulePath module;
    std::string destination;
    ModulePath new_prefix;
};

/**
 * @brief One selected source resource and where it lands.
 */
struct MovedResource {
    std::string from;
    std::string to;
    size_t instances_moved = 0;
    size_t instances_kept = 0;   // left in the source because of a conflict
};

struct MappingPlan {
    SplitMapping mapping;
    std::vector<MovedResource> resources;
    std::vector<MergeConflict> conflicts;
    std::vector<DanglingReference> dangling;
};

struct SplitPlan {
    std::string source;
    std::vector<MappingPlan> mappings;
    std::vector<std::string> destinations;   // distinct, in first-mention order
    size_t resources_removed = 0;            // entries removed from the source
    size_t instances_moved = 0;
    bool source_changed = false;
};

enum class RunPhase {
    Idle,
    Pulled,
    Planned,
    DryReported,
    Applying,
    Applied,
    Failed
};

const char* phase_name(RunPhase phase);

struct ApplyOutcome {
    RunPhase phase = RunPhase::Idle;
    std::vector<std::string> pushed;          // destinations written, in order
    std::vector<std::string> unchanged;       // destinations with nothing to write
    std::optional<std::string> failed;        // directory whose push failed
    std::vector<std::string> not_attempted;   // destinations skipped after a failure
    bool source_pushed = false;
    bool source_unchanged = false;
    bool terminal_inconsistency = false;      // all destinations written, source push failed
    std::string error;

    bool ok() const { return phase == RunPhase::Applied; }
};

struct SplitOptions {
    bool dry_run = false;
    bool overwrite = false;
};

class SplitOrchestrator {
public:
    SplitOrchestrator(StateBackend& backend, SplitOptions options = SplitOptions());

    /**
     * @brief Pull every involved document and plan all mappings in memory
     * @throws ConfigError, BackendError, ParseError, ModuleNotFoundError; nothing is pushed
     */
    const SplitPlan& plan(const std::string& source_directory, const std::vector<SplitMapping>& mappings);

    /**
     * @brief Finish a dry run: mark the plan as reported without touching any backend.
     */
    const SplitPlan& report();

    /**
     * @brief Push destinations, then the source. Push failures are returned, not thrown.
     */
    ApplyOutcome apply();

    /**
     * @brief plan() and log the plan, then report() or apply() according to the options.
     */
    std::optional<ApplyOutcome> run(const std::string& source_directory, const std::vector<SplitMapping>& mappings);

    RunPhase phase() const { return phase_; }
    const SplitPlan& current_plan() const { return plan_; }
    const SplitOptions& options() const { return options_; }

    const StateDocument& source_document() const { return source_.doc; }
    const StateDocument* destination_document(const std::string& directory) const;

private:
    struct WorkingDocument {
        StateDocument doc;
        PulledState pulled;
        bool changed = false;
    };

    void validate(const std::string& source_directory, const std::vector<SplitMapping>& mappings) const;
    WorkingDocument pull_document(const std::string& directory, const std::string& tool_version);
    MappingPlan plan_mapping(const SplitMapping& mapping);
    void flag_source_dependencies();
    void push_document(WorkingDocument& working);
    void require_phase(RunPhase expected, const char* operation) const;

    StateBackend& backend_;
    SplitOptions options_;
    RunPhase phase_ = RunPhase::Idle;

    SplitPlan plan_;
    WorkingDocument source_;
    std::map<std::string, WorkingDocument> destinations_;

    // resource or instance address that left the source -> index into plan_.mappings
    std::map<std::string, size_t> moved_out_;
};

} // namespace Terrasplit
