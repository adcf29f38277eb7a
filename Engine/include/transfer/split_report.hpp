/**
 * @file split_report.hpp
 * @brief Structured and human-readable reports of a split run
 */

#pragma once

#include <transfer/split_orchestrator.hpp>
#include <state/state_document.hpp>

namespace Terrasplit {

class SplitReport {
public:
    /**
     * @brief Per mapping: selected addresses, rewritten addresses, conflicts, dangling references.
     */
    static Json plan_to_json(const SplitPlan& plan, bool dry_run);

    /**
     * @brief Which directories were written, which failed, which were never attempted.
     */
    static Json outcome_to_json(const ApplyOutcome& outcome, const SplitPlan& plan);

    static void log_plan(const SplitPlan& plan, bool dry_run);
    static void log_outcome(const ApplyOutcome& outcome, const SplitPlan& plan);
};

} // namespace Terrasplit
