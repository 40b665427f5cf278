#pragma once
/*
===============================================================================
BOTTLENECK - Theory-of-Constraints ranking of tool types
===============================================================================

Overview
--------
Given the capacity baseline and a target weekly output, each tool type is
loaded with the visits it must serve for the fab to hit the target:

    visits_wpw      = target_wpw * steps / visit_normalization
    raw_utilization = visits_wpw / effective_wpw
    utilization     = min(raw_utilization, 1)

A tool type whose raw utilization exceeds the threshold (0.90) is a
bottleneck. Rows are ranked by utilization, highest first: the top row is the
binding constraint, the resource that caps the whole fab.

Reported Fields
---------------
    process_fraction      steps / table total
    constraint_severity   raw_utilization if bottleneck, else 0
    capacity_gap_wpw      max(0, visits - effective capacity)
    max_supportable_wpw   effective capacity / (steps / visit_normalization)

The unclamped raw ratio is kept on the row; the gap and the severity are
computed from it, not from the reported (clamped) utilization.

Ordering
--------
Descending utilization; when several types saturate at 1.0 the one with the
larger raw ratio comes first, then tool type name. This keeps the ranking
total and stable for every target.

Unknown Tool Types
------------------
Resolved through ProcessStepTable::lookup(): either the table's default
weight (row flagged usedDefaultSteps, logged at Warn) or DataError.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "capacity.h"
#include "config.h"
#include "errors.h"
#include "logging.h"

namespace fabcap {

struct BottleneckRow {
    std::string toolType;
    std::size_t toolCount = 0;
    double totalThroughputWph = 0.0;
    double processSteps = 0.0;
    bool usedDefaultSteps = false;
    double processFraction = 0.0;
    double effectiveCapacityWpw = 0.0;
    double requiredVisitsWpw = 0.0;
    double utilizationAtTarget = 0.0;     ///< clamped to [0, 1]
    double rawUtilization = 0.0;          ///< unclamped
    double maxSupportableOutputWpw = 0.0;
    bool isBottleneck = false;
    double constraintSeverity = 0.0;
    double capacityGapWpw = 0.0;
};

/**
 * @brief Rank tool types by how tightly they constrain a target output
 *
 * @param capacity        Baseline from computeCapacity()
 * @param steps           Process-step weights
 * @param targetOutputWpw Target fab output in wafers per week (>= 0)
 * @param config          Normalization and threshold
 * @return Rows sorted with the binding constraint first
 *
 * @throws std::invalid_argument if targetOutputWpw is negative or not finite
 * @throws DataError if capacity is empty, or a type is rejected by the table
 * @throws NumericError if a tool type has zero effective capacity
 */
inline std::vector<BottleneckRow> analyzeBottlenecks(const std::vector<CapacityRow>& capacity,
                                                     const ProcessStepTable& steps,
                                                     double targetOutputWpw,
                                                     const BottleneckConfig& config = {}) {
    if (!(targetOutputWpw >= 0.0) || !std::isfinite(targetOutputWpw))
        throw std::invalid_argument("analyzeBottlenecks: target output must be a non-negative number");
    if (!(config.visitNormalization > 0.0))
        throw std::invalid_argument("analyzeBottlenecks: visit normalization must be positive");
    requireNonEmpty(capacity, "analyzeBottlenecks: capacity baseline");

    std::vector<BottleneckRow> rows;
    rows.reserve(capacity.size());

    for (const auto& c : capacity) {
        const auto lookup = steps.lookup(c.toolType);
        if (lookup.defaulted) {
            logWarn("analyzeBottlenecks: no process-step entry for " + c.toolType +
                    ", using default weight " + std::to_string(lookup.steps));
        }

        BottleneckRow r;
        r.toolType = c.toolType;
        r.toolCount = c.toolCount;
        r.totalThroughputWph = c.totalThroughputWph;
        r.processSteps = lookup.steps;
        r.usedDefaultSteps = lookup.defaulted;
        r.processFraction = lookup.steps / steps.totalSteps();
        r.effectiveCapacityWpw = c.effectiveWeeklyCapacity;

        const double visitsPerWafer = lookup.steps / config.visitNormalization;
        r.requiredVisitsWpw = targetOutputWpw * visitsPerWafer;
        r.rawUtilization = checkedDivide(r.requiredVisitsWpw, c.effectiveWeeklyCapacity,
                                         "analyzeBottlenecks: effective capacity of " + c.toolType);
        r.utilizationAtTarget = std::min(r.rawUtilization, 1.0);
        r.maxSupportableOutputWpw = c.effectiveWeeklyCapacity / visitsPerWafer;

        r.isBottleneck = r.rawUtilization > config.bottleneckThreshold;
        r.constraintSeverity = r.isBottleneck ? r.rawUtilization : 0.0;
        r.capacityGapWpw = std::max(0.0, r.requiredVisitsWpw - c.effectiveWeeklyCapacity);

        rows.push_back(std::move(r));
    }

    std::sort(rows.begin(), rows.end(), [](const BottleneckRow& a, const BottleneckRow& b) {
        if (a.utilizationAtTarget != b.utilizationAtTarget)
            return a.utilizationAtTarget > b.utilizationAtTarget;
        if (a.rawUtilization != b.rawUtilization)
            return a.rawUtilization > b.rawUtilization;
        return a.toolType < b.toolType;
    });

    const auto flagged = std::count_if(rows.begin(), rows.end(),
        [](const BottleneckRow& r) { return r.isBottleneck; });
    logDebug("analyzeBottlenecks: target " + std::to_string(targetOutputWpw) + " wpw, " +
             std::to_string(flagged) + " of " + std::to_string(rows.size()) +
             " tool types above threshold, binding constraint " + rows.front().toolType);

    return rows;
}

/**
 * @brief The binding constraint (first row), or nullptr for an empty ranking
 */
inline const BottleneckRow* bindingConstraint(const std::vector<BottleneckRow>& ranking) noexcept {
    return ranking.empty() ? nullptr : &ranking.front();
}

} // namespace fabcap
