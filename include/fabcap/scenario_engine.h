#pragma once
/*
===============================================================================
SCENARIO ENGINE - Deterministic growth / yield what-if projection
===============================================================================

For each named scenario:

    projected_demand   = demand_wpw * (1 + growth)
    effective_capacity = capacity_wpw * yield
    gap                = projected_demand - effective_capacity
    utilization        = min(projected_demand / effective_capacity, 1)
    sufficient         = gap <= 0
    additional_pct     = max(0, gap / effective_capacity * 100)

No randomness; rows come back in the order of the scenario table.

Example (capacity 100000, demand 90000, Base Case 0.12 / 0.91):
    100800 demand, 91000 capacity, gap 9800, utilization 1.0,
    not sufficient, ~10.77% additional capacity needed

===============================================================================
*/

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.h"
#include "errors.h"
#include "logging.h"

namespace fabcap {

struct ScenarioRow {
    std::string scenario;
    double growthRate = 0.0;
    double assumedYield = 0.0;
    double projectedDemandWpw = 0.0;
    double effectiveCapacityWpw = 0.0;
    double capacityGapWpw = 0.0;          ///< positive = shortfall
    double utilization = 0.0;             ///< clamped to <= 1
    bool capacitySufficient = false;
    double additionalCapacityNeededPct = 0.0;
};

/**
 * @brief Project demand and capacity under each scenario
 *
 * @param capacityWpw Current weekly capacity (currentWeeklyCapacity())
 * @param demandWpw   Current weekly demand (currentWeeklyDemand())
 * @param scenarios   Growth / yield table, defaultScenarios() if omitted
 *
 * @throws std::invalid_argument for negative capacity or demand
 * @throws NumericError if a scenario's effective capacity is zero
 */
inline std::vector<ScenarioRow> computeScenarios(double capacityWpw, double demandWpw,
                                                 const std::vector<ScenarioDefinition>& scenarios =
                                                     defaultScenarios()) {
    if (!(capacityWpw >= 0.0) || !(demandWpw >= 0.0))
        throw std::invalid_argument("computeScenarios: capacity and demand must be non-negative");

    std::vector<ScenarioRow> rows;
    rows.reserve(scenarios.size());

    for (const auto& s : scenarios) {
        ScenarioRow r;
        r.scenario = s.name;
        r.growthRate = s.growthRate;
        r.assumedYield = s.assumedYield;
        r.projectedDemandWpw = demandWpw * (1.0 + s.growthRate);
        r.effectiveCapacityWpw = capacityWpw * s.assumedYield;
        r.capacityGapWpw = r.projectedDemandWpw - r.effectiveCapacityWpw;

        const std::string what = "computeScenarios: effective capacity of scenario " + s.name;
        r.utilization = std::min(checkedDivide(r.projectedDemandWpw, r.effectiveCapacityWpw, what), 1.0);
        r.capacitySufficient = r.capacityGapWpw <= 0.0;
        r.additionalCapacityNeededPct =
            std::max(0.0, r.capacityGapWpw / r.effectiveCapacityWpw * 100.0);

        rows.push_back(std::move(r));
    }

    logDebug("computeScenarios: " + std::to_string(rows.size()) + " scenarios at capacity " +
             std::to_string(capacityWpw) + " wpw, demand " + std::to_string(demandWpw) + " wpw");
    return rows;
}

} // namespace fabcap
