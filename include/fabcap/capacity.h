#pragma once
/*
===============================================================================
CAPACITY - Theoretical and effective capacity baselines
===============================================================================

Overview
--------
The capacity baseline is the figure every other analysis builds on:

    computeCapacity()          per tool type: installed throughput, mean
                               utilization target, effective weekly capacity
    currentWeeklyCapacity()    latest day's total output * 7
    currentWeeklyDemand()      latest quarter's total demand / 13

Effective weekly capacity
-------------------------
    effective_wpw = sum(throughput_wph) * hours_per_week * mean(utilization_target)

All equipment rows of a tool type take part in both aggregates. The baseline
is recomputed on every call; callers that need it repeatedly keep the
returned vector.

Edge Cases
----------
* Empty equipment produces an empty result (no exception). Consumers that
  divide by effective capacity raise NumericError themselves.
* Empty operations / forecast raise DataError: there is no "latest" row.

===============================================================================
*/

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "config.h"
#include "errors.h"
#include "records.h"

namespace fabcap {

struct CapacityRow {
    std::string toolType;
    std::size_t toolCount = 0;
    double totalThroughputWph = 0.0;
    double meanUtilizationTarget = 0.0;
    double effectiveWeeklyCapacity = 0.0;
};

/**
 * @brief Aggregate installed capacity per tool type
 *
 * @param equipment Equipment table (may be empty)
 * @param calendar  Supplies hoursPerWeek (168 by default)
 * @return One row per tool type, ordered by tool type name
 *
 * @complexity O(n log k) for n tools and k tool types
 */
inline std::vector<CapacityRow> computeCapacity(const EquipmentTable& equipment,
                                                const PlanningCalendar& calendar = {}) {
    struct Acc {
        std::size_t count = 0;
        double throughput = 0.0;
        double utilizationSum = 0.0;
    };
    std::map<std::string, Acc> byType;

    for (const auto& e : equipment) {
        auto& a = byType[e.toolType];
        a.count++;
        a.throughput += e.throughputWph;
        a.utilizationSum += e.utilizationTarget;
    }

    std::vector<CapacityRow> rows;
    rows.reserve(byType.size());
    for (const auto& [type, a] : byType) {
        CapacityRow r;
        r.toolType = type;
        r.toolCount = a.count;
        r.totalThroughputWph = a.throughput;
        r.meanUtilizationTarget = a.utilizationSum / static_cast<double>(a.count);
        r.effectiveWeeklyCapacity = r.totalThroughputWph * calendar.hoursPerWeek * r.meanUtilizationTarget;
        rows.push_back(std::move(r));
    }
    return rows;
}

/**
 * @brief Sum of effective weekly capacity over all tool types
 */
inline double totalEffectiveCapacity(const std::vector<CapacityRow>& rows) noexcept {
    double total = 0.0;
    for (const auto& r : rows)
        total += r.effectiveWeeklyCapacity;
    return total;
}

/**
 * @brief Most recent date present in the operations history
 * @throws DataError if operations is empty
 */
inline Date latestOperationsDate(const OperationsTable& operations) {
    requireNonEmpty(operations, "latestOperationsDate: operations table");
    auto it = std::max_element(operations.begin(), operations.end(),
        [](const OperationRecord& a, const OperationRecord& b) { return a.date < b.date; });
    return it->date;
}

/**
 * @brief Demonstrated weekly output: latest day's total output * days per week
 * @throws DataError if operations is empty
 */
inline double currentWeeklyCapacity(const OperationsTable& operations,
                                    const PlanningCalendar& calendar = {}) {
    const Date latest = latestOperationsDate(operations);
    double daily = 0.0;
    for (const auto& o : operations) {
        if (o.date == latest)
            daily += o.outputWafers;
    }
    return daily * calendar.daysPerWeek;
}

/**
 * @brief Weekly demand: latest quarter's demand over all products / weeks per quarter
 * @throws DataError if forecast is empty
 */
inline double currentWeeklyDemand(const ForecastTable& forecast,
                                  const PlanningCalendar& calendar = {}) {
    requireNonEmpty(forecast, "currentWeeklyDemand: forecast table");
    auto latest = std::max_element(forecast.begin(), forecast.end(),
        [](const ForecastRecord& a, const ForecastRecord& b) { return a.quarter < b.quarter; })->quarter;

    double quarterly = 0.0;
    for (const auto& f : forecast) {
        if (f.quarter == latest)
            quarterly += f.demandWafers;
    }
    return checkedDivide(quarterly, calendar.weeksPerQuarter, "currentWeeklyDemand: weeks per quarter");
}

} // namespace fabcap
