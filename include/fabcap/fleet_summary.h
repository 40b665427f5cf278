#pragma once
/*
===============================================================================
FLEET SUMMARY - Headline figures for a planning run
===============================================================================

    summarizeFleet(equipment, operations)
        tool counts by status, critical tools,
        latest-day mean OEE, mean utilization, total output

    summarizeCapEx(projects)
        total investment, total NPV, mean IRR, projects "In Progress"

Both are plain aggregations over the input tables and feed the executive
summary printed by planning runs.

===============================================================================
*/

#include <string>

#include "capacity.h"
#include "enum_utils.h"
#include "errors.h"
#include "records.h"

namespace fabcap {

struct FleetSummary {
    std::size_t totalTools = 0;
    EnumArray<ToolStatus, std::size_t> toolsByStatus{};
    std::size_t criticalTools = 0;

    Date latestDate{};
    double meanOee = 0.0;              ///< over the latest day's rows
    double meanUtilization = 0.0;
    double dailyOutputWafers = 0.0;

    std::size_t activeTools() const noexcept { return toolsByStatus[ToolStatus::Active]; }
};

struct CapExSummary {
    std::size_t projectCount = 0;
    double totalInvestmentUsd = 0.0;
    double totalNpvUsd = 0.0;
    double meanIrrPercent = 0.0;
    std::size_t inProgressCount = 0;
};

/// Status string counted by CapExSummary::inProgressCount.
inline constexpr const char* kInProgressStatus = "In Progress";

/**
 * @brief Fleet status and latest-day operating performance
 * @throws DataError if either table is empty
 */
inline FleetSummary summarizeFleet(const EquipmentTable& equipment, const OperationsTable& operations) {
    requireNonEmpty(equipment, "summarizeFleet: equipment table");

    FleetSummary s;
    s.totalTools = equipment.size();
    for (const auto& e : equipment) {
        ++s.toolsByStatus[e.status];
        if (e.isCritical)
            ++s.criticalTools;
    }

    s.latestDate = latestOperationsDate(operations);
    std::size_t rows = 0;
    for (const auto& o : operations) {
        if (o.date != s.latestDate)
            continue;
        s.meanOee += o.oee;
        s.meanUtilization += o.utilizationRate;
        s.dailyOutputWafers += o.outputWafers;
        ++rows;
    }
    s.meanOee /= static_cast<double>(rows);
    s.meanUtilization /= static_cast<double>(rows);
    return s;
}

/**
 * @brief Totals over the whole CapEx list (not just selected projects)
 * @throws DataError if projects is empty
 */
inline CapExSummary summarizeCapEx(const CapExTable& projects) {
    requireNonEmpty(projects, "summarizeCapEx: project list");

    CapExSummary s;
    s.projectCount = projects.size();
    double irr = 0.0;
    for (const auto& p : projects) {
        s.totalInvestmentUsd += p.investmentUsd;
        s.totalNpvUsd += p.npvUsd;
        irr += p.irrPercent;
        if (p.status == kInProgressStatus)
            ++s.inProgressCount;
    }
    s.meanIrrPercent = irr / static_cast<double>(s.projectCount);
    return s;
}

} // namespace fabcap
