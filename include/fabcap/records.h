#pragma once
/*
===============================================================================
RECORDS - Input tables of a capacity planning run
===============================================================================

Overview
--------
Four read-only tables are loaded by the caller and handed to the engine:

    EquipmentRecord     one row per physical tool (reference data)
    OperationRecord     one row per tool per day (telemetry history)
    ForecastRecord      one row per quarter per product (demand forecast)
    CapExProjectRecord  one row per candidate investment project

The engine never mutates them. Analyses return newly built row types
(CapacityRow, BottleneckRow, ...) declared next to the analysis that produces
them.

Validation
----------
validateEquipment() / validateOperations() / validateForecast() /
validateProjects() throw DataError on the first invalid row, naming the row
index and tool/project id. CapacityModel and ReliabilityModel call them on
construction so every analysis starts from checked data.

===============================================================================
*/

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

#include "enum_utils.h"
#include "errors.h"

namespace fabcap {

// =============================================================================
// CATEGORIES
// =============================================================================

FABCAP_DECLARE_ENUM_WITH_COUNT(ToolStatus, Active, Maintenance, Upgrade);
FABCAP_DECLARE_ENUM_WITH_COUNT(RiskLevel, Low, Medium, High);

inline constexpr EnumNames<ToolStatus> kToolStatusNames{"Active", "Maintenance", "Upgrade"};
inline constexpr EnumNames<RiskLevel> kRiskLevelNames{"Low", "Medium", "High"};

/// Calendar date of a telemetry row or a forecast quarter start.
using Date = std::chrono::year_month_day;

// =============================================================================
// INPUT TABLES
// =============================================================================

struct EquipmentRecord {
    std::string toolId;
    std::string toolType;            ///< category key, e.g. "Etch_Plasma"
    double throughputWph = 0.0;      ///< wafers per hour
    double utilizationTarget = 0.0;  ///< planned fraction of time in production, [0,1]
    double mtbfHours = 0.0;          ///< theoretical mean time between failures
    ToolStatus status = ToolStatus::Active;
    bool isCritical = false;
};

struct OperationRecord {
    Date date{};
    std::string toolId;
    std::string toolType;
    double utilizationRate = 0.0;
    double availability = 0.0;
    double performanceEfficiency = 0.0;
    double qualityRate = 0.0;
    double oee = 0.0;                     ///< availability * performance * quality
    double outputWafers = 0.0;
    double operatingHours = 0.0;
    double unplannedDowntimeHours = 0.0;
};

struct ForecastRecord {
    Date quarter{};                  ///< first day of the quarter
    std::string product;
    double demandWafers = 0.0;
};

struct CapExProjectRecord {
    std::string projectId;
    std::string projectName;
    double investmentUsd = 0.0;
    double npvUsd = 0.0;
    double irrPercent = 0.0;
    RiskLevel riskLevel = RiskLevel::Low;
    std::string status;              ///< "Planning", "Approved", "In Progress", ...
};

using EquipmentTable = std::vector<EquipmentRecord>;
using OperationsTable = std::vector<OperationRecord>;
using ForecastTable = std::vector<ForecastRecord>;
using CapExTable = std::vector<CapExProjectRecord>;

/**
 * @brief OEE from its three factors
 */
inline double computeOee(double availability, double performance, double quality) noexcept {
    return availability * performance * quality;
}

// =============================================================================
// VALIDATION
// =============================================================================

namespace record_detail {

    inline std::string rowRef(const char* table, std::size_t i, const std::string& id) {
        return std::string(table) + " row " + std::to_string(i) + " (" + id + ")";
    }

    inline void requireFraction(double v, const std::string& row, const char* field) {
        if (!(v >= 0.0 && v <= 1.0)) {
            throw DataError(row + ": " + field + " must be in [0, 1], got " + std::to_string(v));
        }
    }

    inline void requireNonNegative(double v, const std::string& row, const char* field) {
        if (!(v >= 0.0) || !std::isfinite(v)) {
            throw DataError(row + ": " + field + " must be non-negative, got " + std::to_string(v));
        }
    }

} // namespace record_detail

/**
 * @brief Check the equipment table
 * @throws DataError if empty or on the first invalid row
 */
inline void validateEquipment(const EquipmentTable& equipment) {
    using namespace record_detail;
    requireNonEmpty(equipment, "validateEquipment: equipment table");

    for (std::size_t i = 0; i < equipment.size(); ++i) {
        const auto& e = equipment[i];
        const auto row = rowRef("equipment", i, e.toolId);
        if (e.toolId.empty() || e.toolType.empty())
            throw DataError(row + ": tool id and tool type are required");
        if (!is_valid_enum_value(e.status))
            throw DataError(row + ": unknown status");
        requireNonNegative(e.throughputWph, row, "throughput_wph");
        requireFraction(e.utilizationTarget, row, "utilization_target");
        requireNonNegative(e.mtbfHours, row, "mtbf_hours");
    }
}

/**
 * @brief Check the operations table
 * @throws DataError if empty or on the first invalid row
 */
inline void validateOperations(const OperationsTable& operations) {
    using namespace record_detail;
    requireNonEmpty(operations, "validateOperations: operations table");

    for (std::size_t i = 0; i < operations.size(); ++i) {
        const auto& o = operations[i];
        const auto row = rowRef("operations", i, o.toolId);
        if (o.toolType.empty())
            throw DataError(row + ": tool type is required");
        if (!o.date.ok())
            throw DataError(row + ": invalid date");
        requireFraction(o.utilizationRate, row, "utilization_rate");
        requireFraction(o.availability, row, "availability");
        requireFraction(o.performanceEfficiency, row, "performance_efficiency");
        requireFraction(o.qualityRate, row, "quality_rate");
        requireFraction(o.oee, row, "oee");
        requireNonNegative(o.outputWafers, row, "output_wafers");
        requireNonNegative(o.operatingHours, row, "operating_hours");
        requireNonNegative(o.unplannedDowntimeHours, row, "unplanned_downtime_hours");
    }
}

/**
 * @brief Check the demand forecast
 * @throws DataError if empty or on the first invalid row
 */
inline void validateForecast(const ForecastTable& forecast) {
    using namespace record_detail;
    requireNonEmpty(forecast, "validateForecast: forecast table");

    for (std::size_t i = 0; i < forecast.size(); ++i) {
        const auto& f = forecast[i];
        const auto row = rowRef("forecast", i, f.product);
        if (!f.quarter.ok())
            throw DataError(row + ": invalid quarter");
        requireNonNegative(f.demandWafers, row, "demand_wafers");
    }
}

/**
 * @brief Check the CapEx project list
 * @throws DataError if empty or on the first invalid row
 */
inline void validateProjects(const CapExTable& projects) {
    using namespace record_detail;
    requireNonEmpty(projects, "validateProjects: project list");

    for (std::size_t i = 0; i < projects.size(); ++i) {
        const auto& p = projects[i];
        const auto row = rowRef("capex", i, p.projectId);
        if (p.projectId.empty())
            throw DataError(row + ": project id is required");
        if (!is_valid_enum_value(p.riskLevel))
            throw DataError(row + ": unknown risk level");
        requireNonNegative(p.investmentUsd, row, "investment_usd");
        if (!std::isfinite(p.npvUsd))
            throw DataError(row + ": npv_usd must be finite");
    }
}

} // namespace fabcap
