#pragma once
/*
===============================================================================
CONFIG - Immutable configuration tables for the planning analyses
===============================================================================

Overview
--------
All tunable constants of the engine live here as plain value types that the
caller passes into each analysis. Nothing is read from global state, so two
runs with different weighting schemes can coexist in one process and every
analysis is testable in isolation.

    ProcessStepTable      tool type -> process-step count (bottleneck weights)
    BottleneckConfig      visit normalization, bottleneck threshold
    RiskSimulationConfig  Monte Carlo distributions, trial count, seeding
    ScenarioDefinition    named (growth, yield) what-if pairs
    PortfolioConfig       risk weights, risk headroom, rounding, solve deadline
    PlanningCalendar      hours per week, days per week, weeks per quarter

===============================================================================
*/

#include <cstdint>
#include <initializer_list>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "errors.h"
#include "records.h"

namespace fabcap {

// =============================================================================
// CALENDAR
// =============================================================================

/**
 * @brief Time-unit conversions shared by the baseline computations
 */
struct PlanningCalendar {
    double hoursPerWeek = 168.0;     ///< 24/7 operation
    double daysPerWeek = 7.0;        ///< daily output -> weekly output
    double weeksPerQuarter = 13.0;   ///< quarterly demand -> weekly demand
};

// =============================================================================
// PROCESS-STEP TABLE
// =============================================================================

/// What to do with a tool type that has no entry in the process-step table.
enum class UnknownToolPolicy {
    UseDefaultWeight,   ///< use defaultSteps() and flag the row
    Reject              ///< throw DataError
};

/**
 * @class ProcessStepTable
 * @brief Number of process steps each tool type performs on one wafer
 *
 * @details The bottleneck analyzer weights each tool type by its step count.
 *          totalSteps() is always the sum of the declared entries; the default
 *          weight for unknown tool types is deliberately NOT part of that
 *          total, so adding equipment of an unlisted type never changes the
 *          fractions reported for the listed ones.
 *
 * @example
 *     ProcessStepTable t{{"Etch", 60}, {"CMP", 20}};
 *     t.totalSteps();          // 80
 *     t.lookup("Litho");       // {50, defaulted = true}
 */
class ProcessStepTable {
public:
    struct Lookup {
        double steps = 0.0;
        bool defaulted = false;
    };

    static constexpr double kDefaultSteps = 50.0;

    ProcessStepTable(std::initializer_list<std::pair<const std::string, double>> entries,
                     double defaultSteps = kDefaultSteps,
                     UnknownToolPolicy policy = UnknownToolPolicy::UseDefaultWeight)
        : ProcessStepTable(std::map<std::string, double>(entries), defaultSteps, policy)
    {
    }

    explicit ProcessStepTable(std::map<std::string, double> entries,
                              double defaultSteps = kDefaultSteps,
                              UnknownToolPolicy policy = UnknownToolPolicy::UseDefaultWeight)
        : steps_(std::move(entries)), defaultSteps_(defaultSteps), policy_(policy)
    {
        if (steps_.empty())
            throw DataError("ProcessStepTable: no entries");
        if (!(defaultSteps_ > 0.0))
            throw DataError("ProcessStepTable: default step count must be positive");
        for (const auto& [type, n] : steps_) {
            if (!(n > 0.0))
                throw DataError("ProcessStepTable: step count of " + type + " must be positive");
            total_ += n;
        }
    }

    /// @brief Reference 300mm logic flow used by the fab planning team.
    static ProcessStepTable fabDefault() {
        return ProcessStepTable{
            {"Lithography_EUV", 25},
            {"Lithography_DUV", 40},
            {"Etch_Plasma", 65},
            {"Deposition_CVD", 45},
            {"Deposition_PVD", 20},
            {"CMP", 25},
            {"Metrology_SEM", 80},
            {"Metrology_Optical", 40},
            {"Ion_Implant", 15},
            {"Wet_Process", 35},
        };
    }

    /**
     * @brief Step count for a tool type
     * @throws DataError if the type is unknown and the policy is Reject
     */
    Lookup lookup(const std::string& toolType) const {
        auto it = steps_.find(toolType);
        if (it != steps_.end())
            return {it->second, false};
        if (policy_ == UnknownToolPolicy::Reject)
            throw DataError("ProcessStepTable: no process-step entry for tool type " + toolType);
        return {defaultSteps_, true};
    }

    bool contains(const std::string& toolType) const { return steps_.count(toolType) > 0; }

    double totalSteps() const noexcept { return total_; }
    double defaultSteps() const noexcept { return defaultSteps_; }
    UnknownToolPolicy policy() const noexcept { return policy_; }
    const std::map<std::string, double>& entries() const noexcept { return steps_; }

private:
    std::map<std::string, double> steps_;
    double defaultSteps_;
    UnknownToolPolicy policy_;
    double total_ = 0.0;
};

// =============================================================================
// ANALYSIS CONFIGURATION
// =============================================================================

struct BottleneckConfig {
    /// Divides step count when converting target output into weekly visits.
    /// Carried over from the legacy planning workbook; kept configurable until
    /// the process engineering group confirms the value.
    double visitNormalization = 10.0;

    /// Utilization above which a tool type is flagged as a bottleneck.
    double bottleneckThreshold = 0.90;
};

struct RiskSimulationConfig {
    std::size_t trials = 10000;
    int horizonQuarters = 4;            ///< reported only

    double demandVolatility = 0.15;     ///< std dev of the demand multiplier (mean 1)
    double yieldMean = 0.92;
    double yieldStd = 0.05;
    double yieldMin = 0.75;
    double yieldMax = 0.98;
    double availabilityAlpha = 9.0;     ///< Beta(alpha, beta) uptime
    double availabilityBeta = 1.0;
    double cycleTimeSigma = 0.15;       ///< log-normal scale, location 0

    std::uint64_t seed = 42;
    std::size_t workers = 1;            ///< async tasks; 1 = run inline
    std::size_t trialsPerStream = 1000; ///< trials sharing one RNG stream
    bool keepTrials = true;             ///< return the raw per-trial table
};

struct ScenarioDefinition {
    std::string name;
    double growthRate = 0.0;     ///< demand growth over the planning horizon
    double assumedYield = 1.0;   ///< fraction of output that is good wafers
};

/// Conservative / Base Case / Aggressive / Stretch, in reporting order.
inline std::vector<ScenarioDefinition> defaultScenarios() {
    return {
        {"Conservative", 0.05, 0.88},
        {"Base Case", 0.12, 0.91},
        {"Aggressive", 0.22, 0.93},
        {"Stretch", 0.35, 0.95},
    };
}

struct PortfolioConfig {
    /// Multiplier applied to investment per risk level in the risk-budget row.
    EnumArray<RiskLevel, double> riskWeights{1.0, 1.3, 1.6};

    /// Risk-adjusted spend may exceed the budget by this factor.
    double riskBudgetMultiplier = 1.20;

    /// Allocation fraction above which a project counts as selected.
    double selectionThreshold = 0.5;

    /// Allocations within this distance of 0 or 1 count as integral.
    double integralityTolerance = 1e-6;

    /// Solve deadline in seconds (Gurobi TimeLimit).
    double timeLimitSeconds = 30.0;

    int threads = 0;     ///< 0 = solver decides
    bool quiet = true;   ///< suppress solver console output
};

} // namespace fabcap
