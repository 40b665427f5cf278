#pragma once
/*
===============================================================================
SOLVER DIAGNOSTICS - Status strings and post-solve checks for engine LPs
===============================================================================

Overview
--------
Free functions over a solved GRBModel, used to turn solver state into the
text of OptimizationResult::message and into log lines:

    * statusString()          GRB_* status code -> "OPTIMAL", "INFEASIBLE", ...
    * failureMessage()        sentence explaining a non-optimal status
    * computeStatistics()     variable / constraint / non-zero counts
    * computeSolutionQuality() constraint and bound violations of the incumbent
    * modelSummary()          "12 vars, 2 constrs, 24 nz"

Non-templated so they work for any builder.

===============================================================================
*/

#include <string>

#include "gurobi_c++.h"

namespace fabcap {

// =============================================================================
// STATUS
// =============================================================================

/**
 * @brief Gurobi status code as its symbolic name
 */
inline std::string statusString(int status) {
    switch (status) {
        case GRB_LOADED:          return "LOADED";
        case GRB_OPTIMAL:         return "OPTIMAL";
        case GRB_INFEASIBLE:      return "INFEASIBLE";
        case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
        case GRB_UNBOUNDED:       return "UNBOUNDED";
        case GRB_CUTOFF:          return "CUTOFF";
        case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
        case GRB_NODE_LIMIT:      return "NODE_LIMIT";
        case GRB_TIME_LIMIT:      return "TIME_LIMIT";
        case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
        case GRB_INTERRUPTED:     return "INTERRUPTED";
        case GRB_NUMERIC:         return "NUMERIC";
        case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
        case GRB_INPROGRESS:      return "INPROGRESS";
        case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
        default:                  return "UNKNOWN(" + std::to_string(status) + ")";
    }
}

/**
 * @brief Human-readable reason for a status that did not produce an optimum
 *
 * @example
 *     failureMessage(GRB_INFEASIBLE)
 *     // "INFEASIBLE: no allocation satisfies the budget constraints"
 */
inline std::string failureMessage(int status) {
    switch (status) {
        case GRB_INFEASIBLE:
        case GRB_INF_OR_UNBD:
            return statusString(status) + ": no allocation satisfies the budget constraints";
        case GRB_UNBOUNDED:
            return statusString(status) + ": objective is unbounded";
        case GRB_TIME_LIMIT:
            return statusString(status) + ": solve deadline reached before optimality was proven";
        case GRB_ITERATION_LIMIT:
            return statusString(status) + ": iteration limit reached";
        case GRB_NUMERIC:
            return statusString(status) + ": solver stopped on numerical difficulties";
        case GRB_INTERRUPTED:
            return statusString(status) + ": solve interrupted";
        default:
            return statusString(status) + ": solver did not report an optimal solution";
    }
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

struct ModelStatistics {
    int numVars = 0;
    int numConstrs = 0;
    int numNonZeros = 0;
    int numIntegerVars = 0;   ///< includes binaries; 0 for the engine's LPs
};

inline ModelStatistics computeStatistics(const GRBModel& model) {
    ModelStatistics stats;
    stats.numVars = model.get(GRB_IntAttr_NumVars);
    stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
    stats.numNonZeros = model.get(GRB_IntAttr_NumNZs);
    stats.numIntegerVars = model.get(GRB_IntAttr_NumIntVars);
    return stats;
}

/**
 * @brief "12 vars, 2 constrs, 24 nz"
 */
inline std::string modelSummary(const GRBModel& model) {
    auto s = computeStatistics(model);
    return std::to_string(s.numVars) + " vars, " + std::to_string(s.numConstrs) +
           " constrs, " + std::to_string(s.numNonZeros) + " nz";
}

// =============================================================================
// SOLUTION QUALITY
// =============================================================================

/**
 * @brief Violations of the incumbent solution
 *
 * @details Gurobi reports violations within its feasibility tolerance as
 *          non-zero. optimizePortfolio() warns above kViolationWarnThreshold.
 */
struct SolutionQuality {
    double maxConstrViolation = 0.0;
    double maxBoundViolation = 0.0;

    static constexpr double kViolationWarnThreshold = 1e-6;

    bool clean() const noexcept {
        return maxConstrViolation <= kViolationWarnThreshold &&
               maxBoundViolation <= kViolationWarnThreshold;
    }
};

/// @pre the model has a solution (SolCount > 0)
inline SolutionQuality computeSolutionQuality(const GRBModel& model) {
    SolutionQuality q;
    q.maxConstrViolation = model.get(GRB_DoubleAttr_ConstrVio);
    q.maxBoundViolation = model.get(GRB_DoubleAttr_BoundVio);
    return q;
}

} // namespace fabcap
