#pragma once
/*
===============================================================================
PORTFOLIO OPTIMIZER - Budget-constrained NPV maximization over CapEx projects
===============================================================================

Overview
--------
Chooses how much of each candidate capital project to fund. The relaxation is
a plain LP, solved with Gurobi through ModelBuilder:

    max   sum_i npv_i * x_i
    s.t.  sum_i inv_i * x_i                 <= B              (budget)
          sum_i inv_i * w(risk_i) * x_i     <= 1.20 * B       (risk_budget)
          0 <= x_i <= 1                                       (alloc[<id>])

    w(Low) = 1.0, w(Medium) = 1.3, w(High) = 1.6

A project is reported as selected when x_i > 0.5. Because that rounding is
applied after the solve, the binary portfolio can overspend; the result
carries the binary investment, the overrun and an isApproximate flag so the
caller can see it.

Components
----------
• PortfolioBuilder      ModelBuilder<PortfolioVars, PortfolioCons> for the LP
• optimizePortfolio()   validate, solve, summarize, never throw on solver trouble

Failure Handling
----------------
Any status other than GRB_OPTIMAL, and any GRBException raised while the
environment is started or the model is built and solved (missing license,
deadline, infeasible budget), is folded into

    OptimizationResult{status = Failed, message = "<reason>"}

with no allocation table. Input problems (empty list, negative investment)
are still DataError.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "config.h"
#include "enum_utils.h"
#include "errors.h"
#include "expressions.h"
#include "logging.h"
#include "model_builder.h"
#include "records.h"
#include "solver_diagnostics.h"

namespace fabcap {

FABCAP_DECLARE_ENUM_WITH_COUNT(PortfolioVars, Allocation);
FABCAP_DECLARE_ENUM_WITH_COUNT(PortfolioCons, Budget, RiskBudget);
FABCAP_DECLARE_ENUM_WITH_COUNT(OptimizationStatus, Optimal, Failed);

inline constexpr EnumNames<OptimizationStatus> kOptimizationStatusNames{"Optimal", "Failed"};

// =============================================================================
// RESULT TYPES
// =============================================================================

struct ProjectAllocation {
    CapExProjectRecord project;
    double allocationFraction = 0.0;   ///< x_i in [0, 1]
    double allocatedInvestmentUsd = 0.0;
    double allocatedNpvUsd = 0.0;
    bool selected = false;             ///< x_i > selection threshold
};

struct OptimizationResult {
    OptimizationStatus status = OptimizationStatus::Failed;
    std::string message;

    double totalNpvUsd = 0.0;               ///< LP objective
    double totalInvestmentUsd = 0.0;        ///< sum of allocated investment
    double budgetUtilizationPct = 0.0;

    std::size_t selectedCount = 0;
    std::vector<std::string> selectedProjects;   ///< project names, list order
    std::optional<double> avgIrrPercent;    ///< absent when nothing is selected

    bool isApproximate = false;             ///< some x_i strictly fractional
    double binaryInvestmentUsd = 0.0;       ///< spend of the x_i > 0.5 selection
    double binaryBudgetOverrunUsd = 0.0;

    double solverRuntimeSeconds = 0.0;

    bool ok() const noexcept { return status == OptimizationStatus::Optimal; }
};

struct PortfolioOutcome {
    OptimizationResult summary;
    std::optional<std::vector<ProjectAllocation>> allocations;
};

// =============================================================================
// LP BUILDER
// =============================================================================

/**
 * @class PortfolioBuilder
 * @brief The allocation LP for one project list and budget
 *
 * Run annotations in store():
 *   "n_projects", "budget_usd"          set on construction
 *   "solver_status", "runtime_s"        set after the solve
 *   "max_constr_vio", "max_bound_vio"   set after an optimal solve
 *   "param:*"                           solver parameters applied
 *
 * The project list is held by reference and must outlive the builder.
 */
class PortfolioBuilder : public ModelBuilder<PortfolioVars, PortfolioCons> {
public:
    PortfolioBuilder(const CapExTable& projects, double budgetUsd, const PortfolioConfig& config)
        : projects_(projects), budget_(budgetUsd), config_(config)
    {
        store_["n_projects"] = projects_.size();
        store_["budget_usd"] = budget_;
    }

    PortfolioBuilder(CapExTable&&, double, const PortfolioConfig&) = delete;

    /// Incumbent violations; zero unless the solve was optimal.
    const SolutionQuality& quality() const noexcept { return quality_; }

    /// Allocation fractions in project order; empty unless the solve was optimal.
    const std::vector<double>& fractions() const noexcept { return fractions_; }

protected:
    void configureEnvironment(GRBEnv& env) override {
        if (config_.quiet)
            env.set(GRB_IntParam_OutputFlag, 0);
    }

    void addVariables() override {
        std::vector<std::string> names;
        names.reserve(projects_.size());
        for (const auto& p : projects_)
            names.push_back("alloc[" + p.projectId + "]");
        addContinuousVars(PortfolioVars::Allocation, names, 0.0, 1.0);
    }

    void addConstraints() override {
        const auto& x = vars(PortfolioVars::Allocation);

        std::vector<double> investment;
        std::vector<double> riskAdjusted;
        investment.reserve(projects_.size());
        riskAdjusted.reserve(projects_.size());
        for (const auto& p : projects_) {
            investment.push_back(p.investmentUsd);
            riskAdjusted.push_back(p.investmentUsd * config_.riskWeights[p.riskLevel]);
        }

        addConstraint(PortfolioCons::Budget, dot(investment, x) <= budget_, "budget");
        addConstraint(PortfolioCons::RiskBudget,
                      dot(riskAdjusted, x) <= budget_ * config_.riskBudgetMultiplier,
                      "risk_budget");
    }

    void addParameters() override {
        timeLimit(config_.timeLimitSeconds);
        threads(config_.threads);
        if (config_.quiet)
            quiet();
    }

    void addObjective() override {
        const auto& x = vars(PortfolioVars::Allocation);
        maximize(sum(projects_.size(), [&](std::size_t i) {
            return projects_[i].npvUsd * x[i];
        }));
    }

    void beforeOptimize() override {
        model().update();
        logDebug("optimizePortfolio: " + modelSummary(model()) + ", budget " +
                 std::to_string(budget_));
    }

    void afterOptimize() override {
        store_["solver_status"] = statusString(status());
        store_["runtime_s"] = runtime();

        if (!isOptimal())
            return;

        const auto& x = vars(PortfolioVars::Allocation);
        fractions_.reserve(x.size());
        for (const auto& v : x)
            fractions_.push_back(v.get(GRB_DoubleAttr_X));

        quality_ = computeSolutionQuality(model());
        store_["max_constr_vio"] = quality_.maxConstrViolation;
        store_["max_bound_vio"] = quality_.maxBoundViolation;
    }

private:
    const CapExTable& projects_;
    double budget_;
    PortfolioConfig config_;
    std::vector<double> fractions_;
    SolutionQuality quality_;
};

// =============================================================================
// ENTRY POINT
// =============================================================================

namespace portfolio_detail {

    inline PortfolioOutcome failed(std::string message, double runtime = 0.0) {
        logWarn("optimizePortfolio: " + message);
        PortfolioOutcome out;
        out.summary.status = OptimizationStatus::Failed;
        out.summary.message = std::move(message);
        out.summary.solverRuntimeSeconds = runtime;
        return out;
    }

    // Strictly between 0 and 1 beyond tol.
    inline bool isFractional(double x, double tol) noexcept {
        return x > tol && x < 1.0 - tol;
    }

} // namespace portfolio_detail

/**
 * @brief Fund the NPV-maximizing share of each project within budget
 *
 * @param projects  Candidate projects (validated here)
 * @param budgetUsd Total capital available
 * @param config    Risk weights, selection threshold, solver parameters
 *
 * @return Summary plus per-project allocations; allocations is empty and
 *         summary.status == Failed when the solver does not reach an optimum
 *
 * @throws DataError on an empty list or an invalid project row
 * @throws std::invalid_argument if budgetUsd is not finite
 */
inline PortfolioOutcome optimizePortfolio(const CapExTable& projects, double budgetUsd,
                                          const PortfolioConfig& config = {}) {
    validateProjects(projects);
    if (!std::isfinite(budgetUsd))
        throw std::invalid_argument("optimizePortfolio: budget must be a finite number");

    logDebug("optimizePortfolio: " + std::to_string(projects.size()) + " projects, budget " +
             std::to_string(budgetUsd) + ", time limit " + std::to_string(config.timeLimitSeconds) + "s");

    PortfolioBuilder builder(projects, budgetUsd, config);
    double objective = 0.0;
    double runtime = 0.0;

    try {
        builder.optimize();
        runtime = builder.runtime();
        if (!builder.isOptimal())
            return portfolio_detail::failed(failureMessage(builder.status()), runtime);
        objective = builder.objVal();
    }
    catch (const GRBException& e) {
        return portfolio_detail::failed("solver error " + std::to_string(e.getErrorCode()) + ": " +
                                        e.getMessage(), runtime);
    }

    const auto& x = builder.fractions();

    const auto& quality = builder.quality();
    if (!quality.clean()) {
        logWarn("optimizePortfolio: optimal solution violates constraints by " +
                std::to_string(quality.maxConstrViolation) + " and bounds by " +
                std::to_string(quality.maxBoundViolation));
    }

    PortfolioOutcome out;
    auto& summary = out.summary;
    summary.status = OptimizationStatus::Optimal;
    summary.message = statusString(GRB_OPTIMAL);
    summary.totalNpvUsd = objective;
    summary.solverRuntimeSeconds = runtime;

    std::vector<ProjectAllocation> rows;
    rows.reserve(projects.size());
    double irrSum = 0.0;

    for (std::size_t i = 0; i < projects.size(); ++i) {
        // Clamp solver noise at the bounds.
        const double xi = std::clamp(x[i], 0.0, 1.0);

        ProjectAllocation a;
        a.project = projects[i];
        a.allocationFraction = xi;
        a.allocatedInvestmentUsd = projects[i].investmentUsd * xi;
        a.allocatedNpvUsd = projects[i].npvUsd * xi;
        a.selected = xi > config.selectionThreshold;

        summary.totalInvestmentUsd += a.allocatedInvestmentUsd;
        if (portfolio_detail::isFractional(xi, config.integralityTolerance))
            summary.isApproximate = true;
        if (a.selected) {
            summary.selectedProjects.push_back(projects[i].projectName);
            summary.binaryInvestmentUsd += projects[i].investmentUsd;
            irrSum += projects[i].irrPercent;
        }
        rows.push_back(std::move(a));
    }

    summary.selectedCount = summary.selectedProjects.size();
    if (summary.selectedCount > 0)
        summary.avgIrrPercent = irrSum / static_cast<double>(summary.selectedCount);
    summary.budgetUtilizationPct =
        budgetUsd > 0.0 ? summary.totalInvestmentUsd / budgetUsd * 100.0 : 0.0;
    summary.binaryBudgetOverrunUsd = std::max(0.0, summary.binaryInvestmentUsd - budgetUsd);

    if (summary.isApproximate) {
        logWarn("optimizePortfolio: fractional allocation, binary selection of " +
                std::to_string(summary.selectedCount) + " projects spends " +
                std::to_string(summary.binaryInvestmentUsd) + " (overrun " +
                std::to_string(summary.binaryBudgetOverrunUsd) + ")");
    }
    logInfo("optimizePortfolio: NPV " + std::to_string(summary.totalNpvUsd) + ", " +
            std::to_string(summary.selectedCount) + "/" + std::to_string(projects.size()) +
            " projects selected, budget utilization " +
            std::to_string(summary.budgetUtilizationPct) + "%");

    out.allocations = std::move(rows);
    return out;
}

} // namespace fabcap
