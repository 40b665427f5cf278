/*
================================================================================
EXAMPLE 03: CAPEX PORTFOLIO - Budget-constrained NPV maximization
================================================================================
DIFFICULTY: Intermediate
PROBLEM TYPE: Linear Programming (LP) relaxation + binary rounding

PROBLEM DESCRIPTION
-------------------
Six capital projects compete for a fixed budget. Risky projects consume extra
"risk budget": the risk-adjusted spend may exceed the budget by at most 20%.
The LP picks the share of each project to fund; projects funded above 50% are
reported as selected.

MATHEMATICAL MODEL
------------------
Variables:
    x[i] in [0, 1]      Share of project i funded

Objective:
    max  sum_i npv[i] * x[i]

Constraints:
    budget:       sum_i inv[i] * x[i]          <= B
    risk_budget:  sum_i inv[i] * w[i] * x[i]   <= 1.2 * B
                  w = 1.0 (Low), 1.3 (Medium), 1.6 (High)

FEATURES DEMONSTRATED
---------------------
- optimizePortfolio()            Validate, solve, summarize
- PortfolioBuilder               Direct access to the Gurobi model
- PortfolioConfig                Risk weights, selection threshold, deadline
- isApproximate / overrun        Binary rounding report
- statusString(), modelSummary() Diagnostics
- PortfolioBuilder::quality()    Constraint / bound violation
- summarizeCapEx()               Portfolio totals

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <string>

#include <fabcap/fabcap.h>

namespace {

    void printOutcome(const fabcap::PortfolioOutcome& out) {
        const auto& s = out.summary;
        std::cout << "Status: " << fabcap::kOptimizationStatusNames.toString(s.status);
        if (!s.ok()) {
            std::cout << " (" << s.message << ")\n";
            return;
        }
        std::cout << "\n";

        std::cout << std::left << std::setw(8) << "Project" << std::setw(28) << "Name" << std::right
                  << std::setw(8) << "Risk" << std::setw(8) << "Share"
                  << std::setw(12) << "Invest $M" << std::setw(10) << "NPV $M" << "  Selected\n";
        std::cout << std::string(82, '-') << "\n";
        for (const auto& a : *out.allocations) {
            std::cout << std::left << std::setw(8) << a.project.projectId
                      << std::setw(28) << a.project.projectName << std::right
                      << std::setw(8) << fabcap::kRiskLevelNames.toString(a.project.riskLevel)
                      << std::setw(8) << std::setprecision(3) << a.allocationFraction
                      << std::setw(12) << std::setprecision(1) << a.allocatedInvestmentUsd / 1e6
                      << std::setw(10) << a.allocatedNpvUsd / 1e6
                      << (a.selected ? "  yes" : "") << "\n";
        }

        std::cout << std::setprecision(1);
        std::cout << "\nTotal NPV:           $" << s.totalNpvUsd / 1e6 << "M\n";
        std::cout << "Allocated:           $" << s.totalInvestmentUsd / 1e6 << "M ("
                  << s.budgetUtilizationPct << "% of budget)\n";
        std::cout << "Selected:            " << s.selectedCount << " projects";
        if (s.avgIrrPercent)
            std::cout << ", mean IRR " << *s.avgIrrPercent << "%";
        std::cout << "\n";
        if (s.isApproximate) {
            std::cout << "Binary selection:    $" << s.binaryInvestmentUsd / 1e6 << "M, overrun $"
                      << s.binaryBudgetOverrunUsd / 1e6 << "M (fractional LP optimum)\n";
        }
    }

} // namespace

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 03: CapEx Portfolio\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        using fabcap::RiskLevel;
        const fabcap::CapExTable projects = {
            {"CX-01", "EUV scanner expansion", 650e6, 310e6, 19.5, RiskLevel::Medium, "Approved"},
            {"CX-02", "Etch chamber retrofit", 180e6, 95e6, 22.0, RiskLevel::Low, "In Progress"},
            {"CX-03", "Advanced packaging line", 420e6, 260e6, 24.5, RiskLevel::High, "Planning"},
            {"CX-04", "CMP slurry recovery", 90e6, 30e6, 14.0, RiskLevel::Low, "In Progress"},
            {"CX-05", "HBM test capacity", 310e6, 140e6, 17.0, RiskLevel::Medium, "Planning"},
            {"CX-06", "Fab automation upgrade", 240e6, 70e6, 11.5, RiskLevel::Low, "Approved"},
        };

        const auto totals = fabcap::summarizeCapEx(projects);
        std::cout << std::fixed << std::setprecision(1);
        std::cout << "CANDIDATES\n";
        std::cout << "----------\n";
        std::cout << "  " << totals.projectCount << " projects, $" << totals.totalInvestmentUsd / 1e6
                  << "M requested, $" << totals.totalNpvUsd / 1e6 << "M NPV, mean IRR "
                  << totals.meanIrrPercent << "%, " << totals.inProgressCount << " in progress\n\n";

        fabcap::PortfolioConfig config;
        config.timeLimitSeconds = 10.0;

        // ====================================================================
        // SOLVE AT THE PLANNING BUDGET
        // ====================================================================
        const double budget = 1.2e9;
        std::cout << "BUDGET $" << budget / 1e6 << "M\n";
        std::cout << "---------------\n";
        printOutcome(fabcap::optimizePortfolio(projects, budget, config));

        // ====================================================================
        // MODEL DIAGNOSTICS
        // ====================================================================
        std::cout << "\nMODEL DIAGNOSTICS\n";
        std::cout << "-----------------\n";
        fabcap::PortfolioBuilder builder(projects, budget, config);
        builder.optimize();

        std::cout << "Status: " << fabcap::statusString(builder.status()) << "\n";
        std::cout << fabcap::modelSummary(builder.model()) << "\n";
        if (builder.isOptimal()) {
            const auto& quality = builder.quality();
            std::cout << std::scientific << std::setprecision(2)
                      << "Max constraint violation: " << quality.maxConstrViolation << "\n"
                      << "Max bound violation:      " << quality.maxBoundViolation << "\n"
                      << std::fixed;

            const auto& rows = builder.cons(fabcap::PortfolioCons::Budget);
            const auto& risk = builder.cons(fabcap::PortfolioCons::RiskBudget);
            std::cout << std::setprecision(1)
                      << "Budget slack:      $" << rows[0].get(GRB_DoubleAttr_Slack) / 1e6 << "M\n"
                      << "Risk budget slack: $" << risk[0].get(GRB_DoubleAttr_Slack) / 1e6 << "M\n";
        }

        // ====================================================================
        // BUDGET SWEEP
        // ====================================================================
        std::cout << "\nBUDGET SWEEP\n";
        std::cout << "------------\n";
        for (double b : {0.4e9, 0.8e9, 1.2e9, 1.6e9, 2.0e9}) {
            const auto out = fabcap::optimizePortfolio(projects, b, config);
            std::cout << "  $" << std::setw(6) << b / 1e6 << "M: NPV $" << std::setw(6)
                      << out.summary.totalNpvUsd / 1e6 << "M, " << out.summary.selectedCount
                      << " selected" << (out.summary.isApproximate ? " (approximate)" : "") << "\n";
        }

        // ====================================================================
        // INFEASIBLE BUDGET
        // ====================================================================
        std::cout << "\nNEGATIVE BUDGET\n";
        std::cout << "---------------\n";
        printOutcome(fabcap::optimizePortfolio(projects, -1.0, config));

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (const fabcap::PlanningError& e) {
        std::cerr << "Planning error: " << e.what() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
