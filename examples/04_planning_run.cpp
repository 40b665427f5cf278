/*
================================================================================
EXAMPLE 04: PLANNING RUN - Every analysis over one fab dataset
================================================================================
DIFFICULTY: Advanced
ANALYSIS TYPE: End-to-end (CapacityModel + ReliabilityModel)

PROBLEM DESCRIPTION
-------------------
A quarterly planning run over a small fab: two weeks of operations history,
a two-quarter demand forecast and a CapEx candidate list. The run answers:

    1. Which tool type binds at 8000 wafers per week?
    2. What is the service level next quarter?
    3. Which projects to fund with $1.5B?
    4. How do the growth scenarios compare?
    5. Which tool types underperform their MTBF rating?

and closes with the executive summary figures.

FEATURES DEMONSTRATED
---------------------
- CapacityModel                  Validated facade over the planning tables
- computeBottleneck()            Binding constraint at a target
- simulateRisk()                 Monte Carlo metrics
- optimizePortfolio()            CapEx LP
- computeScenarios()             What-if table
- ReliabilityModel               MTBF and availability impact
- summarizeFleet(), summarizeCapEx()  Executive summary
- setLogSink()                   Routing library log lines

================================================================================
*/

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <fabcap/fabcap.h>

namespace {

    using fabcap::ToolStatus;

    fabcap::EquipmentTable buildFleet() {
        return {
            {"EUV-01", "Lithography_EUV", 150, 0.83, 450, ToolStatus::Active, true},
            {"EUV-02", "Lithography_EUV", 150, 0.83, 450, ToolStatus::Active, true},
            {"EUV-03", "Lithography_EUV", 150, 0.83, 450, ToolStatus::Maintenance, true},
            {"DUV-01", "Lithography_DUV", 230, 0.86, 700, ToolStatus::Active, false},
            {"DUV-02", "Lithography_DUV", 230, 0.86, 700, ToolStatus::Active, false},
            {"ETCH-01", "Etch_Plasma", 190, 0.89, 380, ToolStatus::Active, false},
            {"ETCH-02", "Etch_Plasma", 190, 0.89, 380, ToolStatus::Active, false},
            {"ETCH-03", "Etch_Plasma", 190, 0.89, 380, ToolStatus::Active, false},
            {"ETCH-04", "Etch_Plasma", 190, 0.89, 380, ToolStatus::Upgrade, false},
            {"CVD-01", "Deposition_CVD", 170, 0.87, 520, ToolStatus::Active, false},
            {"CVD-02", "Deposition_CVD", 170, 0.87, 520, ToolStatus::Active, false},
            {"PVD-01", "Deposition_PVD", 210, 0.88, 650, ToolStatus::Active, false},
            {"CMP-01", "CMP", 160, 0.80, 600, ToolStatus::Active, false},
            {"CMP-02", "CMP", 160, 0.80, 600, ToolStatus::Active, false},
        };
    }

    // Fourteen days, one row per tool. Downtime follows a fixed pattern so the
    // run is reproducible without a data generator.
    fabcap::OperationsTable buildHistory(const fabcap::EquipmentTable& fleet) {
        using namespace std::chrono;
        const sys_days start = year{2025} / June / day{16};

        fabcap::OperationsTable ops;
        for (int d = 0; d < 14; ++d) {
            for (std::size_t t = 0; t < fleet.size(); ++t) {
                const auto& e = fleet[t];
                fabcap::OperationRecord o;
                o.date = fabcap::Date{start + days{d}};
                o.toolId = e.toolId;
                o.toolType = e.toolType;
                o.utilizationRate = e.utilizationTarget - 0.01 * static_cast<double>((d + t) % 4);
                o.availability = 0.93 - 0.01 * static_cast<double>(t % 3);
                o.performanceEfficiency = 0.94;
                o.qualityRate = 0.975;
                o.oee = fabcap::computeOee(o.availability, o.performanceEfficiency, o.qualityRate);
                o.operatingHours = 24.0 * o.utilizationRate;
                o.outputWafers = e.status == ToolStatus::Active ? 40.0 * o.operatingHours : 0.0;
                o.unplannedDowntimeHours = ((d * 7 + static_cast<int>(t) * 3) % 11 == 0) ? 1.5 + 0.5 * (t % 3) : 0.0;
                ops.push_back(o);
            }
        }
        return ops;
    }

    std::string isoDate(const fabcap::Date& d) {
        std::ostringstream oss;
        oss << static_cast<int>(d.year()) << "-" << std::setfill('0') << std::setw(2)
            << static_cast<unsigned>(d.month()) << "-" << std::setw(2) << static_cast<unsigned>(d.day());
        return oss.str();
    }

    void section(const std::string& title) {
        std::cout << "\n" << title << "\n" << std::string(title.size(), '-') << "\n";
    }

} // namespace

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 04: Planning Run\n";
    std::cout << "================================================================\n";

    try {
        using namespace std::chrono;

        // Library log lines go to stderr with a prefix; solver chatter stays off.
        fabcap::setLogLevel(fabcap::LogLevel::Info);
        fabcap::setLogSink([](fabcap::LogLevel level, const std::string& msg) {
            std::cerr << "  [fabcap " << fabcap::logLevelName(level) << "] " << msg << "\n";
        });

        // ====================================================================
        // DATASET
        // ====================================================================
        const auto equipment = buildFleet();
        const auto operations = buildHistory(equipment);
        const fabcap::ForecastTable forecast = {
            {year{2025} / July / day{1}, "Logic_N3", 310000},
            {year{2025} / July / day{1}, "Logic_N5", 180000},
            {year{2025} / October / day{1}, "Logic_N3", 340000},
            {year{2025} / October / day{1}, "Logic_N5", 175000},
        };
        using fabcap::RiskLevel;
        const fabcap::CapExTable capex = {
            {"CX-01", "EUV scanner #4", 420e6, 230e6, 21.0, RiskLevel::Medium, "Approved"},
            {"CX-02", "CMP line extension", 160e6, 120e6, 26.0, RiskLevel::Low, "Planning"},
            {"CX-03", "Etch chamber retrofit", 210e6, 90e6, 16.5, RiskLevel::Low, "In Progress"},
            {"CX-04", "Advanced packaging", 520e6, 290e6, 23.0, RiskLevel::High, "Planning"},
            {"CX-05", "Metrology refresh", 140e6, 35e6, 10.5, RiskLevel::Low, "In Progress"},
            {"CX-06", "CVD capacity add", 330e6, 140e6, 15.0, RiskLevel::Medium, "Approved"},
        };

        const fabcap::CapacityModel model(equipment, operations, forecast);
        const fabcap::ReliabilityModel reliability(equipment, operations);

        std::cout << std::fixed << std::setprecision(0);

        // ====================================================================
        // 1. BOTTLENECK
        // ====================================================================
        section("1. BOTTLENECK AT 8000 WPW");
        const auto ranking = model.computeBottleneck(8000.0);
        for (const auto& r : ranking) {
            std::cout << "  " << std::left << std::setw(18) << r.toolType << std::right
                      << std::setprecision(1) << std::setw(7) << 100.0 * r.utilizationAtTarget << "%"
                      << std::setprecision(0) << std::setw(10) << r.maxSupportableOutputWpw << " max wpw"
                      << (r.isBottleneck ? "  BOTTLENECK" : "") << "\n";
        }

        // ====================================================================
        // 2. RISK
        // ====================================================================
        section("2. CAPACITY RISK (10,000 TRIALS)");
        fabcap::RiskSimulationConfig riskConfig;
        riskConfig.workers = 4;
        riskConfig.keepTrials = false;
        const auto risk = model.simulateRisk(10000, 4, 42, riskConfig).metrics;
        std::cout << "  Baseline " << risk.baselineCapacityWpw << " wpw capacity vs "
                  << risk.meanDemandWpw << " wpw demand\n";
        std::cout << std::setprecision(1)
                  << "  Service level " << 100.0 * risk.serviceLevelProbability << "%, P95 shortfall "
                  << risk.p95ShortfallWpw << " wpw\n";

        // ====================================================================
        // 3. CAPEX
        // ====================================================================
        section("3. CAPEX AT $1.5B");
        const auto plan = model.optimizePortfolio(capex, 1.5e9);
        if (plan.summary.ok()) {
            std::cout << "  Selected " << plan.summary.selectedCount << " projects:";
            for (const auto& name : plan.summary.selectedProjects)
                std::cout << " [" << name << "]";
            std::cout << "\n  NPV $" << std::setprecision(2) << plan.summary.totalNpvUsd / 1e9 << "B, "
                      << std::setprecision(1) << plan.summary.budgetUtilizationPct << "% of budget\n";
        } else {
            std::cout << "  Optimization failed: " << plan.summary.message << "\n";
        }

        // ====================================================================
        // 4. SCENARIOS
        // ====================================================================
        section("4. SCENARIOS");
        for (const auto& s : model.computeScenarios()) {
            std::cout << "  " << std::left << std::setw(14) << s.scenario << std::right
                      << std::setprecision(0) << std::setw(9) << s.projectedDemandWpw << " vs "
                      << std::setw(7) << s.effectiveCapacityWpw
                      << (s.capacitySufficient ? "  ok" : "  short by ")
                      << std::setprecision(1);
            if (!s.capacitySufficient)
                std::cout << s.additionalCapacityNeededPct << "%";
            std::cout << "\n";
        }

        // ====================================================================
        // 5. RELIABILITY
        // ====================================================================
        section("5. RELIABILITY");
        const auto mtbf = reliability.computeReliability();
        for (const auto& r : mtbf) {
            std::cout << "  " << std::left << std::setw(18) << r.toolType << std::right
                      << std::setw(3) << r.failureCount << " failures, MTBF "
                      << std::setprecision(0) << r.mtbfActualHours << "h of "
                      << r.mtbfTheoreticalHours << "h (" << std::setprecision(1)
                      << r.mtbfPerformancePct << "%), impact " << std::setprecision(2)
                      << r.availabilityImpactPct << "%\n";
        }
        std::cout << "  " << mtbf.size() << " tool types with recorded failures\n";

        // ====================================================================
        // EXECUTIVE SUMMARY
        // ====================================================================
        const auto fleet = fabcap::summarizeFleet(equipment, operations);
        const auto portfolio = fabcap::summarizeCapEx(capex);

        std::cout << "\n================================================================\n";
        std::cout << "EXECUTIVE SUMMARY\n";
        std::cout << "================================================================\n";
        std::cout << "FLEET STATUS\n";
        std::cout << "  Total Tools     : " << fleet.totalTools << "\n";
        std::cout << "  Active          : " << fleet.activeTools() << "\n";
        std::cout << "  Critical        : " << fleet.criticalTools << "\n";
        std::cout << "OPERATIONAL PERFORMANCE (" << isoDate(fleet.latestDate) << ")\n";
        std::cout << std::setprecision(1)
                  << "  Fleet OEE       : " << 100.0 * fleet.meanOee << "%\n"
                  << "  Utilization     : " << 100.0 * fleet.meanUtilization << "%\n"
                  << std::setprecision(0)
                  << "  Daily Output    : " << fleet.dailyOutputWafers << " wafers\n";
        std::cout << "CAPEX PORTFOLIO\n";
        std::cout << std::setprecision(2)
                  << "  Total Investment: $" << portfolio.totalInvestmentUsd / 1e9 << "B\n"
                  << "  Portfolio NPV   : $" << portfolio.totalNpvUsd / 1e9 << "B\n"
                  << std::setprecision(1)
                  << "  Average IRR     : " << portfolio.meanIrrPercent << "%\n"
                  << "  In Progress     : " << portfolio.inProgressCount << " projects\n";

        fabcap::resetLogSink();

    } catch (GRBException& e) {
        fabcap::resetLogSink();
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (const fabcap::PlanningError& e) {
        fabcap::resetLogSink();
        std::cerr << "Planning error: " << e.what() << "\n";
        return 1;
    } catch (std::exception& e) {
        fabcap::resetLogSink();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "================================================================\n";
    return 0;
}
