/*
================================================================================
EXAMPLE 02: CAPACITY RISK - Monte Carlo shortfall and what-if scenarios
================================================================================
DIFFICULTY: Intermediate
ANALYSIS TYPE: Stochastic simulation + deterministic scenarios

PROBLEM DESCRIPTION
-------------------
Demonstrated weekly output is close to the forecast weekly demand. How likely
is a shortfall next quarter once demand, yield, tool availability and cycle
time vary? And how do the planning team's growth scenarios compare?

MODEL
-----
Per trial:
    demand   ~ baseline_demand * Normal(1, 0.15)
    yield    ~ Normal(0.92, 0.05) clipped to [0.75, 0.98]
    uptime   ~ Beta(9, 1)
    ct_mult  ~ LogNormal(0, 0.15)

    capacity  = baseline_capacity * yield * uptime / ct_mult
    shortfall = max(0, demand - capacity)

Per scenario (growth g, yield y):
    demand * (1 + g)  vs.  capacity * y

FEATURES DEMONSTRATED
---------------------
- currentWeeklyCapacity() / currentWeeklyDemand()   Baselines
- RiskSimulator                  Seeded, parallel Monte Carlo
- RiskSimulationConfig           Distribution parameters, workers
- computeScenarios()             Conservative / Base / Aggressive / Stretch
- setLogLevel()                  Run logging

================================================================================
*/

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

#include <fabcap/fabcap.h>

namespace {

    fabcap::OperationRecord dayRow(fabcap::Date date, const std::string& tool,
                                   const std::string& type, double output) {
        fabcap::OperationRecord o;
        o.date = date;
        o.toolId = tool;
        o.toolType = type;
        o.utilizationRate = 0.84;
        o.availability = 0.92;
        o.performanceEfficiency = 0.94;
        o.qualityRate = 0.97;
        o.oee = fabcap::computeOee(o.availability, o.performanceEfficiency, o.qualityRate);
        o.outputWafers = output;
        o.operatingHours = 21.0;
        return o;
    }

} // namespace

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Capacity Risk\n";
    std::cout << "================================================================\n\n";

    try {
        using namespace std::chrono;
        fabcap::setLogLevel(fabcap::LogLevel::Info);

        // ====================================================================
        // BASELINES
        // ====================================================================
        const fabcap::Date today = year{2025} / March / day{31};
        const fabcap::OperationsTable operations = {
            dayRow(today, "EUV-01", "Lithography_EUV", 1900),
            dayRow(today, "EUV-02", "Lithography_EUV", 1850),
            dayRow(today, "ETCH-01", "Etch_Plasma", 2100),
            dayRow(today, "ETCH-02", "Etch_Plasma", 2050),
            dayRow(today, "CMP-01", "CMP", 2000),
        };
        const fabcap::ForecastTable forecast = {
            {year{2025} / April / day{1}, "Logic_N3", 420000},
            {year{2025} / April / day{1}, "Memory_HBM", 290000},
        };
        fabcap::validateOperations(operations);
        fabcap::validateForecast(forecast);

        const double capacity = fabcap::currentWeeklyCapacity(operations);
        const double demand = fabcap::currentWeeklyDemand(forecast);

        std::cout << std::fixed << std::setprecision(0);
        std::cout << "BASELINE\n";
        std::cout << "--------\n";
        std::cout << "  Weekly capacity: " << capacity << " wpw (latest day * 7)\n";
        std::cout << "  Weekly demand:   " << demand << " wpw (latest quarter / 13)\n\n";

        // ====================================================================
        // MONTE CARLO
        // ====================================================================
        fabcap::RiskSimulationConfig config;
        config.trials = 50000;
        config.horizonQuarters = 4;
        config.seed = 2025;
        config.workers = 4;
        config.keepTrials = false;

        std::cout << "SIMULATING " << config.trials << " TRIALS (" << config.workers << " workers)\n";
        std::cout << "-------------------------------------\n";
        const auto sim = fabcap::RiskSimulator(config).run(capacity, demand);
        const auto& m = sim.metrics;

        std::cout << std::setprecision(1);
        std::cout << "  Mean shortfall:       " << m.meanShortfallWpw << " wpw\n";
        std::cout << "  Median shortfall:     " << m.medianShortfallWpw << " wpw\n";
        std::cout << "  P95 / P99 shortfall:  " << m.p95ShortfallWpw << " / " << m.p99ShortfallWpw << " wpw\n";
        std::cout << std::setprecision(3);
        std::cout << "  P(shortfall):         " << m.probabilityOfShortfall << "\n";
        std::cout << "  Service level:        " << m.serviceLevelProbability << "\n";
        std::cout << "  Mean / P95 util:      " << m.meanUtilization << " / " << m.p95Utilization << "\n";
        std::cout << std::setprecision(0);
        std::cout << "  Capacity at risk P5:  " << m.capacityAtRiskP5Wpw << " wpw\n";
        std::cout << "  Demand at risk P95:   " << m.demandAtRiskP95Wpw << " wpw\n\n";

        // Same seed, one worker: identical metrics.
        config.workers = 1;
        const auto again = fabcap::RiskSimulator(config).run(capacity, demand);
        std::cout << "  Re-run with 1 worker reproduces metrics: "
                  << (again.metrics == m ? "yes" : "NO") << "\n\n";

        // ====================================================================
        // SCENARIOS
        // ====================================================================
        std::cout << "SCENARIOS\n";
        std::cout << "---------\n";
        std::cout << std::left << std::setw(14) << "Scenario" << std::right
                  << std::setw(8) << "Growth" << std::setw(8) << "Yield"
                  << std::setw(11) << "Demand" << std::setw(11) << "Capacity"
                  << std::setw(10) << "Gap" << std::setw(8) << "Util"
                  << std::setw(10) << "Need %" << "\n";
        std::cout << std::string(80, '-') << "\n";
        for (const auto& r : fabcap::computeScenarios(capacity, demand)) {
            std::cout << std::left << std::setw(14) << r.scenario << std::right
                      << std::setprecision(2) << std::setw(8) << r.growthRate
                      << std::setw(8) << r.assumedYield
                      << std::setprecision(0) << std::setw(11) << r.projectedDemandWpw
                      << std::setw(11) << r.effectiveCapacityWpw
                      << std::setw(10) << r.capacityGapWpw
                      << std::setprecision(2) << std::setw(8) << r.utilization
                      << std::setprecision(1) << std::setw(10) << r.additionalCapacityNeededPct
                      << (r.capacitySufficient ? "" : "  SHORT") << "\n";
        }

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
