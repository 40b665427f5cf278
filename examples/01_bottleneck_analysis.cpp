/*
================================================================================
EXAMPLE 01: BOTTLENECK ANALYSIS - Which tool type caps the fab?
================================================================================
DIFFICULTY: Beginner
ANALYSIS TYPE: Deterministic (Theory of Constraints)

PROBLEM DESCRIPTION
-------------------
A 300mm fab runs five tool types. Planning wants to know, for a range of
weekly wafer-start targets, which tool type saturates first and how much
capacity is missing at each target.

MODEL
-----
Per tool type t:
    effective_wpw[t] = sum(wph) * 168 * mean(utilization_target)
    visits_wpw[t]    = target * steps[t] / 10
    utilization[t]   = min(visits_wpw[t] / effective_wpw[t], 1)

    bottleneck       if visits / effective > 0.90
    max_supportable  = effective_wpw[t] / (steps[t] / 10)

FEATURES DEMONSTRATED
---------------------
- computeCapacity()               Effective weekly capacity per tool type
- ProcessStepTable::fabDefault()  Reference step counts
- analyzeBottlenecks()            Ranking at a target output
- bindingConstraint()             Top of the ranking
- UnknownToolPolicy               Default weight vs. rejection

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <fabcap/fabcap.h>

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Bottleneck Analysis\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // FLEET
        // ====================================================================
        using fabcap::ToolStatus;
        const fabcap::EquipmentTable equipment = {
            {"EUV-01", "Lithography_EUV", 140, 0.82, 450, ToolStatus::Active, true},
            {"EUV-02", "Lithography_EUV", 140, 0.82, 450, ToolStatus::Active, true},
            {"DUV-01", "Lithography_DUV", 220, 0.85, 700, ToolStatus::Active, false},
            {"ETCH-01", "Etch_Plasma", 180, 0.88, 380, ToolStatus::Active, false},
            {"ETCH-02", "Etch_Plasma", 180, 0.88, 380, ToolStatus::Active, false},
            {"ETCH-03", "Etch_Plasma", 180, 0.88, 380, ToolStatus::Maintenance, false},
            {"CVD-01", "Deposition_CVD", 160, 0.86, 520, ToolStatus::Active, false},
            {"CVD-02", "Deposition_CVD", 160, 0.86, 520, ToolStatus::Active, false},
            {"CMP-01", "CMP", 150, 0.78, 600, ToolStatus::Active, false},
            {"CMP-02", "CMP", 150, 0.78, 600, ToolStatus::Upgrade, false},
        };
        fabcap::validateEquipment(equipment);

        const auto steps = fabcap::ProcessStepTable::fabDefault();
        const auto capacity = fabcap::computeCapacity(equipment);

        std::cout << "EFFECTIVE CAPACITY\n";
        std::cout << "------------------\n";
        std::cout << std::left << std::setw(18) << "Tool type" << std::right
                  << std::setw(7) << "Tools" << std::setw(10) << "WPH"
                  << std::setw(8) << "Util" << std::setw(12) << "WPW" << "\n";
        std::cout << std::string(55, '-') << "\n";
        std::cout << std::fixed;
        for (const auto& c : capacity) {
            std::cout << std::left << std::setw(18) << c.toolType << std::right
                      << std::setw(7) << c.toolCount
                      << std::setw(10) << std::setprecision(0) << c.totalThroughputWph
                      << std::setw(8) << std::setprecision(2) << c.meanUtilizationTarget
                      << std::setw(12) << std::setprecision(0) << c.effectiveWeeklyCapacity << "\n";
        }
        std::cout << std::setw(45) << "Total" << std::setw(10)
                  << fabcap::totalEffectiveCapacity(capacity) << "\n\n";

        // ====================================================================
        // RANKING AT ONE TARGET
        // ====================================================================
        const double target = 9000.0;
        const auto ranking = fabcap::analyzeBottlenecks(capacity, steps, target);

        std::cout << "RANKING AT " << std::setprecision(0) << target << " WPW\n";
        std::cout << "-------------------------\n";
        std::cout << std::left << std::setw(18) << "Tool type" << std::right
                  << std::setw(7) << "Steps" << std::setw(10) << "Util"
                  << std::setw(10) << "Raw" << std::setw(12) << "Max WPW"
                  << std::setw(10) << "Gap" << "  Flag\n";
        std::cout << std::string(73, '-') << "\n";
        for (const auto& r : ranking) {
            std::cout << std::left << std::setw(18) << r.toolType << std::right
                      << std::setw(7) << std::setprecision(0) << r.processSteps
                      << std::setw(10) << std::setprecision(3) << r.utilizationAtTarget
                      << std::setw(10) << r.rawUtilization
                      << std::setw(12) << std::setprecision(0) << r.maxSupportableOutputWpw
                      << std::setw(10) << r.capacityGapWpw
                      << (r.isBottleneck ? "  BOTTLENECK" : "") << "\n";
        }

        if (const auto* binding = fabcap::bindingConstraint(ranking)) {
            std::cout << "\nBinding constraint: " << binding->toolType
                      << " (supports " << binding->maxSupportableOutputWpw << " wpw)\n\n";
        }

        // ====================================================================
        // TARGET SWEEP
        // ====================================================================
        std::cout << "TARGET SWEEP\n";
        std::cout << "------------\n";
        for (double t : {4000.0, 6000.0, 8000.0, 10000.0, 12000.0}) {
            const auto sweep = fabcap::analyzeBottlenecks(capacity, steps, t);
            std::size_t flagged = 0;
            for (const auto& r : sweep)
                flagged += r.isBottleneck ? 1 : 0;
            std::cout << "  " << std::setw(6) << t << " wpw: binding " << std::left
                      << std::setw(16) << sweep.front().toolType << std::right
                      << " utilization " << std::setprecision(3) << sweep.front().utilizationAtTarget
                      << ", " << flagged << " bottleneck(s)\n" << std::setprecision(0);
        }

        // ====================================================================
        // UNKNOWN TOOL TYPES
        // ====================================================================
        std::cout << "\nUNKNOWN TOOL TYPES\n";
        std::cout << "------------------\n";
        auto extended = equipment;
        extended.push_back({"MET-01", "Metrology", 300, 0.70, 900, ToolStatus::Active, false});
        const auto extendedCapacity = fabcap::computeCapacity(extended);

        for (const auto& r : fabcap::analyzeBottlenecks(extendedCapacity, steps, target)) {
            if (r.usedDefaultSteps)
                std::cout << "  " << r.toolType << " weighted with the default "
                          << r.processSteps << " steps\n";
        }

        const std::map<std::string, double> declared = {
            {"Lithography_EUV", 25}, {"Lithography_DUV", 40}, {"Etch_Plasma", 65},
            {"Deposition_CVD", 45}, {"CMP", 25}};
        const fabcap::ProcessStepTable strict(declared, fabcap::ProcessStepTable::kDefaultSteps,
                                              fabcap::UnknownToolPolicy::Reject);
        try {
            const auto rejected = fabcap::analyzeBottlenecks(extendedCapacity, strict, target);
            std::cout << "  Reject policy accepted " << rejected.size() << " tool types\n";
        } catch (const fabcap::DataError& e) {
            std::cout << "  Reject policy: " << e.what() << "\n";
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
