#pragma once
/*
===============================================================================
FABCAP - Unified Include Header
===============================================================================

OVERVIEW
--------
Single-include header for the fab capacity planning engine. Including this
file provides the datasets, every analysis and the CapacityModel facade.

WHAT'S INCLUDED
---------------
• enum_utils.h          - FABCAP_DECLARE_ENUM_WITH_COUNT, EnumArray, EnumNames
• errors.h              - PlanningError, DataError, NumericError, checkedDivide
• logging.h             - levelled, thread-safe log sink
• data_store.h          - type-erased run annotations
• records.h             - equipment / operations / forecast / CapEx tables
• config.h              - calendar, process steps, analysis configuration
• capacity.h            - effective capacity baseline
• bottleneck.h          - Theory-of-Constraints ranking
• risk_simulator.h      - Monte Carlo shortfall risk
• expressions.h         - linear expression helpers (sum, dot)
• model_builder.h       - Gurobi model lifecycle template
• solver_diagnostics.h  - status strings, model statistics
• portfolio_optimizer.h - CapEx allocation LP
• scenario_engine.h     - growth / yield what-ifs
• reliability.h         - MTBF and availability impact
• fleet_summary.h       - headline fleet and CapEx figures
• capacity_model.h      - facade over one planning run

QUICK START
-----------
    #include <fabcap/fabcap.h>

    int main() {
        fabcap::CapacityModel model(equipment, operations, forecast);

        for (const auto& row : model.computeBottleneck(60000.0)) {
            if (row.isBottleneck)
                std::cout << row.toolType << " at " << row.rawUtilization << "\n";
        }

        auto risk = model.simulateRisk(10000, 4, 42);
        std::cout << "service level " << risk.metrics.serviceLevelProbability << "\n";
        return 0;
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 10+, Clang 12+, MSVC 19.29+)
• Gurobi Optimizer 10.0+ with C++ API (portfolio optimization)

NAMESPACE
---------
Everything lives in `fabcap::`. Implementation helpers sit in nested
`*_detail` namespaces and are not part of the interface.

===============================================================================
*/

// ============================================================================
// FOUNDATIONS
// ============================================================================

#include "enum_utils.h"
#include "errors.h"
#include "logging.h"
#include "data_store.h"

// ============================================================================
// DATASETS AND CONFIGURATION
// ============================================================================

#include "records.h"
#include "config.h"

// ============================================================================
// ANALYSES
// ============================================================================

#include "capacity.h"
#include "bottleneck.h"
#include "risk_simulator.h"
#include "scenario_engine.h"
#include "reliability.h"
#include "fleet_summary.h"

// Solver-backed (Gurobi)
#include "expressions.h"
#include "model_builder.h"
#include "solver_diagnostics.h"
#include "portfolio_optimizer.h"

// ============================================================================
// FACADE
// ============================================================================

#include "capacity_model.h"
