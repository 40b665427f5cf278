#pragma once
/*
===============================================================================
CAPACITY MODEL - One planning run over a validated fleet dataset
===============================================================================

Overview
--------
CapacityModel binds the equipment, operations and forecast tables of a
planning run and exposes every analysis over them:

    computeCapacity()                 per-tool-type effective capacity
    computeBottleneck(target)         Theory-of-Constraints ranking
    simulateRisk(trials, horizon, seed)  Monte Carlo shortfall metrics
    optimizePortfolio(projects, budget)  CapEx LP
    computeScenarios()                growth / yield what-ifs
    currentWeeklyCapacity()           latest day's output * 7
    currentWeeklyDemand()             latest quarter's demand / 13

Nothing is cached: each call recomputes the baseline it needs from the bound
tables, so calls are independent and repeatable.

Lifetime
--------
The tables are held by const reference. The caller owns them and keeps them
alive, unchanged, for as long as the model is used. Passing a temporary
table does not compile.

Typical Usage
-------------
    fabcap::CapacityModel model(equipment, operations, forecast);

    auto ranking = model.computeBottleneck(60000.0);
    auto risk = model.simulateRisk(10000, 4, 42);
    auto plan = model.optimizePortfolio(projects, 5.0e9);
    auto whatIf = model.computeScenarios();

===============================================================================
*/

#include <cstdint>
#include <type_traits>
#include <utility>
#include <vector>

#include "bottleneck.h"
#include "capacity.h"
#include "config.h"
#include "portfolio_optimizer.h"
#include "records.h"
#include "risk_simulator.h"
#include "scenario_engine.h"

namespace fabcap {

class CapacityModel {
public:
    /**
     * @brief Validate and bind the datasets of a planning run
     *
     * @throws DataError if a table is empty or holds an invalid row
     */
    CapacityModel(const EquipmentTable& equipment,
                  const OperationsTable& operations,
                  const ForecastTable& forecast,
                  ProcessStepTable steps = ProcessStepTable::fabDefault(),
                  PlanningCalendar calendar = {})
        : equipment_(equipment)
        , operations_(operations)
        , forecast_(forecast)
        , steps_(std::move(steps))
        , calendar_(calendar)
    {
        validateEquipment(equipment_);
        validateOperations(operations_);
        validateForecast(forecast_);
    }

    /// Temporaries for any of the bound tables would dangle.
    template <typename E, typename O, typename F, typename... Rest,
              typename = std::enable_if_t<!(std::is_lvalue_reference_v<E> &&
                                            std::is_lvalue_reference_v<O> &&
                                            std::is_lvalue_reference_v<F>)>>
    CapacityModel(E&&, O&&, F&&, Rest&&...) = delete;

    const EquipmentTable& equipment() const noexcept { return equipment_; }
    const OperationsTable& operations() const noexcept { return operations_; }
    const ForecastTable& forecast() const noexcept { return forecast_; }
    const ProcessStepTable& processSteps() const noexcept { return steps_; }
    const PlanningCalendar& calendar() const noexcept { return calendar_; }

    std::vector<CapacityRow> computeCapacity() const {
        return fabcap::computeCapacity(equipment_, calendar_);
    }

    double currentWeeklyCapacity() const {
        return fabcap::currentWeeklyCapacity(operations_, calendar_);
    }

    double currentWeeklyDemand() const {
        return fabcap::currentWeeklyDemand(forecast_, calendar_);
    }

    /**
     * @brief Bottleneck ranking for a target weekly output
     * @see analyzeBottlenecks()
     */
    std::vector<BottleneckRow> computeBottleneck(double targetOutputWpw,
                                                 const BottleneckConfig& config = {}) const {
        return analyzeBottlenecks(computeCapacity(), steps_, targetOutputWpw, config);
    }

    /**
     * @brief Monte Carlo risk against the current weekly capacity and demand
     *
     * trials, horizonQuarters and seed override the corresponding fields
     * of config; the remaining fields (distributions, workers) are used as given.
     */
    RiskSimulation simulateRisk(std::size_t trials, int horizonQuarters, std::uint64_t seed,
                                RiskSimulationConfig config = {}) const {
        config.trials = trials;
        config.horizonQuarters = horizonQuarters;
        config.seed = seed;
        return RiskSimulator(std::move(config)).run(currentWeeklyCapacity(), currentWeeklyDemand());
    }

    /**
     * @brief Budget-constrained CapEx allocation
     * @see fabcap::optimizePortfolio()
     */
    PortfolioOutcome optimizePortfolio(const CapExTable& projects, double budgetUsd,
                                       const PortfolioConfig& config = {}) const {
        return fabcap::optimizePortfolio(projects, budgetUsd, config);
    }

    std::vector<ScenarioRow> computeScenarios(const std::vector<ScenarioDefinition>& scenarios =
                                                  defaultScenarios()) const {
        return fabcap::computeScenarios(currentWeeklyCapacity(), currentWeeklyDemand(), scenarios);
    }

private:
    const EquipmentTable& equipment_;
    const OperationsTable& operations_;
    const ForecastTable& forecast_;
    ProcessStepTable steps_;
    PlanningCalendar calendar_;
};

} // namespace fabcap
