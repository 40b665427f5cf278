#pragma once
/*
===============================================================================
RISK SIMULATOR - Monte Carlo estimation of demand/capacity shortfall
===============================================================================

Overview
--------
Each trial perturbs the current weekly baseline with four independent
factors and compares the resulting demand with the resulting capacity:

    demand       = baseline_demand   * N(1, demand_volatility)
    yield        = clamp(N(0.92, 0.05), 0.75, 0.98)
    availability ~ Beta(9, 1)                       (skewed towards uptime)
    cycle_time   ~ LogNormal(0, 0.15)
    capacity     = baseline_capacity * yield * availability / cycle_time

    shortfall    = max(0, demand - capacity)
    surplus      = max(0, capacity - demand)
    utilization  = min(demand / capacity, 1)

Trials are i.i.d.; the metrics summarize their empirical distribution
(mean, median and tail percentiles of shortfall, service level, utilization,
capacity-at-risk, demand-at-risk).

Random Streams
--------------
The trial sequence is cut into streams of `trialsPerStream` trials. Stream k
draws from its own std::mt19937_64 seeded with seed_seq{seed, k}. The stream
layout depends only on the seed and the trial count, never on the number of
workers, so

    * the same (seed, trials) gives bit-identical metrics for any `workers`
    * a 10k-trial run is the prefix of a 1M-trial run with the same seed

Parallel Fan-Out
----------------
With workers > 1 the streams are distributed round-robin over std::async
tasks. Each task writes only its own slice of the preallocated trial table;
the single reduction runs after every future has been joined.

Beta Sampling
-------------
The standard library has no beta distribution. Beta(a, b) is drawn as
X / (X + Y) with X ~ Gamma(a, 1) and Y ~ Gamma(b, 1).

Percentiles
-----------
Linear interpolation between order statistics at position p * (n - 1),
identical to the default quantile of common dataframe libraries.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <future>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.h"
#include "errors.h"
#include "logging.h"

namespace fabcap {

/// One simulated week.
struct TrialOutcome {
    double demand = 0.0;
    double capacity = 0.0;
    double shortfall = 0.0;
    double surplus = 0.0;
    double utilization = 0.0;
    double yield = 0.0;
    double availability = 0.0;
    double cycleTimeMultiplier = 0.0;
};

struct RiskMetrics {
    double baselineCapacityWpw = 0.0;
    double meanDemandWpw = 0.0;            ///< baseline weekly demand
    double meanShortfallWpw = 0.0;
    double medianShortfallWpw = 0.0;
    double p95ShortfallWpw = 0.0;
    double p99ShortfallWpw = 0.0;
    double probabilityOfShortfall = 0.0;   ///< P(shortfall > 0)
    double serviceLevelProbability = 0.0;  ///< P(shortfall == 0)
    double meanUtilization = 0.0;
    double p95Utilization = 0.0;
    double capacityAtRiskP5Wpw = 0.0;      ///< 5th percentile of capacity
    double demandAtRiskP95Wpw = 0.0;       ///< 95th percentile of demand
    std::size_t simulationCount = 0;
    int horizonQuarters = 0;
    std::uint64_t seed = 0;

    bool operator==(const RiskMetrics&) const = default;
};

struct RiskSimulation {
    RiskMetrics metrics;
    std::vector<TrialOutcome> trials;   ///< empty when keepTrials is false
};

namespace risk_detail {

    /**
     * @brief Quantile of an ascending sample with linear interpolation
     * @pre sorted is non-empty and sorted ascending, p in [0, 1]
     */
    inline double quantileSorted(const std::vector<double>& sorted, double p) {
        const std::size_t n = sorted.size();
        if (n == 1)
            return sorted.front();
        const double pos = p * static_cast<double>(n - 1);
        const std::size_t i0 = static_cast<std::size_t>(std::floor(pos));
        const std::size_t i1 = std::min(n - 1, i0 + 1);
        const double t = pos - static_cast<double>(i0);
        return sorted[i0] + t * (sorted[i1] - sorted[i0]);
    }

    inline double mean(const std::vector<double>& xs) {
        double s = 0.0;
        for (double x : xs)
            s += x;
        return s / static_cast<double>(xs.size());
    }

    /// Beta(alpha, beta) via two gamma draws.
    class BetaDistribution {
    public:
        BetaDistribution(double alpha, double beta)
            : x_(alpha, 1.0), y_(beta, 1.0)
        {
        }

        template <typename Rng>
        double operator()(Rng& rng) {
            const double x = x_(rng);
            const double y = y_(rng);
            return x / (x + y);
        }

    private:
        std::gamma_distribution<double> x_;
        std::gamma_distribution<double> y_;
    };

    inline std::mt19937_64 streamEngine(std::uint64_t seed, std::uint64_t stream) {
        std::seed_seq seq{
            static_cast<std::uint32_t>(seed & 0xffffffffu),
            static_cast<std::uint32_t>(seed >> 32),
            static_cast<std::uint32_t>(stream & 0xffffffffu),
            static_cast<std::uint32_t>(stream >> 32),
        };
        return std::mt19937_64(seq);
    }

} // namespace risk_detail

/**
 * @class RiskSimulator
 * @brief Seeded Monte Carlo engine for weekly capacity shortfall
 *
 * @details The simulator holds only its configuration; run() is const and
 *          may be called concurrently from several threads.
 *
 * @example
 *     RiskSimulationConfig cfg;
 *     cfg.trials = 10000;
 *     cfg.seed = 7;
 *     auto sim = RiskSimulator(cfg).run(120000.0, 95000.0);
 *     sim.metrics.serviceLevelProbability;   // e.g. 0.83
 */
class RiskSimulator {
public:
    explicit RiskSimulator(RiskSimulationConfig config = {})
        : config_(std::move(config))
    {
        validate();
    }

    const RiskSimulationConfig& config() const noexcept { return config_; }

    /**
     * @brief Run all trials against a weekly baseline
     *
     * @param baselineCapacityWpw Current weekly capacity (> 0)
     * @param baselineDemandWpw   Current weekly demand (>= 0)
     *
     * @throws NumericError if baselineCapacityWpw is not positive
     * @throws DataError if baselineDemandWpw is negative
     */
    RiskSimulation run(double baselineCapacityWpw, double baselineDemandWpw) const {
        if (!(baselineCapacityWpw > 0.0) || !std::isfinite(baselineCapacityWpw))
            throw NumericError("RiskSimulator::run: baseline capacity must be positive, got " +
                               std::to_string(baselineCapacityWpw));
        if (!(baselineDemandWpw >= 0.0) || !std::isfinite(baselineDemandWpw))
            throw DataError("RiskSimulator::run: baseline demand must be non-negative, got " +
                            std::to_string(baselineDemandWpw));

        logDebug("RiskSimulator::run: " + std::to_string(config_.trials) + " trials, seed " +
                 std::to_string(config_.seed) + ", " + std::to_string(config_.workers) + " worker(s)");

        std::vector<TrialOutcome> trials(config_.trials);
        const std::size_t streams = streamCount();
        const std::size_t workers = std::min(config_.workers, streams);

        if (workers <= 1) {
            for (std::size_t k = 0; k < streams; ++k)
                runStream(k, baselineCapacityWpw, baselineDemandWpw, trials);
        } else {
            std::vector<std::future<void>> tasks;
            tasks.reserve(workers);
            for (std::size_t w = 0; w < workers; ++w) {
                tasks.push_back(std::async(std::launch::async, [&, w] {
                    for (std::size_t k = w; k < streams; k += workers)
                        runStream(k, baselineCapacityWpw, baselineDemandWpw, trials);
                }));
            }
            for (auto& t : tasks)
                t.get();
        }

        RiskSimulation result;
        result.metrics = summarize(trials, baselineCapacityWpw, baselineDemandWpw);
        if (config_.keepTrials)
            result.trials = std::move(trials);

        logInfo("RiskSimulator::run: service level " + std::to_string(result.metrics.serviceLevelProbability) +
                ", mean shortfall " + std::to_string(result.metrics.meanShortfallWpw) +
                " wpw, p95 shortfall " + std::to_string(result.metrics.p95ShortfallWpw) + " wpw");
        return result;
    }

private:
    RiskSimulationConfig config_;

    void validate() const {
        if (config_.trials == 0)
            throw std::invalid_argument("RiskSimulator: trial count must be positive");
        if (config_.trialsPerStream == 0)
            throw std::invalid_argument("RiskSimulator: trialsPerStream must be positive");
        if (config_.workers == 0)
            throw std::invalid_argument("RiskSimulator: workers must be at least 1");
        if (!(config_.demandVolatility > 0.0) || !(config_.yieldStd > 0.0) || !(config_.cycleTimeSigma > 0.0))
            throw std::invalid_argument("RiskSimulator: distribution spreads must be positive");
        if (!(config_.availabilityAlpha > 0.0) || !(config_.availabilityBeta > 0.0))
            throw std::invalid_argument("RiskSimulator: availability shape parameters must be positive");
        if (!(config_.yieldMin > 0.0) || config_.yieldMin > config_.yieldMax)
            throw std::invalid_argument("RiskSimulator: yield bounds must satisfy 0 < min <= max");
    }

    std::size_t streamCount() const noexcept {
        return (config_.trials + config_.trialsPerStream - 1) / config_.trialsPerStream;
    }

    void runStream(std::size_t stream, double capacityWpw, double demandWpw,
                   std::vector<TrialOutcome>& out) const {
        auto rng = risk_detail::streamEngine(config_.seed, stream);

        std::normal_distribution<double> demandShock(1.0, config_.demandVolatility);
        std::normal_distribution<double> yieldShock(config_.yieldMean, config_.yieldStd);
        risk_detail::BetaDistribution availabilityShock(config_.availabilityAlpha, config_.availabilityBeta);
        std::lognormal_distribution<double> cycleTime(0.0, config_.cycleTimeSigma);

        const std::size_t first = stream * config_.trialsPerStream;
        const std::size_t last = std::min(first + config_.trialsPerStream, out.size());

        for (std::size_t i = first; i < last; ++i) {
            TrialOutcome& t = out[i];
            t.demand = demandWpw * demandShock(rng);
            t.yield = std::clamp(yieldShock(rng), config_.yieldMin, config_.yieldMax);
            t.availability = availabilityShock(rng);
            t.cycleTimeMultiplier = cycleTime(rng);

            t.capacity = capacityWpw * t.yield * t.availability / t.cycleTimeMultiplier;
            t.shortfall = std::max(0.0, t.demand - t.capacity);
            t.surplus = std::max(0.0, t.capacity - t.demand);
            t.utilization = std::min(t.demand / t.capacity, 1.0);
        }
    }

    RiskMetrics summarize(const std::vector<TrialOutcome>& trials,
                          double capacityWpw, double demandWpw) const {
        const std::size_t n = trials.size();
        std::vector<double> shortfall(n), utilization(n), capacity(n), demand(n);
        std::size_t withShortfall = 0;

        for (std::size_t i = 0; i < n; ++i) {
            shortfall[i] = trials[i].shortfall;
            utilization[i] = trials[i].utilization;
            capacity[i] = trials[i].capacity;
            demand[i] = trials[i].demand;
            if (trials[i].shortfall > 0.0)
                ++withShortfall;
        }

        RiskMetrics m;
        m.baselineCapacityWpw = capacityWpw;
        m.meanDemandWpw = demandWpw;
        m.simulationCount = n;
        m.horizonQuarters = config_.horizonQuarters;
        m.seed = config_.seed;

        m.meanShortfallWpw = risk_detail::mean(shortfall);
        m.meanUtilization = risk_detail::mean(utilization);
        m.probabilityOfShortfall = static_cast<double>(withShortfall) / static_cast<double>(n);
        m.serviceLevelProbability = static_cast<double>(n - withShortfall) / static_cast<double>(n);

        std::sort(shortfall.begin(), shortfall.end());
        std::sort(utilization.begin(), utilization.end());
        std::sort(capacity.begin(), capacity.end());
        std::sort(demand.begin(), demand.end());

        m.medianShortfallWpw = risk_detail::quantileSorted(shortfall, 0.50);
        m.p95ShortfallWpw = risk_detail::quantileSorted(shortfall, 0.95);
        m.p99ShortfallWpw = risk_detail::quantileSorted(shortfall, 0.99);
        m.p95Utilization = risk_detail::quantileSorted(utilization, 0.95);
        m.capacityAtRiskP5Wpw = risk_detail::quantileSorted(capacity, 0.05);
        m.demandAtRiskP95Wpw = risk_detail::quantileSorted(demand, 0.95);
        return m;
    }
};

} // namespace fabcap
