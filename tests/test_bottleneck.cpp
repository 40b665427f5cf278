/*
===============================================================================
TEST BOTTLENECK - Tests for bottleneck.h
===============================================================================

OVERVIEW
--------
Validates the Theory-of-Constraints ranking: per-type utilization at a
target output, the bottleneck flag, ordering and tie-breaking, monotonicity
in the target, and handling of unknown tool types and zero capacity.

Fixture figures (see fixtures.h):

    type             eff. wpw  steps  max supportable
    CMP              18900     25     7560
    Lithography_EUV  26880     25     10752
    Etch_Plasma      90720     65     ~13957

TEST ORGANIZATION
-----------------
• Section A: Row figures
• Section B: Ordering
• Section C: Monotonicity
• Section D: Unknown tool types
• Section E: Errors

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• bottleneck.h - System under test
• fixtures.h - In-memory fab, LogCapture

===============================================================================
*/

#include <catch2/catch_all.hpp>

#include <fabcap/bottleneck.h>

#include "fixtures.h"

#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fabcap;
using namespace fabcap::test;

namespace {

    std::vector<BottleneckRow> rank(double target) {
        return analyzeBottlenecks(computeCapacity(fleetEquipment()),
                                  ProcessStepTable::fabDefault(), target);
    }

    const BottleneckRow& rowFor(const std::vector<BottleneckRow>& rows, const std::string& type) {
        for (const auto& r : rows) {
            if (r.toolType == type)
                return r;
        }
        throw std::out_of_range("no row for " + type);
    }

} // namespace

// ============================================================================
// SECTION A: ROW FIGURES
// ============================================================================

/**
 * @test RowFigures::BelowThreshold
 * @brief Visits, utilization and supportable output at a modest target
 *
 * @given Target 5000 wpw
 * @when Ranking the fixture fleet
 * @then CMP runs at 12500/18900, nothing is flagged
 *
 * @covers analyzeBottlenecks()
 */
TEST_CASE("A1: RowFigures::BelowThreshold", "[bottleneck][figures]")
{
    const auto rows = rank(5000.0);
    REQUIRE(rows.size() == 3);

    const auto& cmp = rowFor(rows, "CMP");
    REQUIRE(cmp.processSteps == Catch::Approx(25.0));
    REQUIRE(cmp.processFraction == Catch::Approx(25.0 / 390.0));
    REQUIRE(cmp.requiredVisitsWpw == Catch::Approx(12500.0));
    REQUIRE(cmp.utilizationAtTarget == Catch::Approx(12500.0 / 18900.0));
    REQUIRE(cmp.maxSupportableOutputWpw == Catch::Approx(7560.0));
    REQUIRE_FALSE(cmp.isBottleneck);
    REQUIRE(cmp.constraintSeverity == 0.0);
    REQUIRE(cmp.capacityGapWpw == 0.0);

    const auto& etch = rowFor(rows, "Etch_Plasma");
    REQUIRE(etch.requiredVisitsWpw == Catch::Approx(32500.0));
    REQUIRE(etch.toolCount == 3);

    for (const auto& r : rows)
        REQUIRE_FALSE(r.isBottleneck);
}

/**
 * @test RowFigures::OverloadedType
 * @brief Above capacity: clamped utilization, raw severity and a gap
 *
 * @given Target 8000 wpw (CMP needs 20000 visits against 18900)
 * @when Ranking
 * @then CMP is the flagged binding constraint with a 1100 wpw gap
 */
TEST_CASE("A2: RowFigures::OverloadedType", "[bottleneck][figures]")
{
    const auto rows = rank(8000.0);

    const auto* binding = bindingConstraint(rows);
    REQUIRE(binding != nullptr);
    REQUIRE(binding->toolType == "CMP");
    REQUIRE(binding->isBottleneck);
    REQUIRE(binding->utilizationAtTarget == Catch::Approx(1.0));
    REQUIRE(binding->rawUtilization == Catch::Approx(20000.0 / 18900.0));
    REQUIRE(binding->constraintSeverity == Catch::Approx(binding->rawUtilization));
    REQUIRE(binding->capacityGapWpw == Catch::Approx(1100.0));

    REQUIRE_FALSE(rowFor(rows, "Lithography_EUV").isBottleneck);
}

/**
 * @test RowFigures::ThresholdIsStrict
 * @brief The flag follows the configured threshold; equality is not enough
 */
TEST_CASE("A3: RowFigures::ThresholdIsStrict", "[bottleneck][figures]")
{
    BottleneckConfig config;
    config.bottleneckThreshold = 0.5;

    // 12500 / 18900 = 0.661 > 0.5
    auto rows = analyzeBottlenecks(computeCapacity(fleetEquipment()),
                                   ProcessStepTable::fabDefault(), 5000.0, config);
    REQUIRE(rowFor(rows, "CMP").isBottleneck);
    REQUIRE_FALSE(rowFor(rows, "Etch_Plasma").isBottleneck);

    // CMP capacity 100 wph * 168 * 0.5 = 8400; target 3024 -> 7560 visits = 0.9 exactly
    EquipmentTable single{{"CMP-X", "CMP", 100.0, 0.5, 600.0, ToolStatus::Active, false}};
    rows = analyzeBottlenecks(computeCapacity(single), ProcessStepTable::fabDefault(), 3024.0);
    REQUIRE(rows.front().rawUtilization == Catch::Approx(0.9));
    REQUIRE_FALSE(rows.front().isBottleneck);
}

/**
 * @test RowFigures::ZeroTarget
 * @brief Zero output loads nothing
 */
TEST_CASE("A4: RowFigures::ZeroTarget", "[bottleneck][figures]")
{
    for (const auto& r : rank(0.0)) {
        REQUIRE(r.utilizationAtTarget == 0.0);
        REQUIRE_FALSE(r.isBottleneck);
        REQUIRE(r.capacityGapWpw == 0.0);
    }
}

// ============================================================================
// SECTION B: ORDERING
// ============================================================================

/**
 * @test Ordering::DescendingUtilization
 * @brief Rows are sorted by utilization, highest first
 */
TEST_CASE("B1: Ordering::DescendingUtilization", "[bottleneck][ordering]")
{
    const auto rows = rank(5000.0);

    REQUIRE(rows[0].toolType == "CMP");
    REQUIRE(rows[1].toolType == "Lithography_EUV");
    REQUIRE(rows[2].toolType == "Etch_Plasma");
    for (std::size_t i = 1; i < rows.size(); ++i)
        REQUIRE(rows[i - 1].utilizationAtTarget >= rows[i].utilizationAtTarget);
}

/**
 * @test Ordering::SaturatedTiesUseRawRatio
 * @brief Several types clamped at 1.0 are ordered by their raw ratio
 *
 * @given Target 12000 wpw (CMP raw 1.59, EUV raw 1.12, both clamped)
 * @when Ranking
 * @then CMP precedes EUV; both flagged; Etch (0.86) last and unflagged
 */
TEST_CASE("B2: Ordering::SaturatedTiesUseRawRatio", "[bottleneck][ordering]")
{
    const auto rows = rank(12000.0);

    REQUIRE(rows[0].toolType == "CMP");
    REQUIRE(rows[1].toolType == "Lithography_EUV");
    REQUIRE(rows[0].utilizationAtTarget == rows[1].utilizationAtTarget);
    REQUIRE(rows[0].rawUtilization > rows[1].rawUtilization);
    REQUIRE(rows[0].isBottleneck);
    REQUIRE(rows[1].isBottleneck);

    REQUIRE(rows[2].toolType == "Etch_Plasma");
    REQUIRE(rows[2].rawUtilization == Catch::Approx(78000.0 / 90720.0));
    REQUIRE_FALSE(rows[2].isBottleneck);
}

/**
 * @test Ordering::IdenticalTypesBreakByName
 * @brief Fully identical figures fall back to tool type name
 */
TEST_CASE("B3: Ordering::IdenticalTypesBreakByName", "[bottleneck][ordering]")
{
    EquipmentTable equipment{
        {"B-1", "Beta", 100.0, 0.8, 100.0, ToolStatus::Active, false},
        {"A-1", "Alpha", 100.0, 0.8, 100.0, ToolStatus::Active, false},
    };
    ProcessStepTable steps{{"Alpha", 30.0}, {"Beta", 30.0}};

    const auto rows = analyzeBottlenecks(computeCapacity(equipment), steps, 10000.0);
    REQUIRE(rows[0].toolType == "Alpha");
    REQUIRE(rows[1].toolType == "Beta");
}

/**
 * @test Ordering::HeaviestAndSmallestRanksFirst
 * @brief A type with the most steps and the least capacity is always first
 *
 * @given Metrology_SEM (80 steps) with the smallest installed capacity
 * @when Ranking at targets across four orders of magnitude
 * @then Metrology_SEM is the top row every time
 */
TEST_CASE("B4: Ordering::HeaviestAndSmallestRanksFirst", "[bottleneck][ordering][property]")
{
    auto equipment = fleetEquipment();
    equipment.push_back({"SEM-01", "Metrology_SEM", 60.0, 0.70, 800.0, ToolStatus::Active, false});
    const auto capacity = computeCapacity(equipment);

    for (double target : {1.0, 50.0, 900.0, 4000.0, 25000.0}) {
        const auto rows = analyzeBottlenecks(capacity, ProcessStepTable::fabDefault(), target);
        REQUIRE(rows.front().toolType == "Metrology_SEM");
    }
}

// ============================================================================
// SECTION C: MONOTONICITY
// ============================================================================

/**
 * @test Monotonicity::UtilizationNonDecreasingInTarget
 * @brief Raising the target never lowers any type's utilization
 *
 * @given Targets 0, 500, ..., 20000 wpw
 * @when Ranking at each target
 * @then Each type's clamped and raw utilization is non-decreasing, and a
 *       type once flagged stays flagged
 */
TEST_CASE("C1: Monotonicity::UtilizationNonDecreasingInTarget", "[bottleneck][property]")
{
    const auto capacity = computeCapacity(fleetEquipment());
    const auto steps = ProcessStepTable::fabDefault();

    std::map<std::string, BottleneckRow> previous;
    for (double target = 0.0; target <= 20000.0; target += 500.0) {
        for (const auto& r : analyzeBottlenecks(capacity, steps, target)) {
            auto it = previous.find(r.toolType);
            if (it != previous.end()) {
                REQUIRE(r.utilizationAtTarget >= it->second.utilizationAtTarget);
                REQUIRE(r.rawUtilization >= it->second.rawUtilization);
                if (it->second.isBottleneck)
                    REQUIRE(r.isBottleneck);
            }
            previous[r.toolType] = r;
        }
    }
}

// ============================================================================
// SECTION D: UNKNOWN TOOL TYPES
// ============================================================================

/**
 * @test UnknownTypes::DefaultWeightIsFlaggedAndLogged
 * @brief A type outside the table uses weight 50 and a WARN line
 *
 * @covers ProcessStepTable::lookup(), UnknownToolPolicy::UseDefaultWeight
 */
TEST_CASE("D1: UnknownTypes::DefaultWeightIsFlaggedAndLogged", "[bottleneck][unknown]")
{
    LogCapture capture(LogLevel::Warn);

    auto equipment = fleetEquipment();
    equipment.push_back({"LA-01", "Laser_Anneal", 120.0, 0.8, 700.0, ToolStatus::Active, false});

    const auto rows = analyzeBottlenecks(computeCapacity(equipment),
                                         ProcessStepTable::fabDefault(), 5000.0);
    const auto& anneal = rowFor(rows, "Laser_Anneal");

    REQUIRE(anneal.usedDefaultSteps);
    REQUIRE(anneal.processSteps == Catch::Approx(50.0));
    REQUIRE(anneal.processFraction == Catch::Approx(50.0 / 390.0));
    REQUIRE_FALSE(rowFor(rows, "CMP").usedDefaultSteps);

    REQUIRE(capture.contains(LogLevel::Warn, "Laser_Anneal"));
}

/**
 * @test UnknownTypes::RejectPolicy
 * @brief Under Reject an unknown type is a DataError
 */
TEST_CASE("D2: UnknownTypes::RejectPolicy", "[bottleneck][unknown][exception]")
{
    auto equipment = fleetEquipment();
    equipment.push_back({"LA-01", "Laser_Anneal", 120.0, 0.8, 700.0, ToolStatus::Active, false});

    ProcessStepTable strict(ProcessStepTable::fabDefault().entries(),
                            ProcessStepTable::kDefaultSteps, UnknownToolPolicy::Reject);

    REQUIRE_THROWS_AS(analyzeBottlenecks(computeCapacity(equipment), strict, 5000.0), DataError);
    REQUIRE_NOTHROW(analyzeBottlenecks(computeCapacity(fleetEquipment()), strict, 5000.0));
}

// ============================================================================
// SECTION E: ERRORS
// ============================================================================

/**
 * @test Errors::InvalidArguments
 */
TEST_CASE("E1: Errors::InvalidArguments", "[bottleneck][exception]")
{
    const auto capacity = computeCapacity(fleetEquipment());
    const auto steps = ProcessStepTable::fabDefault();

    REQUIRE_THROWS_AS(analyzeBottlenecks(capacity, steps, -1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(analyzeBottlenecks(capacity, steps, std::numeric_limits<double>::quiet_NaN()),
                      std::invalid_argument);

    BottleneckConfig bad;
    bad.visitNormalization = 0.0;
    REQUIRE_THROWS_AS(analyzeBottlenecks(capacity, steps, 100.0, bad), std::invalid_argument);

    REQUIRE_THROWS_AS(analyzeBottlenecks({}, steps, 100.0), DataError);
}

/**
 * @test Errors::ZeroEffectiveCapacity
 * @brief A type with zero utilization target cannot be loaded
 *
 * @given A CMP tool with utilization target 0
 * @when Ranking at any target
 * @then NumericError naming the type
 */
TEST_CASE("E2: Errors::ZeroEffectiveCapacity", "[bottleneck][exception]")
{
    EquipmentTable idle{{"CMP-9", "CMP", 150.0, 0.0, 600.0, ToolStatus::Maintenance, false}};

    REQUIRE_THROWS_AS(analyzeBottlenecks(computeCapacity(idle), ProcessStepTable::fabDefault(), 100.0),
                      NumericError);
    REQUIRE_THROWS_WITH(analyzeBottlenecks(computeCapacity(idle), ProcessStepTable::fabDefault(), 0.0),
                        Catch::Matchers::ContainsSubstring("CMP"));
}
