/*
===============================================================================
TEST MODEL BUILDER - Tests for model_builder.h
===============================================================================

OVERVIEW
--------
Validates the ModelBuilder template: hook invocation order, typed variable
and constraint registries, tracked parameter setters, the objective helper
and status queries before and after a solve.

TEST ORGANIZATION
-----------------
• Section A: Orchestration and lifecycle
• Section B: Registries
• Section C: Parameters
• Section D: Status queries

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• model_builder.h, expressions.h - System under test
• Gurobi C++ API - Solver backend (license required)

===============================================================================
*/

#include <catch2/catch_all.hpp>

#include <fabcap/expressions.h>
#include <fabcap/model_builder.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace fabcap;

// ============================================================================
// TEST UTILITIES AND FIXTURES
// ============================================================================

FABCAP_DECLARE_ENUM_WITH_COUNT(TestVars, X);
FABCAP_DECLARE_ENUM_WITH_COUNT(TestCons, Cap, Floor);

/**
 * @class TinyBuilder
 * @brief max 2 x0 + x1  s.t.  x0 + x1 <= 1,  x in [0, 1]
 *
 * @details Records the order in which hooks run. With `infeasible` set it
 *          also adds x0 + x1 >= 3, which no point in the box satisfies.
 */
class TinyBuilder : public ModelBuilder<TestVars, TestCons>
{
public:
    std::vector<std::string> calls;
    bool infeasible = false;

    void configureEnvironment(GRBEnv& env) override
    {
        calls.push_back("env");
        env.set(GRB_IntParam_OutputFlag, 0);
    }

    void addVariables() override
    {
        calls.push_back("vars");
        addContinuousVars(TestVars::X, {"x0", "x1"}, 0.0, 1.0);
    }

    void addConstraints() override
    {
        calls.push_back("cons");
        const auto& x = vars(TestVars::X);
        addConstraint(TestCons::Cap, x[0] + x[1] <= 1.0, "cap");
        if (infeasible)
            addConstraint(TestCons::Floor, x[0] + x[1] >= 3.0, "floor");
    }

    void addParameters() override
    {
        calls.push_back("params");
        timeLimit(10.0);
        threads(1);
    }

    void addObjective() override
    {
        calls.push_back("objective");
        maximize(dot({2.0, 1.0}, vars(TestVars::X)));
    }

    void beforeOptimize() override { calls.push_back("before"); }
    void afterOptimize() override { calls.push_back("after"); }
};

// ============================================================================
// SECTION A: ORCHESTRATION AND LIFECYCLE
// ============================================================================

/**
 * @test Orchestration::HookOrder
 * @brief optimize() runs every hook once in the documented order
 *
 * @given A TinyBuilder
 * @when Calling optimize()
 * @then env, vars, cons, params, objective, before, after
 *
 * @covers ModelBuilder::optimize(), ModelBuilder::initialize()
 */
TEST_CASE("A1: Orchestration::HookOrder", "[ModelBuilder][orchestration]")
{
    TinyBuilder builder;
    REQUIRE_FALSE(builder.optimized());

    builder.optimize();

    REQUIRE(builder.optimized());
    REQUIRE(builder.calls == std::vector<std::string>{
        "env", "vars", "cons", "params", "objective", "before", "after"});
}

/**
 * @test Lifecycle::InitializeIsIdempotent
 * @brief The environment is configured once however often model() is used
 */
TEST_CASE("A2: Lifecycle::InitializeIsIdempotent", "[ModelBuilder][lifecycle]")
{
    TinyBuilder builder;
    builder.initialize();
    builder.initialize();
    (void)builder.model();
    builder.optimize();

    int envCalls = 0;
    for (const auto& c : builder.calls)
        envCalls += (c == "env");
    REQUIRE(envCalls == 1);
}

// ============================================================================
// SECTION B: REGISTRIES
// ============================================================================

/**
 * @test Registries::VariablesAndConstraints
 * @brief Variables and rows are registered under their enum keys
 *
 * @covers ModelBuilder::addContinuousVars(), ModelBuilder::addConstraint()
 */
TEST_CASE("B1: Registries::VariablesAndConstraints", "[ModelBuilder][registry]")
{
    TinyBuilder builder;
    builder.optimize();

    const auto& x = builder.vars(TestVars::X);
    REQUIRE(x.size() == 2);
    REQUIRE(x[1].get(GRB_StringAttr_VarName) == "x1");
    REQUIRE(x[0].get(GRB_CharAttr_VType) == GRB_CONTINUOUS);
    REQUIRE(x[0].get(GRB_DoubleAttr_UB) == Catch::Approx(1.0));

    REQUIRE(builder.cons(TestCons::Cap).size() == 1);
    REQUIRE(builder.cons(TestCons::Cap)[0].get(GRB_StringAttr_ConstrName) == "cap");
    REQUIRE(builder.cons(TestCons::Floor).empty());
}

// ============================================================================
// SECTION C: PARAMETERS
// ============================================================================

/**
 * @test Parameters::TrackedInStore
 * @brief Named setters apply to the model and record "param:<Name>"
 */
TEST_CASE("C1: Parameters::TrackedInStore", "[ModelBuilder][parameters]")
{
    TinyBuilder builder;
    builder.optimize();

    REQUIRE(builder.model().get(GRB_DoubleParam_TimeLimit) == Catch::Approx(10.0));
    REQUIRE(builder.model().get(GRB_IntParam_Threads) == 1);

    const auto& store = builder.store();
    REQUIRE(store.at("param:TimeLimit").get<double>() == Catch::Approx(10.0));
    REQUIRE(store.at("param:Threads").get<int>() == 1);
}

/**
 * @test Parameters::Quiet
 * @brief quiet() silences solver output and records the flag
 */
TEST_CASE("C2: Parameters::Quiet", "[ModelBuilder][parameters]")
{
    TinyBuilder builder;
    builder.quiet();

    REQUIRE(builder.model().get(GRB_IntParam_OutputFlag) == 0);
    REQUIRE(builder.store().at("param:OutputFlag").get<int>() == 0);
}

// ============================================================================
// SECTION D: STATUS QUERIES
// ============================================================================

/**
 * @test Status::OptimalSolution
 * @brief The solved toy model is optimal at x = (1, 0) with objective 2
 */
TEST_CASE("D1: Status::OptimalSolution", "[ModelBuilder][status]")
{
    TinyBuilder builder;
    builder.optimize();

    REQUIRE(builder.isOptimal());
    REQUIRE(builder.status() == GRB_OPTIMAL);
    REQUIRE(builder.objVal() == Catch::Approx(2.0));
    REQUIRE(builder.runtime() >= 0.0);
    REQUIRE(builder.vars(TestVars::X)[0].get(GRB_DoubleAttr_X) == Catch::Approx(1.0));
}

/**
 * @test Status::Infeasible
 * @brief An empty feasible region is reported, objVal() throws
 */
TEST_CASE("D2: Status::Infeasible", "[ModelBuilder][status]")
{
    TinyBuilder builder;
    builder.infeasible = true;
    builder.optimize();

    REQUIRE_FALSE(builder.isOptimal());
    const int status = builder.status();
    REQUIRE((status == GRB_INFEASIBLE || status == GRB_INF_OR_UNBD));
    REQUIRE_THROWS_AS(builder.objVal(), GRBException);
}

/**
 * @test Status::BeforeInitialize
 * @brief Status queries on a fresh builder touch no solver state
 *
 * @given A TinyBuilder that was never initialized
 * @then status() is GRB_LOADED, objVal() and runtime() throw std::logic_error,
 *       and no environment was created
 */
TEST_CASE("D3: Status::BeforeInitialize", "[ModelBuilder][status][lifecycle]")
{
    TinyBuilder builder;

    REQUIRE(builder.status() == GRB_LOADED);
    REQUIRE_FALSE(builder.isOptimal());
    REQUIRE_THROWS_AS(builder.objVal(), std::logic_error);
    REQUIRE_THROWS_AS(builder.runtime(), std::logic_error);
    REQUIRE(builder.calls.empty());
}

/**
 * @test Expressions::DotRejectsSizeMismatch
 */
TEST_CASE("D4: Expressions::DotRejectsSizeMismatch", "[expressions][exception]")
{
    TinyBuilder builder;
    builder.optimize();

    REQUIRE_THROWS_AS(dot({1.0}, builder.vars(TestVars::X)), std::invalid_argument);

    GRBLinExpr e = sum(2, [&](std::size_t i) { return builder.vars(TestVars::X)[i]; });
    REQUIRE(e.size() == 2);
}
