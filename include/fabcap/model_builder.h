#pragma once
/*
===============================================================================
MODEL BUILDER - Solver lifecycle for the engine's linear programs
===============================================================================

Overview
--------
ModelBuilder owns the Gurobi environment and model of one optimization and
runs it through a fixed sequence of hooks ("template method"):

    optimize() {
        initialize();          // GRBEnv (deferred start) + GRBModel
        addVariables();
        addConstraints();
        addParameters();       // TimeLimit, Threads, OutputFlag
        addObjective();
        beforeOptimize();
        model.optimize();
        afterOptimize();       // extract the solution while the model lives
    }

Derived builders (PortfolioBuilder) only describe their model; environment
handling, parameter tracking and solution status queries live here.

Key Features
------------
1. Lazy initialization: the constructor touches no solver state; the license
   check happens on the first model() / optimize() call.
2. Typed registries: variables and constraints are kept per enum key
   (VarEnum / ConEnum declared with FABCAP_DECLARE_ENUM_WITH_COUNT), so a
   builder refers to "the allocation variables" or "the budget row" by name.
3. Parameter tracking: every named setter records its value in store()
   under "param:<Name>", which is how run reports show the solve deadline
   that was in force.
4. Deadline: timeLimit() bounds the solve. Reaching it is reported through
   status() == GRB_TIME_LIMIT, never by blocking the caller.

Typical Usage
-------------
    FABCAP_DECLARE_ENUM_WITH_COUNT(Vars, X);
    FABCAP_DECLARE_ENUM_WITH_COUNT(Cons, Cap);

    class TinyBuilder : public fabcap::ModelBuilder<Vars, Cons> {
        void addVariables() override {
            addContinuousVars(Vars::X, {"x0", "x1"}, 0.0, 1.0);
        }
        void addConstraints() override {
            addConstraint(Cons::Cap, vars(Vars::X)[0] + vars(Vars::X)[1] <= 1.0, "cap");
        }
        void addObjective() override {
            maximize(2.0 * vars(Vars::X)[0] + vars(Vars::X)[1]);
        }
    };

Exceptions
----------
Gurobi reports environment, license and modelling errors as GRBException;
they propagate out of optimize(). Callers that must turn every solver problem
into a result (PortfolioOptimizer) catch them there.

===============================================================================
*/

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "data_store.h"
#include "enum_utils.h"

namespace fabcap {

    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarGroup = std::vector<GRBVar>;
        using ConGroup = std::vector<GRBConstr>;

    private:
        std::unique_ptr<GRBEnv>   env_;
        std::unique_ptr<GRBModel> model_;
        bool initialized_ = false;
        bool optimized_ = false;

    protected:
        EnumArray<VarEnum, VarGroup> vars_;
        EnumArray<ConEnum, ConGroup> cons_;

        // Solver parameters and run annotations.
        DataStore store_;

    public:
        ModelBuilder() = default;
        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // -------------------------------------------------------------------------
        // Initialization
        // -------------------------------------------------------------------------

        /**
         * @brief Create environment and model once
         *
         * The environment is created with deferred start so configureEnvironment()
         * can set parameters (OutputFlag, license options) before the license is
         * checked out.
         */
        void initialize()
        {
            if (initialized_)
                return;

            env_ = std::make_unique<GRBEnv>(true);
            configureEnvironment(*env_);
            env_->start();
            model_ = std::make_unique<GRBModel>(*env_);

            initialized_ = true;
        }

        GRBModel& model()
        {
            if (!initialized_)
                initialize();
            return *model_;
        }

        /// @throws std::logic_error before initialize()
        const GRBModel& model() const
        {
            if (!initialized_)
                throw std::logic_error("ModelBuilder: model queried before initialize()");
            return *model_;
        }

        bool optimized() const noexcept { return optimized_; }

        VarGroup& vars(VarEnum key) noexcept { return vars_[key]; }
        const VarGroup& vars(VarEnum key) const noexcept { return vars_[key]; }

        ConGroup& cons(ConEnum key) noexcept { return cons_[key]; }
        const ConGroup& cons(ConEnum key) const noexcept { return cons_[key]; }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        // -------------------------------------------------------------------------
        // Model construction helpers
        // -------------------------------------------------------------------------

        /**
         * @brief Add one continuous variable per name and register them under key
         * @return The registered group
         */
        VarGroup& addContinuousVars(VarEnum key, const std::vector<std::string>& names,
                                    double lb, double ub)
        {
            auto& group = vars_[key];
            group.reserve(group.size() + names.size());
            for (const auto& n : names)
                group.push_back(model().addVar(lb, ub, 0.0, GRB_CONTINUOUS, n));
            return group;
        }

        /**
         * @brief Add a linear constraint and register it under key
         */
        GRBConstr addConstraint(ConEnum key, const GRBTempConstr& c, const std::string& name)
        {
            GRBConstr constr = model().addConstr(c, name);
            cons_[key].push_back(constr);
            return constr;
        }

        // -------------------------------------------------------------------------
        // Parameter configuration (tracked in store())
        // -------------------------------------------------------------------------

        template <typename Param, typename Val>
        void setParam(Param p, Val&& value)
        {
            model().set(p, std::forward<Val>(value));
        }

        /// @brief Solve deadline in seconds; tracked as "param:TimeLimit".
        void timeLimit(double seconds) {
            setParam(GRB_DoubleParam_TimeLimit, seconds);
            store_["param:TimeLimit"] = seconds;
        }

        /// @brief Thread count (0 = automatic); tracked as "param:Threads".
        void threads(int n) {
            setParam(GRB_IntParam_Threads, n);
            store_["param:Threads"] = n;
        }

        void quiet() {
            setParam(GRB_IntParam_OutputFlag, 0);
            store_["param:OutputFlag"] = 0;
        }

        // -------------------------------------------------------------------------
        // Objective helpers
        // -------------------------------------------------------------------------

        void maximize(const GRBLinExpr& expr) {
            model().setObjective(expr, GRB_MAXIMIZE);
        }

        // -------------------------------------------------------------------------
        // Solution status (objVal() and runtime() need optimize())
        // -------------------------------------------------------------------------

        /// @brief GRB_LOADED until the model has been built and solved.
        int status() const {
            if (!initialized_)
                return GRB_LOADED;
            return model().get(GRB_IntAttr_Status);
        }

        bool isOptimal() const {
            return status() == GRB_OPTIMAL;
        }

        /// @throws GRBException if no solution is available, std::logic_error before initialize()
        double objVal() const {
            return model().get(GRB_DoubleAttr_ObjVal);
        }

        double runtime() const {
            return model().get(GRB_DoubleAttr_Runtime);
        }

        // -------------------------------------------------------------------------
        // Template-method hooks
        // -------------------------------------------------------------------------

        /// @brief Environment parameters set before the license is checked out.
        virtual void configureEnvironment(GRBEnv& env) {}

        virtual void addParameters() {}
        virtual void addVariables() {}
        virtual void addConstraints() {}
        virtual void addObjective() {}
        virtual void beforeOptimize() {}
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Orchestration
        // -------------------------------------------------------------------------

        /**
         * @brief Build and solve the model
         *
         * @note Intended to be called once per builder; the hooks append to the
         *       model and the registries.
         */
        GRBModel& optimize()
        {
            initialize();

            addVariables();
            addConstraints();
            addParameters();
            addObjective();

            beforeOptimize();
            model().optimize();
            optimized_ = true;
            afterOptimize();

            return model();
        }
    };

} // namespace fabcap
