#pragma once
/*
===============================================================================
EXPRESSIONS - Linear expression builders over project/tool index ranges
===============================================================================

    GRBLinExpr npv = fabcap::sum(projects.size(), [&](std::size_t i) {
        return projects[i].npvUsd * X[i];
    });

    GRBLinExpr spend = fabcap::dot(investment, X);

===============================================================================
*/

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

namespace fabcap {

    /**
     * @brief sum_{i in [0, n)} func(i)
     *
     * @tparam Func Callable f(std::size_t) returning GRBVar, GRBLinExpr or double
     */
    template <typename Func>
    GRBLinExpr sum(std::size_t n, Func&& func) {
        GRBLinExpr expr = 0.0;
        for (std::size_t i = 0; i < n; ++i)
            expr += func(i);
        return expr;
    }

    /**
     * @brief sum_i coeffs[i] * vars[i]
     *
     * @throws std::invalid_argument if the sizes differ
     */
    inline GRBLinExpr dot(const std::vector<double>& coeffs, const std::vector<GRBVar>& vars) {
        if (coeffs.size() != vars.size())
            throw std::invalid_argument("dot: " + std::to_string(coeffs.size()) + " coefficients for " +
                                        std::to_string(vars.size()) + " variables");
        GRBLinExpr expr = 0.0;
        expr.addTerms(coeffs.data(), vars.data(), static_cast<int>(vars.size()));
        return expr;
    }

} // namespace fabcap
