#pragma once
/*
===============================================================================
ERRORS - Exception taxonomy for capacity planning runs
===============================================================================

Overview
--------
Two failure categories are raised as exceptions because a silently coerced
value would end up as a misleading figure in an executive report:

    * DataError     missing or empty required table, invalid record values,
                    tool type rejected by the process-step table
    * NumericError  a denominator that must be non-zero is zero (effective
                    capacity, theoretical MTBF, operating hours, baseline
                    capacity)

Solver failures are NOT exceptions. Portfolio infeasibility is a business
outcome and is reported through OptimizationResult (see
portfolio_optimizer.h). Invalid call parameters (negative target output,
zero trials) throw std::invalid_argument.

Messages follow the "function: reason" convention used across the engine so
a failure can be traced to the analysis that raised it.

===============================================================================
*/

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace fabcap {

/// Base class of every engine exception.
class PlanningError : public std::runtime_error {
public:
    explicit PlanningError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

/// Missing/empty table or invalid record contents.
class DataError : public PlanningError {
public:
    explicit DataError(std::string msg) : PlanningError(std::move(msg)) {}
};

/// Division by a zero denominator.
class NumericError : public PlanningError {
public:
    explicit NumericError(std::string msg) : PlanningError(std::move(msg)) {}
};

/**
 * @brief Divide, raising NumericError instead of producing inf/NaN
 *
 * @param numerator   Dividend
 * @param denominator Divisor; must be finite and non-zero
 * @param what        Context prefix for the message ("analyzeBottlenecks: effective capacity of CMP")
 *
 * @throws NumericError if denominator is zero or not finite
 */
inline double checkedDivide(double numerator, double denominator, const std::string& what) {
    if (denominator == 0.0 || !std::isfinite(denominator)) {
        throw NumericError(what + " is zero");
    }
    return numerator / denominator;
}

/**
 * @brief Throw DataError(what) when a required table is empty
 */
template <typename Container>
void requireNonEmpty(const Container& table, const std::string& what) {
    if (table.empty()) {
        throw DataError(what + " is empty");
    }
}

} // namespace fabcap
