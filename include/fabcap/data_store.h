#pragma once
/*
===============================================================================
DATA STORE - Typed run annotations attached to solver-backed analyses
===============================================================================

OVERVIEW
--------
A string-keyed map of type-erased values. The portfolio builder records in it
every solver parameter it applies ("param:TimeLimit", "param:Threads", ...)
together with problem facts ("n_projects", "budget_usd") and solve facts
("solver_status", "runtime_s"). Reports and tests read them back without the
builder having to grow an accessor per fact.

KEY COMPONENTS
--------------
• Value: std::any wrapper with is<T>(), try_get<T>(), get<T>(), get_or<T>()
• DataStore: std::unordered_map<std::string, Value>

USAGE EXAMPLES
--------------
    DataStore notes;
    notes["budget_usd"] = 1.5e9;
    notes["solver_status"] = std::string("OPTIMAL");

    double budget = notes["budget_usd"].get<double>();
    int threads   = notes["param:Threads"].get_or<int>(0);   // absent -> 0

EXCEPTION SAFETY
----------------
• get<T>() throws std::bad_any_cast on type mismatch or empty value
• get_or<T>() and try_get<T>() never throw on mismatch

THREAD SAFETY
-------------
• Not synchronized; a store belongs to one builder on one thread

===============================================================================
*/

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace fabcap {

/**
 * @class Value
 * @brief Type-erased annotation value
 *
 * @note Types are matched exactly: a value stored as int is not readable as
 *       double. Store doubles as doubles ("1.0", not "1").
 */
class Value
{
    std::any storage_;

public:
    Value() = default;

    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Value>>>
    Value(T&& v)
        : storage_(std::forward<T>(v))
    {
    }

    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Value>>>
    Value& operator=(T&& v)
    {
        storage_ = std::forward<T>(v);
        return *this;
    }

    bool has_value() const noexcept { return storage_.has_value(); }

    const std::type_info& type() const noexcept { return storage_.type(); }

    /// @brief Exact type check; false when empty.
    template <typename T>
    bool is() const noexcept
    {
        return storage_.type() == typeid(T);
    }

    /**
     * @brief Reference to the stored value if it has type T
     * @return std::nullopt on mismatch or when empty
     */
    template <typename T>
    std::optional<std::reference_wrapper<const T>> try_get() const noexcept
    {
        if (!is<T>())
            return std::nullopt;
        return std::cref(*std::any_cast<T>(&storage_));
    }

    /// @throws std::bad_any_cast on mismatch
    template <typename T>
    const T& get() const
    {
        return std::any_cast<const T&>(storage_);
    }

    /// @throws std::bad_any_cast on mismatch
    template <typename T>
    T& get()
    {
        return std::any_cast<T&>(storage_);
    }

    /// @brief Stored value, or fallback when empty or of another type.
    template <typename T>
    T get_or(const T& fallback) const
    {
        if (is<T>())
            return get<T>();
        return fallback;
    }

    void reset() noexcept { storage_.reset(); }
};

/**
 * @typedef DataStore
 * @brief Annotation map; keys are case-sensitive
 */
using DataStore = std::unordered_map<std::string, Value>;

} // namespace fabcap
