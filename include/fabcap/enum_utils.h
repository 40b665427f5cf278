#pragma once
/*
===============================================================================
ENUM UTILS - Compile-time enumeration helpers for the capacity planning engine
===============================================================================

OVERVIEW
--------
Strongly-typed enumerations with a COUNT sentinel, fixed-size arrays indexed
directly by those enumerations, and name tables for converting enumerators to
and from the strings used in fleet and CapEx datasets.

The engine uses these for every closed category it touches:

    * ToolStatus   (Active, Maintenance, Upgrade)
    * RiskLevel    (Low, Medium, High)     -> per-level risk weights
    * OptimizationStatus (Optimal, Failed)
    * LP variable / constraint registries of the portfolio builder

KEY COMPONENTS
--------------
• FABCAP_DECLARE_ENUM_WITH_COUNT: enum class + COUNT sentinel + size constant
• EnumArray<Enum, T>: std::array wrapper indexed by Enum instead of size_t
• EnumNames<Enum>: parallel name table with toString()/fromString()

USAGE EXAMPLES
--------------
    FABCAP_DECLARE_ENUM_WITH_COUNT(Shift, Day, Night);

    EnumArray<Shift, double> hours{12.0, 12.0};
    hours[Shift::Night] = 11.5;

    constexpr EnumNames<Shift> kShiftNames{"Day", "Night"};
    auto s = kShiftNames.fromString("Night");   // std::optional<Shift>

THREAD SAFETY
-------------
• No mutable shared state; all helpers are constexpr or value types

===============================================================================
*/

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

/**
 * @macro FABCAP_DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a trailing COUNT sentinel
 *
 * @param Name The name of the enumeration type
 * @param ...  Comma-separated list of enumerators (at least one)
 *
 * @details
 * Expands to:
 *   enum class Name { ..., COUNT };
 *   static constexpr std::size_t Name_COUNT = <number of enumerators>;
 *
 * @warning Do not define COUNT yourself; it is not a domain value.
 */
#define FABCAP_DECLARE_ENUM_WITH_COUNT(Name, ...)                         \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace fabcap {

/**
 * @brief Number of meaningful enumerators (COUNT excluded)
 */
template <typename Enum>
struct enum_size {
    static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
};

template <typename Enum>
inline constexpr std::size_t enum_size_v = enum_size<Enum>::value;

/**
 * @brief True if value names a real enumerator (not COUNT, not out of range)
 */
template <typename Enum>
constexpr bool is_valid_enum_value(Enum value) noexcept {
    return static_cast<std::size_t>(value) < enum_size_v<Enum>;
}

/**
 * @brief Position of an enumerator, suitable for array indexing
 */
template <typename Enum>
constexpr std::size_t enum_index(Enum value) noexcept {
    return static_cast<std::size_t>(value);
}

/**
 * @class EnumArray
 * @brief Fixed-size array with one slot per enumerator, indexed by the enum
 *
 * @details Aggregate over std::array so it can be brace-initialized in
 *          enumerator order:
 *
 *              EnumArray<RiskLevel, double> w{1.0, 1.3, 1.6};
 *              w[RiskLevel::High];   // 1.6
 *
 *          at() is bounds checked and throws std::out_of_range for COUNT or
 *          values cast from out-of-range integers.
 */
template <typename Enum, typename T>
struct EnumArray {
    std::array<T, enum_size_v<Enum>> values{};

    constexpr T& operator[](Enum e) noexcept { return values[enum_index(e)]; }
    constexpr const T& operator[](Enum e) const noexcept { return values[enum_index(e)]; }

    constexpr T& at(Enum e) { return values.at(enum_index(e)); }
    constexpr const T& at(Enum e) const { return values.at(enum_index(e)); }

    constexpr std::size_t size() const noexcept { return values.size(); }

    constexpr auto begin() noexcept { return values.begin(); }
    constexpr auto end() noexcept { return values.end(); }
    constexpr auto begin() const noexcept { return values.begin(); }
    constexpr auto end() const noexcept { return values.end(); }
};

/**
 * @class EnumNames
 * @brief Name table for an enumeration, in enumerator order
 *
 * @details Dataset columns such as status or risk level arrive as strings.
 *          fromString() performs an exact, case-sensitive match and returns
 *          std::nullopt for anything it does not know, leaving the decision
 *          (reject the row, map to a default) to the caller.
 */
template <typename Enum>
struct EnumNames {
    std::array<std::string_view, enum_size_v<Enum>> names;

    constexpr std::string_view toString(Enum e) const noexcept {
        return is_valid_enum_value(e) ? names[enum_index(e)] : std::string_view{"?"};
    }

    constexpr std::optional<Enum> fromString(std::string_view s) const noexcept {
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (names[i] == s)
                return static_cast<Enum>(i);
        }
        return std::nullopt;
    }
};

/**
 * @brief Invoke fn(e) for every enumerator in declaration order
 */
template <typename Enum, typename Fn>
constexpr void for_each_enum(Fn&& fn) {
    for (std::size_t i = 0; i < enum_size_v<Enum>; ++i) {
        fn(static_cast<Enum>(i));
    }
}

} // namespace fabcap
