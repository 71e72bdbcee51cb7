/// @file value.hpp
/// @brief ScalarValue: the closed set of values a change record can carry.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ledgersync {

/// Represents a null cell value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A closed set of primitive values stored in a cell.
///
/// Alternatives: Null, bool, int64_t, double, string (UTF-8).
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    double,
    std::string
>;

/// Kinds of value a declared column holds.
enum class ValueKind : std::uint8_t {
    boolean,
    integer,
    real,
    text,
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::boolean: return "boolean";
        case ValueKind::integer: return "integer";
        case ValueKind::real:    return "real";
        case ValueKind::text:    return "text";
    }
    return "unknown";
}

/// Check if a value is Null.
inline auto is_null(const ScalarValue& v) -> bool {
    return std::holds_alternative<Null>(v);
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { use(s); },
///     [](std::int64_t i) { use(i); },
///     [](auto&&) {},
/// }, value);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed scalar extraction helpers ------------------------------------------

/// Extract a typed scalar, or nullopt on type mismatch.
/// @code
/// auto amount = get_scalar<std::int64_t>(value);
/// @endcode
template <typename T>
auto get_scalar(const ScalarValue& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v)) {
        return *t;
    }
    return std::nullopt;
}

/// Extract a typed scalar from an optional<ScalarValue>.
template <typename T>
auto get_scalar(const std::optional<ScalarValue>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_scalar<T>(*v);
}

/// Interpret a stored flag. SQLite-backed stores hand booleans back as
/// integers, so both representations are accepted.
inline auto truthy(const ScalarValue& v) -> bool {
    return std::visit(overload{
        [](Null) { return false; },
        [](bool b) { return b; },
        [](std::int64_t i) { return i != 0; },
        [](double d) { return d != 0.0; },
        [](const std::string& s) { return !s.empty(); },
    }, v);
}

}  // namespace ledgersync
