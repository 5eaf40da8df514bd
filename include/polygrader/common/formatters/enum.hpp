#pragma once

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <fmt/format.h>

#include <concepts>
#include <optional>
#include <string_view>
#include <type_traits>

// NOLINTBEGIN(bugprone-macro-parentheses)
#define POLYGRADER_ENUM_NAME_CASE_IMPL(r, enum_t, ident)                                                               \
    case enum_t::ident:                                                                                                \
        return BOOST_PP_STRINGIZE(ident);

#define POLYGRADER_ENUM_PARSE_IMPL(r, enum_t, ident)                                                                   \
    if (name == BOOST_PP_STRINGIZE(ident)) {                                                                           \
        return enum_t::ident;                                                                                          \
    }
// NOLINTEND(bugprone-macro-parentheses)

/// Defines `enum_name(e)` and `parse_enum_name(std::type_identity<E>, str)` for a scoped enum.
/// Must be used in the namespace that declares the enum so that both are found by ADL.
/// The enumerator names are the stringized identifiers, so renaming an enumerator changes
/// its textual form everywhere (including exported result records).
///
/// Example:
///   enum class Color { Red, Green };
///   POLYGRADER_ENUM_NAMES(Color, Red, Green);
#define POLYGRADER_ENUM_NAMES(enum_t, ... /*enumerators*/)                                                            \
    [[maybe_unused]] constexpr std::string_view enum_name(enum_t value) noexcept {                                     \
        switch (value) {                                                                                               \
            BOOST_PP_SEQ_FOR_EACH(POLYGRADER_ENUM_NAME_CASE_IMPL, enum_t, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))       \
        }                                                                                                              \
        return "<unknown>";                                                                                            \
    }                                                                                                                  \
    [[maybe_unused]] constexpr std::optional<enum_t> parse_enum_name(std::type_identity<enum_t> /*unused*/,            \
                                                                     std::string_view name) noexcept {                \
        BOOST_PP_SEQ_FOR_EACH(POLYGRADER_ENUM_PARSE_IMPL, enum_t, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))               \
        return std::nullopt;                                                                                           \
    }                                                                                                                  \
    static_assert(true, "require trailing semicolon")

namespace polygrader {

template <typename Enum>
concept NamedEnum = std::is_enum_v<Enum> && requires(Enum value) {
    { enum_name(value) } -> std::convertible_to<std::string_view>;
};

/// Inverse of `enum_name`
template <NamedEnum Enum>
constexpr std::optional<Enum> enum_from_name(std::string_view name) noexcept {
    return parse_enum_name(std::type_identity<Enum>{}, name);
}

} // namespace polygrader

template <::polygrader::NamedEnum Enum>
struct fmt::formatter<Enum> : fmt::formatter<std::string_view>
{
    auto format(const Enum& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(enum_name(from), ctx);
    }
};
