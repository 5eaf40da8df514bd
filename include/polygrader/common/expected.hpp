#pragma once

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace polygrader {

/**
 * @brief std::variant wrapper for the subset of C++23's std::expected that we need
 *
 * @tparam T The expected value type (may be void)
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another, as construction
 * from either is implicit.
 */
template <typename T = void, typename E = std::error_code>
class [[nodiscard]] Expected
{
    using StoredT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ValueT = T;
    using ErrorT = E;

    Expected()
        requires(std::is_void_v<T> || std::default_initializable<T>)
        : data_{std::in_place_index<0>} {}

    template <typename Tu>
        requires(!std::is_void_v<T> && !std::same_as<std::remove_cvref_t<Tu>, Expected> &&
                 std::convertible_to<Tu, StoredT> && !std::convertible_to<Tu, E>)
    Expected(Tu&& value) // NOLINT(*-explicit-*)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
        requires(!std::same_as<std::remove_cvref_t<Eu>, Expected> && std::convertible_to<Eu, E> &&
                 !std::convertible_to<Eu, StoredT>)
    Expected(Eu&& error) // NOLINT(*-explicit-*)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    bool has_value() const noexcept { return data_.index() == 0; }

    bool has_error() const noexcept { return !has_value(); }

    explicit operator bool() const noexcept { return has_value(); }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    U& value() & {
        ASSERT(has_value(), "value() called on an erroneous Expected");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    const U& value() const& {
        ASSERT(has_value(), "value() called on an erroneous Expected");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    U&& value() && {
        ASSERT(has_value(), "value() called on an erroneous Expected");
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
        requires(std::is_void_v<U>)
    void value() const {
        ASSERT(has_value(), "value() called on an erroneous Expected");
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    U& operator*() & {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    const U& operator*() const& {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    U* operator->() {
        return &value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    const U* operator->() const {
        return &value();
    }

    template <typename Tu>
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    T value_or(Tu&& default_value) const& {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    const E& error() const {
        ASSERT(has_error(), "error() called on an Expected holding a value");
        return std::get<1>(data_);
    }

    bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<E> && std::equality_comparable<StoredT>)
    = default;

    template <typename Eu>
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E>)
    bool operator==(const Eu& rhs) const {
        return has_error() && error() == rhs;
    }

private:
    std::variant<StoredT, E> data_;
};

} // namespace polygrader

template <typename T, typename E>
struct fmt::formatter<::polygrader::Expected<T, E>> : fmt::formatter<std::string_view>
{
    auto format(const ::polygrader::Expected<T, E>& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(format_impl(from), ctx);
    }

private:
    static std::string format_impl(const ::polygrader::Expected<T, E>& from) {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format("Error({})", from.error());
            } else {
                return "Error(<unformattable>)";
            }
        }

        if constexpr (std::is_void_v<T>) {
            return "Expected(void)";
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("Expected({})", from.value());
        } else {
            return "Expected(<unformattable>)";
        }
    }
};
