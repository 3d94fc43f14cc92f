#pragma once

#include <concepts>
#include <string_view>
#include <type_traits>

namespace infix {

/**
 * @brief Access information about the host operator token `Token`
 *
 * Each token type is an empty tag naming one of the language's existing
 * left-associative binary operators. An applicator bound to a token inherits
 * that operator's precedence and associativity unchanged.
 *
 * @tparam Token
 */
template <typename Token>
struct token_traits {
    using _is_default_definition_ = void;
};

/// `left | op | right`
constexpr inline struct pipe_t {
} pipe_token;

/// `left * op * right`
constexpr inline struct star_t {
} star_token;

/// `left % op % right`
constexpr inline struct percent_t {
} percent_token;

/// `left ^ op ^ right`
constexpr inline struct caret_t {
} caret_token;

template <>
struct token_traits<pipe_t> {
    static constexpr std::string_view spelling = "|";
};

template <>
struct token_traits<star_t> {
    static constexpr std::string_view spelling = "*";
};

template <>
struct token_traits<percent_t> {
    static constexpr std::string_view spelling = "%";
};

template <>
struct token_traits<caret_t> {
    static constexpr std::string_view spelling = "^";
};

// clang-format off
/**
 * @brief Match the tag types that name a supported host operator
 */
template <typename Token>
concept operator_token =
    std::is_empty_v<Token> &&
    !requires { typename token_traits<Token>::_is_default_definition_; } &&
    requires {
        { token_traits<Token>::spelling } -> std::convertible_to<std::string_view>;
    };
// clang-format on

/// The source spelling of the given token
template <operator_token Token>
inline constexpr std::string_view spelling_of = token_traits<Token>::spelling;

}  // namespace infix
