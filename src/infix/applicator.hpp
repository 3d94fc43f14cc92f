#pragma once

#include "./token.hpp"

#include <neo/concepts.hpp>
#include <neo/fwd.hpp>

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace infix {

// clang-format off
/**
 * @brief Match the types that play the operator role in an infix expression
 * (applicators and their bound intermediates). These are never accepted as
 * the operands of an infix expression.
 */
template <typename T>
concept infix_operator_like = requires {
    typename std::remove_cvref_t<T>::_infix_operator_;
};

/**
 * @brief Match the types that may appear as the left or right operand of an
 * infix expression.
 */
template <typename T>
concept plain_operand = !infix_operator_like<T>;
// clang-format on

/**
 * @brief The intermediate value produced by the left-bind step of
 * `left | op | right`.
 *
 * Refers to the operation of the applicator that made it and holds a
 * decay-copy of the left operand. The apply step consumes it. The applicator
 * itself is never written, so one applicator can be used by any number of
 * (possibly nested or concurrent) expressions.
 *
 * A `bound_left` that is kept by the caller is a left section: a unary
 * callable that applies the operation with its stored left operand. A section
 * owns its left operand but must not outlive its applicator.
 *
 * @tparam Op The wrapped binary operation. `const`-qualified when bound from
 * a `const` applicator, in which case the operation is invoked as `const`.
 * @tparam Left The decayed type of the left operand
 * @tparam Token The host operator token
 */
template <typename Op, typename Left, operator_token Token>
class bound_left {
    Op*  _op;
    Left _left;

public:
    using _infix_operator_ = void;

    using operation_type = Op;
    using left_type      = Left;
    using token_type     = Token;

    constexpr bound_left(Op& op, Left left) noexcept(std::is_nothrow_move_constructible_v<Left>)
        : _op(std::addressof(op))
        , _left(std::move(left)) {}

    [[nodiscard]] constexpr Op&         operation() const noexcept { return *_op; }
    [[nodiscard]] constexpr const Left& left() const& noexcept { return _left; }
    [[nodiscard]] constexpr Left&&      left() && noexcept { return std::move(_left); }

    /**
     * The apply step. Invokes the operation with the stored left operand and
     * `right`, returning whatever the operation returns.
     */
    template <plain_operand Right>
    requires neo::invocable<Op&, Left, Right>  //
        constexpr decltype(auto) apply(Right&& right) && {
        return std::invoke(*_op, std::move(_left), NEO_FWD(right));
    }

    template <plain_operand Right>
    requires neo::invocable<Op&, const Left&, Right>  //
        constexpr decltype(auto) apply(Right&& right) const& {
        return std::invoke(*_op, _left, NEO_FWD(right));
    }

    template <plain_operand Right>
    requires neo::invocable<Op&, Left, Right>  //
        constexpr decltype(auto) operator()(Right&& right) && {
        return std::move(*this).apply(NEO_FWD(right));
    }

    template <plain_operand Right>
    requires neo::invocable<Op&, const Left&, Right>  //
        constexpr decltype(auto) operator()(Right&& right) const& {
        return apply(NEO_FWD(right));
    }
};

/**
 * @brief Adapt a two-argument callable to be written between its operands:
 * `left | op | right` evaluates to `op(left, right)`.
 *
 * The expression is evaluated in two steps by the host operator's own
 * left-to-right grouping. `left | op` finds no overload on `left`'s side and
 * selects the reflected hook below, which returns a `bound_left`. The
 * following `| right` selects the forward hook on that `bound_left`, which
 * performs the call.
 *
 * The applicator itself is never modified. Binding from a `const` applicator
 * invokes the operation as `const`, and such an applicator may be shared
 * between threads if its operation's `const` call may. Binding from a
 * non-`const` applicator invokes the operation as non-`const`, which admits
 * `mutable` callables but not concurrent use.
 *
 * @tparam Op The wrapped binary operation
 * @tparam Token The host operator token. Precedence and associativity are
 * those of the token's operator.
 */
template <typename Op, operator_token Token = pipe_t>
class applicator {
    Op _op;

public:
    using _infix_operator_ = void;

    using operation_type = Op;
    using token_type     = Token;

    /// The intermediate type produced by binding a left operand of type `Left`
    template <typename Left>
    using bound_type = bound_left<const Op, std::decay_t<Left>, Token>;

    template <typename Left>
    using mutable_bound_type = bound_left<Op, std::decay_t<Left>, Token>;

    constexpr applicator() requires std::default_initializable<Op>
    = default;

    constexpr explicit applicator(Op op) noexcept(std::is_nothrow_move_constructible_v<Op>)
        : _op(std::move(op)) {}

    [[nodiscard]] constexpr const Op& operation() const noexcept { return _op; }
    [[nodiscard]] constexpr Op&       operation() noexcept { return _op; }

    /**
     * The left-bind step. `op.bind_left(a).apply(b)` is the spelled-out
     * equivalent of `a | op | b`.
     */
    template <plain_operand Left>
    [[nodiscard]] constexpr bound_type<Left> bind_left(Left&& left) const
        requires std::constructible_from<std::decay_t<Left>, Left> {
        return bound_type<Left>(_op, NEO_FWD(left));
    }

    template <plain_operand Left>
    [[nodiscard]] constexpr mutable_bound_type<Left> bind_left(Left&& left)
        requires std::constructible_from<std::decay_t<Left>, Left> {
        return mutable_bound_type<Left>(_op, NEO_FWD(left));
    }
};

template <typename Op>
applicator(Op) -> applicator<Op>;

namespace detail {

template <typename T>
inline constexpr bool is_applicator_v = false;

template <typename Op, operator_token Token>
inline constexpr bool is_applicator_v<applicator<Op, Token>> = true;

}  // namespace detail

// clang-format off
/**
 * @brief Match (cvref-qualified) applicators bound to the host token `Token`
 */
template <typename App, typename Token>
concept applicator_of =
    detail::is_applicator_v<std::remove_cvref_t<App>> &&
    neo::same_as<typename std::remove_cvref_t<App>::token_type, Token>;

/**
 * @brief Match an applicator `App` that can bind a left operand of type `Left`
 */
template <typename App, typename Left>
concept left_bindable = requires(std::remove_reference_t<App>& app, Left&& left) {
    app.bind_left(NEO_FWD(left));
};
// clang-format on

/**
 * @brief Create an applicator for `op` that is bound to the given host
 * operator token.
 */
template <operator_token Token = pipe_t, typename Op>
[[nodiscard]] constexpr applicator<std::decay_t<Op>, Token> make_applicator(Op&& op) {
    return applicator<std::decay_t<Op>, Token>(NEO_FWD(op));
}

template <operator_token Token, typename Op>
[[nodiscard]] constexpr applicator<std::decay_t<Op>, Token> make_applicator(Token, Op&& op) {
    return applicator<std::decay_t<Op>, Token>(NEO_FWD(op));
}

/**
 * Declare the operator hooks of the infix protocol for one host token:
 *
 * - The reflected hook `left OP applicator`, which binds the left operand.
 * - The forward hook `bound OP right`, which applies the operation.
 * - A deleted forward hook `applicator OP right`, so that using the operator
 *   without a left operand does not compile.
 */
#define INFIX_DECLARE_OPERATOR_HOOKS(TokenType, Oper)                                              \
    template <::infix::plain_operand Left, ::infix::applicator_of<TokenType> App>                  \
    [[nodiscard]] constexpr auto operator Oper(Left&& left, App&& app)                             \
        requires ::infix::left_bindable<App, Left> {                                               \
        return app.bind_left(NEO_FWD(left));                                                       \
    }                                                                                              \
    template <typename Op, typename Left, ::infix::plain_operand Right>                            \
    requires neo::invocable<Op&, Left, Right>                                                      \
    constexpr decltype(auto) operator Oper(::infix::bound_left<Op, Left, TokenType>&& bound,       \
                                           Right&&                                    right) {     \
        return std::move(bound).apply(NEO_FWD(right));                                             \
    }                                                                                              \
    template <typename Op, typename Left, ::infix::plain_operand Right>                            \
    requires neo::invocable<Op&, const Left&, Right>                                               \
    constexpr decltype(auto) operator Oper(const ::infix::bound_left<Op, Left, TokenType>& bound,  \
                                           Right&&                                         right) { \
        return bound.apply(NEO_FWD(right));                                                        \
    }                                                                                              \
    template <typename Op, typename Right>                                                         \
    void operator Oper(const ::infix::applicator<Op, TokenType>&, Right&&) = delete

INFIX_DECLARE_OPERATOR_HOOKS(pipe_t, |);
INFIX_DECLARE_OPERATOR_HOOKS(star_t, *);
INFIX_DECLARE_OPERATOR_HOOKS(percent_t, %);
INFIX_DECLARE_OPERATOR_HOOKS(caret_t, ^);

}  // namespace infix
