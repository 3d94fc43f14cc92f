#pragma once

#include "./applicator.hpp"
#include "./error.hpp"
#include "./token.hpp"

#include <neo/concepts.hpp>
#include <neo/fwd.hpp>

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace infix {

namespace detail {

template <typename T>
struct reset_on_exit {
    std::optional<T>& slot;

    constexpr ~reset_on_exit() { slot.reset(); }
};

}  // namespace detail

/**
 * @brief An applicator that carries its pending left operand in itself.
 *
 * `left | op | right` is evaluated in the same two steps as for `applicator`,
 * but the left-bind step stores `left` into a slot of this object and returns
 * the object itself. The apply step then takes the operand back out of the
 * slot, empties it, and invokes the operation. If the slot is empty when the
 * apply step fires, `unbound_left_operand` is thrown.
 *
 * Only one expression may be in flight per instance. Two interleaved
 * evaluations that use the same instance will race on the slot. Prefer
 * `applicator` unless the pending state needs to be observable.
 *
 * @tparam Op The wrapped binary operation
 * @tparam Left The type stored in the pending slot
 * @tparam Token The host operator token
 */
template <typename Op, typename Left, operator_token Token = pipe_t>
class stateful_applicator {
    Op                  _op;
    std::optional<Left> _pending;

public:
    using _infix_operator_ = void;

    using operation_type = Op;
    using left_type      = Left;
    using token_type     = Token;

    constexpr explicit stateful_applicator(Op op) noexcept(std::is_nothrow_move_constructible_v<Op>)
        : _op(std::move(op)) {}

    stateful_applicator(const stateful_applicator&) = delete;
    stateful_applicator& operator=(const stateful_applicator&) = delete;

    [[nodiscard]] constexpr const Op& operation() const noexcept { return _op; }

    /// Whether a left operand has been bound and not yet consumed
    [[nodiscard]] constexpr bool has_pending() const noexcept { return _pending.has_value(); }

    /// Discard the pending left operand, if any
    constexpr void reset() noexcept { _pending.reset(); }

    /**
     * The left-bind step. Replaces any operand already pending.
     */
    template <plain_operand L>
    requires neo::convertible_to<L, Left>  //
        constexpr stateful_applicator& bind_left(L&& left) {
        _pending.emplace(NEO_FWD(left));
        return *this;
    }

    /**
     * The apply step. The slot is emptied before the operation runs, so it is
     * empty afterward whether or not taking the operand or the operation
     * throws. The left operand does not outlive this call, so the result is
     * returned by value even if the operation returns a reference.
     */
    template <plain_operand Right>
    requires neo::invocable<Op&, Left, Right>  //
        constexpr std::remove_cvref_t<std::invoke_result_t<Op&, Left, Right>>
        apply(Right&& right) {
        if (!_pending) {
            throw_unbound_left_operand<Token>();
        }
        std::optional<Left> left;
        {
            detail::reset_on_exit<Left> consume{_pending};
            left.emplace(std::move(*_pending));
        }
        return std::invoke(_op, std::move(*left), NEO_FWD(right));
    }
};

/// Create a `stateful_applicator` whose pending slot holds a `Left`
template <typename Left, operator_token Token = pipe_t, typename Op>
[[nodiscard]] constexpr stateful_applicator<std::decay_t<Op>, Left, Token>
make_stateful(Op&& op) {
    return stateful_applicator<std::decay_t<Op>, Left, Token>(NEO_FWD(op));
}

/**
 * Declare the operator hooks of the infix protocol for `stateful_applicator`
 * on one host token. Both hooks act on the applicator in place.
 */
#define INFIX_DECLARE_STATEFUL_OPERATOR_HOOKS(TokenType, Oper)                                     \
    template <::infix::plain_operand L, typename Op, typename Left>                                \
    requires neo::convertible_to<L, Left>                                                          \
    constexpr ::infix::stateful_applicator<Op, Left, TokenType>& operator Oper(                    \
        L&& left, ::infix::stateful_applicator<Op, Left, TokenType>& app) {                        \
        return app.bind_left(NEO_FWD(left));                                                       \
    }                                                                                              \
    template <typename Op, typename Left, ::infix::plain_operand Right>                            \
    requires neo::invocable<Op&, Left, Right>                                                      \
    constexpr decltype(auto) operator Oper(::infix::stateful_applicator<Op, Left, TokenType>& app, \
                                           Right&& right) {                                        \
        return app.apply(NEO_FWD(right));                                                          \
    }                                                                                              \
    static_assert(true)

INFIX_DECLARE_STATEFUL_OPERATOR_HOOKS(pipe_t, |);
INFIX_DECLARE_STATEFUL_OPERATOR_HOOKS(star_t, *);
INFIX_DECLARE_STATEFUL_OPERATOR_HOOKS(percent_t, %);
INFIX_DECLARE_STATEFUL_OPERATOR_HOOKS(caret_t, ^);

}  // namespace infix
