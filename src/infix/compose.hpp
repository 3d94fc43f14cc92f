#pragma once

#include "./applicator.hpp"

#include <neo/concepts.hpp>
#include <neo/fwd.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace infix {

/**
 * @brief The composition of two callables. Calling it with `args...` returns
 * `outer(inner(args...))`.
 */
template <typename Outer, typename Inner>
class composed {
    Outer _outer;
    Inner _inner;

public:
    constexpr composed(Outer outer, Inner inner) noexcept(
        std::is_nothrow_move_constructible_v<Outer>&& std::is_nothrow_move_constructible_v<Inner>)
        : _outer(std::move(outer))
        , _inner(std::move(inner)) {}

    [[nodiscard]] constexpr const Outer& outer() const noexcept { return _outer; }
    [[nodiscard]] constexpr const Inner& inner() const noexcept { return _inner; }

    template <typename... Args>
    requires neo::invocable<const Inner&, Args...> &&
        neo::invocable<const Outer&, std::invoke_result_t<const Inner&, Args...>>  //
        constexpr decltype(auto) operator()(Args&&... args) const {
        return std::invoke(_outer, std::invoke(_inner, NEO_FWD(args)...));
    }
};

inline constexpr struct compose_fn {
    /**
     * Compose `outer` after `inner`. Both are decay-copied into the result.
     * Function names decay to function pointers.
     */
    template <typename Outer, typename Inner>
    [[nodiscard]] constexpr auto operator()(Outer&& outer, Inner&& inner) const {
        return composed<std::decay_t<Outer>, std::decay_t<Inner>>(NEO_FWD(outer), NEO_FWD(inner));
    }
} compose;

/**
 * @brief Infix function composition: `f | composer | g` is the function
 * `x -> f(g(x))`. Chains group to the left, so `f | composer | g | composer | h`
 * is `x -> f(g(h(x)))`.
 */
inline constexpr applicator<compose_fn> composer{compose};

}  // namespace infix
