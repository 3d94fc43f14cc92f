#pragma once

#include "./token.hpp"

#include <neo/ufmt.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace infix {

/**
 * Thrown when the apply step of an infix expression fires on an applicator
 * that has no pending left operand, e.g. when the operator is used with only
 * a right-hand operand.
 */
class unbound_left_operand : public std::logic_error {
    std::string _spelling;

public:
    explicit unbound_left_operand(std::string_view spelling)
        : std::logic_error(
            neo::ufmt("Infix operator '{}' was applied without a bound left operand "
                      "(expected `left {} op {} right`)",
                      spelling,
                      spelling,
                      spelling))
        , _spelling(std::string(spelling)) {}

    /// The spelling of the host operator that was misused
    [[nodiscard]] std::string_view spelling() const noexcept { return _spelling; }
};

template <operator_token Token>
[[noreturn]] void throw_unbound_left_operand() {
    throw unbound_left_operand(spelling_of<Token>);
}

}  // namespace infix
