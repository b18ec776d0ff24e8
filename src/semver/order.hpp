#pragma once

namespace semver {

/**
 * @brief The result of a three-way comparison between two semver entities.
 */
enum class order {
    less,
    equivalent,
    greater,
};

/// Reverse the sense of an ordering, as if the operands had been swapped
constexpr order reverse(order o) noexcept {
    if (o == order::less) {
        return order::greater;
    } else if (o == order::greater) {
        return order::less;
    }
    return order::equivalent;
}

}  // namespace semver
