/**
 * @file checksum.hpp
 * @brief PESEL check digit.
 *
 * Digits 1-10 are multiplied by the weights 1,3,7,9,1,3,7,9,1,3 and summed.
 * The check digit is (10 - sum mod 10) mod 10. Every weight is coprime with
 * 10, so any single-digit change alters the check digit.
 */

#ifndef PESEL_CHECKSUM_HPP
#define PESEL_CHECKSUM_HPP

#include <array>
#include <string_view>

#include "config.hpp"

namespace pesel {

/// Positional weights for digits 1-10
inline constexpr std::array<int, PAYLOAD_LENGTH> CHECKSUM_WEIGHTS = {1, 3, 7, 9, 1,
                                                                     3, 7, 9, 1, 3};

/**
 * @brief Compute the check digit.
 *
 * @param digits At least PAYLOAD_LENGTH ASCII digits; only the first
 *               PAYLOAD_LENGTH are read
 * @return Check digit 0-9
 */
constexpr int compute_check_digit(std::string_view digits) noexcept {
    int sum = 0;
    for (std::size_t i = 0; i < PAYLOAD_LENGTH; ++i) {
        sum += CHECKSUM_WEIGHTS[i] * (digits[i] - '0');
    }
    return (10 - sum % 10) % 10;
}

/**
 * @brief Check that the 11th digit matches digits 1-10.
 *
 * @param digits Exactly PESEL_LENGTH ASCII digits
 */
constexpr bool has_valid_checksum(std::string_view digits) noexcept {
    return compute_check_digit(digits) == digits[PAYLOAD_LENGTH] - '0';
}

} // namespace pesel

#endif // PESEL_CHECKSUM_HPP
