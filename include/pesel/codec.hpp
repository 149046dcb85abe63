/**
 * @file codec.hpp
 * @brief PESEL parsing and generation.
 *
 * Both directions are pure functions: parse() validates a candidate string
 * and generate() builds a number from a birth date and sex. Failures are
 * returned as error codes, never thrown.
 */

#ifndef PESEL_CODEC_HPP
#define PESEL_CODEC_HPP

#include <random>
#include <string_view>

#include "config.hpp"
#include "error.hpp"
#include "pesel.hpp"
#include "result.hpp"

namespace pesel {

/**
 * @brief Parse and validate a PESEL.
 *
 * Checks are applied in this order, the first failure wins:
 * length, digits only, month/century, date, checksum.
 *
 * @param text Candidate number
 * @return Validated PESEL, or the failing check's ParseError
 */
Result<Pesel, ParseError> parse(std::string_view text) noexcept;

/**
 * @brief Check whether @p text is a valid PESEL.
 */
inline bool is_valid(std::string_view text) noexcept {
    return parse(text).ok();
}

/**
 * @brief Generate a PESEL with the default filler block.
 *
 * Digits 7-9 are zero and the sex digit is 1 (male) or 0 (female), so the
 * output depends only on the arguments.
 *
 * @param year Birth year, 1800-2299
 * @param month Birth month, 1-12
 * @param day Birth day, valid for (year, month)
 * @param sex Encoded into the parity of digit 10
 * @return Generated PESEL, or the failing check's GenerationError
 */
Result<Pesel, GenerationError> generate(int year, int month, int day, Sex sex) noexcept;

/**
 * @brief Generate a PESEL with an explicit sequence number.
 *
 * @param serial Sequence number for digits 7-9, 0-999
 * @return Generated PESEL; GenerationError::InvalidSerial if @p serial is
 *         out of range
 */
Result<Pesel, GenerationError> generate(int year, int month, int day, Sex sex,
                                        int serial) noexcept;

/**
 * @brief Generate a PESEL with a random filler block.
 *
 * Digits 7-9 are uniform over 000-999 and the sex digit is uniform over the
 * five digits of the requested parity.
 *
 * @tparam URBG Uniform random bit generator, e.g. std::mt19937
 * @param rng Caller-owned engine
 */
template <typename URBG>
Result<Pesel, GenerationError> generate_random(int year, int month, int day, Sex sex,
                                               URBG& rng) {
    std::uniform_int_distribution<int> serial_dist(0, MAX_SERIAL);
    std::uniform_int_distribution<int> half_dist(0, 4);

    int serial = serial_dist(rng);
    int sex_digit = 2 * half_dist(rng) + static_cast<int>(sex);

    return detail::assemble(year, month, day, serial, sex_digit);
}

namespace detail {

/**
 * @brief Validate the inputs and lay out the 11 digits.
 *
 * @param serial Digits 7-9, 0-999
 * @param sex_digit Digit 10, 0-9
 */
Result<Pesel, GenerationError> assemble(int year, int month, int day, int serial,
                                        int sex_digit) noexcept;

} // namespace detail

} // namespace pesel

#endif // PESEL_CODEC_HPP
