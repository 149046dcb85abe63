/**
 * @file century.hpp
 * @brief PESEL century encoding.
 *
 * A PESEL stores only the last two digits of the birth year. The century
 * is carried by the month field, which is shifted by a per-century offset:
 *
 * | Years     | Offset | Month field |
 * |-----------|--------|-------------|
 * | 1800-1899 | 80     | 81-92       |
 * | 1900-1999 | 0      | 01-12       |
 * | 2000-2099 | 20     | 21-32       |
 * | 2100-2199 | 40     | 41-52       |
 * | 2200-2299 | 60     | 61-72       |
 */

#ifndef PESEL_CENTURY_HPP
#define PESEL_CENTURY_HPP

#include <array>
#include <optional>

#include "config.hpp"

namespace pesel {

/**
 * @brief One row of the century table.
 */
struct CenturyBucket {
    int first_year;   ///< First year of the century, e.g. 1900
    int month_offset; ///< Added to the calendar month when encoding
};

/// Century table, ordered by year
inline constexpr std::array<CenturyBucket, 5> CENTURY_TABLE = {{
    {1800, 80},
    {1900, 0},
    {2000, 20},
    {2100, 40},
    {2200, 60},
}};

/**
 * @brief Month offset for a birth year.
 *
 * @param year Calendar year
 * @return Offset to add to the month, or std::nullopt if @p year is
 *         outside MIN_YEAR..MAX_YEAR
 */
constexpr std::optional<int> month_offset_for_year(int year) noexcept {
    for (const auto& bucket : CENTURY_TABLE) {
        if (year >= bucket.first_year && year < bucket.first_year + 100) {
            return bucket.month_offset;
        }
    }
    return std::nullopt;
}

/**
 * @brief Encoded (year, month) pair recovered from a PESEL.
 */
struct DecodedBirthMonth {
    int year;
    int month;
};

/**
 * @brief Resolve the full year and calendar month from the encoded fields.
 *
 * Every bucket is tried; the offsets are 20 apart and months span 12, so
 * at most one bucket leaves the month in 1-12.
 *
 * @param year_literal Digits 1-2 (0-99)
 * @param encoded_month Digits 3-4 (0-99)
 * @return Decoded pair, or std::nullopt if no bucket matches
 */
constexpr std::optional<DecodedBirthMonth> decode_birth_month(int year_literal,
                                                              int encoded_month) noexcept {
    for (const auto& bucket : CENTURY_TABLE) {
        int month = encoded_month - bucket.month_offset;
        if (month >= 1 && month <= 12) {
            return DecodedBirthMonth{bucket.first_year + year_literal, month};
        }
    }
    return std::nullopt;
}

} // namespace pesel

#endif // PESEL_CENTURY_HPP
