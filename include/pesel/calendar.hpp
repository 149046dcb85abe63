/**
 * @file calendar.hpp
 * @brief Gregorian calendar rules used to validate birth dates.
 */

#ifndef PESEL_CALENDAR_HPP
#define PESEL_CALENDAR_HPP

#include "config.hpp"

namespace pesel {

/**
 * @brief Gregorian leap year test.
 *
 * Divisible by 4, except centuries, unless also divisible by 400.
 *
 * @param year Calendar year
 * @return true if February has 29 days in @p year
 */
constexpr bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/**
 * @brief Number of days in a month.
 *
 * @param year Calendar year (for February)
 * @param month Month 1-12
 * @return Days in month, or 0 if @p month is out of range
 */
constexpr int days_in_month(int year, int month) noexcept {
    switch (month) {
    case 1:
    case 3:
    case 5:
    case 7:
    case 8:
    case 10:
    case 12:
        return 31;
    case 4:
    case 6:
    case 9:
    case 11:
        return 30;
    case 2:
        return is_leap_year(year) ? 29 : 28;
    default:
        return 0;
    }
}

/**
 * @brief Check that (year, month, day) names an existing date.
 */
constexpr bool is_valid_date(int year, int month, int day) noexcept {
    return day >= 1 && day <= days_in_month(year, month);
}

} // namespace pesel

#endif // PESEL_CALENDAR_HPP
