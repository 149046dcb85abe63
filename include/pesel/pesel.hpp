/**
 * @file pesel.hpp
 * @brief Validated PESEL value type.
 *
 * Layout of the 11 digits:
 *
 *     Y Y M M D D S S S X C
 *     | | | | | | | | | | +-- check digit
 *     | | | | | | | | | +---- sex digit (odd = male, even = female)
 *     | | | | | | +-+-+------ sequence number
 *     | | | | +-+------------ day of birth
 *     | | +-+---------------- month of birth plus century offset
 *     +-+-------------------- last two digits of the year of birth
 */

#ifndef PESEL_PESEL_HPP
#define PESEL_PESEL_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

#include "config.hpp"
#include "error.hpp"
#include "result.hpp"

namespace pesel {

/**
 * @brief Sex encoded in the parity of the 10th digit.
 */
enum class Sex {
    Female = 0, ///< Even sex digit
    Male = 1    ///< Odd sex digit
};

/**
 * @brief Lowercase English name of a sex ("male" / "female").
 */
inline const char* sex_name(Sex sex) noexcept {
    return sex == Sex::Male ? "male" : "female";
}

class Pesel;

namespace detail {
Result<Pesel, GenerationError> assemble(int year, int month, int day, int serial,
                                        int sex_digit) noexcept;
} // namespace detail

Result<Pesel, ParseError> parse(std::string_view text) noexcept;

/**
 * @brief An immutable, validated PESEL.
 *
 * Instances are only created by parse() and the generate() family, so the
 * digits always carry a valid date in 1800-2299 and a matching check digit.
 * There are no setters; copies compare equal.
 */
class Pesel {
public:
    using Digits = std::array<char, PESEL_LENGTH>;

#if !PESEL_NO_EXCEPTIONS
    /**
     * @brief Parse a PESEL, throwing on failure.
     *
     * @param text Candidate number
     * @return Validated PESEL
     * @throws ParseException with the failing check's code
     */
    static Pesel from_string(std::string_view text);

    /**
     * @brief Generate a PESEL with the default filler, throwing on failure.
     *
     * @throws GenerationException with the failing check's code
     */
    static Pesel generate_or_throw(int year, int month, int day, Sex sex);
#endif

    /// Canonical form: the 11 digits, no separators
    [[nodiscard]] std::string to_string() const {
        return std::string(digits_.data(), digits_.size());
    }

    /// The 11 digits as a view into this object
    [[nodiscard]] std::string_view digits() const noexcept {
        return std::string_view(digits_.data(), digits_.size());
    }

    /// Single digit value at 0-based @p index (0-10)
    [[nodiscard]] int digit(std::size_t index) const noexcept {
        return digits_[index] - '0';
    }

    [[nodiscard]] int year() const noexcept {
        return year_;
    }

    [[nodiscard]] int month() const noexcept {
        return month_;
    }

    [[nodiscard]] int day() const noexcept {
        return day_;
    }

    [[nodiscard]] Sex sex() const noexcept {
        return (digit(9) % 2 != 0) ? Sex::Male : Sex::Female;
    }

    [[nodiscard]] bool is_male() const noexcept {
        return sex() == Sex::Male;
    }

    [[nodiscard]] bool is_female() const noexcept {
        return sex() == Sex::Female;
    }

    [[nodiscard]] const char* sex_name() const noexcept {
        return pesel::sex_name(sex());
    }

    /// Month field as stored, century offset included (1-92)
    [[nodiscard]] int encoded_month() const noexcept {
        return digit(2) * 10 + digit(3);
    }

    /// Digits 7-10 as a number (0-9999)
    [[nodiscard]] int serial() const noexcept {
        return digit(6) * 1000 + digit(7) * 100 + digit(8) * 10 + digit(9);
    }

    [[nodiscard]] int check_digit() const noexcept {
        return digit(10);
    }

    /// Date of birth in ISO 8601 form, e.g. "1944-05-14"
    [[nodiscard]] std::string date_of_birth() const;

    /// Multi-line summary: number, date of birth and sex
    [[nodiscard]] std::string describe() const;

    friend bool operator==(const Pesel& lhs, const Pesel& rhs) noexcept {
        return lhs.digits_ == rhs.digits_;
    }

    friend bool operator!=(const Pesel& lhs, const Pesel& rhs) noexcept {
        return !(lhs == rhs);
    }

private:
    Pesel(const Digits& digits, int year, int month, int day) noexcept
        : digits_(digits), year_(year), month_(month), day_(day) {}

    friend Result<Pesel, ParseError> parse(std::string_view text) noexcept;
    friend Result<Pesel, GenerationError> detail::assemble(int year, int month, int day,
                                                           int serial, int sex_digit) noexcept;

    Digits digits_;
    int year_;
    int month_;
    int day_;
};

/// Writes the canonical 11-digit form
std::ostream& operator<<(std::ostream& os, const Pesel& pesel);

} // namespace pesel

namespace std {

template <>
struct hash<pesel::Pesel> {
    size_t operator()(const pesel::Pesel& pesel) const noexcept {
        return hash<string_view>{}(pesel.digits());
    }
};

} // namespace std

#endif // PESEL_PESEL_HPP
