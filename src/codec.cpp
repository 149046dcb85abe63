/**
 * @file codec.cpp
 * @brief PESEL parsing and generation.
 *
 * The building blocks (century table, calendar rules, check digit) are
 * constexpr and live in their headers; this unit strings them together.
 */

#include <pesel/calendar.hpp>
#include <pesel/century.hpp>
#include <pesel/checksum.hpp>
#include <pesel/codec.hpp>

#include <algorithm>

namespace pesel {

namespace {

int read_two_digits(std::string_view digits, std::size_t pos) noexcept {
    return (digits[pos] - '0') * 10 + (digits[pos + 1] - '0');
}

void write_two_digits(Pesel::Digits& digits, std::size_t pos, int value) noexcept {
    digits[pos] = static_cast<char>('0' + value / 10);
    digits[pos + 1] = static_cast<char>('0' + value % 10);
}

} // namespace

Result<Pesel, ParseError> parse(std::string_view text) noexcept {
    if (text.size() != PESEL_LENGTH) {
        return ParseError::InvalidLength;
    }

    // ASCII digits only, independent of the locale
    for (char c : text) {
        if (c < '0' || c > '9') {
            return ParseError::NonDigitCharacter;
        }
    }

    int year_literal = read_two_digits(text, 0);
    int encoded_month = read_two_digits(text, 2);
    int day = read_two_digits(text, 4);

    auto birth = decode_birth_month(year_literal, encoded_month);
    if (!birth) {
        return ParseError::InvalidMonth;
    }

    if (!is_valid_date(birth->year, birth->month, day)) {
        return ParseError::InvalidDate;
    }

    if (!has_valid_checksum(text)) {
        return ParseError::ChecksumMismatch;
    }

    Pesel::Digits digits;
    std::copy(text.begin(), text.end(), digits.begin());
    return Pesel(digits, birth->year, birth->month, day);
}

Result<Pesel, GenerationError> generate(int year, int month, int day, Sex sex) noexcept {
    return detail::assemble(year, month, day, 0, static_cast<int>(sex));
}

Result<Pesel, GenerationError> generate(int year, int month, int day, Sex sex,
                                        int serial) noexcept {
    return detail::assemble(year, month, day, serial, static_cast<int>(sex));
}

namespace detail {

Result<Pesel, GenerationError> assemble(int year, int month, int day, int serial,
                                        int sex_digit) noexcept {
    auto offset = month_offset_for_year(year);
    if (!offset) {
        return GenerationError::YearOutOfRange;
    }
    if (month < 1 || month > 12) {
        return GenerationError::InvalidMonth;
    }
    if (!is_valid_date(year, month, day)) {
        return GenerationError::InvalidDate;
    }
    if (serial < 0 || serial > MAX_SERIAL) {
        return GenerationError::InvalidSerial;
    }

    Pesel::Digits digits;
    write_two_digits(digits, 0, year % 100);
    write_two_digits(digits, 2, month + *offset);
    write_two_digits(digits, 4, day);
    digits[6] = static_cast<char>('0' + serial / 100);
    write_two_digits(digits, 7, serial % 100);
    digits[9] = static_cast<char>('0' + sex_digit);
    digits[10] = static_cast<char>(
        '0' + compute_check_digit(std::string_view(digits.data(), digits.size())));

    return Pesel(digits, year, month, day);
}

} // namespace detail

} // namespace pesel
