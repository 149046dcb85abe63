/**
 * @file error.hpp
 * @brief PESEL codec error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * The error codes are always available; the exception classes are
 * compiled out for -fno-exceptions builds (PESEL_NO_EXCEPTIONS=1).
 */

#ifndef PESEL_ERROR_HPP
#define PESEL_ERROR_HPP

#include "config.hpp"

#if !PESEL_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace pesel {

/**
 * @brief Reasons a candidate string is rejected by parse().
 *
 * Listed in the order the checks are performed.
 */
enum class ParseError {
    Ok = 0,                 ///< Success
    InvalidLength = -1,     ///< Not exactly 11 characters
    NonDigitCharacter = -2, ///< Contains a character outside '0'-'9'
    InvalidMonth = -3,      ///< Month field matches no century bucket
    InvalidDate = -4,       ///< Day does not exist in the resolved month
    ChecksumMismatch = -5   ///< 11th digit disagrees with the weighted sum
};

/**
 * @brief Reasons generate() refuses to build a number.
 */
enum class GenerationError {
    Ok = 0,              ///< Success
    YearOutOfRange = -1, ///< Year outside 1800-2299
    InvalidMonth = -2,   ///< Month outside 1-12
    InvalidDate = -3,    ///< Day does not exist in the given month
    InvalidSerial = -4   ///< Sequence number outside 0-999
};

/**
 * @brief Get error message for a parse error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(ParseError error) noexcept {
    switch (error) {
    case ParseError::Ok:
        return "Success";
    case ParseError::InvalidLength:
        return "PESEL has to be 11 characters long";
    case ParseError::NonDigitCharacter:
        return "PESEL may only contain digits";
    case ParseError::InvalidMonth:
        return "Invalid month or century coded";
    case ParseError::InvalidDate:
        return "Invalid date of birth";
    case ParseError::ChecksumMismatch:
        return "Checksum mismatch";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Get error message for a generation error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(GenerationError error) noexcept {
    switch (error) {
    case GenerationError::Ok:
        return "Success";
    case GenerationError::YearOutOfRange:
        return "Year out of range (1800-2299)";
    case GenerationError::InvalidMonth:
        return "Month out of range (1-12)";
    case GenerationError::InvalidDate:
        return "Invalid date of birth";
    case GenerationError::InvalidSerial:
        return "Serial number out of range (0-999)";
    default:
        return "Unknown error";
    }
}

#if !PESEL_NO_EXCEPTIONS

/**
 * @brief Base exception for PESEL errors.
 */
class PeselException : public std::runtime_error {
public:
    explicit PeselException(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown by the throwing parse variant.
 */
class ParseException : public PeselException {
public:
    explicit ParseException(ParseError code)
        : PeselException(error_string(code)), error_code_(code) {}

    ParseError code() const noexcept {
        return error_code_;
    }

private:
    ParseError error_code_;
};

/**
 * @brief Exception thrown by the throwing generate variant.
 */
class GenerationException : public PeselException {
public:
    explicit GenerationException(GenerationError code)
        : PeselException(error_string(code)), error_code_(code) {}

    GenerationError code() const noexcept {
        return error_code_;
    }

private:
    GenerationError error_code_;
};

#endif // !PESEL_NO_EXCEPTIONS

} // namespace pesel

#endif // PESEL_ERROR_HPP
