/**
 * @file config.hpp
 * @brief PESEL codec compile-time configuration.
 *
 * PESEL: Powszechny Elektroniczny System Ewidencji Ludności, the 11-digit
 * Polish national identification number.
 */

#ifndef PESEL_CONFIG_HPP
#define PESEL_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace pesel {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Number of digits in a PESEL, check digit included
inline constexpr std::size_t PESEL_LENGTH = 11U;

/// Number of digits covered by the checksum
inline constexpr std::size_t PAYLOAD_LENGTH = PESEL_LENGTH - 1U;

/// Earliest and latest birth year the century encoding can express
inline constexpr int MIN_YEAR = 1800;
inline constexpr int MAX_YEAR = 2299;

/// Largest sequence number that fits in digits 7-9
inline constexpr int MAX_SERIAL = 999;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define PESEL_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef PESEL_NO_EXCEPTIONS
#define PESEL_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace pesel

#endif // PESEL_CONFIG_HPP
