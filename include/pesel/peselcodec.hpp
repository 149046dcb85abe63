/**
 * @file peselcodec.hpp
 * @brief PESEL codec public API.
 *
 * Single include for parsing, validating and generating PESEL numbers.
 */

#ifndef PESEL_PESELCODEC_HPP
#define PESEL_PESELCODEC_HPP

#include "calendar.hpp"
#include "century.hpp"
#include "checksum.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "pesel.hpp"
#include "result.hpp"

namespace pesel {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace pesel

#endif // PESEL_PESELCODEC_HPP
