/**
 * @file result.hpp
 * @brief Value-or-error return type for the codec operations.
 */

#ifndef PESEL_RESULT_HPP
#define PESEL_RESULT_HPP

#include <optional>
#include <utility>

#include "config.hpp"

namespace pesel {

/**
 * @brief Holds either a value of type T or an error code of type E.
 *
 * E is one of the error enums from error.hpp; its Ok member marks success.
 * A failed result never holds a value.
 *
 * @tparam T Value type (need not be default-constructible)
 * @tparam E Error enum with an Ok member
 */
template <typename T, typename E>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(E::Ok) {}

    Result(E error) : error_(error) {}

    /// True when a value is present
    [[nodiscard]] bool ok() const noexcept {
        return value_.has_value();
    }

    explicit operator bool() const noexcept {
        return ok();
    }

    /// Error code; E::Ok on success
    [[nodiscard]] E error() const noexcept {
        return error_;
    }

    /**
     * @brief Access the value.
     *
     * Must only be called when ok() is true.
     */
    [[nodiscard]] const T& value() const& noexcept {
        return *value_;
    }

    [[nodiscard]] T&& value() && noexcept {
        return std::move(*value_);
    }

    const T& operator*() const& noexcept {
        return *value_;
    }

    const T* operator->() const noexcept {
        return &*value_;
    }

private:
    std::optional<T> value_;
    E error_;
};

} // namespace pesel

#endif // PESEL_RESULT_HPP
