/**
 * @file pesel.cpp
 * @brief Pesel formatting and throwing constructors.
 */

#include <pesel/codec.hpp>
#include <pesel/pesel.hpp>

#include <cstdio>
#include <ostream>
#include <utility>

namespace pesel {

#if !PESEL_NO_EXCEPTIONS

Pesel Pesel::from_string(std::string_view text) {
    auto result = parse(text);
    if (!result) {
        throw ParseException(result.error());
    }
    return std::move(result).value();
}

Pesel Pesel::generate_or_throw(int year, int month, int day, Sex sex) {
    auto result = generate(year, month, day, sex);
    if (!result) {
        throw GenerationException(result.error());
    }
    return std::move(result).value();
}

#endif // !PESEL_NO_EXCEPTIONS

std::string Pesel::date_of_birth() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year_, month_, day_);
    return buf;
}

std::string Pesel::describe() const {
    std::string out;
    out += "PESEL:         " + to_string() + "\n";
    out += "date of birth: " + date_of_birth() + "\n";
    out += "sex:           ";
    out += sex_name();
    return out;
}

std::ostream& operator<<(std::ostream& os, const Pesel& pesel) {
    return os << pesel.digits();
}

} // namespace pesel
