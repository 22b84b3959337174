#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <sa_defs.h>

/**
 * `fmt::format` with a compile-time checked format string
 */
#define SA_FMT(FORMAT, ...) fmt::format(FMT_STRING(FORMAT), __VA_ARGS__)

namespace sa::utils {

static inline std::string to_lower(std::string_view str) {
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
    });
    return out;
}

/**
 * @return `str` without leading and trailing whitespace
 */
static inline std::string_view trim(std::string_view str) {
    auto is_space = [](unsigned char c) {
        return std::isspace(c) != 0;
    };
    while (!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

static inline bool is_blank(std::string_view str) {
    return trim(str).empty();
}

static inline constexpr bool starts_with(std::string_view str, std::string_view prefix) {
    return str.substr(0, prefix.size()) == prefix;
}

/**
 * Parse a decimal integer. No sign for unsigned types, no whitespace, no leading `+`.
 * @return the value, or nullopt if the string is not a number or does not fit into `T`
 */
template<typename T>
std::optional<T> to_integer(std::string_view str) {
    static_assert(std::is_integral_v<T>, "Integral type expected");
    using wide = std::conditional_t<std::is_signed_v<T>, long long, unsigned long long>;

    bool negative = std::is_signed_v<T> && starts_with(str, "-");
    if (negative) {
        str.remove_prefix(1);
    }
    if (str.empty()) {
        return std::nullopt;
    }

    // accumulate towards the sign to reach the minimum of a signed type
    wide value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        wide digit = c - '0';
        if (negative) {
            if (value < (std::numeric_limits<T>::min() + digit) / 10) {
                return std::nullopt;
            }
            value = value * 10 - digit;
        } else {
            if (value > (std::numeric_limits<T>::max() - digit) / 10) {
                return std::nullopt;
            }
            value = value * 10 + digit;
        }
    }
    return (T) value;
}

/**
 * Format a wall-clock time as UTC RFC 3339 with second precision (`2006-01-02T15:04:05Z`)
 * @return the formatted string, or an empty string for the zero time point
 */
std::string time_to_rfc3339(std::chrono::system_clock::time_point time);

/**
 * Measures time since construction or the last `reset`
 */
class timer {
public:
    template<typename T>
    [[nodiscard]] T elapsed() const {
        return std::chrono::duration_cast<T>(std::chrono::steady_clock::now() - m_start);
    }

    void reset() {
        m_start = std::chrono::steady_clock::now();
    }

private:
    std::chrono::steady_clock::time_point m_start = std::chrono::steady_clock::now();
};

} // namespace sa::utils
