#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sa {

/**
 * Stateless deleter for `std::unique_ptr` owning a C object, e.g.
 * `std::unique_ptr<event, ftor<&event_free>>`
 */
template<auto func>
using ftor = std::integral_constant<decltype(func), func>;

/** Error description; nullopt means success */
using err_string = std::optional<std::string>;
using err_string_view = std::optional<std::string_view>;

using uint8_view = std::basic_string_view<uint8_t>;
using uint8_vector = std::vector<uint8_t>;
template<size_t S>
using uint8_array = std::array<uint8_t, S>;

constexpr size_t ipv4_address_size = 4;
constexpr size_t ipv6_address_size = 16;

// A value and the mutex guarding it
template<typename T, typename Mutex = std::mutex>
struct with_mtx {
    T val;
    Mutex mtx;
};

} // namespace sa
