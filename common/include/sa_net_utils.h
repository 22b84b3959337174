#pragma once

#include <cerrno>
#include <chrono>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <event2/util.h>
#include <sa_defs.h>

namespace sa::utils {

/** Error code of an operation which ran out of time */
static constexpr int SA_ETIMEDOUT = ETIMEDOUT;
/** Error code of an operation aborted through its cancel context */
static constexpr int SA_ECANCELED = ECANCELED;

/**
 * Split `host:port` or `[host]:port`. Brackets are stripped from the host.
 * The port is not validated; it may be empty after a trailing colon.
 * @return host, port, and an error if the string has no port or a bare IPv6 literal
 */
std::tuple<std::string_view, std::string_view, err_string_view> split_host_port(std::string_view address);

/**
 * Join host and port, bracketing hosts which contain colons
 */
std::string join_host_port(std::string_view host, std::string_view port);

/**
 * Host and numeric port of a `host:port` endpoint
 */
struct host_port {
    std::string host;
    uint16_t port = 0;

    [[nodiscard]] std::string str() const;
};

/**
 * Parse a `host:port` endpoint.
 * The port must be numeric and in 1..65535, the host must not be blank.
 * IPv6 literals must be enclosed in square brackets.
 * @return the endpoint, or an error description
 */
std::pair<host_port, err_string> parse_host_port_strict(std::string_view address);

/**
 * Convert a duration to `timeval` (microsecond resolution)
 */
timeval duration_to_timeval(std::chrono::microseconds usecs);

} // namespace sa::utils
