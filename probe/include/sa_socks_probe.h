#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <sa_defs.h>
#include <sa_cancel.h>
#include <sa_agent_state.h>

namespace sa {

/**
 * Credentials for the SOCKS5 username/password authentication
 */
struct proxy_auth {
    std::string username;
    std::string password;
};

/**
 * Parameters of a single probe run
 */
struct probe_config {
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{3000};
    /** Longer timeouts are cut down to this */
    static constexpr std::chrono::milliseconds MAX_TIMEOUT{5 * 60 * 1000};
    static constexpr std::string_view DEFAULT_CONNECT_TARGET = "example.com:80";

    /** SOCKS5 server in the `host:port` form (IPv6 literals in square brackets) */
    std::string server;
    /** Bound for the whole probe; non-positive values mean `DEFAULT_TIMEOUT`, at most `MAX_TIMEOUT` */
    std::chrono::milliseconds timeout{0};
    /**
     * Credentials. If set, the username/password method is offered along with "no authentication".
     * Otherwise the probe succeeds only if the proxy accepts "no authentication".
     */
    std::optional<proxy_auth> auth;
    /** Destination for the CONNECT test; blank means `DEFAULT_CONNECT_TARGET` */
    std::string connect_target;
    /** Also try a UDP ASSOCIATE request */
    bool udp_test = false;
};

enum class probe_error_kind {
    /** Bad parameters, nothing was sent */
    INPUT,
    /** Connection, I/O, timeout or cancellation failure */
    TRANSPORT,
    /** The proxy answered but the answer means failure */
    PROTOCOL,
};

struct probe_error {
    probe_error_kind kind;
    std::string description;
};

struct probe_result {
    /** Populated on every path, including failures */
    probe_summary summary;
    std::optional<probe_error> error;
};

/**
 * Run a SOCKS5 probe: TCP connect, greeting (with optional username/password authentication),
 * CONNECT to the target, and optionally UDP ASSOCIATE. All the steps share one connection
 * and one deadline derived from `config.timeout`.
 * A failed UDP ASSOCIATE does not fail the probe, it only produces a warning.
 * @param ctx cancellation context; cancelling it aborts the probe
 * @param config probe parameters
 * @return the summary and an error if the probe failed
 */
probe_result probe_socks(cancel_context &ctx, const probe_config &config);

} // namespace sa
