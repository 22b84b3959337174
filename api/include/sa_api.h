#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <sa_defs.h>
#include <sa_agent_state.h>
#include <sa_socks_probe.h>

namespace sa::api {

/** Control API payloads keep the order in which the fields are set */
using json = nlohmann::ordered_json;

/**
 * Body of `POST /v1/probe`
 */
struct probe_request {
    std::string socks_server;
    int64_t timeout_ms = 0;
    /** Credentials with both fields empty are treated as absent */
    std::optional<proxy_auth> auth;
    std::string connect_target;
    bool udp_test = false;

    /**
     * @return the probe parameters this request describes
     */
    [[nodiscard]] probe_config to_probe_config() const;
};

/**
 * Body of `POST /v1/start`
 */
struct start_request {
    std::string socks_server;
    /** 0 means the default MTU */
    int mtu = 0;
    std::optional<proxy_auth> auth;
    std::vector<std::string> bypass_hosts;
};

/**
 * Parse and validate a probe request
 * @return the request, or an error message suitable for a `400 Bad Request` reply
 */
std::pair<probe_request, err_string> parse_probe_request(std::string_view body);

/**
 * Parse and validate a start request. Unknown fields are rejected.
 * @return the request, or an error message suitable for a `400 Bad Request` reply
 */
std::pair<start_request, err_string> parse_start_request(std::string_view body);

/**
 * Check that a stop request is a JSON object without fields
 * @return an error message if it is not
 */
err_string parse_stop_request(std::string_view body);

/**
 * @return status view of the snapshot (the `GET /v1/status` payload)
 */
json status_view(const state_snapshot &snapshot, std::chrono::system_clock::time_point now);

/**
 * @return view of a probe summary (the `POST /v1/probe` payload and `last_probe` of the status)
 */
json probe_view(const probe_summary &summary);

/**
 * @return `{"status":"ok","timestamp":...}`
 */
json health_view(std::chrono::system_clock::time_point now);

/**
 * @return `{"error":...,"timestamp":...}`
 */
json error_view(std::string_view error, std::chrono::system_clock::time_point now);

} // namespace sa::api
