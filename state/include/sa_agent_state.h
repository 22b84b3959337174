#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include <sa_defs.h>
#include <sa_logger.h>

namespace sa {

/**
 * Lifecycle state of the agent.
 *
 * inactive -> starting | active
 * starting -> active | error | inactive
 * active   -> degraded | stopping | error
 * degraded -> active | stopping | error
 * stopping -> inactive | error
 * error    -> inactive | starting
 */
enum class agent_state {
    INACTIVE,
    STARTING,
    ACTIVE,
    DEGRADED,
    STOPPING,
    ERROR,
};

/**
 * @return the lowercase name of the state, e.g. "inactive"
 */
std::string agent_state_to_string(agent_state state);

enum class state_error {
    INVALID_TRANSITION,
};

/**
 * Server-side capabilities discovered by a probe
 */
struct proxy_features {
    /** "none" or "userpass"; nullopt means unknown */
    std::optional<std::string> auth;
    /** True if the proxy connected to an IPv6 literal target */
    bool ipv6 = false;
    /** Reserved, not detected by the probe */
    bool udp = false;
};

/**
 * Condensed result of the last SOCKS proxy probe
 */
struct probe_summary {
    /** TCP connection to the proxy succeeded */
    bool reachable = false;
    /** SOCKS5 greeting (and authentication if any) succeeded */
    bool socks_ok = false;
    /** CONNECT to the target succeeded */
    bool connect_ok = false;
    /** UDP ASSOCIATE succeeded */
    bool udp_ok = false;
    /** Step name -> milliseconds ("tcp_connect", "socks_handshake", "connect", "udp_associate") */
    std::map<std::string, int64_t> latencies_ms;
    proxy_features features;
    /** Non-fatal anomalies in the order they were observed */
    std::vector<std::string> warnings;
    /** Wall clock time of the probe completion, zero if never probed */
    std::chrono::system_clock::time_point last_checked;
};

struct tun_snapshot {
    std::string name;
    bool up = false;
    int mtu = 0;
    std::string local_ip;
    std::string peer_ip;
};

struct route_snapshot {
    /** Current default route gateway */
    std::string default_via;
    std::vector<std::string> lan_cidrs;
    std::vector<std::string> bypass_hosts;
    /** Whether the proxy endpoint has a pinned host route */
    bool proxy_host_route = false;
    /** Default gateway observed before the swap */
    std::string original_gateway;
};

struct tun2socks_snapshot {
    /** 0 if not running */
    int pid = 0;
    int64_t uptime_sec = 0;
    bool tcp_ok = false;
    bool udp_ok = false;
};

/**
 * Independent copy of the state at some point in time
 */
struct state_snapshot {
    agent_state state = agent_state::INACTIVE;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::vector<std::string> warnings;
    tun_snapshot tun;
    route_snapshot routes;
    tun2socks_snapshot tun2socks;
    probe_summary last_probe;
};

/**
 * Thread-safe holder of the agent state.
 * Readers share the lock, writers are exclusive. Every update replaces a whole record.
 */
class state_store {
public:
    state_store();
    ~state_store() = default;

    state_store(const state_store &) = delete;
    state_store &operator=(const state_store &) = delete;
    state_store(state_store &&) = delete;
    state_store &operator=(state_store &&) = delete;

    /**
     * @return a copy of the whole state, safe to retain without locking
     */
    [[nodiscard]] state_snapshot get_snapshot() const;

    /**
     * Move to the `next` state. Moving to the current state is a no-op.
     * The first transition to `ACTIVE` records the start time, the transition to `INACTIVE` clears it.
     * @return `INVALID_TRANSITION` if the edge is not allowed, in which case nothing is changed
     */
    [[nodiscard]] std::optional<state_error> set_agent_state(agent_state next);

    /**
     * Force-set the start time (nullopt clears it).
     * Prefer `set_agent_state`, which maintains it automatically.
     */
    void set_started_at(std::optional<std::chrono::system_clock::time_point> time);

    /**
     * @return time since the first activation, zero if never started
     */
    [[nodiscard]] std::chrono::milliseconds uptime() const;

    /**
     * Append a non-fatal warning. Empty messages are ignored.
     */
    void append_warning(std::string msg);

    void clear_warnings();

    void update_tun(tun_snapshot tun);
    void update_routes(route_snapshot routes);
    void update_tun2socks(tun2socks_snapshot tun2socks);
    void update_probe(probe_summary summary);

    /**
     * Clear the warnings and all the subsystem records.
     * @param clear_lifecycle if true, also return to `INACTIVE` and clear the start time
     */
    void reset(bool clear_lifecycle);

    /**
     * @return true if the transition table contains the edge
     */
    static bool is_transition_allowed(agent_state from, agent_state to);

private:
    logger m_log;
    mutable std::shared_mutex m_mtx;
    state_snapshot m_state;
};

} // namespace sa
