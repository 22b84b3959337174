#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <sa_defs.h>
#include <sa_agent_state.h>
#include <sa_socket_address.h>

namespace sa {

struct control_server_settings {
    /** `host:port` to listen on; port 0 picks an ephemeral one */
    std::string listen_address;
    /** How long `await_shutdown` lets an in-flight request finish before cancelling it */
    std::chrono::seconds shutdown_timeout;
    /** Per-connection read/write timeout */
    std::chrono::seconds io_timeout;
    /** Requests with larger bodies are rejected */
    size_t max_body_size;

    static const control_server_settings &get_default();
};

class control_server;
using control_server_ptr = std::unique_ptr<control_server>;

/**
 * HTTP control API of the agent.
 * Serves `/v1/healthz`, `/v1/status`, `/v1/probe`, `/v1/start` and `/v1/stop` on its own event loop thread.
 */
class control_server {
public:
    virtual ~control_server() = default;

    using create_result = std::pair<control_server_ptr, err_string>;

    /**
     * Create a server and start listening
     * @param settings the server settings
     * @param state    the agent state, must outlive the server
     * @return a server pointer or an error string
     */
    static create_result create_and_listen(const control_server_settings &settings, state_store &state);

    /**
     * Request this server to shutdown
     */
    virtual void shutdown() = 0;

    /**
     * Block until the server shuts down
     */
    virtual void await_shutdown() = 0;

    /**
     * @brief Get the address the server is listening on
     */
    [[nodiscard]] virtual socket_address get_listen_address() const = 0;
};

} // namespace sa
