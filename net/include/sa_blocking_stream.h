#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <event2/event.h>
#include <event2/bufferevent.h>
#include <event2/dns.h>
#include <sa_defs.h>
#include <sa_logger.h>
#include <sa_cancel.h>
#include <sa_net_utils.h>
#include <sa_socket_address.h>

namespace sa {

namespace detail {
inline void evdns_base_free_and_fail(evdns_base *b) {
    evdns_base_free(b, 1);
}
} // namespace detail

/**
 * Synchronous TCP stream.
 * Every operation blocks the calling thread until it completes, fails, the deadline passes,
 * or the cancellation context is cancelled. I/O is driven by a private libevent base
 * which runs in the calling thread, so a stream must be used from one thread only.
 */
class blocking_stream {
public:
    struct error {
        /** Socket error code, `SA_ETIMEDOUT`, `SA_ECANCELED`, or -1 */
        int code;
        std::string description;
    };

    /**
     * @param ctx cancellation context, must outlive the stream
     * @param deadline absolute deadline for all the operations (the context deadline is honored too)
     */
    blocking_stream(cancel_context &ctx, std::optional<std::chrono::steady_clock::time_point> deadline);
    ~blocking_stream();

    blocking_stream(const blocking_stream &) = delete;
    blocking_stream &operator=(const blocking_stream &) = delete;
    blocking_stream(blocking_stream &&) = delete;
    blocking_stream &operator=(blocking_stream &&) = delete;

    /**
     * Connect to the peer. Host names are resolved via evdns, numeric addresses are used as is.
     * @return some error if failed
     */
    [[nodiscard]] std::optional<error> connect(const utils::host_port &peer);

    /**
     * Send the data and wait until it is flushed to the socket
     * @return some error if failed
     */
    [[nodiscard]] std::optional<error> write(uint8_view data);

    /**
     * Read exactly `n` bytes
     * @return some error if failed (including EOF before `n` bytes were received)
     */
    [[nodiscard]] std::optional<error> read_exact(uint8_t *buf, size_t n);

    /**
     * Read exactly `n` bytes and throw them away
     */
    [[nodiscard]] std::optional<error> discard(size_t n);

    /**
     * @return the remote address of a connected stream
     */
    [[nodiscard]] std::optional<socket_address> get_peer_address() const;

private:
    enum class wait_for {
        NOTHING,
        CONNECTED,
        FLUSHED,
        READABLE,
    };

    logger log;
    size_t id;
    cancel_context &ctx;
    cancel_context::subscription_id ctx_subscription;
    std::unique_ptr<event_base, ftor<&event_base_free>> base;
    std::unique_ptr<event, ftor<&event_free>> deadline_timer;
    std::unique_ptr<event, ftor<&event_free>> cancel_event;
    std::unique_ptr<evdns_base, ftor<&detail::evdns_base_free_and_fail>> dns_base;
    std::unique_ptr<bufferevent, ftor<&bufferevent_free>> bev;
    wait_for waiting = wait_for::NOTHING;
    size_t bytes_wanted = 0;
    std::optional<error> pending_error;
    /** Timeout and cancellation errors persist across operations */
    std::optional<error> terminal_error;

    [[nodiscard]] std::optional<error> check_usable() const;
    [[nodiscard]] std::optional<error> run_until(wait_for what);
    void finish(std::optional<error> e);

    static void on_read(bufferevent *bev, void *arg);
    static void on_write(bufferevent *bev, void *arg);
    static void on_event(bufferevent *bev, short what, void *arg);
    static void on_deadline(evutil_socket_t, short, void *arg);
    static void on_cancel(evutil_socket_t, short, void *arg);
};

} // namespace sa
