#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <netinet/in.h>
#include <event2/util.h>
#include <sa_defs.h>

namespace sa {

/**
 * Numeric IPv4 or IPv6 endpoint
 */
class socket_address {
public:
    /** Invalid address */
    socket_address() = default;

    /**
     * @param numeric_host IPv4 or IPv6 literal without brackets; anything else gives an invalid address
     * @param port         port number
     */
    socket_address(std::string_view numeric_host, uint16_t port);

    /**
     * @param addr `sockaddr_in` or `sockaddr_in6`; other families give an invalid address
     */
    explicit socket_address(const sockaddr *addr);

    /**
     * @return the address a socket is bound to
     */
    static std::optional<socket_address> local_of(evutil_socket_t fd);

    /**
     * @return the remote address of a connected socket
     */
    static std::optional<socket_address> peer_of(evutil_socket_t fd);

    [[nodiscard]] const sockaddr *c_sockaddr() const;

    /**
     * @return size of the underlying `sockaddr_in`/`sockaddr_in6`, 0 if invalid
     */
    [[nodiscard]] ev_socklen_t c_socklen() const;

    /**
     * @return 4 or 16 address bytes, empty if invalid
     */
    [[nodiscard]] uint8_view addr() const;

    [[nodiscard]] uint16_t port() const;

    /**
     * @return `a.b.c.d:port` or `[v6]:port`
     */
    [[nodiscard]] std::string str() const;

    [[nodiscard]] bool valid() const;
    [[nodiscard]] bool is_ipv6() const;

private:
    union storage {
        sockaddr sa;
        sockaddr_in sin;
        sockaddr_in6 sin6;
    };
    storage m_addr = {};
};

} // namespace sa
