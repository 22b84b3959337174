#include <cstring>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sa_socket_address.h>
#include <sa_utils.h>

sa::socket_address::socket_address(std::string_view numeric_host, uint16_t port) {
    char host[INET6_ADDRSTRLEN];
    if (numeric_host.size() >= sizeof(host)) {
        return;
    }
    std::memcpy(host, numeric_host.data(), numeric_host.size());
    host[numeric_host.size()] = '\0';

    if (1 == inet_pton(AF_INET, host, &m_addr.sin.sin_addr)) {
        m_addr.sin.sin_family = AF_INET;
        m_addr.sin.sin_port = htons(port);
    } else if (1 == inet_pton(AF_INET6, host, &m_addr.sin6.sin6_addr)) {
        m_addr.sin6.sin6_family = AF_INET6;
        m_addr.sin6.sin6_port = htons(port);
    } else {
        m_addr = {};
    }
}

sa::socket_address::socket_address(const sockaddr *addr) {
    if (addr == nullptr) {
        return;
    }
    switch (addr->sa_family) {
    case AF_INET:
        std::memcpy(&m_addr.sin, addr, sizeof(sockaddr_in));
        break;
    case AF_INET6:
        std::memcpy(&m_addr.sin6, addr, sizeof(sockaddr_in6));
        break;
    default:
        break;
    }
}

static std::optional<sa::socket_address> socket_name(evutil_socket_t fd, bool peer) {
    sockaddr_storage ss = {};
    socklen_t len = sizeof(ss);
    if (fd < 0) {
        return std::nullopt;
    }
    int r = peer ? getpeername(fd, (sockaddr *) &ss, &len) : getsockname(fd, (sockaddr *) &ss, &len);
    if (r != 0) {
        return std::nullopt;
    }
    sa::socket_address addr((sockaddr *) &ss);
    if (!addr.valid()) {
        return std::nullopt;
    }
    return addr;
}

std::optional<sa::socket_address> sa::socket_address::local_of(evutil_socket_t fd) {
    return socket_name(fd, false);
}

std::optional<sa::socket_address> sa::socket_address::peer_of(evutil_socket_t fd) {
    return socket_name(fd, true);
}

const sockaddr *sa::socket_address::c_sockaddr() const {
    return &m_addr.sa;
}

ev_socklen_t sa::socket_address::c_socklen() const {
    switch (m_addr.sa.sa_family) {
    case AF_INET:
        return sizeof(sockaddr_in);
    case AF_INET6:
        return sizeof(sockaddr_in6);
    default:
        return 0;
    }
}

sa::uint8_view sa::socket_address::addr() const {
    switch (m_addr.sa.sa_family) {
    case AF_INET:
        return {(const uint8_t *) &m_addr.sin.sin_addr, ipv4_address_size};
    case AF_INET6:
        return {(const uint8_t *) &m_addr.sin6.sin6_addr, ipv6_address_size};
    default:
        return {};
    }
}

uint16_t sa::socket_address::port() const {
    switch (m_addr.sa.sa_family) {
    case AF_INET:
        return ntohs(m_addr.sin.sin_port);
    case AF_INET6:
        return ntohs(m_addr.sin6.sin6_port);
    default:
        return 0;
    }
}

std::string sa::socket_address::str() const {
    char host[INET6_ADDRSTRLEN] = "";
    switch (m_addr.sa.sa_family) {
    case AF_INET:
        inet_ntop(AF_INET, &m_addr.sin.sin_addr, host, sizeof(host));
        return SA_FMT("{}:{}", host, port());
    case AF_INET6:
        inet_ntop(AF_INET6, &m_addr.sin6.sin6_addr, host, sizeof(host));
        return SA_FMT("[{}]:{}", host, port());
    default:
        return "<invalid>";
    }
}

bool sa::socket_address::valid() const {
    return m_addr.sa.sa_family == AF_INET || m_addr.sa.sa_family == AF_INET6;
}

bool sa::socket_address::is_ipv6() const {
    return m_addr.sa.sa_family == AF_INET6;
}
