#include <cstring>
#include <arpa/inet.h>
#include <sa_socks5.h>
#include <sa_socket_address.h>
#include <sa_utils.h>

using namespace sa;

static void append_bytes(uint8_vector &buf, const void *mem, size_t size) {
    buf.insert(buf.end(), (uint8_t *) mem, (uint8_t *) mem + size);
}

static bool is_ipv4_mapped(uint8_view addr) {
    static constexpr uint8_t PREFIX[] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
    return addr.size() == ipv6_address_size && 0 == std::memcmp(addr.data(), PREFIX, sizeof(PREFIX));
}

std::pair<socks5::encoded_address, err_string> socks5::encode_address(std::string_view host, uint16_t port) {
    if (port == 0) {
        return {{}, SA_FMT("invalid port: \"{}\"", port)};
    }

    encoded_address result;
    uint16_t nport = htons(port);
    std::memcpy(result.port.data(), &nport, sizeof(nport));

    if (socket_address ip(host, 0); ip.valid()) {
        uint8_view addr = ip.addr();
        if (!ip.is_ipv6()) {
            result.atyp = S5AT_IPV4;
            result.addr.assign(addr.begin(), addr.end());
        } else if (is_ipv4_mapped(addr)) {
            result.atyp = S5AT_IPV4;
            result.addr.assign(addr.begin() + 12, addr.end());
        } else {
            result.atyp = S5AT_IPV6;
            result.addr.assign(addr.begin(), addr.end());
            result.ipv6 = true;
        }
        return {std::move(result), std::nullopt};
    }

    if (host.empty() || host.size() > MAX_FIELD_LENGTH) {
        return {{}, SA_FMT("invalid domain length: {}", host.size())};
    }
    result.atyp = S5AT_DOMAINNAME;
    result.addr.reserve(1 + host.size());
    result.addr.push_back((uint8_t) host.size());
    append_bytes(result.addr, host.data(), host.size());
    return {std::move(result), std::nullopt};
}

uint8_vector socks5::make_greeting(bool offer_user_pass) {
    uint8_vector msg = {SVN_5, 1, S5AM_NO_AUTHENTICATION_REQUIRED};
    if (offer_user_pass) {
        msg[1] = 2;
        msg.push_back(S5AM_USERNAME_PASSWORD);
    }
    return msg;
}

// https://tools.ietf.org/html/rfc1929
std::pair<uint8_vector, err_string> socks5::make_user_pass_request(
        std::string_view username, std::string_view password) {
    if (username.size() > MAX_FIELD_LENGTH || password.size() > MAX_FIELD_LENGTH) {
        return {{}, "username/password too long (max 255 bytes each)"};
    }

    uint8_vector msg;
    msg.reserve(3 + username.size() + password.size());
    msg.push_back(S5UPAVN_1);
    msg.push_back((uint8_t) username.size());
    append_bytes(msg, username.data(), username.size());
    msg.push_back((uint8_t) password.size());
    append_bytes(msg, password.data(), password.size());
    return {std::move(msg), std::nullopt};
}

uint8_vector socks5::make_request(command cmd, const encoded_address &dst) {
    uint8_vector msg = {SVN_5, (uint8_t) cmd, 0x00, dst.atyp};
    msg.reserve(msg.size() + dst.addr.size() + dst.port.size());
    msg.insert(msg.end(), dst.addr.begin(), dst.addr.end());
    msg.insert(msg.end(), dst.port.begin(), dst.port.end());
    return msg;
}

uint8_vector socks5::make_udp_associate_request() {
    encoded_address unspecified;
    unspecified.atyp = S5AT_IPV4;
    unspecified.addr.assign(ipv4_address_size, 0);
    return make_request(S5CMD_UDP_ASSOCIATE, unspecified);
}

std::string socks5::reply_status_to_string(uint8_t rep) {
    switch ((reply_status) rep) {
    case S5RS_SUCCEEDED:
        return "succeeded";
    case S5RS_GENERAL_FAILURE:
        return "general SOCKS server failure";
    case S5RS_NOT_ALLOWED_BY_RULESET:
        return "connection not allowed by ruleset";
    case S5RS_NETWORK_UNREACHABLE:
        return "network unreachable";
    case S5RS_HOST_UNREACHABLE:
        return "host unreachable";
    case S5RS_CONNECTION_REFUSED:
        return "connection refused by destination host";
    case S5RS_TTL_EXPIRED:
        return "TTL expired";
    case S5RS_COMMAND_NOT_SUPPORTED:
        return "command not supported";
    case S5RS_ADDRESS_TYPE_NOT_SUPPORTED:
        return "address type not supported";
    }
    return SA_FMT("unknown reply code 0x{:02x}", rep);
}

std::optional<size_t> socks5::fixed_bound_address_size(uint8_t atyp) {
    switch (atyp) {
    case S5AT_IPV4:
        return ipv4_address_size + 2;
    case S5AT_IPV6:
        return ipv6_address_size + 2;
    case S5AT_DOMAINNAME:
        return 0;
    default:
        return std::nullopt;
    }
}
