#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <sa_defs.h>

/**
 * SOCKS5 wire format (RFC 1928) and username/password authentication (RFC 1929)
 */
namespace sa::socks5 {

enum version_number {
    SVN_5 = 0x05,
};

enum auth_method {
    S5AM_NO_AUTHENTICATION_REQUIRED = 0x00,
    S5AM_USERNAME_PASSWORD = 0x02,
    S5AM_NO_ACCEPTABLE_METHODS = 0xff,
};

enum user_pass_auth_version_number {
    S5UPAVN_1 = 0x01,
};

enum user_pass_auth_status {
    S5UPAS_SUCCESS = 0x00,
};

enum command {
    S5CMD_CONNECT = 0x01,
    S5CMD_UDP_ASSOCIATE = 0x03,
};

enum address_type {
    S5AT_IPV4 = 0x01, // a version-4 IP address, with a length of 4 octets
    S5AT_DOMAINNAME = 0x03, // a fully-qualified domain name, prefixed with its length
    S5AT_IPV6 = 0x04, // a version-6 IP address, with a length of 16 octets
};

enum reply_status {
    S5RS_SUCCEEDED = 0x00,
    S5RS_GENERAL_FAILURE = 0x01,
    S5RS_NOT_ALLOWED_BY_RULESET = 0x02,
    S5RS_NETWORK_UNREACHABLE = 0x03,
    S5RS_HOST_UNREACHABLE = 0x04,
    S5RS_CONNECTION_REFUSED = 0x05,
    S5RS_TTL_EXPIRED = 0x06,
    S5RS_COMMAND_NOT_SUPPORTED = 0x07,
    S5RS_ADDRESS_TYPE_NOT_SUPPORTED = 0x08,
};

/** Maximum length of a username, a password, or a domain name */
constexpr size_t MAX_FIELD_LENGTH = 255;

#pragma pack(push, 1)

struct auth_method_response {
    uint8_t ver; // version number
    uint8_t method; // selected method
};

struct user_pass_auth_response {
    uint8_t ver; // version number of the subnegotiation
    uint8_t status; // verification status
};

struct reply_header {
    uint8_t ver; // set to X'05' for this version of the protocol
    uint8_t rep; // reply status
    [[maybe_unused]] uint8_t rsv; // reserved
    uint8_t atyp; // address type of following address
    // server bound address
    // server bound port in network octet order
};

#pragma pack(pop)

/**
 * ATYP, DST.ADDR and DST.PORT fields of a request
 */
struct encoded_address {
    uint8_t atyp = 0;
    /** Address bytes; for domain names the length octet goes first */
    uint8_vector addr;
    /** Port in network octet order */
    uint8_array<2> port = {};
    /** The host was an IPv6 literal */
    bool ipv6 = false;
};

/**
 * Encode a destination. IP literals are encoded as such (IPv4-mapped IPv6 literals as IPv4),
 * anything else as a domain name.
 * @param host host without square brackets
 * @param port port number, must be non-zero
 * @return the encoded address, or an error if the port is zero or the domain is empty or too long
 */
std::pair<encoded_address, err_string> encode_address(std::string_view host, uint16_t port);

/**
 * Make the method selection message: always offers "no authentication", plus
 * "username/password" if `offer_user_pass` is set
 */
uint8_vector make_greeting(bool offer_user_pass);

/**
 * Make the username/password authentication request
 * @return the request, or an error if any of the credentials is longer than 255 bytes
 */
std::pair<uint8_vector, err_string> make_user_pass_request(std::string_view username, std::string_view password);

/**
 * Make a CONNECT or UDP ASSOCIATE request
 */
uint8_vector make_request(command cmd, const encoded_address &dst);

/**
 * Make the UDP ASSOCIATE request with the unspecified address 0.0.0.0:0
 */
uint8_vector make_udp_associate_request();

/**
 * @return human-readable description of a reply status, "unknown reply code 0xNN" for unknown ones
 */
std::string reply_status_to_string(uint8_t rep);

/**
 * @return the size of BND.ADDR + BND.PORT for a fixed-size address type, 0 for a domain name
 *         (its length comes in the first octet), nullopt for an unknown type
 */
std::optional<size_t> fixed_bound_address_size(uint8_t atyp);

} // namespace sa::socks5
