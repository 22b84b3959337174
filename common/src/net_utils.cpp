#include <sa_net_utils.h>
#include <sa_utils.h>

using namespace sa;

std::tuple<std::string_view, std::string_view, err_string_view> utils::split_host_port(std::string_view address) {
    std::string_view host;
    std::string_view rest;

    if (starts_with(address, "[")) {
        size_t end = address.find(']');
        if (end == std::string_view::npos) {
            return {{}, {}, "missing ']' in address"};
        }
        host = address.substr(1, end - 1);
        rest = address.substr(end + 1);
        if (rest.empty()) {
            return {{}, {}, "missing port in address"};
        }
        if (rest.front() != ':') {
            return {{}, {}, "unexpected characters after ']' in address"};
        }
    } else {
        size_t colon = address.rfind(':');
        if (colon == std::string_view::npos) {
            return {{}, {}, "missing port in address"};
        }
        host = address.substr(0, colon);
        if (host.find(':') != std::string_view::npos) {
            return {{}, {}, "too many colons in address"};
        }
        if (host.find_first_of("[]") != std::string_view::npos) {
            return {{}, {}, "unexpected bracket in address"};
        }
        rest = address.substr(colon);
    }

    return {host, rest.substr(1), std::nullopt};
}

std::string utils::join_host_port(std::string_view host, std::string_view port) {
    if (host.find(':') != std::string_view::npos) {
        return SA_FMT("[{}]:{}", host, port);
    }
    return SA_FMT("{}:{}", host, port);
}

std::string utils::host_port::str() const {
    return join_host_port(this->host, std::to_string(this->port));
}

std::pair<utils::host_port, err_string> utils::parse_host_port_strict(std::string_view address) {
    auto [host, port, err] = split_host_port(address);
    if (err.has_value()) {
        return {{}, SA_FMT("address {}: {}", address, err.value())};
    }
    std::optional<uint16_t> port_num = to_integer<uint16_t>(port);
    if (!port_num.has_value() || port_num.value() == 0) {
        return {{}, SA_FMT("invalid port \"{}\"", port)};
    }
    if (is_blank(host)) {
        return {{}, "empty host"};
    }
    return {{std::string(host), port_num.value()}, std::nullopt};
}

timeval utils::duration_to_timeval(std::chrono::microseconds usecs) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(usecs);
    timeval tv{};
    tv.tv_sec = (decltype(tv.tv_sec)) secs.count();
    tv.tv_usec = (decltype(tv.tv_usec)) (usecs - secs).count();
    return tv;
}
