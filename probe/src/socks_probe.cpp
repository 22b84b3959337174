#include <algorithm>
#include <atomic>
#include <sa_blocking_stream.h>
#include <sa_net_utils.h>
#include <sa_socks5.h>
#include <sa_socks_probe.h>
#include <sa_utils.h>

#define log_probe(p_, lvl_, fmt_, ...) lvl_##log((p_)->log, "[id={}] {}(): " fmt_, (p_)->id, __func__, ##__VA_ARGS__)

using namespace sa;
using namespace std::chrono;

static std::atomic_size_t next_id = {0};

static int64_t millis_since(const utils::timer &t) {
    return std::max(t.elapsed<milliseconds>().count(), (milliseconds::rep) 0);
}

static probe_error transport_error(std::string description) {
    return {probe_error_kind::TRANSPORT, std::move(description)};
}

static probe_error protocol_error(std::string description) {
    return {probe_error_kind::PROTOCOL, std::move(description)};
}

namespace {

/**
 * One probe run over one connection
 */
class socks_prober {
public:
    socks_prober(cancel_context &ctx, steady_clock::time_point deadline, probe_summary &summary)
            : log(create_logger("probe"))
            , id(next_id.fetch_add(1, std::memory_order_relaxed))
            , stream(ctx, deadline)
            , summary(summary) {
    }

    std::optional<probe_error> tcp_connect(const utils::host_port &server);
    std::optional<probe_error> handshake(const std::optional<proxy_auth> &auth);
    std::optional<probe_error> connect(const utils::host_port &target);
    void udp_associate();

    logger log;
    size_t id;

private:
    blocking_stream stream;
    probe_summary &summary;

    void warn(std::string msg) {
        log_probe(this, dbg, "{}", msg);
        summary.warnings.emplace_back(std::move(msg));
    }

    std::optional<probe_error> negotiate(const std::optional<proxy_auth> &auth, uint8_t &method);
    std::optional<probe_error> user_pass_auth(const proxy_auth &auth);
    err_string discard_bound_address(uint8_t atyp);
};

} // namespace

std::optional<probe_error> socks_prober::tcp_connect(const utils::host_port &server) {
    log_probe(this, trace, "{}", server.str());

    utils::timer t;
    std::optional<blocking_stream::error> e = stream.connect(server);
    summary.latencies_ms["tcp_connect"] = millis_since(t);
    if (e.has_value()) {
        warn("tcp connect failed: " + e->description);
        return transport_error(std::move(e->description));
    }

    if (std::optional<socket_address> peer = stream.get_peer_address(); peer.has_value()) {
        log_probe(this, dbg, "Connected to {} in {}ms", peer->str(), summary.latencies_ms["tcp_connect"]);
    }
    summary.reachable = true;
    return std::nullopt;
}

std::optional<probe_error> socks_prober::handshake(const std::optional<proxy_auth> &auth) {
    utils::timer t;
    uint8_t method = 0;
    std::optional<probe_error> e = negotiate(auth, method);
    summary.latencies_ms["socks_handshake"] = millis_since(t);
    if (e.has_value()) {
        warn("socks handshake failed: " + e->description);
        return e;
    }

    summary.socks_ok = true;
    switch (method) {
    case socks5::S5AM_NO_AUTHENTICATION_REQUIRED:
        summary.features.auth = "none";
        break;
    case socks5::S5AM_USERNAME_PASSWORD:
        summary.features.auth = "userpass";
        break;
    default:
        warn(SA_FMT("unexpected method selected: 0x{:02x}", method));
        break;
    }
    return std::nullopt;
}

std::optional<probe_error> socks_prober::negotiate(const std::optional<proxy_auth> &auth, uint8_t &method) {
    log_probe(this, trace, "Offering user/pass: {}", auth.has_value());

    uint8_vector greeting = socks5::make_greeting(auth.has_value());
    if (auto e = stream.write({greeting.data(), greeting.size()}); e.has_value()) {
        return transport_error("write greeting: " + e->description);
    }

    socks5::auth_method_response reply = {};
    if (auto e = stream.read_exact((uint8_t *) &reply, sizeof(reply)); e.has_value()) {
        return transport_error("read method selection: " + e->description);
    }
    if (reply.ver != socks5::SVN_5) {
        return protocol_error(SA_FMT("unexpected version in method selection: 0x{:02x}", reply.ver));
    }

    method = reply.method;
    switch (method) {
    case socks5::S5AM_NO_AUTHENTICATION_REQUIRED:
        return std::nullopt;
    case socks5::S5AM_USERNAME_PASSWORD:
        if (!auth.has_value()) {
            return protocol_error("proxy requires username/password but none provided");
        }
        return user_pass_auth(auth.value());
    case socks5::S5AM_NO_ACCEPTABLE_METHODS:
        return protocol_error("proxy rejected offered methods");
    default:
        return protocol_error(SA_FMT("unsupported method selected by proxy: 0x{:02x}", method));
    }
}

std::optional<probe_error> socks_prober::user_pass_auth(const proxy_auth &auth) {
    log_probe(this, trace, "...");

    auto [request, err] = socks5::make_user_pass_request(auth.username, auth.password);
    if (err.has_value()) {
        return probe_error{probe_error_kind::INPUT, std::move(err.value())};
    }
    if (auto e = stream.write({request.data(), request.size()}); e.has_value()) {
        return transport_error("write user/pass: " + e->description);
    }

    socks5::user_pass_auth_response reply = {};
    if (auto e = stream.read_exact((uint8_t *) &reply, sizeof(reply)); e.has_value()) {
        return transport_error("read user/pass reply: " + e->description);
    }
    if (reply.ver != socks5::S5UPAVN_1) {
        return protocol_error(SA_FMT("unexpected user/pass reply version: 0x{:02x}", reply.ver));
    }
    if (reply.status != socks5::S5UPAS_SUCCESS) {
        return protocol_error("user/pass authentication failed");
    }
    return std::nullopt;
}

std::optional<probe_error> socks_prober::connect(const utils::host_port &target) {
    log_probe(this, trace, "{}", target.str());

    utils::timer t;
    auto [dst, err] = socks5::encode_address(target.host, target.port);
    if (err.has_value()) {
        warn("invalid connect target encoding: " + err.value());
        return probe_error{probe_error_kind::INPUT, std::move(err.value())};
    }

    uint8_vector request = socks5::make_request(socks5::S5CMD_CONNECT, dst);
    if (auto e = stream.write({request.data(), request.size()}); e.has_value()) {
        warn("write CONNECT failed: " + e->description);
        return transport_error(std::move(e->description));
    }

    socks5::reply_header reply = {};
    if (auto e = stream.read_exact((uint8_t *) &reply, sizeof(reply)); e.has_value()) {
        warn("read CONNECT reply header failed: " + e->description);
        return transport_error(std::move(e->description));
    }
    if (reply.ver != socks5::SVN_5) {
        warn(SA_FMT("unexpected reply version: 0x{:02x}", reply.ver));
        return protocol_error("bad connect reply version");
    }
    if (reply.rep != socks5::S5RS_SUCCEEDED) {
        std::string msg = socks5::reply_status_to_string(reply.rep);
        warn("connect failed: " + msg);
        summary.latencies_ms["connect"] = millis_since(t);
        return protocol_error("socks connect failed: " + msg);
    }
    if (err_string e = discard_bound_address(reply.atyp); e.has_value()) {
        warn("read CONNECT reply addr failed: " + e.value());
        return transport_error(std::move(e.value()));
    }
    summary.latencies_ms["connect"] = millis_since(t);

    summary.connect_ok = true;
    summary.features.ipv6 = dst.ipv6;
    return std::nullopt;
}

void socks_prober::udp_associate() {
    log_probe(this, trace, "...");

    utils::timer t;
    // a failure is reported as a warning only
    auto do_associate = [this]() -> err_string {
        uint8_vector request = socks5::make_udp_associate_request();
        if (auto e = stream.write({request.data(), request.size()}); e.has_value()) {
            return "write UDP ASSOCIATE failed: " + e->description;
        }
        socks5::reply_header reply = {};
        if (auto e = stream.read_exact((uint8_t *) &reply, sizeof(reply)); e.has_value()) {
            return "read UDP ASSOCIATE reply header failed: " + e->description;
        }
        if (reply.ver != socks5::SVN_5) {
            return SA_FMT("unexpected UDP ASSOCIATE reply version: 0x{:02x}", reply.ver);
        }
        if (reply.rep != socks5::S5RS_SUCCEEDED) {
            return "udp associate failed: " + socks5::reply_status_to_string(reply.rep);
        }
        if (err_string e = discard_bound_address(reply.atyp); e.has_value()) {
            return "read UDP ASSOCIATE bind addr failed: " + e.value();
        }
        return std::nullopt;
    };

    err_string e = do_associate();
    summary.latencies_ms["udp_associate"] = millis_since(t);
    if (e.has_value()) {
        warn(std::move(e.value()));
        return;
    }
    summary.udp_ok = true;
}

err_string socks_prober::discard_bound_address(uint8_t atyp) {
    std::optional<size_t> size = socks5::fixed_bound_address_size(atyp);
    if (!size.has_value()) {
        return SA_FMT("unknown reply ATYP: 0x{:02x}", atyp);
    }
    if (size.value() == 0) {
        uint8_t length = 0;
        if (auto e = stream.read_exact(&length, sizeof(length)); e.has_value()) {
            return std::move(e->description);
        }
        if (length == 0) {
            return "invalid domain length in reply";
        }
        size = length + 2;
    }
    if (auto e = stream.discard(size.value()); e.has_value()) {
        return std::move(e->description);
    }
    return std::nullopt;
}

static void run_probe(cancel_context &ctx, const probe_config &config, probe_result &result) {
    static const logger log = create_logger("probe");

    auto [server, server_err] = utils::parse_host_port_strict(config.server);
    if (server_err.has_value()) {
        result.error = {probe_error_kind::INPUT, "invalid socks server: " + server_err.value()};
        return;
    }
    milliseconds timeout = (config.timeout > milliseconds{0}) ? config.timeout : probe_config::DEFAULT_TIMEOUT;
    timeout = std::min(timeout, probe_config::MAX_TIMEOUT);
    std::string_view target_str = config.connect_target;
    if (utils::is_blank(target_str)) {
        target_str = probe_config::DEFAULT_CONNECT_TARGET;
    }
    auto [target, target_err] = utils::parse_host_port_strict(target_str);
    if (target_err.has_value()) {
        result.error = {probe_error_kind::INPUT, "invalid connect target: " + target_err.value()};
        return;
    }

    dbglog(log, "Probing {} (target={}, timeout={}, udp={})", server.str(), target.str(), timeout, config.udp_test);

    {
        // the connection is closed when the prober goes out of scope
        socks_prober prober(ctx, steady_clock::now() + timeout, result.summary);
        result.error = prober.tcp_connect(server);
        if (!result.error.has_value()) {
            result.error = prober.handshake(config.auth);
        }
        if (!result.error.has_value()) {
            result.error = prober.connect(target);
        }
        if (!result.error.has_value() && config.udp_test) {
            prober.udp_associate();
        }
    }

    if (result.error.has_value()) {
        infolog(log, "Probe of {} failed: {}", server.str(), result.error->description);
    } else {
        infolog(log, "Probe of {} succeeded: auth={} udp_ok={}", server.str(),
                result.summary.features.auth.value_or("unknown"), result.summary.udp_ok);
    }
}

probe_result sa::probe_socks(cancel_context &ctx, const probe_config &config) {
    probe_result result;
    run_probe(ctx, config, result);
    result.summary.last_checked = system_clock::now();
    return result;
}
