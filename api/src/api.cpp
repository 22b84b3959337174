#include <algorithm>
#include <initializer_list>
#include <limits>
#include <sa_api.h>
#include <sa_utils.h>

using namespace sa;
using namespace std::chrono;

static constexpr int MIN_MTU = 576;
static constexpr int MAX_MTU = 9000;

namespace {

/**
 * Typed access to the fields of a request object. Absent and `null` fields keep their defaults.
 */
class field_reader {
public:
    explicit field_reader(const api::json &obj) : m_obj(obj) {}

    err_string read(const char *name, std::string &out) const {
        return read_as(name, out, &api::json::is_string, "a string");
    }

    err_string read(const char *name, bool &out) const {
        return read_as(name, out, &api::json::is_boolean, "a boolean");
    }

    template<typename T>
    err_string read_integer(const char *name, T &out) const {
        auto it = m_obj.find(name);
        if (it == m_obj.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_number_integer()) {
            return SA_FMT("field \"{}\" must be an integer", name);
        }
        if (it->is_number_unsigned() ? it->template get<uint64_t>() > (uint64_t) std::numeric_limits<T>::max()
                                     : (it->template get<int64_t>() < (int64_t) std::numeric_limits<T>::min()
                                             || it->template get<int64_t>() > (int64_t) std::numeric_limits<T>::max())) {
            return SA_FMT("field \"{}\" is out of range", name);
        }
        out = it->template get<T>();
        return std::nullopt;
    }

    err_string read(const char *name, std::vector<std::string> &out) const {
        auto it = m_obj.find(name);
        if (it == m_obj.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_array() || !std::all_of(it->begin(), it->end(), [](const api::json &v) { return v.is_string(); })) {
            return SA_FMT("field \"{}\" must be an array of strings", name);
        }
        out = it->get<std::vector<std::string>>();
        return std::nullopt;
    }

    /**
     * Read an `{"username":..., "password":...}` object. Empty credentials are dropped.
     */
    err_string read(const char *name, std::optional<proxy_auth> &out) const {
        auto it = m_obj.find(name);
        if (it == m_obj.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_object()) {
            return SA_FMT("field \"{}\" must be an object", name);
        }
        proxy_auth auth;
        field_reader nested(*it);
        if (err_string e = nested.read("username", auth.username); e.has_value()) {
            return e;
        }
        if (err_string e = nested.read("password", auth.password); e.has_value()) {
            return e;
        }
        if (!auth.username.empty() || !auth.password.empty()) {
            out = std::move(auth);
        }
        return std::nullopt;
    }

    /**
     * @return an error naming the first field which is not in `known`
     */
    err_string check_known(std::initializer_list<std::string_view> known) const {
        for (auto it = m_obj.begin(); it != m_obj.end(); ++it) {
            if (known.end() == std::find(known.begin(), known.end(), it.key())) {
                return SA_FMT("unknown field \"{}\"", it.key());
            }
        }
        return std::nullopt;
    }

private:
    const api::json &m_obj;

    template<typename T>
    err_string read_as(const char *name, T &out, bool (api::json::*check)() const noexcept,
            std::string_view what) const {
        auto it = m_obj.find(name);
        if (it == m_obj.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!((*it).*check)()) {
            return SA_FMT("field \"{}\" must be {}", name, what);
        }
        out = it->template get<T>();
        return std::nullopt;
    }
};

} // namespace

static std::pair<api::json, err_string> parse_object(std::string_view body) {
    api::json obj;
    try {
        obj = api::json::parse(body.begin(), body.end());
    } catch (const nlohmann::json::parse_error &e) {
        // the parser's own message quotes the input, which may be invalid UTF-8
        return {{}, SA_FMT("invalid JSON: syntax error at byte {}", e.byte)};
    } catch (const nlohmann::json::exception &e) {
        return {{}, SA_FMT("invalid JSON: {}", e.what())};
    }
    if (!obj.is_object()) {
        return {{}, "invalid JSON: request body must be an object"};
    }
    return {std::move(obj), std::nullopt};
}

probe_config api::probe_request::to_probe_config() const {
    probe_config config;
    config.server = this->socks_server;
    config.timeout = milliseconds{this->timeout_ms};
    config.auth = this->auth;
    config.connect_target = this->connect_target;
    config.udp_test = this->udp_test;
    return config;
}

std::pair<api::probe_request, err_string> api::parse_probe_request(std::string_view body) {
    auto [obj, err] = parse_object(body);
    if (err.has_value()) {
        return {{}, std::move(err)};
    }

    probe_request req;
    field_reader reader(obj);
    for (err_string e : {reader.read("socks_server", req.socks_server),
                 reader.read_integer("timeout_ms", req.timeout_ms),
                 reader.read("auth", req.auth),
                 reader.read("connect_target", req.connect_target),
                 reader.read("udp_test", req.udp_test)}) {
        if (e.has_value()) {
            return {{}, "invalid JSON: " + e.value()};
        }
    }

    if (req.socks_server.empty()) {
        return {{}, "socks_server is required"};
    }
    if (req.timeout_ms < 0) {
        return {{}, "timeout_ms must be >= 0"};
    }
    return {std::move(req), std::nullopt};
}

std::pair<api::start_request, err_string> api::parse_start_request(std::string_view body) {
    auto [obj, err] = parse_object(body);
    if (err.has_value()) {
        return {{}, std::move(err)};
    }

    start_request req;
    field_reader reader(obj);
    for (err_string e : {reader.check_known({"socks_server", "mtu", "auth", "bypass_hosts"}),
                 reader.read("socks_server", req.socks_server),
                 reader.read_integer("mtu", req.mtu),
                 reader.read("auth", req.auth),
                 reader.read("bypass_hosts", req.bypass_hosts)}) {
        if (e.has_value()) {
            return {{}, "invalid JSON: " + e.value()};
        }
    }

    if (req.socks_server.empty()) {
        return {{}, "socks_server is required"};
    }
    if (req.mtu < 0 || (req.mtu > 0 && (req.mtu < MIN_MTU || req.mtu > MAX_MTU))) {
        return {{}, SA_FMT("mtu must be 0 or between {} and {}", MIN_MTU, MAX_MTU)};
    }
    return {std::move(req), std::nullopt};
}

err_string api::parse_stop_request(std::string_view body) {
    auto [obj, err] = parse_object(body);
    if (err.has_value()) {
        return err;
    }
    if (err_string e = field_reader(obj).check_known({}); e.has_value()) {
        return "invalid JSON: " + e.value();
    }
    return std::nullopt;
}

// Empty lists are rendered as `null`
static api::json string_list(const std::vector<std::string> &list) {
    return list.empty() ? api::json(nullptr) : api::json(list);
}

api::json api::probe_view(const probe_summary &summary) {
    json latencies = nullptr;
    for (const auto &[step, ms] : summary.latencies_ms) {
        latencies[step] = ms;
    }

    json view;
    view["reachable"] = summary.reachable;
    view["socks_ok"] = summary.socks_ok;
    view["connect_ok"] = summary.connect_ok;
    view["udp_ok"] = summary.udp_ok;
    view["latencies_ms"] = std::move(latencies);
    view["features"] = {
            {"auth", summary.features.auth.value_or("")},
            {"ipv6", summary.features.ipv6},
            {"udp", summary.features.udp},
    };
    view["last_checked"] = utils::time_to_rfc3339(summary.last_checked);
    view["warnings"] = string_list(summary.warnings);
    return view;
}

api::json api::status_view(const state_snapshot &snapshot, system_clock::time_point now) {
    std::string started_at;
    int64_t uptime_sec = 0;
    if (snapshot.started_at.has_value()) {
        started_at = utils::time_to_rfc3339(snapshot.started_at.value());
        uptime_sec = std::max(duration_cast<seconds>(now - snapshot.started_at.value()).count(), (seconds::rep) 0);
    }

    json view;
    view["state"] = agent_state_to_string(snapshot.state);
    view["started_at"] = started_at;
    view["uptime_sec"] = uptime_sec;
    view["warnings"] = string_list(snapshot.warnings);
    view["tun"] = {
            {"name", snapshot.tun.name},
            {"up", snapshot.tun.up},
            {"mtu", snapshot.tun.mtu},
            {"local_ip", snapshot.tun.local_ip},
            {"peer_ip", snapshot.tun.peer_ip},
    };
    view["routes"] = {
            {"default_via", snapshot.routes.default_via},
            {"lan_cidrs", string_list(snapshot.routes.lan_cidrs)},
            {"bypass_hosts", string_list(snapshot.routes.bypass_hosts)},
            {"proxy_host_route", snapshot.routes.proxy_host_route},
            {"original_gateway", snapshot.routes.original_gateway},
    };
    view["tun2socks"] = {
            {"pid", snapshot.tun2socks.pid},
            {"uptime_sec", snapshot.tun2socks.uptime_sec},
            {"tcp_ok", snapshot.tun2socks.tcp_ok},
            {"udp_ok", snapshot.tun2socks.udp_ok},
    };
    view["last_probe"] = probe_view(snapshot.last_probe);
    view["generated_at"] = utils::time_to_rfc3339(now);
    return view;
}

api::json api::health_view(system_clock::time_point now) {
    json view;
    view["status"] = "ok";
    view["timestamp"] = utils::time_to_rfc3339(now);
    return view;
}

api::json api::error_view(std::string_view error, system_clock::time_point now) {
    json view;
    view["error"] = error;
    view["timestamp"] = utils::time_to_rfc3339(now);
    return view;
}
