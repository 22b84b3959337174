#include <atomic>
#include <condition_variable>
#include <string>
#include <event2/buffer.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>
#include <event2/util.h>
#include <sa_api.h>
#include <sa_cancel.h>
#include <sa_control_server.h>
#include <sa_event_loop.h>
#include <sa_logger.h>
#include <sa_net_utils.h>
#include <sa_socks_probe.h>
#include <sa_utils.h>

#define log_server(s_, lvl_, fmt_, ...) lvl_##log((s_)->m_log, "[{}] {}(): " fmt_, (s_)->m_address.str(), __func__, ##__VA_ARGS__)

using namespace sa;
using namespace std::chrono;

enum http_status {
    /** The reply is sent later from another task */
    HS_DEFERRED = 0,
    HS_OK = 200,
    HS_BAD_REQUEST = 400,
    HS_NOT_FOUND = 404,
    HS_METHOD_NOT_ALLOWED = 405,
    HS_NOT_IMPLEMENTED = 501,
    HS_BAD_GATEWAY = 502,
    HS_SERVICE_UNAVAILABLE = 503,
};

static constexpr std::string_view CONTENT_TYPE = "application/json; charset=utf-8";

const control_server_settings &control_server_settings::get_default() {
    static const control_server_settings settings{
            "127.0.0.1:8787",
            seconds{5},
            seconds{10},
            1024 * 1024,
    };
    return settings;
}

static const char *method_name(evhttp_cmd_type cmd) {
    switch (cmd) {
    case EVHTTP_REQ_GET:
        return "GET";
    case EVHTTP_REQ_POST:
        return "POST";
    case EVHTTP_REQ_HEAD:
        return "HEAD";
    case EVHTTP_REQ_PUT:
        return "PUT";
    case EVHTTP_REQ_DELETE:
        return "DELETE";
    case EVHTTP_REQ_OPTIONS:
        return "OPTIONS";
    case EVHTTP_REQ_TRACE:
        return "TRACE";
    case EVHTTP_REQ_CONNECT:
        return "CONNECT";
    case EVHTTP_REQ_PATCH:
        return "PATCH";
    }
    return "UNKNOWN";
}

static std::string read_body(evhttp_request *req) {
    evbuffer *input = evhttp_request_get_input_buffer(req);
    std::string body(evbuffer_get_length(input), '\0');
    if (!body.empty()) {
        evbuffer_copyout(input, body.data(), body.size());
    }
    return body;
}

class http_control_server : public control_server {
public:
    http_control_server(const control_server_settings &settings, state_store &state)
            : m_settings(settings)
            , m_state(state) {
    }

    ~http_control_server() override {
        shutdown();
        await_shutdown();
    }

    err_string listen() {
        auto [host, port_str, split_err] = utils::split_host_port(m_settings.listen_address);
        if (split_err.has_value()) {
            return SA_FMT("Invalid listen address {}: {}", m_settings.listen_address, split_err.value());
        }
        std::optional<uint16_t> port = utils::to_integer<uint16_t>(port_str);
        if (!port.has_value()) {
            return SA_FMT("Invalid listen address {}: bad port", m_settings.listen_address);
        }
        std::string bind_host = host.empty() ? "0.0.0.0" : std::string(host);

        m_loop = event_loop::create(false);
        m_probe_loop = event_loop::create(false);
        if (m_loop == nullptr || m_probe_loop == nullptr) {
            return "Failed to create event loop";
        }
        m_http.reset(evhttp_new(m_loop->c_base()));
        if (m_http == nullptr) {
            return "Failed to create HTTP server";
        }
        evhttp_set_allowed_methods(m_http.get(),
                EVHTTP_REQ_GET | EVHTTP_REQ_POST | EVHTTP_REQ_HEAD | EVHTTP_REQ_PUT | EVHTTP_REQ_DELETE
                        | EVHTTP_REQ_OPTIONS | EVHTTP_REQ_PATCH);
        evhttp_set_timeout(m_http.get(), (int) m_settings.io_timeout.count());
        evhttp_set_max_body_size(m_http.get(), (ev_ssize_t) m_settings.max_body_size);
        evhttp_set_gencb(m_http.get(), on_request, this);

        evhttp_bound_socket *handle = evhttp_bind_socket_with_handle(m_http.get(), bind_host.c_str(), port.value());
        if (handle == nullptr) {
            int err = evutil_socket_geterror(-1);
            m_http.reset();
            return SA_FMT("Failed to listen on {}: {}", m_settings.listen_address, evutil_socket_error_to_string(err));
        }
        m_address = socket_address::local_of(evhttp_bound_socket_get_fd(handle)).value_or(socket_address{});

        m_loop->start();
        m_probe_loop->start();
        m_started = true;
        log_server(this, info, "Listening");
        return std::nullopt;
    }

    void shutdown() final {
        if (!m_started || m_shutdown_requested.exchange(true)) {
            return;
        }
        log_server(this, dbg, "Shutdown requested");

        m_loop->submit([this] {
            m_closing = true;
            // Queued behind the accepted probes, so their replies reach the HTTP loop before the teardown
            m_probe_loop->submit([this] {
                m_loop->submit([this] {
                    m_http.reset();
                    m_loop->stop();
                    std::scoped_lock l(m_stopped.mtx);
                    m_stopped.val = true;
                    m_stopped_cv.notify_all();
                });
            });
        });
    }

    void await_shutdown() final {
        if (!m_started) {
            return;
        }
        {
            std::unique_lock l(m_stopped.mtx);
            if (!m_stopped_cv.wait_for(l, m_settings.shutdown_timeout, [this] { return m_stopped.val; })) {
                log_server(this, warn, "Graceful shutdown timed out, cancelling in-flight requests");
                m_requests_ctx.cancel();
                m_stopped_cv.wait(l, [this] { return m_stopped.val; });
            }
        }
        m_loop->join();
        m_probe_loop->stop();
        m_probe_loop->join();
        log_server(this, info, "Stopped");
    }

    [[nodiscard]] socket_address get_listen_address() const override {
        return m_address;
    }

private:
    struct request_info {
        evhttp_cmd_type method;
        std::string path;
        std::string user_agent;
        utils::timer timer;
    };

    using handler = int (http_control_server::*)(evhttp_request *, const request_info &);

    struct route {
        std::string_view path;
        evhttp_cmd_type method;
        handler handle;
    };

    static const route ROUTES[5];

    logger m_log = create_logger("api");
    control_server_settings m_settings;
    state_store &m_state;
    event_loop_ptr m_loop;
    /** Probes run here so that they don't hold up the HTTP loop */
    event_loop_ptr m_probe_loop;
    std::unique_ptr<evhttp, ftor<&evhttp_free>> m_http;
    socket_address m_address;
    /** Cancelled if in-flight requests don't finish in time on shutdown */
    cancel_context m_requests_ctx;
    bool m_started = false;
    std::atomic_bool m_shutdown_requested = false;
    /** Set on the HTTP loop when shutdown begins, no probes are accepted after that */
    bool m_closing = false;
    with_mtx<bool> m_stopped = {false};
    std::condition_variable m_stopped_cv;

    static void on_request(evhttp_request *req, void *arg) {
        auto *self = (http_control_server *) arg;

        const evhttp_uri *uri = evhttp_request_get_evhttp_uri(req);
        const char *raw_path = (uri != nullptr) ? evhttp_uri_get_path(uri) : nullptr;
        const char *ua = evhttp_find_header(evhttp_request_get_input_headers(req), "User-Agent");
        request_info info{evhttp_request_get_command(req), (raw_path != nullptr) ? raw_path : "",
                (ua != nullptr) ? ua : "", {}};

        if (int status = self->dispatch(req, info); status != HS_DEFERRED) {
            self->log_request(info, status);
        }
    }

    void log_request(const request_info &info, int status) {
        infolog(m_log, "{} {} {} {}ms UA=\"{}\"", method_name(info.method), info.path, status,
                info.timer.elapsed<milliseconds>().count(), info.user_agent);
    }

    int dispatch(evhttp_request *req, const request_info &info) {
        for (const route &r : ROUTES) {
            if (r.path != info.path) {
                continue;
            }
            if (r.method != info.method) {
                return reply_error(req, HS_METHOD_NOT_ALLOWED, "method not allowed");
            }
            return (this->*r.handle)(req, info);
        }
        return reply_error(req, HS_NOT_FOUND, "not found");
    }

    int reply(evhttp_request *req, int status, const api::json &body) {
        evkeyvalq *headers = evhttp_request_get_output_headers(req);
        evhttp_add_header(headers, "Content-Type", CONTENT_TYPE.data());

        std::string payload = body.dump(-1, ' ', false, api::json::error_handler_t::replace);
        payload.push_back('\n');
        std::unique_ptr<evbuffer, ftor<&evbuffer_free>> buf(evbuffer_new());
        evbuffer_add(buf.get(), payload.data(), payload.size());
        evhttp_send_reply(req, status, nullptr, buf.get());
        return status;
    }

    int reply_error(evhttp_request *req, int status, std::string_view error) {
        return reply(req, status, api::error_view(error, system_clock::now()));
    }

    int handle_healthz(evhttp_request *req, const request_info &) {
        return reply(req, HS_OK, api::health_view(system_clock::now()));
    }

    int handle_status(evhttp_request *req, const request_info &) {
        return reply(req, HS_OK, api::status_view(m_state.get_snapshot(), system_clock::now()));
    }

    int handle_probe(evhttp_request *req, const request_info &info) {
        auto [request, err] = api::parse_probe_request(read_body(req));
        if (err.has_value()) {
            return reply_error(req, HS_BAD_REQUEST, err.value());
        }
        if (m_closing) {
            return reply_error(req, HS_SERVICE_UNAVAILABLE, "server is shutting down");
        }

        m_probe_loop->submit([this, req, info, config = request.to_probe_config()] {
            probe_result result = probe_socks(m_requests_ctx, config);
            // the summary is kept even if the probe failed
            m_state.update_probe(result.summary);

            m_loop->submit([this, req, info, result = std::move(result)] {
                int status = result.error.has_value()
                        ? reply_error(req, HS_BAD_GATEWAY, "probe failed: " + result.error->description)
                        : reply(req, HS_OK, api::probe_view(result.summary));
                log_request(info, status);
            });
        });
        return HS_DEFERRED;
    }

    int handle_start(evhttp_request *req, const request_info &) {
        auto [request, err] = api::parse_start_request(read_body(req));
        if (err.has_value()) {
            return reply_error(req, HS_BAD_REQUEST, err.value());
        }
        log_server(this, dbg, "Start requested via {}", request.socks_server);
        return reply_error(req, HS_NOT_IMPLEMENTED, "start not implemented yet");
    }

    int handle_stop(evhttp_request *req, const request_info &) {
        if (err_string err = api::parse_stop_request(read_body(req)); err.has_value()) {
            return reply_error(req, HS_NOT_IMPLEMENTED, err.value());
        }
        return reply_error(req, HS_NOT_IMPLEMENTED, "stop not implemented yet");
    }
};

const http_control_server::route http_control_server::ROUTES[5] = {
        {"/v1/healthz", EVHTTP_REQ_GET, &http_control_server::handle_healthz},
        {"/v1/status", EVHTTP_REQ_GET, &http_control_server::handle_status},
        {"/v1/probe", EVHTTP_REQ_POST, &http_control_server::handle_probe},
        {"/v1/start", EVHTTP_REQ_POST, &http_control_server::handle_start},
        {"/v1/stop", EVHTTP_REQ_POST, &http_control_server::handle_stop},
};

control_server::create_result control_server::create_and_listen(const control_server_settings &settings,
        state_store &state) {
    auto server = std::make_unique<http_control_server>(settings, state);
    if (err_string err = server->listen(); err.has_value()) {
        return {nullptr, std::move(err)};
    }
    return {std::move(server), std::nullopt};
}
