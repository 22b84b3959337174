#include <algorithm>
#include <atomic>
#include <utility>
#include <vector>
#include <event2/buffer.h>
#include <event2/thread.h>
#include <event2/util.h>
#include <sa_blocking_stream.h>
#include <sa_event_loop.h>
#include <sa_utils.h>

#define log_stream(s_, lvl_, fmt_, ...) lvl_##log((s_)->log, "[id={}] {}(): " fmt_, (s_)->id, __func__, ##__VA_ARGS__)

using namespace sa;
using namespace std::chrono;

static std::atomic_size_t next_id = {0};

blocking_stream::blocking_stream(cancel_context &ctx, std::optional<steady_clock::time_point> deadline)
        : log(create_logger("blocking_stream"))
        , id(next_id.fetch_add(1, std::memory_order_relaxed))
        , ctx(ctx) {
    ensure_libevent_threads();

    this->base.reset(event_base_new());
    if (this->base == nullptr) {
        log_stream(this, err, "Failed to create event base");
        this->ctx_subscription = this->ctx.subscribe([] {});
        return;
    }
    evthread_make_base_notifiable(this->base.get());

    this->deadline_timer.reset(evtimer_new(this->base.get(), on_deadline, this));
    this->cancel_event.reset(event_new(this->base.get(), -1, 0, on_cancel, this));

    std::optional<steady_clock::time_point> effective = deadline;
    if (std::optional<steady_clock::time_point> d = ctx.deadline();
            d.has_value() && (!effective.has_value() || d.value() < effective.value())) {
        effective = d;
    }
    if (effective.has_value() && this->deadline_timer != nullptr) {
        auto left = std::max(duration_cast<microseconds>(effective.value() - steady_clock::now()), microseconds{0});
        const timeval tv = utils::duration_to_timeval(left);
        evtimer_add(this->deadline_timer.get(), &tv);
        log_stream(this, trace, "Deadline in {}", duration_cast<milliseconds>(left));
    }

    event *cancel_ev = this->cancel_event.get();
    this->ctx_subscription = this->ctx.subscribe([cancel_ev] {
        if (cancel_ev != nullptr) {
            event_active(cancel_ev, EV_TIMEOUT, 0);
        }
    });
}

blocking_stream::~blocking_stream() {
    // after this the cancel event can't be activated from another thread
    this->ctx.unsubscribe(this->ctx_subscription);
    this->bev.reset();
    this->dns_base.reset();
}

std::optional<blocking_stream::error> blocking_stream::connect(const utils::host_port &peer) {
    log_stream(this, trace, "{}", peer.str());

    if (this->base == nullptr || this->deadline_timer == nullptr || this->cancel_event == nullptr) {
        return {{-1, "Failed to initialize event base"}};
    }
    if (this->bev != nullptr) {
        return {{-1, "Already connected"}};
    }
    if (this->terminal_error.has_value()) {
        return this->terminal_error;
    }

    this->bev.reset(bufferevent_socket_new(this->base.get(), -1, BEV_OPT_CLOSE_ON_FREE));
    if (this->bev == nullptr) {
        return {{-1, "Failed to create socket buffer event"}};
    }
    bufferevent_setcb(this->bev.get(), on_read, on_write, on_event, this);
    if (0 != bufferevent_enable(this->bev.get(), EV_READ | EV_WRITE)) {
        return {{-1, "Failed to enable socket events"}};
    }

    int r;
    socket_address addr(peer.host, peer.port);
    if (addr.valid()) {
        r = bufferevent_socket_connect(this->bev.get(), addr.c_sockaddr(), (int) addr.c_socklen());
    } else {
        this->dns_base.reset(evdns_base_new(this->base.get(), EVDNS_BASE_INITIALIZE_NAMESERVERS));
        if (this->dns_base == nullptr) {
            return {{-1, "Failed to initialize DNS resolver"}};
        }
        r = bufferevent_socket_connect_hostname(this->bev.get(), this->dns_base.get(), AF_UNSPEC,
                peer.host.c_str(), peer.port);
    }
    if (r != 0) {
        log_stream(this, dbg, "Failed to start connection");
        if (this->terminal_error.has_value()) {
            return this->terminal_error;
        }
        int err = evutil_socket_geterror(bufferevent_getfd(this->bev.get()));
        return {{err != 0 ? err : -1, err != 0 ? evutil_socket_error_to_string(err) : "Failed to start connection"}};
    }

    return this->run_until(wait_for::CONNECTED);
}

std::optional<blocking_stream::error> blocking_stream::write(uint8_view data) {
    log_stream(this, trace, "{}", data.size());

    if (auto e = this->check_usable(); e.has_value()) {
        return e;
    }
    if (0 != bufferevent_write(this->bev.get(), data.data(), data.size())) {
        int err = evutil_socket_geterror(bufferevent_getfd(this->bev.get()));
        return {{err != 0 ? err : -1, err != 0 ? evutil_socket_error_to_string(err) : "Failed to write data"}};
    }
    if (evbuffer_get_length(bufferevent_get_output(this->bev.get())) == 0) {
        return std::nullopt;
    }

    return this->run_until(wait_for::FLUSHED);
}

std::optional<blocking_stream::error> blocking_stream::read_exact(uint8_t *buf, size_t n) {
    log_stream(this, trace, "{}", n);

    if (this->bev == nullptr) {
        return this->check_usable();
    }

    evbuffer *input = bufferevent_get_input(this->bev.get());
    if (evbuffer_get_length(input) < n) {
        if (auto e = this->check_usable(); e.has_value()) {
            return e;
        }
        this->bytes_wanted = n;
        if (auto e = this->run_until(wait_for::READABLE); e.has_value()) {
            return e;
        }
    }

    if (n != 0 && n != bufferevent_read(this->bev.get(), buf, n)) {
        return {{-1, "Failed to read data from buffer"}};
    }
    return std::nullopt;
}

std::optional<blocking_stream::error> blocking_stream::discard(size_t n) {
    std::vector<uint8_t> scratch(n);
    return this->read_exact(scratch.data(), n);
}

std::optional<socket_address> blocking_stream::get_peer_address() const {
    if (this->bev == nullptr) {
        return std::nullopt;
    }
    return socket_address::peer_of(bufferevent_getfd(this->bev.get()));
}

std::optional<blocking_stream::error> blocking_stream::check_usable() const {
    if (this->terminal_error.has_value()) {
        return this->terminal_error;
    }
    if (this->bev == nullptr) {
        return {{-1, "Not connected"}};
    }
    return std::nullopt;
}

std::optional<blocking_stream::error> blocking_stream::run_until(wait_for what) {
    // a failure may have been reported synchronously while the operation was being started
    if (this->terminal_error.has_value()) {
        return this->terminal_error;
    }

    this->waiting = what;
    this->pending_error.reset();
    while (this->waiting != wait_for::NOTHING) {
        int r = event_base_loop(this->base.get(), EVLOOP_ONCE);
        if (r < 0) {
            this->waiting = wait_for::NOTHING;
            return {{-1, "Event loop failed"}};
        }
        if (r == 1) {
            this->waiting = wait_for::NOTHING;
            return {{-1, "No pending events in event loop"}};
        }
    }

    return std::exchange(this->pending_error, std::nullopt);
}

void blocking_stream::finish(std::optional<error> e) {
    this->waiting = wait_for::NOTHING;
    this->pending_error = std::move(e);
}

void blocking_stream::on_read(bufferevent *bev, void *arg) {
    auto *self = (blocking_stream *) arg;
    size_t available = evbuffer_get_length(bufferevent_get_input(bev));
    log_stream(self, trace, "{} bytes available", available);
    if (self->waiting == wait_for::READABLE && available >= self->bytes_wanted) {
        self->finish(std::nullopt);
    }
}

void blocking_stream::on_write(bufferevent *, void *arg) {
    auto *self = (blocking_stream *) arg;
    log_stream(self, trace, "Flushed");
    if (self->waiting == wait_for::FLUSHED) {
        self->finish(std::nullopt);
    }
}

void blocking_stream::on_event(bufferevent *bev, short what, void *arg) {
    auto *self = (blocking_stream *) arg;

    if (what & BEV_EVENT_CONNECTED) {
        log_stream(self, trace, "Connected");
        if (self->waiting == wait_for::CONNECTED) {
            self->finish(std::nullopt);
        }
    } else if (what & BEV_EVENT_ERROR) {
        error error = {-1};
        if (int dns_err = bufferevent_socket_get_dns_error(bev); dns_err != 0) {
            error.description = SA_FMT("lookup failed: {}", evutil_gai_strerror(dns_err));
        } else if (int err = evutil_socket_geterror(bufferevent_getfd(bev)); err != 0) {
            error = {err, evutil_socket_error_to_string(err)};
        } else {
            error.description = "Unknown error";
        }
        log_stream(self, trace, "Error: {} ({})", error.description, error.code);
        self->terminal_error = error;
        self->finish(std::move(error));
    } else if (what & BEV_EVENT_EOF) {
        log_stream(self, trace, "EOF");
        self->terminal_error = {-1, "unexpected EOF"};
        self->finish(self->terminal_error);
    } else {
        log_stream(self, trace, "Unexpected event: {}", what);
    }
}

void blocking_stream::on_deadline(evutil_socket_t, short, void *arg) {
    auto *self = (blocking_stream *) arg;
    log_stream(self, dbg, "Timed out");
    self->terminal_error = {utils::SA_ETIMEDOUT, "i/o timeout"};
    self->finish(self->terminal_error);
}

void blocking_stream::on_cancel(evutil_socket_t, short, void *arg) {
    auto *self = (blocking_stream *) arg;
    log_stream(self, dbg, "Cancelled");
    if (!self->terminal_error.has_value()) {
        self->terminal_error = {utils::SA_ECANCELED, "operation was cancelled"};
    }
    self->finish(self->terminal_error);
}
