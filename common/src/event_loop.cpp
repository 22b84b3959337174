#include <csignal>
#include <mutex>
#include <pthread.h>
#include <event2/thread.h>
#include <sa_event_loop.h>
#include <sa_logger.h>

static void on_libevent_log(int severity, const char *msg) {
    static const sa::logger log = sa::create_logger("LIBEVENT");
    switch (severity) {
    case EVENT_LOG_DEBUG:
        dbglog(log, "{}", msg);
        break;
    case EVENT_LOG_MSG:
        infolog(log, "{}", msg);
        break;
    case EVENT_LOG_WARN:
        warnlog(log, "{}", msg);
        break;
    default:
        errlog(log, "{}", msg);
        break;
    }
}

void sa::ensure_libevent_threads() {
    static std::once_flag once;
    std::call_once(once, [] {
        event_set_log_callback(on_libevent_log);
        if (0 != evthread_use_pthreads()) {
            on_libevent_log(EVENT_LOG_ERR, "Failed to enable pthreads locking");
        }
    });
}

sa::event_loop_ptr sa::event_loop::create(bool run_immediately) {
    ensure_libevent_threads();

    event_loop_ptr loop(new event_loop);
    loop->m_base.reset(event_base_new());
    if (loop->m_base == nullptr || 0 != evthread_make_base_notifiable(loop->m_base.get())) {
        return nullptr;
    }
    loop->m_wakeup.reset(event_new(loop->m_base.get(), -1, 0, on_wakeup, loop.get()));
    if (loop->m_wakeup == nullptr) {
        return nullptr;
    }

    if (run_immediately) {
        loop->start();
    }
    return loop;
}

sa::event_loop::~event_loop() {
    stop();
    join();
    // tasks may hold references to the base
    m_tasks.val.clear();
    m_wakeup.reset();
    m_base.reset();
}

void sa::event_loop::start() {
    if (m_thread.joinable()) {
        return;
    }
    m_thread = std::thread([this] {
        run();
    });
}

void sa::event_loop::submit(std::function<void()> task) {
    {
        std::scoped_lock l(m_tasks.mtx);
        m_tasks.val.emplace_back(std::move(task));
    }
    event_active(m_wakeup.get(), EV_TIMEOUT, 0);
}

void sa::event_loop::stop() {
    if (m_base == nullptr) {
        return;
    }
    event_base_loopexit(m_base.get(), nullptr);
}

void sa::event_loop::join() {
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

event_base *sa::event_loop::c_base() {
    return m_base.get();
}

void sa::event_loop::run() {
    // Writes to closed sockets must fail with EPIPE instead of killing the process
    sigset_t sigpipe;
    sigset_t old;
    sigemptyset(&sigpipe);
    sigaddset(&sigpipe, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &sigpipe, &old);

    event_base_loop(m_base.get(), EVLOOP_NO_EXIT_ON_EMPTY);
    run_tasks();

    pthread_sigmask(SIG_SETMASK, &old, nullptr);
}

void sa::event_loop::run_tasks() {
    std::deque<std::function<void()>> batch;
    {
        std::scoped_lock l(m_tasks.mtx);
        batch.swap(m_tasks.val);
    }
    // tasks submitted from these ones wake the loop again
    for (auto &task : batch) {
        task();
    }
}

void sa::event_loop::on_wakeup(evutil_socket_t, short, void *arg) {
    auto *self = (sa::event_loop *) arg;
    self->run_tasks();
}
