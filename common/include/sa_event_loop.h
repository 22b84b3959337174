#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <thread>
#include <event2/event.h>
#include <sa_defs.h>

namespace sa {

class event_loop;
using event_loop_ptr = std::unique_ptr<event_loop>;

/**
 * Libevent base running on a dedicated thread, with a queue of tasks executed on that thread
 */
class event_loop {
public:
    /**
     * @param run_immediately if true the loop thread is started right away
     * @return the loop, or nullptr if libevent failed to initialize
     */
    static event_loop_ptr create(bool run_immediately = true);

    ~event_loop();

    event_loop(const event_loop &) = delete;
    event_loop &operator=(const event_loop &) = delete;
    event_loop(event_loop &&) = delete;
    event_loop &operator=(event_loop &&) = delete;

    /**
     * Start the loop thread. No-op if it is already running.
     */
    void start();

    /**
     * Queue a task. Tasks run in submission order on the loop thread.
     * Tasks still queued when the loop exits are run before the thread finishes.
     */
    void submit(std::function<void()> task);

    /**
     * Ask the loop to exit. Thread-safe.
     */
    void stop();

    /**
     * Wait for the loop thread to finish
     */
    void join();

    event_base *c_base();

private:
    std::unique_ptr<event_base, ftor<&event_base_free>> m_base;
    std::unique_ptr<event, ftor<&event_free>> m_wakeup;
    std::thread m_thread;
    with_mtx<std::deque<std::function<void()>>> m_tasks;

    event_loop() = default;

    void run();
    void run_tasks();

    static void on_wakeup(evutil_socket_t, short, void *arg);
};

/**
 * Enable libevent locking and route libevent's diagnostics into the `LIBEVENT` logger.
 * Idempotent; must be called before creating a base which is used from several threads.
 */
void ensure_libevent_threads();

} // namespace sa
