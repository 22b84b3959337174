#include <sa_cancel.h>

sa::cancel_context::cancel_context(clock::time_point deadline)
        : m_deadline(deadline) {
}

void sa::cancel_context::cancel() {
    std::scoped_lock l(m_mtx);
    if (m_cancelled) {
        return;
    }
    m_cancelled = true;
    for (auto &s : m_subscribers) {
        s.cb();
    }
}

bool sa::cancel_context::is_cancelled() const {
    std::scoped_lock l(m_mtx);
    return m_cancelled;
}

bool sa::cancel_context::is_done() const {
    return is_cancelled() || (m_deadline.has_value() && clock::now() >= m_deadline.value());
}

std::optional<sa::cancel_context::clock::time_point> sa::cancel_context::deadline() const {
    return m_deadline;
}

sa::cancel_context::subscription_id sa::cancel_context::subscribe(std::function<void()> cb) {
    std::scoped_lock l(m_mtx);
    subscription_id id = m_next_id++;
    if (m_cancelled) {
        cb();
    }
    m_subscribers.push_back({id, std::move(cb)});
    return id;
}

void sa::cancel_context::unsubscribe(subscription_id id) {
    std::scoped_lock l(m_mtx);
    m_subscribers.remove_if([id](const subscriber &s) { return s.id == id; });
}
