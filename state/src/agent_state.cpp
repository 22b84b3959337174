#include <algorithm>
#include <magic_enum.hpp>
#include <sa_agent_state.h>
#include <sa_utils.h>

using namespace std::chrono;

std::string sa::agent_state_to_string(agent_state state) {
    return utils::to_lower(magic_enum::enum_name(state));
}

sa::state_store::state_store()
        : m_log(create_logger("state")) {
}

sa::state_snapshot sa::state_store::get_snapshot() const {
    std::shared_lock l(m_mtx);
    return m_state;
}

bool sa::state_store::is_transition_allowed(agent_state from, agent_state to) {
    switch (from) {
    case agent_state::INACTIVE:
        return to == agent_state::STARTING || to == agent_state::ACTIVE;
    case agent_state::STARTING:
        return to == agent_state::ACTIVE || to == agent_state::ERROR || to == agent_state::INACTIVE;
    case agent_state::ACTIVE:
        return to == agent_state::DEGRADED || to == agent_state::STOPPING || to == agent_state::ERROR;
    case agent_state::DEGRADED:
        return to == agent_state::ACTIVE || to == agent_state::STOPPING || to == agent_state::ERROR;
    case agent_state::STOPPING:
        return to == agent_state::INACTIVE || to == agent_state::ERROR;
    case agent_state::ERROR:
        return to == agent_state::INACTIVE || to == agent_state::STARTING;
    }
    return false;
}

std::optional<sa::state_error> sa::state_store::set_agent_state(agent_state next) {
    agent_state current;
    {
        std::unique_lock l(m_mtx);
        current = m_state.state;
        if (current == next) {
            return std::nullopt;
        }
        if (!is_transition_allowed(current, next)) {
            l.unlock();
            dbglog(m_log, "Rejected transition {} -> {}",
                    agent_state_to_string(current), agent_state_to_string(next));
            return state_error::INVALID_TRANSITION;
        }

        switch (next) {
        case agent_state::ACTIVE:
            if (!m_state.started_at.has_value()) {
                m_state.started_at = system_clock::now();
            }
            break;
        case agent_state::INACTIVE:
            m_state.started_at.reset();
            break;
        default:
            break;
        }
        m_state.state = next;
    }

    infolog(m_log, "Agent state: {} -> {}", agent_state_to_string(current), agent_state_to_string(next));
    return std::nullopt;
}

void sa::state_store::set_started_at(std::optional<system_clock::time_point> time) {
    std::unique_lock l(m_mtx);
    m_state.started_at = time;
}

milliseconds sa::state_store::uptime() const {
    std::shared_lock l(m_mtx);
    if (!m_state.started_at.has_value()) {
        return milliseconds{0};
    }
    return std::max(duration_cast<milliseconds>(system_clock::now() - m_state.started_at.value()), milliseconds{0});
}

void sa::state_store::append_warning(std::string msg) {
    if (msg.empty()) {
        return;
    }
    std::unique_lock l(m_mtx);
    m_state.warnings.emplace_back(std::move(msg));
}

void sa::state_store::clear_warnings() {
    std::unique_lock l(m_mtx);
    m_state.warnings.clear();
}

void sa::state_store::update_tun(tun_snapshot tun) {
    std::unique_lock l(m_mtx);
    m_state.tun = std::move(tun);
}

void sa::state_store::update_routes(route_snapshot routes) {
    std::unique_lock l(m_mtx);
    m_state.routes = std::move(routes);
}

void sa::state_store::update_tun2socks(tun2socks_snapshot tun2socks) {
    std::unique_lock l(m_mtx);
    m_state.tun2socks = tun2socks;
}

void sa::state_store::update_probe(probe_summary summary) {
    std::unique_lock l(m_mtx);
    m_state.last_probe = std::move(summary);
}

void sa::state_store::reset(bool clear_lifecycle) {
    {
        std::unique_lock l(m_mtx);
        if (clear_lifecycle) {
            m_state.state = agent_state::INACTIVE;
            m_state.started_at.reset();
        }
        m_state.warnings.clear();
        m_state.tun = {};
        m_state.routes = {};
        m_state.tun2socks = {};
        m_state.last_probe = {};
    }
    dbglog(m_log, "State reset (lifecycle {})", clear_lifecycle ? "cleared" : "kept");
}
