#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <fmt/chrono.h>
#include <magic_enum.hpp>
#include <spdlog/details/os.h>
#include <spdlog/sinks/base_sink.h>
#include <sa_logger.h>
#include <sa_utils.h>

static void write_to_stderr(sa::log_level level, const char *message, size_t length) {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = system_clock::to_time_t(now);
    tm local = {};
    localtime_r(&t, &local);
    fmt::print(stderr, "{:%Y-%m-%d %H:%M:%S}.{:03} [{}] {:5} {}", local, ms, spdlog::details::os::thread_id(),
            magic_enum::enum_name(level), std::string_view{message, length});
}

namespace {

// One sink shared by all loggers so that the output can be redirected at any time
class callback_sink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    void set_callback(sa::logger_cb cb) {
        std::scoped_lock l(mutex_);
        m_callback = cb ? std::move(cb) : write_to_stderr;
    }

protected:
    void sink_it_(const spdlog::details::log_msg &msg) override {
        spdlog::memory_buf_t line;
        formatter_->format(msg, line);
        m_callback((sa::log_level) msg.level, line.data(), line.size());
    }

    void flush_() override {
    }

private:
    sa::logger_cb m_callback = write_to_stderr;
};

struct logging_globals {
    std::shared_ptr<callback_sink> sink = std::make_shared<callback_sink>();
    std::atomic<sa::log_level> level = sa::INFO;
    std::mutex registry_mtx;

    logging_globals() {
        sink->set_pattern("[%n] %v");
    }
};

logging_globals &globals() {
    static logging_globals g;
    return g;
}

} // namespace

sa::logger sa::create_logger(const std::string &name) {
    logging_globals &g = globals();
    std::scoped_lock l(g.registry_mtx);
    if (logger existing = spdlog::get(name)) {
        return existing;
    }
    auto log = std::make_shared<spdlog::logger>(name, g.sink);
    log->set_level((spdlog::level::level_enum) g.level.load());
    spdlog::register_logger(log);
    return log;
}

void sa::set_default_log_level(log_level lvl) {
    logging_globals &g = globals();
    std::scoped_lock l(g.registry_mtx);
    g.level = lvl;
    spdlog::set_level((spdlog::level::level_enum) lvl);
}

std::optional<sa::log_level> sa::parse_log_level(std::string_view name) {
    std::string lowered = utils::to_lower(name);
    if (lowered == "error") {
        return ERR;
    }
    return magic_enum::enum_cast<log_level>(lowered, magic_enum::case_insensitive);
}

void sa::set_logger_callback(logger_cb cb) {
    globals().sink->set_callback(std::move(cb));
}
