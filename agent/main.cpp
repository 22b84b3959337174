#include <algorithm>
#include <csignal>
#include <cstdio>
#include <optional>
#include <string>
#include <pthread.h>
#include <cxxopts.hpp>
#include <sa_agent_state.h>
#include <sa_control_server.h>
#include <sa_logger.h>
#include <sa_utils.h>

using namespace std::chrono;

struct agent_settings {
    /** Control API listen address */
    std::string listen_address;
    /** Graceful shutdown timeout of the control API */
    seconds shutdown_timeout;
    sa::log_level log_level;

    static const agent_settings &get_default() {
        static const agent_settings settings{
                sa::control_server_settings::get_default().listen_address,
                sa::control_server_settings::get_default().shutdown_timeout,
                sa::INFO,
        };
        return settings;
    }
};

int main(int argc, char **argv) {
    agent_settings settings = agent_settings::get_default();

    cxxopts::Options args("socksagent", "Local control plane for routing traffic through a SOCKS5 proxy");
    // clang-format off
    args.add_options()
            ("listen", "HTTP listen address",
                cxxopts::value<std::string>()->default_value(settings.listen_address))
            ("shutdown-secs", "Graceful shutdown timeout in seconds",
                cxxopts::value<int>()->default_value(std::to_string(settings.shutdown_timeout.count())))
            ("l,log-level", "Logging level. Possible values: error, warn, info, debug, trace.",
                cxxopts::value<std::string>()->default_value("info"))
            ("h,help", "Print usage");
    // clang-format on

    try {
        auto result = args.parse(argc, argv);
        if (result.count("help")) {
            fmt::print("{}\n", args.help());
            return 0;
        }
        settings.listen_address = result["listen"].as<std::string>();
        settings.shutdown_timeout = seconds{std::max(result["shutdown-secs"].as<int>(), 0)};
        std::optional<sa::log_level> level = sa::parse_log_level(result["log-level"].as<std::string>());
        if (!level.has_value()) {
            fmt::print(stderr, "Unknown log level: {}\n", result["log-level"].as<std::string>());
            return 1;
        }
        settings.log_level = level.value();
    } catch (const std::exception &e) {
        fmt::print(stderr, "{}\n{}\n", e.what(), args.help());
        return 1;
    }

    sa::set_default_log_level(settings.log_level);
    sa::logger log = sa::create_logger("agent");

    std::signal(SIGPIPE, SIG_IGN);
    // Block SIGINT and SIGTERM before any thread is started, they will be waited using sigwait()
    sigset_t sigset;
    sigemptyset(&sigset);
    sigaddset(&sigset, SIGINT);
    sigaddset(&sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigset, nullptr);

    sa::state_store state;

    sa::control_server_settings server_settings = sa::control_server_settings::get_default();
    server_settings.listen_address = settings.listen_address;
    server_settings.shutdown_timeout = settings.shutdown_timeout;
    auto [server, err] = sa::control_server::create_and_listen(server_settings, state);
    if (err.has_value()) {
        errlog(log, "Failed to start control API: {}", err.value());
        return 1;
    }
    infolog(log, "Control API listening on {}", server->get_listen_address().str());

    int signum = 0;
    sigwait(&sigset, &signum);
    infolog(log, "Received signal {}, shutting down", signum);

    server->shutdown();
    server->await_shutdown();
    infolog(log, "Stopped");
    return 0;
}
