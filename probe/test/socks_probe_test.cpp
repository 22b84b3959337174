#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <sa_logger.h>
#include <sa_socks_probe.h>
#include "scripted_socks_server.h"

using namespace std::chrono;
using sa::test::scripted_socks_server;

class socks_probe_test : public ::testing::Test {
protected:
    sa::cancel_context ctx;

    void SetUp() override {
        sa::set_default_log_level(sa::TRACE);
    }

    static sa::probe_config make_config(const scripted_socks_server &server) {
        sa::probe_config config;
        config.server = server.address();
        config.timeout = seconds{5};
        return config;
    }

    // Greeting -> no auth, CONNECT -> succeeded
    static void accept_no_auth(int fd) {
        if (scripted_socks_server::read_greeting(fd).empty()) {
            return;
        }
        scripted_socks_server::write_all(fd, {0x05, 0x00});
        if (!scripted_socks_server::read_request(fd).has_value()) {
            return;
        }
        scripted_socks_server::send_reply(fd, 0x00);
    }
};

TEST_F(socks_probe_test, no_auth_success) {
    std::mutex mtx;
    sa::uint8_vector offered;
    std::optional<scripted_socks_server::request> connect_request;
    scripted_socks_server server([&](int fd) {
        sa::uint8_vector methods = scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00});
        auto req = scripted_socks_server::read_request(fd);
        {
            std::scoped_lock l(mtx);
            offered = methods;
            connect_request = req;
        }
        scripted_socks_server::send_reply(fd, 0x00);
        scripted_socks_server::drain(fd);
    });

    auto before = system_clock::now();
    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_FALSE(result.error.has_value()) << result.error->description;

    const sa::probe_summary &s = result.summary;
    ASSERT_TRUE(s.reachable);
    ASSERT_TRUE(s.socks_ok);
    ASSERT_TRUE(s.connect_ok);
    ASSERT_FALSE(s.udp_ok);
    ASSERT_EQ(s.features.auth, "none");
    ASSERT_FALSE(s.features.ipv6);
    ASSERT_FALSE(s.features.udp);
    ASSERT_TRUE(s.warnings.empty());
    ASSERT_EQ(s.latencies_ms.size(), 3u);
    ASSERT_EQ(s.latencies_ms.count("tcp_connect"), 1u);
    ASSERT_EQ(s.latencies_ms.count("socks_handshake"), 1u);
    ASSERT_EQ(s.latencies_ms.count("connect"), 1u);
    for (const auto &[step, ms] : s.latencies_ms) {
        ASSERT_GE(ms, 0) << step;
    }
    ASSERT_GE(s.last_checked, before);

    std::scoped_lock l(mtx);
    ASSERT_EQ(offered, sa::uint8_vector({0x00}));
    ASSERT_TRUE(connect_request.has_value());
    ASSERT_EQ(connect_request->cmd, 0x01);
    // the default target is example.com:80
    ASSERT_EQ(connect_request->atyp, 0x03);
    ASSERT_EQ(std::string(connect_request->addr.begin(), connect_request->addr.end()), "example.com");
    ASSERT_EQ(connect_request->port, 80);
}

TEST_F(socks_probe_test, rejected_methods) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0xff});
        scripted_socks_server::drain(fd);
    });

    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->kind, sa::probe_error_kind::PROTOCOL);
    ASSERT_EQ(result.error->description, "proxy rejected offered methods");

    const sa::probe_summary &s = result.summary;
    ASSERT_TRUE(s.reachable);
    ASSERT_FALSE(s.socks_ok);
    ASSERT_FALSE(s.connect_ok);
    ASSERT_FALSE(s.features.auth.has_value());
    ASSERT_EQ(s.latencies_ms.count("tcp_connect"), 1u);
    ASSERT_EQ(s.latencies_ms.count("socks_handshake"), 1u);
    ASSERT_EQ(s.latencies_ms.count("connect"), 0u);
    ASSERT_EQ(s.warnings, std::vector<std::string>{"socks handshake failed: proxy rejected offered methods"});
    ASSERT_NE(s.last_checked, system_clock::time_point{});
}

TEST_F(socks_probe_test, unsupported_method) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x01});
        scripted_socks_server::drain(fd);
    });

    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->description, "unsupported method selected by proxy: 0x01");
}

TEST_F(socks_probe_test, bad_greeting_version) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x04, 0x00});
        scripted_socks_server::drain(fd);
    });

    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->description, "unexpected version in method selection: 0x04");
    ASSERT_FALSE(result.summary.socks_ok);
}

TEST_F(socks_probe_test, user_pass_success) {
    std::mutex mtx;
    sa::uint8_vector offered;
    sa::uint8_vector auth_request;
    scripted_socks_server server([&](int fd) {
        sa::uint8_vector methods = scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x02});
        // VER ULEN "user" PLEN "secret"
        sa::uint8_vector auth = scripted_socks_server::read_n(fd, 1 + 1 + 4 + 1 + 6);
        {
            std::scoped_lock l(mtx);
            offered = methods;
            auth_request = auth;
        }
        scripted_socks_server::write_all(fd, {0x01, 0x00});
        scripted_socks_server::read_request(fd);
        scripted_socks_server::send_reply(fd, 0x00);
        scripted_socks_server::drain(fd);
    });

    sa::probe_config config = make_config(server);
    config.auth = {"user", "secret"};
    sa::probe_result result = sa::probe_socks(ctx, config);
    ASSERT_FALSE(result.error.has_value()) << result.error->description;
    ASSERT_TRUE(result.summary.socks_ok);
    ASSERT_TRUE(result.summary.connect_ok);
    ASSERT_EQ(result.summary.features.auth, "userpass");

    std::scoped_lock l(mtx);
    ASSERT_EQ(offered, sa::uint8_vector({0x00, 0x02}));
    ASSERT_EQ(auth_request, sa::uint8_vector({0x01, 4, 'u', 's', 'e', 'r', 6, 's', 'e', 'c', 'r', 'e', 't'}));
}

TEST_F(socks_probe_test, user_pass_rejected) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x02});
        scripted_socks_server::read_n(fd, 1 + 1 + 1 + 1 + 1);
        scripted_socks_server::write_all(fd, {0x01, 0x01});
        scripted_socks_server::drain(fd);
    });

    sa::probe_config config = make_config(server);
    config.auth = {"u", "p"};
    sa::probe_result result = sa::probe_socks(ctx, config);
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->kind, sa::probe_error_kind::PROTOCOL);
    ASSERT_EQ(result.error->description, "user/pass authentication failed");
    ASSERT_TRUE(result.summary.reachable);
    ASSERT_FALSE(result.summary.socks_ok);
    ASSERT_EQ(result.summary.warnings,
            std::vector<std::string>{"socks handshake failed: user/pass authentication failed"});
}

TEST_F(socks_probe_test, user_pass_required_without_credentials) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x02});
        scripted_socks_server::drain(fd);
    });

    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->description, "proxy requires username/password but none provided");
}

TEST_F(socks_probe_test, too_long_credentials) {
    std::atomic_bool auth_received = false;
    scripted_socks_server server([&](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x02});
        uint8_t b;
        auth_received = scripted_socks_server::read_exact(fd, &b, 1);
    });

    sa::probe_config config = make_config(server);
    config.auth = {std::string(256, 'u'), "p"};
    sa::probe_result result = sa::probe_socks(ctx, config);
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->kind, sa::probe_error_kind::INPUT);
    ASSERT_EQ(result.error->description, "username/password too long (max 255 bytes each)");
    ASSERT_FALSE(result.summary.socks_ok);
    // nothing is sent after the method selection
    ASSERT_FALSE(auth_received);
}

TEST_F(socks_probe_test, connect_rejected) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00});
        scripted_socks_server::read_request(fd);
        scripted_socks_server::send_reply(fd, 0x05);
        scripted_socks_server::drain(fd);
    });

    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->kind, sa::probe_error_kind::PROTOCOL);
    ASSERT_EQ(result.error->description, "socks connect failed: connection refused by destination host");

    const sa::probe_summary &s = result.summary;
    ASSERT_TRUE(s.reachable);
    ASSERT_TRUE(s.socks_ok);
    ASSERT_FALSE(s.connect_ok);
    ASSERT_EQ(s.features.auth, "none");
    ASSERT_EQ(s.latencies_ms.count("connect"), 1u);
    ASSERT_EQ(s.warnings, std::vector<std::string>{"connect failed: connection refused by destination host"});
}

TEST_F(socks_probe_test, bad_connect_reply_version) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00});
        scripted_socks_server::read_request(fd);
        scripted_socks_server::write_all(fd, {0x04, 0x00, 0x00, 0x01});
        scripted_socks_server::drain(fd);
    });

    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->description, "bad connect reply version");
    ASSERT_EQ(result.summary.warnings, std::vector<std::string>{"unexpected reply version: 0x04"});
}

TEST_F(socks_probe_test, unknown_bound_address_type) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00});
        scripted_socks_server::read_request(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00, 0x00, 0x07});
        scripted_socks_server::drain(fd);
    });

    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->description, "unknown reply ATYP: 0x07");
    ASSERT_FALSE(result.summary.connect_ok);
    ASSERT_EQ(result.summary.warnings, std::vector<std::string>{"read CONNECT reply addr failed: unknown reply ATYP: 0x07"});
}

TEST_F(socks_probe_test, domain_bound_address) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00});
        scripted_socks_server::read_request(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00, 0x00, 0x03, 4, 'h', 'o', 's', 't', 0x00, 0x50});
        scripted_socks_server::drain(fd);
    });

    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_FALSE(result.error.has_value()) << result.error->description;
    ASSERT_TRUE(result.summary.connect_ok);
}

TEST_F(socks_probe_test, empty_domain_bound_address) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00});
        scripted_socks_server::read_request(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00, 0x00, 0x03, 0, 0x00, 0x50});
        scripted_socks_server::drain(fd);
    });

    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->description, "invalid domain length in reply");
}

TEST_F(socks_probe_test, ipv6_target) {
    std::mutex mtx;
    std::optional<scripted_socks_server::request> connect_request;
    scripted_socks_server server([&](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00});
        auto req = scripted_socks_server::read_request(fd);
        {
            std::scoped_lock l(mtx);
            connect_request = req;
        }
        sa::uint8_vector reply = {0x05, 0x00, 0x00, 0x04};
        reply.resize(reply.size() + 16 + 2, 0);
        scripted_socks_server::write_all(fd, reply);
        scripted_socks_server::drain(fd);
    });

    sa::probe_config config = make_config(server);
    config.connect_target = "[2001:db8::1]:443";
    sa::probe_result result = sa::probe_socks(ctx, config);
    ASSERT_FALSE(result.error.has_value()) << result.error->description;
    ASSERT_TRUE(result.summary.connect_ok);
    ASSERT_TRUE(result.summary.features.ipv6);

    std::scoped_lock l(mtx);
    ASSERT_TRUE(connect_request.has_value());
    ASSERT_EQ(connect_request->atyp, 0x04);
    ASSERT_EQ(connect_request->addr.size(), 16u);
    ASSERT_EQ(connect_request->addr[0], 0x20);
    ASSERT_EQ(connect_request->addr[15], 0x01);
    ASSERT_EQ(connect_request->port, 443);
}

TEST_F(socks_probe_test, udp_associate_failure_is_a_warning) {
    std::atomic<int> udp_cmd = 0;
    scripted_socks_server server([&](int fd) {
        accept_no_auth(fd);
        auto req = scripted_socks_server::read_request(fd);
        udp_cmd = req.has_value() ? req->cmd : -1;
        scripted_socks_server::send_reply(fd, 0x07);
        scripted_socks_server::drain(fd);
    });

    sa::probe_config config = make_config(server);
    config.udp_test = true;
    sa::probe_result result = sa::probe_socks(ctx, config);
    ASSERT_FALSE(result.error.has_value()) << result.error->description;

    const sa::probe_summary &s = result.summary;
    ASSERT_TRUE(s.connect_ok);
    ASSERT_FALSE(s.udp_ok);
    ASSERT_EQ(s.latencies_ms.count("udp_associate"), 1u);
    ASSERT_EQ(s.warnings, std::vector<std::string>{"udp associate failed: command not supported"});
    ASSERT_EQ(udp_cmd, 0x03);
}

TEST_F(socks_probe_test, udp_associate_success) {
    scripted_socks_server server([](int fd) {
        accept_no_auth(fd);
        scripted_socks_server::read_request(fd);
        scripted_socks_server::send_reply(fd, 0x00);
        scripted_socks_server::drain(fd);
    });

    sa::probe_config config = make_config(server);
    config.udp_test = true;
    sa::probe_result result = sa::probe_socks(ctx, config);
    ASSERT_FALSE(result.error.has_value()) << result.error->description;
    ASSERT_TRUE(result.summary.udp_ok);
    ASSERT_FALSE(result.summary.features.udp);
    ASSERT_TRUE(result.summary.warnings.empty());
    ASSERT_EQ(result.summary.latencies_ms.size(), 4u);
}

TEST_F(socks_probe_test, udp_associate_connection_closed) {
    scripted_socks_server server([](int fd) {
        accept_no_auth(fd);
    });

    sa::probe_config config = make_config(server);
    config.udp_test = true;
    sa::probe_result result = sa::probe_socks(ctx, config);
    ASSERT_FALSE(result.error.has_value()) << result.error->description;
    ASSERT_FALSE(result.summary.udp_ok);
    ASSERT_EQ(result.summary.warnings.size(), 1u);
    ASSERT_TRUE(result.summary.warnings[0].find("UDP ASSOCIATE") != std::string::npos)
            << result.summary.warnings[0];
}

TEST_F(socks_probe_test, invalid_inputs) {
    for (const char *server : {"", "localhost", "127.0.0.1:0", "127.0.0.1:http", "127.0.0.1:70000", ":1080",
                 "::1:1080"}) {
        sa::probe_config config;
        config.server = server;
        sa::probe_result result = sa::probe_socks(ctx, config);
        ASSERT_TRUE(result.error.has_value()) << server;
        ASSERT_EQ(result.error->kind, sa::probe_error_kind::INPUT) << server;
        ASSERT_EQ(result.error->description.rfind("invalid socks server: ", 0), 0u) << result.error->description;
        ASSERT_FALSE(result.summary.reachable);
        ASSERT_TRUE(result.summary.latencies_ms.empty());
        ASSERT_NE(result.summary.last_checked, system_clock::time_point{});
    }

    sa::probe_config config;
    config.server = "127.0.0.1:1080";
    config.connect_target = "example.com:0";
    sa::probe_result result = sa::probe_socks(ctx, config);
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->kind, sa::probe_error_kind::INPUT);
    ASSERT_EQ(result.error->description, "invalid connect target: invalid port \"0\"");
    ASSERT_TRUE(result.summary.latencies_ms.empty());
}

TEST_F(socks_probe_test, blank_target_means_default) {
    std::mutex mtx;
    std::optional<scripted_socks_server::request> connect_request;
    scripted_socks_server server([&](int fd) {
        scripted_socks_server::read_greeting(fd);
        scripted_socks_server::write_all(fd, {0x05, 0x00});
        auto req = scripted_socks_server::read_request(fd);
        {
            std::scoped_lock l(mtx);
            connect_request = req;
        }
        scripted_socks_server::send_reply(fd, 0x00);
        scripted_socks_server::drain(fd);
    });

    sa::probe_config config = make_config(server);
    config.connect_target = "  \t ";
    sa::probe_result result = sa::probe_socks(ctx, config);
    ASSERT_FALSE(result.error.has_value()) << result.error->description;

    std::scoped_lock l(mtx);
    ASSERT_TRUE(connect_request.has_value());
    ASSERT_EQ(std::string(connect_request->addr.begin(), connect_request->addr.end()), "example.com");
}

TEST_F(socks_probe_test, tcp_connect_refused) {
    // take a free port and release it
    uint16_t port;
    {
        scripted_socks_server server([](int) {});
        port = server.port();
    }

    sa::probe_config config;
    config.server = "127.0.0.1:" + std::to_string(port);
    config.timeout = seconds{2};
    sa::probe_result result = sa::probe_socks(ctx, config);
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->kind, sa::probe_error_kind::TRANSPORT);
    ASSERT_FALSE(result.summary.reachable);
    ASSERT_EQ(result.summary.latencies_ms.count("tcp_connect"), 1u);
    ASSERT_EQ(result.summary.latencies_ms.count("socks_handshake"), 0u);
    ASSERT_EQ(result.summary.warnings.size(), 1u);
    ASSERT_EQ(result.summary.warnings[0].rfind("tcp connect failed: ", 0), 0u);
}

TEST_F(socks_probe_test, connection_closed_during_greeting) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::read_greeting(fd);
    });

    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->kind, sa::probe_error_kind::TRANSPORT);
    ASSERT_EQ(result.error->description.rfind("read method selection: ", 0), 0u) << result.error->description;
    ASSERT_TRUE(result.summary.reachable);
    ASSERT_FALSE(result.summary.socks_ok);
}

TEST_F(socks_probe_test, timeout) {
    scripted_socks_server server([](int fd) {
        // never answer
        scripted_socks_server::drain(fd);
    });

    sa::probe_config config = make_config(server);
    config.timeout = milliseconds{300};
    auto start = steady_clock::now();
    sa::probe_result result = sa::probe_socks(ctx, config);
    auto elapsed = steady_clock::now() - start;

    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->kind, sa::probe_error_kind::TRANSPORT);
    ASSERT_EQ(result.error->description, "read method selection: i/o timeout");
    ASSERT_GE(elapsed, milliseconds{250});
    ASSERT_LT(elapsed, seconds{3});
    ASSERT_TRUE(result.summary.reachable);
    ASSERT_GE(result.summary.latencies_ms.at("socks_handshake"), 200);
}

TEST_F(socks_probe_test, huge_timeout_is_capped) {
    scripted_socks_server server([](int fd) {
        accept_no_auth(fd);
        scripted_socks_server::drain(fd);
    });

    std::vector<milliseconds> timeouts = {milliseconds::max(), milliseconds{9'300'000'000'000}, hours{24 * 365}};
    for (milliseconds timeout : timeouts) {
        sa::probe_config config = make_config(server);
        config.timeout = timeout;
        sa::probe_result result = sa::probe_socks(ctx, config);
        ASSERT_FALSE(result.error.has_value()) << timeout.count() << ": " << result.error->description;
        ASSERT_TRUE(result.summary.connect_ok);
    }
}

TEST_F(socks_probe_test, cancel) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::drain(fd);
    });

    sa::probe_config config = make_config(server);
    config.timeout = seconds{30};
    std::thread canceller([this] {
        std::this_thread::sleep_for(milliseconds{200});
        ctx.cancel();
    });
    auto start = steady_clock::now();
    sa::probe_result result = sa::probe_socks(ctx, config);
    auto elapsed = steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->kind, sa::probe_error_kind::TRANSPORT);
    ASSERT_EQ(result.error->description, "read method selection: operation was cancelled");
    ASSERT_LT(elapsed, seconds{5});
}

TEST_F(socks_probe_test, already_cancelled) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::drain(fd);
    });

    ctx.cancel();
    sa::probe_result result = sa::probe_socks(ctx, make_config(server));
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->kind, sa::probe_error_kind::TRANSPORT);
    ASSERT_EQ(result.summary.warnings, std::vector<std::string>{"tcp connect failed: operation was cancelled"});
}

TEST_F(socks_probe_test, context_deadline) {
    scripted_socks_server server([](int fd) {
        scripted_socks_server::drain(fd);
    });

    sa::cancel_context short_ctx(steady_clock::now() + milliseconds{200});
    sa::probe_config config = make_config(server);
    config.timeout = seconds{30};
    auto start = steady_clock::now();
    sa::probe_result result = sa::probe_socks(short_ctx, config);
    ASSERT_TRUE(result.error.has_value());
    ASSERT_EQ(result.error->description, "read method selection: i/o timeout");
    ASSERT_LT(steady_clock::now() - start, seconds{5});
}
