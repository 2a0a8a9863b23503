#include <catch2/catch_test_macros.hpp>
#include "store/redis_store.hpp"
#include "store/resp_protocol.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace fnrt;
using namespace std::chrono_literals;

namespace {

// Minimal single-connection-at-a-time RESP server on 127.0.0.1
class FakeRedisServer {
public:
    FakeRedisServer() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket() failed");
        const int one = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 8) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~FakeRedisServer() {
        stop_ = true;
        thread_.join();
        ::close(listen_fd_);
    }

    FakeRedisServer(const FakeRedisServer&) = delete;
    FakeRedisServer& operator=(const FakeRedisServer&) = delete;

    [[nodiscard]] uint16_t port() const { return port_; }

    StoreConfig config() const {
        StoreConfig cfg;
        cfg.host = "127.0.0.1";
        cfg.port = port_;
        cfg.io_timeout = 500ms;
        return cfg;
    }

    void put(const std::string& key, const std::string& value) {
        std::lock_guard lock(mutex_);
        data_[key] = value;
    }

    std::optional<std::string> peek(const std::string& key) {
        std::lock_guard lock(mutex_);
        const auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::vector<std::string>> commands() {
        std::lock_guard lock(mutex_);
        return commands_;
    }

    void require_password(std::string pw) {
        std::lock_guard lock(mutex_);
        password_ = std::move(pw);
    }

    // Close each connection after it has served n commands
    void close_after(int n) { close_after_ = n; }

    // Read requests but never answer
    void go_silent() { silent_ = true; }

    // Answer GET with a server error
    void fail_gets() { fail_gets_ = true; }

    [[nodiscard]] int connections() const { return connections_; }

private:
    void serve() {
        while (!stop_) {
            pollfd p{listen_fd_, POLLIN, 0};
            if (::poll(&p, 1, 20) <= 0) continue;
            const int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) continue;
            ++connections_;
            handle(fd);
            ::close(fd);
        }
    }

    void handle(int fd) {
        RespReader reader;
        int served = 0;
        char buf[4096];
        while (!stop_) {
            while (auto request = reader.next()) {
                std::vector<std::string> args;
                for (const auto& e : request->elements) args.push_back(e.str);
                const std::string reply = respond(args);
                if (!silent_) {
                    ::send(fd, reply.data(), reply.size(), MSG_NOSIGNAL);
                }
                if (close_after_ > 0 && ++served >= close_after_) return;
            }

            pollfd p{fd, POLLIN, 0};
            if (::poll(&p, 1, 20) <= 0) continue;
            const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) return;
            reader.feed(buf, static_cast<size_t>(n));
        }
    }

    std::string respond(const std::vector<std::string>& args) {
        std::lock_guard lock(mutex_);
        commands_.push_back(args);
        if (args.empty()) return "-ERR empty command\r\n";

        const std::string& cmd = args[0];
        if (cmd == "AUTH" && args.size() == 2) {
            return args[1] == password_ ? "+OK\r\n" : "-WRONGPASS invalid password\r\n";
        }
        if (!password_.empty() && !authenticated()) {
            return "-NOAUTH Authentication required.\r\n";
        }
        if (cmd == "SELECT") return "+OK\r\n";
        if (cmd == "GET" && args.size() == 2) {
            if (fail_gets_) return "-ERR simulated failure\r\n";
            const auto it = data_.find(args[1]);
            if (it == data_.end()) return "$-1\r\n";
            return "$" + std::to_string(it->second.size()) + "\r\n" + it->second + "\r\n";
        }
        if (cmd == "SET" && args.size() == 3) {
            data_[args[1]] = args[2];
            return "+OK\r\n";
        }
        return "-ERR unknown command\r\n";
    }

    // True once a successful AUTH has been recorded
    bool authenticated() const {
        for (const auto& c : commands_) {
            if (c.size() == 2 && c[0] == "AUTH" && c[1] == password_) return true;
        }
        return false;
    }

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<int> close_after_{0};
    std::atomic<bool> silent_{false};
    std::atomic<bool> fail_gets_{false};
    std::atomic<int> connections_{0};

    std::mutex mutex_;
    std::map<std::string, std::string> data_;
    std::vector<std::vector<std::string>> commands_;
    std::string password_;
};

// A loopback port with nothing listening on it
uint16_t closed_port() {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

bool mentions(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("RedisStore: GET of an existing key", "[store][redis]") {
    FakeRedisServer server;
    server.put("metrics", R"({"percent-network-egress": 100.0})");
    RedisStore store(server.config());

    REQUIRE(store.connect().is_ok());
    CHECK(store.is_connected());

    auto result = store.get("metrics");
    REQUIRE(result.is_ok());
    REQUIRE(result.value().has_value());
    CHECK(*result.value() == R"({"percent-network-egress": 100.0})");
}

TEST_CASE("RedisStore: GET of a missing key yields no value", "[store][redis]") {
    FakeRedisServer server;
    RedisStore store(server.config());

    auto result = store.get("nope");
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value().has_value());
}

TEST_CASE("RedisStore: SET stores the exact bytes", "[store][redis]") {
    FakeRedisServer server;
    RedisStore store(server.config());

    const std::string value = "{\"text\":\"line1\\r\\nline2\"}\r\n";
    auto result = store.set("out", value);
    REQUIRE(result.is_ok());
    CHECK(server.peek("out") == value);

    auto read_back = store.get("out");
    REQUIRE(read_back.is_ok());
    CHECK(read_back.value() == value);
}

TEST_CASE("RedisStore: commands share one connection", "[store][redis]") {
    FakeRedisServer server;
    RedisStore store(server.config());

    REQUIRE(store.set("a", "1").is_ok());
    REQUIRE(store.get("a").is_ok());
    REQUIRE(store.get("b").is_ok());
    CHECK(server.connections() == 1);
    CHECK(server.commands().size() == 3);
}

TEST_CASE("RedisStore: connect is lazy and idempotent", "[store][redis]") {
    FakeRedisServer server;
    RedisStore store(server.config());
    CHECK_FALSE(store.is_connected());

    REQUIRE(store.connect().is_ok());
    REQUIRE(store.connect().is_ok());
    CHECK(server.connections() <= 1);
}

TEST_CASE("RedisStore: AUTH and SELECT are sent on connect", "[store][redis]") {
    FakeRedisServer server;
    server.require_password("s3cret");

    auto cfg = server.config();
    cfg.password = "s3cret";
    cfg.db = 2;
    RedisStore store(cfg);

    REQUIRE(store.set("k", "v").is_ok());

    const auto cmds = server.commands();
    REQUIRE(cmds.size() == 3);
    CHECK((cmds[0] == std::vector<std::string>{"AUTH", "s3cret"}));
    CHECK((cmds[1] == std::vector<std::string>{"SELECT", "2"}));
    CHECK(cmds[2][0] == "SET");
}

TEST_CASE("RedisStore: rejected AUTH fails the connection", "[store][redis]") {
    FakeRedisServer server;
    server.require_password("right");

    auto cfg = server.config();
    cfg.password = "wrong";
    RedisStore store(cfg);

    auto result = store.connect();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::STORE_ERROR);
    CHECK(mentions(result.error_message(), "AUTH rejected"));
    CHECK_FALSE(store.is_connected());
}

TEST_CASE("RedisStore: refused connection is a store error", "[store][redis]") {
    StoreConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = closed_port();
    cfg.io_timeout = 500ms;
    RedisStore store(cfg);

    auto connected = store.connect();
    REQUIRE(connected.is_error());
    CHECK(connected.error_category() == ErrorCategory::STORE_ERROR);
    CHECK(mentions(connected.error_message(), "cannot connect to " + store.endpoint()));

    auto got = store.get("metrics");
    REQUIRE(got.is_error());
    CHECK(got.error_category() == ErrorCategory::STORE_ERROR);
}

TEST_CASE("RedisStore: unresolvable host is a store error", "[store][redis]") {
    StoreConfig cfg;
    cfg.host = "no-such-host.invalid";
    RedisStore store(cfg);

    auto result = store.connect();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::STORE_ERROR);
    CHECK(mentions(result.error_message(), "no-such-host.invalid:6379"));
}

TEST_CASE("RedisStore: server error reply surfaces as store error", "[store][redis]") {
    FakeRedisServer server;
    server.fail_gets();
    RedisStore store(server.config());

    auto result = store.get("metrics");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::STORE_ERROR);
    CHECK(mentions(result.error_message(), "simulated failure"));
    // A server error is not a transport failure
    CHECK(store.is_connected());
}

TEST_CASE("RedisStore: dropped connection is re-established once", "[store][redis]") {
    FakeRedisServer server;
    server.put("metrics", "{}");
    server.close_after(1);
    RedisStore store(server.config());

    REQUIRE(store.get("metrics").is_ok());

    // The server has closed the first connection; the next command
    // fails on it and is retried on a fresh one
    auto result = store.get("metrics");
    REQUIRE(result.is_ok());
    CHECK(result.value() == "{}");
    CHECK(server.connections() == 2);
}

TEST_CASE("RedisStore: unanswered command times out", "[store][redis]") {
    FakeRedisServer server;
    server.go_silent();

    auto cfg = server.config();
    cfg.io_timeout = 100ms;
    RedisStore store(cfg);

    auto result = store.get("metrics");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::STORE_ERROR);
    CHECK(mentions(result.error_message(), "timed out"));
    CHECK_FALSE(store.is_connected());
}

TEST_CASE("RedisStore: endpoint names host and port", "[store][redis]") {
    StoreConfig cfg;
    cfg.host = "cache.local";
    cfg.port = 6380;
    RedisStore store(cfg);
    CHECK(store.endpoint() == "cache.local:6380");
}
