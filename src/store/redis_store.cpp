#include "store/redis_store.hpp"
#include "core/utils.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>

namespace fnrt {

namespace {

timeval to_timeval(std::chrono::milliseconds ms) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

} // anonymous namespace

RedisStore::RedisStore(StoreConfig config)
    : config_(std::move(config)) {}

RedisStore::~RedisStore() {
    close();
}

std::string RedisStore::endpoint() const {
    return std::format("{}:{}", config_.host, config_.port);
}

void RedisStore::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    reader_.clear();
}

// ============================================================================
// Connection
// ============================================================================

Result<bool> RedisStore::connect() {
    if (fd_ >= 0) return Result<bool>::ok(true);

    auto opened = open_socket();
    if (opened.is_error()) return opened;

    auto hs = handshake();
    if (hs.is_error()) {
        close();
        return hs;
    }

    utils::log::debug(std::format("Store connected: {}", endpoint()));
    return Result<bool>::ok(true);
}

Result<bool> RedisStore::open_socket() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string port_str = std::to_string(config_.port);
    const int gai = ::getaddrinfo(config_.host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<bool>::error(ErrorCategory::STORE_ERROR,
            std::format("cannot resolve {}: {}", endpoint(), ::gai_strerror(gai)));
    }

    const timeval tv = to_timeval(config_.io_timeout);
    std::string last_error = "no usable address";

    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::format("socket() failed: {}", std::strerror(errno));
            continue;
        }

        // SO_SNDTIMEO also bounds connect() on Linux
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        const int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = fd;
            break;
        }
        last_error = std::format("connect() failed: {}", std::strerror(errno));
        ::close(fd);
    }
    ::freeaddrinfo(res);

    if (fd_ < 0) {
        return Result<bool>::error(ErrorCategory::STORE_ERROR,
            std::format("cannot connect to {}: {}", endpoint(), last_error));
    }
    reader_.clear();
    return Result<bool>::ok(true);
}

Result<bool> RedisStore::handshake() {
    if (!config_.password.empty()) {
        auto reply = round_trip({"AUTH", config_.password});
        if (reply.is_error()) return Result<bool>::error(reply.error_category(), reply.error_message());
        if (reply.value().is_error()) {
            return Result<bool>::error(ErrorCategory::STORE_ERROR,
                std::format("AUTH rejected by {}: {}", endpoint(), reply.value().str));
        }
    }

    if (config_.db != 0) {
        auto reply = round_trip({"SELECT", std::to_string(config_.db)});
        if (reply.is_error()) return Result<bool>::error(reply.error_category(), reply.error_message());
        if (reply.value().is_error()) {
            return Result<bool>::error(ErrorCategory::STORE_ERROR,
                std::format("SELECT {} rejected by {}: {}", config_.db, endpoint(), reply.value().str));
        }
    }
    return Result<bool>::ok(true);
}

// ============================================================================
// I/O
// ============================================================================

bool RedisStore::send_all(const std::string& data, std::string& error) {
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = (errno == EAGAIN || errno == EWOULDBLOCK)
                ? std::string("send timed out")
                : std::format("send failed: {}", std::strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool RedisStore::read_reply(RespReply& out, std::string& error) {
    char buf[4096];
    while (true) {
        try {
            if (auto reply = reader_.next()) {
                out = std::move(*reply);
                return true;
            }
        } catch (const RespError& e) {
            error = std::format("protocol error: {}", e.what());
            return false;
        }

        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n == 0) {
            error = "connection closed by server";
            return false;
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            error = (errno == EAGAIN || errno == EWOULDBLOCK)
                ? std::string("read timed out")
                : std::format("recv failed: {}", std::strerror(errno));
            return false;
        }
        reader_.feed(buf, static_cast<size_t>(n));
    }
}

Result<RespReply> RedisStore::round_trip(const std::vector<std::string>& args) {
    std::string error;
    RespReply reply;
    if (!send_all(RespWriter::command(args), error) || !read_reply(reply, error)) {
        close();
        return Result<RespReply>::error(ErrorCategory::STORE_ERROR,
            std::format("{} on {}: {}", args.empty() ? "command" : args[0], endpoint(), error));
    }
    return Result<RespReply>::ok(std::move(reply));
}

Result<RespReply> RedisStore::execute(const std::vector<std::string>& args) {
    const bool reused = fd_ >= 0;
    if (!reused) {
        auto c = connect();
        if (c.is_error()) {
            return Result<RespReply>::error(c.error_category(), c.error_message());
        }
    }

    auto result = round_trip(args);
    if (result.is_ok() || !reused) return result;

    // The server may have dropped an idle connection; try once more
    utils::log::debug(std::format("Store command failed on reused connection ({}), reconnecting",
        result.error_message()));
    auto c = connect();
    if (c.is_error()) {
        return Result<RespReply>::error(c.error_category(), c.error_message());
    }
    return round_trip(args);
}

// ============================================================================
// Commands
// ============================================================================

Result<std::optional<std::string>> RedisStore::get(const std::string& key) {
    auto result = execute({"GET", key});
    if (result.is_error()) {
        return Result<std::optional<std::string>>::error(result.error_category(), result.error_message());
    }

    const auto& reply = result.value();
    switch (reply.type) {
        case RespReply::Type::NIL:
            return Result<std::optional<std::string>>::ok(std::nullopt);
        case RespReply::Type::BULK_STRING:
        case RespReply::Type::SIMPLE_STRING:
            return Result<std::optional<std::string>>::ok(reply.str);
        case RespReply::Type::ERROR:
            return Result<std::optional<std::string>>::error(ErrorCategory::STORE_ERROR,
                std::format("GET {} failed: {}", key, reply.str));
        default:
            return Result<std::optional<std::string>>::error(ErrorCategory::STORE_ERROR,
                std::format("GET {}: unexpected reply type", key));
    }
}

Result<bool> RedisStore::set(const std::string& key, const std::string& value) {
    auto result = execute({"SET", key, value});
    if (result.is_error()) {
        return Result<bool>::error(result.error_category(), result.error_message());
    }

    const auto& reply = result.value();
    if (reply.is_error()) {
        return Result<bool>::error(ErrorCategory::STORE_ERROR,
            std::format("SET {} failed: {}", key, reply.str));
    }
    if (reply.type != RespReply::Type::SIMPLE_STRING || reply.str != "OK") {
        return Result<bool>::error(ErrorCategory::STORE_ERROR,
            std::format("SET {}: unexpected reply", key));
    }
    return Result<bool>::ok(true);
}

} // namespace fnrt
