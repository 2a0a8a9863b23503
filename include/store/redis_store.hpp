#pragma once

#include "config/config_types.hpp"
#include "store/ikv_store.hpp"
#include "store/resp_protocol.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fnrt {

/**
 * @brief Redis-compatible store client speaking RESP2 over one TCP socket
 *
 * The connection is opened by connect() and reused for every command.
 * A transport failure closes the socket; the next command reconnects.
 * A command that fails on an already-established connection is retried
 * once on a fresh connection before the failure is reported.
 */
class RedisStore : public IKeyValueStore {
public:
    explicit RedisStore(StoreConfig config);
    ~RedisStore() override;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    [[nodiscard]] Result<bool> connect() override;

    [[nodiscard]] Result<std::optional<std::string>> get(const std::string& key) override;

    [[nodiscard]] Result<bool> set(const std::string& key, const std::string& value) override;

    [[nodiscard]] bool is_connected() const override { return fd_ >= 0; }

    [[nodiscard]] std::string endpoint() const override;

    void close();

    [[nodiscard]] const StoreConfig& config() const { return config_; }

private:
    // Send one command and read its reply, reconnecting as described above
    [[nodiscard]] Result<RespReply> execute(const std::vector<std::string>& args);

    // Single attempt on the current connection; closes it on transport failure
    [[nodiscard]] Result<RespReply> round_trip(const std::vector<std::string>& args);

    [[nodiscard]] Result<bool> open_socket();
    [[nodiscard]] Result<bool> handshake();

    [[nodiscard]] bool send_all(const std::string& data, std::string& error);
    [[nodiscard]] bool read_reply(RespReply& out, std::string& error);

    StoreConfig config_;
    int fd_ = -1;
    RespReader reader_;
};

} // namespace fnrt
