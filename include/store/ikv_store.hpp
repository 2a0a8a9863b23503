#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>

namespace fnrt {

/**
 * @brief Narrow key-value store contract used by the poll loop
 *
 * get() yields std::nullopt when the key does not exist. Transport and
 * server failures come back as STORE_ERROR results, never as exceptions.
 * Implementations are not thread-safe.
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    /**
     * @brief Establish the connection (idempotent)
     */
    [[nodiscard]] virtual Result<bool> connect() = 0;

    [[nodiscard]] virtual Result<std::optional<std::string>> get(const std::string& key) = 0;

    [[nodiscard]] virtual Result<bool> set(const std::string& key, const std::string& value) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    // "host:port" style description for logs
    [[nodiscard]] virtual std::string endpoint() const = 0;
};

} // namespace fnrt
