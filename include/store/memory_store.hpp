#pragma once

#include "store/ikv_store.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fnrt {

/**
 * @brief Process-local store for tests and dry runs
 *
 * Supports failure injection: the next N connect/get/set calls fail with
 * STORE_ERROR. Operation counters include failed calls.
 */
class InMemoryStore : public IKeyValueStore {
public:
    InMemoryStore() = default;

    [[nodiscard]] Result<bool> connect() override;

    [[nodiscard]] Result<std::optional<std::string>> get(const std::string& key) override;

    [[nodiscard]] Result<bool> set(const std::string& key, const std::string& value) override;

    [[nodiscard]] bool is_connected() const override;

    [[nodiscard]] std::string endpoint() const override { return "memory"; }

    // ---- Test hooks (do not touch the counters) ----

    void put(const std::string& key, const std::string& value);
    void erase(const std::string& key);
    [[nodiscard]] std::optional<std::string> peek(const std::string& key) const;

    void fail_next_connects(uint32_t n);
    void fail_next_gets(uint32_t n);
    void fail_next_sets(uint32_t n);

    [[nodiscard]] uint64_t get_count() const;
    [[nodiscard]] uint64_t set_count() const;

private:
    std::unordered_map<std::string, std::string> data_;
    bool connected_ = false;
    uint32_t failing_connects_ = 0;
    uint32_t failing_gets_ = 0;
    uint32_t failing_sets_ = 0;
    uint64_t get_count_ = 0;
    uint64_t set_count_ = 0;
    mutable std::mutex mutex_;
};

} // namespace fnrt
