#include "store/memory_store.hpp"

#include <format>

namespace fnrt {

Result<bool> InMemoryStore::connect() {
    std::lock_guard lock(mutex_);
    if (failing_connects_ > 0) {
        --failing_connects_;
        return Result<bool>::error(ErrorCategory::STORE_ERROR, "injected connect failure");
    }
    connected_ = true;
    return Result<bool>::ok(true);
}

Result<std::optional<std::string>> InMemoryStore::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    ++get_count_;
    if (failing_gets_ > 0) {
        --failing_gets_;
        return Result<std::optional<std::string>>::error(ErrorCategory::STORE_ERROR,
            std::format("injected GET failure for '{}'", key));
    }
    connected_ = true;
    const auto it = data_.find(key);
    if (it == data_.end()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>>::ok(it->second);
}

Result<bool> InMemoryStore::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    ++set_count_;
    if (failing_sets_ > 0) {
        --failing_sets_;
        return Result<bool>::error(ErrorCategory::STORE_ERROR,
            std::format("injected SET failure for '{}'", key));
    }
    connected_ = true;
    data_[key] = value;
    return Result<bool>::ok(true);
}

bool InMemoryStore::is_connected() const {
    std::lock_guard lock(mutex_);
    return connected_;
}

void InMemoryStore::put(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    data_[key] = value;
}

void InMemoryStore::erase(const std::string& key) {
    std::lock_guard lock(mutex_);
    data_.erase(key);
}

std::optional<std::string> InMemoryStore::peek(const std::string& key) const {
    std::lock_guard lock(mutex_);
    const auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

void InMemoryStore::fail_next_connects(uint32_t n) {
    std::lock_guard lock(mutex_);
    failing_connects_ = n;
}

void InMemoryStore::fail_next_gets(uint32_t n) {
    std::lock_guard lock(mutex_);
    failing_gets_ = n;
}

void InMemoryStore::fail_next_sets(uint32_t n) {
    std::lock_guard lock(mutex_);
    failing_sets_ = n;
}

uint64_t InMemoryStore::get_count() const {
    std::lock_guard lock(mutex_);
    return get_count_;
}

uint64_t InMemoryStore::set_count() const {
    std::lock_guard lock(mutex_);
    return set_count_;
}

} // namespace fnrt
