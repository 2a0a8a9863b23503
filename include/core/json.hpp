#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace fnrt {

/**
 * @brief Thin wrapper around glz::json_t
 *
 * Stores json_t by value. Used for the decoded input payload, the handler
 * result and the free-form environment map of the runtime context.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;
    using null_t = glz::json_t::null_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct serialize_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    JsonValue(int v) { data_ = static_cast<double>(v); }
    JsonValue(long long v) { data_ = static_cast<double>(v); }
    JsonValue(double v) { data_ = v; }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }
    JsonValue(std::string&& v) { data_ = std::move(v); }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    // Human-readable kind, used in diagnostics
    [[nodiscard]] const char* type_name() const {
        if (is_null()) return "null";
        if (is_object()) return "object";
        if (is_array()) return "array";
        if (is_string()) return "string";
        if (is_number()) return "number";
        if (is_boolean()) return "boolean";
        return "unknown";
    }

    // ===== Container Properties =====

    [[nodiscard]] bool empty() const { return data_.empty(); }
    [[nodiscard]] size_t size() const { return data_.size(); }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    // ===== Mutation =====

    // Insert or replace a member; turns a null value into an object first
    void set(std::string_view key, JsonValue val) {
        if (data_.is_null()) data_ = object_t{};
        if (!data_.is_object()) {
            throw std::logic_error(std::format("JsonValue::set on {}", type_name()));
        }
        data_.get_object()[std::string(key)] = std::move(val.data_);
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double; cast to target integral type
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        if (!data_.is_object()) return default_value;
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it == obj.end()) return default_value;
        return JsonValue(it->second).get<T>();
    }

    // ===== Items Range (for structured bindings over objects) =====

    class items_range {
        const object_t* obj_;

    public:
        explicit items_range(const object_t* obj) : obj_(obj) {}

        class iterator {
            object_t::const_iterator it_;

        public:
            explicit iterator(object_t::const_iterator it) : it_(it) {}

            [[nodiscard]] std::pair<std::string, JsonValue> operator*() const {
                return {it_->first, JsonValue(it_->second)};
            }

            iterator& operator++() { ++it_; return *this; }
            [[nodiscard]] bool operator!=(const iterator& o) const { return it_ != o.it_; }
        };

        [[nodiscard]] iterator begin() const { return iterator(obj_->begin()); }
        [[nodiscard]] iterator end() const { return iterator(obj_->end()); }
    };

    [[nodiscard]] items_range items() const {
        static const object_t empty_obj;
        if (data_.is_object()) {
            return items_range(&data_.get_object());
        }
        return items_range(&empty_obj);
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue object() {
        glz::json_t j;
        j = object_t{};
        return JsonValue(std::move(j));
    }

    // The whole text must be one JSON value; only whitespace may follow it
    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        const std::string buffer(json_str);
        auto ec = glz::read<glz::opts{.validate_trailing_whitespace = true}>(result, buffer);
        if (ec) {
            throw parse_error(std::format("JSON parse error: {}", glz::format_error(ec, buffer)));
        }
        return JsonValue(std::move(result));
    }

    // ===== Serialization =====

    [[nodiscard]] std::string dump() const {
        std::string out;
        auto ec = glz::write_json(data_, out);
        if (ec) {
            throw serialize_error(std::format("JSON encode error: {}", glz::format_error(ec, out)));
        }
        return out;
    }

private:
    glz::json_t data_{};
};

} // namespace fnrt
