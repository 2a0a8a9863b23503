#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fnrt {

// Redis serialization protocol (RESP2) type bytes
namespace resp {

constexpr char TYPE_SIMPLE_STRING = '+';
constexpr char TYPE_ERROR = '-';
constexpr char TYPE_INTEGER = ':';
constexpr char TYPE_BULK_STRING = '$';
constexpr char TYPE_ARRAY = '*';

constexpr std::string_view CRLF = "\r\n";

// Largest bulk string the server may send (Redis proto-max-bulk-len default)
constexpr int64_t MAX_BULK_LENGTH = 512LL * 1024 * 1024;
constexpr int64_t MAX_ARRAY_LENGTH = 1024LL * 1024;
constexpr int MAX_NESTING_DEPTH = 16;

} // namespace resp

struct RespError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// One decoded server reply
struct RespReply {
    enum class Type { SIMPLE_STRING, ERROR, INTEGER, BULK_STRING, NIL, ARRAY };

    Type type = Type::NIL;
    std::string str;                  // SIMPLE_STRING, ERROR, BULK_STRING
    int64_t integer = 0;              // INTEGER
    std::vector<RespReply> elements;  // ARRAY

    [[nodiscard]] bool is_error() const { return type == Type::ERROR; }
    [[nodiscard]] bool is_nil() const { return type == Type::NIL; }
};

// Builds request frames (arrays of bulk strings)
class RespWriter {
public:
    [[nodiscard]] static std::string command(const std::vector<std::string>& args);
};

/**
 * @brief Incremental reply parser
 *
 * feed() appends raw socket bytes; next() returns a complete reply once
 * enough bytes have arrived, std::nullopt while the reply is still partial.
 * Throws RespError on a malformed stream.
 */
class RespReader {
public:
    void feed(const char* data, size_t len) { buffer_.append(data, len); }
    void feed(std::string_view data) { buffer_.append(data); }

    [[nodiscard]] std::optional<RespReply> next();

    [[nodiscard]] size_t buffered() const { return buffer_.size(); }
    void clear() { buffer_.clear(); }

private:
    // Parse one reply starting at pos; advances pos on success
    [[nodiscard]] std::optional<RespReply> parse_at(size_t& pos, int depth) const;
    [[nodiscard]] std::optional<std::string_view> read_line(size_t& pos) const;
    [[nodiscard]] static int64_t parse_length(std::string_view line, char type);

    std::string buffer_;
};

} // namespace fnrt
