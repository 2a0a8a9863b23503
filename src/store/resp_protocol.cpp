#include "store/resp_protocol.hpp"
#include "core/utils.hpp"

#include <format>

namespace fnrt {

// ============================================================================
// RespWriter
// ============================================================================

std::string RespWriter::command(const std::vector<std::string>& args) {
    std::string out;
    size_t total = 16;
    for (const auto& a : args) total += a.size() + 16;
    out.reserve(total);

    out += std::format("{}{}", resp::TYPE_ARRAY, args.size());
    out += resp::CRLF;
    for (const auto& a : args) {
        out += std::format("{}{}", resp::TYPE_BULK_STRING, a.size());
        out += resp::CRLF;
        out += a;
        out += resp::CRLF;
    }
    return out;
}

// ============================================================================
// RespReader
// ============================================================================

std::optional<RespReply> RespReader::next() {
    size_t pos = 0;
    auto reply = parse_at(pos, 0);
    if (reply) {
        buffer_.erase(0, pos);
    }
    return reply;
}

std::optional<std::string_view> RespReader::read_line(size_t& pos) const {
    const size_t end = buffer_.find(resp::CRLF, pos);
    if (end == std::string::npos) return std::nullopt;
    std::string_view line(buffer_.data() + pos, end - pos);
    pos = end + resp::CRLF.size();
    return line;
}

int64_t RespReader::parse_length(std::string_view line, char type) {
    const auto len = utils::try_parse_int<int64_t>(line);
    if (!len) {
        throw RespError(std::format("invalid length '{}' for type '{}'", line, type));
    }
    return *len;
}

std::optional<RespReply> RespReader::parse_at(size_t& pos, int depth) const {
    if (depth > resp::MAX_NESTING_DEPTH) {
        throw RespError("reply nesting too deep");
    }
    if (pos >= buffer_.size()) return std::nullopt;

    const char type = buffer_[pos];
    size_t cursor = pos + 1;
    const auto line = read_line(cursor);
    if (!line) return std::nullopt;

    RespReply reply;
    switch (type) {
        case resp::TYPE_SIMPLE_STRING:
            reply.type = RespReply::Type::SIMPLE_STRING;
            reply.str = std::string(*line);
            break;

        case resp::TYPE_ERROR:
            reply.type = RespReply::Type::ERROR;
            reply.str = std::string(*line);
            break;

        case resp::TYPE_INTEGER: {
            const auto v = utils::try_parse_int<int64_t>(*line);
            if (!v) throw RespError(std::format("invalid integer reply '{}'", *line));
            reply.type = RespReply::Type::INTEGER;
            reply.integer = *v;
            break;
        }

        case resp::TYPE_BULK_STRING: {
            const int64_t len = parse_length(*line, type);
            if (len == -1) {
                reply.type = RespReply::Type::NIL;
                break;
            }
            if (len < 0 || len > resp::MAX_BULK_LENGTH) {
                throw RespError(std::format("bulk length {} out of range", len));
            }
            const auto n = static_cast<size_t>(len);
            if (buffer_.size() < cursor + n + resp::CRLF.size()) return std::nullopt;
            if (buffer_.compare(cursor + n, resp::CRLF.size(), resp::CRLF) != 0) {
                throw RespError("bulk string not terminated by CRLF");
            }
            reply.type = RespReply::Type::BULK_STRING;
            reply.str.assign(buffer_, cursor, n);
            cursor += n + resp::CRLF.size();
            break;
        }

        case resp::TYPE_ARRAY: {
            const int64_t count = parse_length(*line, type);
            if (count == -1) {
                reply.type = RespReply::Type::NIL;
                break;
            }
            if (count < 0 || count > resp::MAX_ARRAY_LENGTH) {
                throw RespError(std::format("array length {} out of range", count));
            }
            reply.type = RespReply::Type::ARRAY;
            reply.elements.reserve(static_cast<size_t>(count));
            for (int64_t i = 0; i < count; ++i) {
                auto elem = parse_at(cursor, depth + 1);
                if (!elem) return std::nullopt;
                reply.elements.push_back(std::move(*elem));
            }
            break;
        }

        default:
            throw RespError(std::format("unexpected reply type byte 0x{:02x}",
                static_cast<unsigned char>(type)));
    }

    pos = cursor;
    return reply;
}

} // namespace fnrt
