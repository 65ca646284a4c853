#ifndef TIERCACHE_TESTS_RESP_WIRE_HPP_
#define TIERCACHE_TESTS_RESP_WIRE_HPP_

#include "net/redis_reply.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Server side of the RESP wire format, spoken by the loopback key-value store in tests
namespace TierCache::Testing
{

using Net::RespValue;

inline std::string EncodeBulk(std::string_view s)
{
    std::string out = "$" + std::to_string(s.size()) + "\r\n";
    out.append(s);
    out += "\r\n";
    return out;
}

inline std::string EncodeCommand(const std::vector<std::string>& args)
{
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += EncodeBulk(arg);
    }
    return out;
}

inline std::string EncodeSimple(std::string_view s) { return "+" + std::string(s) + "\r\n"; }
inline std::string EncodeError(std::string_view s) { return "-ERR " + std::string(s) + "\r\n"; }
inline std::string EncodeInteger(std::int64_t v) { return ":" + std::to_string(v) + "\r\n"; }
inline std::string EncodeNull() { return "$-1\r\n"; }

inline std::string EncodeArray(const std::vector<std::string>& encoded_items)
{
    std::string out = "*" + std::to_string(encoded_items.size()) + "\r\n";
    for (const auto& item : encoded_items) {
        out += item;
    }
    return out;
}

/// Command arguments when the value is an array of strings.
inline std::optional<std::vector<std::string>> AsCommand(const RespValue& value)
{
    if (value.type != RespValue::Type::Array || value.elements.empty()) {
        return std::nullopt;
    }
    std::vector<std::string> args;
    args.reserve(value.elements.size());
    for (const auto& element : value.elements) {
        if (element.type != RespValue::Type::BulkString &&
            element.type != RespValue::Type::SimpleString) {
            return std::nullopt;
        }
        args.push_back(element.text);
    }
    return args;
}

// Incremental parser for requests arriving in arbitrary chunks
class RespParser
{
    public:
    static constexpr std::size_t MAX_BULK_LENGTH    = 512 * 1024 * 1024;
    static constexpr std::size_t MAX_ARRAY_ELEMENTS = 1024 * 1024;

    void Feed(std::string_view data) { buffer_.append(data); }

    /// The next complete value, nullopt when more input is needed, or ProtocolError.
    Storage::StorageResult<std::optional<RespValue>> Next()
    {
        if (buffer_.empty()) {
            return std::optional<RespValue>{};
        }
        std::size_t pos = 0;
        RespValue value;
        switch (ParseValue(pos, value, 0)) {
            case Parse::Incomplete:
                return std::optional<RespValue>{};
            case Parse::Malformed:
                buffer_.clear();
                return std::unexpected(
                    Storage::make_error_code(Storage::StorageErrc::ProtocolError)
                );
            case Parse::Complete:
            default:
                buffer_.erase(0, pos);
                return std::optional<RespValue>(std::move(value));
        }
    }

    std::size_t Buffered() const { return buffer_.size(); }

    private:
    enum class Parse { Complete, Incomplete, Malformed };
    static constexpr int MAX_NESTING = 32;

    static bool ParseInteger(std::string_view text, std::int64_t& out)
    {
        if (text.empty()) {
            return false;
        }
        const auto* end = text.data() + text.size();
        auto [ptr, ec]  = std::from_chars(text.data(), end, out);
        return ec == std::errc() && ptr == end;
    }

    Parse ParseLine(std::size_t& pos, std::string& line) const
    {
        const auto crlf = buffer_.find("\r\n", pos);
        if (crlf == std::string::npos) {
            return Parse::Incomplete;
        }
        line = buffer_.substr(pos, crlf - pos);
        pos  = crlf + 2;
        return Parse::Complete;
    }

    Parse ParseValue(std::size_t& pos, RespValue& out, int depth) const
    {
        if (depth > MAX_NESTING) {
            return Parse::Malformed;
        }
        if (pos >= buffer_.size()) {
            return Parse::Incomplete;
        }

        const char marker  = buffer_[pos];
        std::size_t cursor = pos + 1;
        std::string line;
        if (auto st = ParseLine(cursor, line); st != Parse::Complete) {
            return st;
        }

        switch (marker) {
            case '+':
                out.type = RespValue::Type::SimpleString;
                out.text = std::move(line);
                break;
            case '-':
                out.type = RespValue::Type::Error;
                out.text = std::move(line);
                break;
            case ':':
                out.type = RespValue::Type::Integer;
                if (!ParseInteger(line, out.integer)) {
                    return Parse::Malformed;
                }
                break;
            case '$': {
                std::int64_t len = 0;
                if (!ParseInteger(line, len) || len < -1 ||
                    len > static_cast<std::int64_t>(MAX_BULK_LENGTH)) {
                    return Parse::Malformed;
                }
                if (len == -1) {
                    out.type = RespValue::Type::Null;
                    break;
                }
                const auto data_end = cursor + static_cast<std::size_t>(len);
                if (data_end + 2 > buffer_.size()) {
                    return Parse::Incomplete;
                }
                if (buffer_.compare(data_end, 2, "\r\n") != 0) {
                    return Parse::Malformed;
                }
                out.type = RespValue::Type::BulkString;
                out.text = buffer_.substr(cursor, static_cast<std::size_t>(len));
                cursor   = data_end + 2;
                break;
            }
            case '*': {
                std::int64_t count = 0;
                if (!ParseInteger(line, count) || count < -1 ||
                    count > static_cast<std::int64_t>(MAX_ARRAY_ELEMENTS)) {
                    return Parse::Malformed;
                }
                if (count == -1) {
                    out.type = RespValue::Type::Null;
                    break;
                }
                out.type = RespValue::Type::Array;
                out.elements.clear();
                for (std::int64_t i = 0; i < count; ++i) {
                    RespValue element;
                    if (auto st = ParseValue(cursor, element, depth + 1); st != Parse::Complete) {
                        return st;
                    }
                    out.elements.push_back(std::move(element));
                }
                break;
            }
            default:
                return Parse::Malformed;
        }

        pos = cursor;
        return Parse::Complete;
    }

    std::string buffer_;
};

}  // namespace TierCache::Testing

#endif  // TIERCACHE_TESTS_RESP_WIRE_HPP_
