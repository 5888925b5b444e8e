#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Redis serialization protocol (RESP2), the subset a client needs.
namespace masterlist::registry::resp {

// Commands are always sent as arrays of bulk strings.
std::string EncodeCommand(const std::vector<std::string> &args);

struct Reply {
    enum class Type {
        SimpleString,
        Error,
        Integer,
        BulkString,
        Null,
        Array
    };

    Type type = Type::Null;
    std::string text;
    int64_t integer = 0;
    std::vector<Reply> elements;

    bool isError() const { return type == Type::Error; }
    bool isNull() const { return type == Type::Null; }
    bool isArray() const { return type == Type::Array; }
    bool isString() const { return type == Type::SimpleString || type == Type::BulkString; }
};

enum class ParseStatus {
    Complete,
    Incomplete,
    Malformed
};

struct ParseResult {
    ParseStatus status = ParseStatus::Incomplete;
    Reply reply;
    std::size_t consumed = 0;
};

// Parses one reply from the front of buffer. Incomplete means more bytes are needed.
ParseResult ParseReply(std::string_view buffer);

} // namespace masterlist::registry::resp
