#include "registry/resp.hpp"

#include <charconv>

namespace masterlist::registry::resp {

namespace {

constexpr std::string_view kCrlf = "\r\n";
// Nesting deeper than this is never produced by the commands we issue.
constexpr int kMaxDepth = 8;

bool parseInteger(std::string_view text, int64_t &out) {
    if (text.empty()) {
        return false;
    }
    const char *begin = text.data();
    const char *end = begin + text.size();
    const auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

ParseResult parseAt(std::string_view buffer, int depth) {
    ParseResult result;
    if (buffer.empty()) {
        return result;
    }
    if (depth > kMaxDepth) {
        result.status = ParseStatus::Malformed;
        return result;
    }

    const auto lineEnd = buffer.find(kCrlf);
    if (lineEnd == std::string_view::npos) {
        return result;
    }

    const char marker = buffer.front();
    const std::string_view line = buffer.substr(1, lineEnd - 1);
    const std::size_t headerSize = lineEnd + kCrlf.size();

    switch (marker) {
        case '+':
        case '-':
            result.reply.type = marker == '+' ? Reply::Type::SimpleString : Reply::Type::Error;
            result.reply.text = std::string(line);
            result.consumed = headerSize;
            result.status = ParseStatus::Complete;
            return result;
        case ':':
            if (!parseInteger(line, result.reply.integer)) {
                result.status = ParseStatus::Malformed;
                return result;
            }
            result.reply.type = Reply::Type::Integer;
            result.consumed = headerSize;
            result.status = ParseStatus::Complete;
            return result;
        case '$': {
            int64_t length = 0;
            if (!parseInteger(line, length) || length < -1) {
                result.status = ParseStatus::Malformed;
                return result;
            }
            if (length == -1) {
                result.reply.type = Reply::Type::Null;
                result.consumed = headerSize;
                result.status = ParseStatus::Complete;
                return result;
            }
            const auto size = static_cast<std::size_t>(length);
            if (buffer.size() < headerSize + size + kCrlf.size()) {
                return result;
            }
            if (buffer.substr(headerSize + size, kCrlf.size()) != kCrlf) {
                result.status = ParseStatus::Malformed;
                return result;
            }
            result.reply.type = Reply::Type::BulkString;
            result.reply.text = std::string(buffer.substr(headerSize, size));
            result.consumed = headerSize + size + kCrlf.size();
            result.status = ParseStatus::Complete;
            return result;
        }
        case '*': {
            int64_t count = 0;
            if (!parseInteger(line, count) || count < -1) {
                result.status = ParseStatus::Malformed;
                return result;
            }
            if (count == -1) {
                result.reply.type = Reply::Type::Null;
                result.consumed = headerSize;
                result.status = ParseStatus::Complete;
                return result;
            }
            result.reply.type = Reply::Type::Array;
            std::size_t offset = headerSize;
            for (int64_t i = 0; i < count; ++i) {
                ParseResult element = parseAt(buffer.substr(offset), depth + 1);
                if (element.status != ParseStatus::Complete) {
                    result.status = element.status;
                    result.reply = Reply{};
                    return result;
                }
                offset += element.consumed;
                result.reply.elements.push_back(std::move(element.reply));
            }
            result.consumed = offset;
            result.status = ParseStatus::Complete;
            return result;
        }
        default:
            result.status = ParseStatus::Malformed;
            return result;
    }
}

} // namespace

std::string EncodeCommand(const std::vector<std::string> &args) {
    std::string out;
    out.append("*").append(std::to_string(args.size())).append(kCrlf);
    for (const auto &arg : args) {
        out.append("$").append(std::to_string(arg.size())).append(kCrlf);
        out.append(arg).append(kCrlf);
    }
    return out;
}

ParseResult ParseReply(std::string_view buffer) {
    return parseAt(buffer, 0);
}

} // namespace masterlist::registry::resp
