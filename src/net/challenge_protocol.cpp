#include "net/challenge_protocol.hpp"

#include <string_view>

namespace masterlist::net::challenge {

namespace {

class Writer {
public:
    void u8(uint8_t value) {
        buffer.push_back(static_cast<std::byte>(value));
    }

    void u32(uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            u8(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    void i32(int32_t value) {
        u32(static_cast<uint32_t>(value));
    }

    void u64(uint64_t value) {
        u32(static_cast<uint32_t>(value & 0xFFFFFFFFu));
        u32(static_cast<uint32_t>(value >> 32));
    }

    void cstring(std::string_view text) {
        for (char ch : text) {
            u8(static_cast<uint8_t>(ch));
        }
        u8(0);
    }

    std::vector<std::byte> take() {
        return std::move(buffer);
    }

private:
    std::vector<std::byte> buffer;
};

class Reader {
public:
    Reader(const std::byte *data, std::size_t size) : data(data), size(size) {}

    std::optional<uint8_t> u8() {
        if (!data || offset + 1 > size) {
            return std::nullopt;
        }
        return static_cast<uint8_t>(data[offset++]);
    }

    std::optional<uint32_t> u32() {
        if (!data || offset + 4 > size) {
            return std::nullopt;
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(static_cast<uint8_t>(data[offset + i])) << (8 * i);
        }
        offset += 4;
        return value;
    }

    std::optional<int32_t> i32() {
        auto value = u32();
        if (!value) {
            return std::nullopt;
        }
        return static_cast<int32_t>(*value);
    }

    std::optional<uint64_t> u64() {
        auto low = u32();
        auto high = u32();
        if (!low || !high) {
            return std::nullopt;
        }
        return (static_cast<uint64_t>(*high) << 32) | *low;
    }

    std::optional<std::string_view> cstring() {
        if (!data) {
            return std::nullopt;
        }
        const std::size_t start = offset;
        while (offset < size && data[offset] != std::byte{0}) {
            ++offset;
        }
        if (offset >= size) {
            return std::nullopt;
        }
        std::string_view text(reinterpret_cast<const char *>(data + start), offset - start);
        ++offset;
        return text;
    }

private:
    const std::byte *data;
    std::size_t size;
    std::size_t offset = 0;
};

} // namespace

std::vector<std::byte> EncodeRequest(uint64_t uid) {
    Writer writer;
    writer.i32(kHeaderMagic);
    writer.u8(kRequestType);
    writer.cstring(kConnectCommand);
    writer.u32(static_cast<uint32_t>(uid & 0xFFFFFFFFu));
    writer.u32(static_cast<uint32_t>(uid >> 32));
    writer.u8(kProtocolVersion);
    return writer.take();
}

std::optional<Request> DecodeRequest(const std::byte *data, std::size_t size) {
    Reader reader(data, size);
    const auto magic = reader.i32();
    if (!magic || *magic != kHeaderMagic) {
        return std::nullopt;
    }
    const auto type = reader.u8();
    if (!type || *type != kRequestType) {
        return std::nullopt;
    }
    const auto command = reader.cstring();
    if (!command || *command != kConnectCommand) {
        return std::nullopt;
    }
    const auto uid = reader.u64();
    const auto version = reader.u8();
    if (!uid || !version) {
        return std::nullopt;
    }
    return Request{*uid, *version};
}

std::vector<std::byte> EncodeResponse(const Response &response) {
    Writer writer;
    writer.i32(kHeaderMagic);
    writer.u8(kResponseType);
    writer.i32(response.challenge);
    writer.u64(response.uid);
    return writer.take();
}

std::optional<Response> DecodeResponse(const std::byte *data, std::size_t size) {
    if (size < kResponseSize) {
        return std::nullopt;
    }
    Reader reader(data, size);
    const auto magic = reader.i32();
    if (!magic || *magic != kHeaderMagic) {
        return std::nullopt;
    }
    const auto type = reader.u8();
    if (!type || *type != kResponseType) {
        return std::nullopt;
    }
    const auto challengeValue = reader.i32();
    const auto uid = reader.u64();
    if (!challengeValue || !uid) {
        return std::nullopt;
    }
    return Response{*challengeValue, *uid};
}

std::optional<int32_t> MatchResponse(const std::byte *data, std::size_t size, uint64_t expectedUid) {
    const auto response = DecodeResponse(data, size);
    if (!response || response->uid != expectedUid) {
        return std::nullopt;
    }
    return response->challenge;
}

} // namespace masterlist::net::challenge
