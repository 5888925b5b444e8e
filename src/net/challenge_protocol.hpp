#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Plaintext layout of the verification handshake. Every datagram is sealed
// with crypto::Seal before it leaves the socket. Fields are little-endian.
namespace masterlist::net::challenge {

constexpr int32_t kHeaderMagic = -1;
constexpr uint8_t kRequestType = 0x48; // 'H'
constexpr uint8_t kResponseType = 73;
constexpr uint8_t kProtocolVersion = 2;
constexpr const char *kConnectCommand = "connect";

constexpr std::size_t kResponseTypeOffset = 4;
constexpr std::size_t kResponseChallengeOffset = 5;
constexpr std::size_t kResponseUidOffset = 9;
constexpr std::size_t kResponseSize = 17;

struct Request {
    uint64_t uid = 0;
    uint8_t protocolVersion = kProtocolVersion;
};

struct Response {
    int32_t challenge = 0;
    uint64_t uid = 0;
};

// magic | type | "connect\0" | uid low | uid high | version
std::vector<std::byte> EncodeRequest(uint64_t uid);
std::optional<Request> DecodeRequest(const std::byte *data, std::size_t size);

// magic | type | challenge | uid
std::vector<std::byte> EncodeResponse(const Response &response);
std::optional<Response> DecodeResponse(const std::byte *data, std::size_t size);

// DecodeResponse plus the session identifier check. Returns the challenge value.
std::optional<int32_t> MatchResponse(const std::byte *data, std::size_t size, uint64_t expectedUid);

} // namespace masterlist::net::challenge
