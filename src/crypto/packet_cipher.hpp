#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace masterlist::crypto {

constexpr std::size_t kKeySize = 16;
constexpr std::size_t kNonceSize = 12;
constexpr std::size_t kTagSize = 16;
constexpr std::size_t kPacketOverhead = kNonceSize + kTagSize;

using Key = std::array<unsigned char, kKeySize>;
using Bytes = std::vector<std::byte>;

// Additional authenticated data bound into every sealed datagram (bytes 0x01..0x10).
const std::array<unsigned char, 16> &AdditionalData();

// Decodes a base64 shared secret. Only keys of exactly kKeySize bytes are accepted.
std::optional<Key> DecodeKey(const std::string &base64);
std::string EncodeKey(const Key &key);

// AES-128-GCM. Sealed layout: nonce(12) || tag(16) || ciphertext.
// A fresh random nonce is drawn for every call.
std::optional<Bytes> Seal(const std::byte *plaintext, std::size_t size, const Key &key);

// Returns nullopt when the packet is truncated or fails authentication.
std::optional<Bytes> Open(const std::byte *packet, std::size_t size, const Key &key);

inline std::optional<Bytes> Seal(const Bytes &plaintext, const Key &key) {
    return Seal(plaintext.data(), plaintext.size(), key);
}

inline std::optional<Bytes> Open(const Bytes &packet, const Key &key) {
    return Open(packet.data(), packet.size(), key);
}

} // namespace masterlist::crypto
