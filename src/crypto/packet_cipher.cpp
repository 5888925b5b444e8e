#include "crypto/packet_cipher.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace masterlist::crypto {

namespace {

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX *ctx) const {
        EVP_CIPHER_CTX_free(ctx);
    }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

const unsigned char *asUnsigned(const std::byte *data) {
    return reinterpret_cast<const unsigned char *>(data);
}

unsigned char *asUnsigned(std::byte *data) {
    return reinterpret_cast<unsigned char *>(data);
}

} // namespace

const std::array<unsigned char, 16> &AdditionalData() {
    static const std::array<unsigned char, 16> kAad = {
        0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
        0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f, 0x10
    };
    return kAad;
}

std::optional<Key> DecodeKey(const std::string &base64) {
    std::string text;
    text.reserve(base64.size() + 2);
    for (char ch : base64) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            text.push_back(ch);
        }
    }
    if (text.empty() || text.size() % 4 == 1) {
        return std::nullopt;
    }
    while (text.size() % 4 != 0) {
        text.push_back('=');
    }

    std::vector<unsigned char> decoded(text.size() / 4 * 3);
    const int written = EVP_DecodeBlock(decoded.data(),
                                        reinterpret_cast<const unsigned char *>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    for (auto it = text.rbegin(); it != text.rend() && *it == '=' && padding < 2; ++it) {
        ++padding;
    }
    const std::size_t actual = static_cast<std::size_t>(written) - padding;
    if (actual != kKeySize) {
        return std::nullopt;
    }

    Key key{};
    std::copy_n(decoded.begin(), kKeySize, key.begin());
    return key;
}

std::string EncodeKey(const Key &key) {
    std::array<unsigned char, 4 * ((kKeySize + 2) / 3) + 1> out{};
    const int written = EVP_EncodeBlock(out.data(), key.data(), static_cast<int>(key.size()));
    return std::string(reinterpret_cast<const char *>(out.data()), static_cast<std::size_t>(written));
}

std::optional<Bytes> Seal(const std::byte *plaintext, std::size_t size, const Key &key) {
    Bytes packet(kPacketOverhead + size);
    unsigned char *nonce = asUnsigned(packet.data());
    unsigned char *tag = nonce + kNonceSize;
    unsigned char *ciphertext = tag + kTagSize;

    if (RAND_bytes(nonce, static_cast<int>(kNonceSize)) != 1) {
        return std::nullopt;
    }

    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    int length = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        return std::nullopt;
    }

    const auto &aad = AdditionalData();
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &length, aad.data(), static_cast<int>(aad.size())) != 1) {
        return std::nullopt;
    }

    int produced = 0;
    if (size > 0) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext, &length, asUnsigned(plaintext), static_cast<int>(size)) != 1) {
            return std::nullopt;
        }
        produced = length;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + produced, &length) != 1) {
        return std::nullopt;
    }
    produced += length;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag) != 1) {
        return std::nullopt;
    }

    packet.resize(kPacketOverhead + static_cast<std::size_t>(produced));
    return packet;
}

std::optional<Bytes> Open(const std::byte *packet, std::size_t size, const Key &key) {
    if (!packet || size < kPacketOverhead) {
        return std::nullopt;
    }

    const unsigned char *nonce = asUnsigned(packet);
    std::array<unsigned char, kTagSize> tag{};
    std::copy_n(nonce + kNonceSize, kTagSize, tag.begin());
    const unsigned char *ciphertext = nonce + kPacketOverhead;
    const std::size_t ciphertextSize = size - kPacketOverhead;

    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    int length = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        return std::nullopt;
    }

    const auto &aad = AdditionalData();
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &length, aad.data(), static_cast<int>(aad.size())) != 1) {
        return std::nullopt;
    }

    Bytes plaintext(ciphertextSize);
    int produced = 0;
    if (ciphertextSize > 0) {
        if (EVP_DecryptUpdate(ctx.get(), asUnsigned(plaintext.data()), &length,
                              ciphertext, static_cast<int>(ciphertextSize)) != 1) {
            return std::nullopt;
        }
        produced = length;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        return std::nullopt;
    }

    // Tag mismatch surfaces here; whatever was decrypted so far is discarded.
    if (EVP_DecryptFinal_ex(ctx.get(), asUnsigned(plaintext.data()) + produced, &length) != 1) {
        return std::nullopt;
    }
    produced += length;

    plaintext.resize(static_cast<std::size_t>(produced));
    return plaintext;
}

} // namespace masterlist::crypto
