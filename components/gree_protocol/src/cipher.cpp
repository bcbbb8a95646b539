#include "gree_protocol/cipher.hpp"
#include "gree_protocol/error.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace gree_protocol {

namespace {

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherContext makeContext() {
    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to allocate cipher context");
    }
    return ctx;
}

// AES variant follows the key length; null for unsupported lengths
const EVP_CIPHER* aesForKey(const std::string& key) {
    switch (key.size()) {
    case 16:
        return EVP_aes_128_ecb();
    case 24:
        return EVP_aes_192_ecb();
    case 32:
        return EVP_aes_256_ecb();
    default:
        return nullptr;
    }
}

const unsigned char* keyBytes(const std::string& key) {
    return reinterpret_cast<const unsigned char*>(key.data());
}

} // namespace

bool Cipher::isValidKeyLength(size_t length) {
    return length == 16 || length == 24 || length == 32;
}

std::string Cipher::encrypt(const nlohmann::json& payload, const std::string& key) {
    if (!isValidKeyLength(key.size())) {
        throw std::invalid_argument("Cipher key must be 16, 24 or 32 bytes, got " +
                                    std::to_string(key.size()));
    }
    return base64Encode(encryptBlocks(payload.dump(), key));
}

nlohmann::json Cipher::decrypt(const std::string& cipherText, const std::string& key) {
    if (!isValidKeyLength(key.size())) {
        throw DecryptionError("key must be 16, 24 or 32 bytes, got " + std::to_string(key.size()));
    }

    auto raw = base64Decode(cipherText);
    if (raw.empty() || raw.size() % BLOCK_SIZE != 0) {
        throw DecryptionError("cipher text length " + std::to_string(raw.size()) +
                              " is not a positive multiple of the block size");
    }

    auto plainText = decryptBlocks(raw, key);

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(plainText);
    } catch (const nlohmann::json::exception& e) {
        throw DecryptionError(std::string("plaintext is not valid JSON: ") + e.what());
    }

    if (!payload.is_object()) {
        throw DecryptionError("plaintext is not a JSON object");
    }
    return payload;
}

std::string Cipher::base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return {};
    }

    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                  data.data(), static_cast<int>(data.size()));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

std::vector<uint8_t> Cipher::base64Decode(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw DecryptionError("base64 input length " + std::to_string(text.size()) +
                              " is not a multiple of 4");
    }

    std::vector<uint8_t> decoded(3 * text.size() / 4);
    int written = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        throw DecryptionError("invalid base64 input");
    }

    // EVP_DecodeBlock counts the bytes represented by '=' padding
    size_t padding = 0;
    if (text[text.size() - 1] == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    decoded.resize(static_cast<size_t>(written) - padding);
    return decoded;
}

std::vector<uint8_t> Cipher::encryptBlocks(const std::string& plainText, const std::string& key) {
    auto ctx = makeContext();
    if (EVP_EncryptInit_ex(ctx.get(), aesForKey(key), nullptr, keyBytes(key), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise AES encryption");
    }

    std::vector<uint8_t> out(plainText.size() + BLOCK_SIZE);
    int length = 0;
    int total = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &length,
                          reinterpret_cast<const unsigned char*>(plainText.data()),
                          static_cast<int>(plainText.size())) != 1) {
        throw std::runtime_error("AES encryption failed");
    }
    total = length;

    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &length) != 1) {
        throw std::runtime_error("AES encryption finalisation failed");
    }
    total += length;

    out.resize(static_cast<size_t>(total));
    return out;
}

std::string Cipher::decryptBlocks(const std::vector<uint8_t>& cipherText, const std::string& key) {
    auto ctx = makeContext();
    if (EVP_DecryptInit_ex(ctx.get(), aesForKey(key), nullptr, keyBytes(key), nullptr) != 1) {
        throw DecryptionError("failed to initialise AES decryption");
    }

    std::string out(cipherText.size() + BLOCK_SIZE, '\0');
    int length = 0;
    int total = 0;
    if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]), &length,
                          cipherText.data(), static_cast<int>(cipherText.size())) != 1) {
        throw DecryptionError("AES decryption failed");
    }
    total = length;

    // Fails on invalid PKCS#7 padding, the usual symptom of a wrong key
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]) + total, &length) != 1) {
        throw DecryptionError("invalid padding, wrong key or corrupt cipher text");
    }
    total += length;

    out.resize(static_cast<size_t>(total));
    return out;
}

} // namespace gree_protocol
