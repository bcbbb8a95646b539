#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace gree_protocol {

/**
 * @class Cipher
 * @brief Encrypts and decrypts the "pack" payload of protocol envelopes
 *
 * Payloads are serialized to compact JSON, encrypted with AES in ECB mode
 * with PKCS#7 padding, and base64 encoded. The key length selects AES-128,
 * AES-192 or AES-256. Every call is stateless.
 */
class Cipher {
public:
    // Length of the generic key and of the keys devices hand out on bind
    static constexpr size_t KEY_SIZE = 16;
    static constexpr size_t BLOCK_SIZE = 16;

    /**
     * @brief Serialize and encrypt a payload
     * @param payload JSON structure to encrypt
     * @param key 16, 24 or 32 byte key (generic key or device key)
     * @return Base64 encoded cipher text
     * @throws std::invalid_argument if the key has the wrong length
     */
    static std::string encrypt(const nlohmann::json& payload, const std::string& key);

    /**
     * @brief Decrypt and parse a payload
     * @param cipherText Base64 encoded cipher text
     * @param key 16, 24 or 32 byte key
     * @return The decrypted JSON object
     * @throws DecryptionError on malformed base64, bad padding, wrong key, or a
     *         plaintext that is not a JSON object
     */
    static nlohmann::json decrypt(const std::string& cipherText, const std::string& key);

    static bool isValidKeyLength(size_t length);

    static std::string base64Encode(const std::vector<uint8_t>& data);

    /**
     * @throws DecryptionError if the input is not valid base64
     */
    static std::vector<uint8_t> base64Decode(const std::string& text);

private:
    static std::vector<uint8_t> encryptBlocks(const std::string& plainText, const std::string& key);
    static std::string decryptBlocks(const std::vector<uint8_t>& cipherText, const std::string& key);
};

} // namespace gree_protocol
