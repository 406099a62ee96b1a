/**
 * @file HashUtils.h
 * @brief SHA-256 and base64 utilities
 */

#pragma once

#include "config.h"
#include <string>
#include <vector>
#include <cstdint>

namespace P2Lan {

/**
 * @class HashUtils
 * @brief SHA-256 hashing for file integrity and base64 for chunk payloads
 *
 * This class provides static methods for computing SHA-256 hashes
 * of files and memory buffers, and for encoding binary chunk data into
 * the JSON wire format, using OpenSSL's EVP API.
 *
 * Thread Safety:
 * - All methods are thread-safe (no shared state)
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 hash of a file
     * @param filePath Path to the file to hash
     * @param hash Output buffer (must be at least HASH_SIZE bytes)
     * @param errorMsg Output error message if computation fails
     * @return true if successful, false otherwise
     *
     * Reads the file in BUFFER_SIZE blocks; memory use is independent
     * of file size.
     */
    static bool computeFileHash(const std::string& filePath,
                                unsigned char* hash,
                                std::string& errorMsg);

    /**
     * @brief Compute SHA-256 hex digest of a file
     * @return 64-character lowercase hex string, or empty on error
     */
    static std::string computeFileHashHex(const std::string& filePath,
                                          std::string& errorMsg);

    /**
     * @brief Compute SHA-256 hash of a memory buffer
     * @return Vector containing the 32-byte hash
     */
    static std::vector<unsigned char> computeBufferHash(const uint8_t* data,
                                                        size_t size);

    /**
     * @brief Convert binary hash to hexadecimal string
     * @param hash Binary hash (must be HASH_SIZE bytes)
     * @return Hexadecimal string representation (64 hex characters)
     */
    static std::string hashToString(const unsigned char* hash);

    /**
     * @brief Compare two hex digests in constant time (case-insensitive)
     */
    static bool compareHashHex(const std::string& a, const std::string& b);

    /**
     * @brief Base64-encode binary data (no line breaks)
     */
    static std::string base64Encode(const uint8_t* data, size_t size);

    /**
     * @brief Decode base64 text
     * @param text Base64 input (padding required, no whitespace)
     * @param out Decoded bytes
     * @return false if the input is not valid base64
     */
    static bool base64Decode(const std::string& text, std::vector<uint8_t>& out);

private:
    HashUtils() = delete;
};

}  // namespace P2Lan
