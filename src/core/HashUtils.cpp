/**
 * @file HashUtils.cpp
 * @brief SHA-256 and base64 utilities using the OpenSSL EVP API
 *
 * Uses the EVP API instead of the deprecated SHA256_* functions
 * for compatibility with OpenSSL 3.0+.
 */

#include "p2lan/HashUtils.h"

#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cctype>

namespace P2Lan {

//=============================================================================
// SHA-256
//=============================================================================

bool HashUtils::computeFileHash(const std::string& filePath,
                                unsigned char* hash,
                                std::string& errorMsg)
{
    if (!hash) {
        errorMsg = "Hash buffer is null";
        return false;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        errorMsg = "Failed to open file: " + filePath;
        return false;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        errorMsg = "Failed to create EVP_MD_CTX";
        return false;
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        errorMsg = "Failed to initialize SHA256 context";
        return false;
    }

    std::vector<uint8_t> buffer(BUFFER_SIZE);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize bytesRead = file.gcount();

        if (bytesRead > 0) {
            if (EVP_DigestUpdate(ctx, buffer.data(), static_cast<size_t>(bytesRead)) != 1) {
                EVP_MD_CTX_free(ctx);
                errorMsg = "Failed to update SHA256 hash";
                return false;
            }
        }
    }

    if (file.bad()) {
        EVP_MD_CTX_free(ctx);
        errorMsg = "Error reading file: " + filePath;
        return false;
    }

    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        errorMsg = "Failed to finalize SHA256 hash";
        return false;
    }

    EVP_MD_CTX_free(ctx);
    return true;
}

std::string HashUtils::computeFileHashHex(const std::string& filePath,
                                          std::string& errorMsg)
{
    unsigned char hash[HASH_SIZE];
    if (!computeFileHash(filePath, hash, errorMsg)) {
        return {};
    }
    return hashToString(hash);
}

std::vector<unsigned char> HashUtils::computeBufferHash(const uint8_t* data,
                                                        size_t size)
{
    std::vector<unsigned char> hash(HASH_SIZE);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return hash;  // Zeroed hash on error
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1) {
        if (data && size > 0) {
            EVP_DigestUpdate(ctx, data, size);
        }
        unsigned int hashLen = 0;
        EVP_DigestFinal_ex(ctx, hash.data(), &hashLen);
    }

    EVP_MD_CTX_free(ctx);
    return hash;
}

std::string HashUtils::hashToString(const unsigned char* hash)
{
    if (!hash) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(hash[i]);
    }
    return oss.str();
}

bool HashUtils::compareHashHex(const std::string& a, const std::string& b)
{
    if (a.size() != HASH_SIZE * 2 || b.size() != HASH_SIZE * 2) {
        return false;
    }

    // Constant-time comparison
    int result = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        const int ca = std::tolower(static_cast<unsigned char>(a[i]));
        const int cb = std::tolower(static_cast<unsigned char>(b[i]));
        result |= ca ^ cb;
    }
    return result == 0;
}

//=============================================================================
// Base64
//=============================================================================

std::string HashUtils::base64Encode(const uint8_t* data, size_t size)
{
    if (!data || size == 0) {
        return {};
    }

    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL
    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                        data,
                                        static_cast<int>(size));
    if (written < 0) {
        return {};
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

bool HashUtils::base64Decode(const std::string& text, std::vector<uint8_t>& out)
{
    out.clear();
    if (text.empty()) {
        return true;
    }
    if (text.size() % 4 != 0) {
        return false;
    }

    std::vector<uint8_t> buffer(3 * (text.size() / 4));
    const int decoded = EVP_DecodeBlock(buffer.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (decoded < 0) {
        return false;
    }

    // EVP_DecodeBlock does not strip padding; remove the bytes it decoded from '='
    size_t length = static_cast<size_t>(decoded);
    if (text[text.size() - 1] == '=') {
        --length;
        if (text[text.size() - 2] == '=') {
            --length;
        }
    }

    buffer.resize(length);
    out = std::move(buffer);
    return true;
}

}  // namespace P2Lan
