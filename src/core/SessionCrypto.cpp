/**
 * @file SessionCrypto.cpp
 * @brief Ed25519 identity, X25519 + HKDF key agreement and AES-256-GCM via the OpenSSL EVP API
 */

#include "p2lan/SessionCrypto.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace P2Lan {

namespace {

std::string opensslLastErrorString() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "Unknown error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

EVP_PKEY* generateKey(int type, std::string& errorMsg) {
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(type, nullptr);
    if (!pctx) {
        errorMsg = "EVP_PKEY_CTX_new_id failed: " + opensslLastErrorString();
        return nullptr;
    }

    EVP_PKEY* key = nullptr;
    if (EVP_PKEY_keygen_init(pctx) != 1 || EVP_PKEY_keygen(pctx, &key) != 1) {
        errorMsg = "Key generation failed: " + opensslLastErrorString();
        key = nullptr;
    }
    EVP_PKEY_CTX_free(pctx);
    return key;
}

bool rawPublicHex(EVP_PKEY* key, size_t expected, std::string& hexOut, std::string& errorMsg) {
    std::vector<uint8_t> raw(expected);
    size_t len = raw.size();
    if (EVP_PKEY_get_raw_public_key(key, raw.data(), &len) != 1 || len != expected) {
        errorMsg = "EVP_PKEY_get_raw_public_key failed: " + opensslLastErrorString();
        return false;
    }
    hexOut = bytesToHex(raw.data(), raw.size());
    return true;
}

EVP_PKEY* publicKeyFromHex(int type, const std::string& hex, size_t expected) {
    std::vector<uint8_t> raw;
    if (!hexToBytes(hex, raw) || raw.size() != expected) {
        return nullptr;
    }
    return EVP_PKEY_new_raw_public_key(type, nullptr, raw.data(), raw.size());
}

bool hkdfSha256(const std::vector<uint8_t>& secret, const std::vector<uint8_t>& salt,
                const std::string& info, SessionKey& keyOut, std::string& errorMsg)
{
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) {
        errorMsg = "EVP_PKEY_CTX_new_id(HKDF) failed: " + opensslLastErrorString();
        return false;
    }

    bool ok = false;
    do {
        if (EVP_PKEY_derive_init(pctx) != 1) {
            errorMsg = "EVP_PKEY_derive_init failed: " + opensslLastErrorString();
            break;
        }
        if (EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) != 1) {
            errorMsg = "EVP_PKEY_CTX_set_hkdf_md failed: " + opensslLastErrorString();
            break;
        }
        if (EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt.data(), static_cast<int>(salt.size())) != 1) {
            errorMsg = "EVP_PKEY_CTX_set1_hkdf_salt failed: " + opensslLastErrorString();
            break;
        }
        if (EVP_PKEY_CTX_set1_hkdf_key(pctx, secret.data(), static_cast<int>(secret.size())) != 1) {
            errorMsg = "EVP_PKEY_CTX_set1_hkdf_key failed: " + opensslLastErrorString();
            break;
        }
        if (EVP_PKEY_CTX_add1_hkdf_info(pctx, reinterpret_cast<const unsigned char*>(info.data()),
                                        static_cast<int>(info.size())) != 1) {
            errorMsg = "EVP_PKEY_CTX_add1_hkdf_info failed: " + opensslLastErrorString();
            break;
        }

        size_t outLen = keyOut.size();
        if (EVP_PKEY_derive(pctx, keyOut.data(), &outLen) != 1 || outLen != keyOut.size()) {
            errorMsg = "EVP_PKEY_derive(HKDF) failed: " + opensslLastErrorString();
            break;
        }
        ok = true;
    } while (false);

    EVP_PKEY_CTX_free(pctx);
    if (!ok) {
        OPENSSL_cleanse(keyOut.data(), keyOut.size());
    }
    return ok;
}

}  // namespace

//=============================================================================
// Hex
//=============================================================================

std::string bytesToHex(const uint8_t* data, size_t size) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

bool hexToBytes(const std::string& hex, std::vector<uint8_t>& out) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    out.clear();
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hexValue(hex[i]);
        const int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

//=============================================================================
// IdentityKey
//=============================================================================

IdentityKey::IdentityKey(EVP_PKEY* key, std::string publicHex)
    : m_key(key)
    , m_publicHex(std::move(publicHex))
{
}

IdentityKey::~IdentityKey() {
    EVP_PKEY_free(m_key);
}

std::unique_ptr<IdentityKey> IdentityKey::generate(std::string& errorMsg) {
    EVP_PKEY* key = generateKey(EVP_PKEY_ED25519, errorMsg);
    if (!key) {
        return nullptr;
    }
    std::string publicHex;
    if (!rawPublicHex(key, ED25519_KEY_SIZE, publicHex, errorMsg)) {
        EVP_PKEY_free(key);
        return nullptr;
    }
    return std::unique_ptr<IdentityKey>(new IdentityKey(key, std::move(publicHex)));
}

std::unique_ptr<IdentityKey> IdentityKey::fromPrivateHex(const std::string& privateHex, std::string& errorMsg) {
    std::vector<uint8_t> raw;
    if (!hexToBytes(privateHex, raw) || raw.size() != ED25519_KEY_SIZE) {
        errorMsg = "Identity key is not 32 hex-encoded bytes";
        return nullptr;
    }

    EVP_PKEY* key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, raw.data(), raw.size());
    OPENSSL_cleanse(raw.data(), raw.size());
    if (!key) {
        errorMsg = "EVP_PKEY_new_raw_private_key failed: " + opensslLastErrorString();
        return nullptr;
    }

    std::string publicHex;
    if (!rawPublicHex(key, ED25519_KEY_SIZE, publicHex, errorMsg)) {
        EVP_PKEY_free(key);
        return nullptr;
    }
    return std::unique_ptr<IdentityKey>(new IdentityKey(key, std::move(publicHex)));
}

std::string IdentityKey::privateKeyHex() const {
    std::array<uint8_t, ED25519_KEY_SIZE> raw{};
    size_t len = raw.size();
    if (EVP_PKEY_get_raw_private_key(m_key, raw.data(), &len) != 1 || len != raw.size()) {
        return {};
    }
    std::string hex = bytesToHex(raw.data(), raw.size());
    OPENSSL_cleanse(raw.data(), raw.size());
    return hex;
}

bool IdentityKey::sign(const std::string& message, std::string& signatureHex, std::string& errorMsg) const {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        errorMsg = "Failed to create EVP_MD_CTX";
        return false;
    }

    std::array<uint8_t, ED25519_SIGNATURE_SIZE> sig{};
    size_t sigLen = sig.size();
    bool ok = EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, m_key) == 1 &&
              EVP_DigestSign(ctx, sig.data(), &sigLen,
                             reinterpret_cast<const unsigned char*>(message.data()), message.size()) == 1 &&
              sigLen == sig.size();
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        errorMsg = "Ed25519 signing failed: " + opensslLastErrorString();
        return false;
    }
    signatureHex = bytesToHex(sig.data(), sig.size());
    return true;
}

bool IdentityKey::verify(const std::string& publicKeyHex, const std::string& message,
                         const std::string& signatureHex)
{
    std::vector<uint8_t> sig;
    if (!hexToBytes(signatureHex, sig) || sig.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }

    EVP_PKEY* key = publicKeyFromHex(EVP_PKEY_ED25519, publicKeyHex, ED25519_KEY_SIZE);
    if (!key) {
        return false;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    bool ok = ctx &&
              EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, key) == 1 &&
              EVP_DigestVerify(ctx, sig.data(), sig.size(),
                               reinterpret_cast<const unsigned char*>(message.data()), message.size()) == 1;
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(key);
    // A failed verification leaves an entry on the error queue
    ERR_clear_error();
    return ok;
}

//=============================================================================
// EphemeralKeyPair
//=============================================================================

EphemeralKeyPair::EphemeralKeyPair(EVP_PKEY* key, std::string publicHex)
    : m_key(key)
    , m_publicHex(std::move(publicHex))
{
}

EphemeralKeyPair::~EphemeralKeyPair() {
    EVP_PKEY_free(m_key);
}

std::unique_ptr<EphemeralKeyPair> EphemeralKeyPair::generate(std::string& errorMsg) {
    EVP_PKEY* key = generateKey(EVP_PKEY_X25519, errorMsg);
    if (!key) {
        return nullptr;
    }
    std::string publicHex;
    if (!rawPublicHex(key, X25519_KEY_SIZE, publicHex, errorMsg)) {
        EVP_PKEY_free(key);
        return nullptr;
    }
    return std::unique_ptr<EphemeralKeyPair>(new EphemeralKeyPair(key, std::move(publicHex)));
}

bool EphemeralKeyPair::deriveSessionKey(const std::string& peerPublicHex, const std::string& context,
                                        SessionKey& keyOut, std::string& errorMsg) const
{
    EVP_PKEY* peer = publicKeyFromHex(EVP_PKEY_X25519, peerPublicHex, X25519_KEY_SIZE);
    if (!peer) {
        errorMsg = "Invalid X25519 public key";
        return false;
    }

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new(m_key, nullptr);
    if (!pctx) {
        EVP_PKEY_free(peer);
        errorMsg = "EVP_PKEY_CTX_new failed: " + opensslLastErrorString();
        return false;
    }

    std::vector<uint8_t> secret;
    bool ok = false;
    do {
        if (EVP_PKEY_derive_init(pctx) != 1) {
            errorMsg = "EVP_PKEY_derive_init failed: " + opensslLastErrorString();
            break;
        }
        if (EVP_PKEY_derive_set_peer(pctx, peer) != 1) {
            errorMsg = "EVP_PKEY_derive_set_peer failed: " + opensslLastErrorString();
            break;
        }
        size_t len = 0;
        if (EVP_PKEY_derive(pctx, nullptr, &len) != 1 || len == 0) {
            errorMsg = "EVP_PKEY_derive failed: " + opensslLastErrorString();
            break;
        }
        secret.resize(len);
        if (EVP_PKEY_derive(pctx, secret.data(), &len) != 1) {
            errorMsg = "EVP_PKEY_derive failed: " + opensslLastErrorString();
            break;
        }
        secret.resize(len);
        ok = true;
    } while (false);

    EVP_PKEY_CTX_free(pctx);
    EVP_PKEY_free(peer);
    if (!ok) {
        return false;
    }

    // Both public keys in a fixed order, so both sides build the same salt
    std::vector<uint8_t> salt;
    std::vector<uint8_t> ours;
    std::vector<uint8_t> theirs;
    if (!hexToBytes(m_publicHex, ours) || !hexToBytes(peerPublicHex, theirs)) {
        errorMsg = "Invalid X25519 public key";
        return false;
    }
    const std::vector<uint8_t>& first = std::min(ours, theirs);
    const std::vector<uint8_t>& second = std::max(ours, theirs);
    salt.insert(salt.end(), first.begin(), first.end());
    salt.insert(salt.end(), second.begin(), second.end());

    ok = hkdfSha256(secret, salt, "P2Lan transfer key v1|" + context, keyOut, errorMsg);
    OPENSSL_cleanse(secret.data(), secret.size());
    return ok;
}

//=============================================================================
// ChunkCipher
//=============================================================================

ChunkCipher::ChunkCipher(const SessionKey& key)
    : m_key(key)
{
}

ChunkCipher::~ChunkCipher() {
    OPENSSL_cleanse(m_key.data(), m_key.size());
}

std::string ChunkCipher::associatedData(const std::string& taskId, int64_t offset, int64_t rawSize) {
    return taskId + "|" + std::to_string(offset) + "|" + std::to_string(rawSize);
}

bool ChunkCipher::seal(const uint8_t* plain, size_t size, const std::string& aad,
                       SealedChunk& out, std::string& errorMsg) const
{
    if (RAND_bytes(out.nonce.data(), static_cast<int>(out.nonce.size())) != 1) {
        errorMsg = "RAND_bytes failed: " + opensslLastErrorString();
        return false;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        errorMsg = "Failed to create EVP_CIPHER_CTX";
        return false;
    }

    out.ciphertext.assign(size, 0);
    bool ok = false;
    do {
        int len = 0;
        if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(GCM_NONCE_SIZE), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx, nullptr, nullptr, m_key.data(), out.nonce.data()) != 1) {
            errorMsg = "AES-GCM init failed: " + opensslLastErrorString();
            break;
        }
        if (!aad.empty() &&
            EVP_EncryptUpdate(ctx, nullptr, &len, reinterpret_cast<const unsigned char*>(aad.data()),
                              static_cast<int>(aad.size())) != 1) {
            errorMsg = "AES-GCM aad failed: " + opensslLastErrorString();
            break;
        }
        int written = 0;
        if (size > 0) {
            if (EVP_EncryptUpdate(ctx, out.ciphertext.data(), &len, plain, static_cast<int>(size)) != 1) {
                errorMsg = "AES-GCM encrypt failed: " + opensslLastErrorString();
                break;
            }
            written = len;
        }
        if (EVP_EncryptFinal_ex(ctx, out.ciphertext.data() + written, &len) != 1) {
            errorMsg = "AES-GCM final failed: " + opensslLastErrorString();
            break;
        }
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                                out.tag.data()) != 1) {
            errorMsg = "AES-GCM tag failed: " + opensslLastErrorString();
            break;
        }
        ok = true;
    } while (false);

    EVP_CIPHER_CTX_free(ctx);
    return ok;
}

bool ChunkCipher::open(const SealedChunk& sealed, const std::string& aad,
                       std::vector<uint8_t>& plainOut, std::string& errorMsg) const
{
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        errorMsg = "Failed to create EVP_CIPHER_CTX";
        return false;
    }

    plainOut.assign(sealed.ciphertext.size(), 0);
    std::array<uint8_t, GCM_TAG_SIZE> tag = sealed.tag;
    bool ok = false;
    do {
        int len = 0;
        if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(GCM_NONCE_SIZE), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx, nullptr, nullptr, m_key.data(), sealed.nonce.data()) != 1) {
            errorMsg = "AES-GCM init failed: " + opensslLastErrorString();
            break;
        }
        if (!aad.empty() &&
            EVP_DecryptUpdate(ctx, nullptr, &len, reinterpret_cast<const unsigned char*>(aad.data()),
                              static_cast<int>(aad.size())) != 1) {
            errorMsg = "AES-GCM aad failed: " + opensslLastErrorString();
            break;
        }
        int written = 0;
        if (!sealed.ciphertext.empty()) {
            if (EVP_DecryptUpdate(ctx, plainOut.data(), &len, sealed.ciphertext.data(),
                                  static_cast<int>(sealed.ciphertext.size())) != 1) {
                errorMsg = "AES-GCM decrypt failed: " + opensslLastErrorString();
                break;
            }
            written = len;
        }
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE), tag.data()) != 1) {
            errorMsg = "AES-GCM tag failed: " + opensslLastErrorString();
            break;
        }
        if (EVP_DecryptFinal_ex(ctx, plainOut.data() + written, &len) != 1) {
            errorMsg = "Chunk authentication failed";
            ERR_clear_error();
            break;
        }
        ok = true;
    } while (false);

    EVP_CIPHER_CTX_free(ctx);
    if (!ok) {
        OPENSSL_cleanse(plainOut.data(), plainOut.size());
        plainOut.clear();
    }
    return ok;
}

}  // namespace P2Lan
