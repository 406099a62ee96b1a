/**
 * @file SessionCrypto.h
 * @brief Device identity keys, X25519 key agreement and AES-256-GCM chunk sealing
 */

#pragma once

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace P2Lan {

constexpr size_t SESSION_KEY_SIZE = 32;       ///< AES-256 key
constexpr size_t GCM_NONCE_SIZE = 12;
constexpr size_t GCM_TAG_SIZE = 16;
constexpr size_t X25519_KEY_SIZE = 32;
constexpr size_t ED25519_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

using SessionKey = std::array<uint8_t, SESSION_KEY_SIZE>;

/**
 * @brief Lowercase hex of a byte buffer
 */
std::string bytesToHex(const uint8_t* data, size_t size);

/**
 * @return false on odd length or a non-hex character
 */
bool hexToBytes(const std::string& hex, std::vector<uint8_t>& out);

//=============================================================================
// IdentityKey
//=============================================================================

/**
 * @class IdentityKey
 * @brief Long-term Ed25519 key of this device
 *
 * The public half is announced in the session handshake and pinned by
 * peers; the private half signs handshake transcripts and key exchanges.
 * Immutable after construction, so one instance may be shared by threads.
 */
class IdentityKey {
public:
    using Ptr = std::shared_ptr<const IdentityKey>;

    static std::unique_ptr<IdentityKey> generate(std::string& errorMsg);

    /**
     * @brief Rebuild a key from its stored private half
     */
    static std::unique_ptr<IdentityKey> fromPrivateHex(const std::string& privateHex, std::string& errorMsg);

    ~IdentityKey();

    IdentityKey(const IdentityKey&) = delete;
    IdentityKey& operator=(const IdentityKey&) = delete;

    std::string privateKeyHex() const;
    const std::string& publicKeyHex() const { return m_publicHex; }

    bool sign(const std::string& message, std::string& signatureHex, std::string& errorMsg) const;

    /**
     * @brief Check an Ed25519 signature made by the holder of publicKeyHex
     */
    static bool verify(const std::string& publicKeyHex, const std::string& message,
                       const std::string& signatureHex);

private:
    IdentityKey(EVP_PKEY* key, std::string publicHex);

    EVP_PKEY* m_key;
    const std::string m_publicHex;
};

//=============================================================================
// EphemeralKeyPair
//=============================================================================

/**
 * @class EphemeralKeyPair
 * @brief One-shot X25519 key pair for a transfer key exchange
 *
 * The shared secret is never used directly: it is stretched with
 * HKDF-SHA256, salted by both public keys, into the AES-256 session key.
 */
class EphemeralKeyPair {
public:
    static std::unique_ptr<EphemeralKeyPair> generate(std::string& errorMsg);

    ~EphemeralKeyPair();

    EphemeralKeyPair(const EphemeralKeyPair&) = delete;
    EphemeralKeyPair& operator=(const EphemeralKeyPair&) = delete;

    const std::string& publicKeyHex() const { return m_publicHex; }

    /**
     * @param peerPublicHex The other side's X25519 public key
     * @param context Bound into the HKDF info; both sides must pass the same text
     */
    bool deriveSessionKey(const std::string& peerPublicHex, const std::string& context,
                          SessionKey& keyOut, std::string& errorMsg) const;

private:
    EphemeralKeyPair(EVP_PKEY* key, std::string publicHex);

    EVP_PKEY* m_key;
    const std::string m_publicHex;
};

//=============================================================================
// ChunkCipher
//=============================================================================

/**
 * @brief One sealed chunk: random nonce, ciphertext and GCM tag
 */
struct SealedChunk {
    std::array<uint8_t, GCM_NONCE_SIZE> nonce{};
    std::vector<uint8_t> ciphertext;
    std::array<uint8_t, GCM_TAG_SIZE> tag{};
};

/**
 * @class ChunkCipher
 * @brief AES-256-GCM over file chunks
 *
 * The associated data binds every chunk to its task, offset and
 * compression header, so a chunk replayed into another task or position
 * fails authentication.
 */
class ChunkCipher {
public:
    explicit ChunkCipher(const SessionKey& key);
    ~ChunkCipher();

    ChunkCipher(const ChunkCipher&) = delete;
    ChunkCipher& operator=(const ChunkCipher&) = delete;

    /**
     * @param rawSize Inflated size of a compressed chunk, 0 if uncompressed
     */
    static std::string associatedData(const std::string& taskId, int64_t offset, int64_t rawSize);

    bool seal(const uint8_t* plain, size_t size, const std::string& aad,
              SealedChunk& out, std::string& errorMsg) const;

    /**
     * @return false if the tag does not authenticate the ciphertext and aad
     */
    bool open(const SealedChunk& sealed, const std::string& aad,
              std::vector<uint8_t>& plainOut, std::string& errorMsg) const;

private:
    SessionKey m_key;
};

}  // namespace P2Lan
