/**
 * @file WireCodec.h
 * @brief Length-prefixed JSON framing for session sockets
 *
 * Frame layout:
 * - Offset 0-3: payload length, unsigned 32-bit big-endian
 * - Offset 4..: UTF-8 JSON envelope (see WireMessage)
 *
 * A declared length above MAX_FRAME_SIZE cannot be resynchronized and is
 * reported as CorruptStream; the session must be reset. A complete frame
 * with bad JSON or missing envelope fields is MalformedFrame; it is
 * consumed and the session continues.
 */

#pragma once

#include "WireMessage.h"

#include <cstdint>
#include <string>
#include <vector>

namespace P2Lan {

enum class DecodeStatus {
    Ok,
    IncompleteFrame,   ///< Need more bytes
    MalformedFrame,    ///< Frame consumed and dropped
    CorruptStream      ///< Unrecoverable, reset the connection
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::IncompleteFrame;
    WireMessage message;
    std::string error;
};

/**
 * @brief Serialize a message into one frame
 * @param frame Output buffer (replaced)
 * @param errorMsg Reason on failure (payload too large)
 */
bool encodeFrame(const WireMessage& message, std::vector<uint8_t>& frame, std::string& errorMsg);

/**
 * @brief Parse one JSON payload (without the length prefix)
 */
DecodeResult decodePayload(const std::string& payload);

/**
 * @brief Incremental decoder fed with arbitrary socket chunks
 *
 * Not thread-safe; each connection reader owns one.
 */
class FrameDecoder {
public:
    void feed(const uint8_t* data, size_t size);

    /**
     * @brief Extract the next frame, if complete
     *
     * After CorruptStream the decoder stays corrupt until reset().
     */
    DecodeResult next();

    size_t bufferedBytes() const { return m_buffer.size() - m_readPos; }
    void reset();

private:
    void compact();

    std::vector<uint8_t> m_buffer;
    size_t m_readPos = 0;
    bool m_corrupt = false;
};

}  // namespace P2Lan
