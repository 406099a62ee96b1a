/**
 * @file Compression.h
 * @brief zlib deflate for transfer chunks
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace P2Lan {

/**
 * @class Compression
 * @brief Stateless chunk compression
 *
 * Every chunk is compressed on its own, so a receiver can inflate it
 * without any earlier chunk.
 */
class Compression {
public:
    /**
     * @brief Deflate a chunk if that pays off
     * @return false if the input is too small or does not shrink by
     *         COMPRESSION_MIN_RATIO; `out` is then unspecified
     */
    static bool compressChunk(const uint8_t* data, size_t size, std::vector<uint8_t>& out);

    /**
     * @param expectedSize Exact inflated size announced by the sender
     * @return false on corrupt input or a size mismatch
     */
    static bool decompressChunk(const uint8_t* data, size_t size, size_t expectedSize,
                                std::vector<uint8_t>& out, std::string& errorMsg);

private:
    Compression() = delete;
};

}  // namespace P2Lan
