/**
 * @file Compression.cpp
 * @brief zlib chunk compression
 */

#include "p2lan/Compression.h"
#include "p2lan/config.h"

#include <zlib.h>

namespace P2Lan {

bool Compression::compressChunk(const uint8_t* data, size_t size, std::vector<uint8_t>& out) {
    if (size < COMPRESSION_MIN_INPUT) {
        return false;
    }

    uLongf compressedSize = compressBound(static_cast<uLong>(size));
    out.resize(compressedSize);

    int result = compress2(out.data(), &compressedSize, data, static_cast<uLong>(size), Z_DEFAULT_COMPRESSION);
    if (result != Z_OK || compressedSize == 0) {
        return false;
    }
    out.resize(compressedSize);

    return static_cast<double>(size) / static_cast<double>(compressedSize) >= COMPRESSION_MIN_RATIO;
}

bool Compression::decompressChunk(const uint8_t* data, size_t size, size_t expectedSize,
                                  std::vector<uint8_t>& out, std::string& errorMsg)
{
    if (expectedSize == 0 || expectedSize > static_cast<size_t>(MAX_CHUNK_SIZE_KB) * 1024) {
        errorMsg = "Invalid uncompressed chunk size: " + std::to_string(expectedSize);
        return false;
    }

    out.resize(expectedSize);
    uLongf outSize = static_cast<uLongf>(expectedSize);
    int result = uncompress(out.data(), &outSize, data, static_cast<uLong>(size));
    if (result != Z_OK) {
        errorMsg = std::string("Chunk decompression failed: ") + zError(result);
        out.clear();
        return false;
    }
    if (outSize != expectedSize) {
        errorMsg = "Chunk inflated to " + std::to_string(outSize) + " bytes, expected " +
                   std::to_string(expectedSize);
        out.clear();
        return false;
    }
    return true;
}

}  // namespace P2Lan
