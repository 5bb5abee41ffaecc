#ifndef SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_STREAMING_DECOMPRESSOR_H
#define SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_STREAMING_DECOMPRESSOR_H

#include <slotingest/components/io/types/types.h>
#include <zlib.h>

#include <cstddef>
#include <vector>

namespace slotingest::components::compression::gzip {

using io::CompressedData;
using io::RawData;

/**
 * @brief Chunk-by-chunk gzip decompressor.
 *
 * Feed compressed chunks in order; each call returns whatever output the
 * chunk completed. Concatenated gzip members are decoded back to back.
 * Bytes after a complete member that do not start a new member are
 * ignored.
 *
 * @throws DecodeFailure on corrupt input
 */
class StreamingDecompressor {
   private:
    z_stream stream_;
    bool initialized_ = false;
    bool stream_end_ = false;
    bool trailing_garbage_ = false;
    std::size_t total_in_ = 0;
    std::size_t total_out_ = 0;

    static constexpr std::size_t OUTPUT_BUFFER_SIZE = 64 * 1024;
    std::vector<unsigned char> output_buffer_;

   public:
    StreamingDecompressor();
    ~StreamingDecompressor();

    StreamingDecompressor(const StreamingDecompressor&) = delete;
    StreamingDecompressor& operator=(const StreamingDecompressor&) = delete;

    std::vector<RawData> decompress_chunk(const CompressedData& chunk);

    /**
     * @brief True once the last fed member has been fully decoded.
     *
     * A stream that ends while this is false was truncated.
     */
    bool is_stream_end() const { return stream_end_; }

    std::size_t total_bytes_in() const { return total_in_; }
    std::size_t total_bytes_out() const { return total_out_; }

   private:
    void initialize();
};

}  // namespace slotingest::components::compression::gzip

#endif  // SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_STREAMING_DECOMPRESSOR_H
