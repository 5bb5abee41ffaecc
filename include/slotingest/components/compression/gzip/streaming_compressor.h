#ifndef SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_STREAMING_COMPRESSOR_H
#define SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_STREAMING_COMPRESSOR_H

#include <slotingest/components/io/types/types.h>
#include <zlib.h>

#include <cstddef>
#include <vector>

namespace slotingest::components::compression::gzip {

using io::CompressedData;
using io::RawData;

/**
 * @brief Writes one gzip member from data handed over in pieces.
 *
 * Used to build gzip fixtures and to produce slot content that the
 * decoder must inflate transparently.
 *
 * Usage:
 * @code
 * ManualStreamingCompressor compressor;
 * auto out = compressor.compress_chunk(RawData{std::string("hello\n")});
 * auto tail = compressor.finalize();
 * @endcode
 */
class ManualStreamingCompressor {
   private:
    z_stream stream_;
    bool initialized_ = false;
    bool finished_ = false;
    int level_;
    std::size_t total_in_ = 0;
    std::size_t total_out_ = 0;
    std::vector<unsigned char> scratch_;

    static constexpr std::size_t SCRATCH_SIZE = 64 * 1024;

   public:
    /**
     * @throws std::invalid_argument unless level is 0-9 or
     *         Z_DEFAULT_COMPRESSION
     */
    explicit ManualStreamingCompressor(int level = Z_DEFAULT_COMPRESSION);
    ~ManualStreamingCompressor();

    ManualStreamingCompressor(const ManualStreamingCompressor&) = delete;
    ManualStreamingCompressor& operator=(const ManualStreamingCompressor&) =
        delete;

    /**
     * @throws std::logic_error after finalize()
     */
    std::vector<CompressedData> compress_chunk(const RawData& chunk);

    /**
     * @brief Flush pending output and write the gzip trailer.
     */
    std::vector<CompressedData> finalize();

    std::size_t total_bytes_in() const { return total_in_; }
    std::size_t total_bytes_out() const { return total_out_; }

   private:
    void ensure_initialized();
    std::vector<CompressedData> drain(int flush);
};

/**
 * @brief Compress a whole buffer into one gzip member.
 */
CompressedData compress(const RawData& input,
                        int level = Z_DEFAULT_COMPRESSION);

}  // namespace slotingest::components::compression::gzip

#endif  // SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_STREAMING_COMPRESSOR_H
