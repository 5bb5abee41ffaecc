#ifndef SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_GZIP_BYTE_SOURCE_H
#define SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_GZIP_BYTE_SOURCE_H

#include <slotingest/components/compression/gzip/streaming_decompressor.h>
#include <slotingest/components/io/byte_source.h>

#include <cstddef>
#include <deque>
#include <memory>
#include <vector>

namespace slotingest::components::compression::gzip {

/**
 * @brief ByteSource that inflates a gzip stream read from another source.
 *
 * Compressed input is pulled in fixed-size chunks only when the decoded
 * output runs dry.
 *
 * @throws DecodeFailure if the input is corrupt or ends mid-member
 */
class GzipByteSource : public io::ByteSource {
   private:
    std::unique_ptr<io::ByteSource> inner_;
    StreamingDecompressor decompressor_;
    std::vector<unsigned char> input_buffer_;
    std::deque<io::RawData> pending_;
    std::size_t pending_offset_ = 0;
    bool input_done_ = false;

    static constexpr std::size_t INPUT_CHUNK_SIZE = 64 * 1024;

   public:
    explicit GzipByteSource(std::unique_ptr<io::ByteSource> inner);

    std::size_t read(unsigned char* buffer, std::size_t buffer_size) override;

   private:
    bool fill_pending();
};

}  // namespace slotingest::components::compression::gzip

#endif  // SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_GZIP_BYTE_SOURCE_H
