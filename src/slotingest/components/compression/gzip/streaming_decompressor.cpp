#include <slotingest/components/compression/gzip/streaming_decompressor.h>
#include <slotingest/core/common/errors.h>
#include <slotingest/core/common/logging.h>

#include <cstring>
#include <string>

namespace slotingest::components::compression::gzip {

StreamingDecompressor::StreamingDecompressor()
    : output_buffer_(OUTPUT_BUFFER_SIZE) {}

StreamingDecompressor::~StreamingDecompressor() {
    if (initialized_) {
        inflateEnd(&stream_);
    }
}

std::vector<RawData> StreamingDecompressor::decompress_chunk(
    const CompressedData& chunk) {
    if (!initialized_) {
        initialize();
    }

    if (chunk.empty() || trailing_garbage_) {
        return {};
    }

    std::vector<RawData> output_chunks;

    stream_.avail_in = static_cast<uInt>(chunk.size());
    stream_.next_in = const_cast<Bytef*>(chunk.data.data());
    total_in_ += chunk.size();

    do {
        if (stream_end_) {
            if (stream_.avail_in == 0) {
                break;
            }
            if (stream_.next_in[0] != 0x1f) {
                SLOTINGEST_LOG_DEBUG(
                    "Ignoring %u trailing bytes after gzip member",
                    stream_.avail_in);
                trailing_garbage_ = true;
                break;
            }
            // Next member of a multi-member stream
            inflateReset(&stream_);
            stream_end_ = false;
        }

        stream_.avail_out = static_cast<uInt>(output_buffer_.size());
        stream_.next_out = output_buffer_.data();

        int ret = inflate(&stream_, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
            ret == Z_STREAM_ERROR) {
            std::string reason = stream_.msg ? stream_.msg : "unknown error";
            throw DecodeFailure("Corrupt gzip stream (zlib " +
                                std::to_string(ret) + "): " + reason);
        }

        std::size_t produced = output_buffer_.size() - stream_.avail_out;
        if (produced > 0) {
            total_out_ += produced;
            output_chunks.emplace_back(std::vector<unsigned char>(
                output_buffer_.begin(),
                output_buffer_.begin() +
                    static_cast<std::ptrdiff_t>(produced)));
        }

        if (ret == Z_STREAM_END) {
            stream_end_ = true;
        } else if (ret == Z_BUF_ERROR && produced == 0) {
            break;
        }
    } while (stream_.avail_in > 0 || stream_.avail_out == 0);

    return output_chunks;
}

void StreamingDecompressor::initialize() {
    std::memset(&stream_, 0, sizeof(stream_));

    int ret = inflateInit2(&stream_, 15 + 16);  // gzip format only
    if (ret != Z_OK) {
        throw DecodeFailure("Failed to initialize inflate");
    }

    initialized_ = true;
}

}  // namespace slotingest::components::compression::gzip
