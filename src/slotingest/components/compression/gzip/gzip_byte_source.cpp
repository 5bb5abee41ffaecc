#include <slotingest/components/compression/gzip/gzip_byte_source.h>
#include <slotingest/core/common/errors.h>

#include <algorithm>
#include <cstring>

namespace slotingest::components::compression::gzip {

GzipByteSource::GzipByteSource(std::unique_ptr<io::ByteSource> inner)
    : inner_(std::move(inner)), input_buffer_(INPUT_CHUNK_SIZE) {}

std::size_t GzipByteSource::read(unsigned char* buffer,
                                 std::size_t buffer_size) {
    std::size_t written = 0;

    while (written < buffer_size) {
        if (pending_.empty() && !fill_pending()) {
            break;
        }

        const io::RawData& front = pending_.front();
        std::size_t available = front.size() - pending_offset_;
        std::size_t n = std::min(available, buffer_size - written);
        std::memcpy(buffer + written, front.data.data() + pending_offset_, n);
        written += n;
        pending_offset_ += n;

        if (pending_offset_ == front.size()) {
            pending_.pop_front();
            pending_offset_ = 0;
        }
    }

    return written;
}

bool GzipByteSource::fill_pending() {
    while (pending_.empty()) {
        if (input_done_) {
            return false;
        }

        std::size_t n = inner_->read(input_buffer_.data(), input_buffer_.size());
        if (n == 0) {
            input_done_ = true;
            if (!decompressor_.is_stream_end()) {
                throw DecodeFailure("Truncated gzip stream after " +
                                    std::to_string(
                                        decompressor_.total_bytes_in()) +
                                    " compressed bytes");
            }
            return false;
        }

        io::CompressedData chunk{std::vector<unsigned char>(
            input_buffer_.begin(),
            input_buffer_.begin() + static_cast<std::ptrdiff_t>(n))};
        for (auto& out : decompressor_.decompress_chunk(chunk)) {
            pending_.push_back(std::move(out));
        }
    }
    return true;
}

}  // namespace slotingest::components::compression::gzip
