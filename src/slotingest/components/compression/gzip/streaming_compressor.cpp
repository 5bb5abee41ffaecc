#include <slotingest/components/compression/gzip/streaming_compressor.h>

#include <cstring>
#include <stdexcept>

namespace slotingest::components::compression::gzip {

ManualStreamingCompressor::ManualStreamingCompressor(int level)
    : level_(level), scratch_(SCRATCH_SIZE) {
    bool valid = level_ == Z_DEFAULT_COMPRESSION || (level_ >= 0 && level_ <= 9);
    if (!valid) {
        throw std::invalid_argument("Invalid gzip level " +
                                    std::to_string(level_));
    }
}

ManualStreamingCompressor::~ManualStreamingCompressor() {
    if (initialized_) {
        deflateEnd(&stream_);
    }
}

void ManualStreamingCompressor::ensure_initialized() {
    if (initialized_) {
        return;
    }
    std::memset(&stream_, 0, sizeof(stream_));
    // windowBits 15 + 16 selects the gzip wrapper
    if (deflateInit2(&stream_, level_, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    initialized_ = true;
}

std::vector<CompressedData> ManualStreamingCompressor::drain(int flush) {
    std::vector<CompressedData> out;
    int ret = Z_OK;
    do {
        stream_.next_out = scratch_.data();
        stream_.avail_out = static_cast<uInt>(scratch_.size());

        ret = deflate(&stream_, flush);
        if (ret == Z_STREAM_ERROR) {
            throw std::runtime_error("deflate failed");
        }

        std::size_t produced = scratch_.size() - stream_.avail_out;
        if (produced > 0) {
            total_out_ += produced;
            out.emplace_back(std::vector<unsigned char>(
                scratch_.begin(),
                scratch_.begin() + static_cast<std::ptrdiff_t>(produced)));
        }
        // Z_NO_FLUSH: stop once input is consumed and output has room
        // Z_FINISH: stop at the end of the member
    } while (flush == Z_FINISH ? ret != Z_STREAM_END
                               : (stream_.avail_in > 0 ||
                                  stream_.avail_out == 0));
    return out;
}

std::vector<CompressedData> ManualStreamingCompressor::compress_chunk(
    const RawData& chunk) {
    if (finished_) {
        throw std::logic_error("compress_chunk() after finalize()");
    }
    ensure_initialized();
    if (chunk.empty()) {
        return {};
    }

    stream_.next_in = const_cast<Bytef*>(chunk.data.data());
    stream_.avail_in = static_cast<uInt>(chunk.size());
    total_in_ += chunk.size();
    return drain(Z_NO_FLUSH);
}

std::vector<CompressedData> ManualStreamingCompressor::finalize() {
    ensure_initialized();
    if (finished_) {
        return {};
    }
    stream_.next_in = nullptr;
    stream_.avail_in = 0;
    auto out = drain(Z_FINISH);
    finished_ = true;
    return out;
}

CompressedData compress(const RawData& input, int level) {
    ManualStreamingCompressor compressor(level);
    CompressedData result;
    result.original_size = input.size();

    auto append = [&result](const std::vector<CompressedData>& parts) {
        for (const auto& part : parts) {
            result.data.insert(result.data.end(), part.data.begin(),
                               part.data.end());
        }
    };
    append(compressor.compress_chunk(input));
    append(compressor.finalize());
    return result;
}

}  // namespace slotingest::components::compression::gzip
