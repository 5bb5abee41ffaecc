#include <slotingest/components/io/lines/decoded_line_range.h>

#include <stdexcept>

namespace slotingest::components::io::lines {

DecodedLineRange::DecodedLineRange(std::unique_ptr<ByteSource> source,
                                   text::Charset charset)
    : source_(std::move(source)),
      charset_(charset),
      buffer_(DEFAULT_READ_BUFFER_SIZE) {
    // Pre-read the first line
    advance();
}

Line DecodedLineRange::next() {
    if (!has_next()) {
        throw std::out_of_range("No more lines available");
    }

    Line result(text::decode_bytes(next_line_.data(), next_line_.size(),
                                   charset_),
                current_line_);
    ++lines_read_;
    advance();
    return result;
}

void DecodedLineRange::close() {
    source_.reset();
    has_next_line_ = false;
    exhausted_ = true;
}

bool DecodedLineRange::refill() {
    if (!source_) {
        return false;
    }
    buffer_size_ = source_->read(buffer_.data(), buffer_.size());
    buffer_pos_ = 0;
    return buffer_size_ > 0;
}

void DecodedLineRange::advance() {
    next_line_.clear();
    has_next_line_ = false;

    if (exhausted_) {
        return;
    }

    bool got_any = false;

    while (true) {
        if (buffer_pos_ >= buffer_size_ && !refill()) {
            break;
        }

        unsigned char c = buffer_[buffer_pos_++];
        ++bytes_consumed_;

        if (skip_lf_) {
            skip_lf_ = false;
            if (c == '\n') {
                continue;  // second half of "\r\n"
            }
        }

        got_any = true;

        if (c == '\n') {
            break;
        }
        if (c == '\r') {
            skip_lf_ = true;
            break;
        }
        next_line_.push_back(static_cast<char>(c));
    }

    if (got_any) {
        ++current_line_;
        has_next_line_ = true;
    } else {
        exhausted_ = true;
        source_.reset();
    }
}

}  // namespace slotingest::components::io::lines
