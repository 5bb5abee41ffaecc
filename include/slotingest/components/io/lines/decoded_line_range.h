#ifndef SLOTINGEST_COMPONENTS_IO_LINES_DECODED_LINE_RANGE_H
#define SLOTINGEST_COMPONENTS_IO_LINES_DECODED_LINE_RANGE_H

#include <slotingest/components/io/byte_source.h>
#include <slotingest/components/io/lines/line_types.h>
#include <slotingest/components/text/charset.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace slotingest::components::io::lines {

/**
 * @brief Lazy, single-pass sequence of text lines over a ByteSource.
 *
 * Lines end at "\n", "\r\n" or a lone "\r"; terminators are not part of
 * the returned content. A final line without terminator is still returned.
 * The range owns its source and releases it when exhausted, on close(),
 * or on destruction, whichever comes first.
 *
 * Usage:
 * @code
 * DecodedLineRange range(std::move(source), text::Charset::UTF8);
 * while (range.has_next()) {
 *     Line line = range.next();
 *     // Process line...
 * }
 * @endcode
 */
class DecodedLineRange {
   private:
    std::unique_ptr<ByteSource> source_;
    text::Charset charset_;
    std::vector<unsigned char> buffer_;
    std::size_t buffer_pos_ = 0;
    std::size_t buffer_size_ = 0;
    bool skip_lf_ = false;

    std::string next_line_;
    bool has_next_line_ = false;
    bool exhausted_ = false;
    std::size_t current_line_ = 0;
    std::size_t bytes_consumed_ = 0;
    std::size_t lines_read_ = 0;

    static constexpr std::size_t DEFAULT_READ_BUFFER_SIZE = 64 * 1024;

   public:
    /**
     * @param source Byte source to split; may be null for an empty range
     * @param charset Encoding of the source bytes
     * @throws DecodeFailure if the first read fails
     */
    DecodedLineRange(std::unique_ptr<ByteSource> source,
                     text::Charset charset);

    DecodedLineRange(DecodedLineRange&&) = default;
    DecodedLineRange& operator=(DecodedLineRange&&) = default;
    DecodedLineRange(const DecodedLineRange&) = delete;
    DecodedLineRange& operator=(const DecodedLineRange&) = delete;

    bool has_next() const { return has_next_line_; }

    /**
     * @brief Get the next line.
     *
     * @throws std::out_of_range if no more lines are available
     * @throws DecodeFailure if reading ahead hits corrupt input
     */
    Line next();

    /**
     * @brief Release the underlying source early; the range becomes empty.
     */
    void close();

    /**
     * @brief Decoded bytes consumed so far, terminators included.
     */
    std::size_t bytes_consumed() const { return bytes_consumed_; }

    /**
     * @brief Lines handed out by next() so far.
     */
    std::size_t lines_read() const { return lines_read_; }

    bool is_open() const { return source_ != nullptr; }

   private:
    void advance();
    bool refill();
};

}  // namespace slotingest::components::io::lines

#endif  // SLOTINGEST_COMPONENTS_IO_LINES_DECODED_LINE_RANGE_H
