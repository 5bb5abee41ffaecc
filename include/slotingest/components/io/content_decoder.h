#ifndef SLOTINGEST_COMPONENTS_IO_CONTENT_DECODER_H
#define SLOTINGEST_COMPONENTS_IO_CONTENT_DECODER_H

#include <slotingest/components/io/lines/decoded_line_range.h>
#include <slotingest/components/io/types/types.h>
#include <slotingest/components/text/charset.h>
#include <slotingest/core/utilities/tags/parallelizable.h>
#include <slotingest/core/utilities/utility.h>

#include <memory>
#include <string>

namespace slotingest::components::io {

/**
 * @brief Turns fetched bytes into a lazy sequence of text lines.
 *
 * The first two bytes are inspected without being consumed. If they carry
 * the gzip magic number the content is inflated on the fly; otherwise it
 * is read as-is. Content too short to probe is treated as uncompressed.
 *
 * Usage:
 * @code
 * ContentDecoder decoder("UTF-8");
 * auto range = decoder.decode(raw);
 * while (range.has_next()) {
 *     auto line = range.next();
 * }
 * @endcode
 */
class ContentDecoder
    : public utilities::Utility<std::shared_ptr<const RawData>,
                                lines::DecodedLineRange,
                                utilities::tags::Parallelizable> {
   private:
    text::Charset charset_;

   public:
    /**
     * @throws std::invalid_argument for unsupported charsets
     */
    explicit ContentDecoder(const std::string& charset = "UTF-8");
    explicit ContentDecoder(text::Charset charset);
    ~ContentDecoder() override = default;

    lines::DecodedLineRange process(
        const std::shared_ptr<const RawData>& input) override;

    lines::DecodedLineRange decode(RawData data);

    /**
     * @brief True when the content starts with the gzip magic number.
     */
    static bool is_gzip(const RawData& data);

    text::Charset charset() const { return charset_; }
};

}  // namespace slotingest::components::io

#endif  // SLOTINGEST_COMPONENTS_IO_CONTENT_DECODER_H
