#include <slotingest/components/compression/gzip/gzip.h>
#include <slotingest/components/io/content_decoder.h>
#include <slotingest/core/common/logging.h>

namespace slotingest::components::io {

ContentDecoder::ContentDecoder(const std::string& charset)
    : charset_(text::parse_charset(charset)) {}

ContentDecoder::ContentDecoder(text::Charset charset) : charset_(charset) {}

bool ContentDecoder::is_gzip(const RawData& data) {
    if (data.size() < compression::gzip::GZIP_MAGIC_LENGTH) {
        return false;
    }
    return data.data[0] == compression::gzip::GZIP_MAGIC_0 &&
           data.data[1] == compression::gzip::GZIP_MAGIC_1;
}

lines::DecodedLineRange ContentDecoder::process(
    const std::shared_ptr<const RawData>& input) {
    std::unique_ptr<ByteSource> source =
        std::make_unique<MemoryByteSource>(input);

    if (input && is_gzip(*input)) {
        SLOTINGEST_LOG_TRACE("Gzip content detected (%zu bytes)",
                             input->size());
        source = std::make_unique<compression::gzip::GzipByteSource>(
            std::move(source));
    }

    return lines::DecodedLineRange(std::move(source), charset_);
}

lines::DecodedLineRange ContentDecoder::decode(RawData data) {
    return process(std::make_shared<const RawData>(std::move(data)));
}

}  // namespace slotingest::components::io
