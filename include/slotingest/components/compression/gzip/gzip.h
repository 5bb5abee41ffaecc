#ifndef SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_GZIP_H
#define SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_GZIP_H

/**
 * @file gzip.h
 * @brief Convenience header for gzip compression utilities.
 *
 * - ManualStreamingCompressor / compress(): produce gzip members
 * - StreamingDecompressor: chunk-by-chunk inflate of gzip members
 * - GzipByteSource: lazy decompressing io::ByteSource adapter
 */

#include <slotingest/components/compression/gzip/gzip_byte_source.h>
#include <slotingest/components/compression/gzip/streaming_compressor.h>
#include <slotingest/components/compression/gzip/streaming_decompressor.h>

namespace slotingest::components::compression::gzip {

// First two bytes of every gzip member
inline constexpr unsigned char GZIP_MAGIC_0 = 0x1f;
inline constexpr unsigned char GZIP_MAGIC_1 = 0x8b;
inline constexpr std::size_t GZIP_MAGIC_LENGTH = 2;

}  // namespace slotingest::components::compression::gzip

#endif  // SLOTINGEST_COMPONENTS_COMPRESSION_GZIP_GZIP_H
