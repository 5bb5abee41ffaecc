#ifndef SLOTINGEST_COMPONENTS_TEXT_CHARSET_H
#define SLOTINGEST_COMPONENTS_TEXT_CHARSET_H

#include <cstddef>
#include <string>

namespace slotingest::components::text {

/**
 * @brief Character encodings understood by the line decoder.
 *
 * Decoded lines are always returned as UTF-8 (or plain bytes for UTF8).
 */
enum class Charset {
    UTF8,    // Bytes are passed through unchanged
    LATIN1,  // ISO-8859-1, every byte maps to one code point
    ASCII    // US-ASCII, bytes above 0x7F become '?'
};

/**
 * @brief Parse a charset name ("UTF-8", "ISO-8859-1", "US-ASCII", ...).
 *
 * Matching is case-insensitive and accepts common aliases.
 *
 * @throws std::invalid_argument for unsupported names
 */
Charset parse_charset(const std::string& name);

const char* charset_name(Charset charset);

/**
 * @brief Check whether a charset name is supported without throwing.
 */
bool is_supported_charset(const std::string& name);

/**
 * @brief Convert raw line bytes from the given charset to the output form.
 */
std::string decode_bytes(const char* data, std::size_t length,
                         Charset charset);

}  // namespace slotingest::components::text

#endif  // SLOTINGEST_COMPONENTS_TEXT_CHARSET_H
