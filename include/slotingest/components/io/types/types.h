#ifndef SLOTINGEST_COMPONENTS_IO_TYPES_TYPES_H
#define SLOTINGEST_COMPONENTS_IO_TYPES_TYPES_H

#include <cstddef>
#include <string>
#include <vector>

namespace slotingest::components::io {

/**
 * @brief Bytes of a slot as fetched, or of inflated gzip output.
 */
struct RawData {
    std::vector<unsigned char> data;

    RawData() = default;
    explicit RawData(std::vector<unsigned char> bytes)
        : data(std::move(bytes)) {}
    explicit RawData(const std::string& text)
        : data(text.begin(), text.end()) {}

    std::size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
};

/**
 * @brief Gzip bytes; original_size is 0 when unknown.
 */
struct CompressedData {
    std::vector<unsigned char> data;
    std::size_t original_size = 0;

    CompressedData() = default;
    explicit CompressedData(std::vector<unsigned char> bytes,
                            std::size_t uncompressed = 0)
        : data(std::move(bytes)), original_size(uncompressed) {}

    std::size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
};

}  // namespace slotingest::components::io

#endif  // SLOTINGEST_COMPONENTS_IO_TYPES_TYPES_H
