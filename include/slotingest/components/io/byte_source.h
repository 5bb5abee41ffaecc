#ifndef SLOTINGEST_COMPONENTS_IO_BYTE_SOURCE_H
#define SLOTINGEST_COMPONENTS_IO_BYTE_SOURCE_H

#include <slotingest/components/io/types/types.h>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>

namespace slotingest::components::io {

/**
 * @brief Pull-based source of bytes.
 *
 * read() copies up to buffer_size bytes and returns how many were copied;
 * 0 means end of stream. Implementations own whatever they read from and
 * release it when destroyed.
 */
class ByteSource {
   public:
    virtual ~ByteSource() = default;

    virtual std::size_t read(unsigned char* buffer,
                             std::size_t buffer_size) = 0;
};

/**
 * @brief ByteSource over an in-memory buffer.
 */
class MemoryByteSource : public ByteSource {
   private:
    std::shared_ptr<const RawData> data_;
    std::size_t position_ = 0;

   public:
    explicit MemoryByteSource(std::shared_ptr<const RawData> data)
        : data_(std::move(data)) {}

    std::size_t read(unsigned char* buffer, std::size_t buffer_size) override {
        if (!data_ || position_ >= data_->size()) {
            return 0;
        }
        std::size_t n = std::min(buffer_size, data_->size() - position_);
        std::memcpy(buffer, data_->data.data() + position_, n);
        position_ += n;
        return n;
    }

    std::size_t position() const { return position_; }
};

}  // namespace slotingest::components::io

#endif  // SLOTINGEST_COMPONENTS_IO_BYTE_SOURCE_H
