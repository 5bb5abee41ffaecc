#ifndef SLOTINGEST_COMPONENTS_IO_BINARY_FILE_READER_H
#define SLOTINGEST_COMPONENTS_IO_BINARY_FILE_READER_H

#include <slotingest/core/common/filesystem.h>
#include <slotingest/components/io/types/types.h>
#include <slotingest/core/utilities/tags/parallelizable.h>
#include <slotingest/core/utilities/utility.h>

namespace slotingest::components::io {

/**
 * @brief Utility that reads a whole file into RawData.
 *
 * Usage:
 * @code
 * BinaryFileReader reader;
 * RawData content = reader.process("/data/in/20161201.log.gz");
 * @endcode
 */
class BinaryFileReader
    : public utilities::Utility<fs::path, RawData,
                                utilities::tags::Parallelizable> {
   public:
    BinaryFileReader() = default;
    ~BinaryFileReader() override = default;

    /**
     * @throws std::runtime_error if the file cannot be opened or read
     */
    RawData process(const fs::path& input) override;
};

}  // namespace slotingest::components::io

#endif  // SLOTINGEST_COMPONENTS_IO_BINARY_FILE_READER_H
