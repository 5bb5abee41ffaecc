#ifndef SLOTINGEST_INGEST_FETCH_RESULT_H
#define SLOTINGEST_INGEST_FETCH_RESULT_H

#include <slotingest/ingest/slot.h>

#include <cstddef>
#include <string>
#include <vector>

namespace slotingest::ingest {

/**
 * @brief Decoded content of one slot, owned by the cycle that fetched it.
 */
struct FetchResult {
    Slot slot;
    std::vector<std::string> lines;
    std::size_t bytes_read = 0;    // Decoded bytes, terminators included
    std::size_t records_read = 0;  // Equals lines.size()
};

}  // namespace slotingest::ingest

#endif  // SLOTINGEST_INGEST_FETCH_RESULT_H
