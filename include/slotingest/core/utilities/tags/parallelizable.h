#ifndef SLOTINGEST_CORE_UTILITIES_TAGS_PARALLELIZABLE_H
#define SLOTINGEST_CORE_UTILITIES_TAGS_PARALLELIZABLE_H

namespace slotingest::utilities::tags {

/**
 * @brief Marks a utility as safe to execute from several worker threads.
 *
 * A Parallelizable utility keeps no mutable state between process() calls
 * other than state it synchronizes itself.
 */
struct Parallelizable {};

}  // namespace slotingest::utilities::tags

#endif  // SLOTINGEST_CORE_UTILITIES_TAGS_PARALLELIZABLE_H
