#ifndef SLOTINGEST_INGEST_RANGE_CURSOR_H
#define SLOTINGEST_INGEST_RANGE_CURSOR_H

#include <slotingest/ingest/slot.h>

#include <set>
#include <string>
#include <vector>

namespace slotingest::ingest {

/**
 * @brief Immutable "consumed up to here" marker.
 *
 * Everything strictly before the watermark has been consumed, and so have
 * the slots at exactly the watermark whose identifiers are listed in the
 * exclusion set. A slot is eligible iff
 *   timestamp > watermark, or
 *   timestamp == watermark and identifier is not excluded.
 */
class RangeCursor {
   private:
    Timestamp watermark_;
    std::set<std::string> excluded_at_watermark_;

   public:
    explicit RangeCursor(Timestamp watermark);

    /**
     * @brief Cursor with identifiers already consumed at the watermark.
     */
    RangeCursor(Timestamp watermark, std::set<std::string> excluded);

    RangeCursor(Timestamp watermark, const std::vector<std::string>& excluded);

    bool is_eligible(const Slot& slot) const;

    /**
     * @brief Keep the eligible slots, preserving the input order.
     */
    std::vector<Slot> filter(const std::vector<Slot>& candidates) const;

    /**
     * @brief Cursor after consuming a batch of slots.
     *
     * The watermark moves to the latest processed timestamp and the
     * exclusion set becomes the processed identifiers at that timestamp.
     * If the watermark does not move, the current exclusions are kept as
     * well. An empty batch returns an identical cursor.
     */
    RangeCursor advance(const std::vector<Slot>& processed) const;

    Timestamp watermark() const { return watermark_; }

    const std::set<std::string>& excluded_at_watermark() const {
        return excluded_at_watermark_;
    }

    bool operator==(const RangeCursor& other) const {
        return watermark_ == other.watermark_ &&
               excluded_at_watermark_ == other.excluded_at_watermark_;
    }

    bool operator!=(const RangeCursor& other) const {
        return !(*this == other);
    }

    std::string to_string() const;
};

}  // namespace slotingest::ingest

#endif  // SLOTINGEST_INGEST_RANGE_CURSOR_H
