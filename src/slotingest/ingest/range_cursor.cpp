#include <slotingest/ingest/range_cursor.h>

#include <algorithm>
#include <iterator>

namespace slotingest::ingest {

RangeCursor::RangeCursor(Timestamp watermark) : watermark_(watermark) {}

RangeCursor::RangeCursor(Timestamp watermark, std::set<std::string> excluded)
    : watermark_(watermark), excluded_at_watermark_(std::move(excluded)) {}

RangeCursor::RangeCursor(Timestamp watermark,
                         const std::vector<std::string>& excluded)
    : watermark_(watermark),
      excluded_at_watermark_(excluded.begin(), excluded.end()) {}

bool RangeCursor::is_eligible(const Slot& slot) const {
    if (slot.timestamp > watermark_) {
        return true;
    }
    if (slot.timestamp < watermark_) {
        return false;
    }
    return excluded_at_watermark_.count(slot.identifier) == 0;
}

std::vector<Slot> RangeCursor::filter(
    const std::vector<Slot>& candidates) const {
    std::vector<Slot> eligible;
    eligible.reserve(candidates.size());
    std::copy_if(candidates.begin(), candidates.end(),
                 std::back_inserter(eligible),
                 [this](const Slot& slot) { return is_eligible(slot); });
    return eligible;
}

RangeCursor RangeCursor::advance(const std::vector<Slot>& processed) const {
    if (processed.empty()) {
        return *this;
    }

    Timestamp new_watermark = watermark_;
    for (const auto& slot : processed) {
        new_watermark = std::max(new_watermark, slot.timestamp);
    }

    std::set<std::string> excluded;
    if (new_watermark == watermark_) {
        excluded = excluded_at_watermark_;
    }
    for (const auto& slot : processed) {
        if (slot.timestamp == new_watermark) {
            excluded.insert(slot.identifier);
        }
    }

    return RangeCursor(new_watermark, std::move(excluded));
}

std::string RangeCursor::to_string() const {
    std::string out = "RangeCursor(" + format_timestamp(watermark_) + ", [";
    bool first = true;
    for (const auto& id : excluded_at_watermark_) {
        if (!first) {
            out += ", ";
        }
        out += id;
        first = false;
    }
    out += "])";
    return out;
}

}  // namespace slotingest::ingest
