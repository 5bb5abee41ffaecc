#ifndef SLOTINGEST_INGEST_SLOT_H
#define SLOTINGEST_INGEST_SLOT_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace slotingest::ingest {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Identity of one unit of remote content.
 *
 * identifier is unique within a listing; timestamp is the slot's logical
 * date. Several slots may share a timestamp.
 */
struct Slot {
    std::string identifier;
    Timestamp timestamp;

    Slot() = default;

    Slot(std::string identifier_, Timestamp timestamp_)
        : identifier(std::move(identifier_)), timestamp(timestamp_) {}

    bool operator==(const Slot& other) const {
        return identifier == other.identifier && timestamp == other.timestamp;
    }

    bool operator!=(const Slot& other) const { return !(*this == other); }

    std::string to_string() const;
};

/**
 * @brief Milliseconds since the Unix epoch.
 */
std::int64_t to_epoch_millis(Timestamp ts);

Timestamp from_epoch_millis(std::int64_t millis);

/**
 * @brief Nanoseconds since the Unix epoch. Exact for every Timestamp the
 * clock can produce, so it is the form checkpoints persist.
 */
std::int64_t to_epoch_nanos(Timestamp ts);

Timestamp from_epoch_nanos(std::int64_t nanos);

/**
 * @brief Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS"
 * as UTC.
 *
 * @throws std::invalid_argument on malformed input or a date that does not
 * exist, such as February 30
 */
Timestamp parse_timestamp(const std::string& text);

/**
 * @brief Format as "YYYY-MM-DD HH:MM:SS" in UTC, with ".mmm" appended when
 * the timestamp has a millisecond part.
 */
std::string format_timestamp(Timestamp ts);

}  // namespace slotingest::ingest

namespace std {
template <>
struct hash<slotingest::ingest::Slot> {
    std::size_t operator()(const slotingest::ingest::Slot& slot) const {
        std::size_t h1 = std::hash<std::string>{}(slot.identifier);
        std::size_t h2 = std::hash<std::int64_t>{}(
            slotingest::ingest::to_epoch_nanos(slot.timestamp));
        return h1 ^ (h2 << 1);
    }
};
}  // namespace std

#endif  // SLOTINGEST_INGEST_SLOT_H
