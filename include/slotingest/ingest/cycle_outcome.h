#ifndef SLOTINGEST_INGEST_CYCLE_OUTCOME_H
#define SLOTINGEST_INGEST_CYCLE_OUTCOME_H

#include <slotingest/core/common/errors.h>
#include <slotingest/ingest/slot.h>

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace slotingest::ingest {

/**
 * @brief Result of one cycle: the consumed slots, or why it aborted.
 */
struct CycleOutcome {
    bool success = true;
    std::vector<Slot> consumed_slots;  // Filtered order; empty on failure

    ErrorKind kind = ErrorKind::PERMANENT_FAILURE;  // Valid on failure only
    std::string message;
    std::exception_ptr cause;
    std::optional<Slot> failed_slot;

    static CycleOutcome succeeded(std::vector<Slot> slots) {
        CycleOutcome outcome;
        outcome.consumed_slots = std::move(slots);
        return outcome;
    }

    static CycleOutcome failed(ErrorKind kind, std::string message,
                               std::exception_ptr cause = nullptr,
                               std::optional<Slot> slot = std::nullopt) {
        CycleOutcome outcome;
        outcome.success = false;
        outcome.kind = kind;
        outcome.message = std::move(message);
        outcome.cause = cause;
        outcome.failed_slot = std::move(slot);
        return outcome;
    }

    explicit operator bool() const { return success; }
};

}  // namespace slotingest::ingest

#endif  // SLOTINGEST_INGEST_CYCLE_OUTCOME_H
