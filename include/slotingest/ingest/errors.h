#ifndef SLOTINGEST_INGEST_ERRORS_H
#define SLOTINGEST_INGEST_ERRORS_H

#include <slotingest/core/common/errors.h>
#include <slotingest/ingest/slot.h>

#include <exception>
#include <string>

namespace slotingest::ingest {

/**
 * @brief A slot could not be fetched or decoded. Fatal to its cycle.
 */
class PermanentFailure : public IngestError {
   private:
    Slot slot_;
    std::exception_ptr cause_;
    ErrorKind cause_kind_;

   public:
    /**
     * @param slot Slot that failed
     * @param cause Exception that ended the last attempt
     * @param cause_kind FETCH_FAILURE or DECODE_FAILURE
     * @param detail Message of the cause
     */
    PermanentFailure(Slot slot, std::exception_ptr cause, ErrorKind cause_kind,
                     const std::string& detail)
        : IngestError(ErrorKind::PERMANENT_FAILURE,
                      "Permanent failure on " + slot.to_string() + " (" +
                          slotingest::to_string(cause_kind) + "): " + detail),
          slot_(std::move(slot)),
          cause_(cause),
          cause_kind_(cause_kind) {}

    const Slot& slot() const { return slot_; }
    std::exception_ptr cause() const { return cause_; }
    ErrorKind cause_kind() const { return cause_kind_; }
};

/**
 * @brief A fetch unit skipped because its cycle is being aborted or stopped.
 */
class UnitCancelled : public IngestError {
   public:
    explicit UnitCancelled(const Slot& slot)
        : IngestError(ErrorKind::CANCELLED,
                      "Cancelled before fetching " + slot.to_string()) {}
};

/**
 * @brief Terminal error reported to the scheduler when a cycle aborts.
 *
 * The cursor is unchanged when this is thrown.
 */
class CycleAborted : public IngestError {
   public:
    CycleAborted(ErrorKind kind, const std::string& message)
        : IngestError(kind, "Cycle aborted (" +
                                std::string(slotingest::to_string(kind)) +
                                "): " + message) {}
};

}  // namespace slotingest::ingest

#endif  // SLOTINGEST_INGEST_ERRORS_H
