#include <slotingest/core/common/logging.h>
#include <slotingest/ingest/errors.h>
#include <slotingest/ingest/slot_fetch_unit.h>

#include <exception>
#include <stdexcept>

namespace slotingest::ingest {

using components::io::RawData;
using utilities::behaviors::RetryExhausted;

SlotFetchUnit::SlotFetchUnit(
    std::shared_ptr<Connector> connector, std::size_t max_retries,
    const std::string& charset,
    std::shared_ptr<const std::atomic<bool>> cancelled)
    : connector_(std::move(connector)),
      retry_policy_(max_retries),
      decoder_(charset),
      cancelled_(std::move(cancelled)) {
    if (!connector_) {
        throw std::invalid_argument("SlotFetchUnit requires a connector");
    }
}

SlotFetchUnit& SlotFetchUnit::with_retry_delay(std::chrono::milliseconds delay,
                                               bool exponential_backoff) {
    retry_policy_ = utilities::RetryPolicy(retry_policy_.get_max_retries(),
                                           delay, exponential_backoff);
    return *this;
}

namespace {

ErrorKind kind_of(std::exception_ptr eptr) {
    try {
        std::rethrow_exception(eptr);
    } catch (const IngestError& e) {
        return e.kind();
    } catch (const std::exception&) {
        return ErrorKind::FETCH_FAILURE;
    }
}

}  // namespace

FetchResult SlotFetchUnit::process(const Slot& slot) {
    if (cancelled_ && cancelled_->load()) {
        throw UnitCancelled(slot);
    }

    SLOTINGEST_LOG_DEBUG("Input slot: %s", slot.to_string().c_str());

    RawData raw;
    try {
        raw = retry_policy_.execute(
            [this, &slot]() { return connector_->fetch(slot); },
            "fetch " + slot.identifier);
    } catch (const RetryExhausted& e) {
        std::exception_ptr cause = e.get_original_exception();
        throw PermanentFailure(slot, cause, kind_of(cause), e.what());
    }

    FetchResult result;
    result.slot = slot;
    try {
        auto range = decoder_.decode(std::move(raw));
        while (range.has_next()) {
            result.lines.push_back(std::move(range.next().content));
        }
        result.bytes_read = range.bytes_consumed();
        result.records_read = range.lines_read();
    } catch (const DecodeFailure& e) {
        throw PermanentFailure(slot, std::current_exception(),
                               ErrorKind::DECODE_FAILURE, e.what());
    }

    SLOTINGEST_LOG_DEBUG("Finished slot: %s (%zu records, %zu bytes)",
                         slot.to_string().c_str(), result.records_read,
                         result.bytes_read);
    return result;
}

}  // namespace slotingest::ingest
