#ifndef SLOTINGEST_INGEST_SLOT_FETCH_UNIT_H
#define SLOTINGEST_INGEST_SLOT_FETCH_UNIT_H

#include <slotingest/components/io/content_decoder.h>
#include <slotingest/core/utilities/retry_policy.h>
#include <slotingest/core/utilities/tags/parallelizable.h>
#include <slotingest/core/utilities/utility.h>
#include <slotingest/ingest/connector.h>
#include <slotingest/ingest/fetch_result.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace slotingest::ingest {

/**
 * @brief Fetches and decodes one slot.
 *
 * The fetch is retried through a RetryPolicy. The content is decoded in
 * full before process() returns, so decode errors surface here and not
 * while lines are being delivered. The decoder's byte source is released
 * on every exit path.
 *
 * @throws PermanentFailure when the retry budget is exhausted or the
 *         content is malformed
 * @throws UnitCancelled when the shared cancel flag is set before start
 */
class SlotFetchUnit
    : public utilities::Utility<Slot, FetchResult,
                                utilities::tags::Parallelizable> {
   private:
    std::shared_ptr<Connector> connector_;
    utilities::RetryPolicy retry_policy_;
    components::io::ContentDecoder decoder_;
    std::shared_ptr<const std::atomic<bool>> cancelled_;

   public:
    /**
     * @param connector Source of the slot's bytes
     * @param max_retries Fetch attempts allowed after the first one
     * @param charset Text encoding of the decoded content
     * @param cancelled Optional flag; when set, process() refuses to start
     */
    SlotFetchUnit(std::shared_ptr<Connector> connector,
                  std::size_t max_retries,
                  const std::string& charset = "UTF-8",
                  std::shared_ptr<const std::atomic<bool>> cancelled = nullptr);

    SlotFetchUnit& with_retry_delay(std::chrono::milliseconds delay,
                                    bool exponential_backoff = false);

    FetchResult process(const Slot& slot) override;

    const utilities::RetryPolicy& retry_policy() const { return retry_policy_; }
};

}  // namespace slotingest::ingest

#endif  // SLOTINGEST_INGEST_SLOT_FETCH_UNIT_H
