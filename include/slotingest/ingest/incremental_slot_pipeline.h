#ifndef SLOTINGEST_INGEST_INCREMENTAL_SLOT_PIPELINE_H
#define SLOTINGEST_INGEST_INCREMENTAL_SLOT_PIPELINE_H

#include <slotingest/core/pipeline/executor.h>
#include <slotingest/ingest/checkpoint_store.h>
#include <slotingest/ingest/connector.h>
#include <slotingest/ingest/cycle_outcome.h>
#include <slotingest/ingest/fetch_result.h>
#include <slotingest/ingest/pipeline_config.h>
#include <slotingest/ingest/range_cursor.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace slotingest::ingest {

enum class CycleState {
    Idle,
    Listing,
    Filtering,
    Fetching,
    Committing,
    Aborted  // Last cycle failed; the next run_cycle starts from Listing
};

const char* to_string(CycleState state);

struct PipelineStats {
    std::size_t cycles_completed = 0;
    std::size_t cycles_aborted = 0;
    std::size_t slots_processed = 0;
    std::size_t records_read = 0;
    std::size_t bytes_read = 0;
};

/**
 * @brief Receives the content of each slot of a committed cycle.
 */
using FetchResultSink = std::function<void(const FetchResult&)>;

/**
 * @brief Runs list -> filter -> fetch -> commit ingestion cycles.
 *
 * Each cycle is all-or-nothing: either every eligible slot is fetched and
 * decoded, delivered to the sink in filtered order and the cursor advanced
 * and persisted, or nothing is delivered and the cursor stays where it was.
 *
 * Cycles never overlap; a second caller blocks until the running cycle
 * finishes. With executor_threads != 1 the slots of a cycle are fetched
 * concurrently, so the connector must then tolerate concurrent fetch()
 * calls.
 *
 * Usage:
 * @code
 * IncrementalSlotPipeline pipeline(factory, config, store,
 *                                  RangeCursor(parse_timestamp("2016-01-01")));
 * auto outcome = pipeline.run_cycle([](const FetchResult& result) {
 *     for (const auto& line : result.lines) std::cout << line << "\n";
 * });
 * @endcode
 */
class IncrementalSlotPipeline {
   private:
    std::shared_ptr<ConnectorFactory> factory_;
    PipelineConfig config_;
    std::shared_ptr<CheckpointStore> store_;
    std::unique_ptr<Executor> executor_;

    std::mutex cycle_mutex_;

    mutable std::mutex state_mutex_;
    RangeCursor cursor_;
    PipelineStats stats_;
    std::shared_ptr<std::atomic<bool>> active_cancel_;

    std::atomic<CycleState> state_{CycleState::Idle};
    std::atomic<bool> stop_requested_{false};

   public:
    /**
     * @param factory Creates the connector used by each cycle
     * @param config Validated on construction
     * @param store Checkpoint storage; a cursor saved under config.name
     *        replaces initial_cursor
     * @param initial_cursor Cursor used when nothing was persisted yet
     * @throws std::invalid_argument on an invalid config or null collaborator
     * @throws CheckpointError if the persisted cursor is unreadable
     */
    IncrementalSlotPipeline(std::shared_ptr<ConnectorFactory> factory,
                            PipelineConfig config,
                            std::shared_ptr<CheckpointStore> store,
                            RangeCursor initial_cursor);

    ~IncrementalSlotPipeline();

    IncrementalSlotPipeline(const IncrementalSlotPipeline&) = delete;
    IncrementalSlotPipeline& operator=(const IncrementalSlotPipeline&) = delete;

    /**
     * @brief Run one cycle. Failures are reported in the outcome.
     */
    CycleOutcome run_cycle(const FetchResultSink& sink);

    /**
     * @brief Run one cycle.
     *
     * @return Slots consumed by the cycle, in delivery order
     * @throws CycleAborted if the cycle did not commit
     */
    std::vector<Slot> run_cycle_or_throw(const FetchResultSink& sink);

    /**
     * @brief Ask the pipeline to stop. A running cycle either finishes
     * committing or aborts without touching the cursor; later cycles abort
     * immediately with CANCELLED.
     */
    void request_stop();

    bool stop_requested() const { return stop_requested_.load(); }

    CycleState state() const { return state_.load(); }

    RangeCursor cursor() const;

    PipelineStats stats() const;

    const PipelineConfig& config() const { return config_; }

   private:
    CycleOutcome abort_cycle(CycleOutcome outcome);

    std::vector<std::optional<FetchResult>> fetch_slots(
        const std::shared_ptr<Connector>& connector,
        const std::vector<Slot>& slots,
        const std::shared_ptr<std::atomic<bool>>& cancel,
        std::optional<CycleOutcome>& failure);
};

}  // namespace slotingest::ingest

#endif  // SLOTINGEST_INGEST_INCREMENTAL_SLOT_PIPELINE_H
