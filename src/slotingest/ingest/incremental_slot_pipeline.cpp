#include <slotingest/core/common/logging.h>
#include <slotingest/core/utilities/retry_policy.h>
#include <slotingest/ingest/errors.h>
#include <slotingest/ingest/incremental_slot_pipeline.h>
#include <slotingest/ingest/slot_fetch_unit.h>

#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>
#include <string>

namespace slotingest::ingest {

const char* to_string(CycleState state) {
    switch (state) {
        case CycleState::Idle:
            return "Idle";
        case CycleState::Listing:
            return "Listing";
        case CycleState::Filtering:
            return "Filtering";
        case CycleState::Fetching:
            return "Fetching";
        case CycleState::Committing:
            return "Committing";
        case CycleState::Aborted:
            return "Aborted";
    }
    return "Unknown";
}

namespace {

CycleOutcome unit_failure(const Slot& slot, std::exception_ptr eptr) {
    try {
        std::rethrow_exception(eptr);
    } catch (const PermanentFailure& e) {
        return CycleOutcome::failed(ErrorKind::PERMANENT_FAILURE, e.what(),
                                    eptr, e.slot());
    } catch (const UnitCancelled& e) {
        return CycleOutcome::failed(ErrorKind::CANCELLED, e.what(), eptr,
                                    slot);
    } catch (const std::exception& e) {
        return CycleOutcome::failed(
            ErrorKind::PERMANENT_FAILURE,
            "Unexpected failure on " + slot.to_string() + ": " + e.what(),
            eptr, slot);
    }
}

}  // namespace

IncrementalSlotPipeline::IncrementalSlotPipeline(
    std::shared_ptr<ConnectorFactory> factory, PipelineConfig config,
    std::shared_ptr<CheckpointStore> store, RangeCursor initial_cursor)
    : factory_(std::move(factory)),
      config_(std::move(config)),
      store_(std::move(store)),
      cursor_(std::move(initial_cursor)) {
    if (!factory_) {
        throw std::invalid_argument("Pipeline requires a connector factory");
    }
    if (!store_) {
        throw std::invalid_argument("Pipeline requires a checkpoint store");
    }
    config_.validate();

    if (auto persisted = store_->load(config_.name)) {
        SLOTINGEST_LOG_INFO("Pipeline '%s' resuming from %s",
                            config_.name.c_str(),
                            persisted->to_string().c_str());
        cursor_ = std::move(*persisted);
    } else {
        SLOTINGEST_LOG_INFO("Pipeline '%s' starting from %s",
                            config_.name.c_str(), cursor_.to_string().c_str());
    }

    if (config_.executor_threads != 1) {
        executor_ = std::make_unique<Executor>(config_.executor_threads);
        executor_->start();
    }
}

IncrementalSlotPipeline::~IncrementalSlotPipeline() {
    if (executor_) {
        executor_->shutdown();
    }
}

RangeCursor IncrementalSlotPipeline::cursor() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return cursor_;
}

PipelineStats IncrementalSlotPipeline::stats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats_;
}

void IncrementalSlotPipeline::request_stop() {
    stop_requested_ = true;
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (active_cancel_) {
        active_cancel_->store(true);
    }
    SLOTINGEST_LOG_INFO("Stop requested for pipeline '%s'",
                        config_.name.c_str());
}

CycleOutcome IncrementalSlotPipeline::abort_cycle(CycleOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++stats_.cycles_aborted;
        active_cancel_.reset();
    }
    state_ = CycleState::Aborted;

    if (outcome.kind == ErrorKind::CANCELLED) {
        SLOTINGEST_LOG_WARN("Cycle of '%s' cancelled: %s",
                            config_.name.c_str(), outcome.message.c_str());
    } else {
        SLOTINGEST_LOG_ERROR("Cycle of '%s' aborted (%s): %s",
                             config_.name.c_str(),
                             slotingest::to_string(outcome.kind),
                             outcome.message.c_str());
    }
    return outcome;
}

std::vector<std::optional<FetchResult>> IncrementalSlotPipeline::fetch_slots(
    const std::shared_ptr<Connector>& connector, const std::vector<Slot>& slots,
    const std::shared_ptr<std::atomic<bool>>& cancel,
    std::optional<CycleOutcome>& failure) {
    auto unit = std::make_shared<SlotFetchUnit>(connector, config_.max_retries,
                                                config_.charset, cancel);
    unit->with_retry_delay(config_.retry_delay, config_.exponential_backoff);

    std::vector<std::optional<FetchResult>> results(slots.size());
    std::vector<std::exception_ptr> errors(slots.size());

    if (!executor_) {
        for (std::size_t i = 0; i < slots.size(); ++i) {
            try {
                results[i] = unit->process(slots[i]);
            } catch (const std::exception&) {
                errors[i] = std::current_exception();
                cancel->store(true);
                break;
            }
        }
    } else {
        static_assert(
            SlotFetchUnit::has_tag<utilities::tags::Parallelizable>(),
            "slot fetch units are shared across executor workers");
        std::vector<std::future<FetchResult>> futures;
        futures.reserve(slots.size());
        for (const auto& slot : slots) {
            futures.push_back(executor_->submit(
                "fetch " + slot.identifier, [unit, slot, cancel]() {
                    try {
                        return unit->process(slot);
                    } catch (const std::exception&) {
                        cancel->store(true);
                        throw;
                    }
                }));
        }
        // Every unit must settle before the cycle may commit or abort
        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                results[i] = futures[i].get();
            } catch (const std::exception&) {
                errors[i] = std::current_exception();
            }
        }
    }

    // Report the first real failure in slot order; cancellations only
    // matter when nothing else went wrong
    std::optional<CycleOutcome> cancelled;
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (!errors[i]) {
            continue;
        }
        CycleOutcome outcome = unit_failure(slots[i], errors[i]);
        if (outcome.kind != ErrorKind::CANCELLED) {
            failure = std::move(outcome);
            return {};
        }
        if (!cancelled) {
            cancelled = std::move(outcome);
        }
    }
    if (cancelled) {
        failure = std::move(cancelled);
        return {};
    }
    if (cancel->load()) {
        // Sequential run stopped between units
        for (std::size_t i = 0; i < slots.size(); ++i) {
            if (!results[i]) {
                failure = CycleOutcome::failed(
                    ErrorKind::CANCELLED,
                    "Cancelled before fetching " + slots[i].to_string(),
                    nullptr, slots[i]);
                return {};
            }
        }
    }
    return results;
}

CycleOutcome IncrementalSlotPipeline::run_cycle(const FetchResultSink& sink) {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);

    auto cancel = std::make_shared<std::atomic<bool>>(false);
    RangeCursor start_cursor = cursor();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_cancel_ = cancel;
    }
    if (stop_requested_) {
        return abort_cycle(CycleOutcome::failed(
            ErrorKind::CANCELLED, "Stop requested before the cycle started"));
    }

    // Listing
    state_ = CycleState::Listing;
    SLOTINGEST_LOG_INFO("Cycle of '%s' started at %s", config_.name.c_str(),
                        start_cursor.to_string().c_str());

    std::shared_ptr<Connector> connector;
    std::vector<Slot> listed;
    try {
        connector = factory_->create(config_.connector_parameters);
        if (!connector) {
            throw ListFailure("Connector factory returned no connector");
        }
        utilities::RetryPolicy policy(config_.max_retries, config_.retry_delay,
                                      config_.exponential_backoff);
        listed = policy.execute([&connector]() { return connector->list(); },
                                "list");
    } catch (const std::exception& e) {
        return abort_cycle(CycleOutcome::failed(
            ErrorKind::LIST_FAILURE, std::string("Listing failed: ") + e.what(),
            std::current_exception()));
    }

    if (cancel->load()) {
        return abort_cycle(CycleOutcome::failed(
            ErrorKind::CANCELLED, "Stop requested after listing"));
    }

    // Filtering
    state_ = CycleState::Filtering;
    std::vector<Slot> eligible = start_cursor.filter(listed);
    SLOTINGEST_LOG_DEBUG("Listed %zu slot(s), %zu eligible", listed.size(),
                         eligible.size());

    // Fetching
    std::vector<std::optional<FetchResult>> results;
    if (!eligible.empty()) {
        auto bounds = std::minmax_element(
            eligible.begin(), eligible.end(),
            [](const Slot& a, const Slot& b) {
                return a.timestamp < b.timestamp;
            });
        SLOTINGEST_LOG_INFO(
            "Batch of %zu slot(s) from %s to %s", eligible.size(),
            format_timestamp(bounds.first->timestamp).c_str(),
            format_timestamp(bounds.second->timestamp).c_str());

        state_ = CycleState::Fetching;
        std::optional<CycleOutcome> failure;
        try {
            results = fetch_slots(connector, eligible, cancel, failure);
        } catch (const std::exception& e) {
            failure = CycleOutcome::failed(
                ErrorKind::PERMANENT_FAILURE,
                std::string("Fetching failed: ") + e.what(),
                std::current_exception());
        }
        if (failure) {
            return abort_cycle(std::move(*failure));
        }
    }

    // Committing
    state_ = CycleState::Committing;
    std::size_t records = 0;
    std::size_t bytes = 0;
    try {
        for (const auto& result : results) {
            records += result->records_read;
            bytes += result->bytes_read;
            if (sink) {
                sink(*result);
            }
        }
    } catch (const std::exception& e) {
        return abort_cycle(CycleOutcome::failed(
            ErrorKind::PERMANENT_FAILURE,
            std::string("Downstream sink failed: ") + e.what(),
            std::current_exception()));
    }

    RangeCursor next_cursor = start_cursor.advance(eligible);
    if (next_cursor != start_cursor) {
        try {
            store_->save(config_.name, next_cursor);
        } catch (const std::exception& e) {
            return abort_cycle(CycleOutcome::failed(
                ErrorKind::PERMANENT_FAILURE,
                std::string("Checkpoint save failed: ") + e.what(),
                std::current_exception()));
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        cursor_ = next_cursor;
        ++stats_.cycles_completed;
        stats_.slots_processed += eligible.size();
        stats_.records_read += records;
        stats_.bytes_read += bytes;
        active_cancel_.reset();
    }
    state_ = CycleState::Idle;

    SLOTINGEST_LOG_INFO(
        "Cycle of '%s' committed %zu slot(s), %zu record(s), %zu byte(s); "
        "cursor now %s",
        config_.name.c_str(), eligible.size(), records, bytes,
        next_cursor.to_string().c_str());
    return CycleOutcome::succeeded(std::move(eligible));
}

std::vector<Slot> IncrementalSlotPipeline::run_cycle_or_throw(
    const FetchResultSink& sink) {
    CycleOutcome outcome = run_cycle(sink);
    if (!outcome.success) {
        throw CycleAborted(outcome.kind, outcome.message);
    }
    return std::move(outcome.consumed_slots);
}

}  // namespace slotingest::ingest
