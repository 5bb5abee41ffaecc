#ifndef SLOTINGEST_CORE_UTILITIES_BEHAVIORS_RETRY_BEHAVIOR_H
#define SLOTINGEST_CORE_UTILITIES_BEHAVIORS_RETRY_BEHAVIOR_H

#include <slotingest/core/common/errors.h>
#include <slotingest/core/common/logging.h>
#include <slotingest/core/utilities/behaviors/behavior.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace slotingest::utilities::behaviors {

/**
 * @brief Exception thrown when every allowed attempt has failed.
 */
class RetryExhausted : public std::runtime_error {
   private:
    std::size_t attempts_;
    std::exception_ptr original_exception_;

   public:
    /**
     * @param attempts Number of attempts made
     * @param original The exception raised by the last attempt
     * @param detail Message of the last failure, appended to what()
     */
    RetryExhausted(std::size_t attempts, std::exception_ptr original = nullptr,
                   const std::string& detail = "")
        : std::runtime_error("Retry attempts exhausted after " +
                             std::to_string(attempts) + " attempt(s)" +
                             (detail.empty() ? "" : ": " + detail)),
          attempts_(attempts),
          original_exception_(original) {}

    std::size_t get_attempts() const { return attempts_; }

    std::exception_ptr get_original_exception() const {
        return original_exception_;
    }
};

/**
 * @brief Retry behavior with optional exponential backoff.
 *
 * The first attempt plus up to max_retries further attempts are made. On
 * the last failure the behavior rethrows a RetryExhausted carrying the
 * original exception. A DecodeFailure, and any failure rejected by the retry
 * predicate, is rethrown unchanged without further attempts.
 *
 * @tparam I Input type
 * @tparam O Output type
 */
template <typename I, typename O>
class RetryBehavior : public UtilityBehavior<I, O> {
   public:
    using RetryPredicate = std::function<bool(const std::exception&)>;

   private:
    std::size_t max_retries_;
    std::chrono::milliseconds base_delay_;
    bool exponential_backoff_;
    RetryPredicate retry_if_;
    std::string label_;

    std::chrono::milliseconds calculate_delay(std::size_t attempt) const {
        if (!exponential_backoff_) {
            return base_delay_;
        }

        // Cap the shift to avoid overflow
        std::size_t multiplier = 1ULL << std::min(attempt, std::size_t(10));
        return base_delay_ * multiplier;
    }

   public:
    /**
     * @param max_retries Attempts allowed after the first one
     * @param base_delay Delay before each retry
     * @param exponential_backoff Double the delay on every retry
     */
    RetryBehavior(std::size_t max_retries,
                  std::chrono::milliseconds base_delay =
                      std::chrono::milliseconds(0),
                  bool exponential_backoff = false)
        : max_retries_(max_retries),
          base_delay_(base_delay),
          exponential_backoff_(exponential_backoff),
          label_("operation") {}

    RetryBehavior& with_retry_if(RetryPredicate predicate) {
        retry_if_ = std::move(predicate);
        return *this;
    }

    RetryBehavior& with_label(std::string label) {
        label_ = std::move(label);
        return *this;
    }

    std::variant<BehaviorErrorResult, std::optional<O>> on_error(
        [[maybe_unused]] const I& input, const std::exception& e,
        std::size_t attempt) override {
        if (dynamic_cast<const DecodeFailure*>(&e) != nullptr ||
            (retry_if_ && !retry_if_(e))) {
            return BehaviorErrorResult::rethrow();
        }

        if (attempt >= max_retries_) {
            SLOTINGEST_LOG_ERROR("%s failed after %zu attempt(s): %s",
                                 label_.c_str(), attempt + 1, e.what());
            try {
                throw RetryExhausted(attempt + 1, std::current_exception(),
                                     e.what());
            } catch (const RetryExhausted&) {
                return BehaviorErrorResult::rethrow(std::current_exception());
            }
        }

        SLOTINGEST_LOG_WARN("%s failed on attempt %zu of %zu, retrying: %s",
                            label_.c_str(), attempt + 1, max_retries_ + 1,
                            e.what());

        auto delay = calculate_delay(attempt);
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        return BehaviorErrorResult::retry();
    }

    void on_success([[maybe_unused]] const I& input,
                    std::size_t attempt) override {
        if (attempt > 0) {
            SLOTINGEST_LOG_INFO("%s succeeded on attempt %zu",
                                label_.c_str(), attempt + 1);
        }
    }

    std::size_t get_max_retries() const { return max_retries_; }

    std::chrono::milliseconds get_base_delay() const { return base_delay_; }

    bool is_exponential_backoff() const { return exponential_backoff_; }
};

}  // namespace slotingest::utilities::behaviors

#endif  // SLOTINGEST_CORE_UTILITIES_BEHAVIORS_RETRY_BEHAVIOR_H
