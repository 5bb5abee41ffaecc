#ifndef SLOTINGEST_CORE_UTILITIES_RETRY_POLICY_H
#define SLOTINGEST_CORE_UTILITIES_RETRY_POLICY_H

#include <slotingest/core/utilities/behaviors/behavior_chain.h>
#include <slotingest/core/utilities/behaviors/retry_behavior.h>
#include <slotingest/core/utilities/utility.h>
#include <slotingest/core/utilities/utility_executor.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

namespace slotingest::utilities {

/**
 * @brief Input handed to a wrapped callable; only carries a label for logs.
 */
struct Invocation {
    std::string label;
};

/**
 * @brief Utility adapter over a nullary callable.
 */
template <typename O>
class CallableUtility : public Utility<Invocation, O> {
   private:
    std::function<O()> fn_;

   public:
    explicit CallableUtility(std::function<O()> fn) : fn_(std::move(fn)) {}

    O process([[maybe_unused]] const Invocation& input) override {
        return fn_();
    }
};

/**
 * @brief Bounded retry around an arbitrary fallible operation.
 *
 * execute() runs the operation once and, on failure, up to max_retries more
 * times. When the last attempt fails a behaviors::RetryExhausted is thrown
 * carrying the last cause. The operation is responsible for discarding any
 * partial effects of a failed attempt.
 *
 * Usage:
 * @code
 * RetryPolicy policy(3);
 * auto slots = policy.execute([&] { return connector->list(); }, "list");
 * @endcode
 */
class RetryPolicy {
   public:
    using RetryPredicate =
        behaviors::RetryBehavior<Invocation, int>::RetryPredicate;

   private:
    std::size_t max_retries_;
    std::chrono::milliseconds delay_;
    bool exponential_backoff_;
    RetryPredicate retry_if_;

   public:
    explicit RetryPolicy(
        std::size_t max_retries,
        std::chrono::milliseconds delay = std::chrono::milliseconds(0),
        bool exponential_backoff = false)
        : max_retries_(max_retries),
          delay_(delay),
          exponential_backoff_(exponential_backoff) {}

    /**
     * @brief Restrict which failures are retried; others propagate as-is.
     */
    RetryPolicy& with_retry_if(RetryPredicate predicate) {
        retry_if_ = std::move(predicate);
        return *this;
    }

    template <typename F>
    std::invoke_result_t<F&> execute(F&& operation,
                                     const std::string& label = "operation") {
        using O = std::invoke_result_t<F&>;
        static_assert(!std::is_void_v<O>,
                      "RetryPolicy::execute requires a value-returning "
                      "operation");

        auto utility = std::make_shared<CallableUtility<O>>(
            std::function<O()>(std::forward<F>(operation)));

        auto retry = std::make_shared<behaviors::RetryBehavior<Invocation, O>>(
            max_retries_, delay_, exponential_backoff_);
        retry->with_label(label);
        if (retry_if_) {
            retry->with_retry_if(retry_if_);
        }

        behaviors::BehaviorChain<Invocation, O> chain;
        chain.add_behavior(retry);

        behaviors::UtilityExecutor<Invocation, O> executor(utility,
                                                           std::move(chain));
        return executor.execute(Invocation{label});
    }

    std::size_t get_max_retries() const { return max_retries_; }
    std::size_t get_max_attempts() const { return max_retries_ + 1; }
};

}  // namespace slotingest::utilities

#endif  // SLOTINGEST_CORE_UTILITIES_RETRY_POLICY_H
