#ifndef SLOTINGEST_CORE_UTILITIES_UTILITY_EXECUTOR_H
#define SLOTINGEST_CORE_UTILITIES_UTILITY_EXECUTOR_H

#include <slotingest/core/utilities/behaviors/behavior_chain.h>
#include <slotingest/core/utilities/utility.h>

#include <exception>
#include <memory>
#include <optional>
#include <variant>

namespace slotingest::utilities::behaviors {

/**
 * @brief Runs a utility, consulting its behavior chain after each failure.
 *
 * The loop ends when process() returns, a behavior supplies a recovery
 * value, or a behavior asks for the error to propagate.
 */
template <typename I, typename O, typename... Tags>
class UtilityExecutor {
   private:
    std::shared_ptr<Utility<I, O, Tags...>> utility_;
    BehaviorChain<I, O> chain_;
    std::size_t last_attempts_ = 0;

   public:
    UtilityExecutor(std::shared_ptr<Utility<I, O, Tags...>> utility,
                    BehaviorChain<I, O> chain)
        : utility_(std::move(utility)), chain_(std::move(chain)) {}

    /**
     * @throws Whatever the utility threw, or the replacement a behavior chose
     */
    O execute(const I& input) {
        for (std::size_t attempt = 0;; ++attempt) {
            last_attempts_ = attempt + 1;
            std::exception_ptr failure;
            try {
                chain_.before_attempt(input, attempt);
                O result = utility_->process(input);
                chain_.on_success(input, attempt);
                return result;
            } catch (const std::exception& e) {
                auto decision = chain_.on_error(input, e, attempt);
                if (auto* recovered = std::get_if<std::optional<O>>(&decision)) {
                    if (recovered->has_value()) {
                        return std::move(**recovered);
                    }
                    throw;
                }
                const auto& action = std::get<BehaviorErrorResult>(decision);
                if (action.action == BehaviorErrorAction::Retry) {
                    continue;
                }
                failure = action.exception ? action.exception
                                           : std::current_exception();
            }
            std::rethrow_exception(failure);
        }
    }

    /**
     * @brief Attempts made by the most recent execute() call.
     */
    std::size_t last_attempts() const { return last_attempts_; }
};

}  // namespace slotingest::utilities::behaviors

#endif  // SLOTINGEST_CORE_UTILITIES_UTILITY_EXECUTOR_H
