#ifndef SLOTINGEST_CORE_UTILITIES_BEHAVIORS_BEHAVIOR_CHAIN_H
#define SLOTINGEST_CORE_UTILITIES_BEHAVIORS_BEHAVIOR_CHAIN_H

#include <slotingest/core/utilities/behaviors/behavior.h>

#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace slotingest::utilities::behaviors {

/**
 * @brief Ordered list of behaviors applied around one utility.
 *
 * on_error asks each behavior in turn; the first explicit action or
 * recovery value wins. When no behavior claims the error it is rethrown.
 */
template <typename I, typename O>
class BehaviorChain {
   public:
    using BehaviorPtr = std::shared_ptr<UtilityBehavior<I, O>>;
    using ErrorDecision = std::variant<BehaviorErrorResult, std::optional<O>>;

   private:
    std::vector<BehaviorPtr> behaviors_;

   public:
    BehaviorChain& add_behavior(BehaviorPtr behavior) {
        if (behavior) {
            behaviors_.push_back(std::move(behavior));
        }
        return *this;
    }

    void before_attempt(const I& input, std::size_t attempt) {
        for (auto& behavior : behaviors_) {
            behavior->before_attempt(input, attempt);
        }
    }

    void on_success(const I& input, std::size_t attempt) {
        for (auto& behavior : behaviors_) {
            behavior->on_success(input, attempt);
        }
    }

    ErrorDecision on_error(const I& input, const std::exception& e,
                           std::size_t attempt) {
        for (auto& behavior : behaviors_) {
            ErrorDecision decision = behavior->on_error(input, e, attempt);
            auto* recovered = std::get_if<std::optional<O>>(&decision);
            if (recovered == nullptr || recovered->has_value()) {
                return decision;
            }
        }
        return BehaviorErrorResult::rethrow();
    }

    std::size_t size() const { return behaviors_.size(); }
    bool empty() const { return behaviors_.empty(); }
};

}  // namespace slotingest::utilities::behaviors

#endif  // SLOTINGEST_CORE_UTILITIES_BEHAVIORS_BEHAVIOR_CHAIN_H
