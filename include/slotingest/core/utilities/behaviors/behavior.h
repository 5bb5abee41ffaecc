#ifndef SLOTINGEST_CORE_UTILITIES_BEHAVIORS_BEHAVIOR_H
#define SLOTINGEST_CORE_UTILITIES_BEHAVIORS_BEHAVIOR_H

#include <slotingest/core/utilities/behaviors/behavior_error_result.h>

#include <cstddef>
#include <exception>
#include <optional>
#include <variant>

namespace slotingest::utilities::behaviors {

/**
 * @brief Hooks run by UtilityExecutor around each attempt of a utility.
 *
 * attempt is 0 for the first try and grows by one per retry.
 *
 * @tparam I Input type for the utility
 * @tparam O Output type for the utility
 */
template <typename I, typename O>
class UtilityBehavior {
   public:
    virtual ~UtilityBehavior() = default;

    virtual void before_attempt([[maybe_unused]] const I& input,
                                [[maybe_unused]] std::size_t attempt) {}

    /**
     * @brief Called once when an attempt returned normally.
     */
    virtual void on_success([[maybe_unused]] const I& input,
                            [[maybe_unused]] std::size_t attempt) {}

    /**
     * @brief Decide what happens after a failed attempt.
     *
     * Return a BehaviorErrorResult to retry or propagate, a value to use
     * as the result, or std::nullopt to let the next behavior decide.
     */
    virtual std::variant<BehaviorErrorResult, std::optional<O>> on_error(
        [[maybe_unused]] const I& input,
        [[maybe_unused]] const std::exception& e,
        [[maybe_unused]] std::size_t attempt) {
        return std::optional<O>{};
    }
};

}  // namespace slotingest::utilities::behaviors

#endif  // SLOTINGEST_CORE_UTILITIES_BEHAVIORS_BEHAVIOR_H
