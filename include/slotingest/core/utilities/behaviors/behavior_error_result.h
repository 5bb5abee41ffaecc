#ifndef SLOTINGEST_CORE_UTILITIES_BEHAVIORS_BEHAVIOR_ERROR_RESULT_H
#define SLOTINGEST_CORE_UTILITIES_BEHAVIORS_BEHAVIOR_ERROR_RESULT_H

#include <exception>

namespace slotingest::utilities::behaviors {

/**
 * @brief Action a behavior requests after a failed attempt.
 */
enum class BehaviorErrorAction {
    Retry,   // Run process() again
    Rethrow  // Propagate (optionally a replacement exception)
};

struct BehaviorErrorResult {
    BehaviorErrorAction action;
    std::exception_ptr exception;

    static BehaviorErrorResult retry() {
        return BehaviorErrorResult{BehaviorErrorAction::Retry, nullptr};
    }

    /**
     * @brief Propagate an exception.
     *
     * @param e Replacement exception, or nullptr to rethrow the original one
     */
    static BehaviorErrorResult rethrow(std::exception_ptr e = nullptr) {
        return BehaviorErrorResult{BehaviorErrorAction::Rethrow, e};
    }
};

}  // namespace slotingest::utilities::behaviors

#endif  // SLOTINGEST_CORE_UTILITIES_BEHAVIORS_BEHAVIOR_ERROR_RESULT_H
