#ifndef SLOTINGEST_CORE_UTILITIES_UTILITY_H
#define SLOTINGEST_CORE_UTILITIES_UTILITY_H

#include <type_traits>

namespace slotingest::utilities {

/**
 * @brief One-input, one-output processing step.
 *
 * Tags declare properties of the step at compile time, for instance
 * tags::Parallelizable for steps that may run on several workers at once.
 * Retries and similar concerns are attached as behaviors and applied by
 * behaviors::UtilityExecutor, not coded into process().
 *
 * Usage:
 * @code
 * class ReadFile : public Utility<fs::path, io::RawData> {
 *     io::RawData process(const fs::path& path) override;
 * };
 * @endcode
 */
template <typename I, typename O, typename... Tags>
class Utility {
   public:
    using Input = I;
    using Output = O;

    Utility() = default;
    virtual ~Utility() = default;

    Utility(const Utility&) = delete;
    Utility& operator=(const Utility&) = delete;
    Utility(Utility&&) = default;
    Utility& operator=(Utility&&) = default;

    virtual O process(const I& input) = 0;

    template <typename Tag>
    static constexpr bool has_tag() {
        return (std::is_same_v<Tag, Tags> || ...);
    }
};

}  // namespace slotingest::utilities

#endif  // SLOTINGEST_CORE_UTILITIES_UTILITY_H
