#ifndef SLOTINGEST_COMPONENTS_IO_LINES_LINE_TYPES_H
#define SLOTINGEST_COMPONENTS_IO_LINES_LINE_TYPES_H

#include <cstddef>
#include <string>
#include <utility>

namespace slotingest::components::io::lines {

/**
 * @brief One decoded record, without its terminator.
 */
struct Line {
    std::string content;
    std::size_t line_number = 0;  // 1-based within the slot

    Line() = default;
    Line(std::string text, std::size_t number)
        : content(std::move(text)), line_number(number) {}
};

}  // namespace slotingest::components::io::lines

#endif  // SLOTINGEST_COMPONENTS_IO_LINES_LINE_TYPES_H
