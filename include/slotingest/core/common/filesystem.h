#ifndef SLOTINGEST_CORE_COMMON_FILESYSTEM_H
#define SLOTINGEST_CORE_COMMON_FILESYSTEM_H

#include <filesystem>

namespace slotingest {
namespace fs = std::filesystem;
}  // namespace slotingest

#endif  // SLOTINGEST_CORE_COMMON_FILESYSTEM_H
