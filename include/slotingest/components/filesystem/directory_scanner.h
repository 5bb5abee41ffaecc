#ifndef SLOTINGEST_COMPONENTS_FILESYSTEM_DIRECTORY_SCANNER_H
#define SLOTINGEST_COMPONENTS_FILESYSTEM_DIRECTORY_SCANNER_H

#include <slotingest/core/common/filesystem.h>
#include <slotingest/core/utilities/utility.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace slotingest::components::filesystem {

struct Directory {
    fs::path path;
    bool recursive = false;

    explicit Directory(fs::path root, bool descend = false)
        : path(std::move(root)), recursive(descend) {}
};

/**
 * @brief A regular file found by the scanner.
 */
struct FileEntry {
    fs::path path;
    fs::path relative_path;  // Relative to the scanned directory
    std::size_t size = 0;
    std::chrono::system_clock::time_point modified;

    FileEntry() = default;
};

/**
 * @brief Utility that lists the regular files of a directory.
 *
 * Subdirectories are descended into only when Directory.recursive is set;
 * symlinks to regular files are followed, anything else is skipped.
 * Entries come back sorted by relative path.
 *
 * Usage:
 * @code
 * DirectoryScanner scanner;
 * for (const auto& entry : scanner.process(Directory{"/data/in", true})) {
 *     std::cout << entry.relative_path << " - " << entry.size << " bytes\n";
 * }
 * @endcode
 */
class DirectoryScanner
    : public utilities::Utility<Directory, std::vector<FileEntry>> {
   public:
    DirectoryScanner() = default;
    ~DirectoryScanner() override = default;

    /**
     * @throws fs::filesystem_error if the directory doesn't exist or is
     * inaccessible
     */
    std::vector<FileEntry> process(const Directory& input) override;
};

/**
 * @brief Modification time of a file on the system clock.
 *
 * @throws fs::filesystem_error
 */
std::chrono::system_clock::time_point last_write_time(const fs::path& path);

}  // namespace slotingest::components::filesystem

#endif  // SLOTINGEST_COMPONENTS_FILESYSTEM_DIRECTORY_SCANNER_H
