#include <slotingest/components/filesystem/directory_scanner.h>

#include <algorithm>
#include <system_error>

namespace slotingest::components::filesystem {

std::chrono::system_clock::time_point last_write_time(const fs::path& path) {
    // file_time_type has no portable clock conversion in C++17
    auto ftime = fs::last_write_time(path);
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() +
        std::chrono::system_clock::now());
}

namespace {

template <typename Iterator>
void collect(const fs::path& root, Iterator it,
             std::vector<FileEntry>& entries) {
    for (const auto& entry : it) {
        if (!entry.is_regular_file()) {
            continue;
        }
        FileEntry file;
        file.path = entry.path();
        file.relative_path = entry.path().lexically_relative(root);
        file.size = static_cast<std::size_t>(entry.file_size());
        file.modified = filesystem::last_write_time(entry.path());
        entries.push_back(std::move(file));
    }
}

}  // namespace

std::vector<FileEntry> DirectoryScanner::process(const Directory& input) {
    if (!fs::exists(input.path)) {
        throw fs::filesystem_error(
            "Directory does not exist", input.path,
            std::make_error_code(std::errc::no_such_file_or_directory));
    }

    if (!fs::is_directory(input.path)) {
        throw fs::filesystem_error(
            "Path is not a directory", input.path,
            std::make_error_code(std::errc::not_a_directory));
    }

    std::vector<FileEntry> entries;
    if (input.recursive) {
        collect(input.path, fs::recursive_directory_iterator(input.path),
                entries);
    } else {
        collect(input.path, fs::directory_iterator(input.path), entries);
    }

    std::sort(entries.begin(), entries.end(),
              [](const FileEntry& a, const FileEntry& b) {
                  return a.relative_path < b.relative_path;
              });
    return entries;
}

}  // namespace slotingest::components::filesystem
