#include <slotingest/components/connectors/local_directory_connector.h>
#include <slotingest/core/common/errors.h>
#include <slotingest/core/common/logging.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace slotingest::components::connectors {

using ingest::Slot;
using ingest::Timestamp;

TimestampSource parse_timestamp_source(const std::string& text) {
    if (text == "mtime") {
        return TimestampSource::MTIME;
    }
    if (text == "filename") {
        return TimestampSource::FILENAME;
    }
    throw std::invalid_argument("Unknown timestamp source: '" + text +
                                "' (expected mtime or filename)");
}

std::optional<Timestamp> timestamp_from_filename(const std::string& filename) {
    std::size_t pos = 0;
    while (pos < filename.size()) {
        if (!std::isdigit(static_cast<unsigned char>(filename[pos]))) {
            ++pos;
            continue;
        }
        std::size_t end = pos;
        while (end < filename.size() &&
               std::isdigit(static_cast<unsigned char>(filename[end]))) {
            ++end;
        }
        std::size_t length = end - pos;
        if (length == 8 || length == 14) {
            const std::string digits = filename.substr(pos, length);
            std::string text = digits.substr(0, 4) + "-" +
                               digits.substr(4, 2) + "-" + digits.substr(6, 2);
            if (length == 14) {
                text += " " + digits.substr(8, 2) + ":" + digits.substr(10, 2) +
                        ":" + digits.substr(12, 2);
            }
            try {
                return ingest::parse_timestamp(text);
            } catch (const std::invalid_argument&) {
                return std::nullopt;
            }
        }
        pos = end;
    }
    return std::nullopt;
}

LocalDirectoryConnector::LocalDirectoryConnector(fs::path directory,
                                                 bool recursive,
                                                 TimestampSource source)
    : directory_(std::move(directory)),
      recursive_(recursive),
      timestamp_source_(source) {}

std::vector<Slot> LocalDirectoryConnector::list() {
    std::vector<filesystem::FileEntry> entries;
    try {
        entries = scanner_.process(filesystem::Directory{directory_, recursive_});
    } catch (const fs::filesystem_error& e) {
        throw ListFailure("Cannot list " + directory_.string() + ": " +
                          e.what());
    }

    std::vector<Slot> slots;
    slots.reserve(entries.size());
    for (const auto& entry : entries) {
        std::string identifier = entry.relative_path.generic_string();
        if (timestamp_source_ == TimestampSource::FILENAME) {
            auto ts = timestamp_from_filename(entry.path.filename().string());
            if (!ts) {
                SLOTINGEST_LOG_DEBUG("Skipping %s: no date in file name",
                                     identifier.c_str());
                continue;
            }
            slots.emplace_back(std::move(identifier), *ts);
        } else {
            slots.emplace_back(std::move(identifier), entry.modified);
        }
    }

    std::stable_sort(slots.begin(), slots.end(),
                     [](const Slot& a, const Slot& b) {
                         if (a.timestamp != b.timestamp) {
                             return a.timestamp < b.timestamp;
                         }
                         return a.identifier < b.identifier;
                     });

    SLOTINGEST_LOG_DEBUG("Listed %zu slot(s) in %s", slots.size(),
                         directory_.c_str());
    return slots;
}

io::RawData LocalDirectoryConnector::fetch(const Slot& slot) {
    fs::path path = directory_ / fs::path(slot.identifier);
    try {
        return reader_.process(path);
    } catch (const std::runtime_error& e) {
        throw FetchFailure("Cannot fetch " + slot.identifier + ": " +
                           e.what());
    }
}

std::shared_ptr<ingest::Connector> LocalDirectoryConnectorFactory::create(
    const ingest::ConnectorParameters& parameters) {
    auto dir_it = parameters.find("directory");
    if (dir_it == parameters.end() || dir_it->second.empty()) {
        throw std::invalid_argument(
            "Local directory connector requires a 'directory' parameter");
    }

    bool recursive = false;
    auto rec_it = parameters.find("recursive");
    if (rec_it != parameters.end()) {
        if (rec_it->second == "true") {
            recursive = true;
        } else if (rec_it->second != "false") {
            throw std::invalid_argument("Parameter 'recursive' must be true "
                                        "or false, got '" +
                                        rec_it->second + "'");
        }
    }

    TimestampSource source = TimestampSource::MTIME;
    auto ts_it = parameters.find("timestamp");
    if (ts_it != parameters.end()) {
        source = parse_timestamp_source(ts_it->second);
    }

    return std::make_shared<LocalDirectoryConnector>(dir_it->second, recursive,
                                                     source);
}

}  // namespace slotingest::components::connectors
