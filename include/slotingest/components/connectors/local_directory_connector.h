#ifndef SLOTINGEST_COMPONENTS_CONNECTORS_LOCAL_DIRECTORY_CONNECTOR_H
#define SLOTINGEST_COMPONENTS_CONNECTORS_LOCAL_DIRECTORY_CONNECTOR_H

#include <slotingest/components/filesystem/directory_scanner.h>
#include <slotingest/components/io/binary_file_reader.h>
#include <slotingest/core/common/filesystem.h>
#include <slotingest/ingest/connector.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace slotingest::components::connectors {

/**
 * @brief Where a file's slot timestamp comes from.
 */
enum class TimestampSource {
    MTIME,     // File modification time, truncated to milliseconds
    FILENAME,  // First YYYYMMDD or YYYYMMDDhhmmss digit run, UTC
};

/**
 * @brief Connector over the regular files of a local directory.
 *
 * Each file is one slot whose identifier is its path relative to the
 * directory, with '/' separators. list() orders slots by timestamp and
 * then identifier. With TimestampSource::FILENAME, files without a date
 * in their name are not listed.
 *
 * Recognized parameters:
 * - directory: root directory (required)
 * - recursive: "true" to descend into subdirectories (default "false")
 * - timestamp: "mtime" (default) or "filename"
 */
class LocalDirectoryConnector : public ingest::Connector {
   private:
    fs::path directory_;
    bool recursive_;
    TimestampSource timestamp_source_;
    filesystem::DirectoryScanner scanner_;
    io::BinaryFileReader reader_;

   public:
    LocalDirectoryConnector(fs::path directory, bool recursive = false,
                            TimestampSource source = TimestampSource::MTIME);

    /**
     * @throws ListFailure if the directory cannot be scanned
     */
    std::vector<ingest::Slot> list() override;

    /**
     * @throws FetchFailure if the file cannot be read
     */
    io::RawData fetch(const ingest::Slot& slot) override;

    const fs::path& directory() const { return directory_; }
    bool recursive() const { return recursive_; }
    TimestampSource timestamp_source() const { return timestamp_source_; }
};

class LocalDirectoryConnectorFactory : public ingest::ConnectorFactory {
   public:
    /**
     * @throws std::invalid_argument on missing or malformed parameters
     */
    std::shared_ptr<ingest::Connector> create(
        const ingest::ConnectorParameters& parameters) override;
};

/**
 * @brief Date embedded in a file name.
 *
 * Looks at the first run of exactly 8 or 14 digits and reads it as
 * YYYYMMDD or YYYYMMDDhhmmss in UTC.
 *
 * @return nullopt when no such run exists or it is not a valid date
 */
std::optional<ingest::Timestamp> timestamp_from_filename(
    const std::string& filename);

TimestampSource parse_timestamp_source(const std::string& text);

}  // namespace slotingest::components::connectors

#endif  // SLOTINGEST_COMPONENTS_CONNECTORS_LOCAL_DIRECTORY_CONNECTOR_H
