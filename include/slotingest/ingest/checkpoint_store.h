#ifndef SLOTINGEST_INGEST_CHECKPOINT_STORE_H
#define SLOTINGEST_INGEST_CHECKPOINT_STORE_H

#include <slotingest/core/common/filesystem.h>
#include <slotingest/ingest/range_cursor.h>

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace slotingest::ingest {

/**
 * @brief Raised when a checkpoint cannot be read back or written.
 */
class CheckpointError : public std::runtime_error {
   public:
    explicit CheckpointError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Durable home of the cursor, keyed by pipeline instance id.
 */
class CheckpointStore {
   public:
    virtual ~CheckpointStore() = default;

    /**
     * @return The last saved cursor, or nullopt if none was ever saved
     * @throws CheckpointError if a saved cursor exists but is unreadable
     */
    virtual std::optional<RangeCursor> load(const std::string& pipeline_id) = 0;

    /**
     * @throws CheckpointError if the cursor could not be persisted
     */
    virtual void save(const std::string& pipeline_id,
                      const RangeCursor& cursor) = 0;
};

class MemoryCheckpointStore : public CheckpointStore {
   private:
    mutable std::mutex mutex_;
    std::map<std::string, RangeCursor> cursors_;

   public:
    std::optional<RangeCursor> load(const std::string& pipeline_id) override;

    void save(const std::string& pipeline_id,
              const RangeCursor& cursor) override;

    std::size_t size() const;
};

/**
 * @brief One JSON document per pipeline id inside a directory.
 *
 * Document layout:
 * @code
 * {"pipeline_id": "daily", "watermark_ns": 1480636800000000000,
 *  "excluded": ["a.log", "b.log"]}
 * @endcode
 *
 * File names are the id with bytes outside [A-Za-z0-9._-] percent-escaped,
 * so distinct ids map to distinct files. A load also checks the stored
 * pipeline_id.
 *
 * A save writes a temporary file next to the target and renames it over
 * the target, so readers see either the old or the new cursor.
 */
class FileCheckpointStore : public CheckpointStore {
   private:
    fs::path directory_;

   public:
    /**
     * @param directory Created on first save if missing
     */
    explicit FileCheckpointStore(fs::path directory);

    std::optional<RangeCursor> load(const std::string& pipeline_id) override;

    void save(const std::string& pipeline_id,
              const RangeCursor& cursor) override;

    fs::path path_for(const std::string& pipeline_id) const;

    const fs::path& directory() const { return directory_; }
};

/**
 * @brief Serialize a cursor to its JSON checkpoint form.
 */
std::string to_checkpoint_json(const std::string& pipeline_id,
                               const RangeCursor& cursor);

/**
 * @brief Parse a checkpoint document. Documents holding only the older
 * "watermark_ms" field are still accepted.
 *
 * @throws CheckpointError on malformed documents
 */
RangeCursor from_checkpoint_json(const std::string& json);

/**
 * @throws CheckpointError on malformed documents or when the stored
 * pipeline_id differs from pipeline_id
 */
RangeCursor from_checkpoint_json(const std::string& json,
                                 const std::string& pipeline_id);

}  // namespace slotingest::ingest

#endif  // SLOTINGEST_INGEST_CHECKPOINT_STORE_H
