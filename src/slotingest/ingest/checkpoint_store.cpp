#include <slotingest/core/common/logging.h>
#include <slotingest/ingest/checkpoint_store.h>
#include <yyjson.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>

namespace slotingest::ingest {

std::optional<RangeCursor> MemoryCheckpointStore::load(
    const std::string& pipeline_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cursors_.find(pipeline_id);
    if (it == cursors_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryCheckpointStore::save(const std::string& pipeline_id,
                                 const RangeCursor& cursor) {
    std::lock_guard<std::mutex> lock(mutex_);
    cursors_.insert_or_assign(pipeline_id, cursor);
}

std::size_t MemoryCheckpointStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursors_.size();
}

std::string to_checkpoint_json(const std::string& pipeline_id,
                               const RangeCursor& cursor) {
    yyjson_mut_doc* doc = yyjson_mut_doc_new(nullptr);
    if (!doc) {
        throw CheckpointError("Failed to allocate checkpoint document");
    }

    yyjson_mut_val* root = yyjson_mut_obj(doc);
    yyjson_mut_doc_set_root(doc, root);
    yyjson_mut_obj_add_strncpy(doc, root, "pipeline_id", pipeline_id.data(),
                               pipeline_id.size());
    yyjson_mut_obj_add_int(doc, root, "watermark_ns",
                           to_epoch_nanos(cursor.watermark()));

    yyjson_mut_val* excluded = yyjson_mut_arr(doc);
    for (const auto& id : cursor.excluded_at_watermark()) {
        yyjson_mut_arr_add_strncpy(doc, excluded, id.data(), id.size());
    }
    yyjson_mut_obj_add_val(doc, root, "excluded", excluded);

    std::size_t length = 0;
    char* json = yyjson_mut_write(doc, 0, &length);
    yyjson_mut_doc_free(doc);
    if (!json) {
        throw CheckpointError("Failed to serialize checkpoint for " +
                              pipeline_id);
    }

    std::string result(json, length);
    std::free(json);
    return result;
}

namespace {

std::int64_t read_int(yyjson_val* val) {
    // Non-negative numbers are parsed as unsigned
    return yyjson_is_uint(val) ? static_cast<std::int64_t>(yyjson_get_uint(val))
                               : yyjson_get_sint(val);
}

RangeCursor parse_checkpoint(const std::string& json,
                             const std::string* expected_id) {
    yyjson_doc* doc = yyjson_read(json.data(), json.size(), 0);
    if (!doc) {
        throw CheckpointError("Checkpoint is not valid JSON");
    }

    yyjson_val* root = yyjson_doc_get_root(doc);
    if (!yyjson_is_obj(root)) {
        yyjson_doc_free(doc);
        throw CheckpointError("Checkpoint root is not an object");
    }

    if (expected_id) {
        yyjson_val* id_val = yyjson_obj_get(root, "pipeline_id");
        if (!yyjson_is_str(id_val) ||
            std::string(yyjson_get_str(id_val), yyjson_get_len(id_val)) !=
                *expected_id) {
            yyjson_doc_free(doc);
            throw CheckpointError("Checkpoint does not belong to pipeline '" +
                                  *expected_id + "'");
        }
    }

    Timestamp watermark;
    yyjson_val* ns_val = yyjson_obj_get(root, "watermark_ns");
    yyjson_val* ms_val = yyjson_obj_get(root, "watermark_ms");
    if (ns_val && yyjson_is_int(ns_val)) {
        watermark = from_epoch_nanos(read_int(ns_val));
    } else if (!ns_val && ms_val && yyjson_is_int(ms_val)) {
        watermark = from_epoch_millis(read_int(ms_val));
    } else {
        yyjson_doc_free(doc);
        throw CheckpointError("Checkpoint has no integer watermark_ns");
    }

    std::set<std::string> excluded;
    yyjson_val* excluded_val = yyjson_obj_get(root, "excluded");
    if (excluded_val) {
        if (!yyjson_is_arr(excluded_val)) {
            yyjson_doc_free(doc);
            throw CheckpointError("Checkpoint field 'excluded' is not an array");
        }
        std::size_t idx, max;
        yyjson_val* item;
        yyjson_arr_foreach(excluded_val, idx, max, item) {
            if (!yyjson_is_str(item)) {
                yyjson_doc_free(doc);
                throw CheckpointError(
                    "Checkpoint field 'excluded' holds a non-string value");
            }
            excluded.emplace(yyjson_get_str(item), yyjson_get_len(item));
        }
    }

    yyjson_doc_free(doc);
    return RangeCursor(watermark, std::move(excluded));
}

}  // namespace

RangeCursor from_checkpoint_json(const std::string& json) {
    return parse_checkpoint(json, nullptr);
}

RangeCursor from_checkpoint_json(const std::string& json,
                                 const std::string& pipeline_id) {
    return parse_checkpoint(json, &pipeline_id);
}

FileCheckpointStore::FileCheckpointStore(fs::path directory)
    : directory_(std::move(directory)) {}

fs::path FileCheckpointStore::path_for(const std::string& pipeline_id) const {
    // Percent-escape everything else so distinct ids never share a file
    static const char hex[] = "0123456789ABCDEF";
    std::string name;
    name.reserve(pipeline_id.size());
    for (char c : pipeline_id) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.') {
            name += c;
        } else {
            name += '%';
            name += hex[uc >> 4];
            name += hex[uc & 0x0F];
        }
    }
    // "." and ".." are not usable as file name stems on their own
    if (name.empty() || name == "." || name == "..") {
        name.insert(0, "%");
    }
    return directory_ / (name + ".checkpoint.json");
}

std::optional<RangeCursor> FileCheckpointStore::load(
    const std::string& pipeline_id) {
    fs::path path = path_for(pipeline_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        SLOTINGEST_LOG_DEBUG("No checkpoint for '%s' at %s",
                             pipeline_id.c_str(), path.c_str());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw CheckpointError("Cannot open checkpoint " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    try {
        RangeCursor cursor = from_checkpoint_json(buffer.str(), pipeline_id);
        SLOTINGEST_LOG_INFO("Loaded checkpoint for '%s': %s",
                            pipeline_id.c_str(), cursor.to_string().c_str());
        return cursor;
    } catch (const CheckpointError& e) {
        throw CheckpointError(path.string() + ": " + e.what());
    }
}

void FileCheckpointStore::save(const std::string& pipeline_id,
                               const RangeCursor& cursor) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw CheckpointError("Cannot create checkpoint directory " +
                              directory_.string() + ": " + ec.message());
    }

    std::string json = to_checkpoint_json(pipeline_id, cursor);
    fs::path target = path_for(pipeline_id);
    fs::path temp = target;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw CheckpointError("Cannot write checkpoint " + temp.string());
        }
        out.write(json.data(), static_cast<std::streamsize>(json.size()));
        out.flush();
        if (!out) {
            throw CheckpointError("Short write to checkpoint " +
                                  temp.string());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw CheckpointError("Cannot replace checkpoint " + target.string());
    }

    SLOTINGEST_LOG_DEBUG("Saved checkpoint for '%s': %s", pipeline_id.c_str(),
                         cursor.to_string().c_str());
}

}  // namespace slotingest::ingest
