#ifndef SLOTINGEST_TESTS_TESTING_UTILITIES_H
#define SLOTINGEST_TESTS_TESTING_UTILITIES_H

#include <slotingest/components/compression/gzip/streaming_compressor.h>
#include <slotingest/components/io/types/types.h>
#include <slotingest/core/common/errors.h>
#include <slotingest/core/common/filesystem.h>
#include <slotingest/ingest/connector.h>
#include <slotingest/ingest/slot.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace slotingest_test {

using slotingest::components::io::RawData;
using slotingest::ingest::Slot;

/**
 * Temporary directory removed on destruction.
 */
class TestEnvironment {
   private:
    slotingest::fs::path dir_;

   public:
    TestEnvironment() {
        std::random_device rd;
        auto base = slotingest::fs::temp_directory_path();
        for (int i = 0; i < 16 && dir_.empty(); ++i) {
            auto candidate =
                base / ("slotingest_test_" + std::to_string(rd()));
            std::error_code ec;
            if (slotingest::fs::create_directory(candidate, ec)) {
                dir_ = candidate;
            }
        }
    }

    ~TestEnvironment() {
        if (!dir_.empty()) {
            std::error_code ec;
            slotingest::fs::remove_all(dir_, ec);
        }
    }

    TestEnvironment(const TestEnvironment&) = delete;
    TestEnvironment& operator=(const TestEnvironment&) = delete;

    bool is_valid() const { return !dir_.empty(); }

    const slotingest::fs::path& get_dir() const { return dir_; }

    std::string write_file(const std::string& name,
                           const std::string& content) const {
        auto path = dir_ / name;
        slotingest::fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path.string();
    }

    std::string write_gzip_file(const std::string& name,
                                const std::string& content) const {
        auto compressed = gzip_bytes(content);
        return write_file(name,
                          std::string(compressed.data.begin(),
                                      compressed.data.end()));
    }

    static slotingest::components::io::CompressedData gzip_bytes(
        const std::string& content) {
        return slotingest::components::compression::gzip::compress(
            RawData(content));
    }
};

/**
 * "LINE 001 - 20161201\n" ... one line per record.
 */
inline std::string make_lines(const std::string& tag, std::size_t count) {
    std::string out;
    for (std::size_t i = 1; i <= count; ++i) {
        char num[8];
        std::snprintf(num, sizeof(num), "%03zu", i);
        out += "LINE " + std::string(num) + " - " + tag + "\n";
    }
    return out;
}

inline Slot make_slot(const std::string& id, const std::string& date) {
    return Slot(id, slotingest::ingest::parse_timestamp(date));
}

/**
 * In-memory connector whose list and fetch fail a scripted number of
 * times before succeeding.
 */
class ScriptedConnector : public slotingest::ingest::Connector {
   private:
    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::map<std::string, RawData> contents_;
    std::size_t list_bad_tries_ = 0;
    std::map<std::string, std::size_t> fetch_bad_tries_;
    std::set<std::string> broken_;

   public:
    std::atomic<std::size_t> list_calls{0};
    std::atomic<std::size_t> fetch_calls{0};

    void add_slot(const Slot& slot, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_.push_back(slot);
        contents_[slot.identifier] = RawData(content);
    }

    void add_slot(const Slot& slot, RawData content) {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_.push_back(slot);
        contents_[slot.identifier] = std::move(content);
    }

    void set_list_bad_tries(std::size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        list_bad_tries_ = n;
    }

    void set_fetch_bad_tries(const std::string& id, std::size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        fetch_bad_tries_[id] = n;
    }

    // Every fetch of this slot fails
    void break_slot(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        broken_.insert(id);
    }

    void repair_slot(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        broken_.erase(id);
    }

    std::vector<Slot> list() override {
        ++list_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        if (list_bad_tries_ > 0) {
            --list_bad_tries_;
            throw slotingest::ListFailure("scripted list failure");
        }
        return slots_;
    }

    RawData fetch(const Slot& slot) override {
        ++fetch_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken_.count(slot.identifier) > 0) {
            throw slotingest::FetchFailure("scripted permanent fetch failure: " +
                                           slot.identifier);
        }
        auto bad = fetch_bad_tries_.find(slot.identifier);
        if (bad != fetch_bad_tries_.end() && bad->second > 0) {
            --bad->second;
            throw slotingest::FetchFailure("scripted fetch failure: " +
                                           slot.identifier);
        }
        auto it = contents_.find(slot.identifier);
        if (it == contents_.end()) {
            throw slotingest::FetchFailure("unknown slot: " + slot.identifier);
        }
        return it->second;
    }
};

/**
 * Hands out the same connector and records the parameters it was given.
 */
class ScriptedConnectorFactory : public slotingest::ingest::ConnectorFactory {
   private:
    std::shared_ptr<ScriptedConnector> connector_;

   public:
    slotingest::ingest::ConnectorParameters last_parameters;
    std::size_t created = 0;

    explicit ScriptedConnectorFactory(
        std::shared_ptr<ScriptedConnector> connector)
        : connector_(std::move(connector)) {}

    std::shared_ptr<slotingest::ingest::Connector> create(
        const slotingest::ingest::ConnectorParameters& parameters) override {
        last_parameters = parameters;
        ++created;
        return connector_;
    }
};

}  // namespace slotingest_test

#endif  // SLOTINGEST_TESTS_TESTING_UTILITIES_H
