#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <slotingest/components/connectors/local_directory_connector.h>
#include <slotingest/ingest/errors.h>
#include <slotingest/ingest/incremental_slot_pipeline.h>

#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../testing_utilities.h"

using namespace slotingest;
using namespace slotingest::ingest;
using namespace slotingest_test;

namespace {

struct Collector {
    std::vector<std::string> lines;
    std::vector<std::string> slots;
    std::size_t results = 0;

    FetchResultSink sink() {
        return [this](const FetchResult& result) {
            ++results;
            slots.push_back(result.slot.identifier);
            lines.insert(lines.end(), result.lines.begin(),
                         result.lines.end());
        };
    }
};

struct Fixture {
    std::shared_ptr<ScriptedConnector> connector =
        std::make_shared<ScriptedConnector>();
    std::shared_ptr<ScriptedConnectorFactory> factory =
        std::make_shared<ScriptedConnectorFactory>(connector);
    std::shared_ptr<CheckpointStore> store =
        std::make_shared<MemoryCheckpointStore>();

    Fixture() = default;

    explicit Fixture(std::shared_ptr<CheckpointStore> store_)
        : store(std::move(store_)) {}

    std::unique_ptr<IncrementalSlotPipeline> make(
        PipelineConfig config = PipelineConfig(),
        const std::string& start = "2016-01-01",
        std::vector<std::string> excluded = {}) {
        return std::make_unique<IncrementalSlotPipeline>(
            factory, config, store,
            RangeCursor(parse_timestamp(start), excluded));
    }
};

}  // namespace

TEST_CASE("Pipeline - two dated slots in one cycle") {
    Fixture fx;
    fx.connector->add_slot(make_slot("file-20161201", "2016-12-01"),
                           make_lines("20161201", 5));
    fx.connector->add_slot(make_slot("file-20161202", "2016-12-02"),
                           RawData(TestEnvironment::gzip_bytes(
                                       make_lines("20161202", 5))
                                       .data));

    auto pipeline = fx.make(PipelineConfig().with_name("two-slots"));
    CHECK(pipeline->state() == CycleState::Idle);

    Collector collector;
    auto outcome = pipeline->run_cycle(collector.sink());

    REQUIRE(outcome.success);
    CHECK(outcome.consumed_slots.size() == 2);
    REQUIRE(collector.lines.size() == 10);
    CHECK(collector.lines[0] == "LINE 001 - 20161201");
    CHECK(collector.lines[5] == "LINE 001 - 20161202");
    CHECK(collector.slots ==
          std::vector<std::string>{"file-20161201", "file-20161202"});

    auto cursor = pipeline->cursor();
    CHECK(cursor.watermark() == parse_timestamp("2016-12-02"));
    CHECK(cursor.excluded_at_watermark() ==
          std::set<std::string>{"file-20161202"});
    CHECK(pipeline->state() == CycleState::Idle);

    REQUIRE(fx.store->load("two-slots").has_value());
    CHECK(*fx.store->load("two-slots") == cursor);

    auto stats = pipeline->stats();
    CHECK(stats.cycles_completed == 1);
    CHECK(stats.slots_processed == 2);
    CHECK(stats.records_read == 10);
    CHECK(stats.bytes_read == 2 * make_lines("20161201", 5).size());

    SUBCASE("A second cycle finds nothing new") {
        Collector again;
        auto second = pipeline->run_cycle(again.sink());
        CHECK(second.success);
        CHECK(second.consumed_slots.empty());
        CHECK(again.results == 0);
        CHECK(pipeline->cursor() == cursor);
    }

    SUBCASE("A later slot is picked up by the next cycle") {
        fx.connector->add_slot(make_slot("file-20161203", "2016-12-03"),
                               make_lines("20161203", 2));
        Collector again;
        auto second = pipeline->run_cycle(again.sink());
        REQUIRE(second.success);
        CHECK(again.slots == std::vector<std::string>{"file-20161203"});
        CHECK(pipeline->cursor().watermark() == parse_timestamp("2016-12-03"));
    }
}

TEST_CASE("Pipeline - initial date skips older slots") {
    Fixture fx;
    fx.connector->add_slot(make_slot("file-20161201", "2016-12-01"),
                           make_lines("20161201", 5));
    fx.connector->add_slot(make_slot("file-20161202", "2016-12-02"),
                           make_lines("20161202", 5));

    auto pipeline = fx.make(PipelineConfig(), "2016-12-02");
    Collector collector;
    REQUIRE(pipeline->run_cycle(collector.sink()).success);
    CHECK(collector.slots == std::vector<std::string>{"file-20161202"});
    CHECK(collector.lines.size() == 5);
}

TEST_CASE("Pipeline - same-date slot excluded by name") {
    Fixture fx;
    fx.connector->add_slot(make_slot("file1", "2016-12-01"),
                           make_lines("file1", 5));
    fx.connector->add_slot(make_slot("file2", "2016-12-01"),
                           make_lines("file2", 5));

    auto pipeline = fx.make(PipelineConfig(), "2016-12-01", {"file1"});
    Collector collector;
    auto outcome = pipeline->run_cycle(collector.sink());
    REQUIRE(outcome.success);
    CHECK(collector.slots == std::vector<std::string>{"file2"});
    CHECK(pipeline->cursor().excluded_at_watermark() ==
          std::set<std::string>{"file1", "file2"});
}

TEST_CASE("Pipeline - listing failures") {
    Fixture fx;
    fx.connector->add_slot(make_slot("a", "2016-12-01"), "a\n");

    SUBCASE("Recovered within the retry budget") {
        fx.connector->set_list_bad_tries(2);
        auto pipeline = fx.make(PipelineConfig().with_max_retries(2));
        Collector collector;
        CHECK(pipeline->run_cycle(collector.sink()).success);
        CHECK(fx.connector->list_calls.load() == 3);
        CHECK(collector.lines == std::vector<std::string>{"a"});
    }

    SUBCASE("Exhausted budget aborts the cycle") {
        fx.connector->set_list_bad_tries(3);
        auto pipeline = fx.make(PipelineConfig().with_max_retries(2));
        auto before = pipeline->cursor();
        Collector collector;
        auto outcome = pipeline->run_cycle(collector.sink());
        CHECK_FALSE(outcome.success);
        CHECK(outcome.kind == ErrorKind::LIST_FAILURE);
        CHECK(outcome.cause != nullptr);
        CHECK(collector.results == 0);
        CHECK(pipeline->cursor() == before);
        CHECK(pipeline->state() == CycleState::Aborted);
        CHECK(pipeline->stats().cycles_aborted == 1);
        CHECK_FALSE(fx.store->load("default").has_value());

        // The next cycle is a clean retry of the same work
        auto retry = pipeline->run_cycle(collector.sink());
        CHECK(retry.success);
        CHECK(collector.lines == std::vector<std::string>{"a"});
    }
}

TEST_CASE("Pipeline - all or nothing") {
    const std::size_t slot_count = 5;

    for (std::size_t threads : {std::size_t(1), std::size_t(4)}) {
        for (std::size_t failing = 0; failing < slot_count; ++failing) {
            CAPTURE(threads);
            CAPTURE(failing);
            Fixture fx;
            for (std::size_t i = 0; i < slot_count; ++i) {
                std::string id = "slot" + std::to_string(i);
                fx.connector->add_slot(
                    make_slot(id, "2016-12-0" + std::to_string(i + 1)),
                    make_lines(id, 3));
            }
            std::string bad = "slot" + std::to_string(failing);
            fx.connector->break_slot(bad);

            auto pipeline = fx.make(PipelineConfig()
                                        .with_max_retries(1)
                                        .with_executor_threads(threads));
            auto before = pipeline->cursor();

            Collector collector;
            auto outcome = pipeline->run_cycle(collector.sink());
            CHECK_FALSE(outcome.success);
            CHECK(outcome.kind == ErrorKind::PERMANENT_FAILURE);
            REQUIRE(outcome.failed_slot.has_value());
            CHECK(outcome.failed_slot->identifier == bad);
            CHECK(outcome.message.find(bad) != std::string::npos);
            CHECK(collector.results == 0);
            CHECK(pipeline->cursor() == before);
            CHECK_FALSE(fx.store->load("default").has_value());

            CHECK_THROWS_AS(pipeline->run_cycle_or_throw(collector.sink()),
                            CycleAborted);
            CHECK(collector.results == 0);

            fx.connector->repair_slot(bad);
            auto slots = pipeline->run_cycle_or_throw(collector.sink());
            CHECK(slots.size() == slot_count);
            CHECK(collector.lines.size() == slot_count * 3);
        }
    }
}

TEST_CASE("Pipeline - decode failure aborts the cycle") {
    Fixture fx;
    fx.connector->add_slot(make_slot("good", "2016-12-01"), "ok\n");
    std::vector<unsigned char> corrupt{0x1f, 0x8b, 0x08, 0x00, 0xff, 0xff};
    fx.connector->add_slot(make_slot("bad.gz", "2016-12-02"), RawData(corrupt));

    auto pipeline = fx.make();
    Collector collector;
    auto outcome = pipeline->run_cycle(collector.sink());
    CHECK_FALSE(outcome.success);
    CHECK(outcome.kind == ErrorKind::PERMANENT_FAILURE);
    CHECK(collector.results == 0);
    CHECK(fx.connector->fetch_calls.load() == 2);
}

TEST_CASE("Pipeline - parallel fetching keeps delivery order") {
    Fixture fx;
    std::vector<std::string> expected;
    for (int i = 0; i < 20; ++i) {
        char id[16];
        std::snprintf(id, sizeof(id), "slot%02d", i);
        fx.connector->add_slot(make_slot(id, "2016-12-01"), make_lines(id, 4));
        expected.push_back(id);
        fx.connector->set_fetch_bad_tries(id, i % 3);
    }

    auto pipeline = fx.make(PipelineConfig::parallel(4).with_max_retries(2));
    Collector collector;
    auto outcome = pipeline->run_cycle(collector.sink());
    REQUIRE(outcome.success);
    CHECK(collector.slots == expected);
    CHECK(collector.lines.size() == 80);
    CHECK(pipeline->cursor().excluded_at_watermark().size() == 20);
}

TEST_CASE("Pipeline - empty eligible set") {
    Fixture fx;
    auto pipeline = fx.make();
    auto before = pipeline->cursor();

    Collector collector;
    auto outcome = pipeline->run_cycle(collector.sink());
    CHECK(outcome.success);
    CHECK(outcome.consumed_slots.empty());
    CHECK(pipeline->cursor() == before);
    CHECK(pipeline->stats().cycles_completed == 1);
    CHECK(fx.connector->fetch_calls.load() == 0);
}

TEST_CASE("Pipeline - resume from checkpoint matches an uninterrupted run") {
    // Cycles come in pairs sharing one date, so every second cycle only
    // adds slots at the current watermark. The restart falls between the
    // two cycles of a pair. Timestamps carry a sub-millisecond part.
    auto arrivals = [](ScriptedConnector& connector, int cycle) {
        Timestamp ts = parse_timestamp("2016-12-01") +
                       std::chrono::hours(24 * (cycle / 2)) +
                       std::chrono::microseconds(250);
        std::string a = "a" + std::to_string(cycle);
        std::string b = "b" + std::to_string(cycle);
        connector.add_slot(Slot(a, ts), make_lines(a, 2));
        connector.add_slot(Slot(b, ts), make_lines(b, 3));
    };
    const int total_cycles = 6;
    const int restart_after = 3;

    Fixture straight;
    Collector straight_out;
    {
        auto pipeline = straight.make(PipelineConfig().with_name("resume"));
        for (int c = 0; c < total_cycles; ++c) {
            arrivals(*straight.connector, c);
            auto outcome = pipeline->run_cycle(straight_out.sink());
            REQUIRE(outcome.success);
            CHECK(outcome.consumed_slots.size() == 2);
        }
        CHECK(pipeline->cursor().excluded_at_watermark() ==
              std::set<std::string>{"a4", "b4", "a5", "b5"});
    }

    TestEnvironment env;
    REQUIRE(env.is_valid());

    auto run_resumed = [&](std::shared_ptr<CheckpointStore> store) {
        Fixture resumed(store);
        Collector resumed_out;
        {
            auto first = resumed.make(PipelineConfig().with_name("resume"));
            for (int c = 0; c < restart_after; ++c) {
                arrivals(*resumed.connector, c);
                REQUIRE(first->run_cycle(resumed_out.sink()).success);
            }
        }
        {
            // The initial cursor is ignored once a checkpoint exists
            auto second = resumed.make(PipelineConfig().with_name("resume"),
                                       "2000-01-01");
            for (int c = restart_after; c < total_cycles; ++c) {
                arrivals(*resumed.connector, c);
                auto outcome = second->run_cycle(resumed_out.sink());
                REQUIRE(outcome.success);
                CHECK(outcome.consumed_slots.size() == 2);
            }
            CHECK(second->cursor() == *straight.store->load("resume"));
        }

        CHECK(resumed_out.lines == straight_out.lines);
        CHECK(*resumed.store->load("resume") ==
              *straight.store->load("resume"));
    };

    run_resumed(std::make_shared<MemoryCheckpointStore>());
    run_resumed(
        std::make_shared<FileCheckpointStore>(env.get_dir() / "checkpoints"));
}

TEST_CASE("Pipeline - stop requests") {
    Fixture fx;
    fx.connector->add_slot(make_slot("a", "2016-12-01"), "a\n");
    auto pipeline = fx.make();

    pipeline->request_stop();
    CHECK(pipeline->stop_requested());

    Collector collector;
    auto outcome = pipeline->run_cycle(collector.sink());
    CHECK_FALSE(outcome.success);
    CHECK(outcome.kind == ErrorKind::CANCELLED);
    CHECK(collector.results == 0);
    CHECK(fx.connector->list_calls.load() == 0);
    CHECK(pipeline->cursor() ==
          RangeCursor(parse_timestamp("2016-01-01")));
}

TEST_CASE("Pipeline - sink failure leaves the cursor alone") {
    Fixture fx;
    fx.connector->add_slot(make_slot("a", "2016-12-01"), "a\n");
    auto pipeline = fx.make();
    auto before = pipeline->cursor();

    auto outcome = pipeline->run_cycle(
        [](const FetchResult&) { throw std::runtime_error("disk full"); });
    CHECK_FALSE(outcome.success);
    CHECK(outcome.message.find("disk full") != std::string::npos);
    CHECK(pipeline->cursor() == before);
}

TEST_CASE("Pipeline - configuration") {
    Fixture fx;

    SUBCASE("Parameters reach the connector factory") {
        auto pipeline = fx.make(
            PipelineConfig().with_connector_parameter("bucket", "logs"));
        REQUIRE(pipeline->run_cycle(nullptr).success);
        CHECK(fx.factory->created == 1);
        CHECK(fx.factory->last_parameters.at("bucket") == "logs");
    }

    SUBCASE("Invalid settings are rejected") {
        CHECK_THROWS_AS(fx.make(PipelineConfig().with_charset("EBCDIC")),
                        std::invalid_argument);
        CHECK_THROWS_AS(fx.make(PipelineConfig().with_name("")),
                        std::invalid_argument);
        CHECK_THROWS_AS(IncrementalSlotPipeline(
                            nullptr, PipelineConfig(), fx.store,
                            RangeCursor(parse_timestamp("2016-01-01"))),
                        std::invalid_argument);
    }

    SUBCASE("Presets") {
        CHECK(PipelineConfig::sequential().executor_threads == 1);
        CHECK(PipelineConfig::parallel(8).executor_threads == 8);
        CHECK(PipelineConfig().max_retries == 3);
        CHECK(PipelineConfig().charset == "UTF-8");
    }
}

TEST_CASE("Pipeline - local directory end to end") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    env.write_file("in/data_20161201.log", make_lines("20161201", 5));
    env.write_gzip_file("in/data_20161202.log.gz", make_lines("20161202", 5));

    auto config = PipelineConfig()
                      .with_name("local")
                      .with_connector_parameter(
                          "directory", (env.get_dir() / "in").string())
                      .with_connector_parameter("timestamp", "filename");
    auto store = std::make_shared<FileCheckpointStore>(env.get_dir() / "cp");
    auto factory = std::make_shared<
        components::connectors::LocalDirectoryConnectorFactory>();

    Collector collector;
    {
        IncrementalSlotPipeline pipeline(
            factory, config, store, RangeCursor(parse_timestamp("2016-01-01")));
        REQUIRE(pipeline.run_cycle(collector.sink()).success);
    }
    CHECK(collector.lines.size() == 10);

    env.write_file("in/data_20161203.log", make_lines("20161203", 1));
    {
        IncrementalSlotPipeline pipeline(
            factory, config, store, RangeCursor(parse_timestamp("2016-01-01")));
        REQUIRE(pipeline.run_cycle(collector.sink()).success);
        CHECK(pipeline.cursor().watermark() == parse_timestamp("2016-12-03"));
    }
    CHECK(collector.lines.size() == 11);
    CHECK(collector.lines.back() == "LINE 001 - 20161203");
}
