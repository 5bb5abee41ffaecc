#include <slotingest/components/connectors/local_directory_connector.h>
#include <slotingest/core/common/config.h>
#include <slotingest/core/common/logging.h>
#include <slotingest/ingest/checkpoint_store.h>
#include <slotingest/ingest/errors.h>
#include <slotingest/ingest/incremental_slot_pipeline.h>

#include <argparse/argparse.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace slotingest;
using namespace slotingest::ingest;

namespace {

std::atomic<bool> g_signalled{false};

void handle_signal(int) { g_signalled.store(true); }

// Sleep in short slices so a signal ends the wait promptly
void wait_for(std::chrono::milliseconds interval) {
    auto deadline = std::chrono::steady_clock::now() + interval;
    while (!g_signalled.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

}  // namespace

int main(int argc, char** argv) {
    SLOTINGEST_LOGGER_INIT();

    argparse::ArgumentParser program("slotingest_run",
                                     SLOTINGEST_PACKAGE_VERSION);
    program.add_description(
        "Incrementally ingest dated files from a directory, resuming from "
        "the last checkpoint");

    program.add_argument("-d", "--directory")
        .help("Directory holding the slots to ingest")
        .required();

    program.add_argument("--recursive")
        .help("Also list files in subdirectories")
        .flag();

    program.add_argument("--timestamp")
        .help("Slot timestamp source: mtime or filename")
        .default_value<std::string>("mtime");

    program.add_argument("-n", "--name")
        .help("Pipeline name, used as checkpoint key")
        .default_value<std::string>("default");

    program.add_argument("-c", "--checkpoint-dir")
        .help("Directory for checkpoint files")
        .default_value<std::string>("./checkpoints");

    program.add_argument("--start")
        .help("Initial watermark, YYYY-MM-DD[ HH:MM:SS] in UTC")
        .default_value<std::string>("1970-01-01");

    program.add_argument("--exclude")
        .help("Identifier already consumed at the initial watermark "
              "(repeatable)")
        .append()
        .default_value<std::vector<std::string>>({});

    program.add_argument("--max-retries")
        .help("Retries after the first attempt for list and fetch")
        .scan<'d', std::size_t>()
        .default_value(static_cast<std::size_t>(3));

    program.add_argument("--charset")
        .help("Text encoding of the slot contents")
        .default_value<std::string>("UTF-8");

    program.add_argument("--threads")
        .help("Worker threads for fetching (1 = sequential, 0 = number of "
              "CPU cores)")
        .scan<'d', std::size_t>()
        .default_value(static_cast<std::size_t>(1));

    program.add_argument("--interval")
        .help("Milliseconds between cycles")
        .scan<'d', long>()
        .default_value(60000L);

    program.add_argument("--cycles")
        .help("Number of cycles to run (0 = until stopped)")
        .scan<'d', std::size_t>()
        .default_value(static_cast<std::size_t>(1));

    program.add_argument("-o", "--output")
        .help("Output file for ingested lines (default: stdout)")
        .default_value<std::string>("");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        SLOTINGEST_LOG_ERROR("Error occurred: %s", err.what());
        std::cerr << program << std::endl;
        return 1;
    }

    std::string directory = program.get<std::string>("--directory");
    std::string name = program.get<std::string>("--name");
    std::string checkpoint_dir = program.get<std::string>("--checkpoint-dir");
    std::string output_path = program.get<std::string>("--output");
    std::size_t max_cycles = program.get<std::size_t>("--cycles");
    long interval_ms = program.get<long>("--interval");
    auto excluded = program.get<std::vector<std::string>>("--exclude");

    if (interval_ms < 0) {
        SLOTINGEST_LOG_ERROR("%s", "--interval must not be negative");
        return 1;
    }

    auto config = PipelineConfig()
                      .with_name(name)
                      .with_max_retries(program.get<std::size_t>("--max-retries"))
                      .with_charset(program.get<std::string>("--charset"))
                      .with_executor_threads(program.get<std::size_t>("--threads"))
                      .with_connector_parameter("directory", directory)
                      .with_connector_parameter(
                          "recursive",
                          program.get<bool>("--recursive") ? "true" : "false")
                      .with_connector_parameter(
                          "timestamp", program.get<std::string>("--timestamp"));

    std::ofstream output_file;
    if (!output_path.empty()) {
        output_file.open(output_path, std::ios::out | std::ios::app);
        if (!output_file) {
            SLOTINGEST_LOG_ERROR("Cannot open output file: %s",
                                 output_path.c_str());
            return 1;
        }
    }
    std::ostream& out = output_path.empty() ? std::cout : output_file;

    std::unique_ptr<IncrementalSlotPipeline> pipeline;
    try {
        RangeCursor initial(parse_timestamp(program.get<std::string>("--start")),
                            excluded);
        pipeline = std::make_unique<IncrementalSlotPipeline>(
            std::make_shared<
                components::connectors::LocalDirectoryConnectorFactory>(),
            config, std::make_shared<FileCheckpointStore>(checkpoint_dir),
            initial);
    } catch (const std::exception& e) {
        SLOTINGEST_LOG_ERROR("Cannot start pipeline: %s", e.what());
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Forwards signals to the pipeline while a cycle is running
    std::atomic<bool> finished{false};
    std::thread stop_watcher([&]() {
        while (!finished.load()) {
            if (g_signalled.load() && !pipeline->stop_requested()) {
                pipeline->request_stop();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    auto sink = [&out](const FetchResult& result) {
        for (const auto& line : result.lines) {
            out << line << '\n';
        }
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed writing lines of " +
                                     result.slot.identifier);
        }
    };

    int exit_code = 0;
    std::size_t cycle = 0;
    while (max_cycles == 0 || cycle < max_cycles) {
        if (g_signalled.load()) {
            break;
        }
        if (cycle > 0) {
            wait_for(std::chrono::milliseconds(interval_ms));
            if (g_signalled.load()) {
                break;
            }
        }
        ++cycle;

        try {
            auto slots = pipeline->run_cycle_or_throw(sink);
            SLOTINGEST_LOG_DEBUG("Cycle %zu consumed %zu slot(s)", cycle,
                                 slots.size());
        } catch (const CycleAborted& e) {
            if (e.kind() == ErrorKind::CANCELLED) {
                SLOTINGEST_LOG_INFO("%s", "Stopped before the cycle committed");
            } else {
                exit_code = 2;
            }
            break;
        }
    }

    finished = true;
    stop_watcher.join();

    auto stats = pipeline->stats();
    SLOTINGEST_LOG_INFO(
        "Pipeline '%s' finished: %zu cycle(s) committed, %zu aborted, %zu "
        "slot(s), %zu record(s), %zu byte(s); cursor %s",
        name.c_str(), stats.cycles_completed, stats.cycles_aborted,
        stats.slots_processed, stats.records_read, stats.bytes_read,
        pipeline->cursor().to_string().c_str());

    return exit_code;
}
