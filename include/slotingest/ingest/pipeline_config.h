#ifndef SLOTINGEST_INGEST_PIPELINE_CONFIG_H
#define SLOTINGEST_INGEST_PIPELINE_CONFIG_H

#include <slotingest/components/text/charset.h>
#include <slotingest/ingest/connector.h>

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace slotingest::ingest {

/**
 * Configuration for an IncrementalSlotPipeline
 *
 * Usage (Fluent API):
 *   auto config = PipelineConfig()
 *       .with_name("daily-logs")
 *       .with_max_retries(3)
 *       .with_charset("ISO-8859-1")
 *       .with_executor_threads(4)
 *       .with_connector_parameter("directory", "/data/in");
 */
struct PipelineConfig {
    std::string name = "default";  // Pipeline id, also the checkpoint key
    std::size_t max_retries = 3;   // Retries after the first attempt
    std::string charset = "UTF-8";
    std::chrono::milliseconds retry_delay{0};
    bool exponential_backoff = false;
    std::size_t executor_threads = 1;  // 1 = fetch slots inline
    ConnectorParameters connector_parameters;

    PipelineConfig& with_name(std::string pipeline_name) {
        name = std::move(pipeline_name);
        return *this;
    }

    PipelineConfig& with_max_retries(std::size_t retries) {
        max_retries = retries;
        return *this;
    }

    PipelineConfig& with_charset(std::string charset_name) {
        charset = std::move(charset_name);
        return *this;
    }

    /**
     * Delay before each retry, doubled per attempt when backoff is enabled
     */
    PipelineConfig& with_retry_delay(std::chrono::milliseconds delay,
                                     bool backoff = false) {
        retry_delay = delay;
        exponential_backoff = backoff;
        return *this;
    }

    PipelineConfig& with_executor_threads(std::size_t threads) {
        executor_threads = threads;
        return *this;
    }

    PipelineConfig& with_connector_parameters(ConnectorParameters params) {
        connector_parameters = std::move(params);
        return *this;
    }

    PipelineConfig& with_connector_parameter(const std::string& key,
                                             std::string value) {
        connector_parameters[key] = std::move(value);
        return *this;
    }

    /**
     * Reject settings the pipeline cannot run with
     *
     * @throws std::invalid_argument
     */
    void validate() const {
        if (name.empty()) {
            throw std::invalid_argument("Pipeline name must not be empty");
        }
        if (!components::text::is_supported_charset(charset)) {
            throw std::invalid_argument("Unsupported charset: " + charset);
        }
        if (retry_delay.count() < 0) {
            throw std::invalid_argument("Retry delay must not be negative");
        }
    }

    /**
     * Fetch slots one after another on the calling thread
     */
    static PipelineConfig sequential() {
        return PipelineConfig().with_executor_threads(1);
    }

    /**
     * Fetch slots on a worker pool (0 = hardware_concurrency)
     */
    static PipelineConfig parallel(std::size_t num_threads = 0) {
        return PipelineConfig().with_executor_threads(num_threads);
    }
};

}  // namespace slotingest::ingest

#endif  // SLOTINGEST_INGEST_PIPELINE_CONFIG_H
