#ifndef SLOTINGEST_CORE_COMMON_ERRORS_H
#define SLOTINGEST_CORE_COMMON_ERRORS_H

#include <stdexcept>
#include <string>

namespace slotingest {

/**
 * @brief Classification of ingestion failures.
 */
enum class ErrorKind {
    LIST_FAILURE,       // Connector could not list slots
    FETCH_FAILURE,      // Connector could not fetch a slot
    DECODE_FAILURE,     // Fetched content is not a valid stream
    PERMANENT_FAILURE,  // A slot could not be processed; aborts the cycle
    CANCELLED           // Stop was requested while the cycle was running
};

const char* to_string(ErrorKind kind);

/**
 * @brief Base exception for every ingestion error.
 */
class IngestError : public std::runtime_error {
   private:
    ErrorKind kind_;

   public:
    IngestError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
};

/**
 * @brief Transient listing error raised by a connector. Retryable.
 */
class ListFailure : public IngestError {
   public:
    explicit ListFailure(const std::string& message)
        : IngestError(ErrorKind::LIST_FAILURE, message) {}
};

/**
 * @brief Transient fetch error raised by a connector. Retryable.
 */
class FetchFailure : public IngestError {
   public:
    explicit FetchFailure(const std::string& message)
        : IngestError(ErrorKind::FETCH_FAILURE, message) {}
};

/**
 * @brief Malformed content found while decoding. Never retried.
 */
class DecodeFailure : public IngestError {
   public:
    explicit DecodeFailure(const std::string& message)
        : IngestError(ErrorKind::DECODE_FAILURE, message) {}
};

}  // namespace slotingest

#endif  // SLOTINGEST_CORE_COMMON_ERRORS_H
