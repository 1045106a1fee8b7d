#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace gpcopy {

/**
 * @brief Error categories for the loader
 */
enum class ErrorCategory {
    NONE,
    MALFORMED_IDENTIFIER,
    INVALID_OPTIONS,
    ENCODING_ERROR,
    CONNECTION_ERROR,
    STAGING_CREATION_ERROR,
    PARTITION_UPLOAD_ERROR,
    TRANSFER_TIMEOUT,
    PARTITION_COPY_FAILURE,
    COMMIT_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::MALFORMED_IDENTIFIER: return "MALFORMED_IDENTIFIER";
        case ErrorCategory::INVALID_OPTIONS: return "INVALID_OPTIONS";
        case ErrorCategory::ENCODING_ERROR: return "ENCODING_ERROR";
        case ErrorCategory::CONNECTION_ERROR: return "CONNECTION_ERROR";
        case ErrorCategory::STAGING_CREATION_ERROR: return "STAGING_CREATION_ERROR";
        case ErrorCategory::PARTITION_UPLOAD_ERROR: return "PARTITION_UPLOAD_ERROR";
        case ErrorCategory::TRANSFER_TIMEOUT: return "TRANSFER_TIMEOUT";
        case ErrorCategory::PARTITION_COPY_FAILURE: return "PARTITION_COPY_FAILURE";
        case ErrorCategory::COMMIT_ERROR: return "COMMIT_ERROR";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Exceptions raised by the copy layer
// ============================================================================

/**
 * @brief Base of every error raised by the loader
 */
class CopyError : public std::runtime_error {
public:
    CopyError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/// Table name is neither `name` nor `schema.name`. Raised before any I/O.
class MalformedIdentifierError : public CopyError {
public:
    explicit MalformedIdentifierError(const std::string& message)
        : CopyError(ErrorCategory::MALFORMED_IDENTIFIER, message) {}
};

class InvalidOptionsError : public CopyError {
public:
    explicit InvalidOptionsError(const std::string& message)
        : CopyError(ErrorCategory::INVALID_OPTIONS, message) {}
};

/// A row value does not match the kind declared for its column.
class RowEncodingError : public CopyError {
public:
    explicit RowEncodingError(const std::string& message)
        : CopyError(ErrorCategory::ENCODING_ERROR, message) {}
};

class ConnectionError : public CopyError {
public:
    explicit ConnectionError(const std::string& message)
        : CopyError(ErrorCategory::CONNECTION_ERROR, message) {}
};

/// Stage 1 failed. Fatal for the whole job, never retried.
class StagingCreationError : public CopyError {
public:
    explicit StagingCreationError(const std::string& message)
        : CopyError(ErrorCategory::STAGING_CREATION_ERROR, message) {}
};

class PartitionUploadError : public CopyError {
public:
    explicit PartitionUploadError(const std::string& message)
        : CopyError(ErrorCategory::PARTITION_UPLOAD_ERROR, message) {}
};

/**
 * @brief COPY transfer of one partition exceeded the configured deadline
 */
class TransferTimeoutError : public CopyError {
public:
    TransferTimeoutError(const std::string& message, std::chrono::milliseconds timeout)
        : CopyError(ErrorCategory::TRANSFER_TIMEOUT, message), timeout_(timeout) {}

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Job aborted: fewer partitions succeeded than were dispatched
 *
 * The target table is guaranteed to be unchanged when this is raised
 * by a transactional copy.
 */
class PartitionCopyFailureError : public CopyError {
public:
    PartitionCopyFailureError(const std::string& message,
                              uint64_t total_partitions,
                              uint64_t successful_partitions)
        : CopyError(ErrorCategory::PARTITION_COPY_FAILURE, message),
          total_partitions_(total_partitions),
          successful_partitions_(successful_partitions) {}

    [[nodiscard]] uint64_t total_partitions() const noexcept { return total_partitions_; }
    [[nodiscard]] uint64_t successful_partitions() const noexcept { return successful_partitions_; }

private:
    uint64_t total_partitions_;
    uint64_t successful_partitions_;
};

class CommitError : public CopyError {
public:
    explicit CommitError(const std::string& message)
        : CopyError(ErrorCategory::COMMIT_ERROR, message) {}
};

} // namespace gpcopy
