#pragma once

#include <stdexcept>
#include <string>

namespace regmetrics {

/**
 * Error taxonomy for conversion and history runs.
 *
 * Per-file and per-unit failures are reported as values inside run summaries
 * (see FileError / UnitResult); the exception types below are thrown only
 * where a failure must cross a function boundary.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    CONFIG_INVALID = 2,

    // Markup
    PARSE_ERROR = 100,
    STRUCTURAL_ANOMALY = 101,
    UNRECOGNIZED_FILENAME = 102,

    // Version history
    MISSING_VERSION = 200,
    MALFORMED_VERSION = 201,

    // Store
    STORE_WRITE_FAILED = 300,
    STORE_READ_FAILED = 301,
    INDEX_INCONSISTENCY = 302,

    // Persistence
    CONNECTION_FAILED = 400,
    QUERY_FAILED = 401,

    INTERNAL_ERROR = 500
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:               return "success";
        case ErrorCode::INVALID_ARGUMENT:      return "invalid_argument";
        case ErrorCode::CONFIG_INVALID:        return "config_invalid";
        case ErrorCode::PARSE_ERROR:           return "parse_error";
        case ErrorCode::STRUCTURAL_ANOMALY:    return "structural_anomaly";
        case ErrorCode::UNRECOGNIZED_FILENAME: return "unrecognized_filename";
        case ErrorCode::MISSING_VERSION:       return "missing_version";
        case ErrorCode::MALFORMED_VERSION:     return "malformed_version";
        case ErrorCode::STORE_WRITE_FAILED:    return "store_write_failed";
        case ErrorCode::STORE_READ_FAILED:     return "store_read_failed";
        case ErrorCode::INDEX_INCONSISTENCY:   return "index_inconsistency";
        case ErrorCode::CONNECTION_FAILED:     return "connection_failed";
        case ErrorCode::QUERY_FAILED:          return "query_failed";
        case ErrorCode::INTERNAL_ERROR:        return "internal_error";
    }
    return "unknown";
}

class RegMetricsException : public std::runtime_error {
public:
    explicit RegMetricsException(ErrorCode code, const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = std::string(error_code_name(code)) + ": " + message;
        if (!context.empty()) {
            result += " (" + context + ")";
        }
        if (!suggestion.empty()) {
            result += "; " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public RegMetricsException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "")
        : RegMetricsException(ErrorCode::INVALID_ARGUMENT, message, context) {}
};

class ConfigError : public RegMetricsException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& suggestion = "")
        : RegMetricsException(ErrorCode::CONFIG_INVALID, message, "", suggestion) {}
};

// Malformed markup in one file. Caught at the file boundary by the parser.
class ParseError : public RegMetricsException {
public:
    explicit ParseError(const std::string& message, const std::string& file = "")
        : RegMetricsException(ErrorCode::PARSE_ERROR, message, file) {}
};

class StoreError : public RegMetricsException {
public:
    StoreError(ErrorCode code, const std::string& message, const std::string& path = "")
        : RegMetricsException(code, message, path) {}
};

// A key claimed by the index has no fully written TitleFile behind it.
// Never recovered: the conversion run is aborted.
class IndexInconsistencyError : public RegMetricsException {
public:
    explicit IndexInconsistencyError(const std::string& message, const std::string& key = "")
        : RegMetricsException(ErrorCode::INDEX_INCONSISTENCY, message, key,
                              "TitleFiles must be fully written before their keys are indexed") {}
};

class DatabaseError : public RegMetricsException {
public:
    explicit DatabaseError(const std::string& message,
                           const std::string& context = "",
                           ErrorCode code = ErrorCode::QUERY_FAILED)
        : RegMetricsException(code, message, context) {}
};

#define REGMETRICS_CHECK(condition, code, message) \
    do { if (!(condition)) throw regmetrics::RegMetricsException(code, message, __func__); } while (0)

#define REGMETRICS_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw regmetrics::InvalidArgumentError(message, __func__); } while (0)

#define REGMETRICS_THROW(code, message) \
    throw regmetrics::RegMetricsException(code, message, __func__)

} // namespace regmetrics
