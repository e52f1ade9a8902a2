#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace knowmap {

/**
 * Structured error reporting for the flattening engine.
 * Every failure carries a code, a message, the function it came from and,
 * where one exists, a suggestion for the caller.
 */

enum class ErrorCode {
    SUCCESS = 0,

    // Caller errors
    INVALID_PARAMETER = 1,
    DEGENERATE_INPUT = 2,

    // Numerical errors
    NUMERICAL_ERROR = 200,

    // I/O errors
    IO_ERROR = 300,

    // Internal errors
    INTERNAL_ERROR = 500
};

class KnowmapException : public std::runtime_error {
public:
    explicit KnowmapException(ErrorCode code, const std::string& message,
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
        std::string result = "knowmap error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

/**
 * A parameter or input array violated its documented constraint.
 * field() names the offending parameter, constraint() states the rule.
 */
class InvalidParameterError : public KnowmapException {
public:
    InvalidParameterError(const std::string& field, const std::string& constraint,
                          const std::string& context = "")
        : KnowmapException(ErrorCode::INVALID_PARAMETER,
                           "invalid parameter '" + field + "': must satisfy " + constraint,
                           context)
        , field_(field)
        , constraint_(constraint) {}

    const std::string& field() const noexcept { return field_; }
    const std::string& constraint() const noexcept { return constraint_; }

private:
    std::string field_;
    std::string constraint_;
};

/**
 * Clustering cannot produce the requested number of non-empty clusters.
 */
class DegenerateInputError : public KnowmapException {
public:
    DegenerateInputError(const std::string& message, size_t distinct_points, size_t requested_clusters,
                         const std::string& context = "")
        : KnowmapException(ErrorCode::DEGENERATE_INPUT, message, context,
                           "reduce cluster_count to at most " + std::to_string(distinct_points) +
                           " or deduplicate the primary points")
        , distinct_points_(distinct_points)
        , requested_clusters_(requested_clusters) {}

    size_t distinct_points() const noexcept { return distinct_points_; }
    size_t requested_clusters() const noexcept { return requested_clusters_; }

private:
    size_t distinct_points_;
    size_t requested_clusters_;
};

class NumericalError : public KnowmapException {
public:
    explicit NumericalError(const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "")
        : KnowmapException(ErrorCode::NUMERICAL_ERROR, message, context, suggestion) {}
};

class IOError : public KnowmapException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : KnowmapException(ErrorCode::IO_ERROR, message, context, suggestion) {}
};

// Macros for common error checking
#define KNOWMAP_CHECK_PARAM(condition, field, constraint) \
    do { if (!(condition)) throw knowmap::InvalidParameterError(field, constraint, __func__); } while (0)

#define KNOWMAP_THROW(code, message) \
    throw knowmap::KnowmapException(code, message, __func__)

} // namespace knowmap
