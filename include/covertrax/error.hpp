#pragma once

#include <stdexcept>
#include <string>

namespace covertrax {

    /**
     * @brief Stable failure kinds surfaced to callers of the analysis pipeline
     */
    enum class ErrorKind {
        Validation,      ///< Malformed or out-of-range input, never retried
        DataUnavailable, ///< No qualifying imagery for the AOI and date window
        Timeout,         ///< Deadline exceeded or the caller cancelled the run
        Internal,        ///< A stage broke one of its output invariants
    };

    /**
     * @brief Machine-readable name for an error kind (used by the service layer)
     */
    inline const char *error_kind_name(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::Validation:
            return "validation_error";
        case ErrorKind::DataUnavailable:
            return "data_unavailable";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::Internal:
            return "internal_error";
        }
        return "internal_error";
    }

    /**
     * @brief Base of every failure thrown by covertrax stages
     *
     * Carries one ErrorKind plus the human-readable reason in what().
     */
    class AnalysisError : public std::runtime_error {
      public:
        AnalysisError(ErrorKind kind, const std::string &reason) : std::runtime_error(reason), kind_(kind) {}

        ErrorKind kind() const noexcept { return kind_; }

      private:
        ErrorKind kind_;
    };

    class ValidationError : public AnalysisError {
      public:
        explicit ValidationError(const std::string &reason) : AnalysisError(ErrorKind::Validation, reason) {}
    };

    class DataUnavailableError : public AnalysisError {
      public:
        explicit DataUnavailableError(const std::string &reason)
            : AnalysisError(ErrorKind::DataUnavailable, reason) {}
    };

    class TimeoutError : public AnalysisError {
      public:
        explicit TimeoutError(const std::string &reason) : AnalysisError(ErrorKind::Timeout, reason) {}
    };

    class InternalError : public AnalysisError {
      public:
        explicit InternalError(const std::string &reason) : AnalysisError(ErrorKind::Internal, reason) {}
    };

} // namespace covertrax
