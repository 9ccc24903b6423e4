/**
 * @file exception.hpp
 * @brief Exception hierarchy for the command orchestration core
 *
 * Only caller and configuration errors are thrown. Process failures are
 * reported as ProcessResult values (see types.hpp) so that every execution
 * resolves through a single result path.
 *
 * @date 2025-03-02
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2025 Max Qian
 */

#ifndef DEVFLOW_CORE_EXCEPTION_HPP
#define DEVFLOW_CORE_EXCEPTION_HPP

#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace devflow {

/**
 * @enum ErrorSeverity
 * @brief Severity levels attached to thrown errors
 */
enum class ErrorSeverity {
    Warning,   ///< Operation can continue
    Error,     ///< Operation failed
    Critical   ///< Component is unusable
};

/**
 * @class DevflowException
 * @brief Base class for all devflow exceptions.
 */
class DevflowException : public std::exception {
public:
    /**
     * @brief Constructor for DevflowException.
     * @param message The error message.
     * @param severity The error severity.
     */
    explicit DevflowException(std::string message,
                              ErrorSeverity severity = ErrorSeverity::Error)
        : msg_(std::move(message)),
          severity_(severity),
          timestamp_(std::chrono::system_clock::now()) {}

    const char* what() const noexcept override { return msg_.c_str(); }

    ErrorSeverity getSeverity() const noexcept { return severity_; }

    std::chrono::system_clock::time_point getTimestamp() const noexcept {
        return timestamp_;
    }

    std::string severityToString() const noexcept {
        switch (severity_) {
            case ErrorSeverity::Warning: return "WARNING";
            case ErrorSeverity::Error: return "ERROR";
            case ErrorSeverity::Critical: return "CRITICAL";
        }
        return "UNKNOWN";
    }

protected:
    std::string msg_;                                  ///< The error message
    ErrorSeverity severity_;                           ///< The error severity
    std::chrono::system_clock::time_point timestamp_;  ///< When the error occurred
};

/**
 * @class ValidationError
 * @brief Thrown when a command is rejected before any process is spawned,
 * e.g. a missing project or program.
 */
class ValidationError : public DevflowException {
public:
    /**
     * @param message The error message.
     * @param field Name of the offending field.
     */
    ValidationError(const std::string& message, std::string field)
        : DevflowException(message), field_(std::move(field)) {}

    const std::string& getField() const noexcept { return field_; }

private:
    std::string field_;  ///< Name of the invalid field
};

/**
 * @class ConfigError
 * @brief Thrown when a configuration file cannot be read or parsed.
 */
class ConfigError : public DevflowException {
public:
    using DevflowException::DevflowException;
};

/**
 * @class BatchError
 * @brief Raised by output stores when a single file operation fails.
 *
 * The batch coordinator catches it per file; it never escapes executeBatch.
 */
class BatchError : public DevflowException {
public:
    using DevflowException::DevflowException;
};

}  // namespace devflow

#define THROW_VALIDATION_ERROR(field, message) \
    throw devflow::ValidationError((message), (field))

#define THROW_CONFIG_ERROR(message) throw devflow::ConfigError((message))

#define THROW_BATCH_ERROR(message) throw devflow::BatchError((message))

#endif  // DEVFLOW_CORE_EXCEPTION_HPP
