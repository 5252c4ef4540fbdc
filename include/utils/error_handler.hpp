#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <map>
#include <mutex>
#include <vector>

namespace clinscribe {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories, one per pipeline stage
 */
enum class ErrorCategory {
    INPUT,
    PROVIDER,
    FUSION,
    EXTRACTION,
    DEDUPLICATION,
    NOTE_ASSEMBLY,
    VOCABULARY,
    CONFIGURATION,
    SYSTEM,
    UNKNOWN
};

std::string severityToString(ErrorSeverity severity);
std::string categoryToString(ErrorCategory category);

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string encounter_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& eid = "");
};

/**
 * Base of every exception thrown by the library
 */
class ClinScribeException : public std::exception {
public:
    explicit ClinScribeException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    std::string what_message_;
};

/**
 * No transcript text or no candidates. Fatal for the request.
 */
class EmptyInputException : public ClinScribeException {
public:
    EmptyInputException(const std::string& message, const std::string& encounter_id = "");
};

/**
 * A single provider missed its deadline. Recorded, never surfaced on its own.
 */
class ProviderTimeoutException : public ClinScribeException {
public:
    ProviderTimeoutException(const std::string& provider_name, long timeout_ms);
    const std::string& getProviderName() const { return provider_name_; }

private:
    std::string provider_name_;
};

/**
 * Every provider timed out or failed for a window.
 */
class AllProvidersFailedException : public ClinScribeException {
public:
    AllProvidersFailedException(const std::string& window_id, size_t provider_count);
};

/**
 * Word vectors could not be loaded or queried. Deduplication is skipped.
 */
class EmbeddingUnavailableException : public ClinScribeException {
public:
    explicit EmbeddingUnavailableException(const std::string& message, const std::string& source = "");
};

class VocabularyLoadException : public ClinScribeException {
public:
    VocabularyLoadException(const std::string& message, const std::string& path = "");
};

class ConfigurationException : public ClinScribeException {
public:
    ConfigurationException(const std::string& message, const std::string& details = "");
};

/**
 * Warning record for a required note section that had to be filled with a
 * placeholder. Never thrown.
 */
ErrorInfo makeMissingRequiredSectionWarning(const std::string& note_type,
                                            const std::string& section_key,
                                            const std::string& encounter_id = "");

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Collects errors reported by one pipeline instance. Owned by the caller and
 * passed by reference to the components that report into it.
 */
class ErrorHandler {
public:
    explicit ErrorHandler(size_t max_history_size = 1000);
    ~ErrorHandler() = default;

    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& encounter_id = "");

    void setErrorCallback(ErrorCallback callback);

    // UNKNOWN counts every recorded error
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    size_t getErrorCount(ErrorSeverity severity) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

private:
    void logError(const ErrorInfo& error) const;

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_;

    mutable std::mutex mutex_;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& encounter_id = "");
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string getCurrentContext();
    static std::string getCurrentEncounterId();

private:
    std::string previous_context_;
    std::string previous_encounter_id_;

    static thread_local std::string current_context_;
    static thread_local std::string current_encounter_id_;
};

} // namespace utils
} // namespace clinscribe
