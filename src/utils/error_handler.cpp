#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <random>
#include <sstream>

namespace clinscribe {
namespace utils {

thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_encounter_id_;

std::string severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INPUT: return "Input";
        case ErrorCategory::PROVIDER: return "Provider";
        case ErrorCategory::FUSION: return "Fusion";
        case ErrorCategory::EXTRACTION: return "Extraction";
        case ErrorCategory::DEDUPLICATION: return "Deduplication";
        case ErrorCategory::NOTE_ASSEMBLY: return "NoteAssembly";
        case ErrorCategory::VOCABULARY: return "Vocabulary";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& eid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), encounter_id(eid) {

    // Generators are per thread; provider tasks build ErrorInfo concurrently
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

ClinScribeException::ClinScribeException(const ErrorInfo& error_info)
    : error_info_(error_info) {
    what_message_ = error_info_.message;
    if (!error_info_.details.empty()) {
        what_message_ += ": " + error_info_.details;
    }
}

const char* ClinScribeException::what() const noexcept {
    return what_message_.c_str();
}

EmptyInputException::EmptyInputException(const std::string& message, const std::string& encounter_id)
    : ClinScribeException(ErrorInfo(ErrorCategory::INPUT, ErrorSeverity::ERROR,
                                     message, "", "NoteGeneration", encounter_id)) {
}

ProviderTimeoutException::ProviderTimeoutException(const std::string& provider_name, long timeout_ms)
    : ClinScribeException(ErrorInfo(ErrorCategory::PROVIDER, ErrorSeverity::WARNING,
                                     "Provider timed out",
                                     provider_name + " exceeded " + std::to_string(timeout_ms) + " ms",
                                     "CandidateGatherer")),
      provider_name_(provider_name) {
}

AllProvidersFailedException::AllProvidersFailedException(const std::string& window_id, size_t provider_count)
    : ClinScribeException(ErrorInfo(ErrorCategory::PROVIDER, ErrorSeverity::ERROR,
                                     "All transcription providers failed",
                                     "window " + window_id + ", " + std::to_string(provider_count) + " providers",
                                     "CandidateGatherer")) {
}

EmbeddingUnavailableException::EmbeddingUnavailableException(const std::string& message, const std::string& source)
    : ClinScribeException(ErrorInfo(ErrorCategory::DEDUPLICATION, ErrorSeverity::WARNING,
                                     message, source, "Embedding")) {
}

VocabularyLoadException::VocabularyLoadException(const std::string& message, const std::string& path)
    : ClinScribeException(ErrorInfo(ErrorCategory::VOCABULARY, ErrorSeverity::CRITICAL,
                                     message, path, "VocabularyStore")) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& details)
    : ClinScribeException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                     message, details, "EngineConfig")) {
}

ErrorInfo makeMissingRequiredSectionWarning(const std::string& note_type,
                                            const std::string& section_key,
                                            const std::string& encounter_id) {
    return ErrorInfo(ErrorCategory::NOTE_ASSEMBLY, ErrorSeverity::WARNING,
                     "Missing required section", note_type + "." + section_key,
                     "Validating", encounter_id);
}

ErrorHandler::ErrorHandler(size_t max_history_size)
    : max_history_size_(max_history_size == 0 ? 1 : max_history_size) {
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        callback = error_callback_;
    }

    // Invoked outside the lock so a callback may query the handler
    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& encounter_id) {
    if (const auto* known = dynamic_cast<const ClinScribeException*>(&e)) {
        ErrorInfo error = known->getErrorInfo();
        if (!context.empty()) {
            error.context = context;
        }
        if (!encounter_id.empty()) {
            error.encounter_id = encounter_id;
        }
        reportError(error);
        return;
    }

    reportError(ErrorInfo(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context, encounter_id));
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }

    return std::count_if(error_history_.begin(), error_history_.end(),
                         [category](const ErrorInfo& error) {
                             return error.category == category;
                         });
}

size_t ErrorHandler::getErrorCount(ErrorSeverity severity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(error_history_.begin(), error_history_.end(),
                         [severity](const ErrorInfo& error) {
                             return error.severity == severity;
                         });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::logError(const ErrorInfo& error) const {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryToString(error.category) << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }
    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }
    if (!error.encounter_id.empty()) {
        log_message << " | Encounter: " << error.encounter_id;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

ErrorContext::ErrorContext(const std::string& context, const std::string& encounter_id)
    : previous_context_(current_context_), previous_encounter_id_(current_encounter_id_) {
    current_context_ = context;
    if (!encounter_id.empty()) {
        current_encounter_id_ = encounter_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_encounter_id_ = previous_encounter_id_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentEncounterId() {
    return current_encounter_id_;
}

} // namespace utils
} // namespace clinscribe
