#pragma once

#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <chrono>

namespace clinscribe {
namespace core {

/**
 * How fused text is voted out of the candidate texts
 */
enum class VotingStrategy {
    POSITIONAL,  // vote per token index
    ALIGNED      // align every candidate to the heaviest one first
};

std::string votingStrategyToString(VotingStrategy strategy);
bool parseVotingStrategy(const std::string& name, VotingStrategy& out);

struct FusionConfig {
    float specializationBoost = 1.2f;
    float domainTermBonus = 0.05f;
    float maxWeight = 1.0f;
    VotingStrategy votingStrategy = VotingStrategy::POSITIONAL;
    int providerTimeoutMs = 5000;
    int workerThreads = 4;
};

struct ExtractionConfig {
    int windowTokens = 10;
    std::string vocabularyPath;
    bool applyRiskRules = true;
};

struct DeduplicationConfig {
    bool enabled = true;
    float similarityThreshold = 0.85f;
    std::string embeddingsPath;
};

struct NoteConfig {
    std::string defaultNoteType = "SOAP";
    std::string placeholder = "Not assessed.";
    int minSentenceChars = 15;
    int maxHpiSentences = 6;
};

struct LoggingConfig {
    std::string level = "INFO";
};

/**
 * Engine-wide configuration
 */
struct EngineConfig {
    FusionConfig fusion;
    ExtractionConfig extraction;
    DeduplicationConfig deduplication;
    NoteConfig notes;
    LoggingConfig logging;
};

struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    void merge(const ConfigValidationResult& other);

    bool hasErrors() const { return !errors.empty(); }
    bool hasWarnings() const { return !warnings.empty(); }
};

struct ConfigChangeNotification {
    std::string section;
    std::string key;
    std::string oldValue;
    std::string newValue;
    std::chrono::steady_clock::time_point timestamp;

    ConfigChangeNotification(const std::string& sec, const std::string& k,
                             const std::string& oldVal, const std::string& newVal)
        : section(sec), key(k), oldValue(oldVal), newValue(newVal)
        , timestamp(std::chrono::steady_clock::now()) {}
};

/**
 * Loads, validates and updates EngineConfig. The JSON layout mirrors the
 * struct: one object per section ("fusion", "extraction", "deduplication",
 * "notes", "logging") with camelCase keys.
 */
class EngineConfigManager {
public:
    using ConfigChangeCallback = std::function<void(const ConfigChangeNotification&)>;

    EngineConfigManager();
    ~EngineConfigManager() = default;

    /**
     * Load configuration from file. A missing or empty file keeps the
     * defaults and succeeds; malformed or invalid content fails.
     * @return true if loaded successfully
     */
    bool loadFromFile(const std::string& configPath);

    bool saveToFile(const std::string& configPath) const;

    /**
     * @return true if parsed and valid; the current config is unchanged otherwise
     */
    bool loadFromJson(const std::string& jsonStr);

    std::string exportToJson() const;

    EngineConfig getConfig() const;

    ConfigValidationResult updateConfig(const EngineConfig& newConfig);

    /**
     * Update one value, e.g. ("fusion", "providerTimeoutMs", "2500").
     * The change is rolled back if the result fails validation.
     */
    ConfigValidationResult updateConfigValue(const std::string& section,
                                             const std::string& key,
                                             const std::string& value);

    ConfigValidationResult validateConfig(const EngineConfig& config) const;

    void resetToDefaults();

    void registerChangeCallback(ConfigChangeCallback callback);

    bool isModified() const;
    std::string getConfigFilePath() const;

private:
    void notifyConfigChange(const std::string& section, const std::string& key,
                            const std::string& oldValue, const std::string& newValue);

    bool parseJsonConfig(const std::string& jsonStr, EngineConfig& config) const;
    std::string configToJson(const EngineConfig& config) const;

    bool applyValue(EngineConfig& config, const std::string& section, const std::string& key,
                    const std::string& value, std::string& oldValue) const;

    ConfigValidationResult validateFusionConfig(const EngineConfig& config) const;
    ConfigValidationResult validateExtractionConfig(const EngineConfig& config) const;
    ConfigValidationResult validateDeduplicationConfig(const EngineConfig& config) const;
    ConfigValidationResult validateNoteConfig(const EngineConfig& config) const;
    ConfigValidationResult validateLoggingConfig(const EngineConfig& config) const;

    static bool updateBoolValue(const std::string& value, bool& target);
    static bool updateIntValue(const std::string& value, int& target);
    static bool updateFloatValue(const std::string& value, float& target);

    EngineConfig config_;
    std::string configFilePath_;
    bool isModified_;
    std::vector<ConfigChangeCallback> changeCallbacks_;

    mutable std::mutex configMutex_;
};

} // namespace core
} // namespace clinscribe
