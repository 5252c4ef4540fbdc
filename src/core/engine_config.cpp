#include "core/engine_config.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace clinscribe {
namespace core {

namespace {

const std::vector<std::string> kNoteTypeNames = {
    "SOAP", "ED_NOTE", "PROGRESS", "CONSULT", "HANDOFF", "DISCHARGE"
};

const std::vector<std::string> kLogLevelNames = {
    "DEBUG", "INFO", "WARN", "WARNING", "ERROR"
};

std::string upper(const std::string& value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string boolString(bool value) {
    return value ? "true" : "false";
}

// Out-of-range numbers are clamped before the narrowing cast so the
// validators see them as out-of-range values
void readFloat(const utils::JsonValue& section, const std::string& key, float& target) {
    const double limit = static_cast<double>(std::numeric_limits<float>::max());
    target = static_cast<float>(std::clamp(section.getNumber(key, target), -limit, limit));
}

void readInt(const utils::JsonValue& section, const std::string& key, int& target) {
    double value = std::clamp(section.getNumber(key, target),
                              static_cast<double>(std::numeric_limits<int>::min()),
                              static_cast<double>(std::numeric_limits<int>::max()));
    target = static_cast<int>(value);
}

} // namespace

std::string votingStrategyToString(VotingStrategy strategy) {
    switch (strategy) {
        case VotingStrategy::POSITIONAL: return "positional";
        case VotingStrategy::ALIGNED: return "aligned";
    }
    return "positional";
}

bool parseVotingStrategy(const std::string& name, VotingStrategy& out) {
    std::string lowered = utils::toLower(name);
    if (lowered == "positional") {
        out = VotingStrategy::POSITIONAL;
        return true;
    }
    if (lowered == "aligned") {
        out = VotingStrategy::ALIGNED;
        return true;
    }
    return false;
}

void ConfigValidationResult::merge(const ConfigValidationResult& other) {
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    isValid = errors.empty();
}

EngineConfigManager::EngineConfigManager()
    : isModified_(false) {
}

bool EngineConfigManager::loadFromFile(const std::string& configPath) {
    std::string jsonStr;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        configFilePath_ = configPath;

        if (!std::filesystem::exists(configPath)) {
            utils::Logger::info("Configuration file not found: " + configPath + ", using defaults");
            config_ = EngineConfig();
            return true;
        }

        std::ifstream file(configPath);
        if (!file.is_open()) {
            utils::Logger::error("Failed to open configuration file: " + configPath);
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        jsonStr = buffer.str();
    }

    if (utils::isBlank(jsonStr)) {
        utils::Logger::info("Empty configuration file, using defaults");
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = EngineConfig();
        return true;
    }

    if (!loadFromJson(jsonStr)) {
        utils::Logger::error("Invalid configuration in: " + configPath);
        return false;
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    isModified_ = false;
    utils::Logger::info("Engine configuration loaded from: " + configPath);
    return true;
}

bool EngineConfigManager::saveToFile(const std::string& configPath) const {
    std::filesystem::path filePath(configPath);
    std::filesystem::path dirPath = filePath.parent_path();

    if (!dirPath.empty() && !std::filesystem::exists(dirPath)) {
        std::error_code ec;
        if (!std::filesystem::create_directories(dirPath, ec)) {
            utils::Logger::error("Failed to create configuration directory: " + dirPath.string() +
                                 " - " + ec.message());
            return false;
        }
    }

    std::ofstream file(configPath);
    if (!file.is_open()) {
        utils::Logger::error("Failed to open configuration file for writing: " + configPath);
        return false;
    }

    file << exportToJson();
    file.close();

    if (file.fail()) {
        utils::Logger::error("Failed to write configuration file: " + configPath);
        return false;
    }
    return true;
}

bool EngineConfigManager::loadFromJson(const std::string& jsonStr) {
    EngineConfig newConfig;
    if (!parseJsonConfig(jsonStr, newConfig)) {
        return false;
    }

    auto validationResult = validateConfig(newConfig);
    if (!validationResult.isValid) {
        for (const auto& error : validationResult.errors) {
            utils::Logger::error("  Config error: " + error);
        }
        return false;
    }
    for (const auto& warning : validationResult.warnings) {
        utils::Logger::warn("  Config warning: " + warning);
    }

    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = newConfig;
        isModified_ = true;
    }
    notifyConfigChange("all", "config", "", "loaded");
    return true;
}

std::string EngineConfigManager::exportToJson() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return configToJson(config_);
}

EngineConfig EngineConfigManager::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

ConfigValidationResult EngineConfigManager::updateConfig(const EngineConfig& newConfig) {
    auto validationResult = validateConfig(newConfig);
    if (!validationResult.isValid) {
        return validationResult;
    }

    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = newConfig;
        isModified_ = true;
    }
    notifyConfigChange("all", "config", "", "updated");
    return validationResult;
}

ConfigValidationResult EngineConfigManager::updateConfigValue(const std::string& section,
                                                              const std::string& key,
                                                              const std::string& value) {
    ConfigValidationResult result;
    std::string oldValue;

    {
        std::lock_guard<std::mutex> lock(configMutex_);

        EngineConfig candidate = config_;
        if (!applyValue(candidate, section, key, value, oldValue)) {
            result.addError("Unknown configuration key or bad value: " + section + "." + key + "=" + value);
            return result;
        }

        result = validateConfig(candidate);
        if (!result.isValid) {
            return result;
        }

        config_ = candidate;
        isModified_ = true;
    }

    notifyConfigChange(section, key, oldValue, value);
    return result;
}

ConfigValidationResult EngineConfigManager::validateConfig(const EngineConfig& config) const {
    ConfigValidationResult result;
    result.merge(validateFusionConfig(config));
    result.merge(validateExtractionConfig(config));
    result.merge(validateDeduplicationConfig(config));
    result.merge(validateNoteConfig(config));
    result.merge(validateLoggingConfig(config));
    return result;
}

void EngineConfigManager::resetToDefaults() {
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = EngineConfig();
        isModified_ = true;
    }
    notifyConfigChange("all", "reset", "", "defaults");
}

void EngineConfigManager::registerChangeCallback(ConfigChangeCallback callback) {
    std::lock_guard<std::mutex> lock(configMutex_);
    changeCallbacks_.push_back(std::move(callback));
}

bool EngineConfigManager::isModified() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return isModified_;
}

std::string EngineConfigManager::getConfigFilePath() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return configFilePath_;
}

void EngineConfigManager::notifyConfigChange(const std::string& section, const std::string& key,
                                             const std::string& oldValue, const std::string& newValue) {
    std::vector<ConfigChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        callbacks = changeCallbacks_;
    }

    ConfigChangeNotification notification(section, key, oldValue, newValue);
    for (const auto& callback : callbacks) {
        try {
            callback(notification);
        } catch (const std::exception& e) {
            utils::Logger::error("Error in config change callback: " + std::string(e.what()));
        }
    }
}

bool EngineConfigManager::parseJsonConfig(const std::string& jsonStr, EngineConfig& config) const {
    utils::JsonValue root;
    try {
        root = utils::JsonParser::parse(jsonStr);
    } catch (const std::exception& e) {
        utils::Logger::error("JSON parsing error: " + std::string(e.what()));
        return false;
    }

    if (!root.isObject()) {
        utils::Logger::error("Configuration root must be a JSON object");
        return false;
    }

    const auto& fusion = root.getProperty("fusion");
    if (fusion.isObject()) {
        readFloat(fusion, "specializationBoost", config.fusion.specializationBoost);
        readFloat(fusion, "domainTermBonus", config.fusion.domainTermBonus);
        readFloat(fusion, "maxWeight", config.fusion.maxWeight);
        readInt(fusion, "providerTimeoutMs", config.fusion.providerTimeoutMs);
        readInt(fusion, "workerThreads", config.fusion.workerThreads);
        if (fusion.hasProperty("votingStrategy") &&
            !parseVotingStrategy(fusion.getString("votingStrategy"), config.fusion.votingStrategy)) {
            utils::Logger::error("Unknown voting strategy: " + fusion.getString("votingStrategy"));
            return false;
        }
    }

    const auto& extraction = root.getProperty("extraction");
    if (extraction.isObject()) {
        readInt(extraction, "windowTokens", config.extraction.windowTokens);
        config.extraction.vocabularyPath = extraction.getString("vocabularyPath", config.extraction.vocabularyPath);
        config.extraction.applyRiskRules = extraction.getBool("applyRiskRules", config.extraction.applyRiskRules);
    }

    const auto& dedup = root.getProperty("deduplication");
    if (dedup.isObject()) {
        config.deduplication.enabled = dedup.getBool("enabled", config.deduplication.enabled);
        readFloat(dedup, "similarityThreshold", config.deduplication.similarityThreshold);
        config.deduplication.embeddingsPath = dedup.getString("embeddingsPath", config.deduplication.embeddingsPath);
    }

    const auto& notes = root.getProperty("notes");
    if (notes.isObject()) {
        config.notes.defaultNoteType = notes.getString("defaultNoteType", config.notes.defaultNoteType);
        config.notes.placeholder = notes.getString("placeholder", config.notes.placeholder);
        readInt(notes, "minSentenceChars", config.notes.minSentenceChars);
        readInt(notes, "maxHpiSentences", config.notes.maxHpiSentences);
    }

    const auto& logging = root.getProperty("logging");
    if (logging.isObject()) {
        config.logging.level = logging.getString("level", config.logging.level);
    }

    return true;
}

std::string EngineConfigManager::configToJson(const EngineConfig& config) const {
    using utils::JsonValue;

    JsonValue fusion = JsonValue::makeObject();
    fusion.setObjectProperty("specializationBoost", JsonValue(static_cast<double>(config.fusion.specializationBoost)));
    fusion.setObjectProperty("domainTermBonus", JsonValue(static_cast<double>(config.fusion.domainTermBonus)));
    fusion.setObjectProperty("maxWeight", JsonValue(static_cast<double>(config.fusion.maxWeight)));
    fusion.setObjectProperty("votingStrategy", JsonValue(votingStrategyToString(config.fusion.votingStrategy)));
    fusion.setObjectProperty("providerTimeoutMs", JsonValue(static_cast<double>(config.fusion.providerTimeoutMs)));
    fusion.setObjectProperty("workerThreads", JsonValue(static_cast<double>(config.fusion.workerThreads)));

    JsonValue extraction = JsonValue::makeObject();
    extraction.setObjectProperty("windowTokens", JsonValue(static_cast<double>(config.extraction.windowTokens)));
    extraction.setObjectProperty("vocabularyPath", JsonValue(config.extraction.vocabularyPath));
    extraction.setObjectProperty("applyRiskRules", JsonValue(config.extraction.applyRiskRules));

    JsonValue dedup = JsonValue::makeObject();
    dedup.setObjectProperty("enabled", JsonValue(config.deduplication.enabled));
    dedup.setObjectProperty("similarityThreshold", JsonValue(static_cast<double>(config.deduplication.similarityThreshold)));
    dedup.setObjectProperty("embeddingsPath", JsonValue(config.deduplication.embeddingsPath));

    JsonValue notes = JsonValue::makeObject();
    notes.setObjectProperty("defaultNoteType", JsonValue(config.notes.defaultNoteType));
    notes.setObjectProperty("placeholder", JsonValue(config.notes.placeholder));
    notes.setObjectProperty("minSentenceChars", JsonValue(static_cast<double>(config.notes.minSentenceChars)));
    notes.setObjectProperty("maxHpiSentences", JsonValue(static_cast<double>(config.notes.maxHpiSentences)));

    JsonValue logging = JsonValue::makeObject();
    logging.setObjectProperty("level", JsonValue(config.logging.level));

    JsonValue root = JsonValue::makeObject();
    root.setObjectProperty("fusion", fusion);
    root.setObjectProperty("extraction", extraction);
    root.setObjectProperty("deduplication", dedup);
    root.setObjectProperty("notes", notes);
    root.setObjectProperty("logging", logging);

    return utils::JsonParser::stringify(root, 2);
}

bool EngineConfigManager::applyValue(EngineConfig& config, const std::string& section, const std::string& key,
                                     const std::string& value, std::string& oldValue) const {
    if (section == "fusion") {
        if (key == "specializationBoost") {
            oldValue = std::to_string(config.fusion.specializationBoost);
            return updateFloatValue(value, config.fusion.specializationBoost);
        } else if (key == "domainTermBonus") {
            oldValue = std::to_string(config.fusion.domainTermBonus);
            return updateFloatValue(value, config.fusion.domainTermBonus);
        } else if (key == "maxWeight") {
            oldValue = std::to_string(config.fusion.maxWeight);
            return updateFloatValue(value, config.fusion.maxWeight);
        } else if (key == "votingStrategy") {
            oldValue = votingStrategyToString(config.fusion.votingStrategy);
            return parseVotingStrategy(value, config.fusion.votingStrategy);
        } else if (key == "providerTimeoutMs") {
            oldValue = std::to_string(config.fusion.providerTimeoutMs);
            return updateIntValue(value, config.fusion.providerTimeoutMs);
        } else if (key == "workerThreads") {
            oldValue = std::to_string(config.fusion.workerThreads);
            return updateIntValue(value, config.fusion.workerThreads);
        }
    } else if (section == "extraction") {
        if (key == "windowTokens") {
            oldValue = std::to_string(config.extraction.windowTokens);
            return updateIntValue(value, config.extraction.windowTokens);
        } else if (key == "vocabularyPath") {
            oldValue = config.extraction.vocabularyPath;
            config.extraction.vocabularyPath = value;
            return true;
        } else if (key == "applyRiskRules") {
            oldValue = boolString(config.extraction.applyRiskRules);
            return updateBoolValue(value, config.extraction.applyRiskRules);
        }
    } else if (section == "deduplication") {
        if (key == "enabled") {
            oldValue = boolString(config.deduplication.enabled);
            return updateBoolValue(value, config.deduplication.enabled);
        } else if (key == "similarityThreshold") {
            oldValue = std::to_string(config.deduplication.similarityThreshold);
            return updateFloatValue(value, config.deduplication.similarityThreshold);
        } else if (key == "embeddingsPath") {
            oldValue = config.deduplication.embeddingsPath;
            config.deduplication.embeddingsPath = value;
            return true;
        }
    } else if (section == "notes") {
        if (key == "defaultNoteType") {
            oldValue = config.notes.defaultNoteType;
            config.notes.defaultNoteType = value;
            return true;
        } else if (key == "placeholder") {
            oldValue = config.notes.placeholder;
            config.notes.placeholder = value;
            return true;
        } else if (key == "minSentenceChars") {
            oldValue = std::to_string(config.notes.minSentenceChars);
            return updateIntValue(value, config.notes.minSentenceChars);
        } else if (key == "maxHpiSentences") {
            oldValue = std::to_string(config.notes.maxHpiSentences);
            return updateIntValue(value, config.notes.maxHpiSentences);
        }
    } else if (section == "logging") {
        if (key == "level") {
            oldValue = config.logging.level;
            config.logging.level = value;
            return true;
        }
    }
    return false;
}

ConfigValidationResult EngineConfigManager::validateFusionConfig(const EngineConfig& config) const {
    ConfigValidationResult result;
    const auto& fusion = config.fusion;

    if (fusion.specializationBoost < 1.0f) {
        result.addError("fusion.specializationBoost must be >= 1.0");
    } else if (fusion.specializationBoost > 2.0f) {
        result.addWarning("fusion.specializationBoost above 2.0 lets one provider dominate voting");
    }
    if (fusion.domainTermBonus < 0.0f || fusion.domainTermBonus > 1.0f) {
        result.addError("fusion.domainTermBonus must be between 0.0 and 1.0");
    }
    if (fusion.maxWeight <= 0.0f) {
        result.addError("fusion.maxWeight must be positive");
    }
    if (fusion.providerTimeoutMs <= 0) {
        result.addError("fusion.providerTimeoutMs must be positive");
    } else if (fusion.providerTimeoutMs > 60000) {
        result.addWarning("fusion.providerTimeoutMs above 60 s will stall capture");
    }
    if (fusion.workerThreads < 1 || fusion.workerThreads > 64) {
        result.addError("fusion.workerThreads must be between 1 and 64");
    }
    return result;
}

ConfigValidationResult EngineConfigManager::validateExtractionConfig(const EngineConfig& config) const {
    ConfigValidationResult result;
    if (config.extraction.windowTokens < 1 || config.extraction.windowTokens > 50) {
        result.addError("extraction.windowTokens must be between 1 and 50");
    }
    if (!config.extraction.vocabularyPath.empty() &&
        !std::filesystem::exists(config.extraction.vocabularyPath)) {
        result.addWarning("extraction.vocabularyPath does not exist, built-in vocabulary will be used: " +
                          config.extraction.vocabularyPath);
    }
    return result;
}

ConfigValidationResult EngineConfigManager::validateDeduplicationConfig(const EngineConfig& config) const {
    ConfigValidationResult result;
    const auto& dedup = config.deduplication;
    if (dedup.similarityThreshold <= 0.0f || dedup.similarityThreshold > 1.0f) {
        result.addError("deduplication.similarityThreshold must be in (0, 1]");
    }
    if (dedup.enabled && dedup.embeddingsPath.empty()) {
        result.addWarning("deduplication enabled without embeddingsPath; deduplication will be skipped");
    }
    return result;
}

ConfigValidationResult EngineConfigManager::validateNoteConfig(const EngineConfig& config) const {
    ConfigValidationResult result;
    const auto& notes = config.notes;
    if (std::find(kNoteTypeNames.begin(), kNoteTypeNames.end(), upper(notes.defaultNoteType)) == kNoteTypeNames.end()) {
        result.addError("notes.defaultNoteType is not a known note type: " + notes.defaultNoteType);
    }
    if (utils::isBlank(notes.placeholder)) {
        result.addError("notes.placeholder must not be empty");
    }
    if (notes.minSentenceChars < 0) {
        result.addError("notes.minSentenceChars must not be negative");
    }
    if (notes.maxHpiSentences < 1) {
        result.addError("notes.maxHpiSentences must be at least 1");
    }
    return result;
}

ConfigValidationResult EngineConfigManager::validateLoggingConfig(const EngineConfig& config) const {
    ConfigValidationResult result;
    if (std::find(kLogLevelNames.begin(), kLogLevelNames.end(), upper(config.logging.level)) == kLogLevelNames.end()) {
        result.addWarning("logging.level '" + config.logging.level + "' is unknown, INFO will be used");
    }
    return result;
}

bool EngineConfigManager::updateBoolValue(const std::string& value, bool& target) {
    if (value == "true" || value == "1") {
        target = true;
        return true;
    } else if (value == "false" || value == "0") {
        target = false;
        return true;
    }
    return false;
}

bool EngineConfigManager::updateIntValue(const std::string& value, int& target) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        target = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool EngineConfigManager::updateFloatValue(const std::string& value, float& target) {
    try {
        size_t consumed = 0;
        float parsed = std::stof(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        target = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace core
} // namespace clinscribe
