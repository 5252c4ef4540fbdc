#include "clinical/vocabulary_store.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace clinscribe {
namespace clinical {

bool EntityPattern::matches(const ClinicalEntity& entity) const {
    if (entity.kind != kind) {
        return false;
    }
    if (!category.empty() && entity.category != category) {
        return false;
    }
    if (!name.empty() && entity.name != name) {
        return false;
    }
    if (status && entity.status != *status) {
        return false;
    }
    if (entity.is_negated && !allow_negated) {
        return false;
    }
    if (min_elapsed_days) {
        if (!entity.elapsed_days || *entity.elapsed_days <= *min_elapsed_days) {
            return false;
        }
    }
    return true;
}

std::shared_ptr<const VocabularyStore> VocabularyStore::createDefault() {
    auto store = std::make_shared<VocabularyStore>();
    store->loadDefaults();
    utils::Logger::debug("Vocabulary loaded with " + std::to_string(store->termCount()) + " terms");
    return store;
}

std::shared_ptr<const VocabularyStore> VocabularyStore::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw utils::VocabularyLoadException("Cannot open vocabulary file", path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    utils::JsonValue root;
    try {
        root = utils::JsonParser::parse(buffer.str());
    } catch (const std::runtime_error& e) {
        throw utils::VocabularyLoadException(std::string("Invalid vocabulary JSON: ") + e.what(), path);
    }

    auto store = std::make_shared<VocabularyStore>();
    store->loadDefaults();
    store->mergeJson(root, path);
    utils::Logger::info("Vocabulary loaded from " + path + " (" +
                        std::to_string(store->termCount()) + " terms, " +
                        std::to_string(store->getRiskRules().size()) + " risk rules)");
    return store;
}

EntityKind VocabularyStore::parseKind(const std::string& name, const std::string& source) {
    std::string key = utils::toLower(name);
    if (key == "symptom") return EntityKind::SYMPTOM;
    if (key == "medication") return EntityKind::MEDICATION;
    if (key == "condition") return EntityKind::CONDITION;
    if (key == "riskfactor" || key == "risk_factor") return EntityKind::RISK_FACTOR;
    if (key == "timingmarker" || key == "timing_marker") return EntityKind::TIMING_MARKER;
    if (key == "procedure") return EntityKind::PROCEDURE;
    throw utils::VocabularyLoadException("Unknown entity kind '" + name + "'", source);
}

EntityPattern VocabularyStore::parsePattern(const utils::JsonValue& value, const std::string& source) {
    if (!value.isObject()) {
        throw utils::VocabularyLoadException("Risk rule pattern must be an object", source);
    }
    EntityPattern pattern;
    pattern.kind = parseKind(value.getString("kind"), source);
    pattern.category = value.getString("category");
    pattern.name = value.getString("name");
    pattern.allow_negated = value.getBool("allow_negated", false);

    std::string status = utils::toLower(value.getString("status"));
    if (status == "active") {
        pattern.status = EntityStatus::ACTIVE;
    } else if (status == "resolved") {
        pattern.status = EntityStatus::RESOLVED;
    } else if (status == "discontinued") {
        pattern.status = EntityStatus::DISCONTINUED;
    } else if (!status.empty()) {
        throw utils::VocabularyLoadException("Unknown entity status '" + status + "'", source);
    }

    if (value.hasProperty("min_elapsed_days")) {
        const auto& days = value.getProperty("min_elapsed_days");
        if (!days.isNumber()) {
            throw utils::VocabularyLoadException("min_elapsed_days must be a number", source);
        }
        pattern.min_elapsed_days = static_cast<int>(days.asNumber());
    }
    return pattern;
}

void VocabularyStore::mergeJson(const utils::JsonValue& root, const std::string& source) {
    if (!root.isObject()) {
        throw utils::VocabularyLoadException("Vocabulary root must be an object", source);
    }

    if (root.hasProperty("terms")) {
        const auto& terms = root.getProperty("terms");
        if (!terms.isArray()) {
            throw utils::VocabularyLoadException("'terms' must be an array", source);
        }
        for (const auto& item : terms.asArray()) {
            std::string phrase = utils::trim(item.getString("phrase"));
            if (phrase.empty()) {
                throw utils::VocabularyLoadException("Vocabulary term without phrase", source);
            }
            std::string canonical = item.getString("name", phrase);
            addTerm(VocabularyTerm(phrase, canonical, parseKind(item.getString("kind", "symptom"), source),
                                   item.getString("category")));
        }
    }

    if (root.hasProperty("pertinent_negatives")) {
        const auto& negatives = root.getProperty("pertinent_negatives");
        if (!negatives.isObject()) {
            throw utils::VocabularyLoadException("'pertinent_negatives' must be an object", source);
        }
        for (const auto& entry : negatives.asObject()) {
            if (!entry.second.isArray()) {
                throw utils::VocabularyLoadException("Pertinent negatives for '" + entry.first +
                                                     "' must be an array", source);
            }
            ComplaintProfile profile;
            const ComplaintProfile* existing = findComplaintProfile(entry.first);
            if (existing) {
                profile = *existing;
            } else {
                profile.complaint = utils::toLower(entry.first);
            }
            profile.expected_findings = entry.second.asStringList();
            addComplaintProfile(profile);
        }
    }

    if (root.hasProperty("risk_rules")) {
        const auto& rules = root.getProperty("risk_rules");
        if (!rules.isArray()) {
            throw utils::VocabularyLoadException("'risk_rules' must be an array", source);
        }
        for (const auto& item : rules.asArray()) {
            RiskRule rule;
            rule.id = item.getString("id");
            rule.output_name = item.getString("output");
            rule.severity_label = item.getString("severity", "moderate");
            rule.category = item.getString("category");
            rule.promotes = item.getString("promotes");
            rule.plan_item = item.getString("plan");
            if (rule.id.empty() || rule.output_name.empty()) {
                throw utils::VocabularyLoadException("Risk rule needs 'id' and 'output'", source);
            }
            const auto& patterns = item.getProperty("patterns");
            if (!patterns.isArray() || patterns.asArray().empty()) {
                throw utils::VocabularyLoadException("Risk rule '" + rule.id + "' has no patterns", source);
            }
            for (const auto& p : patterns.asArray()) {
                rule.patterns.push_back(parsePattern(p, source));
            }
            addRiskRule(rule);
        }
    }
}

void VocabularyStore::addTerm(const VocabularyTerm& term) {
    VocabularyTerm normalized = term;
    normalized.phrase = utils::toLower(utils::trim(term.phrase));
    if (normalized.phrase.empty()) {
        return;
    }
    auto duplicate = std::find_if(terms_.begin(), terms_.end(), [&](const VocabularyTerm& t) {
        return t.phrase == normalized.phrase && t.kind == normalized.kind;
    });
    if (duplicate != terms_.end()) {
        *duplicate = normalized;
        return;
    }
    auto pos = std::find_if(terms_.begin(), terms_.end(), [&](const VocabularyTerm& t) {
        return t.phrase.size() < normalized.phrase.size();
    });
    terms_.insert(pos, normalized);
}

void VocabularyStore::addRiskRule(const RiskRule& rule) {
    auto existing = std::find_if(risk_rules_.begin(), risk_rules_.end(),
                                 [&](const RiskRule& r) { return r.id == rule.id; });
    if (existing != risk_rules_.end()) {
        *existing = rule;
    } else {
        risk_rules_.push_back(rule);
    }
}

void VocabularyStore::addComplaintProfile(const ComplaintProfile& profile) {
    ComplaintProfile normalized = profile;
    normalized.complaint = utils::toLower(profile.complaint);
    auto existing = std::find_if(profiles_.begin(), profiles_.end(), [&](const ComplaintProfile& p) {
        return p.complaint == normalized.complaint;
    });
    if (existing != profiles_.end()) {
        *existing = normalized;
    } else {
        profiles_.push_back(normalized);
    }
}

const ComplaintProfile* VocabularyStore::findComplaintProfile(const std::string& complaint) const {
    std::string key = utils::toLower(complaint);
    for (const auto& profile : profiles_) {
        if (profile.complaint == key) {
            return &profile;
        }
    }
    return nullptr;
}

const VocabularyTerm* VocabularyStore::findCanonical(EntityKind kind, const std::string& canonical) const {
    for (const auto& term : terms_) {
        if (term.kind == kind && term.canonical == canonical) {
            return &term;
        }
    }
    return nullptr;
}

void VocabularyStore::addPhrase(PhraseTable& table, const std::string& phrase, const std::string& value) {
    auto pos = std::find_if(table.begin(), table.end(), [&](const std::pair<std::string, std::string>& e) {
        return e.first.size() < phrase.size();
    });
    table.insert(pos, std::make_pair(phrase, value));
}

size_t VocabularyStore::countDomainTerms(const std::string& text) const {
    std::string lowered = utils::toLower(text);
    std::vector<bool> claimed(lowered.size(), false);
    size_t count = 0;

    for (const auto& term : terms_) {
        size_t pos = utils::findWholeWord(lowered, term.phrase);
        while (pos != std::string::npos) {
            size_t end = pos + term.phrase.size();
            bool overlaps = std::any_of(claimed.begin() + pos, claimed.begin() + end,
                                        [](bool c) { return c; });
            if (!overlaps) {
                std::fill(claimed.begin() + pos, claimed.begin() + end, true);
                ++count;
            }
            pos = utils::findWholeWord(lowered, term.phrase, end);
        }
    }
    return count;
}

} // namespace clinical
} // namespace clinscribe
