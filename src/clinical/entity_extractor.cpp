#include "clinical/entity_extractor.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <regex>
#include <stdexcept>

namespace clinscribe {
namespace clinical {

namespace {

const char* kNumberPattern =
    "(\\d+|a few|a couple of|a couple|several|few|an|a|one|two|three|four|five|six|seven|"
    "eight|nine|ten|eleven|twelve|fifteen|twenty|thirty)";
const char* kUnitPattern = "(minute|hour|day|week|month|year)s?";

int unitDays(const std::string& unit) {
    if (unit.compare(0, 3, "day") == 0) return 1;
    if (unit.compare(0, 4, "week") == 0) return 7;
    if (unit.compare(0, 5, "month") == 0) return 30;
    if (unit.compare(0, 4, "year") == 0) return 365;
    return 0;
}

int parseCount(std::string word) {
    const std::string suffix = " of";
    if (word.size() > suffix.size() && word.compare(word.size() - suffix.size(), suffix.size(), suffix) == 0) {
        word = word.substr(0, word.size() - suffix.size());
    }
    int value = utils::parseNumberWord(word);
    return value < 0 ? 0 : value;
}

bool overlaps(size_t a_begin, size_t a_end, size_t b_begin, size_t b_end) {
    return a_begin < b_end && b_begin < a_end;
}

} // namespace

EntityExtractor::EntityExtractor(VocabularyStorePtr vocabulary, size_t window_tokens, bool apply_risk_rules)
    : vocabulary_(vocabulary),
      window_tokens_(window_tokens),
      apply_risk_rules_(apply_risk_rules),
      negation_(window_tokens),
      risk_rules_(vocabulary) {
    if (!vocabulary_) {
        throw std::invalid_argument("EntityExtractor requires a vocabulary");
    }
    discontinued_cues_ = {"ran out", "run out", "stopped", "quit", "discontinued", "no longer",
                          "off", "used to take", "not taking", "hasn't taken", "haven't taken",
                          "missed"};
    resolved_cues_ = {"resolved", "went away", "gone away", "subsided", "no longer"};
}

std::vector<TimingMatch> EntityExtractor::findTimingPhrases(const std::string& lowered) {
    static const std::regex ago_regex(std::string("\\b") + kNumberPattern + "\\s+" + kUnitPattern + "\\s+ago\\b");
    static const std::regex for_regex(std::string("\\bfor\\s+(?:the\\s+(?:past|last)\\s+)?") + kNumberPattern +
                                      "\\s+" + kUnitPattern + "\\b");
    static const std::vector<std::pair<std::string, int>> fixed = {
        {"this morning", 0}, {"this afternoon", 0}, {"this evening", 0}, {"today", 0}, {"tonight", 0},
        {"yesterday", 1}, {"last night", 1}, {"last week", 7}, {"last month", 30}, {"last year", 365}};

    std::vector<TimingMatch> matches;
    auto claimed = [&](size_t begin, size_t end) {
        return std::any_of(matches.begin(), matches.end(), [&](const TimingMatch& m) {
            return overlaps(begin, end, m.begin, m.end);
        });
    };

    for (const std::regex* re : {&ago_regex, &for_regex}) {
        for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), *re);
             it != std::sregex_iterator(); ++it) {
            const std::smatch& m = *it;
            size_t begin = static_cast<size_t>(m.position(0));
            size_t end = begin + static_cast<size_t>(m.length(0));
            if (claimed(begin, end)) {
                continue;
            }
            TimingMatch timing;
            timing.text = m.str(0);
            timing.begin = begin;
            timing.end = end;
            timing.elapsed_days = parseCount(m.str(1)) * unitDays(m.str(2));
            matches.push_back(timing);
        }
    }

    for (const auto& phrase : fixed) {
        size_t pos = utils::findWholeWord(lowered, phrase.first);
        while (pos != std::string::npos) {
            size_t end = pos + phrase.first.size();
            if (!claimed(pos, end)) {
                matches.push_back(TimingMatch{phrase.first, pos, end, phrase.second});
            }
            pos = utils::findWholeWord(lowered, phrase.first, end);
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const TimingMatch& a, const TimingMatch& b) { return a.begin < b.begin; });
    return matches;
}

std::vector<EntityExtractor::Mention> EntityExtractor::findMentions(
    const std::string& lowered, const std::vector<utils::TextToken>& tokens) const {

    std::vector<size_t> token_at(lowered.size(), std::string::npos);
    for (size_t t = 0; t < tokens.size(); ++t) {
        for (size_t c = tokens[t].begin; c < tokens[t].end && c < token_at.size(); ++c) {
            token_at[c] = t;
        }
    }

    std::vector<bool> claimed(lowered.size(), false);
    std::vector<Mention> mentions;

    for (const auto& term : vocabulary_->getTerms()) {
        size_t pos = utils::findWholeWord(lowered, term.phrase);
        while (pos != std::string::npos) {
            size_t end = pos + term.phrase.size();
            bool taken = std::any_of(claimed.begin() + pos, claimed.begin() + end, [](bool c) { return c; });
            if (!taken && token_at[pos] != std::string::npos && token_at[end - 1] != std::string::npos) {
                std::fill(claimed.begin() + pos, claimed.begin() + end, true);
                Mention mention;
                mention.term = &term;
                mention.begin = pos;
                mention.end = end;
                mention.first_token = token_at[pos];
                mention.last_token = token_at[end - 1] + 1;
                mentions.push_back(mention);
            }
            pos = utils::findWholeWord(lowered, term.phrase, end);
        }
    }

    std::stable_sort(mentions.begin(), mentions.end(),
                     [](const Mention& a, const Mention& b) { return a.begin < b.begin; });
    return mentions;
}

EntityExtractor::Span EntityExtractor::windowFor(const std::vector<utils::TextToken>& tokens,
                                                 size_t first, size_t last) const {
    size_t lo = first;
    for (size_t steps = 0; lo > 0 && steps < window_tokens_; ++steps) {
        if (NegationDetector::isScopeBreak(tokens[lo - 1])) {
            break;
        }
        --lo;
    }
    size_t hi = last;
    for (size_t steps = 0; hi < tokens.size() && steps < window_tokens_; ++steps) {
        if (NegationDetector::isScopeBreak(tokens[hi])) {
            break;
        }
        ++hi;
    }
    return Span{tokens[lo].begin, tokens[hi - 1].end};
}

std::optional<std::string> EntityExtractor::findPhrase(const PhraseTable& table, const std::string& lowered,
                                                       const Span& window, const std::vector<Span>& excluded,
                                                       Span* found) {
    for (const auto& entry : table) {
        size_t pos = utils::findWholeWord(lowered, entry.first, window.begin);
        while (pos != std::string::npos && pos + entry.first.size() <= window.end) {
            size_t end = pos + entry.first.size();
            bool blocked = std::any_of(excluded.begin(), excluded.end(), [&](const Span& s) {
                return overlaps(pos, end, s.begin, s.end);
            });
            if (!blocked) {
                if (found) {
                    *found = Span{pos, end};
                }
                return entry.second;
            }
            pos = utils::findWholeWord(lowered, entry.first, end);
        }
    }
    return std::nullopt;
}

bool EntityExtractor::containsCue(const std::string& lowered, const Span& window,
                                  const std::vector<std::string>& cues, const Span& own) {
    for (const auto& cue : cues) {
        size_t pos = utils::findWholeWord(lowered, cue, window.begin);
        while (pos != std::string::npos && pos + cue.size() <= window.end) {
            if (!overlaps(pos, pos + cue.size(), own.begin, own.end)) {
                return true;
            }
            pos = utils::findWholeWord(lowered, cue, pos + cue.size());
        }
    }
    return false;
}

std::optional<std::string> EntityExtractor::durationIn(const std::vector<TimingMatch>& timings,
                                                       const Span& window) {
    for (const auto& timing : timings) {
        if (timing.begin >= window.begin && timing.end <= window.end) {
            return timing.text;
        }
    }
    return std::nullopt;
}

void EntityExtractor::attachSymptomModifiers(ClinicalEntity& entity, const std::string& lowered,
                                             const Span& window, const Span& own) const {
    static const std::regex radiation_regex(
        "\\b(?:radiat[a-z]*|spread[a-z]*|goes|going|moves)\\s+(?:to|into|down|up)\\s+"
        "(?:the\\s+|his\\s+|her\\s+|my\\s+|both\\s+)?");
    static const std::regex score_regex("\\b(\\d{1,2})\\s*(?:/|out of)\\s*10\\b");

    std::vector<Span> excluded = {own};
    std::string window_text = lowered.substr(window.begin, window.end - window.begin);

    std::smatch m;
    if (std::regex_search(window_text, m, radiation_regex)) {
        size_t target = window.begin + static_cast<size_t>(m.position(0) + m.length(0));
        for (const auto& entry : vocabulary_->locationTable()) {
            if (lowered.compare(target, entry.first.size(), entry.first) == 0 &&
                utils::findWholeWord(lowered, entry.first, target) == target) {
                entity.radiation = entry.second;
                excluded.push_back(Span{window.begin + static_cast<size_t>(m.position(0)),
                                        target + entry.first.size()});
                break;
            }
        }
    }

    std::optional<std::string> word = findPhrase(vocabulary_->severityTable(), lowered, window, excluded);
    std::optional<std::string> score;
    if (std::regex_search(window_text, m, score_regex)) {
        score = m.str(1) + "/10";
    }
    if (word && score) {
        entity.severity = *word + " (" + *score + ")";
    } else if (word) {
        entity.severity = word;
    } else if (score) {
        entity.severity = score;
    }

    entity.quality = findPhrase(vocabulary_->qualityTable(), lowered, window, excluded);
    entity.location = findPhrase(vocabulary_->locationTable(), lowered, window, excluded);
}

void EntityExtractor::attachMedicationModifiers(ClinicalEntity& entity, const std::string& lowered,
                                                const Span& window, const Span& own) const {
    static const std::regex dose_regex("\\b(\\d+(?:\\.\\d+)?)\\s*(mg|mcg|milligrams|micrograms|g|units|ml)\\b");
    static const std::regex every_regex("\\bevery\\s+(\\d+)\\s+hours?\\b");
    static const std::regex q_regex("\\bq(\\d+)h\\b");

    std::string window_text = lowered.substr(window.begin, window.end - window.begin);
    std::smatch m;
    if (std::regex_search(window_text, m, dose_regex)) {
        std::string unit = m.str(2);
        if (unit == "milligrams") {
            unit = "mg";
        } else if (unit == "micrograms") {
            unit = "mcg";
        }
        entity.dose = m.str(1) + " " + unit;
    }

    std::vector<Span> excluded = {own};
    entity.route = findPhrase(vocabulary_->routeTable(), lowered, window, excluded);
    if (std::regex_search(window_text, m, every_regex) || std::regex_search(window_text, m, q_regex)) {
        entity.frequency = "q" + m.str(1) + "h";
    } else {
        entity.frequency = findPhrase(vocabulary_->frequencyTable(), lowered, window, excluded);
    }

    if (containsCue(lowered, window, discontinued_cues_, own)) {
        entity.status = EntityStatus::DISCONTINUED;
    }
}

ClinicalEntity EntityExtractor::qualify(const Mention& mention, const std::string& text,
                                        const std::string& lowered,
                                        const std::vector<utils::TextToken>& tokens,
                                        const std::vector<TimingMatch>& timings) const {
    ClinicalEntity entity;
    entity.kind = mention.term->kind;
    entity.name = mention.term->canonical;
    entity.category = mention.term->category;
    entity.matched_text = text.substr(mention.begin, mention.end - mention.begin);
    entity.offset = mention.begin;
    entity.is_negated = negation_.isNegated(tokens, mention.first_token, mention.last_token);

    if (entity.is_negated) {
        return entity;
    }

    Span own{mention.begin, mention.end};
    Span window = windowFor(tokens, mention.first_token, mention.last_token);

    switch (entity.kind) {
        case EntityKind::SYMPTOM:
            attachSymptomModifiers(entity, lowered, window, own);
            entity.duration = durationIn(timings, window);
            if (containsCue(lowered, window, resolved_cues_, own)) {
                entity.status = EntityStatus::RESOLVED;
            }
            break;
        case EntityKind::MEDICATION:
            attachMedicationModifiers(entity, lowered, window, own);
            entity.duration = durationIn(timings, window);
            break;
        case EntityKind::CONDITION:
            entity.duration = durationIn(timings, window);
            break;
        default:
            break;
    }
    return entity;
}

std::vector<ClinicalEntity> EntityExtractor::collapse(const std::vector<ClinicalEntity>& mentions) {
    std::vector<ClinicalEntity> merged;
    for (const auto& mention : mentions) {
        auto existing = std::find_if(merged.begin(), merged.end(), [&](const ClinicalEntity& e) {
            return e.kind == mention.kind && e.name == mention.name;
        });
        if (existing == merged.end()) {
            merged.push_back(mention);
            continue;
        }

        ClinicalEntity& entity = *existing;
        entity.is_negated = entity.is_negated && mention.is_negated;
        if (!entity.severity) entity.severity = mention.severity;
        if (!entity.duration) entity.duration = mention.duration;
        if (!entity.location) entity.location = mention.location;
        if (!entity.quality) entity.quality = mention.quality;
        if (!entity.radiation) entity.radiation = mention.radiation;
        if (!entity.dose) entity.dose = mention.dose;
        if (!entity.route) entity.route = mention.route;
        if (!entity.frequency) entity.frequency = mention.frequency;
        if (!entity.elapsed_days) entity.elapsed_days = mention.elapsed_days;

        if (mention.status == EntityStatus::DISCONTINUED) {
            entity.status = EntityStatus::DISCONTINUED;
        } else if (mention.status == EntityStatus::RESOLVED && entity.status == EntityStatus::ACTIVE) {
            entity.status = EntityStatus::RESOLVED;
        }
    }
    return merged;
}

std::vector<ClinicalEntity> EntityExtractor::extractMentions(const std::string& text) const {
    std::string lowered = utils::toLower(text);
    auto tokens = utils::tokenizeWithOffsets(text);
    if (tokens.empty()) {
        return {};
    }

    auto timings = findTimingPhrases(lowered);
    std::vector<ClinicalEntity> found;

    for (const auto& mention : findMentions(lowered, tokens)) {
        found.push_back(qualify(mention, text, lowered, tokens, timings));
    }

    for (const auto& timing : timings) {
        ClinicalEntity marker;
        marker.kind = EntityKind::TIMING_MARKER;
        marker.name = timing.text;
        marker.matched_text = text.substr(timing.begin, timing.end - timing.begin);
        marker.category = "elapsed";
        marker.elapsed_days = timing.elapsed_days;
        marker.offset = timing.begin;
        found.push_back(marker);
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const ClinicalEntity& a, const ClinicalEntity& b) { return a.offset < b.offset; });
    return collapse(found);
}

std::vector<ClinicalEntity> EntityExtractor::extract(const std::string& text) const {
    std::vector<ClinicalEntity> entities = extractMentions(text);
    if (apply_risk_rules_) {
        auto derived = risk_rules_.deriveRiskFactors(entities);
        entities.insert(entities.end(), derived.begin(), derived.end());
    }
    utils::Logger::debug("Extracted " + std::to_string(entities.size()) + " clinical entities");
    return entities;
}

} // namespace clinical
} // namespace clinscribe
