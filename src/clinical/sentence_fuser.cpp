#include "clinical/sentence_fuser.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace clinscribe {
namespace clinical {

namespace {

const std::vector<std::string> kFillerWords = {
    "uh", "um", "umm", "mhmm", "mm", "hmm", "okay", "ok", "yeah", "yes", "no", "alright",
    "right", "so", "well", "sure", "thanks", "thank", "you", "oh", "huh", "got", "it", "good"};

const std::vector<std::string> kClinicalKeywords = {
    "pain", "hurt", "hurts", "hurting", "feel", "feels", "feeling", "started", "began", "hours", "days",
    "weeks", "months", "heart", "chest", "breath", "breathing", "medication", "medications",
    "pills", "history", "worse", "better", "symptoms", "taking", "allergic", "allergies",
    "surgery", "hospital", "doctor", "diagnosed"};

const std::vector<std::string> kExperienceWords = {"feel", "feels", "feeling", "having", "started", "began"};
const std::vector<std::string> kTimingWords = {"hour", "hours", "day", "days", "week", "weeks",
                                               "ago", "morning", "yesterday", "night"};
const std::vector<std::string> kAssociatedWords = {"dizzy", "nausea", "nauseous", "sweaty",
                                                   "vomiting", "short of breath"};
const std::vector<std::string> kOnsetWords = {"started", "began", "onset", "came on", "first noticed"};
const std::vector<std::string> kProgressionWords = {"worse", "worsening", "better", "improved",
                                                    "improving", "changed", "same"};
const std::vector<std::string> kQuestionOpeners = {"any", "have you", "do you", "did you", "are you",
                                                   "is it", "can you", "does it"};

} // namespace

SentenceFuser::SentenceFuser(VocabularyStorePtr vocabulary, size_t min_sentence_chars)
    : vocabulary_(std::move(vocabulary)), min_sentence_chars_(min_sentence_chars) {
    if (!vocabulary_) {
        throw std::invalid_argument("SentenceFuser requires a vocabulary");
    }
}

bool SentenceFuser::containsAny(const std::string& lowered, const std::vector<std::string>& words) {
    return std::any_of(words.begin(), words.end(),
                       [&](const std::string& w) { return utils::containsWholeWord(lowered, w); });
}

bool SentenceFuser::isFiller(const std::string& sentence) {
    auto words = utils::extractWords(sentence);
    if (words.empty()) {
        return true;
    }
    return std::all_of(words.begin(), words.end(), [](const std::string& w) {
        return std::find(kFillerWords.begin(), kFillerWords.end(), w) != kFillerWords.end();
    });
}

bool SentenceFuser::isQuestion(const std::string& sentence) {
    std::string trimmed = utils::trim(sentence);
    if (!trimmed.empty() && trimmed.back() == '?') {
        return true;
    }
    std::string lowered = utils::toLower(trimmed);
    for (const auto& opener : kQuestionOpeners) {
        if (utils::findWholeWord(lowered, opener) == 0) {
            return true;
        }
    }
    return false;
}

const VocabularyTerm* SentenceFuser::firstTerm(const std::string& lowered, EntityKind kind) const {
    const VocabularyTerm* best = nullptr;
    size_t best_pos = std::string::npos;
    for (const auto& term : vocabulary_->getTerms()) {
        if (term.kind != kind) {
            continue;
        }
        size_t pos = utils::findWholeWord(lowered, term.phrase);
        if (pos != std::string::npos && pos < best_pos) {
            best = &term;
            best_pos = pos;
        }
    }
    return best;
}

bool SentenceFuser::hasClinicalContent(const std::string& sentence) const {
    std::string lowered = utils::toLower(sentence);
    if (containsAny(lowered, kClinicalKeywords)) {
        return true;
    }
    return vocabulary_->countDomainTerms(lowered) > 0;
}

std::string SentenceFuser::topicFor(const std::string& sentence) const {
    std::string lowered = utils::toLower(sentence);
    if (const VocabularyTerm* symptom = firstTerm(lowered, EntityKind::SYMPTOM)) {
        return "symptom:" + symptom->canonical;
    }
    if (const VocabularyTerm* medication = firstTerm(lowered, EntityKind::MEDICATION)) {
        return "medication:" + medication->canonical;
    }
    if (const VocabularyTerm* condition = firstTerm(lowered, EntityKind::CONDITION)) {
        return "condition:" + condition->canonical;
    }
    if (containsAny(lowered, kOnsetWords)) {
        return "onset";
    }
    if (containsAny(lowered, kProgressionWords)) {
        return "progression";
    }
    return "general";
}

double SentenceFuser::scoreSentence(const std::string& sentence) const {
    std::string lowered = utils::toLower(sentence);
    double score = 0.0;

    if (containsAny(lowered, kExperienceWords)) {
        score += 5.0;
    }
    if (firstTerm(lowered, EntityKind::SYMPTOM)) {
        score += 4.0;
    }
    if (containsAny(lowered, kTimingWords)) {
        score += 3.0;
    }
    bool has_quality = std::any_of(vocabulary_->qualityTable().begin(), vocabulary_->qualityTable().end(),
                                   [&](const std::pair<std::string, std::string>& q) {
                                       return utils::containsWholeWord(lowered, q.first);
                                   });
    if (has_quality) {
        score += 3.0;
    }
    if (containsAny(lowered, kAssociatedWords)) {
        score += 2.0;
    }
    if (isQuestion(sentence)) {
        score -= 2.0;
    }
    return score;
}

std::vector<FusedSentence> SentenceFuser::fuse(const std::string& text) const {
    std::vector<FusedSentence> fused;
    std::vector<std::string> keys;

    for (const auto& sentence : utils::splitSentences(text)) {
        std::string content = utils::collapseWhitespace(utils::trim(sentence));
        if (content.size() <= min_sentence_chars_ || isFiller(content)) {
            continue;
        }
        if (!hasClinicalContent(content)) {
            continue;
        }

        std::string key = utils::join(utils::extractWords(content), " ");
        auto repeat = std::find(keys.begin(), keys.end(), key);
        if (repeat != keys.end()) {
            fused[static_cast<size_t>(repeat - keys.begin())].source_count += 1;
            continue;
        }

        FusedSentence entry(content, topicFor(content));
        entry.score = scoreSentence(content);
        entry.order = fused.size();
        fused.push_back(entry);
        keys.push_back(key);
    }

    utils::Logger::debug("Sentence fusion kept " + std::to_string(fused.size()) + " sentences");
    return fused;
}

} // namespace clinical
} // namespace clinscribe
