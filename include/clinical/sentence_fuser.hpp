#pragma once

#include "clinical/clinical_types.hpp"
#include "clinical/vocabulary_store.hpp"
#include <string>
#include <vector>

namespace clinscribe {
namespace clinical {

/**
 * Turns transcript text into scored clinical sentences: fillers and short
 * fragments are dropped, sentences without clinical content are skipped,
 * exact repeats collapse into one sentence with a higher source_count.
 * Output keeps transcript order.
 */
class SentenceFuser {
public:
    explicit SentenceFuser(VocabularyStorePtr vocabulary, size_t min_sentence_chars = 15);

    std::vector<FusedSentence> fuse(const std::string& text) const;

    std::string topicFor(const std::string& sentence) const;
    double scoreSentence(const std::string& sentence) const;
    bool hasClinicalContent(const std::string& sentence) const;

    static bool isFiller(const std::string& sentence);
    static bool isQuestion(const std::string& sentence);

private:
    // Earliest vocabulary phrase of the given kind, or nullptr
    const VocabularyTerm* firstTerm(const std::string& lowered, EntityKind kind) const;
    static bool containsAny(const std::string& lowered, const std::vector<std::string>& words);

    VocabularyStorePtr vocabulary_;
    size_t min_sentence_chars_;
};

} // namespace clinical
} // namespace clinscribe
