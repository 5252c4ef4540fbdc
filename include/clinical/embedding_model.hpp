#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clinscribe {
namespace clinical {

/**
 * Source of word vectors for sentence similarity
 */
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    virtual bool isAvailable() const = 0;
    virtual size_t dimension() const = 0;
    virtual std::optional<std::vector<float>> wordVector(const std::string& word) const = 0;

    /**
     * Mean of the known word vectors of a sentence; nullopt when no word
     * of the sentence has a vector
     */
    std::optional<std::vector<float>> sentenceVector(const std::string& sentence) const;

    static float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);
};

/**
 * In-memory word vector table, loadable from a GloVe style text file
 * ("word v1 v2 ... vN" per line).
 */
class WordVectorTable : public EmbeddingModel {
public:
    WordVectorTable() : dimension_(0) {}

    /**
     * Throws EmbeddingUnavailableException if the file is missing, empty or
     * has rows of inconsistent dimension
     */
    static std::shared_ptr<WordVectorTable> loadFromFile(const std::string& path);

    // Throws std::invalid_argument on a dimension mismatch
    void addVector(const std::string& word, const std::vector<float>& vector);

    bool isAvailable() const override { return !vectors_.empty(); }
    size_t dimension() const override { return dimension_; }
    std::optional<std::vector<float>> wordVector(const std::string& word) const override;

    size_t size() const { return vectors_.size(); }

private:
    size_t dimension_;
    std::map<std::string, std::vector<float>> vectors_;
};

} // namespace clinical
} // namespace clinscribe
