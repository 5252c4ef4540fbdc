#include "clinical/embedding_model.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/text_utils.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace clinscribe {
namespace clinical {

std::optional<std::vector<float>> EmbeddingModel::sentenceVector(const std::string& sentence) const {
    if (!isAvailable()) {
        return std::nullopt;
    }
    std::vector<float> sum(dimension(), 0.0f);
    size_t known = 0;
    for (const auto& word : utils::extractWords(sentence)) {
        auto vector = wordVector(word);
        if (!vector || vector->size() != sum.size()) {
            continue;
        }
        for (size_t i = 0; i < sum.size(); ++i) {
            sum[i] += (*vector)[i];
        }
        known++;
    }
    if (known == 0) {
        return std::nullopt;
    }
    for (auto& value : sum) {
        value /= static_cast<float>(known);
    }
    return sum;
}

float EmbeddingModel::cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }
    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

std::shared_ptr<WordVectorTable> WordVectorTable::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw utils::EmbeddingUnavailableException("Cannot open embedding file", path);
    }

    auto table = std::make_shared<WordVectorTable>();
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        std::istringstream row(line);
        std::string word;
        if (!(row >> word)) {
            continue;
        }
        std::vector<float> vector;
        float value = 0.0f;
        while (row >> value) {
            vector.push_back(value);
        }
        // word2vec text files start with a "count dimension" header
        if (line_number == 1 && vector.size() == 1) {
            continue;
        }
        if (vector.empty()) {
            throw utils::EmbeddingUnavailableException(
                "Malformed embedding row " + std::to_string(line_number), path);
        }
        if (table->dimension_ != 0 && vector.size() != table->dimension_) {
            throw utils::EmbeddingUnavailableException(
                "Inconsistent vector dimension at row " + std::to_string(line_number), path);
        }
        table->addVector(word, vector);
    }

    if (!table->isAvailable()) {
        throw utils::EmbeddingUnavailableException("Embedding file has no vectors", path);
    }
    utils::Logger::info("Loaded " + std::to_string(table->size()) + " word vectors (dim " +
                        std::to_string(table->dimension()) + ") from " + path);
    return table;
}

void WordVectorTable::addVector(const std::string& word, const std::vector<float>& vector) {
    if (vector.empty()) {
        throw std::invalid_argument("Empty word vector for '" + word + "'");
    }
    if (dimension_ == 0) {
        dimension_ = vector.size();
    } else if (vector.size() != dimension_) {
        throw std::invalid_argument("Word vector for '" + word + "' has dimension " +
                                    std::to_string(vector.size()) + ", expected " +
                                    std::to_string(dimension_));
    }
    vectors_[utils::toLower(word)] = vector;
}

std::optional<std::vector<float>> WordVectorTable::wordVector(const std::string& word) const {
    auto it = vectors_.find(utils::toLower(word));
    if (it == vectors_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace clinical
} // namespace clinscribe
