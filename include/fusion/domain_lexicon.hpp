#pragma once

#include <string>
#include <cstddef>

namespace clinscribe {
namespace fusion {

/**
 * Counts domain vocabulary hits in a transcript. Used to reward candidates
 * that recognised clinical terminology.
 */
class DomainLexicon {
public:
    virtual ~DomainLexicon() = default;
    virtual size_t countDomainTerms(const std::string& text) const = 0;
};

} // namespace fusion
} // namespace clinscribe
