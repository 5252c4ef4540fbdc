#pragma once

#include "clinical/clinical_types.hpp"
#include "utils/error_handler.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace clinscribe {
namespace clinical {

enum class SectionPhase {
    ANY,
    INITIAL,
    FOLLOW_UP
};

struct SectionSpec {
    std::string key;
    std::string heading;
    bool required;
    SectionPhase phase;
};

/**
 * Section contents after validation. Every required section of the note
 * type is present, placeholder-filled when the assessment had nothing.
 */
struct ValidatedSections {
    std::map<std::string, std::string> sections;
    std::vector<utils::ErrorInfo> warnings;
    // Counted over the sections rendered for the requested phase
    size_t required_count = 0;
    size_t filled_count = 0;

    double completeness() const {
        return required_count == 0 ? 1.0 : static_cast<double>(filled_count) / required_count;
    }
};

/**
 * Generic note renderer driven by the note type to section table. One
 * renderer serves every note type; the ED note also gets a JSON projection.
 */
class NoteRenderer {
public:
    using ContentBuilder = std::function<std::string(const ClinicalAssessment&)>;

    explicit NoteRenderer(const std::string& placeholder = "Not assessed.");

    static const std::vector<SectionSpec>& sectionSpecs(NoteType type);
    static std::string noteTitle(NoteType type);
    static bool isVisible(const SectionSpec& spec, EncounterPhase phase);

    // Empty string when the assessment has nothing for the key
    std::string sectionContent(const std::string& key, const ClinicalAssessment& assessment) const;

    ValidatedSections validate(const NoteRequest& request, const ClinicalAssessment& assessment) const;

    std::string render(const NoteRequest& request, const ValidatedSections& validated) const;

    /**
     * ED note JSON document. EncounterID and Phase are always present; the
     * other fields only when the assessment has content for them.
     */
    std::string renderJson(const NoteRequest& request, const ClinicalAssessment& assessment) const;

    const std::string& getPlaceholder() const { return placeholder_; }

private:
    std::string placeholder_;
    std::map<std::string, ContentBuilder> builders_;
};

} // namespace clinical
} // namespace clinscribe
