#ifndef PHISCRUB_DETECTION_NER_CAPABILITY_HPP
#define PHISCRUB_DETECTION_NER_CAPABILITY_HPP

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "core/entity.hpp"
#include "util/logger.hpp"

/**
 * @file ner_capability.hpp
 * @brief The named-entity-recognition collaborator seen by the pipeline.
 *
 * NER is optional. A pipeline always holds a capability object and calls it
 * uniformly; "no NER" is the UnavailableNerCapability variant, not a null
 * pointer or a flag. Implementations must be safe to call concurrently
 * through a const reference once constructed.
 *
 * Candidates produced from NER spans:
 *   PERSON   -> PERSON_NAME, confidence 0.80, severity HIGH
 *   LOCATION -> LOCATION,    confidence 0.75, severity MEDIUM
 *   provenance "ner", ids numbered from E1000.
 */

namespace phiscrub {
namespace detection {

enum class NerLabel {
    PERSON,
    LOCATION
};

/// A span reported by a NER model, in codepoints of the input text.
struct NerSpan
{
    std::size_t start = 0;
    std::size_t end = 0;
    NerLabel label = NerLabel::PERSON;
};

class NerCapability
{
public:
    virtual ~NerCapability() = default;

    /// True when the model is loaded and detect() may be called.
    virtual bool available() const = 0;

    /// Name of the loaded model, "None" when unavailable.
    virtual std::string modelName() const = 0;

    /**
     * @brief Recognize entities in @p text.
     * @throw util::CapabilityUnavailableError when the model fails on this input.
     */
    virtual std::vector<NerSpan> detect(const std::string &text) const = 0;
};

/**
 * @class UnavailableNerCapability
 * @brief The "no NER" variant: never available, never finds anything.
 */
class UnavailableNerCapability : public NerCapability
{
public:
    bool available() const override { return false; }
    std::string modelName() const override { return "None"; }
    std::vector<NerSpan> detect(const std::string &) const override { return {}; }
};

/// A shared UnavailableNerCapability instance.
inline std::shared_ptr<const NerCapability> unavailableNer()
{
    static const std::shared_ptr<const NerCapability> instance =
        std::make_shared<UnavailableNerCapability>();
    return instance;
}

/// First id assigned to NER candidates.
static const std::size_t kNerFirstId = 1000;

/**
 * @brief Convert NER spans into candidates. Spans that are empty or fall
 *        outside [0, textLength] are dropped with a warning.
 *
 * Ids continue after the rule candidates: E1000 upward, or E<ruleCount + 1>
 * upward once the rule detector has already used E1000.
 */
inline std::vector<core::Entity> nerCandidates(const std::vector<NerSpan> &spans,
                                               std::size_t textLength,
                                               std::size_t ruleCount = 0)
{
    std::vector<core::Entity> out;
    std::size_t counter = std::max(kNerFirstId, ruleCount + 1);
    for (const auto &span : spans) {
        if (span.start >= span.end || span.end > textLength) {
            util::logger::warn("NerCapability: dropping span ["
                               + std::to_string(span.start) + ","
                               + std::to_string(span.end) + ") outside text of length "
                               + std::to_string(textLength));
            continue;
        }

        core::Entity candidate;
        candidate.id = "E" + std::to_string(counter++);
        candidate.start = span.start;
        candidate.end = span.end;
        candidate.action = core::Action::REDACT;
        candidate.provenance.push_back(core::kProvenanceNer);
        if (span.label == NerLabel::PERSON) {
            candidate.type = core::EntityType::PERSON_NAME;
            candidate.confidence = 0.80;
            candidate.severity = core::Severity::HIGH;
        } else {
            candidate.type = core::EntityType::LOCATION;
            candidate.confidence = 0.75;
            candidate.severity = core::Severity::MEDIUM;
        }
        out.push_back(std::move(candidate));
    }
    return out;
}

} // namespace detection
} // namespace phiscrub

#endif // PHISCRUB_DETECTION_NER_CAPABILITY_HPP
