#ifndef PHISCRUB_CORE_ENTITY_HPP
#define PHISCRUB_CORE_ENTITY_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "entity_types.hpp"

/**
 * @file entity.hpp
 * @brief A detected span of sensitive text.
 *
 * The same struct is used for raw candidates (detector output) and for the
 * resolved set: resolution only filters, it never rewrites a candidate.
 * Spans are half-open [start, end) in codepoints of the original text.
 */

namespace phiscrub {
namespace core {

/// Constant disclaimer carried by every entity record.
static const char* const kEntityNotes = "No raw value recorded.";

/// Provenance tags.
static const char* const kProvenanceRegex      = "regex";
static const char* const kProvenanceRegexTitle = "regex_title";
static const char* const kProvenanceRegexBasic = "regex_basic";
static const char* const kProvenanceNer        = "ner";

struct Entity
{
    std::string id;                 ///< "E<n>", unique within one detection run only
    EntityType type = EntityType::GENERIC_PII;
    std::size_t start = 0;
    std::size_t end = 0;
    double confidence = 0.0;        ///< in [0, 1]
    Severity severity = Severity::LOW;
    Action action = Action::REDACT;
    std::vector<std::string> provenance;
    std::string replacement;        ///< filled once the Transformer has run
    std::string notes = kEntityNotes;

    std::size_t length() const { return end - start; }

    /// Half-open intersection test.
    bool overlaps(const Entity &other) const
    {
        return start < other.end && end > other.start;
    }
};

} // namespace core
} // namespace phiscrub

#endif // PHISCRUB_CORE_ENTITY_HPP
