#ifndef PHISCRUB_DETECTION_PATTERN_LIBRARY_HPP
#define PHISCRUB_DETECTION_PATTERN_LIBRARY_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <re2/re2.h>

#include "core/entity.hpp"

namespace phiscrub {
namespace detection {

/*
  PatternLibrary
  --------------------------------------------------------
  Ordered catalog of matchers. Each entry carries the entity type it tags,
  a base confidence, a severity and a provenance tag.

  Declaration order is significant: the detector walks the entries in this
  order and numbers candidates as it goes, and the resolver's stable sort
  keeps that order among equal keys.

  Built-in order:
    main table  ssn, phone, email, ip_address, credit_card, passport, date,
                mrn, insurance_id, vehicle_id, device_id, bank_account,
                api_key, password, address
    dates       date_numeric, date_verbal
    names       person_title, person_basic

  Label-prefixed entries (e.g. "MRN: ABC123") define one capturing group;
  when it matched something non-empty the group's span is reported and the
  label stays outside the entity.

  Matchers are RE2 programs: matching time is linear in the text and the
  stack depth does not grow with it. RE2 has no lookaround, so exclusions
  (SSN area 000/666/9xx, group 00, serial 0000) are spelled out as digit
  alternations. \b and \d are ASCII-only.

  Compiled matchers are immutable and shared between copies of a library.
*/

struct PatternEntry
{
    std::string name;
    core::EntityType type = core::EntityType::GENERIC_PII;
    std::shared_ptr<const re2::RE2> matcher;
    double confidence = 0.0;
    core::Severity severity = core::Severity::LOW;
    std::string provenance;
};

class PatternLibrary
{
public:
    /// An empty library; use builtin() for the standard catalog.
    PatternLibrary() = default;

    /// The standard catalog, in its fixed declaration order.
    static PatternLibrary builtin();

    /// Process-wide shared copy of builtin(), compiled once.
    static const PatternLibrary& defaultLibrary();

    /**
     * @brief Append a matcher at the end of the catalog.
     * @throw util::InvalidConfigError if the expression does not compile.
     */
    void add(const std::string &name,
             core::EntityType type,
             const std::string &expression,
             bool caseSensitive,
             double confidence,
             core::Severity severity,
             const std::string &provenance);

    const std::vector<PatternEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }

    /// Entry by name, or nullptr.
    const PatternEntry* find(const std::string &name) const;

private:
    std::vector<PatternEntry> entries_;
};

} // namespace detection
} // namespace phiscrub

#endif // PHISCRUB_DETECTION_PATTERN_LIBRARY_HPP
