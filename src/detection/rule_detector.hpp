#ifndef PHISCRUB_DETECTION_RULE_DETECTOR_HPP
#define PHISCRUB_DETECTION_RULE_DETECTOR_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <re2/re2.h>

#include "core/entity.hpp"
#include "detection/pattern_library.hpp"
#include "util/deadline.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"

/**
 * @file rule_detector.hpp
 * @brief Runs every matcher of a PatternLibrary over a text and returns the
 *        raw candidate list.
 *
 * DESIGN GOALS:
 *   - Output is the concatenation of all matches, pattern by pattern, in the
 *     library's declaration order. No sorting, no deduplication: the overlap
 *     resolver owns that.
 *   - Candidate ids are E1, E2, ... in output order.
 *   - Every candidate is created with action REDACT; the orchestrator's
 *     action selector may change it after resolution.
 *   - Each pattern runs under its own time budget, checked before every
 *     search. One RE2 search is linear in the remaining text, so a single
 *     search cannot run away. A pattern that overruns loses all of its
 *     matches for this call and the rest of the detection carries on.
 *   - The optional call deadline is a hard stop: DeadlineExceededError.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace phiscrub::detection;
 *
 *   RuleDetector detector;  // built-in library, 250 ms per pattern
 *   auto candidates = detector.detect("SSN: 123-45-6789");
 *   // candidates[0].type == EntityType::SSN, start == 5, end == 16
 *   @endcode
 */

namespace phiscrub {
namespace detection {

class RuleDetector
{
public:
    explicit RuleDetector(PatternLibrary library = PatternLibrary::defaultLibrary(),
                          std::chrono::milliseconds patternBudget = std::chrono::milliseconds(250))
        : library_(std::move(library)), patternBudget_(patternBudget)
    {
    }

    /**
     * @brief Detect raw candidates in @p text, without a call deadline.
     */
    inline std::vector<core::Entity> detect(const std::string &text) const
    {
        return detect(text, util::Deadline::none());
    }

    /**
     * @brief Detect raw candidates in @p text.
     * @throw util::DeadlineExceededError if @p callDeadline expires.
     */
    inline std::vector<core::Entity> detect(const std::string &text,
                                            const util::Deadline &callDeadline) const
    {
        std::vector<core::Entity> candidates;
        if (isBlank(text)) {
            return candidates;
        }

        const util::utf8::CodepointIndex index(text);
        std::size_t counter = 1;

        for (const auto &entry : library_.entries()) {
            if (callDeadline.expired()) {
                throw util::DeadlineExceededError("detection stopped before pattern '" + entry.name + "'");
            }

            std::vector<core::Entity> found;
            try {
                found = runPattern(entry, text, index, callDeadline);
            }
            catch (const util::PatternTimeoutError &ex) {
                util::logger::warn(std::string("RuleDetector: ") + ex.what() + ", matches dropped");
                continue;
            }

            for (auto &candidate : found) {
                candidate.id = "E" + std::to_string(counter++);
                candidates.push_back(std::move(candidate));
            }
        }

        util::logger::debug("RuleDetector: " + std::to_string(candidates.size())
                            + " raw candidates from " + std::to_string(library_.size()) + " patterns");
        return candidates;
    }

private:
    PatternLibrary library_;
    std::chrono::milliseconds patternBudget_;

    static bool isBlank(const std::string &text)
    {
        return std::all_of(text.begin(), text.end(),
                           [](unsigned char c) { return std::isspace(c); });
    }

    /**
     * @brief All matches of one entry, with codepoint spans. Ids are left empty.
     * @throw util::PatternTimeoutError on budget overrun.
     * @throw util::DeadlineExceededError if the call deadline is the one that expired.
     */
    inline std::vector<core::Entity> runPattern(const PatternEntry &entry,
                                                const std::string &text,
                                                const util::utf8::CodepointIndex &index,
                                                const util::Deadline &callDeadline) const
    {
        const util::Deadline bound =
            util::Deadline::earliest(util::Deadline::after(patternBudget_), callDeadline);
        const re2::RE2 &matcher = *entry.matcher;
        const int groups = matcher.NumberOfCapturingGroups();
        std::vector<re2::StringPiece> submatch(static_cast<std::size_t>(groups) + 1);

        const re2::StringPiece input(text);
        std::vector<core::Entity> found;
        std::size_t pos = 0;

        while (pos <= text.size()) {
            if (bound.expired()) {
                if (callDeadline.expired()) {
                    throw util::DeadlineExceededError("detection stopped inside pattern '" + entry.name + "'");
                }
                throw util::PatternTimeoutError(entry.name,
                    "budget of " + std::to_string(patternBudget_.count()) + " ms exceeded");
            }
            if (!matcher.Match(input, pos, text.size(), re2::RE2::UNANCHORED,
                               submatch.data(), groups + 1)) {
                break;
            }

            const std::size_t matchStart = static_cast<std::size_t>(submatch[0].data() - text.data());
            const std::size_t matchEnd = matchStart + submatch[0].size();

            std::size_t byteStart = matchStart;
            std::size_t byteEnd = matchEnd;
            if (groups > 0) {
                const re2::StringPiece &g = submatch[static_cast<std::size_t>(groups)];
                if (g.data() != nullptr && !g.empty()) {
                    byteStart = static_cast<std::size_t>(g.data() - text.data());
                    byteEnd = byteStart + g.size();
                }
            }

            if (matchEnd > matchStart) {
                core::Entity candidate;
                candidate.type = entry.type;
                candidate.start = index.toCodepoint(byteStart);
                candidate.end = index.toCodepoint(byteEnd);
                candidate.confidence = entry.confidence;
                candidate.severity = entry.severity;
                candidate.action = core::Action::REDACT;
                candidate.provenance.push_back(entry.provenance);
                found.push_back(std::move(candidate));
                pos = matchEnd;
            } else if (matchStart < text.size()) {
                pos = matchStart + util::utf8::sequenceLengthAt(text, matchStart);
            } else {
                break;
            }
        }

        return found;
    }
};

} // namespace detection
} // namespace phiscrub

#endif // PHISCRUB_DETECTION_RULE_DETECTOR_HPP
