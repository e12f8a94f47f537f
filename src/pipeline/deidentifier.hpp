#ifndef PHISCRUB_PIPELINE_DEIDENTIFIER_HPP
#define PHISCRUB_PIPELINE_DEIDENTIFIER_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "config/deid_config.hpp"
#include "core/entity.hpp"
#include "detection/ner_capability.hpp"
#include "detection/rule_detector.hpp"
#include "pipeline/action_selector.hpp"
#include "resolution/overlap_resolver.hpp"
#include "transform/text_transformer.hpp"
#include "util/deadline.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"

/**
 * @file deidentifier.hpp
 * @brief The detection -> resolution -> transformation pipeline.
 *
 * DESIGN GOALS:
 *   - A Deidentifier is built once and never changes afterwards. The request
 *     (DeidentifyConfig) is a per-call argument, so concurrent deidentify()
 *     calls on one instance are independent.
 *   - NER is consulted through the NerCapability interface. Any NER failure
 *     is logged and the call continues rule-only.
 *   - A pattern that overruns its budget loses its matches; an expired call
 *     budget aborts the whole call with DeadlineExceededError.
 *   - Neither the result's highlights nor the log lines ever carry the raw
 *     matched text.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace phiscrub;
 *
 *   pipeline::Deidentifier engine;                 // rule-only, fixed REDACT
 *   config::DeidentifyConfig request;
 *   auto result = engine.deidentify("SSN: 123-45-6789", request);
 *   // result.deidentifiedText == "SSN: [REDACTED]"
 *   @endcode
 */

namespace phiscrub {
namespace pipeline {

/// Echo of the request plus the time the call was made.
struct RequestEcho
{
    config::DeidentifyConfig settings;
    std::string timestampIso;
};

struct Summary
{
    std::size_t entitiesFound = 0;
    std::size_t entitiesTransformed = 0;
    bool reviewRequired = false;
};

/// Rendering metadata of one entity. Holds no raw text.
struct Highlight
{
    std::string entityId;
    core::EntityType type = core::EntityType::GENERIC_PII;
    std::size_t start = 0;
    std::size_t end = 0;
    double confidence = 0.0;
    core::Severity severity = core::Severity::LOW;
    core::Action action = core::Action::REDACT;
    std::string color;
    std::string tooltip;
};

struct DeidentifyResult
{
    RequestEcho request;
    std::size_t originalTextLength = 0;    ///< in codepoints
    std::string deidentifiedText;
    Summary summary;
    std::vector<Highlight> highlights;
    std::vector<core::Entity> entities;    ///< resolver acceptance order
    std::vector<std::string> risks;        ///< reserved, always empty
    std::vector<std::string> errors;       ///< reserved, always empty
};

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
inline std::string utcTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

/// "<type> • <action> • conf=X.XX"
inline std::string tooltipFor(const core::Entity &entity)
{
    std::ostringstream oss;
    oss << core::toString(entity.type) << " \xE2\x80\xA2 " << core::toString(entity.action)
        << " \xE2\x80\xA2 conf=" << std::fixed << std::setprecision(2) << entity.confidence;
    return oss.str();
}

/**
 * @brief Reject a request carrying values outside the closed enumerations
 *        or an empty locale.
 * @throw util::InvalidConfigError
 */
inline void validateRequest(const config::DeidentifyConfig &request)
{
    const int mode = static_cast<int>(request.mode);
    if (mode < static_cast<int>(core::Mode::SAFE_HARBOR) || mode > static_cast<int>(core::Mode::RISK_BASED)) {
        throw util::InvalidConfigError("mode value " + std::to_string(mode) + " out of range");
    }
    const int policy = static_cast<int>(request.policy);
    if (policy < static_cast<int>(core::Policy::HIPAA) || policy > static_cast<int>(core::Policy::CUSTOM)) {
        throw util::InvalidConfigError("policy value " + std::to_string(policy) + " out of range");
    }
    const int action = static_cast<int>(request.defaultAction);
    if (action < static_cast<int>(core::Action::REDACT) || action > static_cast<int>(core::Action::KEEP)) {
        throw util::InvalidConfigError("default_action value " + std::to_string(action) + " out of range");
    }
    if (request.locale.empty()) {
        throw util::InvalidConfigError("locale must not be empty");
    }
}

class Deidentifier
{
public:
    /**
     * @param engine   Budgets and action selection mode.
     * @param ner      NER capability; null means unavailable.
     * @param selector Overrides engine.actionSelection when set.
     */
    explicit Deidentifier(const config::EngineConfig &engine = config::EngineConfig(),
                          std::shared_ptr<const detection::NerCapability> ner = detection::unavailableNer(),
                          ActionSelector selector = ActionSelector())
        : engine_(engine),
          ner_(ner ? std::move(ner) : detection::unavailableNer()),
          selector_(selector ? std::move(selector) : makeActionSelector(engine.actionSelection)),
          detector_(detection::PatternLibrary::defaultLibrary(),
                    std::chrono::milliseconds(engine.patternBudgetMs))
    {
    }

    /**
     * @brief Run the full pipeline over @p text.
     * @throw util::InvalidConfigError before any detection if @p request is invalid.
     * @throw util::DeadlineExceededError if the call budget expires.
     * @throw util::TransformError if the selector yields an unusable action.
     */
    DeidentifyResult deidentify(const std::string &text,
                                const config::DeidentifyConfig &request) const
    {
        validateRequest(request);

        DeidentifyResult result;
        result.request.settings = request;
        result.request.timestampIso = utcTimestamp();
        result.originalTextLength = util::utf8::codepointCount(text);

        const util::Deadline callDeadline = util::Deadline::afterMillis(engine_.callBudgetMs);

        std::vector<core::Entity> candidates = detector_.detect(text, callDeadline);
        const std::size_t ruleCount = candidates.size();
        appendNerCandidates(text, result.originalTextLength, candidates);
        if (callDeadline.expired()) {
            throw util::DeadlineExceededError("call budget of " + std::to_string(engine_.callBudgetMs)
                                              + " ms exceeded after detection");
        }

        std::vector<core::Entity> resolved = resolution::OverlapResolver::resolve(candidates);
        for (auto &entity : resolved) {
            entity.action = selector_(entity, request);
        }

        result.deidentifiedText = transform::TextTransformer::apply(text, resolved, request.reversible);

        result.summary.entitiesFound = resolved.size();
        result.summary.entitiesTransformed = resolved.size();
        result.summary.reviewRequired =
            std::any_of(resolved.begin(), resolved.end(), [](const core::Entity &e) {
                return e.severity == core::Severity::HIGH && e.action != core::Action::REDACT;
            });

        result.highlights.reserve(resolved.size());
        for (const auto &entity : resolved) {
            Highlight h;
            h.entityId = entity.id;
            h.type = entity.type;
            h.start = entity.start;
            h.end = entity.end;
            h.confidence = entity.confidence;
            h.severity = entity.severity;
            h.action = entity.action;
            h.color = core::entityColor(entity.type);
            h.tooltip = tooltipFor(entity);
            result.highlights.push_back(std::move(h));
        }
        result.entities = std::move(resolved);

        util::logger::debug("Deidentifier: " + std::to_string(ruleCount) + " rule candidates, "
                            + std::to_string(candidates.size() - ruleCount) + " NER candidates, "
                            + std::to_string(result.summary.entitiesFound) + " entities over "
                            + std::to_string(result.originalTextLength) + " codepoints");
        return result;
    }

    bool nerAvailable() const { return ner_->available(); }
    std::string nerModel() const { return ner_->modelName(); }

private:
    void appendNerCandidates(const std::string &text,
                             std::size_t textLength,
                             std::vector<core::Entity> &candidates) const
    {
        if (!ner_->available()) {
            return;
        }
        if (std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); })) {
            return;
        }

        std::vector<detection::NerSpan> spans;
        try {
            spans = ner_->detect(text);
        }
        catch (const util::CapabilityUnavailableError &ex) {
            util::logger::warn(std::string("Deidentifier: NER unavailable for this call, rule-only: ")
                               + ex.what());
            return;
        }
        catch (const std::exception &ex) {
            util::logger::warn(std::string("Deidentifier: NER failed, rule-only: ") + ex.what());
            return;
        }

        std::vector<core::Entity> fromNer = detection::nerCandidates(spans, textLength, candidates.size());
        candidates.insert(candidates.end(),
                          std::make_move_iterator(fromNer.begin()),
                          std::make_move_iterator(fromNer.end()));
    }

    config::EngineConfig engine_;
    std::shared_ptr<const detection::NerCapability> ner_;
    ActionSelector selector_;
    detection::RuleDetector detector_;
};

/**
 * @brief Process-wide rule-only Deidentifier with default engine settings.
 */
inline const Deidentifier& defaultDeidentifier()
{
    static const Deidentifier instance;
    return instance;
}

/// deidentify() on defaultDeidentifier().
inline DeidentifyResult deidentify(const std::string &text, const config::DeidentifyConfig &request)
{
    return defaultDeidentifier().deidentify(text, request);
}

} // namespace pipeline
} // namespace phiscrub

#endif // PHISCRUB_PIPELINE_DEIDENTIFIER_HPP
