#ifndef PHISCRUB_CONFIG_DEID_CONFIG_HPP
#define PHISCRUB_CONFIG_DEID_CONFIG_HPP

#include <cstdint>
#include <string>

#include "core/entity_types.hpp"
#include "util/logger.hpp"

/**
 * @file deid_config.hpp
 * @brief Configuration values for phiscrub.
 *
 * USAGE:
 *   - DeidentifyConfig is the per-call request. It is passed by const
 *     reference into every deidentify() call and never stored.
 *   - EngineConfig is fixed when a Deidentifier is built.
 *   - Both can be populated manually or through util/config_parser.hpp.
 */

namespace phiscrub {
namespace config {

/**
 * @struct DeidentifyConfig
 * @brief Per-call request settings, echoed back in the result:
 *   - mode: SAFE_HARBOR or RISK_BASED.
 *   - policy: HIPAA, GENERIC_PII or CUSTOM.
 *   - defaultAction: requested action for detected entities (applied only
 *     when the engine uses ActionSelection::CONFIG_DEFAULT).
 *   - reversible: forward-compatible flag, no effect on the transformation.
 *   - locale: BCP-47 tag, echoed.
 */
struct DeidentifyConfig
{
    DeidentifyConfig()
        : mode(core::Mode::SAFE_HARBOR),
          policy(core::Policy::HIPAA),
          defaultAction(core::Action::REDACT),
          reversible(false),
          locale("en-US")
    {
    }

    core::Mode mode;
    core::Policy policy;
    core::Action defaultAction;
    bool reversible;
    std::string locale;
};

/// How the pipeline picks the action of each resolved entity.
enum class ActionSelection {
    FIXED_REDACT,     ///< every entity is redacted, whatever defaultAction says
    CONFIG_DEFAULT    ///< every entity gets DeidentifyConfig::defaultAction
};

/**
 * @struct EngineConfig
 * @brief Settings of one pipeline instance:
 *   - patternBudgetMs: time budget of a single matcher over one text.
 *   - callBudgetMs: budget of a whole detection run, 0 = unlimited.
 *   - nerEndpoint: base URL of a NER service, empty = NER unavailable.
 *   - nerTimeoutMs: transport timeout of a NER request.
 *   - actionSelection: see ActionSelection.
 *   - logLevel / logFile: ambient logging.
 */
struct EngineConfig
{
    EngineConfig()
        : patternBudgetMs(250),
          callBudgetMs(0),
          nerEndpoint(),
          nerTimeoutMs(2000),
          actionSelection(ActionSelection::FIXED_REDACT),
          logLevel(util::logger::LogLevel::INFO),
          logFile()
    {
    }

    uint64_t patternBudgetMs;
    uint64_t callBudgetMs;
    std::string nerEndpoint;
    uint64_t nerTimeoutMs;
    ActionSelection actionSelection;
    util::logger::LogLevel logLevel;
    std::string logFile;
};

} // namespace config
} // namespace phiscrub

#endif // PHISCRUB_CONFIG_DEID_CONFIG_HPP
