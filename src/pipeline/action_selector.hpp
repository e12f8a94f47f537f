#ifndef PHISCRUB_PIPELINE_ACTION_SELECTOR_HPP
#define PHISCRUB_PIPELINE_ACTION_SELECTOR_HPP

#include <functional>

#include "config/deid_config.hpp"
#include "core/entity.hpp"

namespace phiscrub {
namespace pipeline {

/**
 * @brief Picks the action of a resolved entity, given the per-call request.
 *
 * The default engine behaviour redacts everything regardless of
 * DeidentifyConfig::defaultAction. A policy engine can be plugged in here
 * without touching the rest of the pipeline.
 */
using ActionSelector =
    std::function<core::Action(const core::Entity &, const config::DeidentifyConfig &)>;

/// Every entity is redacted.
inline ActionSelector fixedRedactSelector()
{
    return [](const core::Entity &, const config::DeidentifyConfig &) {
        return core::Action::REDACT;
    };
}

/// Every entity gets the requested default action.
inline ActionSelector configDefaultSelector()
{
    return [](const core::Entity &, const config::DeidentifyConfig &request) {
        return request.defaultAction;
    };
}

inline ActionSelector makeActionSelector(config::ActionSelection selection)
{
    switch (selection) {
    case config::ActionSelection::CONFIG_DEFAULT:
        return configDefaultSelector();
    case config::ActionSelection::FIXED_REDACT:
        break;
    }
    return fixedRedactSelector();
}

} // namespace pipeline
} // namespace phiscrub

#endif // PHISCRUB_PIPELINE_ACTION_SELECTOR_HPP
