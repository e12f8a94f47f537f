#ifndef PHISCRUB_SERVICE_RESULT_JSON_HPP
#define PHISCRUB_SERVICE_RESULT_JSON_HPP

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "core/entity.hpp"
#include "pipeline/deidentifier.hpp"
#include "util/json_string.hpp"

/**
 * @file result_json.hpp
 * @brief Serializes a DeidentifyResult into the JSON document consumed by
 *        presentation layers.
 *
 * DESIGN GOALS:
 *   - Stable field names and order:
 *       {"request":{...},"result":{"original_text_length":..,"deidentified_text":..,
 *        "summary":{...},"highlights":[...],"entities":[...],"risks":[],"errors":[]}}
 *   - Confidences printed with two decimals, booleans as true/false.
 *   - Enumerations printed by canonical name (e.g. "SSN", "REDACT").
 *   - Compact output on one line; UTF-8 text passes through unescaped.
 *
 * USAGE EXAMPLE:
 *   @code
 *   auto result = phiscrub::pipeline::deidentify("SSN: 123-45-6789", request);
 *   std::cout << phiscrub::service::toJson(result) << std::endl;
 *   @endcode
 */

namespace phiscrub {
namespace service {

namespace detail {

inline std::string confidence(double value)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

inline const char* boolean(bool value)
{
    return value ? "true" : "false";
}

inline std::string stringArray(const std::vector<std::string> &values)
{
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << util::quoteJson(values[i]);
    }
    oss << "]";
    return oss.str();
}

inline std::string requestJson(const pipeline::RequestEcho &echo)
{
    std::ostringstream oss;
    oss << "{";
    oss << R"("mode":")" << core::toString(echo.settings.mode) << "\",";
    oss << R"("policy":")" << core::toString(echo.settings.policy) << "\",";
    oss << R"("default_action":")" << core::toString(echo.settings.defaultAction) << "\",";
    oss << R"("reversible":)" << boolean(echo.settings.reversible) << ",";
    oss << R"("locale":)" << util::quoteJson(echo.settings.locale) << ",";
    oss << R"("timestamp_iso":)" << util::quoteJson(echo.timestampIso);
    oss << "}";
    return oss.str();
}

inline std::string highlightJson(const pipeline::Highlight &h)
{
    std::ostringstream oss;
    oss << "{";
    oss << R"("entity_id":)" << util::quoteJson(h.entityId) << ",";
    oss << R"("entity_type":")" << core::toString(h.type) << "\",";
    oss << R"("start":)" << h.start << ",";
    oss << R"("end":)" << h.end << ",";
    oss << R"("confidence":)" << confidence(h.confidence) << ",";
    oss << R"("severity":")" << core::toString(h.severity) << "\",";
    oss << R"("action":")" << core::toString(h.action) << "\",";
    oss << R"("color":)" << util::quoteJson(h.color) << ",";
    oss << R"("tooltip":)" << util::quoteJson(h.tooltip);
    oss << "}";
    return oss.str();
}

inline std::string entityJson(const core::Entity &e)
{
    std::ostringstream oss;
    oss << "{";
    oss << R"("entity_id":)" << util::quoteJson(e.id) << ",";
    oss << R"("type":")" << core::toString(e.type) << "\",";
    oss << R"("start":)" << e.start << ",";
    oss << R"("end":)" << e.end << ",";
    oss << R"("confidence":)" << confidence(e.confidence) << ",";
    oss << R"("severity":")" << core::toString(e.severity) << "\",";
    oss << R"("action":")" << core::toString(e.action) << "\",";
    oss << R"("replacement":)" << util::quoteJson(e.replacement) << ",";
    oss << R"("provenance":)" << stringArray(e.provenance) << ",";
    oss << R"("notes":)" << util::quoteJson(e.notes);
    oss << "}";
    return oss.str();
}

} // namespace detail

/**
 * @brief The JSON document of @p result.
 */
inline std::string toJson(const pipeline::DeidentifyResult &result)
{
    std::ostringstream oss;
    oss << "{";
    oss << R"("request":)" << detail::requestJson(result.request) << ",";

    oss << R"("result":{)";
    oss << R"("original_text_length":)" << result.originalTextLength << ",";
    oss << R"("deidentified_text":)" << util::quoteJson(result.deidentifiedText) << ",";
    oss << R"("summary":{)"
        << R"("entities_found":)" << result.summary.entitiesFound << ","
        << R"("entities_transformed":)" << result.summary.entitiesTransformed << ","
        << R"("review_required":)" << detail::boolean(result.summary.reviewRequired)
        << "},";

    oss << R"("highlights":[)";
    for (std::size_t i = 0; i < result.highlights.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << detail::highlightJson(result.highlights[i]);
    }
    oss << "],";

    oss << R"("entities":[)";
    for (std::size_t i = 0; i < result.entities.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << detail::entityJson(result.entities[i]);
    }
    oss << "],";

    oss << R"("risks":)" << detail::stringArray(result.risks) << ",";
    oss << R"("errors":)" << detail::stringArray(result.errors);
    oss << "}}";
    return oss.str();
}

/**
 * @brief The entity legend as a JSON object, {"PERSON_NAME":"#FFE082", ...}.
 */
inline std::string legendToJson()
{
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto &entry : core::entityLegend()) {
        if (!first) {
            oss << ",";
        }
        oss << "\"" << core::toString(entry.first) << "\":" << util::quoteJson(entry.second);
        first = false;
    }
    oss << "}";
    return oss.str();
}

} // namespace service
} // namespace phiscrub

#endif // PHISCRUB_SERVICE_RESULT_JSON_HPP
