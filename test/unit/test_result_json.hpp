#ifndef PHISCRUB_TEST_UNIT_TEST_RESULT_JSON_HPP
#define PHISCRUB_TEST_UNIT_TEST_RESULT_JSON_HPP

#include <gtest/gtest.h>
#include <string>

#include "config/deid_config.hpp"
#include "pipeline/deidentifier.hpp"
#include "service/result_json.hpp"

namespace result_json_test {

using namespace phiscrub;

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST(ResultJsonTest, SchemaFieldsInOrder) {
    pipeline::Deidentifier engine;
    auto result = engine.deidentify("SSN: 123-45-6789", config::DeidentifyConfig());
    const std::string json = service::toJson(result);

    const std::string prefix =
        R"({"request":{"mode":"SAFE_HARBOR","policy":"HIPAA","default_action":"REDACT",)"
        R"("reversible":false,"locale":"en-US","timestamp_iso":")";
    EXPECT_EQ(json.compare(0, prefix.size(), prefix), 0) << json;

    EXPECT_TRUE(contains(json, R"("result":{"original_text_length":16,)"
                               R"("deidentified_text":"SSN: [REDACTED]",)"
                               R"("summary":{"entities_found":1,"entities_transformed":1,)"
                               R"("review_required":false})")) << json;
    EXPECT_TRUE(contains(json, R"("highlights":[{"entity_id":"E1","entity_type":"SSN",)"
                               R"("start":5,"end":16,"confidence":0.95,"severity":"HIGH",)"
                               R"("action":"REDACT","color":"#EF5350",)")) << json;
    EXPECT_TRUE(contains(json, R"("entities":[{"entity_id":"E1","type":"SSN","start":5,"end":16,)"
                               R"("confidence":0.95,"severity":"HIGH","action":"REDACT",)"
                               R"("replacement":"[REDACTED]","provenance":["regex"],)"
                               R"("notes":"No raw value recorded."}])")) << json;
    EXPECT_TRUE(contains(json, R"("risks":[],"errors":[]}})")) << json;
    EXPECT_FALSE(contains(json, "123-45-6789"));
}

TEST(ResultJsonTest, EscapesText) {
    pipeline::Deidentifier engine;
    auto result = engine.deidentify("He said \"hi\"\n\tbye", config::DeidentifyConfig());
    const std::string json = service::toJson(result);
    EXPECT_TRUE(contains(json, R"("deidentified_text":"He said \"hi\"\n\tbye")")) << json;
}

TEST(ResultJsonTest, EmptyResult) {
    pipeline::Deidentifier engine;
    auto result = engine.deidentify("", config::DeidentifyConfig());
    const std::string json = service::toJson(result);
    EXPECT_TRUE(contains(json, R"("highlights":[],"entities":[],"risks":[],"errors":[])")) << json;
    EXPECT_TRUE(contains(json, R"("entities_found":0)"));
}

TEST(ResultJsonTest, Legend) {
    const std::string json = service::legendToJson();
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_TRUE(contains(json, R"("PERSON_NAME":"#FFE082")"));
    EXPECT_TRUE(contains(json, R"("SSN":"#EF5350")"));
    EXPECT_TRUE(contains(json, R"("GENERIC_PII":"#BDBDBD")"));
}

} // namespace result_json_test

#endif // PHISCRUB_TEST_UNIT_TEST_RESULT_JSON_HPP
