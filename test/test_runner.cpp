// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test runner for phiscrub. Every unit and integration suite lives in
// a header under test/unit or test/integration and is pulled in here.

#include <gtest/gtest.h>

#include "util/logger.hpp"

#include "unit/test_utf8.hpp"
#include "unit/test_entity_types.hpp"
#include "unit/test_rule_detector.hpp"
#include "unit/test_overlap_resolver.hpp"
#include "unit/test_text_transformer.hpp"
#include "unit/test_config_parser.hpp"
#include "unit/test_ner_capability.hpp"
#include "unit/test_deidentifier.hpp"
#include "unit/test_result_json.hpp"
#include "integration/test_batch_flow.hpp"

int main(int argc, char** argv) {
    // Expected failures (dropped patterns, unreachable NER) log at WARN.
    phiscrub::util::logger::setLogLevel(phiscrub::util::logger::LogLevel::ERROR);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
