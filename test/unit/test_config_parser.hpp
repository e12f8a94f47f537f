#ifndef PHISCRUB_TEST_UNIT_TEST_CONFIG_PARSER_HPP
#define PHISCRUB_TEST_UNIT_TEST_CONFIG_PARSER_HPP

#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "config/deid_config.hpp"
#include "util/config_parser.hpp"
#include "util/errors.hpp"

namespace config_parser_test {

using namespace phiscrub;
using util::InvalidConfigError;

void parse(const std::string &text, config::DeidentifyConfig &request, config::EngineConfig &engine) {
    std::istringstream in(text);
    util::ConfigParser parser(request, engine);
    parser.loadFromStream(in);
}

TEST(ConfigParserTest, Defaults) {
    config::DeidentifyConfig request;
    config::EngineConfig engine;
    EXPECT_EQ(request.mode, core::Mode::SAFE_HARBOR);
    EXPECT_EQ(request.policy, core::Policy::HIPAA);
    EXPECT_EQ(request.defaultAction, core::Action::REDACT);
    EXPECT_FALSE(request.reversible);
    EXPECT_EQ(request.locale, "en-US");
    EXPECT_EQ(engine.patternBudgetMs, 250u);
    EXPECT_EQ(engine.callBudgetMs, 0u);
    EXPECT_TRUE(engine.nerEndpoint.empty());
    EXPECT_EQ(engine.actionSelection, config::ActionSelection::FIXED_REDACT);
}

TEST(ConfigParserTest, ReadsEveryKey) {
    config::DeidentifyConfig request;
    config::EngineConfig engine;
    parse("# phiscrub settings\n"
          "mode = risk_based\n"
          "policy=GENERIC_PII\n"
          "\n"
          "default_action=hash\n"
          "reversible=true\n"
          "locale=fr-FR\n"
          "pattern_budget_ms=100\n"
          "call_budget_ms=5000\n"
          "ner_endpoint=http://localhost:8000\n"
          "ner_timeout_ms=500\n"
          "action_selection=config_default\n"
          "log_level=warn\n"
          "log_file=/tmp/phiscrub-test.log\n",
          request, engine);

    EXPECT_EQ(request.mode, core::Mode::RISK_BASED);
    EXPECT_EQ(request.policy, core::Policy::GENERIC_PII);
    EXPECT_EQ(request.defaultAction, core::Action::HASH);
    EXPECT_TRUE(request.reversible);
    EXPECT_EQ(request.locale, "fr-FR");
    EXPECT_EQ(engine.patternBudgetMs, 100u);
    EXPECT_EQ(engine.callBudgetMs, 5000u);
    EXPECT_EQ(engine.nerEndpoint, "http://localhost:8000");
    EXPECT_EQ(engine.nerTimeoutMs, 500u);
    EXPECT_EQ(engine.actionSelection, config::ActionSelection::CONFIG_DEFAULT);
    EXPECT_EQ(engine.logLevel, util::logger::LogLevel::WARN);
    EXPECT_EQ(engine.logFile, "/tmp/phiscrub-test.log");
}

TEST(ConfigParserTest, UnknownKeyIsIgnored) {
    config::DeidentifyConfig request;
    config::EngineConfig engine;
    EXPECT_NO_THROW(parse("colour=blue\nlocale=de-DE\n", request, engine));
    EXPECT_EQ(request.locale, "de-DE");
}

TEST(ConfigParserTest, InvalidValuesAreRejected) {
    config::DeidentifyConfig request;
    config::EngineConfig engine;
    EXPECT_THROW(parse("mode=EXPERT\n", request, engine), InvalidConfigError);
    EXPECT_THROW(parse("policy=GDPR\n", request, engine), InvalidConfigError);
    EXPECT_THROW(parse("default_action=shred\n", request, engine), InvalidConfigError);
    EXPECT_THROW(parse("reversible=maybe\n", request, engine), InvalidConfigError);
    EXPECT_THROW(parse("locale=\n", request, engine), InvalidConfigError);
    EXPECT_THROW(parse("pattern_budget_ms=fast\n", request, engine), InvalidConfigError);
    EXPECT_THROW(parse("pattern_budget_ms=0\n", request, engine), InvalidConfigError);
    EXPECT_THROW(parse("ner_timeout_ms=-5\n", request, engine), InvalidConfigError);
    EXPECT_THROW(parse("action_selection=random\n", request, engine), InvalidConfigError);
    EXPECT_THROW(parse("log_level=verbose\n", request, engine), InvalidConfigError);
    EXPECT_THROW(parse("this line has no separator\n", request, engine), InvalidConfigError);
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    config::DeidentifyConfig request;
    config::EngineConfig engine;
    util::ConfigParser parser(request, engine);
    EXPECT_NO_THROW(parser.loadFromFile("/nonexistent/phiscrub.conf"));
    EXPECT_EQ(request.locale, "en-US");
    EXPECT_EQ(engine.patternBudgetMs, 250u);
}

} // namespace config_parser_test

#endif // PHISCRUB_TEST_UNIT_TEST_CONFIG_PARSER_HPP
