#ifndef PHISCRUB_TEST_INTEGRATION_TEST_BATCH_FLOW_HPP
#define PHISCRUB_TEST_INTEGRATION_TEST_BATCH_FLOW_HPP

#include <future>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "config/deid_config.hpp"
#include "pipeline/batch_runner.hpp"
#include "pipeline/deidentifier.hpp"
#include "service/result_json.hpp"
#include "util/config_parser.hpp"
#include "util/errors.hpp"

/**
 * @file test_batch_flow.hpp
 * @brief Configuration file -> pipeline -> JSON, and many documents through
 *        one shared pipeline at once.
 *
 * DESIGN:
 *   - Each document carries its own request; results must not bleed between
 *     concurrent calls.
 *   - A failing document only fails its own future.
 */

namespace batch_flow_test {

using namespace phiscrub;

TEST(BatchRunnerTest, ResultsComeBackInSubmissionOrder) {
    config::EngineConfig engineConfig;
    engineConfig.actionSelection = config::ActionSelection::CONFIG_DEFAULT;
    pipeline::Deidentifier engine(engineConfig);
    pipeline::BatchRunner runner(engine, 4);
    EXPECT_EQ(runner.threadCount(), 4u);

    const core::Action actions[] = {
        core::Action::REDACT, core::Action::MASK, core::Action::TOKENIZE, core::Action::KEEP
    };
    const std::string expected[] = {
        "SSN: [REDACTED]", "SSN: 1*********9", "SSN: [SSN]", "SSN: "
    };

    std::vector<pipeline::BatchItem> items;
    for (int round = 0; round < 25; ++round) {
        for (core::Action action : actions) {
            pipeline::BatchItem item;
            item.text = "SSN: 123-45-6789";
            item.request.defaultAction = action;
            items.push_back(item);
        }
    }

    auto futures = runner.submitAll(items);
    ASSERT_EQ(futures.size(), items.size());
    for (std::size_t i = 0; i < futures.size(); ++i) {
        auto result = futures[i].get();
        EXPECT_EQ(result.deidentifiedText, expected[i % 4]) << "document " << i;
        EXPECT_EQ(result.request.settings.defaultAction, actions[i % 4]);
    }
}

TEST(BatchRunnerTest, FailureStaysInItsOwnFuture) {
    pipeline::Deidentifier engine;
    pipeline::BatchRunner runner(engine, 2);

    config::DeidentifyConfig good;
    config::DeidentifyConfig bad;
    bad.locale = "";

    auto first = runner.submit("SSN: 123-45-6789", good);
    auto broken = runner.submit("SSN: 123-45-6789", bad);
    auto last = runner.submit("Contact: john.doe@example.com", good);

    EXPECT_EQ(first.get().deidentifiedText, "SSN: [REDACTED]");
    EXPECT_THROW(broken.get(), util::InvalidConfigError);
    EXPECT_EQ(last.get().deidentifiedText, "Contact: [REDACTED]");
}

TEST(BatchRunnerTest, DestructorDrainsQueue) {
    pipeline::Deidentifier engine;
    std::vector<std::future<pipeline::DeidentifyResult>> futures;
    {
        pipeline::BatchRunner runner(engine, 1);
        for (int i = 0; i < 10; ++i) {
            futures.push_back(runner.submit("Contact: john.doe@example.com", config::DeidentifyConfig()));
        }
    }
    for (auto &f : futures) {
        EXPECT_EQ(f.get().summary.entitiesFound, 1u);
    }
}

TEST(BatchRunnerTest, LongDocumentsOnWorkerThreads) {
    config::EngineConfig engineConfig;
    engineConfig.patternBudgetMs = 10000;
    pipeline::Deidentifier engine(engineConfig);
    pipeline::BatchRunner runner(engine, 2);

    const std::string word(200000, 'x');
    auto plain = runner.submit(word, config::DeidentifyConfig());
    auto secret = runner.submit("pwd:" + word, config::DeidentifyConfig());
    EXPECT_EQ(plain.get().deidentifiedText, word);
    EXPECT_EQ(secret.get().deidentifiedText, "pwd:[REDACTED]");
}

TEST(EndToEndTest, ConfigDrivenRunToJson) {
    config::DeidentifyConfig request;
    config::EngineConfig engineConfig;
    std::istringstream conf("policy=generic_pii\n"
                            "default_action=tokenize\n"
                            "action_selection=config_default\n"
                            "pattern_budget_ms=500\n"
                            "call_budget_ms=60000\n");
    util::ConfigParser parser(request, engineConfig);
    parser.loadFromStream(conf);

    pipeline::Deidentifier engine(engineConfig);
    auto result = engine.deidentify(
        "Patient John Smith (SSN: 123-45-6789) visited on 01/15/2024. "
        "Contact: john.smith@email.com",
        request);

    EXPECT_EQ(result.deidentifiedText,
              "[PERSON_NAME] Smith (SSN: [SSN]) visited on [DATE]. Contact: [EMAIL]");
    EXPECT_TRUE(result.summary.reviewRequired);

    const std::string json = service::toJson(result);
    EXPECT_NE(json.find(R"("policy":"GENERIC_PII","default_action":"TOKENIZE")"), std::string::npos);
    EXPECT_NE(json.find(R"("review_required":true)"), std::string::npos);
    EXPECT_EQ(json.find("123-45-6789"), std::string::npos);
}

TEST(EndToEndTest, ConcurrentCallsOnSharedPipeline) {
    pipeline::Deidentifier engine;
    std::vector<std::thread> threads;
    std::vector<std::string> outputs(8);
    for (std::size_t t = 0; t < outputs.size(); ++t) {
        threads.emplace_back([&engine, &outputs, t] {
            config::DeidentifyConfig request;
            request.locale = "en-" + std::to_string(t);
            auto result = engine.deidentify("Dr. MacKenzie called 555-123-4567.", request);
            outputs[t] = result.request.settings.locale + "|" + result.deidentifiedText;
        });
    }
    for (auto &th : threads) {
        th.join();
    }
    for (std::size_t t = 0; t < outputs.size(); ++t) {
        EXPECT_EQ(outputs[t], "en-" + std::to_string(t) + "|[REDACTED] called [REDACTED].");
    }
}

} // namespace batch_flow_test

#endif // PHISCRUB_TEST_INTEGRATION_TEST_BATCH_FLOW_HPP
