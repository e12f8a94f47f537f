#ifndef PHISCRUB_TEST_UNIT_TEST_OVERLAP_RESOLVER_HPP
#define PHISCRUB_TEST_UNIT_TEST_OVERLAP_RESOLVER_HPP

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "core/entity.hpp"
#include "detection/rule_detector.hpp"
#include "resolution/overlap_resolver.hpp"

/**
 * @file test_overlap_resolver.hpp
 * @brief Tie-break policy and disjointness of the resolved set.
 */

namespace overlap_resolver_test {

using phiscrub::core::Entity;
using phiscrub::core::EntityType;
using phiscrub::core::Severity;
using phiscrub::resolution::OverlapResolver;

Entity make(const std::string &id, std::size_t start, std::size_t end, double conf,
            Severity sev, EntityType type = EntityType::GENERIC_PII) {
    Entity e;
    e.id = id;
    e.type = type;
    e.start = start;
    e.end = end;
    e.confidence = conf;
    e.severity = sev;
    return e;
}

void expectDisjoint(const std::vector<Entity> &set) {
    for (std::size_t i = 0; i < set.size(); ++i) {
        for (std::size_t j = i + 1; j < set.size(); ++j) {
            EXPECT_FALSE(set[i].start < set[j].end && set[i].end > set[j].start)
                << set[i].id << " overlaps " << set[j].id;
        }
    }
}

TEST(OverlapResolverTest, EmptyInput) {
    EXPECT_TRUE(OverlapResolver::resolve({}).empty());
}

TEST(OverlapResolverTest, LongerSpanWins) {
    auto out = OverlapResolver::resolve({
        make("E1", 0, 5, 0.99, Severity::HIGH),
        make("E2", 0, 10, 0.10, Severity::LOW),
    });
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, "E2");
}

TEST(OverlapResolverTest, EqualLengthPrefersLowerConfidence) {
    auto out = OverlapResolver::resolve({
        make("E1", 0, 10, 0.90, Severity::HIGH),
        make("E2", 2, 12, 0.50, Severity::HIGH),
    });
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, "E2");
}

TEST(OverlapResolverTest, EqualLengthAndConfidencePrefersLowerSeverity) {
    auto out = OverlapResolver::resolve({
        make("E1", 0, 10, 0.80, Severity::HIGH),
        make("E2", 0, 10, 0.80, Severity::MEDIUM),
    });
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, "E2");
}

TEST(OverlapResolverTest, IdenticalKeysKeepInputOrder) {
    auto out = OverlapResolver::resolve({
        make("E7", 11, 21, 0.80, Severity::LOW, EntityType::DATE),
        make("E9", 11, 21, 0.80, Severity::LOW, EntityType::DATE),
    });
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, "E7");
}

TEST(OverlapResolverTest, SsnLosesToPassportOnSameDigits) {
    auto out = OverlapResolver::resolve({
        make("E1", 5, 14, 0.95, Severity::HIGH, EntityType::SSN),
        make("E2", 5, 14, 0.85, Severity::HIGH, EntityType::PASSPORT),
    });
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].type, EntityType::PASSPORT);
}

TEST(OverlapResolverTest, AdjacentSpansBothSurvive) {
    auto out = OverlapResolver::resolve({
        make("E1", 0, 5, 0.80, Severity::LOW),
        make("E2", 5, 9, 0.80, Severity::LOW),
    });
    EXPECT_EQ(out.size(), 2u);
}

TEST(OverlapResolverTest, ResultIsInAcceptanceOrder) {
    auto out = OverlapResolver::resolve({
        make("E1", 0, 3, 0.80, Severity::LOW),
        make("E2", 10, 20, 0.80, Severity::LOW),
        make("E3", 30, 36, 0.80, Severity::LOW),
    });
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].id, "E2");
    EXPECT_EQ(out[1].id, "E3");
    EXPECT_EQ(out[2].id, "E1");
}

TEST(OverlapResolverTest, ChainOfOverlaps) {
    // E2 is longest and blocks E1 and E3, which do not touch each other.
    std::vector<Entity> raw = {
        make("E1", 0, 6, 0.80, Severity::LOW),
        make("E2", 4, 14, 0.80, Severity::LOW),
        make("E3", 12, 18, 0.80, Severity::LOW),
        make("E4", 20, 22, 0.80, Severity::LOW),
    };
    auto out = OverlapResolver::resolve(raw);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].id, "E2");
    EXPECT_EQ(out[1].id, "E4");
    expectDisjoint(out);
    EXPECT_LE(out.size(), raw.size());
}

TEST(OverlapResolverTest, DetectorOutputResolvesToDisjointSet) {
    phiscrub::detection::RuleDetector detector;
    const std::string text =
        "Patient John Smith (SSN: 123-45-6789) visited on 01/15/2024. "
        "Contact: john.smith@email.com, phone 555-123-4567, 42 Main Street.";
    auto raw = detector.detect(text);
    auto resolved = OverlapResolver::resolve(raw);
    EXPECT_LE(resolved.size(), raw.size());
    EXPECT_FALSE(resolved.empty());
    expectDisjoint(resolved);
}

} // namespace overlap_resolver_test

#endif // PHISCRUB_TEST_UNIT_TEST_OVERLAP_RESOLVER_HPP
