#ifndef PHISCRUB_TEST_UNIT_TEST_UTF8_HPP
#define PHISCRUB_TEST_UNIT_TEST_UTF8_HPP

#include <chrono>
#include <gtest/gtest.h>
#include <string>

#include "util/deadline.hpp"
#include "util/hashing.hpp"
#include "util/utf8.hpp"

/**
 * @file test_utf8.hpp
 * @brief Offset conversion, deadlines and digests used across the pipeline.
 */

namespace utf8_test {

using namespace phiscrub::util;

// "José Ünal": é and Ü are two bytes each.
const std::string kAccented = "Jos\xC3\xA9 \xC3\x9Cnal";

TEST(Utf8Test, CountsCodepointsNotBytes) {
    EXPECT_EQ(kAccented.size(), 11u);
    EXPECT_EQ(utf8::codepointCount(kAccented), 9u);
    EXPECT_EQ(utf8::codepointCount(""), 0u);
}

TEST(Utf8Test, IndexMapsBothWays) {
    utf8::CodepointIndex index(kAccented);
    EXPECT_EQ(index.size(), 9u);
    EXPECT_EQ(index.toByte(4), 5u);
    EXPECT_EQ(index.toCodepoint(5), 4u);
    // A byte inside é rounds up to the next codepoint.
    EXPECT_EQ(index.toCodepoint(4), 4u);
    EXPECT_EQ(index.toByte(100), kAccented.size());
    EXPECT_EQ(index.toCodepoint(kAccented.size()), 9u);
}

TEST(Utf8Test, SubstrAndSplit) {
    utf8::CodepointIndex index(kAccented);
    EXPECT_EQ(utf8::substr(kAccented, index, 0, 4), "Jos\xC3\xA9");
    EXPECT_EQ(utf8::substr(kAccented, index, 5, 9), "\xC3\x9Cnal");
    EXPECT_EQ(utf8::substr(kAccented, index, 3, 3), "");

    auto cps = utf8::codepoints("a\xC3\xB1" "b");
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[1], "\xC3\xB1");
}

TEST(Utf8Test, LeadByteWithoutContinuationIsOneCodepoint) {
    // \xC3 announces a two-byte sequence but '1' is not a continuation byte.
    const std::string text = "SSN \xC3" "123";
    EXPECT_EQ(utf8::sequenceLengthAt(text, 4), 1u);
    EXPECT_EQ(utf8::codepointCount(text), 8u);

    utf8::CodepointIndex index(text);
    EXPECT_EQ(index.size(), 8u);
    EXPECT_EQ(index.toCodepoint(5), 5u);
    EXPECT_EQ(index.toByte(5), 5u);
    EXPECT_EQ(utf8::substr(text, index, 5, 8), "123");

    auto cps = utf8::codepoints(text);
    ASSERT_EQ(cps.size(), 8u);
    EXPECT_EQ(cps[4], "\xC3");
    EXPECT_EQ(cps[5], "1");

    // Truncated at the end, and a byte that is never a lead.
    EXPECT_EQ(utf8::codepointCount("ab\xE2\x82"), 4u);
    EXPECT_EQ(utf8::codepointCount("\xFF\xFE"), 2u);
}

TEST(DeadlineTest, NoneNeverExpires) {
    Deadline d = Deadline::none();
    EXPECT_TRUE(d.unlimited());
    EXPECT_FALSE(d.expired());
    EXPECT_TRUE(Deadline::afterMillis(0).unlimited());
}

TEST(DeadlineTest, ZeroBudgetExpiresImmediately) {
    EXPECT_TRUE(Deadline::after(std::chrono::milliseconds(0)).expired());
    EXPECT_FALSE(Deadline::after(std::chrono::hours(1)).expired());
}

TEST(DeadlineTest, EarliestPicksTighterBound) {
    Deadline loose = Deadline::none();
    Deadline tight = Deadline::after(std::chrono::milliseconds(0));
    EXPECT_TRUE(Deadline::earliest(loose, tight).expired());
    EXPECT_FALSE(Deadline::earliest(loose, Deadline::after(std::chrono::hours(1))).unlimited());
}

TEST(HashingTest, Sha256KnownVector) {
    EXPECT_EQ(hashing::sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hashing::sha256HexPrefix("abc", 16), "ba7816bf8f01cfea");
}

} // namespace utf8_test

#endif // PHISCRUB_TEST_UNIT_TEST_UTF8_HPP
