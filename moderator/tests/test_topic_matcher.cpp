#include <gtest/gtest.h>
#include "topic_matcher.hpp"

TEST(TopicMatcherTest, ExactKey) {
    EXPECT_TRUE(topic_matches("violation.events", "violation.events"));
    EXPECT_FALSE(topic_matches("violation.events", "violation.event"));
    EXPECT_FALSE(topic_matches("violation.events", "violation.events.extra"));
}

TEST(TopicMatcherTest, StarMatchesOneWord) {
    EXPECT_TRUE(topic_matches("violation.*", "violation.events"));
    EXPECT_TRUE(topic_matches("*.events", "violation.events"));
    EXPECT_FALSE(topic_matches("violation.*", "violation"));
    EXPECT_FALSE(topic_matches("violation.*", "violation.events.extra"));
}

TEST(TopicMatcherTest, HashMatchesZeroOrMoreWords) {
    EXPECT_TRUE(topic_matches("#", "violation.events"));
    EXPECT_TRUE(topic_matches("violation.#", "violation"));
    EXPECT_TRUE(topic_matches("violation.#", "violation.events.extra"));
    EXPECT_TRUE(topic_matches("#.events", "violation.events"));
    EXPECT_TRUE(topic_matches("a.#.z", "a.z"));
    EXPECT_TRUE(topic_matches("a.#.z", "a.b.c.z"));
    EXPECT_FALSE(topic_matches("a.#.z", "a.b.c"));
    EXPECT_FALSE(topic_matches("post.#", "violation.events"));
}

TEST(TopicMatcherTest, MixedWildcards) {
    EXPECT_TRUE(topic_matches("*.#", "violation.events"));
    EXPECT_TRUE(topic_matches("#.#", "violation"));
    EXPECT_TRUE(topic_matches("*.*.#", "a.b"));
    EXPECT_FALSE(topic_matches("*.*.#", "a"));
}
