#include <gtest/gtest.h>

#include "MessageClassifier.hpp"
#include "TestMessages.hpp"

using namespace mdns_reflector;
using mdns_reflector::test::pack;
using mdns_reflector::test::question;
using mdns_reflector::test::record;

TEST(MessageClassifierTest, QueryIsNotResponse)
{
  auto c = classify(pack(test::query({question("myhost.local.", dns::T_A)})));
  ASSERT_TRUE(c.has_value());
  EXPECT_FALSE(c->isResponse);
  EXPECT_STREQ(c->typeName(), "query");
  ASSERT_EQ(c->questionNames.size(), 1u);
  EXPECT_EQ(c->questionNames[0], "myhost.local.");
}

TEST(MessageClassifierTest, ResponseFlagDecidesEvenWithoutAnswers)
{
  auto c = classify(pack(test::response()));
  ASSERT_TRUE(c.has_value());
  EXPECT_TRUE(c->isResponse);
  EXPECT_STREQ(c->typeName(), "response");
}

TEST(MessageClassifierTest, QueryWithKnownAnswersStaysQuery)
{
  auto m = test::query({question("_airplay._tcp.local.", dns::T_PTR)});
  m.answers.push_back(record("_airplay._tcp.local.", dns::T_PTR));
  auto c = classify(pack(m));
  ASSERT_TRUE(c.has_value());
  EXPECT_FALSE(c->isResponse);
  ASSERT_EQ(c->recordNames.size(), 1u);
}

TEST(MessageClassifierTest, UndecodableDatagramIsRejected)
{
  EXPECT_FALSE(classify(std::vector<uint8_t>{0x01, 0x02, 0x03}).has_value());
}

TEST(MessageClassifierTest, RecordNamesCoverAnswersAndAdditionals)
{
  auto m = test::response({record("a1.", dns::T_A)});
  m.authorities.push_back(record("ns.", dns::T_NS));
  m.additionals.push_back(record("a2.", dns::T_AAAA));
  auto c = classify(pack(m));
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->recordNames, (std::vector<std::string>{"a1.", "a2."}));
}

TEST(MessageSummaryTest, Query)
{
  auto c = classify(test::query({question("q1.", dns::T_A), question("q2.", dns::T_PTR)}));
  EXPECT_EQ(c.summary(), "Questions: [q1. (A), q2. (PTR)]");
}

TEST(MessageSummaryTest, LongQueryIsElided)
{
  auto c = classify(test::query({question("q1.", dns::T_A), question("q2.", dns::T_A),
                                 question("q3.", dns::T_A), question("q4.", dns::T_A)}));
  EXPECT_EQ(c.summary(), "Questions: [q1. (A), q2. (A), q3. (A) ... +1 more]");
}

TEST(MessageSummaryTest, Response)
{
  auto c = classify(test::response({record("a1.", dns::T_A)}));
  EXPECT_EQ(c.summary(), "Records: [a1. (A)]");
}

TEST(MessageSummaryTest, EmptyResponse)
{
  auto c = classify(test::response());
  EXPECT_EQ(c.summary(), "No records");
}
