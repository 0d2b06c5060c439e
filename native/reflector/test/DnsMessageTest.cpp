#include <gtest/gtest.h>

#include "TestMessages.hpp"
#include "mdns/DnsMessage.hpp"

using namespace mdns_reflector;
using namespace mdns_reflector::dns;

namespace
{
  void appendLabel(std::vector<uint8_t> &out, const std::string &label)
  {
    out.push_back(uint8_t(label.size()));
    out.insert(out.end(), label.begin(), label.end());
  }

  std::vector<uint8_t> header(uint16_t flags, uint16_t qd, uint16_t an)
  {
    return {0x00, 0x00, uint8_t(flags >> 8), uint8_t(flags), 0x00, uint8_t(qd),
            0x00, uint8_t(an), 0x00, 0x00, 0x00, 0x00};
  }

  // Response with one PTR answer whose rdata points back at the owner name.
  std::vector<uint8_t> compressedPtrResponse()
  {
    auto buf = header(0x8400, 0, 1);
    appendLabel(buf, "_ipp"); // owner name at offset 12
    appendLabel(buf, "_tcp");
    appendLabel(buf, "local");
    buf.push_back(0);
    buf.insert(buf.end(), {0x00, 0x0c, 0x00, 0x01, 0x00, 0x00, 0x11, 0x94, 0x00, 0x0a});
    appendLabel(buf, "Printer");
    buf.insert(buf.end(), {0xc0, 0x0c});
    return buf;
  }
} // namespace

TEST(DnsMessageTest, DecodesQueryWithUnicastResponseBit)
{
  auto buf = header(0x0000, 1, 0);
  appendLabel(buf, "_airplay");
  appendLabel(buf, "_tcp");
  appendLabel(buf, "local");
  buf.push_back(0);
  buf.insert(buf.end(), {0x00, 0x0c, 0x80, 0x01});

  auto m = DnsMessage::decode(buf);
  ASSERT_TRUE(m.has_value());
  EXPECT_FALSE(m->isResponse());
  ASSERT_EQ(m->questions.size(), 1u);
  EXPECT_EQ(m->questions[0].name.toString(), "_airplay._tcp.local.");
  EXPECT_EQ(m->questions[0].type, T_PTR);
  EXPECT_EQ(m->questions[0].klass, 0x8001);
  EXPECT_TRUE(m->questions[0].unicastResponse());
}

TEST(DnsMessageTest, ExpandsCompressedNamesInRdata)
{
  auto m = DnsMessage::decode(compressedPtrResponse());
  ASSERT_TRUE(m.has_value());
  EXPECT_TRUE(m->isResponse());
  ASSERT_EQ(m->answers.size(), 1u);
  const auto &rr = m->answers[0];
  EXPECT_EQ(rr.name.toString(), "_ipp._tcp.local.");
  EXPECT_EQ(rr.type, T_PTR);
  EXPECT_EQ(rr.ttl, 4500u);

  std::vector<uint8_t> expected;
  appendLabel(expected, "Printer");
  appendLabel(expected, "_ipp");
  appendLabel(expected, "_tcp");
  appendLabel(expected, "local");
  expected.push_back(0);
  EXPECT_EQ(rr.rdata, expected);

  // The re-encoded message stands on its own.
  auto encoded = m->encode();
  ASSERT_TRUE(encoded.has_value());
  auto again = DnsMessage::decode(*encoded);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->answers[0].rdata, expected);
}

TEST(DnsMessageTest, KeepsSrvFixedFieldsWhenExpandingTarget)
{
  auto buf = header(0x8400, 0, 1);
  appendLabel(buf, "host"); // offset 12
  appendLabel(buf, "local");
  buf.push_back(0);
  buf.insert(buf.end(), {0x00, 0x21, 0x80, 0x01, 0x00, 0x00, 0x00, 0x78, 0x00, 0x08});
  buf.insert(buf.end(), {0x00, 0x00, 0x00, 0x00, 0x02, 0x77, 0xc0, 0x0c});

  auto m = DnsMessage::decode(buf);
  ASSERT_TRUE(m.has_value());
  const auto &rr = m->answers[0];
  EXPECT_EQ(rr.klass, 0x8001); // cache-flush bit preserved
  std::vector<uint8_t> expected{0x00, 0x00, 0x00, 0x00, 0x02, 0x77};
  appendLabel(expected, "host");
  appendLabel(expected, "local");
  expected.push_back(0);
  EXPECT_EQ(rr.rdata, expected);
}

TEST(DnsMessageTest, ExpandsBothNamesOfResponsiblePerson)
{
  auto buf = header(0x8400, 0, 1);
  appendLabel(buf, "host"); // offset 12
  appendLabel(buf, "local");
  buf.push_back(0);
  buf.insert(buf.end(), {0x00, 0x11, 0x00, 0x01, 0x00, 0x00, 0x00, 0x78, 0x00, 0x0a});
  appendLabel(buf, "admin"); // mbox: admin.host.local.
  buf.insert(buf.end(), {0xc0, 0x0c});
  buf.insert(buf.end(), {0xc0, 0x0c}); // txt: host.local.

  auto m = DnsMessage::decode(buf);
  ASSERT_TRUE(m.has_value());
  std::vector<uint8_t> expected;
  appendLabel(expected, "admin");
  appendLabel(expected, "host");
  appendLabel(expected, "local");
  expected.push_back(0);
  appendLabel(expected, "host");
  appendLabel(expected, "local");
  expected.push_back(0);
  EXPECT_EQ(m->answers[0].rdata, expected);
}

TEST(DnsMessageTest, RejectsTruncatedInput)
{
  EXPECT_FALSE(DnsMessage::decode(std::vector<uint8_t>{0x00, 0x00, 0x00}).has_value());

  // Header announces a question that is not there.
  EXPECT_FALSE(DnsMessage::decode(header(0x0000, 1, 0)).has_value());

  auto buf = compressedPtrResponse();
  buf.resize(buf.size() - 3); // rdata runs past the end
  EXPECT_FALSE(DnsMessage::decode(buf).has_value());
}

TEST(DnsMessageTest, RejectsCompressionLoop)
{
  auto buf = header(0x0000, 1, 0);
  buf.insert(buf.end(), {0xc0, 0x0c, 0x00, 0x01, 0x00, 0x01});
  EXPECT_FALSE(DnsMessage::decode(buf).has_value());
}

TEST(DnsMessageTest, IgnoresTrailingBytes)
{
  auto buf = compressedPtrResponse();
  buf.insert(buf.end(), {0xde, 0xad});
  auto m = DnsMessage::decode(buf);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->answers.size(), 1u);
}

TEST(DnsMessageTest, LabelsWithDotsSurvivePresentationForm)
{
  DnsName name;
  name.labels = {"Living.Room", "_airplay", "_tcp", "local"};
  EXPECT_EQ(name.toString(), "Living\\.Room._airplay._tcp.local.");
  EXPECT_EQ(DnsName::fromString(name.toString()), name);
  EXPECT_EQ(DnsName().toString(), ".");
  EXPECT_TRUE(DnsName::fromString(".").labels.empty());
}

TEST(DnsMessageTest, EncodeRejectsOversizedLabel)
{
  DnsMessage m;
  Question q;
  q.name.labels = {std::string(64, 'a'), "local"};
  q.type = T_A;
  m.questions.push_back(q);
  EXPECT_FALSE(m.encode().has_value());
}

TEST(DnsMessageTest, EncodingIsStableAcrossDecode)
{
  auto m = test::response({test::record("myhost.local.", T_A, {192, 168, 19, 10})});
  m.additionals.push_back(test::record("myhost.local.", T_AAAA, std::vector<uint8_t>(16, 0)));
  auto first = m.encode();
  ASSERT_TRUE(first.has_value());
  auto decoded = DnsMessage::decode(*first);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->encode(), first);
}

TEST(DnsMessageTest, TypeNames)
{
  EXPECT_EQ(typeName(T_A), "A");
  EXPECT_EQ(typeName(T_PTR), "PTR");
  EXPECT_EQ(typeName(T_SRV), "SRV");
  EXPECT_EQ(typeName(T_ANY), "ANY");
  EXPECT_EQ(typeName(65), "TYPE65");
}
