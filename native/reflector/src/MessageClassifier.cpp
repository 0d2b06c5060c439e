#include "MessageClassifier.hpp"

#include <algorithm>
#include <sstream>

namespace mdns_reflector
{

  namespace
  {
    constexpr size_t SUMMARY_ENTRIES = 3;

    std::string joinEntries(const std::vector<std::string> &entries)
    {
      std::stringstream ss;
      const size_t shown = std::min(entries.size(), SUMMARY_ENTRIES);
      for (size_t i = 0; i < shown; ++i)
      {
        if (i > 0)
          ss << ", ";
        ss << entries[i];
      }
      if (entries.size() > SUMMARY_ENTRIES)
        ss << " ... +" << (entries.size() - SUMMARY_ENTRIES) << " more";
      return ss.str();
    }

    std::string describe(const dns::DnsName &name, uint16_t type)
    {
      return name.toString() + " (" + dns::typeName(type) + ")";
    }
  } // namespace

  std::string ClassifiedMessage::summary() const
  {
    std::vector<std::string> entries;
    if (!isResponse)
    {
      for (const auto &q : message.questions)
        entries.push_back(describe(q.name, q.type));
      return "Questions: [" + joinEntries(entries) + "]";
    }

    for (const auto &rr : message.answers)
      entries.push_back(describe(rr.name, rr.type));
    for (const auto &rr : message.additionals)
      entries.push_back(describe(rr.name, rr.type));
    if (entries.empty())
      return "No records";
    return "Records: [" + joinEntries(entries) + "]";
  }

  ClassifiedMessage classify(dns::DnsMessage message)
  {
    ClassifiedMessage c;
    c.isResponse = message.isResponse();
    for (const auto &q : message.questions)
      c.questionNames.push_back(q.name.toString());
    for (const auto &rr : message.answers)
      c.recordNames.push_back(rr.name.toString());
    for (const auto &rr : message.additionals)
      c.recordNames.push_back(rr.name.toString());
    c.message = std::move(message);
    return c;
  }

  std::optional<ClassifiedMessage> classify(const uint8_t *data, size_t len)
  {
    auto message = dns::DnsMessage::decode(data, len);
    if (!message)
      return std::nullopt;
    return classify(std::move(*message));
  }

} // namespace mdns_reflector
