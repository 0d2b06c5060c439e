#include "PacketMutator.hpp"

#include "SystemEventQueue.hpp"

namespace mdns_reflector
{

  bool clearUnicastResponse(dns::DnsMessage &message)
  {
    bool modified = false;
    for (auto &q : message.questions)
    {
      if (q.unicastResponse())
      {
        q.klass &= uint16_t(~dns::CLASS_TOP_BIT);
        modified = true;
      }
    }
    return modified;
  }

  std::vector<uint8_t> forceMulticastResponses(dns::DnsMessage &message,
                                               const std::vector<uint8_t> &original)
  {
    if (!clearUnicastResponse(message))
      return original;

    auto encoded = message.encode();
    if (!encoded)
    {
      SystemEventQueue::debug("relay", "QU rewrite failed to encode, relaying original");
      return original;
    }
    return std::move(*encoded);
  }

} // namespace mdns_reflector
