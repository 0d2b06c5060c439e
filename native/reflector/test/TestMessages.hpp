#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "mdns/DnsMessage.hpp"
#include "net/Forwarder.hpp"

namespace mdns_reflector
{
  namespace test
  {

    inline dns::Question question(const std::string &name, uint16_t type,
                                  uint16_t klass = dns::C_IN)
    {
      dns::Question q;
      q.name = dns::DnsName::fromString(name);
      q.type = type;
      q.klass = klass;
      return q;
    }

    inline dns::ResourceRecord record(const std::string &name, uint16_t type,
                                      std::vector<uint8_t> rdata = {})
    {
      dns::ResourceRecord rr;
      rr.name = dns::DnsName::fromString(name);
      rr.type = type;
      rr.ttl = 120;
      rr.rdata = std::move(rdata);
      return rr;
    }

    inline dns::DnsMessage query(std::vector<dns::Question> questions)
    {
      dns::DnsMessage m;
      m.questions = std::move(questions);
      return m;
    }

    inline dns::DnsMessage response(std::vector<dns::ResourceRecord> answers = {})
    {
      dns::DnsMessage m;
      m.setResponse(true);
      m.flags |= 0x0400; // AA
      m.answers = std::move(answers);
      return m;
    }

    inline std::vector<uint8_t> pack(const dns::DnsMessage &m)
    {
      auto bytes = m.encode();
      return bytes ? *bytes : std::vector<uint8_t>();
    }

    /// Records every send instead of touching the network.
    class RecordingForwarder : public Forwarder
    {
    public:
      struct Call
      {
        std::string interfaceName;
        std::vector<uint8_t> data;
      };

      void send(const std::string &interfaceName, const std::vector<uint8_t> &data) override
      {
        calls.push_back(Call{interfaceName, data});
      }

      std::vector<Call> calls;
    };

  } // namespace test
} // namespace mdns_reflector
