/**
 * @file      DnsMessage.hpp
 * @brief     DNS message wire codec for the mDNS reflector.
 *
 * @details   Decodes a datagram into header, questions and resource records
 *            and encodes it back. Names are kept as label sequences so
 *            labels containing dots survive a round trip. Names embedded in
 *            the rdata of PTR, CNAME, NS, DNAME, SRV, MX, SOA, NSEC, RP,
 *            AFSDB, RT, KX and PX records (the types RFC 6762 allows to be
 *            compressed) are expanded on decode, and every name is written uncompressed on
 *            encode, so a re-encoded message never holds a compression
 *            pointer into the original datagram.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mdns_reflector
{
  namespace dns
  {

    static constexpr uint16_t MDNS_PORT = 5353;
    static constexpr const char *MDNS_ADDR4 = "224.0.0.251";

    // DNS types
    enum : uint16_t
    {
      T_A = 1,
      T_NS = 2,
      T_CNAME = 5,
      T_SOA = 6,
      T_PTR = 12,
      T_HINFO = 13,
      T_MX = 15,
      T_TXT = 16,
      T_RP = 17,
      T_AFSDB = 18,
      T_RT = 21,
      T_PX = 26,
      T_AAAA = 28,
      T_SRV = 33,
      T_KX = 36,
      T_DNAME = 39,
      T_NSEC = 47,
      T_ANY = 255
    };

    static constexpr uint16_t C_IN = 1;

    /// QR bit of the header flags.
    static constexpr uint16_t FLAG_QR = 0x8000;

    /// Top bit of the class field: QU in questions, cache-flush in records.
    static constexpr uint16_t CLASS_TOP_BIT = 0x8000;

    static constexpr size_t HEADER_SIZE = 12;
    static constexpr size_t MAX_LABEL = 63;
    static constexpr size_t MAX_NAME = 255;

    /// Mnemonic for a record type ("A", "PTR", ...) or "TYPE<n>".
    std::string typeName(uint16_t type);

    struct DnsName
    {
      std::vector<std::string> labels;

      /// Presentation form with a trailing dot ("myhost.local."); the root
      /// is ".". Dots and backslashes inside a label are escaped.
      std::string toString() const;

      /// Parses presentation form, honouring "\." and "\\" escapes.
      static DnsName fromString(const std::string &text);

      bool operator==(const DnsName &other) const { return labels == other.labels; }
    };

    struct Question
    {
      DnsName name;
      uint16_t type = 0;
      uint16_t klass = C_IN; ///< Raw class including the QU bit.

      bool unicastResponse() const { return (klass & CLASS_TOP_BIT) != 0; }
    };

    struct ResourceRecord
    {
      DnsName name;
      uint16_t type = 0;
      uint16_t klass = C_IN; ///< Raw class including the cache-flush bit.
      uint32_t ttl = 0;
      std::vector<uint8_t> rdata; ///< Uncompressed rdata.
    };

    class DnsMessage
    {
    public:
      uint16_t id = 0;
      uint16_t flags = 0;
      std::vector<Question> questions;
      std::vector<ResourceRecord> answers;
      std::vector<ResourceRecord> authorities;
      std::vector<ResourceRecord> additionals;

      bool isResponse() const { return (flags & FLAG_QR) != 0; }
      void setResponse(bool response)
      {
        flags = response ? (flags | FLAG_QR) : (flags & ~FLAG_QR);
      }

      /// Returns std::nullopt for truncated or malformed input.
      static std::optional<DnsMessage> decode(const uint8_t *data, size_t len);
      static std::optional<DnsMessage> decode(const std::vector<uint8_t> &data)
      {
        return decode(data.data(), data.size());
      }

      /// Returns std::nullopt when a label or name exceeds the wire limits
      /// or a section holds more than 65535 entries.
      std::optional<std::vector<uint8_t>> encode() const;
    };

  } // namespace dns
} // namespace mdns_reflector
