#pragma once
#include <optional>
#include <string>
#include <vector>

#include "mdns/DnsMessage.hpp"

namespace mdns_reflector
{

  /**
   * @brief A decoded datagram plus the facts the relay pipeline needs.
   *
   * isResponse mirrors the QR header flag and nothing else: a response with
   * an empty answer section is still a response, and a query that happens to
   * carry known answers is still a query.
   */
  struct ClassifiedMessage
  {
    dns::DnsMessage message;
    bool isResponse = false;
    std::vector<std::string> questionNames;
    std::vector<std::string> recordNames; ///< answers followed by additionals

    /// "query" or "response", the values used by rule type lists.
    const char *typeName() const { return isResponse ? "response" : "query"; }

    /// Short description for log lines, e.g. "Questions: [myhost.local. (A)]".
    std::string summary() const;
  };

  ClassifiedMessage classify(dns::DnsMessage message);

  /// Returns std::nullopt when the datagram is not a decodable DNS message.
  std::optional<ClassifiedMessage> classify(const uint8_t *data, size_t len);

  inline std::optional<ClassifiedMessage> classify(const std::vector<uint8_t> &data)
  {
    return classify(data.data(), data.size());
  }

} // namespace mdns_reflector
