#pragma once
#include <cstdint>
#include <vector>

#include "mdns/DnsMessage.hpp"

namespace mdns_reflector
{

  /**
   * Clears the QU bit (RFC 6762 §5.4) on every question of the message.
   * @return true if at least one question was changed.
   */
  bool clearUnicastResponse(dns::DnsMessage &message);

  /**
   * @brief Produces the bytes to relay for an ingress query.
   *
   * Responders honouring a QU question answer by unicast to the querier,
   * which is on another segment and never reaches the reflector. Clearing
   * the bit makes them answer on their own segment's multicast group where
   * the reflector can pick the answer up.
   *
   * @param message Decoded query; its questions are modified in place.
   * @param original The datagram as received.
   * @return The re-encoded message when a bit was cleared, otherwise (or if
   *         encoding fails) the original bytes.
   */
  std::vector<uint8_t> forceMulticastResponses(dns::DnsMessage &message,
                                               const std::vector<uint8_t> &original);

} // namespace mdns_reflector
