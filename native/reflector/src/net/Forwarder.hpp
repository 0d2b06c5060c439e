#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mdns_reflector
{

  /**
   * @brief Sends a datagram to the mDNS group out of one named interface.
   *
   * The production implementation is @ref MulticastSocket; tests substitute
   * a recorder.
   */
  class Forwarder
  {
  public:
    virtual ~Forwarder() = default;

    /**
     * @param interfaceName Egress interface (e.g. "vlan.10").
     * @param data Complete DNS message to send as one datagram.
     */
    virtual void send(const std::string &interfaceName, const std::vector<uint8_t> &data) = 0;
  };

} // namespace mdns_reflector
