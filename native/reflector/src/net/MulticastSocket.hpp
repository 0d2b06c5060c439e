/**
 * @file
 * @brief IPv4 multicast UDP socket shared by the reflector's listener and
 * forwarder.
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "Forwarder.hpp"

namespace mdns_reflector
{

  /**
   * @class MulticastSocket
   * @brief One UDP socket bound to the group port on all addresses.
   *
   * Received datagrams carry the index of the interface they arrived on
   * (IP_PKTINFO). Sends name the egress interface the same way, so a single
   * socket serves every configured interface.
   */
  class MulticastSocket : public Forwarder
  {
  public:
    struct Datagram
    {
      std::vector<uint8_t> data;
      std::string sourceIp;
      int interfaceIndex = -1; ///< -1 when no control message was attached
    };

    /**
     * @param multicastIP IP address of the multicast group.
     * @param port Port to bind and to send to.
     */
    MulticastSocket(const std::string &multicastIP, unsigned short port);

    /// Closes the socket if still open.
    ~MulticastSocket() override;

    MulticastSocket(const MulticastSocket &) = delete;
    MulticastSocket &operator=(const MulticastSocket &) = delete;

    /**
     * Creates and binds the socket and sets the multicast options.
     * @return "" on success, otherwise a description of the failure.
     */
    std::string open();

    /// OS index of an interface, or -1 (with a warning) if it does not exist.
    static int interfaceIndex(const std::string &interfaceName);

    /**
     * Joins the group on one interface.
     * @return false if the join failed; a warning is logged.
     */
    bool join(const std::string &interfaceName, int index);

    /**
     * Blocks for the next datagram.
     * @return "" when dg was filled, otherwise the fatal error. A socket that
     *         was shut down by shutdown() reports "socket closed".
     */
    std::string receive(Datagram &dg);

    /// Sends to the group via interfaceName. Errors are logged and dropped.
    void send(const std::string &interfaceName, const std::vector<uint8_t> &data) override;

    /// Wakes a blocked receive(), which then reports "socket closed".
    void shutdown();

    /// Closes the descriptor. Call once no thread is inside receive().
    void close();

  private:
    std::string multicastIP;    ///< IP address of the multicast group.
    unsigned short port;        ///< Port number to bind and send to.
    std::atomic<int> sockfd;    ///< Socket file descriptor.
    std::atomic<bool> closing;  ///< Set by shutdown().
  };

} // namespace mdns_reflector
