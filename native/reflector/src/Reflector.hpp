#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "DiscoveryWindow.hpp"
#include "MessageClassifier.hpp"
#include "Policy.hpp"
#include "RuleEngine.hpp"
#include "TopologyTable.hpp"
#include "net/Forwarder.hpp"
#include "net/MulticastSocket.hpp"

namespace mdns_reflector
{

  /**
   * @class Reflector
   * @brief Relays mDNS traffic between interface groups according to a policy.
   *
   * All packet handling runs on the listener thread, one datagram at a time.
   * The read loop does not restart itself; when it ends with an error the
   * reflector reports it through terminalError() and the host decides
   * whether to stop() and start() again.
   */
  class Reflector
  {
  public:
    /// Production wiring: the multicast socket is also the forwarder.
    explicit Reflector(const Policy &policy);

    /// Relayed packets go to forwarder instead of the socket.
    Reflector(const Policy &policy, std::shared_ptr<Forwarder> forwarder);

    ~Reflector();

    Reflector(const Reflector &) = delete;
    Reflector &operator=(const Reflector &) = delete;

    /**
     * Binds the socket, joins the group on every configured interface and
     * starts the listener thread.
     * @return "" on success, otherwise why the reflector could not start.
     */
    std::string start();

    /// Stops the listener thread and closes the socket.
    void stop();

    /// True while the listener thread is reading.
    bool isRunning() const { return listening; }

    /// Error that ended the read loop, "" while running or after stop().
    std::string terminalError() const;

    /**
     * Resolves every configured interface to its OS index and rebinds the
     * index table. Interfaces that do not exist are skipped with a warning.
     * @return (name, index) of each resolved interface in configuration order.
     */
    std::vector<std::pair<std::string, int>> resolveInterfaces();

    /**
     * Entry point for a datagram read from the socket. Datagrams without an
     * arrival index, or arriving on an interface outside the topology, are
     * discarded silently.
     */
    void handleReceived(const MulticastSocket::Datagram &dg,
                        DiscoveryWindow::Clock::time_point now = DiscoveryWindow::Clock::now());

    /**
     * Handles one received datagram. Undecodable datagrams are dropped.
     */
    void handleDatagram(const std::string &sourceInterface, const std::vector<uint8_t> &data,
                        const std::string &sourceIp,
                        DiscoveryWindow::Clock::time_point now = DiscoveryWindow::Clock::now());

    /**
     * Runs the relay pipeline for an already classified datagram and sends
     * it to every selected destination.
     */
    void handlePacket(const std::string &sourceInterface, const std::vector<uint8_t> &data,
                      ClassifiedMessage message, const std::string &sourceIp,
                      DiscoveryWindow::Clock::time_point now = DiscoveryWindow::Clock::now());

    const TopologyTable &topology() const { return topology_; }
    DiscoveryWindow &discoveryWindow() { return window_; }

  private:
    void listen();
    std::string readLoop();

    TopologyTable topology_;
    DiscoveryWindow window_;
    RuleEngine engine_;
    std::shared_ptr<MulticastSocket> socket_;
    std::shared_ptr<Forwarder> forwarder_;

    std::thread listenerThread;
    std::atomic<bool> listening;
    std::atomic<bool> stopRequested;
    mutable std::mutex errorMutex;
    std::string lastError;
  };

} // namespace mdns_reflector
