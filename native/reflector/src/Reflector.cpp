#include "Reflector.hpp"

#include <sstream>

#include "PacketMutator.hpp"
#include "SystemEventQueue.hpp"

namespace mdns_reflector
{

  Reflector::Reflector(const Policy &policy) : Reflector(policy, nullptr)
  {
    forwarder_ = socket_;
  }

  Reflector::Reflector(const Policy &policy, std::shared_ptr<Forwarder> forwarder)
      : topology_(policy.interfaces),
        engine_(policy.rules, topology_, window_, policy.discoveryGroups),
        socket_(std::make_shared<MulticastSocket>(dns::MDNS_ADDR4, dns::MDNS_PORT)),
        forwarder_(std::move(forwarder)), listening(false), stopRequested(false)
  {
  }

  Reflector::~Reflector() { stop(); }

  std::string Reflector::start()
  {
    if (listenerThread.joinable())
    {
      if (listening)
        return "";
      // The previous read loop ended on its own; reap it before restarting.
      stop();
    }

    if (topology_.size() == 0)
    {
      SystemEventQueue::warn("relay", "No interfaces configured, nothing to reflect");
      return "";
    }

    auto error = socket_->open();
    if (!error.empty())
      return error;

    for (const auto &iface : resolveInterfaces())
    {
      socket_->join(iface.first, iface.second);
    }

    {
      std::lock_guard<std::mutex> lock(errorMutex);
      lastError.clear();
    }
    stopRequested = false;
    listening = true;
    listenerThread = std::thread(&Reflector::listen, this);
    return "";
  }

  void Reflector::stop()
  {
    stopRequested = true;
    socket_->shutdown();
    if (listenerThread.joinable())
    {
      listenerThread.join();
    }
    socket_->close();
    listening = false;
    std::lock_guard<std::mutex> lock(errorMutex);
    lastError.clear();
  }

  std::string Reflector::terminalError() const
  {
    std::lock_guard<std::mutex> lock(errorMutex);
    return lastError;
  }

  void Reflector::listen()
  {
    auto error = readLoop();
    if (!stopRequested)
    {
      SystemEventQueue::error("relay", "Listener stopped: " + error);
      std::lock_guard<std::mutex> lock(errorMutex);
      lastError = error;
    }
    else
    {
      SystemEventQueue::push("relay", "Listener stopping.");
    }
    listening = false;
  }

  std::string Reflector::readLoop()
  {
    MulticastSocket::Datagram dg;
    for (;;)
    {
      auto error = socket_->receive(dg);
      if (!error.empty())
        return error;
      handleReceived(dg);
    }
  }

  std::vector<std::pair<std::string, int>> Reflector::resolveInterfaces()
  {
    std::vector<std::pair<std::string, int>> resolved;
    topology_.clearIndexes();
    for (const auto &name : topology_.interfaceNames())
    {
      const int index = MulticastSocket::interfaceIndex(name);
      if (index < 0)
        continue;
      topology_.bindIndex(index, name);
      resolved.emplace_back(name, index);
    }
    return resolved;
  }

  void Reflector::handleReceived(const MulticastSocket::Datagram &dg, DiscoveryWindow::Clock::time_point now)
  {
    // Loopback or traffic from interfaces outside the topology.
    if (dg.interfaceIndex < 0)
      return;
    const auto sourceInterface = topology_.nameForIndex(dg.interfaceIndex);
    if (sourceInterface.empty())
      return;

    handleDatagram(sourceInterface, dg.data, dg.sourceIp, now);
  }

  void Reflector::handleDatagram(const std::string &sourceInterface, const std::vector<uint8_t> &data,
                                 const std::string &sourceIp, DiscoveryWindow::Clock::time_point now)
  {
    auto message = classify(data);
    if (!message)
      return;
    handlePacket(sourceInterface, data, std::move(*message), sourceIp, now);
  }

  void Reflector::handlePacket(const std::string &sourceInterface, const std::vector<uint8_t> &data,
                               ClassifiedMessage message, const std::string &sourceIp,
                               DiscoveryWindow::Clock::time_point now)
  {
    std::vector<uint8_t> payload;
    if (message.isResponse)
    {
      payload = data;
    }
    else
    {
      window_.recordQuery(sourceInterface, now);
      payload = forceMulticastResponses(message.message, data);
    }

    const auto destinations = engine_.evaluate(sourceInterface, message, sourceIp, now);
    if (!forwarder_)
      return;
    for (const auto &dest : destinations)
    {
      forwarder_->send(dest.interfaceName, payload);
    }
  }

} // namespace mdns_reflector
