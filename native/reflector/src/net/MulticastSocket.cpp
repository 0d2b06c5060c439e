#include "MulticastSocket.hpp"
#include "../SystemEventQueue.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace mdns_reflector
{

  namespace
  {
    // Large enough for jumbo frames; mDNS allows messages up to 9000 bytes.
    constexpr size_t RECEIVE_BUFFER_SIZE = 9000;

    std::string errnoMessage(const std::string &what)
    {
      return "Error: " + what + ": " + strerror(errno);
    }
  } // namespace

  MulticastSocket::MulticastSocket(const std::string &multicastIP, unsigned short port)
      : multicastIP(multicastIP), port(port), sockfd(-1), closing(false)
  {
  }

  MulticastSocket::~MulticastSocket()
  {
    shutdown();
    close();
  }

  std::string MulticastSocket::open()
  {
    close();
    closing = false;

    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0)
    {
      return errnoMessage("cannot open multicast socket");
    }

    auto fail = [fd](const std::string &what)
    {
      auto msg = errnoMessage(what);
      ::close(fd);
      return msg;
    };

    int reuse = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
    {
      return fail("setting SO_REUSEADDR");
    }
    // SO_REUSEADDR already shares the port with a local responder such as
    // avahi on Linux; SO_REUSEPORT is only needed where it does not.
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0)
    {
      SystemEventQueue::warn("mcast", errnoMessage("setting SO_REUSEPORT"));
    }

    struct sockaddr_in localSock;
    memset(&localSock, 0, sizeof(localSock));
    localSock.sin_family = AF_INET;
    localSock.sin_port = htons(port);
    localSock.sin_addr.s_addr = htonl(INADDR_ANY);

    if (bind(fd, (struct sockaddr *)&localSock, sizeof(localSock)) < 0)
    {
      return fail("binding socket");
    }

    int on = 1;
    if (setsockopt(fd, IPPROTO_IP, IP_PKTINFO, &on, sizeof(on)) < 0)
    {
      return fail("enabling IP_PKTINFO");
    }

    // Relayed packets must not be received back on the relay socket.
    unsigned char loop = 0;
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0)
    {
      return fail("disabling IP_MULTICAST_LOOP");
    }

    unsigned char ttl = 255;
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0)
    {
      return fail("setting IP_MULTICAST_TTL");
    }

    sockfd = fd;
    std::stringstream ss;
    ss << "Multicast socket bound on port " << port;
    SystemEventQueue::push("mcast", ss.str());
    return "";
  }

  int MulticastSocket::interfaceIndex(const std::string &interfaceName)
  {
    const unsigned int index = if_nametoindex(interfaceName.c_str());
    if (index == 0)
    {
      SystemEventQueue::warn("mcast", errnoMessage("finding interface " + interfaceName));
      return -1;
    }
    return int(index);
  }

  bool MulticastSocket::join(const std::string &interfaceName, int index)
  {
    struct ip_mreqn group;
    memset(&group, 0, sizeof(group));
    inet_pton(AF_INET, multicastIP.c_str(), &group.imr_multiaddr);
    group.imr_ifindex = index;
    if (setsockopt(sockfd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &group, sizeof(group)) < 0)
    {
      SystemEventQueue::warn("mcast", errnoMessage("joining multicast group on " + interfaceName));
      return false;
    }

    std::stringstream ss;
    ss << "Joined " << multicastIP << " on " << interfaceName << " (index " << index << ")";
    SystemEventQueue::push("mcast", ss.str());
    return true;
  }

  std::string MulticastSocket::receive(Datagram &dg)
  {
    dg.data.resize(RECEIVE_BUFFER_SIZE);
    for (;;)
    {
      if (closing)
        return "socket closed";

      struct sockaddr_in src;
      memset(&src, 0, sizeof(src));
      struct iovec iov;
      iov.iov_base = dg.data.data();
      iov.iov_len = dg.data.size();
      alignas(struct cmsghdr) char control[CMSG_SPACE(sizeof(struct in_pktinfo))];

      struct msghdr msg;
      memset(&msg, 0, sizeof(msg));
      msg.msg_name = &src;
      msg.msg_namelen = sizeof(src);
      msg.msg_iov = &iov;
      msg.msg_iovlen = 1;
      msg.msg_control = control;
      msg.msg_controllen = sizeof(control);

      ssize_t nbytes = recvmsg(sockfd, &msg, 0);
      if (nbytes < 0)
      {
        if (errno == EINTR || errno == EAGAIN)
          continue;
        if (closing)
          return "socket closed";
        return errnoMessage("reading multicast socket");
      }
      if (nbytes == 0 && closing)
        return "socket closed";
      if (msg.msg_flags & MSG_TRUNC)
        continue; // oversized datagram, cannot be decoded

      dg.interfaceIndex = -1;
      for (struct cmsghdr *cm = CMSG_FIRSTHDR(&msg); cm != nullptr; cm = CMSG_NXTHDR(&msg, cm))
      {
        if (cm->cmsg_level == IPPROTO_IP && cm->cmsg_type == IP_PKTINFO)
        {
          struct in_pktinfo info;
          memcpy(&info, CMSG_DATA(cm), sizeof(info));
          dg.interfaceIndex = info.ipi_ifindex;
        }
      }

      char ip[INET_ADDRSTRLEN] = {0};
      inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip));
      dg.sourceIp = ip;
      dg.data.resize(size_t(nbytes));
      return "";
    }
  }

  void MulticastSocket::send(const std::string &interfaceName, const std::vector<uint8_t> &data)
  {
    const unsigned int index = if_nametoindex(interfaceName.c_str());
    if (index == 0)
      return;

    struct sockaddr_in dst;
    memset(&dst, 0, sizeof(dst));
    dst.sin_family = AF_INET;
    dst.sin_port = htons(port);
    inet_pton(AF_INET, multicastIP.c_str(), &dst.sin_addr);

    struct iovec iov;
    iov.iov_base = const_cast<uint8_t *>(data.data());
    iov.iov_len = data.size();

    alignas(struct cmsghdr) char control[CMSG_SPACE(sizeof(struct in_pktinfo))];
    memset(control, 0, sizeof(control));

    struct msghdr msg;
    memset(&msg, 0, sizeof(msg));
    msg.msg_name = &dst;
    msg.msg_namelen = sizeof(dst);
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    msg.msg_control = control;
    msg.msg_controllen = sizeof(control);

    struct cmsghdr *cm = CMSG_FIRSTHDR(&msg);
    cm->cmsg_level = IPPROTO_IP;
    cm->cmsg_type = IP_PKTINFO;
    cm->cmsg_len = CMSG_LEN(sizeof(struct in_pktinfo));
    struct in_pktinfo info;
    memset(&info, 0, sizeof(info));
    info.ipi_ifindex = int(index);
    memcpy(CMSG_DATA(cm), &info, sizeof(info));

    if (sendmsg(sockfd, &msg, 0) < 0)
    {
      SystemEventQueue::warn("mcast", errnoMessage("forwarding to " + interfaceName));
    }
  }

  void MulticastSocket::shutdown()
  {
    closing = true;
    int fd = sockfd;
    if (fd != -1)
    {
      ::shutdown(fd, SHUT_RDWR);
    }
  }

  void MulticastSocket::close()
  {
    int fd = sockfd.exchange(-1);
    if (fd != -1)
    {
      ::close(fd);
    }
  }

} // namespace mdns_reflector
