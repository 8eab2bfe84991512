#include "icmp_prober.h"

#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <spdlog/spdlog.h>

namespace {

// Discard service; anything sent there only serves to resolve the next hop.
constexpr std::uint16_t kDiscardPort = 9;

}  // namespace

const char* socket_mode_name(IcmpProber::SocketMode mode) {
  switch (mode) {
    case IcmpProber::SocketMode::kRawIcmp:
      return "raw ICMP";
    case IcmpProber::SocketMode::kDatagramIcmp:
      return "ICMP datagram";
    case IcmpProber::SocketMode::kUdp:
      return "UDP";
  }
  return "unknown";
}

IcmpProber::IcmpProber(const std::string& interface,
                       const NeighborTable& table,
                       std::chrono::milliseconds poll_interval)
    : sock_(-1),
      mode_(SocketMode::kRawIcmp),
      interface_(interface),
      table_(table),
      poll_interval_(poll_interval),
      sequence_(0) {}

IcmpProber::~IcmpProber() {
  if (sock_ != -1) close(sock_);
}

unsigned short IcmpProber::checksum(const void* b, int len) {
  const unsigned char* buf = static_cast<const unsigned char*>(b);
  unsigned int sum = 0;

  // Sum 16-bit words in memory order
  while (len > 1) {
    unsigned short word;
    std::memcpy(&word, buf, sizeof(word));
    sum += word;
    buf += 2;
    len -= 2;
  }

  // Odd trailing byte
  if (len == 1) {
    unsigned short word = 0;
    std::memcpy(&word, buf, 1);
    sum += word;
  }

  // Fold the 32-bit sum into 16 bits
  sum = (sum >> 16) + (sum & 0xFFFF);
  sum += (sum >> 16);

  return static_cast<unsigned short>(~sum);
}

bool IcmpProber::open(Error* err) {
  sock_ = socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
  if (sock_ >= 0) {
    mode_ = SocketMode::kRawIcmp;
  } else {
    spdlog::debug("raw ICMP socket unavailable ({}), trying ICMP datagram",
                  std::strerror(errno));
    sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (sock_ >= 0) {
      mode_ = SocketMode::kDatagramIcmp;
    } else {
      spdlog::debug("ICMP datagram socket unavailable ({}), using UDP",
                    std::strerror(errno));
      sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
      if (sock_ < 0) {
        return set_errno_error(err, ErrorCode::kSystem,
                               "cannot open probe socket");
      }
      mode_ = SocketMode::kUdp;
    }
  }

  // Replies are never read; keep the queue small
  int rcvbuf = 1024;
  if (setsockopt(sock_, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf)) < 0) {
    spdlog::debug("setsockopt SO_RCVBUF: {}", std::strerror(errno));
  }

  bind_to_interface();
  spdlog::debug("probing through {} socket", socket_mode_name(mode_));
  return true;
}

void IcmpProber::bind_to_interface() {
  struct ifreq ifr;
  std::memset(&ifr, 0, sizeof(ifr));
  std::strncpy(ifr.ifr_name, interface_.c_str(), IFNAMSIZ - 1);

  // Needs CAP_NET_RAW on older kernels. Candidates are on the interface's
  // own subnet, so routing picks it anyway.
  if (setsockopt(sock_, SOL_SOCKET, SO_BINDTODEVICE, &ifr, sizeof(ifr)) < 0) {
    spdlog::debug("setsockopt SO_BINDTODEVICE {}: {}", interface_,
                  std::strerror(errno));
  }
}

bool IcmpProber::send_probe(Ipv4Address host) {
  struct sockaddr_in dest;
  std::memset(&dest, 0, sizeof(dest));
  dest.sin_family = AF_INET;
  dest.sin_addr.s_addr = htonl(host);

  ssize_t result;
  if (mode_ == SocketMode::kUdp) {
    const char payload = 0;
    dest.sin_port = htons(kDiscardPort);
    result = sendto(sock_, &payload, sizeof(payload), 0,
                    reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
  } else {
    struct icmphdr icmp;
    std::memset(&icmp, 0, sizeof(icmp));
    icmp.type = ICMP_ECHO;
    icmp.code = 0;
    // Datagram ICMP sockets overwrite the id with their own
    icmp.un.echo.id = htons(static_cast<std::uint16_t>(getpid()));
    icmp.un.echo.sequence = htons(++sequence_);
    icmp.checksum = checksum(&icmp, sizeof(icmp));

    result = sendto(sock_, &icmp, sizeof(icmp), 0,
                    reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
  }

  if (result < 0) {
    spdlog::debug("sendto {}: {}", ipv4_to_string(host),
                  std::strerror(errno));
    return false;
  }
  return true;
}

bool IcmpProber::probe(Ipv4Address host, ProbeClock::time_point deadline,
                       const std::atomic<bool>& cancelled, MacAddress* mac) {
  if (sock_ < 0 || !send_probe(host)) return false;

  const ProbeClock::duration interval =
      std::chrono::duration_cast<ProbeClock::duration>(poll_interval_);
  while (!cancelled.load()) {
    if (table_.lookup(host, interface_, mac)) return true;

    const ProbeClock::time_point now = ProbeClock::now();
    if (now >= deadline) break;
    std::this_thread::sleep_for(std::min(interval, deadline - now));
  }
  return false;
}
