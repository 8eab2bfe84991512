#ifndef NETNAME_ICMP_PROBER_H_
#define NETNAME_ICMP_PROBER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "error.h"
#include "host_prober.h"
#include "neighbor_table.h"

// Probes a host by sending it one ICMP echo request and then watching the
// kernel neighbor table for the host's entry. The echo only has to leave
// the interface: the ARP exchange it triggers is what fills the table, so
// hosts that drop ICMP are found as well.
class IcmpProber : public HostProber {
 public:
  enum class SocketMode { kRawIcmp, kDatagramIcmp, kUdp };

  IcmpProber(const std::string& interface, const NeighborTable& table,
             std::chrono::milliseconds poll_interval);
  ~IcmpProber() override;

  IcmpProber(const IcmpProber&) = delete;
  IcmpProber& operator=(const IcmpProber&) = delete;

  // Opens the probe socket. A raw ICMP socket needs CAP_NET_RAW, so this
  // falls back to an unprivileged ICMP datagram socket and then to plain
  // UDP.
  bool open(Error* err);

  bool probe(Ipv4Address host, ProbeClock::time_point deadline,
             const std::atomic<bool>& cancelled, MacAddress* mac) override;

  SocketMode mode() const { return mode_; }

  // Internet checksum (RFC 1071) over |len| bytes.
  static unsigned short checksum(const void* b, int len);

 private:
  bool send_probe(Ipv4Address host);
  void bind_to_interface();

  int sock_;
  SocketMode mode_;
  std::string interface_;
  NeighborTable table_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<std::uint16_t> sequence_;
};

const char* socket_mode_name(IcmpProber::SocketMode mode);

#endif  // NETNAME_ICMP_PROBER_H_
