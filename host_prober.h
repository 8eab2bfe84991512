#ifndef NETNAME_HOST_PROBER_H_
#define NETNAME_HOST_PROBER_H_

#include <atomic>
#include <chrono>

#include "ipv4.h"
#include "mac_address.h"

typedef std::chrono::steady_clock ProbeClock;

// Elicits the hardware address of a host on the local segment.
class HostProber {
 public:
  virtual ~HostProber() {}

  // Called concurrently from several workers. Returns false when |host|
  // has not answered by |deadline| or |cancelled| became true first.
  virtual bool probe(Ipv4Address host, ProbeClock::time_point deadline,
                     const std::atomic<bool>& cancelled, MacAddress* mac) = 0;
};

#endif  // NETNAME_HOST_PROBER_H_
