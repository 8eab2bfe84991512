#ifndef NETNAME_NEIGHBOR_TABLE_H_
#define NETNAME_NEIGHBOR_TABLE_H_

#include <istream>
#include <string>
#include <utility>
#include <vector>

#include "ipv4.h"
#include "mac_address.h"

struct NeighborEntry {
  Ipv4Address address = 0;
  MacAddress mac;
  unsigned int flags = 0;
  std::string device;
};

// Reader for the kernel's IPv4 neighbor (ARP) cache in /proc/net/arp
// format:
//
//   IP address       HW type     Flags       HW address            Mask     Device
//   192.168.1.42     0x1         0x2         aa:bb:cc:dd:ee:ff     *        eth0
class NeighborTable {
 public:
  static constexpr const char* kDefaultPath = "/proc/net/arp";

  explicit NeighborTable(std::string path = kDefaultPath)
      : path_(std::move(path)) {}

  // Parses a whole table. Malformed lines are skipped.
  static std::vector<NeighborEntry> parse(std::istream& in);

  // Finds the resolved hardware address of |address| on |device|. Only
  // complete entries with a non-zero hardware address count.
  static bool find(const std::vector<NeighborEntry>& entries,
                   Ipv4Address address, const std::string& device,
                   MacAddress* mac);

  // Reads the table from disk and runs find() on it. Returns false if the
  // table cannot be read.
  bool lookup(Ipv4Address address, const std::string& device,
              MacAddress* mac) const;

 private:
  std::string path_;
};

#endif  // NETNAME_NEIGHBOR_TABLE_H_
