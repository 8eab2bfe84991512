#include "subnet.h"

#include <string>

Ipv4Address network_address(const InterfaceInfo& info) {
  return info.address & info.netmask;
}

Ipv4Address broadcast_address(const InterfaceInfo& info) {
  return info.address | ~info.netmask;
}

int prefix_length(Ipv4Address netmask) {
  int bits = 0;
  while (netmask & 0x80000000u) {
    ++bits;
    netmask <<= 1;
  }
  return bits;
}

std::uint64_t usable_host_count(const InterfaceInfo& info) {
  const std::uint64_t size = static_cast<std::uint64_t>(~info.netmask) + 1;
  return size > 2 ? size - 2 : 0;
}

bool enumerate_candidates(const InterfaceInfo& info, std::uint64_t max_hosts,
                          std::vector<Ipv4Address>* hosts, Error* err) {
  const std::uint64_t count = usable_host_count(info);
  if (count > max_hosts) {
    return set_error(err, ErrorCode::kSubnetTooLarge,
                     "subnet " + ipv4_to_string(network_address(info)) + "/" +
                         std::to_string(prefix_length(info.netmask)) +
                         " on " + info.name + " has " +
                         std::to_string(count) + " hosts, limit is " +
                         std::to_string(max_hosts));
  }

  hosts->clear();
  if (count == 0) return true;

  hosts->reserve(count);
  const Ipv4Address first = network_address(info) + 1;
  const Ipv4Address last = broadcast_address(info) - 1;
  for (Ipv4Address host = first;; ++host) {
    if (host != info.address) hosts->push_back(host);
    if (host == last) break;
  }
  return true;
}
