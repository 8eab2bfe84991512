#include "interface_info.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

bool lookup_interface(const std::string& name, InterfaceInfo* info,
                      Error* err) {
  struct ifaddrs *ifaddr, *ifa;
  if (getifaddrs(&ifaddr) == -1) {
    return set_errno_error(err, ErrorCode::kInterface, "getifaddrs");
  }

  bool exists = false;
  bool up = false;
  bool found = false;
  InterfaceInfo result;
  result.name = name;

  for (ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (name != ifa->ifa_name) continue;
    exists = true;
    if (ifa->ifa_flags & IFF_UP) up = true;

    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET ||
        ifa->ifa_netmask == nullptr)
      continue;

    const sockaddr_in* addr =
        reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
    const sockaddr_in* mask =
        reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask);
    result.address = ntohl(addr->sin_addr.s_addr);
    result.netmask = ntohl(mask->sin_addr.s_addr);
    found = true;
    break;
  }

  freeifaddrs(ifaddr);

  if (!exists) {
    return set_error(err, ErrorCode::kInterface,
                     "interface " + name + " does not exist");
  }
  if (!up) {
    return set_error(err, ErrorCode::kInterface,
                     "interface " + name + " is down");
  }
  if (!found) {
    return set_error(err, ErrorCode::kInterface,
                     "interface " + name + " has no IPv4 address");
  }

  // A contiguous mask inverted is 2^n - 1.
  const Ipv4Address host_bits = ~result.netmask;
  if ((host_bits & (host_bits + 1)) != 0) {
    return set_error(err, ErrorCode::kInterface,
                     "interface " + name + " has non-contiguous netmask " +
                         ipv4_to_string(result.netmask));
  }

  result.index = if_nametoindex(name.c_str());
  if (result.index == 0) {
    return set_errno_error(err, ErrorCode::kInterface,
                           "interface " + name + " has no index");
  }

  *info = result;
  return true;
}
