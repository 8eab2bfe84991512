#ifndef NETNAME_INTERFACE_INFO_H_
#define NETNAME_INTERFACE_INFO_H_

#include <string>

#include "error.h"
#include "ipv4.h"

struct InterfaceInfo {
  std::string name;
  Ipv4Address address = 0;
  Ipv4Address netmask = 0;
  unsigned int index = 0;
};

// Looks up the first IPv4 address of |name|. Fails with kInterface when the
// interface does not exist, is down, has no IPv4 address or carries a
// non-contiguous netmask.
bool lookup_interface(const std::string& name, InterfaceInfo* info,
                      Error* err);

#endif  // NETNAME_INTERFACE_INFO_H_
