#ifndef NETNAME_SUBNET_H_
#define NETNAME_SUBNET_H_

#include <cstdint>
#include <vector>

#include "error.h"
#include "interface_info.h"
#include "ipv4.h"

Ipv4Address network_address(const InterfaceInfo& info);
Ipv4Address broadcast_address(const InterfaceInfo& info);
int prefix_length(Ipv4Address netmask);

// Number of host addresses in the subnet, network and broadcast excluded.
std::uint64_t usable_host_count(const InterfaceInfo& info);

// Fills |hosts| with every address of the interface's subnet except the
// network address, the broadcast address and the interface's own address,
// in ascending order. Fails with kSubnetTooLarge when the subnet holds more
// than |max_hosts| usable addresses.
bool enumerate_candidates(const InterfaceInfo& info, std::uint64_t max_hosts,
                          std::vector<Ipv4Address>* hosts, Error* err);

#endif  // NETNAME_SUBNET_H_
