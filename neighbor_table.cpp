#include "neighbor_table.h"

#include <net/if_arp.h>

#include <exception>
#include <fstream>
#include <sstream>
#include <string>

std::vector<NeighborEntry> NeighborTable::parse(std::istream& in) {
  std::vector<NeighborEntry> entries;
  std::string line;

  // Header
  if (!std::getline(in, line)) return entries;

  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string ip, hw_type, flags, hw_address, mask, device;
    if (!(fields >> ip >> hw_type >> flags >> hw_address >> mask >> device))
      continue;

    NeighborEntry entry;
    if (!parse_ipv4(ip, &entry.address)) continue;
    if (!MacAddress::parse(hw_address, &entry.mac)) continue;

    try {
      entry.flags = static_cast<unsigned int>(std::stoul(flags, nullptr, 16));
    } catch (const std::exception&) {
      continue;
    }
    entry.device = device;
    entries.push_back(entry);
  }
  return entries;
}

bool NeighborTable::find(const std::vector<NeighborEntry>& entries,
                         Ipv4Address address, const std::string& device,
                         MacAddress* mac) {
  for (const NeighborEntry& entry : entries) {
    if (entry.address != address || entry.device != device) continue;
    if (!(entry.flags & ATF_COM) || entry.mac.is_zero()) continue;
    *mac = entry.mac;
    return true;
  }
  return false;
}

bool NeighborTable::lookup(Ipv4Address address, const std::string& device,
                           MacAddress* mac) const {
  std::ifstream in(path_);
  if (!in) return false;
  return find(parse(in), address, device, mac);
}
