#ifndef NETNAME_IPV4_H_
#define NETNAME_IPV4_H_

#include <cstdint>
#include <string>

// IPv4 addresses are passed around as host-order integers.
typedef std::uint32_t Ipv4Address;

// Strict dotted-quad parse; rejects hostnames and shorthand forms.
bool parse_ipv4(const std::string& text, Ipv4Address* address);

std::string ipv4_to_string(Ipv4Address address);

#endif  // NETNAME_IPV4_H_
