#include "ipv4.h"

#include <arpa/inet.h>

bool parse_ipv4(const std::string& text, Ipv4Address* address) {
  struct in_addr addr;
  if (inet_pton(AF_INET, text.c_str(), &addr) != 1) return false;
  *address = ntohl(addr.s_addr);
  return true;
}

std::string ipv4_to_string(Ipv4Address address) {
  struct in_addr addr;
  addr.s_addr = htonl(address);
  char buf[INET_ADDRSTRLEN];
  if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) return "";
  return buf;
}
