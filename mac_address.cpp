#include "mac_address.h"

#include <cstdio>
#include <cstring>

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

MacAddress::MacAddress(const unsigned char* octets) {
  std::memcpy(octets_.data(), octets, kLength);
}

bool MacAddress::parse(const std::string& text, MacAddress* mac) {
  // "xx:xx:xx:xx:xx:xx"
  if (text.size() != kLength * 3 - 1) return false;

  const char separator = text[2];
  if (separator != ':' && separator != '-') return false;

  MacAddress result;
  for (std::size_t i = 0; i < kLength; ++i) {
    const std::size_t pos = i * 3;
    if (i > 0 && text[pos - 1] != separator) return false;

    int high = hex_value(text[pos]);
    int low = hex_value(text[pos + 1]);
    if (high < 0 || low < 0) return false;
    result.octets_[i] = static_cast<std::uint8_t>((high << 4) | low);
  }

  *mac = result;
  return true;
}

bool MacAddress::is_zero() const {
  for (std::uint8_t octet : octets_) {
    if (octet != 0) return false;
  }
  return true;
}

std::string MacAddress::to_string() const {
  char buf[kLength * 3];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", octets_[0],
                octets_[1], octets_[2], octets_[3], octets_[4], octets_[5]);
  return buf;
}
