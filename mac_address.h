#ifndef NETNAME_MAC_ADDRESS_H_
#define NETNAME_MAC_ADDRESS_H_

#include <array>
#include <cstdint>
#include <string>

// Link-layer hardware address. Stored as raw octets, so two addresses
// written with different letter case compare equal.
class MacAddress {
 public:
  static constexpr std::size_t kLength = 6;

  MacAddress() : octets_{} {}
  explicit MacAddress(const unsigned char* octets);

  // Accepts "aa:bb:cc:dd:ee:ff" or "aa-bb-cc-dd-ee-ff" in any case.
  static bool parse(const std::string& text, MacAddress* mac);

  bool is_zero() const;
  const std::array<std::uint8_t, kLength>& octets() const { return octets_; }

  // Lower-case, colon separated.
  std::string to_string() const;

  bool operator==(const MacAddress& other) const {
    return octets_ == other.octets_;
  }
  bool operator!=(const MacAddress& other) const { return !(*this == other); }

 private:
  std::array<std::uint8_t, kLength> octets_;
};

#endif  // NETNAME_MAC_ADDRESS_H_
