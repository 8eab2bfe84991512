#include <gtest/gtest.h>

#include "mac_address.h"

TEST(MacAddressTest, ParsesColonSeparated) {
  MacAddress mac;
  ASSERT_TRUE(MacAddress::parse("aa:bb:cc:dd:ee:ff", &mac));
  const unsigned char expected[] = {0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};
  EXPECT_EQ(mac, MacAddress(expected));
}

TEST(MacAddressTest, ComparisonIgnoresCase) {
  MacAddress upper, lower;
  ASSERT_TRUE(MacAddress::parse("AA:BB:CC:DD:EE:FF", &upper));
  ASSERT_TRUE(MacAddress::parse("aa:bb:cc:dd:ee:ff", &lower));
  EXPECT_EQ(upper, lower);

  MacAddress mixed;
  ASSERT_TRUE(MacAddress::parse("Aa:bB:cC:Dd:eE:Ff", &mixed));
  EXPECT_EQ(mixed, lower);
}

TEST(MacAddressTest, AcceptsHyphenSeparated) {
  MacAddress dashed, colons;
  ASSERT_TRUE(MacAddress::parse("00-1A-2b-3C-4d-5E", &dashed));
  ASSERT_TRUE(MacAddress::parse("00:1a:2b:3c:4d:5e", &colons));
  EXPECT_EQ(dashed, colons);
}

TEST(MacAddressTest, RejectsMalformed) {
  MacAddress mac;
  EXPECT_FALSE(MacAddress::parse("", &mac));
  EXPECT_FALSE(MacAddress::parse("aa:bb:cc:dd:ee", &mac));
  EXPECT_FALSE(MacAddress::parse("aa:bb:cc:dd:ee:ff:00", &mac));
  EXPECT_FALSE(MacAddress::parse("aabbccddeeff", &mac));
  EXPECT_FALSE(MacAddress::parse("aa:bb:cc:dd:ee:fg", &mac));
  EXPECT_FALSE(MacAddress::parse("aa:bb-cc:dd:ee:ff", &mac));
  EXPECT_FALSE(MacAddress::parse("a:bb:cc:dd:ee:fff", &mac));
  EXPECT_FALSE(MacAddress::parse("aa.bb.cc.dd.ee.ff", &mac));
}

TEST(MacAddressTest, FormatsLowerCaseColons) {
  MacAddress mac;
  ASSERT_TRUE(MacAddress::parse("AA-BB-0C-DD-EE-0F", &mac));
  EXPECT_EQ(mac.to_string(), "aa:bb:0c:dd:ee:0f");
}

TEST(MacAddressTest, ZeroAddress) {
  MacAddress mac;
  EXPECT_TRUE(mac.is_zero());
  ASSERT_TRUE(MacAddress::parse("00:00:00:00:00:01", &mac));
  EXPECT_FALSE(mac.is_zero());
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
