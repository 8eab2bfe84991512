#include <gtest/gtest.h>
#include <netinet/ip_icmp.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

#include "icmp_prober.h"
#include "neighbor_table.h"

namespace {

const char kTable[] =
    "IP address       HW type     Flags       HW address            Mask     Device\n"
    "192.168.1.1      0x1         0x2         00:11:22:33:44:55     *        eth0\n"
    "192.168.1.42     0x1         0x2         AA:BB:CC:DD:EE:FF     *        eth0\n"
    "192.168.1.43     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
    "192.168.1.44     0x1         0x2         66:77:88:99:aa:bb     *        wlan0\n"
    "garbage line\n"
    "192.168.1.45     0x1         0x6         66:77:88:99:aa:cc     *        eth0\n";

Ipv4Address ip_of(const char* text) {
  Ipv4Address address = 0;
  EXPECT_TRUE(parse_ipv4(text, &address));
  return address;
}

}  // namespace

TEST(NeighborTableTest, ParsesEntriesAndSkipsGarbage) {
  std::istringstream in(kTable);
  std::vector<NeighborEntry> entries = NeighborTable::parse(in);
  ASSERT_EQ(entries.size(), 5u);
  EXPECT_EQ(entries[1].address, ip_of("192.168.1.42"));
  EXPECT_EQ(entries[1].mac.to_string(), "aa:bb:cc:dd:ee:ff");
  EXPECT_EQ(entries[1].flags, 0x2u);
  EXPECT_EQ(entries[3].device, "wlan0");
}

TEST(NeighborTableTest, FindsCompleteEntryOnDevice) {
  std::istringstream in(kTable);
  std::vector<NeighborEntry> entries = NeighborTable::parse(in);

  MacAddress mac;
  ASSERT_TRUE(NeighborTable::find(entries, ip_of("192.168.1.42"), "eth0", &mac));
  EXPECT_EQ(mac.to_string(), "aa:bb:cc:dd:ee:ff");

  // Permanent entries carry ATF_COM as well
  ASSERT_TRUE(NeighborTable::find(entries, ip_of("192.168.1.45"), "eth0", &mac));
  EXPECT_EQ(mac.to_string(), "66:77:88:99:aa:cc");
}

TEST(NeighborTableTest, IgnoresIncompleteAndOtherDevices) {
  std::istringstream in(kTable);
  std::vector<NeighborEntry> entries = NeighborTable::parse(in);

  MacAddress mac;
  EXPECT_FALSE(NeighborTable::find(entries, ip_of("192.168.1.43"), "eth0", &mac));
  EXPECT_FALSE(NeighborTable::find(entries, ip_of("192.168.1.44"), "eth0", &mac));
  EXPECT_FALSE(NeighborTable::find(entries, ip_of("192.168.1.99"), "eth0", &mac));
}

TEST(NeighborTableTest, MissingFileIsNotAnAnswer) {
  NeighborTable table("/nonexistent/netname/arp");
  MacAddress mac;
  EXPECT_FALSE(table.lookup(ip_of("192.168.1.42"), "eth0", &mac));
}

TEST(IcmpProberTest, ChecksumOfEchoRequestVerifies) {
  struct icmphdr icmp;
  std::memset(&icmp, 0, sizeof(icmp));
  icmp.type = ICMP_ECHO;
  icmp.un.echo.id = 0x1234;
  icmp.un.echo.sequence = 7;
  icmp.checksum = IcmpProber::checksum(&icmp, sizeof(icmp));

  EXPECT_NE(icmp.checksum, 0);
  // A buffer that carries its own checksum sums to zero
  EXPECT_EQ(IcmpProber::checksum(&icmp, sizeof(icmp)), 0);
}

TEST(IcmpProberTest, ChecksumOddLength) {
  const unsigned char data[] = {0x01, 0x02, 0x03};
  unsigned char padded[] = {0x01, 0x02, 0x03, 0x00};
  EXPECT_EQ(IcmpProber::checksum(data, sizeof(data)),
            IcmpProber::checksum(padded, sizeof(padded)));
}

TEST(IcmpProberTest, ProbeWithoutSocketFails) {
  IcmpProber prober("eth0", NeighborTable(), std::chrono::milliseconds(10));
  std::atomic<bool> cancelled(false);
  MacAddress mac;
  EXPECT_FALSE(prober.probe(ip_of("192.168.1.42"),
                            ProbeClock::now() + std::chrono::milliseconds(50),
                            cancelled, &mac));
}

class IcmpProberLoopbackTest : public ::testing::Test {
 protected:
  void SetUp() override {
    table_path = ::testing::TempDir() + "netname_arp_table";
    std::ofstream out(table_path);
    out << "IP address       HW type     Flags       HW address            "
           "Mask     Device\n"
        << "127.0.0.2        0x1         0x2         aa:bb:cc:dd:ee:ff     "
           "*        lo\n";
  }

  void TearDown() override { std::remove(table_path.c_str()); }

  std::string table_path;
};

TEST_F(IcmpProberLoopbackTest, ReturnsAddressFromNeighborTable) {
  IcmpProber prober("lo", NeighborTable(table_path),
                    std::chrono::milliseconds(10));
  Error err;
  ASSERT_TRUE(prober.open(&err)) << err.message;

  std::atomic<bool> cancelled(false);
  MacAddress mac;
  const ProbeClock::time_point start = ProbeClock::now();
  ASSERT_TRUE(prober.probe(ip_of("127.0.0.2"),
                           start + std::chrono::seconds(2), cancelled, &mac));
  EXPECT_EQ(mac.to_string(), "aa:bb:cc:dd:ee:ff");
  EXPECT_LT(ProbeClock::now() - start, std::chrono::seconds(1));
}

TEST_F(IcmpProberLoopbackTest, CancelledProbeGivesUp) {
  IcmpProber prober("lo", NeighborTable(table_path),
                    std::chrono::milliseconds(10));
  ASSERT_TRUE(prober.open(nullptr));

  std::atomic<bool> cancelled(true);
  MacAddress mac;
  const ProbeClock::time_point start = ProbeClock::now();
  EXPECT_FALSE(prober.probe(ip_of("127.0.0.3"),
                            start + std::chrono::seconds(5), cancelled, &mac));
  EXPECT_LT(ProbeClock::now() - start, std::chrono::seconds(1));
}

TEST_F(IcmpProberLoopbackTest, SilentHostTimesOut) {
  IcmpProber prober("lo", NeighborTable(table_path),
                    std::chrono::milliseconds(10));
  ASSERT_TRUE(prober.open(nullptr));

  std::atomic<bool> cancelled(false);
  MacAddress mac;
  const ProbeClock::time_point start = ProbeClock::now();
  EXPECT_FALSE(prober.probe(ip_of("127.0.0.3"),
                            start + std::chrono::milliseconds(100), cancelled,
                            &mac));
  const ProbeClock::duration elapsed = ProbeClock::now() - start;
  EXPECT_GE(elapsed, std::chrono::milliseconds(100));
  EXPECT_LT(elapsed, std::chrono::seconds(2));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
