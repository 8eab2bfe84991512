#ifndef NETNAME_DEVICE_RESOLVER_H_
#define NETNAME_DEVICE_RESOLVER_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "error.h"
#include "host_prober.h"
#include "ipv4.h"
#include "mac_address.h"

// Longest timeout honored; larger values are clamped to it, which keeps
// deadline arithmetic on the steady clock far from overflow.
constexpr std::chrono::milliseconds kMaxTimeout(24 * 60 * 60 * 1000);

struct ResolverOptions {
  std::chrono::milliseconds host_timeout{1000};
  std::chrono::milliseconds overall_timeout{10000};
  std::chrono::milliseconds poll_interval{50};
  unsigned int workers = 100;
  // Usable hosts of a /16
  std::uint64_t max_hosts = 65534;
};

struct DeviceBinding {
  MacAddress mac;
  Ipv4Address address = 0;
};

// Finds which candidate currently owns a hardware address. Candidates are
// handed to a pool of workers; the first match stops the run, and hosts
// still being probed at that point are abandoned.
class DeviceResolver {
 public:
  // Starts one worker thread; may throw std::system_error.
  typedef std::function<std::thread(std::function<void()>)> ThreadFactory;

  DeviceResolver(HostProber& prober, const ResolverOptions& options);

  // Replaces std::thread construction. If the factory throws
  // std::system_error the run continues with the workers already started,
  // or on the calling thread when none could be started.
  void set_thread_factory(ThreadFactory factory) {
    thread_factory_ = std::move(factory);
  }

  // Returns std::nullopt when no candidate answered with |target| before
  // every probe finished or the overall timeout passed.
  std::optional<DeviceBinding> resolve(
      const std::vector<Ipv4Address>& candidates, const MacAddress& target);

 private:
  HostProber& prober_;
  ResolverOptions options_;
  ThreadFactory thread_factory_;
};

// Resolves |target| on |interface|: looks the interface up, enumerates its
// subnet and probes it with an IcmpProber. Returns false only on
// interface, subnet or socket errors; a device that is not there is a
// successful run with an empty |result|.
bool find_device(const std::string& interface, const MacAddress& target,
                 const ResolverOptions& options,
                 std::optional<DeviceBinding>* result, Error* err);

// Prints the outcome for the operator. In quiet mode only the address of a
// found device is printed, one line, so scripts can capture it.
void write_result(std::ostream& out, const std::string& interface,
                  const MacAddress& target,
                  const std::optional<DeviceBinding>& result, bool quiet);

#endif  // NETNAME_DEVICE_RESOLVER_H_
