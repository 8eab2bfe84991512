#include "device_resolver.h"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "first_match.h"
#include "icmp_prober.h"
#include "interface_info.h"
#include "neighbor_table.h"
#include "subnet.h"

namespace {

constexpr std::chrono::seconds kProgressInterval(1);

}  // namespace

DeviceResolver::DeviceResolver(HostProber& prober,
                               const ResolverOptions& options)
    : prober_(prober),
      options_(options),
      thread_factory_([](std::function<void()> body) {
        return std::thread(std::move(body));
      }) {}

std::optional<DeviceBinding> DeviceResolver::resolve(
    const std::vector<Ipv4Address>& candidates, const MacAddress& target) {
  if (candidates.empty()) return std::nullopt;

  const std::chrono::milliseconds overall_timeout =
      std::min(options_.overall_timeout, kMaxTimeout);
  const std::chrono::milliseconds host_timeout =
      std::min(options_.host_timeout, kMaxTimeout);
  const ProbeClock::time_point overall_deadline =
      ProbeClock::now() + overall_timeout;

  FirstMatch<DeviceBinding> match;
  std::atomic<bool> cancelled(false);
  std::atomic<std::size_t> next(0);
  std::atomic<std::size_t> running(0);

  auto worker = [&]() {
    for (;;) {
      if (cancelled.load() || ProbeClock::now() >= overall_deadline) break;
      const std::size_t index = next.fetch_add(1);
      if (index >= candidates.size()) break;

      const Ipv4Address host = candidates[index];
      const ProbeClock::time_point deadline =
          std::min(ProbeClock::now() + host_timeout, overall_deadline);

      MacAddress mac;
      if (!prober_.probe(host, deadline, cancelled, &mac)) {
        spdlog::debug("{}: no answer", ipv4_to_string(host));
        continue;
      }
      spdlog::debug("{} is at {}", ipv4_to_string(host), mac.to_string());
      if (mac != target) continue;

      DeviceBinding binding;
      binding.mac = mac;
      binding.address = host;
      if (match.offer(binding)) cancelled.store(true);
      break;
    }

    // The last worker out releases the driver
    if (running.fetch_sub(1) == 1) match.close();
  };

  const std::size_t pool_size = std::max<std::size_t>(
      1, std::min<std::size_t>(options_.workers, candidates.size()));
  running.store(pool_size);

  std::vector<std::thread> threads;
  threads.reserve(pool_size);
  try {
    while (threads.size() < pool_size)
      threads.push_back(thread_factory_(worker));
  } catch (const std::system_error& e) {
    spdlog::warn("started {} of {} workers: {}", threads.size(), pool_size,
                 e.what());
  }

  const std::size_t missing = pool_size - threads.size();
  if (threads.empty()) {
    // Nobody else touches |running|; the inline worker closes the match
    running.store(1);
    worker();
  } else if (missing > 0 && running.fetch_sub(missing) == missing) {
    match.close();
  }

  bool found = false;
  for (;;) {
    const ProbeClock::time_point slice =
        std::min(ProbeClock::now() + kProgressInterval, overall_deadline);
    found = match.wait_until(slice);
    if (found || match.is_closed() || ProbeClock::now() >= overall_deadline)
      break;
    spdlog::info("probed {} of {} hosts",
                 std::min(next.load(), candidates.size()), candidates.size());
  }
  if (!found) spdlog::debug("stopping probes");
  cancelled.store(true);
  for (std::thread& t : threads) t.join();

  if (!found) return std::nullopt;
  return match.value();
}

bool find_device(const std::string& interface, const MacAddress& target,
                 const ResolverOptions& options,
                 std::optional<DeviceBinding>* result, Error* err) {
  InterfaceInfo info;
  if (!lookup_interface(interface, &info, err)) return false;

  std::vector<Ipv4Address> candidates;
  if (!enumerate_candidates(info, options.max_hosts, &candidates, err))
    return false;

  spdlog::info("interface {} address {} subnet {}/{}", info.name,
               ipv4_to_string(info.address),
               ipv4_to_string(network_address(info)),
               prefix_length(info.netmask));
  spdlog::info("searching for {} among {} hosts", target.to_string(),
               candidates.size());

  IcmpProber prober(interface, NeighborTable(), options.poll_interval);
  if (!prober.open(err)) return false;

  DeviceResolver resolver(prober, options);
  *result = resolver.resolve(candidates, target);
  return true;
}

void write_result(std::ostream& out, const std::string& interface,
                  const MacAddress& target,
                  const std::optional<DeviceBinding>& result, bool quiet) {
  if (quiet) {
    if (result) out << ipv4_to_string(result->address) << '\n';
    return;
  }

  if (result) {
    out << "Device found with MAC " << target.to_string() << ": "
        << ipv4_to_string(result->address) << '\n';
  } else {
    out << "No device found with MAC " << target.to_string()
        << " on interface " << interface << '\n';
  }
}
