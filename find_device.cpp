#include <getopt.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "device_resolver.h"
#include "logging.h"
#include "mac_address.h"

namespace {

constexpr int kExitUsage = 2;
const unsigned long long kMaxTimeoutMs = kMaxTimeout.count();

void usage(const char* prog) {
  std::fprintf(
      stderr,
      "Usage: %s <interface> --mac <aa:bb:cc:dd:ee:ff> [options]\n"
      "\n"
      "Finds the IPv4 address of the device with the given hardware address\n"
      "on the interface's subnet.\n"
      "\n"
      "  -m, --mac ADDR          hardware address to look for (required)\n"
      "  -q, --quiet             print only the address found, if any\n"
      "  -v, --verbose           log every probe\n"
      "      --host-timeout MS   per-host probe timeout (default 1000,\n"
      "                          at most 86400000)\n"
      "      --timeout MS        overall timeout (default 10000,\n"
      "                          at most 86400000)\n"
      "      --workers N         concurrent probes (default 100)\n"
      "      --max-hosts N       refuse larger subnets (default 65534)\n",
      prog);
}

bool parse_number(const char* text, unsigned long long min,
                  unsigned long long max, unsigned long long* value) {
  char* end = nullptr;
  errno = 0;
  unsigned long long parsed = std::strtoull(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || text[0] == '-' ||
      parsed < min || parsed > max)
    return false;
  *value = parsed;
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  enum { kHostTimeout = 256, kTimeout, kWorkers, kMaxHosts };
  static const struct option long_options[] = {
      {"mac", required_argument, nullptr, 'm'},
      {"quiet", no_argument, nullptr, 'q'},
      {"verbose", no_argument, nullptr, 'v'},
      {"host-timeout", required_argument, nullptr, kHostTimeout},
      {"timeout", required_argument, nullptr, kTimeout},
      {"workers", required_argument, nullptr, kWorkers},
      {"max-hosts", required_argument, nullptr, kMaxHosts},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  std::string mac_text;
  bool quiet = false;
  bool verbose = false;
  ResolverOptions options;

  int opt;
  while ((opt = getopt_long(argc, argv, "m:qvh", long_options, nullptr)) !=
         -1) {
    unsigned long long value = 0;
    switch (opt) {
      case 'm':
        mac_text = optarg;
        break;
      case 'q':
        quiet = true;
        break;
      case 'v':
        verbose = true;
        break;
      case kHostTimeout:
        if (!parse_number(optarg, 1, kMaxTimeoutMs, &value)) {
          std::fprintf(stderr, "Invalid --host-timeout: %s\n", optarg);
          return kExitUsage;
        }
        options.host_timeout = std::chrono::milliseconds(value);
        break;
      case kTimeout:
        if (!parse_number(optarg, 1, kMaxTimeoutMs, &value)) {
          std::fprintf(stderr, "Invalid --timeout: %s\n", optarg);
          return kExitUsage;
        }
        options.overall_timeout = std::chrono::milliseconds(value);
        break;
      case kWorkers:
        if (!parse_number(optarg, 1, 4096, &value)) {
          std::fprintf(stderr, "Invalid --workers: %s\n", optarg);
          return kExitUsage;
        }
        options.workers = static_cast<unsigned int>(value);
        break;
      case kMaxHosts:
        if (!parse_number(optarg, 1, 0xFFFFFFFFull, &value)) {
          std::fprintf(stderr, "Invalid --max-hosts: %s\n", optarg);
          return kExitUsage;
        }
        options.max_hosts = value;
        break;
      case 'h':
        usage(argv[0]);
        return EXIT_SUCCESS;
      default:
        usage(argv[0]);
        return kExitUsage;
    }
  }

  if (optind + 1 != argc || mac_text.empty()) {
    usage(argv[0]);
    return kExitUsage;
  }
  const std::string interface = argv[optind];

  MacAddress target;
  if (!MacAddress::parse(mac_text, &target)) {
    std::fprintf(stderr, "Invalid MAC address format: %s\n",
                 mac_text.c_str());
    return kExitUsage;
  }

  init_logging("find_device", quiet     ? Verbosity::kQuiet
                              : verbose ? Verbosity::kVerbose
                                        : Verbosity::kNormal);

  std::optional<DeviceBinding> result;
  Error err;
  if (!find_device(interface, target, options, &result, &err)) {
    spdlog::error("{}: {}", error_code_name(err.code), err.message);
    return EXIT_FAILURE;
  }

  write_result(std::cout, interface, target, result, quiet);
  return EXIT_SUCCESS;
}
