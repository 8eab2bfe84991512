#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <string>

#include <spdlog/spdlog.h>

#include "announcer.h"
#include "avahi_registry.h"
#include "logging.h"
#include "termination_signals.h"

namespace {

constexpr int kExitUsage = 2;

void usage(const char* prog) {
  std::fprintf(
      stderr,
      "Usage: %s --name <label> --ip <IPv4 address> [options]\n"
      "\n"
      "Announces <label>.local for the given address over mDNS until\n"
      "interrupted.\n"
      "\n"
      "  -n, --name LABEL        host label to announce (required)\n"
      "  -a, --ip ADDR           IPv4 address to announce (required)\n"
      "  -i, --interface IF      publish on this interface only\n"
      "      --no-service        skip the _workstation._tcp service\n"
      "  -q, --quiet             log errors only\n"
      "  -v, --verbose           log avahi state changes\n",
      prog);
}

}  // namespace

int main(int argc, char* argv[]) {
  enum { kNoService = 256 };
  static const struct option long_options[] = {
      {"name", required_argument, nullptr, 'n'},
      {"ip", required_argument, nullptr, 'a'},
      {"interface", required_argument, nullptr, 'i'},
      {"no-service", no_argument, nullptr, kNoService},
      {"quiet", no_argument, nullptr, 'q'},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  HostBinding binding;
  bool quiet = false;
  bool verbose = false;

  int opt;
  while ((opt = getopt_long(argc, argv, "n:a:i:qvh", long_options,
                            nullptr)) != -1) {
    switch (opt) {
      case 'n':
        binding.name = optarg;
        break;
      case 'a':
        binding.address = optarg;
        break;
      case 'i':
        binding.interface = optarg;
        break;
      case kNoService:
        binding.publish_service = false;
        break;
      case 'q':
        quiet = true;
        break;
      case 'v':
        verbose = true;
        break;
      case 'h':
        usage(argv[0]);
        return EXIT_SUCCESS;
      default:
        usage(argv[0]);
        return kExitUsage;
    }
  }

  if (optind != argc || binding.name.empty() || binding.address.empty()) {
    usage(argv[0]);
    return kExitUsage;
  }

  init_logging("announce_device", quiet     ? Verbosity::kQuiet
                                  : verbose ? Verbosity::kVerbose
                                            : Verbosity::kNormal);

  Error err;
  TerminationSignals signals;
  if (!signals.open(&err)) {
    spdlog::error("{}: {}", error_code_name(err.code), err.message);
    return EXIT_FAILURE;
  }

  AvahiRegistry registry;
  Announcer announcer(registry);
  registry.watch_readable(signals.fd(), [&signals, &announcer]() {
    stop_on_signal(signals, announcer);
  });

  if (!announcer.run(binding, &err)) {
    spdlog::error("{}: {}", error_code_name(err.code), err.message);
    return err.code == ErrorCode::kInvalidArgument ? kExitUsage
                                                   : EXIT_FAILURE;
  }

  spdlog::info("hostname announcement stopped");
  return EXIT_SUCCESS;
}
