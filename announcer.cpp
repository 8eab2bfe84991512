#include "announcer.h"

#include <spdlog/spdlog.h>

#include "interface_info.h"
#include "ipv4.h"

namespace {

constexpr std::size_t kMaxLabelLength = 63;

bool is_label_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '-';
}

}  // namespace

bool validate_host_label(const std::string& name, Error* err) {
  if (name.empty()) {
    return set_error(err, ErrorCode::kInvalidArgument, "name is empty");
  }
  if (name.size() > kMaxLabelLength) {
    return set_error(err, ErrorCode::kInvalidArgument,
                     "name '" + name + "' is longer than 63 characters");
  }
  for (char c : name) {
    if (!is_label_char(c)) {
      return set_error(err, ErrorCode::kInvalidArgument,
                       "name '" + name + "' contains invalid character '" +
                           std::string(1, c) + "'");
    }
  }
  if (name.front() == '-' || name.back() == '-') {
    return set_error(err, ErrorCode::kInvalidArgument,
                     "name '" + name + "' starts or ends with a hyphen");
  }
  return true;
}

bool validate_binding(HostBinding* binding, Error* err) {
  if (!validate_host_label(binding->name, err)) return false;

  Ipv4Address address;
  if (!parse_ipv4(binding->address, &address)) {
    return set_error(err, ErrorCode::kInvalidArgument,
                     "invalid IPv4 address '" + binding->address + "'");
  }

  binding->interface_index = 0;
  if (!binding->interface.empty()) {
    InterfaceInfo info;
    if (!lookup_interface(binding->interface, &info, err)) return false;
    binding->interface_index = info.index;
    spdlog::info("binding to local IP {} on interface {}",
                 ipv4_to_string(info.address), info.name);
  }
  return true;
}

bool Announcer::run(const HostBinding& requested, Error* err) {
  HostBinding binding = requested;
  if (!validate_binding(&binding, err)) return false;

  spdlog::info("announcing {} as {}.local", binding.address, binding.name);
  bool ok = registry_.publish(binding, err);
  if (ok) {
    spdlog::info("hostname announced, waiting for termination signal");
    ok = registry_.run(err);
  }

  withdraw();
  return ok;
}

void Announcer::request_stop() {
  if (stop_requested_.exchange(true)) return;
  spdlog::info("stop requested");
  registry_.stop();
}

void Announcer::withdraw() {
  if (withdrawn_.exchange(true)) return;
  spdlog::info("unregistering hostname");
  registry_.withdraw();
}

void stop_on_signal(TerminationSignals& signals, Announcer& announcer) {
  int signo = signals.consume();
  if (signo != 0) spdlog::info("received signal {}", signo);
  announcer.request_stop();
}
