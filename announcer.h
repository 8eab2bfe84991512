#ifndef NETNAME_ANNOUNCER_H_
#define NETNAME_ANNOUNCER_H_

#include <atomic>
#include <string>

#include "error.h"
#include "termination_signals.h"

struct HostBinding {
  std::string name;     // single label, published as <name>.local
  std::string address;  // IPv4 literal, usually some other device's
  std::string interface;  // empty: every interface
  unsigned int interface_index = 0;  // set by validate_binding()
  bool publish_service = true;
};

// The local service-discovery daemon as seen by the announcer.
class NameRegistry {
 public:
  virtual ~NameRegistry() {}

  virtual bool publish(const HostBinding& binding, Error* err) = 0;

  // Blocks until stop() is called or the registration fails afterwards
  // (for example on a name collision).
  virtual bool run(Error* err) = 0;

  // Callable from any thread.
  virtual void stop() = 0;

  // Retracts whatever publish() registered, also after a failed publish.
  virtual void withdraw() = 0;
};

// Label rules for <name>.local: 1 to 63 letters, digits or hyphens, not
// starting or ending with a hyphen.
bool validate_host_label(const std::string& name, Error* err);

// Checks name, address and (when set) interface before anything is
// registered, and records the interface index the registry publishes on.
bool validate_binding(HostBinding* binding, Error* err);

// Holds one binding for its whole run. run() validates, publishes and
// blocks; the binding is withdrawn exactly once on every way out of run(),
// no matter how many stop requests arrive.
class Announcer {
 public:
  explicit Announcer(NameRegistry& registry)
      : registry_(registry), stop_requested_(false), withdrawn_(false) {}

  Announcer(const Announcer&) = delete;
  Announcer& operator=(const Announcer&) = delete;

  bool run(const HostBinding& requested, Error* err);

  // Safe to call repeatedly and concurrently; only the first call reaches
  // the registry.
  void request_stop();

  bool stop_requested() const { return stop_requested_.load(); }

 private:
  void withdraw();

  NameRegistry& registry_;
  std::atomic<bool> stop_requested_;
  std::atomic<bool> withdrawn_;
};

// Drains |signals| and asks |announcer| to stop. Meant to run whenever
// the signal descriptor becomes readable.
void stop_on_signal(TerminationSignals& signals, Announcer& announcer);

#endif  // NETNAME_ANNOUNCER_H_
