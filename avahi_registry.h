#ifndef NETNAME_AVAHI_REGISTRY_H_
#define NETNAME_AVAHI_REGISTRY_H_

#include <avahi-client/client.h>
#include <avahi-client/publish.h>
#include <avahi-common/simple-watch.h>
#include <avahi-common/watch.h>

#include <atomic>
#include <functional>
#include <string>

#include "announcer.h"

// Publishes a binding through the system avahi daemon. The daemon answers
// queries for <name>.local with the bound address and sends goodbye
// packets when the entry group is reset.
//
// Everything except stop() runs on the thread that calls run().
class AvahiRegistry : public NameRegistry {
 public:
  static constexpr const char* kServiceType = "_workstation._tcp";
  static constexpr const char* kServiceTxt = "description=Custom IP device";

  AvahiRegistry();
  ~AvahiRegistry() override;

  AvahiRegistry(const AvahiRegistry&) = delete;
  AvahiRegistry& operator=(const AvahiRegistry&) = delete;

  // Runs |callback| from the poll loop whenever |fd| becomes readable.
  // Must be called before publish().
  void watch_readable(int fd, std::function<void()> callback);

  bool publish(const HostBinding& binding, Error* err) override;
  bool run(Error* err) override;
  void stop() override;
  void withdraw() override;

 private:
  static void client_callback(AvahiClient* client, AvahiClientState state,
                              void* userdata);
  static void group_callback(AvahiEntryGroup* group,
                             AvahiEntryGroupState state, void* userdata);
  static void watch_callback(AvahiWatch* watch, int fd,
                             AvahiWatchEvent event, void* userdata);

  void create_entries(AvahiClient* client);
  void fail(const std::string& message);
  void release();

  AvahiSimplePoll* poll_;
  AvahiClient* client_;
  AvahiEntryGroup* group_;
  AvahiWatch* watch_;

  int watch_fd_;
  std::function<void()> watch_handler_;

  HostBinding binding_;
  std::string fqdn_;
  AvahiIfIndex interface_index_;

  std::atomic<bool> stop_requested_;
  bool failed_;
  std::string failure_;
};

#endif  // NETNAME_AVAHI_REGISTRY_H_
