#include "avahi_registry.h"

#include <avahi-common/address.h>
#include <avahi-common/error.h>

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

AvahiRegistry::AvahiRegistry()
    : poll_(nullptr),
      client_(nullptr),
      group_(nullptr),
      watch_(nullptr),
      watch_fd_(-1),
      interface_index_(AVAHI_IF_UNSPEC),
      stop_requested_(false),
      failed_(false) {}

AvahiRegistry::~AvahiRegistry() { release(); }

void AvahiRegistry::watch_readable(int fd, std::function<void()> callback) {
  watch_fd_ = fd;
  watch_handler_ = std::move(callback);
}

bool AvahiRegistry::publish(const HostBinding& binding, Error* err) {
  binding_ = binding;
  fqdn_ = binding.name + ".local";

  interface_index_ = AVAHI_IF_UNSPEC;
  if (binding.interface_index != 0) {
    interface_index_ = static_cast<AvahiIfIndex>(binding.interface_index);
  }

  poll_ = avahi_simple_poll_new();
  if (poll_ == nullptr) {
    return set_error(err, ErrorCode::kRegistration,
                     "failed to create avahi poll object");
  }

  const AvahiPoll* api = avahi_simple_poll_get(poll_);
  if (watch_fd_ >= 0) {
    watch_ = api->watch_new(api, watch_fd_, AVAHI_WATCH_IN,
                            &AvahiRegistry::watch_callback, this);
    if (watch_ == nullptr) {
      return set_error(err, ErrorCode::kRegistration,
                       "failed to watch termination signals");
    }
  }

  // The client callback fires from inside avahi_client_new() with the
  // current server state, which creates the entry group right away when
  // the daemon is running.
  int error = 0;
  client_ = avahi_client_new(api, static_cast<AvahiClientFlags>(0),
                             &AvahiRegistry::client_callback, this, &error);
  if (client_ == nullptr) {
    return set_error(err, ErrorCode::kRegistration,
                     std::string("cannot connect to avahi daemon: ") +
                         avahi_strerror(error));
  }

  if (failed_) return set_error(err, ErrorCode::kRegistration, failure_);
  return true;
}

bool AvahiRegistry::run(Error* err) {
  while (!stop_requested_.load() && !failed_) {
    int result = avahi_simple_poll_iterate(poll_, -1);
    if (result < 0) {
      return set_error(err, ErrorCode::kRegistration,
                       "avahi poll loop failed");
    }
    // 1: avahi_simple_poll_quit() was called
    if (result > 0) break;
  }

  if (failed_) return set_error(err, ErrorCode::kRegistration, failure_);
  return true;
}

void AvahiRegistry::stop() {
  stop_requested_.store(true);
  if (poll_ != nullptr) avahi_simple_poll_wakeup(poll_);
}

void AvahiRegistry::withdraw() {
  if (group_ != nullptr) {
    avahi_entry_group_reset(group_);
    spdlog::info("withdrew {} -> {}", fqdn_, binding_.address);
  }
  release();
}

void AvahiRegistry::release() {
  if (group_ != nullptr) {
    avahi_entry_group_free(group_);
    group_ = nullptr;
  }
  if (client_ != nullptr) {
    avahi_client_free(client_);
    client_ = nullptr;
  }
  if (watch_ != nullptr) {
    const AvahiPoll* api = avahi_simple_poll_get(poll_);
    api->watch_free(watch_);
    watch_ = nullptr;
  }
  if (poll_ != nullptr) {
    avahi_simple_poll_free(poll_);
    poll_ = nullptr;
  }
}

void AvahiRegistry::fail(const std::string& message) {
  if (failed_) return;
  failed_ = true;
  failure_ = message;
  spdlog::error("{}", message);
}

void AvahiRegistry::create_entries(AvahiClient* client) {
  if (group_ == nullptr) {
    group_ =
        avahi_entry_group_new(client, &AvahiRegistry::group_callback, this);
    if (group_ == nullptr) {
      fail(std::string("avahi_entry_group_new() failed: ") +
           avahi_strerror(avahi_client_errno(client)));
      return;
    }
  }

  // Already populated; the daemon re-announces it by itself
  if (!avahi_entry_group_is_empty(group_)) return;

  AvahiAddress address;
  if (avahi_address_parse(binding_.address.c_str(), AVAHI_PROTO_INET,
                          &address) == nullptr) {
    fail("avahi cannot parse address " + binding_.address);
    return;
  }

  spdlog::info("registering {} at {}", fqdn_, binding_.address);

  // The address belongs to another device; leave its reverse record alone
  int ret = avahi_entry_group_add_address(
      group_, interface_index_, AVAHI_PROTO_INET, AVAHI_PUBLISH_NO_REVERSE,
      fqdn_.c_str(), &address);
  if (ret < 0) {
    fail("failed to add address record for " + fqdn_ + ": " +
         avahi_strerror(ret));
    return;
  }

  if (binding_.publish_service) {
    ret = avahi_entry_group_add_service(
        group_, interface_index_, AVAHI_PROTO_INET,
        static_cast<AvahiPublishFlags>(0), binding_.name.c_str(),
        kServiceType, nullptr, fqdn_.c_str(), 0, kServiceTxt,
        static_cast<const char*>(nullptr));
    if (ret < 0) {
      fail("failed to add " + std::string(kServiceType) + " service for " +
           binding_.name + ": " + avahi_strerror(ret));
      return;
    }
  }

  ret = avahi_entry_group_commit(group_);
  if (ret < 0) {
    fail("failed to commit entry group for " + fqdn_ + ": " +
         avahi_strerror(ret));
  }
}

void AvahiRegistry::client_callback(AvahiClient* client,
                                    AvahiClientState state, void* userdata) {
  AvahiRegistry* self = static_cast<AvahiRegistry*>(userdata);

  switch (state) {
    case AVAHI_CLIENT_S_RUNNING:
      self->create_entries(client);
      break;

    case AVAHI_CLIENT_FAILURE:
      self->fail(std::string("avahi client failure: ") +
                 avahi_strerror(avahi_client_errno(client)));
      break;

    case AVAHI_CLIENT_S_COLLISION:
    case AVAHI_CLIENT_S_REGISTERING:
      // The daemon's own host name is changing; entries are added again
      // once it is running
      spdlog::debug("avahi server is re-registering");
      if (self->group_ != nullptr) avahi_entry_group_reset(self->group_);
      break;

    case AVAHI_CLIENT_CONNECTING:
      break;
  }
}

void AvahiRegistry::group_callback(AvahiEntryGroup* group,
                                   AvahiEntryGroupState state,
                                   void* userdata) {
  AvahiRegistry* self = static_cast<AvahiRegistry*>(userdata);

  switch (state) {
    case AVAHI_ENTRY_GROUP_ESTABLISHED:
      spdlog::info("{} is established at {}", self->fqdn_,
                   self->binding_.address);
      break;

    case AVAHI_ENTRY_GROUP_COLLISION:
      self->fail("name " + self->fqdn_ +
                 " is already claimed on the network");
      break;

    case AVAHI_ENTRY_GROUP_FAILURE:
      self->fail(
          std::string("entry group failure: ") +
          avahi_strerror(avahi_client_errno(avahi_entry_group_get_client(group))));
      break;

    case AVAHI_ENTRY_GROUP_UNCOMMITED:
    case AVAHI_ENTRY_GROUP_REGISTERING:
      spdlog::debug("entry group state {}", static_cast<int>(state));
      break;
  }
}

void AvahiRegistry::watch_callback(AvahiWatch* /*watch*/, int /*fd*/,
                                   AvahiWatchEvent /*event*/,
                                   void* userdata) {
  AvahiRegistry* self = static_cast<AvahiRegistry*>(userdata);
  if (self->watch_handler_) self->watch_handler_();
}
