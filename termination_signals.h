#ifndef NETNAME_TERMINATION_SIGNALS_H_
#define NETNAME_TERMINATION_SIGNALS_H_

#include <signal.h>

#include "error.h"

// Turns SIGINT, SIGTERM and SIGHUP into readable events on a signalfd, so
// they can be handled from an ordinary event loop instead of an
// asynchronous handler. On destruction the signals are switched to
// SIG_IGN, anything still pending is dropped and the previous mask is
// restored, so repeated signals during shutdown stay harmless.
class TerminationSignals {
 public:
  TerminationSignals() : fd_(-1), blocked_(false) {}
  ~TerminationSignals();

  TerminationSignals(const TerminationSignals&) = delete;
  TerminationSignals& operator=(const TerminationSignals&) = delete;

  bool open(Error* err);

  int fd() const { return fd_; }

  // Reads every pending signal. Returns the number of the last one, or 0
  // if none was pending.
  int consume();

 private:
  int fd_;
  bool blocked_;
  sigset_t previous_;
};

#endif  // NETNAME_TERMINATION_SIGNALS_H_
