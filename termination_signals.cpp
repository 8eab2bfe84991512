#include "termination_signals.h"

#include <sys/signalfd.h>
#include <unistd.h>

#include <cstring>

namespace {

const int kTerminationSignals[] = {SIGINT, SIGTERM, SIGHUP};

}  // namespace

// A signal that arrives after the last consume() is still pending here.
// Ignoring it first discards it, so unblocking cannot kill the process
// during an otherwise clean shutdown. The signals stay ignored afterwards.
TerminationSignals::~TerminationSignals() {
  if (blocked_) {
    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    for (int signo : kTerminationSignals) sigaction(signo, &ignore, nullptr);
  }
  if (fd_ != -1) {
    consume();
    close(fd_);
  }
  if (blocked_) sigprocmask(SIG_SETMASK, &previous_, nullptr);
}

bool TerminationSignals::open(Error* err) {
  sigset_t mask;
  sigemptyset(&mask);
  for (int signo : kTerminationSignals) sigaddset(&mask, signo);

  if (sigprocmask(SIG_BLOCK, &mask, &previous_) < 0) {
    return set_errno_error(err, ErrorCode::kSystem, "sigprocmask");
  }
  blocked_ = true;

  fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
  if (fd_ < 0) {
    return set_errno_error(err, ErrorCode::kSystem, "signalfd");
  }
  return true;
}

int TerminationSignals::consume() {
  int last = 0;
  if (fd_ < 0) return last;
  struct signalfd_siginfo info;
  for (;;) {
    ssize_t bytes = read(fd_, &info, sizeof(info));
    if (bytes != static_cast<ssize_t>(sizeof(info))) break;
    last = static_cast<int>(info.ssi_signo);
  }
  return last;
}
