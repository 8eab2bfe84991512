#include <gtest/gtest.h>
#include <poll.h>
#include <signal.h>

#include <cstdlib>

#include "termination_signals.h"

TEST(TerminationSignalsTest, RaisedSignalIsReadable) {
  TerminationSignals signals;
  Error err;
  ASSERT_TRUE(signals.open(&err)) << err.message;
  EXPECT_EQ(signals.consume(), 0);

  ASSERT_EQ(raise(SIGTERM), 0);
  struct pollfd pfd;
  pfd.fd = signals.fd();
  pfd.events = POLLIN;
  pfd.revents = 0;
  EXPECT_EQ(poll(&pfd, 1, 1000), 1);

  EXPECT_EQ(signals.consume(), SIGTERM);
  EXPECT_EQ(signals.consume(), 0);
}

TEST(TerminationSignalsTest, MaskIsRestoredAndSignalsStayIgnored) {
  {
    TerminationSignals signals;
    ASSERT_TRUE(signals.open(nullptr));
    ASSERT_EQ(raise(SIGINT), 0);
  }

  sigset_t current;
  ASSERT_EQ(sigprocmask(SIG_BLOCK, nullptr, &current), 0);
  EXPECT_FALSE(sigismember(&current, SIGINT));
  EXPECT_FALSE(sigismember(&current, SIGTERM));
  EXPECT_FALSE(sigismember(&current, SIGHUP));

  struct sigaction action;
  ASSERT_EQ(sigaction(SIGTERM, nullptr, &action), 0);
  EXPECT_EQ(action.sa_handler, SIG_IGN);
}

namespace {

// Runs in a child process, with the default dispositions of a fresh tool.
void shut_down_with_late_signals() {
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  signal(SIGHUP, SIG_DFL);
  {
    TerminationSignals signals;
    if (!signals.open(nullptr)) std::exit(3);
    raise(SIGTERM);
    if (signals.consume() != SIGTERM) std::exit(4);

    // Arrive while the binding is being withdrawn
    raise(SIGTERM);
    raise(SIGINT);
    raise(SIGHUP);
  }
  std::exit(0);
}

}  // namespace

TEST(TerminationSignalsDeathTest, LateSignalsKeepCleanExit) {
  ::testing::FLAGS_gtest_death_test_style = "threadsafe";
  EXPECT_EXIT(shut_down_with_late_signals(), ::testing::ExitedWithCode(0),
              "");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
