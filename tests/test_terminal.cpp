// Component: Terminal and Signal Unit Tests
// Purpose: raw mode only on terminals, cancellation token, handler restore.

#include "hevc_batch/terminal.hpp"

#include <csignal>
#include <cstring>

#include <unistd.h>

#include <gtest/gtest.h>

using namespace hevc_batch;

TEST(RawTerminalTest, InactiveOnNonTerminal) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  {
    RawTerminal raw(fds[0]);
    EXPECT_FALSE(raw.active());
  }
  close(fds[0]);
  close(fds[1]);

  RawTerminal none(-1);
  EXPECT_FALSE(none.active());
}

TEST(CancellationTest, RequestAndReset) {
  Cancellation::reset();
  EXPECT_FALSE(Cancellation::requested());

  Cancellation::request();
  EXPECT_TRUE(Cancellation::requested());
  EXPECT_EQ(Cancellation::signal_number(), 0);

  Cancellation::reset();
  EXPECT_FALSE(Cancellation::requested());
}

TEST(SignalGuardTest, HandlesTermAndRestoresPrevious) {
  Cancellation::reset();

  struct sigaction before;
  ASSERT_EQ(sigaction(SIGTERM, nullptr, &before), 0);

  {
    SignalGuard guard;
    std::raise(SIGTERM);
    EXPECT_TRUE(Cancellation::requested());
    EXPECT_EQ(Cancellation::signal_number(), SIGTERM);
  }

  struct sigaction after;
  ASSERT_EQ(sigaction(SIGTERM, nullptr, &after), 0);
  EXPECT_EQ(after.sa_handler, before.sa_handler);

  Cancellation::reset();
}
