// Repository: Pulsecast
// Component: SocketSink Unit Tests
// Purpose: Ordering, overflow detach and peer-failure handling of the stream
//          transport writer, exercised over a socketpair.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/transport/SocketSink.hpp"
#include "pulsecast/util/Logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace pulsecast::transport;
using pulsecast::util::Logger;

namespace {

class SocketSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds_), 0);
    Logger::SetWarnSink([](const std::string&) {});
  }

  void TearDown() override {
    Logger::SetWarnSink(nullptr);
    for (int& fd : fds_) {
      if (fd >= 0) ::close(fd);
      fd = -1;
    }
  }

  // Reads from the peer end until `expected` bytes arrived or timeout.
  std::string ReadPeer(size_t expected, std::chrono::milliseconds timeout) {
    std::string out;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (out.size() < expected && std::chrono::steady_clock::now() < deadline) {
      pollfd pfd{fds_[1], POLLIN, 0};
      if (::poll(&pfd, 1, 50) <= 0) continue;
      char buf[1024];
      ssize_t n = ::recv(fds_[1], buf, sizeof(buf), 0);
      if (n <= 0) break;
      out.append(buf, static_cast<size_t>(n));
    }
    return out;
  }

  int fds_[2] = {-1, -1};
};

}  // namespace

TEST_F(SocketSinkTest, DeliversInEnqueueOrder)
{
  SocketSink sink(fds_[0], "pair", 4096);
  EXPECT_TRUE(sink.Enqueue("one\n"));
  EXPECT_TRUE(sink.Enqueue("two\n"));
  EXPECT_TRUE(sink.Enqueue("three\n"));

  EXPECT_EQ(ReadPeer(14, std::chrono::seconds(2)), "one\ntwo\nthree\n");
  EXPECT_TRUE(sink.WaitUntilDrained(std::chrono::seconds(2)));
  EXPECT_EQ(sink.GetBytesEnqueued(), 14u);
  EXPECT_EQ(sink.GetBytesDelivered(), 14u);
  EXPECT_FALSE(sink.IsDetached());
}

TEST_F(SocketSinkTest, OverflowDetachesInsteadOfDropping)
{
  std::atomic<int> overflow_warnings{0};
  Logger::SetWarnSink([&](const std::string& line) {
    if (line.find("overflow") != std::string::npos) overflow_warnings.fetch_add(1);
  });
  SocketSink sink(fds_[0], "small", 8);

  EXPECT_FALSE(sink.Enqueue(std::string(16, 'x')));
  EXPECT_TRUE(sink.IsDetached());
  EXPECT_EQ(overflow_warnings.load(), 1);

  // The socket is shut down so the connection's reader wakes; the peer sees
  // end of stream with none of the oversized write.
  EXPECT_EQ(ReadPeer(1, std::chrono::seconds(2)), "");

  // Detached for good.
  EXPECT_FALSE(sink.Enqueue("a"));
  EXPECT_EQ(overflow_warnings.load(), 1);
}

TEST_F(SocketSinkTest, PeerCloseDetachesOnNextWrite)
{
  SocketSink sink(fds_[0], "closing", 4096);
  ::close(fds_[1]);
  fds_[1] = -1;

  // The writer notices the dead peer on its first send attempt.
  sink.Enqueue("payload\n");
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!sink.IsDetached() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(sink.IsDetached());
  EXPECT_FALSE(sink.Enqueue("later\n"));
}

TEST_F(SocketSinkTest, CloseIsIdempotentAndRejectsLaterWrites)
{
  SocketSink sink(fds_[0], "closed", 4096);
  sink.Close();
  sink.Close();
  EXPECT_TRUE(sink.IsClosed());
  EXPECT_FALSE(sink.Enqueue("x"));
}
