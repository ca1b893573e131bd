// Repository: Pulsecast
// Component: Client Registry Contract Tests
// Purpose: Membership per receiver population and snapshot isolation.
// Copyright (c) 2026 Pulsecast

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "fixtures/RecordingReceiver.h"
#include "pulsecast/broadcast/ClientRegistry.hpp"

namespace pulsecast::tests::contracts {

using broadcast::ClientKind;
using broadcast::ClientRegistry;
using fixtures::RecordingReceiver;

TEST(ClientRegistryContractTest, PopulationsAreIndependent)
{
  ClientRegistry registry;
  auto a = std::make_shared<RecordingReceiver>("a");
  auto b = std::make_shared<RecordingReceiver>("b");

  EXPECT_TRUE(registry.Register(a, ClientKind::kStream));
  EXPECT_TRUE(registry.Register(b, ClientKind::kMessage));
  EXPECT_EQ(registry.Count(ClientKind::kStream), 1u);
  EXPECT_EQ(registry.Count(ClientKind::kMessage), 1u);
  EXPECT_EQ(registry.TotalCount(), 2u);

  EXPECT_TRUE(registry.Contains(a, ClientKind::kStream));
  EXPECT_FALSE(registry.Contains(a, ClientKind::kMessage));

  // Removing from the wrong population is a no-op.
  EXPECT_FALSE(registry.Unregister(a, ClientKind::kMessage));
  EXPECT_TRUE(registry.Unregister(a, ClientKind::kStream));
  EXPECT_EQ(registry.TotalCount(), 1u);
}

TEST(ClientRegistryContractTest, DuplicateAndNullRegistrationsRejected)
{
  ClientRegistry registry;
  auto a = std::make_shared<RecordingReceiver>("a");
  EXPECT_TRUE(registry.Register(a, ClientKind::kStream));
  EXPECT_FALSE(registry.Register(a, ClientKind::kStream));
  EXPECT_FALSE(registry.Register(nullptr, ClientKind::kStream));
  EXPECT_EQ(registry.Count(ClientKind::kStream), 1u);
}

TEST(ClientRegistryContractTest, SnapshotIsACopy)
{
  ClientRegistry registry;
  auto a = std::make_shared<RecordingReceiver>("a");
  auto b = std::make_shared<RecordingReceiver>("b");
  registry.Register(a, ClientKind::kStream);
  registry.Register(b, ClientKind::kStream);

  auto snapshot = registry.Snapshot(ClientKind::kStream);
  registry.Unregister(a, ClientKind::kStream);

  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot[0], a);
  EXPECT_EQ(snapshot[1], b);
  EXPECT_EQ(registry.Snapshot(ClientKind::kStream).size(), 1u);
}

TEST(ClientRegistryContractTest, ConcurrentMembershipChanges)
{
  ClientRegistry registry;
  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&registry, t] {
      const ClientKind kind = (t % 2 == 0) ? ClientKind::kStream : ClientKind::kMessage;
      std::vector<broadcast::ReceiverPtr> mine;
      for (int i = 0; i < kPerThread; ++i) {
        auto r = std::make_shared<RecordingReceiver>();
        registry.Register(r, kind);
        mine.push_back(r);
        registry.Snapshot(kind);
      }
      for (size_t i = 0; i < mine.size(); i += 2) {
        registry.Unregister(mine[i], kind);
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(registry.TotalCount(), static_cast<size_t>(kThreads * kPerThread / 2));
  EXPECT_EQ(registry.Count(ClientKind::kStream), registry.Count(ClientKind::kMessage));
}

}  // namespace pulsecast::tests::contracts
