/**
 * @file test_persistent_groups.cpp
 * @brief Unit tests for the persistent group store and reinvocation planning
 */

#include <gtest/gtest.h>
#include <p2plink/persistent_groups.h>

#include "test_fakes.h"

using namespace p2plink;
using namespace p2plink::fakes;

namespace {

PersistentGroupProfile profile(int net_id, const char *owner,
                               const char *ssid,
                               std::vector<MacAddress> clients = {}) {
  PersistentGroupProfile p;
  p.net_id = net_id;
  p.owner_address = mac(owner);
  p.network_name = ssid;
  p.clients = std::move(clients);
  return p;
}

const char *kSelf = "02:00:00:00:00:01";
const char *kPeer = "02:00:00:00:00:0a";

} // namespace

// ============================================================================
// Loading and Lookup
// ============================================================================

TEST(PersistentGroupStoreTest, ReloadMirrorsDriver) {
  FakeDriver driver;
  driver.networks = {profile(0, kPeer, "DIRECT-aa-peer"),
                     profile(3, kSelf, "DIRECT-bb-self", {mac(kPeer)})};

  PersistentGroupStore store;
  ASSERT_TRUE(store.reload(driver, mac(kSelf)).is_ok());
  EXPECT_EQ(store.size(), 2u);
  EXPECT_EQ(driver.count("save_config"), 1u);

  ASSERT_NE(store.get(3), nullptr);
  EXPECT_EQ(store.get(3)->network_name, "DIRECT-bb-self");
  EXPECT_EQ(store.get(7), nullptr);
}

TEST(PersistentGroupStoreTest, ReloadFailureClearsCache) {
  FakeDriver driver;
  PersistentGroupStore store;
  store.replace({profile(1, kPeer, "DIRECT-aa")});

  driver.fail("list_networks");
  auto result = store.reload(driver, mac(kSelf));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::DriverCommandFailed);
  EXPECT_TRUE(store.empty());
}

TEST(PersistentGroupStoreTest, NetworkIdLookups) {
  PersistentGroupStore store;
  store.replace({profile(0, kPeer, "DIRECT-aa-peer"),
                 profile(3, kSelf, "DIRECT-bb-self", {mac(kPeer)})});

  EXPECT_EQ(store.network_id(mac(kPeer), "DIRECT-aa-peer"), 0);
  EXPECT_EQ(store.network_id(mac(kPeer), "DIRECT-other"), -1);
  EXPECT_EQ(store.network_id(mac(kPeer), ""), -1);
  EXPECT_EQ(store.network_id(mac(kSelf)), 3);
  EXPECT_EQ(store.network_id_from_client_list(mac(kPeer)), 3);
  EXPECT_EQ(store.network_id_from_client_list(mac(kSelf)), -1);

  auto owner = store.owner_address(0);
  ASSERT_TRUE(owner.has_value());
  EXPECT_EQ(*owner, mac(kPeer));
  EXPECT_FALSE(store.owner_address(9).has_value());
}

// ============================================================================
// Mutation
// ============================================================================

TEST(PersistentGroupStoreTest, RemoveGoesThroughDriver) {
  FakeDriver driver;
  PersistentGroupStore store;
  store.replace({profile(2, kPeer, "DIRECT-aa")});

  ASSERT_TRUE(store.remove(driver, 2).is_ok());
  EXPECT_TRUE(store.empty());
  ASSERT_EQ(driver.removed_networks.size(), 1u);
  EXPECT_EQ(driver.removed_networks[0], 2);

  auto missing = store.remove(driver, 2);
  ASSERT_TRUE(missing.is_error());
  EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST(PersistentGroupStoreTest, RemoveKeepsCacheOnDriverFailure) {
  FakeDriver driver;
  driver.fail("remove_network");
  PersistentGroupStore store;
  store.replace({profile(2, kPeer, "DIRECT-aa")});

  EXPECT_TRUE(store.remove(driver, 2).is_error());
  EXPECT_NE(store.get(2), nullptr);
}

TEST(PersistentGroupStoreTest, PruneClient) {
  FakeDriver driver;
  PersistentGroupStore store;
  store.replace({profile(3, kSelf, "DIRECT-bb",
                         {mac(kPeer), mac("02:00:00:00:00:0b")})});

  auto first = store.prune_client(driver, 3, mac(kPeer));
  ASSERT_TRUE(first.is_ok());
  EXPECT_EQ(first.value(), PersistentGroupStore::PruneOutcome::ClientRemoved);
  ASSERT_EQ(driver.last_client_list.size(), 1u);
  EXPECT_EQ(driver.last_client_list[0], mac("02:00:00:00:00:0b"));

  auto unknown = store.prune_client(driver, 3, mac(kPeer));
  ASSERT_TRUE(unknown.is_ok());
  EXPECT_EQ(unknown.value(), PersistentGroupStore::PruneOutcome::NotFound);

  auto last = store.prune_client(driver, 3, mac("02:00:00:00:00:0b"));
  ASSERT_TRUE(last.is_ok());
  EXPECT_EQ(last.value(), PersistentGroupStore::PruneOutcome::ProfileDeleted);
  EXPECT_EQ(store.get(3), nullptr);
}

TEST(PersistentGroupStoreTest, RemoveAll) {
  FakeDriver driver;
  PersistentGroupStore store;
  store.replace({profile(0, kPeer, "DIRECT-aa"), profile(1, kSelf, "DIRECT-bb")});

  ASSERT_TRUE(store.remove_all(driver).is_ok());
  EXPECT_TRUE(store.empty());
  EXPECT_EQ(driver.removed_networks.size(), 2u);
}

// ============================================================================
// Reinvocation Planning
// ============================================================================

TEST(ReinvocationPlanTest, FreshWithoutStoredGroup) {
  PersistentGroupStore store;
  P2pDevice peer = make_peer(kPeer);
  peer.device_capability = device_capability::kInvitationProcedure;

  auto plan = store.plan_reinvocation(peer, ConnectConfig{}, "", false);
  EXPECT_EQ(plan.action, ReinvocationPlan::Action::Fresh);
}

TEST(ReinvocationPlanTest, ReinvokeStoredGroup) {
  PersistentGroupStore store;
  store.replace({profile(3, kSelf, "DIRECT-bb", {mac(kPeer)})});
  P2pDevice peer = make_peer(kPeer);
  peer.device_capability = device_capability::kInvitationProcedure;

  auto plan = store.plan_reinvocation(peer, ConnectConfig{}, "", false);
  EXPECT_EQ(plan.action, ReinvocationPlan::Action::Reinvoke);
  EXPECT_EQ(plan.net_id, 3);
}

TEST(ReinvocationPlanTest, NotInvitationCapable) {
  PersistentGroupStore store;
  store.replace({profile(3, kSelf, "DIRECT-bb", {mac(kPeer)})});
  P2pDevice peer = make_peer(kPeer);

  auto plan = store.plan_reinvocation(peer, ConnectConfig{}, "", false);
  EXPECT_EQ(plan.action, ReinvocationPlan::Action::Fresh);
}

TEST(ReinvocationPlanTest, JoinPeerOwnedGroup) {
  PersistentGroupStore store;
  store.replace({profile(0, kPeer, "DIRECT-aa-peer")});
  P2pDevice peer = make_peer(kPeer);
  peer.group_capability = group_capability::kGroupOwner;

  auto plan = store.plan_reinvocation(peer, ConnectConfig{}, "DIRECT-aa-peer",
                                      false);
  EXPECT_EQ(plan.action, ReinvocationPlan::Action::JoinPersistent);
  EXPECT_EQ(plan.net_id, 0);

  // Unknown SSID only matches by owner when the peer invited us
  auto other = store.plan_reinvocation(peer, ConnectConfig{}, "DIRECT-zz",
                                       false);
  EXPECT_EQ(other.action, ReinvocationPlan::Action::Fresh);
  auto invited = store.plan_reinvocation(peer, ConnectConfig{}, "DIRECT-zz",
                                         true);
  EXPECT_EQ(invited.action, ReinvocationPlan::Action::JoinPersistent);
}

TEST(ReinvocationPlanTest, DeviceLimitForcesFresh) {
  PersistentGroupStore store;
  store.replace({profile(3, kSelf, "DIRECT-bb", {mac(kPeer)})});
  P2pDevice peer = make_peer(kPeer);
  peer.device_capability = device_capability::kInvitationProcedure |
                           device_capability::kDeviceLimit;

  auto plan = store.plan_reinvocation(peer, ConnectConfig{}, "", false);
  EXPECT_EQ(plan.action, ReinvocationPlan::Action::Fresh);
}
