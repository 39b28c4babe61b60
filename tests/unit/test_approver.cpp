/**
 * @file test_approver.cpp
 * @brief Unit tests for the external approver registry
 */

#include <gtest/gtest.h>
#include <p2plink/approver.h>

using namespace p2plink;

namespace {

MacAddress addr(const char *text) { return MacAddress::from_string(text).value(); }

} // namespace

// ============================================================================
// Registration
// ============================================================================

TEST(ApproverRegistryTest, AddAndFind) {
  ApproverRegistry registry;
  EXPECT_TRUE(registry.empty());

  auto replaced = registry.add(1, addr("02:00:00:00:00:0a"));
  EXPECT_FALSE(replaced.has_value());
  EXPECT_EQ(registry.size(), 1u);

  const ApproverEntry *entry = registry.find(1, addr("02:00:00:00:00:0a"));
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->owner, 1u);
  EXPECT_FALSE(entry->is_wildcard());
  EXPECT_EQ(registry.find(2, addr("02:00:00:00:00:0a")), nullptr);
}

TEST(ApproverRegistryTest, ReRegistrationReplaces) {
  ApproverRegistry registry;
  registry.add(1, addr("02:00:00:00:00:0a"));
  auto replaced = registry.add(1, addr("02:00:00:00:00:0a"));

  ASSERT_TRUE(replaced.has_value());
  EXPECT_EQ(replaced->owner, 1u);
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_GT(registry.find(1, addr("02:00:00:00:00:0a"))->serial,
            replaced->serial);
}

TEST(ApproverRegistryTest, Remove) {
  ApproverRegistry registry;
  registry.add(1, addr("02:00:00:00:00:0a"));

  EXPECT_FALSE(registry.remove(2, addr("02:00:00:00:00:0a")).has_value());
  EXPECT_TRUE(registry.remove(1, addr("02:00:00:00:00:0a")).has_value());
  EXPECT_TRUE(registry.empty());
}

TEST(ApproverRegistryTest, RemoveAllForOwner) {
  ApproverRegistry registry;
  registry.add(1, addr("02:00:00:00:00:0a"));
  registry.add(1, MacAddress::broadcast());
  registry.add(2, addr("02:00:00:00:00:0b"));

  auto removed = registry.remove_all_for_owner(1);
  EXPECT_EQ(removed.size(), 2u);
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_NE(registry.find(2, addr("02:00:00:00:00:0b")), nullptr);
}

TEST(ApproverRegistryTest, RemoveForPeerKeepsWildcards) {
  ApproverRegistry registry;
  registry.add(1, addr("02:00:00:00:00:0a"));
  registry.add(2, addr("02:00:00:00:00:0a"));
  registry.add(3, MacAddress::broadcast());

  auto removed = registry.remove_for_peer(addr("02:00:00:00:00:0a"));
  EXPECT_EQ(removed.size(), 2u);
  EXPECT_EQ(registry.size(), 1u);

  EXPECT_TRUE(registry.remove_for_peer(MacAddress::broadcast()).empty());
  EXPECT_EQ(registry.size(), 1u);
}

// ============================================================================
// Resolution
// ============================================================================

TEST(ApproverRegistryTest, ResolveEmpty) {
  ApproverRegistry registry;
  EXPECT_FALSE(registry.resolve(addr("02:00:00:00:00:0a")).has_value());
}

TEST(ApproverRegistryTest, ExactBeatsWildcard) {
  ApproverRegistry registry;
  registry.add(1, addr("02:00:00:00:00:0a"));
  registry.add(2, MacAddress::broadcast());

  auto approver = registry.resolve(addr("02:00:00:00:00:0a"));
  ASSERT_TRUE(approver.has_value());
  EXPECT_EQ(approver->owner, 1u);

  auto other = registry.resolve(addr("02:00:00:00:00:0b"));
  ASSERT_TRUE(other.has_value());
  EXPECT_EQ(other->owner, 2u);
}

TEST(ApproverRegistryTest, NewestExactWins) {
  ApproverRegistry registry;
  registry.add(5, addr("02:00:00:00:00:0a"));
  registry.add(3, addr("02:00:00:00:00:0a"));

  auto approver = registry.resolve(addr("02:00:00:00:00:0a"));
  ASSERT_TRUE(approver.has_value());
  EXPECT_EQ(approver->owner, 3u);

  // Re-registering makes client 5 the newest again
  registry.add(5, addr("02:00:00:00:00:0a"));
  EXPECT_EQ(registry.resolve(addr("02:00:00:00:00:0a"))->owner, 5u);
}

TEST(ApproverRegistryTest, NewestWildcardWins) {
  ApproverRegistry registry;
  registry.add(1, MacAddress::broadcast());
  registry.add(2, MacAddress::broadcast());

  auto approver = registry.resolve(addr("02:00:00:00:00:0c"));
  ASSERT_TRUE(approver.has_value());
  EXPECT_EQ(approver->owner, 2u);
  EXPECT_TRUE(approver->is_wildcard());
}
