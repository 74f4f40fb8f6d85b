#include "attr_cache.h"
#include "fake_repository.h"

#include <gtest/gtest.h>
#include <memory>

class AttrCacheTest : public ::testing::Test {
  protected:
    void SetUp() override {
        repo_ = std::make_shared<FakeRepository>();
        repo_->add_dir("/docs");
        repo_->add_file("/docs/a.txt", "hello");
        repo_->add_file("/top.bin", "0123456789");
        now_ = 1000;
        cache_ = std::make_unique<AttrCache>(repo_, 10,
                                             [this] { return now_; });
    }

    std::shared_ptr<FakeRepository> repo_;
    time_t now_;
    std::unique_ptr<AttrCache> cache_;
};

TEST_F(AttrCacheTest, ListWithinTtlIsServedFromSnapshot) {
    AttrCache::Listing first = cache_->list("/");
    ASSERT_TRUE(first.status.ok());
    EXPECT_EQ(first.origin, AttrCache::kRefreshed);
    EXPECT_EQ(repo_->list_calls, 1);

    now_ += 9;
    AttrCache::Listing second = cache_->list("/");
    EXPECT_EQ(second.origin, AttrCache::kCacheHit);
    EXPECT_EQ(repo_->list_calls, 1);
    ASSERT_EQ(second.entries.size(), first.entries.size());
    for (const auto &kv : first.entries) {
        ASSERT_TRUE(second.entries.count(kv.first));
        EXPECT_EQ(second.entries.at(kv.first).size, kv.second.size);
        EXPECT_EQ(second.entries.at(kv.first).kind, kv.second.kind);
    }
}

TEST_F(AttrCacheTest, ExpiredSnapshotIsRefetchedOnce) {
    cache_->list("/docs");
    now_ += 10;
    AttrCache::Listing again = cache_->list("/docs");
    EXPECT_EQ(again.origin, AttrCache::kRefreshed);
    EXPECT_EQ(repo_->list_calls, 2);

    cache_->list("/docs");
    EXPECT_EQ(repo_->list_calls, 2);
}

TEST_F(AttrCacheTest, EntriesCarryKindAndSize) {
    AttrCache::Listing root = cache_->list("/");
    ASSERT_EQ(root.entries.size(), 2u);
    EXPECT_EQ(root.entries.at("docs").kind, EntryKind::kDirectory);
    EXPECT_EQ(root.entries.at("docs").size, 0u);
    EXPECT_EQ(root.entries.at("top.bin").kind, EntryKind::kFile);
    EXPECT_EQ(root.entries.at("top.bin").size, 10u);
    EXPECT_EQ(root.entries.at("top.bin").modified_at, 1500);
}

TEST_F(AttrCacheTest, RefreshReplacesWholeSnapshot) {
    cache_->list("/docs");
    cache_->patch("/docs", "local-only", EntryKind::kFile, 3);
    repo_->add_file("/docs/b.txt", "b");

    now_ += 11;
    AttrCache::Listing fresh = cache_->list("/docs");
    EXPECT_EQ(fresh.entries.count("local-only"), 0u);
    EXPECT_EQ(fresh.entries.count("b.txt"), 1u);
    EXPECT_EQ(fresh.entries.count("a.txt"), 1u);
}

TEST_F(AttrCacheTest, FailedFetchFallsBackToEmptyAndRetries) {
    repo_->fail_list = true;
    AttrCache::Listing failed = cache_->list("/docs");
    EXPECT_EQ(failed.origin, AttrCache::kFallback);
    EXPECT_TRUE(failed.status.is_io_error());
    EXPECT_TRUE(failed.entries.empty());
    EXPECT_FALSE(cache_->has_snapshot("/docs"));

    // No clock movement: the failure must not have been cached.
    repo_->fail_list = false;
    AttrCache::Listing recovered = cache_->list("/docs");
    EXPECT_EQ(recovered.origin, AttrCache::kRefreshed);
    EXPECT_EQ(recovered.entries.count("a.txt"), 1u);
    EXPECT_EQ(repo_->list_calls, 2);
}

TEST_F(AttrCacheTest, MissingDirectoryFallsBackToEmpty) {
    AttrCache::Listing listing = cache_->list("/nope");
    EXPECT_EQ(listing.origin, AttrCache::kFallback);
    EXPECT_TRUE(listing.status.is_not_found());
    EXPECT_TRUE(listing.entries.empty());
}

TEST_F(AttrCacheTest, PatchWithoutSnapshotIsNoop) {
    cache_->patch("/docs", "new.txt", EntryKind::kFile, 0);
    EXPECT_FALSE(cache_->has_snapshot("/docs"));

    AttrCache::Listing listing = cache_->list("/docs");
    EXPECT_EQ(listing.entries.count("new.txt"), 0u);
}

TEST_F(AttrCacheTest, PatchAndDropEditExistingSnapshot) {
    cache_->list("/docs");
    cache_->patch("/docs", "new.txt", EntryKind::kFile, 42);
    cache_->drop("/docs", "a.txt");

    AttrCache::Listing listing = cache_->list("/docs");
    EXPECT_EQ(listing.origin, AttrCache::kCacheHit);
    ASSERT_EQ(listing.entries.count("new.txt"), 1u);
    EXPECT_EQ(listing.entries.at("new.txt").size, 42u);
    EXPECT_EQ(listing.entries.at("new.txt").created_at, now_);
    EXPECT_EQ(listing.entries.count("a.txt"), 0u);
}

TEST_F(AttrCacheTest, KeysAreNormalized) {
    cache_->list("/docs/");
    cache_->list("//docs");
    EXPECT_EQ(repo_->list_calls, 1);
}

TEST_F(AttrCacheTest, LookupResolvesThroughParentListing) {
    auto [s, entry] = cache_->lookup("/docs/a.txt");
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(entry.size, 5u);

    auto [ms, missing] = cache_->lookup("/docs/zzz");
    EXPECT_TRUE(ms.is_not_found());
}

TEST_F(AttrCacheTest, InvalidateForcesRefetch) {
    cache_->list("/docs");
    cache_->invalidate("/docs");
    cache_->list("/docs");
    EXPECT_EQ(repo_->list_calls, 2);
}

TEST_F(AttrCacheTest, MutationDuringFetchIsNotOverwritten) {
    repo_->on_list = [this] {
        ASSERT_TRUE(repo_->remove_file("/docs/a.txt").ok());
        cache_->drop("/docs", "a.txt");
    };
    AttrCache::Listing inflight = cache_->list("/docs");
    EXPECT_EQ(inflight.origin, AttrCache::kRefreshed);
    EXPECT_FALSE(cache_->has_snapshot("/docs"));

    auto [s, entry] = cache_->lookup("/docs/a.txt");
    EXPECT_TRUE(s.is_not_found());
    EXPECT_EQ(repo_->list_calls, 2);
}

TEST_F(AttrCacheTest, UnrelatedMutationDoesNotDiscardFetch) {
    repo_->on_list = [this] { cache_->drop("/elsewhere", "x"); };
    cache_->list("/docs");
    EXPECT_TRUE(cache_->has_snapshot("/docs"));
}
