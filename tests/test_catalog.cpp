#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

#include "clip_forge/catalog.hpp"
#include "clip_forge/error.hpp"
#include "clip_forge/system.hpp"
#include "test_helpers.hpp"

using namespace clip_forge;
using namespace clip_forge::test;

namespace {

ClipRecord make_record(const std::string &name, double duration) {
  ClipRecord r;
  r.filename = name;
  r.filepath = "/srv/uploads/" + name;
  r.size = 1234;
  r.duration = duration;
  return r;
}

} // namespace

TEST(CatalogTest, InsertAssignsFreshIds) {
  Catalog catalog(":memory:");
  ClipRecord a = catalog.insert_clip(make_record("a.raw", 1.0));
  ClipRecord b = catalog.insert_clip(make_record("b.raw", 2.0));
  EXPECT_GT(a.id, 0);
  EXPECT_NE(a.id, b.id);
  EXPECT_EQ(catalog.clip_count(), 2);
}

TEST(CatalogTest, FindReturnsStoredRow) {
  Catalog catalog(":memory:");
  ClipRecord stored = catalog.insert_clip(make_record("a.raw", 4.25));

  auto found = catalog.find_clip(stored.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename, "a.raw");
  EXPECT_EQ(found->filepath, "/srv/uploads/a.raw");
  EXPECT_EQ(found->size, 1234u);
  EXPECT_DOUBLE_EQ(found->duration, 4.25);
  EXPECT_TRUE(is_raw(found->clip()));
}

TEST(CatalogTest, UnknownIdIsEmpty) {
  Catalog catalog(":memory:");
  EXPECT_FALSE(catalog.find_clip(42).has_value());
}

TEST(CatalogTest, ClipFormFollowsExtension) {
  Catalog catalog(":memory:");
  ClipRecord mp4 = catalog.insert_clip(make_record("b.mp4", 1.0));
  ClipRecord upper = catalog.insert_clip(make_record("c.RAW", 1.0));
  EXPECT_FALSE(is_raw(catalog.find_clip(mp4.id)->clip()));
  EXPECT_TRUE(is_raw(catalog.find_clip(upper.id)->clip()));
}

TEST(CatalogTest, IdsAreNeverReused) {
  TempDir dir;
  std::string db = dir.file("catalog.db");
  int64_t first = 0;
  {
    Catalog catalog(db);
    first = catalog.insert_clip(make_record("a.raw", 1.0)).id;
  }
  Catalog reopened(db);
  EXPECT_TRUE(reopened.find_clip(first).has_value());
  EXPECT_GT(reopened.insert_clip(make_record("b.raw", 1.0)).id, first);
}

TEST(CatalogTest, ShareRoundTripKeepsMillisecondExpiry) {
  Catalog catalog(":memory:");
  ClipRecord clip = catalog.insert_clip(make_record("a.raw", 1.0));

  ShareGrant grant;
  grant.token = "1700000000000-abc";
  grant.clip_id = clip.id;
  grant.expiry = from_epoch_ms(1700000123456);
  catalog.insert_share(grant);

  auto found = catalog.find_share(grant.token);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->clip_id, clip.id);
  EXPECT_EQ(to_epoch_ms(found->expiry), 1700000123456);
  EXPECT_FALSE(catalog.find_share("other").has_value());
}

TEST(CatalogTest, ConcurrentInsertsGetDistinctIds) {
  Catalog catalog(":memory:");
  std::vector<std::thread> threads;
  std::vector<std::vector<int64_t>> ids(4);

  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&catalog, &ids, t] {
      for (int i = 0; i < 25; ++i)
        ids[t].push_back(catalog.insert_clip(make_record("x.raw", 1.0)).id);
    });
  }
  for (auto &th : threads)
    th.join();

  std::set<int64_t> all;
  for (const auto &v : ids)
    all.insert(v.begin(), v.end());
  EXPECT_EQ(all.size(), 100u);
  EXPECT_EQ(catalog.clip_count(), 100);
}

TEST(CatalogTest, UnopenablePathIsIOFailure) {
  try {
    Catalog catalog("/nonexistent-dir/for/sure/catalog.db");
    FAIL() << "expected ClipError";
  } catch (const ClipError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::IOFailure);
  }
}
