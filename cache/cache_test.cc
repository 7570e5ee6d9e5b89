#include <boost/bind.hpp>

#include "base/TimeAlgException.hpp"
#include "cache/CachedSource.hpp"
#include "gtest/gtest.h"
#include "ops/Compose.hpp"
#include "query/Querier.hpp"
#include "source/StaticSource.hpp"
#include "test/TestUtils.hpp"

namespace timealg {
namespace cache {

class CacheTest : public testing::Test {
 protected:
  test::ManualClock clock;
  std::shared_ptr<test::CountingSource> upstream;
  source::SourcePtr cache;

  void SetUp() {
    upstream.reset(new test::CountingSource(source::timeline_of(
        test::parse_intervals("0:10,20:30,45:55,90:120,140:145"))));
    cache = cached(upstream,
                   CacheOptions(60, boost::bind(&test::ManualClock::now, &clock)));
  }

  std::string run(const interval::Bound &start, const interval::Bound &end) {
    return test::format_bounds(query::query(cache, start, end));
  }
};

TEST_F(CacheTest, TestHitWithinTtl) {
  ASSERT_EQ("0:10,20:30,45:50", run(0, 50));
  clock.advance(30);
  ASSERT_EQ("0:10,20:30,45:50", run(0, 50));
  ASSERT_EQ(1, upstream->num_calls());

  // A sub range is served from the same segment.
  ASSERT_EQ("20:30", run(15, 35));
  ASSERT_EQ(1, upstream->num_calls());
}

TEST_F(CacheTest, TestExpiry) {
  run(0, 50);
  clock.advance(60);
  ASSERT_EQ("0:10,20:30,45:50", run(0, 50));
  ASSERT_EQ(2, upstream->num_calls());
  ASSERT_EQ(1, dynamic_cast<CachedSource &>(*cache).num_segments());
}

TEST_F(CacheTest, TestPartialHit) {
  run(0, 100);
  ASSERT_EQ("50:55,90:120,140:145", run(50, 150));
  ASSERT_EQ(2, upstream->num_calls());
  ASSERT_EQ(100, *upstream->calls()[1].first);
  ASSERT_EQ(150, *upstream->calls()[1].second);
}

TEST_F(CacheTest, TestClippedStaySorted) {
  // Both intervals clip to [11, ...) so the shorter one comes first.
  source::SourcePtr c = cached(
      source::timeline_of(test::parse_intervals("5:15,8:12")),
      CacheOptions(60, boost::bind(&test::ManualClock::now, &clock)));
  ASSERT_EQ("11:12,11:13",
            test::format_bounds(source::expand_intervals(c->fetch(11, 13).get())));
  ASSERT_EQ("11:12,11:13",
            test::format_bounds(source::expand_intervals(c->fetch(11, 13).get())));
}

TEST_F(CacheTest, TestStraddlerNotDuplicated) {
  run(0, 100);
  // [90,120) came back from both fetches.
  ASSERT_EQ("90:120", run(80, 130));
  ASSERT_EQ(2, upstream->num_calls());
  ASSERT_EQ("90:120", run(85, 125));
  ASSERT_EQ(2, upstream->num_calls());
}

TEST_F(CacheTest, TestGapBetweenSegments) {
  run(0, 10);
  run(40, 50);
  ASSERT_EQ("0:10,20:30,45:50", run(0, 50));
  ASSERT_EQ(3, upstream->num_calls());
  ASSERT_EQ(10, *upstream->calls()[2].first);
  ASSERT_EQ(40, *upstream->calls()[2].second);
}

TEST_F(CacheTest, TestFracture) {
  CachedSource &c = dynamic_cast<CachedSource &>(*cache);
  run(0, 100);
  clock.advance(50);
  run(100, 200);
  clock.advance(20);

  // [0,100) is stale, [100,200) is not. Only [40,60) is refetched and the
  // stale remainders [0,40) and [60,100) stay behind.
  ASSERT_EQ("45:55", run(40, 60));
  ASSERT_EQ(3, upstream->num_calls());
  ASSERT_EQ(40, *upstream->calls()[2].first);
  ASSERT_EQ(60, *upstream->calls()[2].second);
  ASSERT_EQ(4, c.num_segments());

  // Asking over the stale left remainder refetches just that.
  ASSERT_EQ("0:10,20:30,45:50", run(0, 50));
  ASSERT_EQ(4, upstream->num_calls());
  ASSERT_EQ(0, *upstream->calls()[3].first);
  ASSERT_EQ(40, *upstream->calls()[3].second);

  // The fresh segment is never touched.
  ASSERT_EQ("140:145", run(130, 150));
  ASSERT_EQ(4, upstream->num_calls());
}

TEST_F(CacheTest, TestEvictInside) {
  CachedSource &c = dynamic_cast<CachedSource &>(*cache);
  run(20, 30);
  clock.advance(100);
  ASSERT_EQ("0:10,20:30", run(0, 40));
  ASSERT_EQ(1, c.num_segments());
  ASSERT_EQ(2, upstream->num_calls());
}

TEST_F(CacheTest, TestUnbounded) {
  ASSERT_EQ("0:10,20:30,45:55,90:120,140:145",
            run(interval::UNBOUNDED, interval::UNBOUNDED));
  ASSERT_EQ("100:110", run(100, 110));
  ASSERT_EQ("0:5", run(interval::UNBOUNDED, 5));
  ASSERT_EQ(1, upstream->num_calls());

  source::SourcePtr gaps = cached(ops::complement_of(upstream));
  ASSERT_EQ(":0,10:20,30:45,55:90,120:140,145:",
            test::format_bounds(query::query(gaps, interval::UNBOUNDED,
                                             interval::UNBOUNDED)));
  ASSERT_EQ(2, upstream->num_calls());
}

TEST_F(CacheTest, TestOptions) {
  ASSERT_EQ(300, DefaultCacheOptions.ttl_seconds);
  ASSERT_FALSE(DefaultCacheOptions.validate());
  ASSERT_TRUE(CacheOptions(0).validate());
  ASSERT_THROW(cached(upstream, CacheOptions(0)), base::InvalidArgument);
  ASSERT_THROW(cached(upstream, CacheOptions(-5)), base::InvalidArgument);
  ASSERT_THROW(cached(source::SourcePtr()), base::InvalidArgument);
  ASSERT_FALSE(cache->is_mask());
}

}  // namespace cache
}  // namespace timealg

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
