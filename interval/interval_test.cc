#include <limits>

#include "base/TimeAlgException.hpp"
#include "gtest/gtest.h"
#include "interval/Interval.hpp"
#include "test/TestUtils.hpp"

namespace timealg {
namespace interval {

class IntervalTest : public testing::Test {};

TEST_F(IntervalTest, TestBounds) {
  IntervalPtr a = make_interval(0, 10);
  ASSERT_TRUE(a->bounded());
  ASSERT_EQ(10, *a->duration());
  ASSERT_EQ(0, a->finite_start());
  ASSERT_EQ(10, a->finite_end());

  IntervalPtr b = make_interval(UNBOUNDED, 5);
  ASSERT_FALSE(b->bounded());
  ASSERT_FALSE(b->duration());
  ASSERT_EQ(std::numeric_limits<int64_t>::min(), b->finite_start());

  IntervalPtr c = make_interval(5, UNBOUNDED);
  ASSERT_EQ(std::numeric_limits<int64_t>::max(), c->finite_end());
  ASSERT_EQ("[-inf, 5)", b->to_string());
  ASSERT_EQ("[5, +inf)", c->to_string());

  // Zero length is allowed, reversed bounds are not.
  ASSERT_EQ(0, *make_interval(7, 7)->duration());
  ASSERT_THROW(make_interval(10, 0), base::ValidationError);
}

TEST_F(IntervalTest, TestOrdering) {
  ASSERT_LT(compare(*make_interval(UNBOUNDED, 0), *make_interval(-100, 0)), 0);
  ASSERT_LT(compare(*make_interval(0, 5), *make_interval(0, UNBOUNDED)), 0);
  ASSERT_LT(compare(*make_interval(0, 5), *make_interval(0, 6)), 0);
  ASSERT_GT(compare(*make_interval(1, 2), *make_interval(0, 100)), 0);
  ASSERT_EQ(0, compare(*make_interval(UNBOUNDED, UNBOUNDED),
                       *make_interval(UNBOUNDED, UNBOUNDED)));

  // A sentinel never equals a finite value, even the extreme ones.
  ASSERT_NE(0, start_compare(UNBOUNDED, std::numeric_limits<int64_t>::min()));
  ASSERT_NE(0, end_compare(UNBOUNDED, std::numeric_limits<int64_t>::max()));
}

TEST_F(IntervalTest, TestOverlaps) {
  ASSERT_TRUE(overlaps(*make_interval(0, 10), *make_interval(5, 15)));
  // Half-open: touching is not overlapping.
  ASSERT_FALSE(overlaps(*make_interval(0, 10), *make_interval(10, 20)));
  ASSERT_TRUE(
      overlaps(*make_interval(UNBOUNDED, 1), *make_interval(0, UNBOUNDED)));
  ASSERT_TRUE(overlaps(*make_interval(UNBOUNDED, UNBOUNDED),
                       *make_interval(UNBOUNDED, UNBOUNDED)));
  ASSERT_FALSE(overlaps(*make_interval(5, 5), *make_interval(0, 10)));
}

TEST_F(IntervalTest, TestClip) {
  IntervalPtr a = make_interval(0, 30);
  IntervalPtr c = clip(a, 10, 20);
  ASSERT_EQ(10, *c->start());
  ASSERT_EQ(20, *c->end());

  // Untouched when already inside.
  ASSERT_EQ(a.get(), clip(a, UNBOUNDED, UNBOUNDED).get());
  ASSERT_EQ(nullptr, clip(a, 30, 40));

  IntervalPtr u = make_interval(UNBOUNDED, UNBOUNDED);
  c = clip(u, 0, UNBOUNDED);
  ASSERT_EQ(0, *c->start());
  ASSERT_FALSE(c->end());

  IntervalPtr p = make_interval(5, 5);
  ASSERT_EQ(p.get(), clip(p, 5, 10).get());
  ASSERT_EQ(nullptr, clip(p, 0, 5));
}

TEST_F(IntervalTest, TestLabeled) {
  IntervalPtr a = test::labeled(0, 100, "title", "standup");
  IntervalPtr b = a->with_bounds(10, 20);
  ASSERT_TRUE(b->has_metadata());
  const LabeledInterval *l = dynamic_cast<const LabeledInterval *>(b.get());
  ASSERT_NE(nullptr, l);
  ASSERT_EQ("standup", *l->get("title"));
  ASSERT_EQ(nullptr, l->get("room"));
  ASSERT_EQ("[10, 20){title=standup}", b->to_string());

  ASSERT_TRUE(a->same_as(*test::labeled(0, 100, "title", "standup")));
  ASSERT_FALSE(a->same_as(*test::labeled(0, 100, "title", "retro")));
  ASSERT_FALSE(a->same_as(*make_interval(0, 100)));
  ASSERT_FALSE(make_interval(0, 100)->same_as(*a));
  ASSERT_TRUE(make_interval(0, 100)->same_as(*make_interval(0, 100)));

  // Clipping keeps the concrete type.
  IntervalPtr c = clip(a, 50, 200);
  ASSERT_TRUE(c->has_metadata());
  ASSERT_EQ(50, *c->start());
  ASSERT_EQ(100, *c->end());
}

TEST_F(IntervalTest, TestIntervalsEqual) {
  Intervals l1 = test::parse_intervals("0:10,:5,40:");
  Intervals l2;
  l2.push_back(make_interval(0, 10));
  l2.push_back(make_interval(UNBOUNDED, 5));
  l2.push_back(make_interval(40, UNBOUNDED));
  ASSERT_TRUE(intervals_equal(l1, l2));
  l2.pop_back();
  ASSERT_FALSE(intervals_equal(l1, l2));
}

}  // namespace interval
}  // namespace timealg

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
