#include "base/TimeAlgException.hpp"
#include "gtest/gtest.h"
#include "source/BoundCoercion.hpp"
#include "source/DailyWindowSource.hpp"
#include "source/StaticSource.hpp"
#include "test/TestUtils.hpp"

namespace timealg {
namespace source {

// 2024-01-01 00:00:00 UTC, a Monday.
const int64_t MONDAY_2024 = 1704067200;
const int64_t ONE_DAY = 86400;

class StaticSourceTest : public testing::Test {};

TEST_F(StaticSourceTest, TestFetchOverlapping) {
  SourcePtr s = timeline_of(test::parse_intervals("30:40,0:100,10:20"));
  ASSERT_FALSE(s->is_mask());

  // Returned unclipped and sorted.
  interval::Intervals r = expand_intervals(s->fetch(15, 35).get());
  ASSERT_EQ("0:100,10:20,30:40", test::format_bounds(r));

  // The long interval is found through the running max end.
  r = expand_intervals(s->fetch(50, 60).get());
  ASSERT_EQ("0:100", test::format_bounds(r));

  r = expand_intervals(s->fetch(100, 200).get());
  ASSERT_TRUE(r.empty());

  r = expand_intervals(s->fetch(interval::UNBOUNDED, interval::UNBOUNDED).get());
  ASSERT_EQ(3, r.size());
}

TEST_F(StaticSourceTest, TestUnboundedMembers) {
  SourcePtr s = mask_of(test::parse_intervals("40:,:5,10:20"));
  ASSERT_TRUE(s->is_mask());

  interval::Intervals r = expand_intervals(s->fetch(0, 50).get());
  ASSERT_EQ(":5,10:20,40:", test::format_bounds(r));

  r = expand_intervals(s->fetch(100, interval::UNBOUNDED).get());
  ASSERT_EQ("40:", test::format_bounds(r));

  r = expand_intervals(s->fetch(interval::UNBOUNDED, 0).get());
  ASSERT_EQ(":5", test::format_bounds(r));
}

TEST_F(StaticSourceTest, TestRestartable) {
  SourcePtr s = timeline_of(test::parse_intervals("0:10,20:30"));
  std::unique_ptr<IntervalIteratorInterface> it1 = s->fetch(0, 30);
  ASSERT_TRUE(it1->next());
  std::unique_ptr<IntervalIteratorInterface> it2 = s->fetch(0, 30);
  ASSERT_EQ(2, expand_intervals(it2.get()).size());
  ASSERT_TRUE(it1->next());
  ASSERT_EQ(20, *it1->at()->start());
  ASSERT_FALSE(it1->next());
}

TEST_F(StaticSourceTest, TestZeroLength) {
  SourcePtr s = timeline_of(test::parse_intervals("5:5,10:10"));
  interval::Intervals r = expand_intervals(s->fetch(5, 10).get());
  ASSERT_EQ("5:5", test::format_bounds(r));
}

TEST_F(StaticSourceTest, TestNullInterval) {
  interval::Intervals l;
  l.push_back(nullptr);
  ASSERT_THROW(timeline_of(l), base::InvalidArgument);
}

class BoundCoercionTest : public testing::Test {};

TEST_F(BoundCoercionTest, TestDefault) {
  ASSERT_FALSE(default_coerce(QueryBound(), START_EDGE));
  ASSERT_FALSE(default_coerce(interval::UNBOUNDED, END_EDGE));
  ASSERT_EQ(42, *default_coerce(42, START_EDGE));

  boost::gregorian::date d(2024, 1, 1);
  ASSERT_EQ(MONDAY_2024, *default_coerce(d, START_EDGE));
  ASSERT_EQ(MONDAY_2024 + ONE_DAY, *default_coerce(d, END_EDGE));

  boost::local_time::time_zone_ptr tz = make_zone("EET+02");
  boost::local_time::local_date_time t(
      boost::posix_time::ptime(d, boost::posix_time::hours(12)), tz);
  ASSERT_EQ(MONDAY_2024 + 12 * 3600, *default_coerce(t, START_EDGE));
}

TEST_F(BoundCoercionTest, TestSpecial) {
  ASSERT_THROW(default_coerce(boost::gregorian::date(boost::gregorian::not_a_date_time),
                              START_EDGE),
               base::InvalidArgument);
  boost::local_time::local_date_time t(boost::date_time::not_a_date_time,
                                       make_zone("UTC0"));
  ASSERT_THROW(default_coerce(t, END_EDGE), base::InvalidArgument);
}

TEST_F(BoundCoercionTest, TestZone) {
  BoundCoercer c = zone_coercer("EET+02");
  boost::gregorian::date d(2024, 1, 1);
  ASSERT_EQ(MONDAY_2024 - 2 * 3600, *c(d, START_EDGE));
  ASSERT_EQ(MONDAY_2024 + ONE_DAY - 2 * 3600, *c(d, END_EDGE));
  // Everything else behaves as the default.
  ASSERT_EQ(7, *c(7, START_EDGE));
  ASSERT_FALSE(c(QueryBound(), END_EDGE));

  SourcePtr s(new StaticSource(interval::Intervals(), false, c));
  ASSERT_EQ(MONDAY_2024 - 2 * 3600, *s->coercer()(d, START_EDGE));
}

class DailyWindowTest : public testing::Test {};

TEST_F(DailyWindowTest, TestWeekdays) {
  SourcePtr s = weekdays();
  ASSERT_TRUE(s->is_mask());
  interval::Intervals r =
      expand_intervals(s->fetch(MONDAY_2024, MONDAY_2024 + 7 * ONE_DAY).get());
  ASSERT_EQ(5, r.size());
  for (int i = 0; i < 5; ++i) {
    ASSERT_EQ(MONDAY_2024 + i * ONE_DAY, *r[i]->start());
    ASSERT_EQ(MONDAY_2024 + (i + 1) * ONE_DAY, *r[i]->end());
  }

  r = expand_intervals(
      weekends()->fetch(MONDAY_2024, MONDAY_2024 + 7 * ONE_DAY).get());
  ASSERT_EQ(2, r.size());
  ASSERT_EQ(MONDAY_2024 + 5 * ONE_DAY, *r[0]->start());
  ASSERT_EQ(MONDAY_2024 + 7 * ONE_DAY, *r[1]->end());
}

TEST_F(DailyWindowTest, TestBusinessHours) {
  SourcePtr s = business_hours("UTC0", 9, 17);
  interval::Intervals r =
      expand_intervals(s->fetch(MONDAY_2024, MONDAY_2024 + 7 * ONE_DAY).get());
  ASSERT_EQ(5, r.size());
  ASSERT_EQ(MONDAY_2024 + 9 * 3600, *r[0]->start());
  ASSERT_EQ(MONDAY_2024 + 17 * 3600, *r[0]->end());

  // A window already running at the range start is still returned.
  r = expand_intervals(
      s->fetch(MONDAY_2024 + 10 * 3600, MONDAY_2024 + 11 * 3600).get());
  ASSERT_EQ(1, r.size());
  ASSERT_EQ(MONDAY_2024 + 9 * 3600, *r[0]->start());

  // Local 09:00 at UTC+2 is 07:00 UTC.
  r = expand_intervals(business_hours("EET+02", 9, 17)
                           ->fetch(MONDAY_2024, MONDAY_2024 + ONE_DAY)
                           .get());
  ASSERT_EQ(1, r.size());
  ASSERT_EQ(MONDAY_2024 + 7 * 3600, *r[0]->start());
  ASSERT_EQ(MONDAY_2024 + 15 * 3600, *r[0]->end());

  // Nothing starting at or after the range end, even on the next local day.
  r = expand_intervals(business_hours("EET+02", 9, 17)
                           ->fetch(MONDAY_2024, MONDAY_2024 + 5 * 3600)
                           .get());
  ASSERT_EQ(0, r.size());
}

TEST_F(DailyWindowTest, TestInvalid) {
  ASSERT_THROW(weekdays()->fetch(interval::UNBOUNDED, MONDAY_2024),
               base::InvalidArgument);
  ASSERT_THROW(weekdays()->fetch(MONDAY_2024, interval::UNBOUNDED),
               base::InvalidArgument);
  ASSERT_THROW(business_hours("UTC0", 17, 9), base::InvalidArgument);
  ASSERT_THROW(business_hours("UTC0", -1, 9), base::InvalidArgument);
  ASSERT_THROW(business_hours("UTC0", 9, 25), base::InvalidArgument);

  WindowOptions options;
  ASSERT_FALSE(options.validate());
  options.days = 0;
  ASSERT_TRUE(options.validate());
  options = DefaultWindowOptions;
  options.tz = "";
  ASSERT_EQ("empty time zone", options.validate().error());

  // Empty range.
  ASSERT_FALSE(weekdays()->fetch(MONDAY_2024, MONDAY_2024)->next());
}

}  // namespace source
}  // namespace timealg

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
