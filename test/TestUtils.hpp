#ifndef TESTUTILS_H
#define TESTUTILS_H

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <deque>
#include <string>
#include <utility>
#include <vector>

#include "base/Logging.hpp"
#include "base/TimeStamp.hpp"
#include "interval/Interval.hpp"
#include "source/SourceInterface.hpp"

namespace timealg {
namespace test {

typedef std::pair<interval::Bound, interval::Bound> BoundPair;
typedef std::vector<BoundPair> BoundPairs;

// "0:10,20:30,:5,40:" -> [0,10) [20,30) [-inf,5) [40,+inf)
interval::Intervals parse_intervals(const std::string &s);
BoundPairs parse_bounds(const std::string &s);

BoundPairs bounds_of(const interval::Intervals &itvls);

// Same format as parse_intervals, for readable assertion messages.
std::string format_bounds(const interval::Intervals &itvls);

interval::IntervalPtr labeled(const interval::Bound &start,
                              const interval::Bound &end,
                              const std::string &name,
                              const std::string &value);

// Wraps a source and records the range of every fetch.
class CountingSource : public source::SourceInterface {
 private:
  source::SourcePtr child_;
  mutable BoundPairs calls_;

 public:
  CountingSource(const source::SourcePtr &child)
      : source::SourceInterface(child->is_mask(), child->coercer()),
        child_(child) {}

  std::unique_ptr<source::IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const {
    calls_.push_back(BoundPair(start, end));
    return child_->fetch(start, end);
  }

  const BoundPairs &calls() const { return calls_; }
  size_t num_calls() const { return calls_.size(); }
};

// Hand-driven clock for TTL tests.
class ManualClock {
 private:
  base::TimeStamp now_;

 public:
  ManualClock() : now_(base::TimeStamp::fromUnixTime(1700000000)) {}

  base::TimeStamp now() const { return now_; }

  void advance(double seconds) { now_ = base::addTime(now_, seconds); }
};

}  // namespace test
}  // namespace timealg

#endif
