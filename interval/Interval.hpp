#ifndef INTERVAL_H
#define INTERVAL_H

#include <stdint.h>

#include <boost/optional.hpp>
#include <deque>
#include <limits>
#include <memory>
#include <string>

#include "base/LogStream.hpp"
#include "label/Label.hpp"

namespace timealg {
namespace interval {

// A time bound in seconds. An empty Bound is unbounded: -inf when used as a
// start, +inf when used as an end.
typedef boost::optional<int64_t> Bound;

extern const Bound UNBOUNDED;

inline int64_t finite_start(const Bound &b) {
  return b ? *b : std::numeric_limits<int64_t>::min();
}
inline int64_t finite_end(const Bound &b) {
  return b ? *b : std::numeric_limits<int64_t>::max();
}

// Orderings of bounds in start position (empty = -inf) and end position
// (empty = +inf). A sentinel never equals a finite value.
int start_compare(const Bound &a, const Bound &b);
int end_compare(const Bound &a, const Bound &b);
// Compares a start bound with an end bound, e.g. x.start against y.end.
int start_end_compare(const Bound &start, const Bound &end);

Bound max_start(const Bound &a, const Bound &b);
Bound min_end(const Bound &a, const Bound &b);
Bound max_end(const Bound &a, const Bound &b);

std::string bound_string(const Bound &b, bool is_start);

class Interval;
typedef std::shared_ptr<const Interval> IntervalPtr;
typedef std::deque<IntervalPtr> Intervals;

// Half-open [start, end). Immutable once built; with_bounds() makes a copy of
// the same concrete type (metadata included) over other bounds.
class Interval {
 public:
  Interval(const Bound &start, const Bound &end);
  virtual ~Interval() = default;

  const Bound &start() const { return start_; }
  const Bound &end() const { return end_; }

  int64_t finite_start() const { return interval::finite_start(start_); }
  int64_t finite_end() const { return interval::finite_end(end_); }

  bool bounded() const { return start_ && end_; }

  // end - start, absent when either side is unbounded.
  boost::optional<int64_t> duration() const;

  // Copy with new bounds. May throw base::ValidationError.
  IntervalPtr with_bounds(const Bound &start, const Bound &end) const {
    return clone(start, end);
  }

  // True when this variant carries data beyond its bounds.
  virtual bool has_metadata() const { return false; }

  // Equal bounds, equal concrete type and equal metadata.
  virtual bool same_as(const Interval &other) const;

  virtual std::string to_string() const;

 protected:
  virtual IntervalPtr clone(const Bound &start, const Bound &end) const;

 private:
  Bound start_;
  Bound end_;
};

// Interval tagged with a label set, the metadata-rich variant used by
// calendar-like sources.
class LabeledInterval : public Interval {
 public:
  LabeledInterval(const Bound &start, const Bound &end,
                  const label::Labels &labels);

  const label::Labels &labels() const { return labels_; }

  // nullptr when the interval has no such label.
  const std::string *get(const std::string &name) const {
    return label::lbs_get(labels_, name);
  }

  bool has_metadata() const { return true; }
  bool same_as(const Interval &other) const;
  std::string to_string() const;

 protected:
  IntervalPtr clone(const Bound &start, const Bound &end) const;

 private:
  label::Labels labels_;
};

IntervalPtr make_interval(const Bound &start, const Bound &end);
IntervalPtr make_labeled(const Bound &start, const Bound &end,
                         const label::Labels &labels);

// Lexicographic on (start, end) with sentinel aware comparisons.
int compare(const Interval &a, const Interval &b);

struct IntervalLess {
  bool operator()(const IntervalPtr &a, const IntervalPtr &b) const {
    return compare(*a, *b) < 0;
  }
};

// max(a.start, b.start) < min(a.end, b.end).
bool overlaps(const Interval &a, const Interval &b);

// Overlap of the interval with [start, end) as a new interval of the same
// type, nullptr when disjoint. A zero-length interval is kept when its instant
// lies inside the range.
IntervalPtr clip(const IntervalPtr &itvl, const Bound &start, const Bound &end);

bool same_bounds(const Interval &a, const Interval &b);

// Compares bounds only.
bool intervals_equal(const Intervals &itvls1, const Intervals &itvls2);

inline base::LogStream &operator<<(base::LogStream &s, const Interval &itvl) {
  s << itvl.to_string();
  return s;
}

}  // namespace interval
}  // namespace timealg

#endif
