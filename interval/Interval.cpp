#include "interval/Interval.hpp"

#include <typeinfo>

#include "base/TimeAlgException.hpp"

namespace timealg {
namespace interval {

const Bound UNBOUNDED = Bound();

int start_compare(const Bound &a, const Bound &b) {
  if (!a && !b) return 0;
  if (!a) return -1;
  if (!b) return 1;
  if (*a < *b) return -1;
  return *a > *b ? 1 : 0;
}

int end_compare(const Bound &a, const Bound &b) {
  if (!a && !b) return 0;
  if (!a) return 1;
  if (!b) return -1;
  if (*a < *b) return -1;
  return *a > *b ? 1 : 0;
}

int start_end_compare(const Bound &start, const Bound &end) {
  // -inf start or +inf end: the start is always smaller.
  if (!start || !end) return -1;
  if (*start < *end) return -1;
  return *start > *end ? 1 : 0;
}

Bound max_start(const Bound &a, const Bound &b) {
  return start_compare(a, b) >= 0 ? a : b;
}

Bound min_end(const Bound &a, const Bound &b) {
  return end_compare(a, b) <= 0 ? a : b;
}

Bound max_end(const Bound &a, const Bound &b) {
  return end_compare(a, b) >= 0 ? a : b;
}

std::string bound_string(const Bound &b, bool is_start) {
  if (!b) return is_start ? "-inf" : "+inf";
  return std::to_string(*b);
}

Interval::Interval(const Bound &start, const Bound &end)
    : start_(start), end_(end) {
  if (start_ && end_ && *start_ > *end_)
    throw base::ValidationError("interval start " + std::to_string(*start_) +
                                " is after end " + std::to_string(*end_));
}

boost::optional<int64_t> Interval::duration() const {
  if (!bounded()) return boost::none;
  return *end_ - *start_;
}

bool Interval::same_as(const Interval &other) const {
  return typeid(*this) == typeid(other) && same_bounds(*this, other);
}

std::string Interval::to_string() const {
  return "[" + bound_string(start_, true) + ", " + bound_string(end_, false) +
         ")";
}

IntervalPtr Interval::clone(const Bound &start, const Bound &end) const {
  return IntervalPtr(new Interval(start, end));
}

LabeledInterval::LabeledInterval(const Bound &start, const Bound &end,
                                 const label::Labels &labels)
    : Interval(start, end), labels_(labels) {}

bool LabeledInterval::same_as(const Interval &other) const {
  if (!Interval::same_as(other)) return false;
  return label::lbs_compare(
             labels_, static_cast<const LabeledInterval &>(other).labels_) ==
         0;
}

std::string LabeledInterval::to_string() const {
  return Interval::to_string() + label::lbs_string(labels_);
}

IntervalPtr LabeledInterval::clone(const Bound &start, const Bound &end) const {
  return IntervalPtr(new LabeledInterval(start, end, labels_));
}

IntervalPtr make_interval(const Bound &start, const Bound &end) {
  return IntervalPtr(new Interval(start, end));
}

IntervalPtr make_labeled(const Bound &start, const Bound &end,
                         const label::Labels &labels) {
  return IntervalPtr(new LabeledInterval(start, end, labels));
}

int compare(const Interval &a, const Interval &b) {
  int c = start_compare(a.start(), b.start());
  if (c != 0) return c;
  return end_compare(a.end(), b.end());
}

bool overlaps(const Interval &a, const Interval &b) {
  return start_end_compare(max_start(a.start(), b.start()),
                           min_end(a.end(), b.end())) < 0;
}

IntervalPtr clip(const IntervalPtr &itvl, const Bound &start,
                 const Bound &end) {
  if (itvl->start() && itvl->end() && *itvl->start() == *itvl->end()) {
    if (start_compare(start, itvl->start()) <= 0 &&
        start_end_compare(itvl->start(), end) < 0)
      return itvl;
    return nullptr;
  }
  Bound s = max_start(itvl->start(), start);
  Bound e = min_end(itvl->end(), end);
  if (start_end_compare(s, e) >= 0) return nullptr;
  if (start_compare(s, itvl->start()) == 0 && end_compare(e, itvl->end()) == 0)
    return itvl;
  return itvl->with_bounds(s, e);
}

bool same_bounds(const Interval &a, const Interval &b) {
  return start_compare(a.start(), b.start()) == 0 &&
         end_compare(a.end(), b.end()) == 0;
}

bool intervals_equal(const Intervals &itvls1, const Intervals &itvls2) {
  if (itvls1.size() != itvls2.size()) return false;
  Intervals::const_iterator it1 = itvls1.cbegin();
  Intervals::const_iterator it2 = itvls2.cbegin();
  while (it1 != itvls1.cend()) {
    if (!same_bounds(**it1, **it2)) return false;
    ++it1;
    ++it2;
  }
  return true;
}

}  // namespace interval
}  // namespace timealg
