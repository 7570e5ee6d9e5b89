#include "source/StaticSource.hpp"

#include <algorithm>
#include <limits>

#include "base/TimeAlgException.hpp"

namespace timealg {
namespace source {

namespace {

// Filters the candidate slice down to intervals touching [start, end).
class StaticIterator : public IntervalIteratorInterface {
 private:
  ListIntervalIterator it_;
  interval::Bound start_;

 public:
  StaticIterator(const std::shared_ptr<const interval::Intervals> &list,
                 size_t begin, size_t end, const interval::Bound &start)
      : it_(list, begin, end), start_(start) {}

  bool next() const {
    while (it_.next()) {
      const interval::IntervalPtr &p = it_.at();
      if (interval::start_end_compare(start_, p->end()) < 0) return true;
      // Zero-length interval sitting on the range start.
      if (interval::start_compare(p->start(), start_) >= 0) return true;
    }
    return false;
  }

  interval::IntervalPtr at() const { return it_.at(); }
};

}  // namespace

StaticSource::StaticSource(const interval::Intervals &intervals, bool is_mask)
    : SourceInterface(is_mask) {
  init(intervals);
}

StaticSource::StaticSource(const interval::Intervals &intervals, bool is_mask,
                           const BoundCoercer &coercer)
    : SourceInterface(is_mask, coercer) {
  init(intervals);
}

void StaticSource::init(const interval::Intervals &intervals) {
  std::shared_ptr<interval::Intervals> sorted(new interval::Intervals());
  for (const interval::IntervalPtr &p : intervals) {
    if (!p) throw base::InvalidArgument("null interval in static source");
    sorted->push_back(p);
  }
  std::stable_sort(sorted->begin(), sorted->end(), interval::IntervalLess());

  max_ends_.reserve(sorted->size());
  int64_t running = std::numeric_limits<int64_t>::min();
  for (const interval::IntervalPtr &p : *sorted) {
    running = std::max(running, p->finite_end());
    max_ends_.push_back(running);
  }
  intervals_ = sorted;
}

std::unique_ptr<IntervalIteratorInterface> StaticSource::fetch(
    const interval::Bound &start, const interval::Bound &end) const {
  size_t begin = 0;
  if (start)
    begin = std::lower_bound(max_ends_.begin(), max_ends_.end(), *start) -
            max_ends_.begin();

  size_t last = intervals_->size();
  if (end) {
    int64_t e = *end;
    last = std::partition_point(intervals_->begin(), intervals_->end(),
                                [e](const interval::IntervalPtr &p) {
                                  return p->finite_start() < e;
                                }) -
           intervals_->begin();
  }
  if (begin >= last)
    return std::unique_ptr<IntervalIteratorInterface>(
        new EmptyIntervalIterator());
  return std::unique_ptr<IntervalIteratorInterface>(
      new StaticIterator(intervals_, begin, last, start));
}

SourcePtr timeline_of(const interval::Intervals &intervals) {
  return SourcePtr(new StaticSource(intervals, false));
}

SourcePtr mask_of(const interval::Intervals &intervals) {
  return SourcePtr(new StaticSource(intervals, true));
}

}  // namespace source
}  // namespace timealg
