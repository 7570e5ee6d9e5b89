#include "query/Querier.hpp"

#include <algorithm>

#include "base/Logging.hpp"
#include "base/TimeAlgException.hpp"

namespace timealg {
namespace query {

namespace {

const source::SourcePtr &checked(const source::SourcePtr &source) {
  if (!source) throw base::InvalidArgument("null source in querier");
  return source;
}

}  // namespace

void ClipIterator::fill_head() const {
  while (it_->next()) {
    interval::IntervalPtr p = interval::clip(it_->at(), start_, end_);
    if (!p) continue;
    head_.push_back(p);
    if (interval::start_compare(p->start(), start_) != 0) break;
  }
  // The last entry may start after the run; it already sorts after it.
  std::stable_sort(head_.begin(), head_.end(), interval::IntervalLess());
}

bool ClipIterator::next() const {
  if (!started_) {
    started_ = true;
    fill_head();
  }
  if (!head_.empty()) {
    cur_ = head_.front();
    head_.pop_front();
    return true;
  }
  while (it_->next()) {
    cur_ = interval::clip(it_->at(), start_, end_);
    if (cur_) return true;
  }
  return false;
}

Querier::Querier(const source::SourcePtr &source,
                 const source::QueryBound &start,
                 const source::QueryBound &end, Direction direction)
    : source_(source),
      start_(checked(source)->coercer()(start, source::START_EDGE)),
      end_(checked(source)->coercer()(end, source::END_EDGE)),
      direction_(direction) {}

std::unique_ptr<source::IntervalIteratorInterface> Querier::select() const {
  LOG_TRACE << "query [" << interval::bound_string(start_, true) << ", "
            << interval::bound_string(end_, false) << ")"
            << (direction_ == DESCENDING ? " desc" : "");
  if (interval::start_end_compare(start_, end_) >= 0)
    return std::unique_ptr<source::IntervalIteratorInterface>(
        new source::EmptyIntervalIterator());

  std::unique_ptr<source::IntervalIteratorInterface> it(
      new ClipIterator(source_->fetch(start_, end_), start_, end_));
  if (direction_ == ASCENDING) return it;

  std::shared_ptr<interval::Intervals> r(
      new interval::Intervals(source::expand_intervals(it.get())));
  std::reverse(r->begin(), r->end());
  return std::unique_ptr<source::IntervalIteratorInterface>(
      new source::ListIntervalIterator(r));
}

interval::Intervals Querier::expand() const {
  std::unique_ptr<source::IntervalIteratorInterface> it = select();
  return source::expand_intervals(it.get());
}

interval::Intervals query(const source::SourcePtr &source,
                          const source::QueryBound &start,
                          const source::QueryBound &end, Direction direction) {
  return Querier(source, start, end, direction).expand();
}

}  // namespace query
}  // namespace timealg
