#include "ops/DifferenceSource.hpp"

#include "ops/UnionSource.hpp"

namespace timealg {
namespace ops {

DifferenceIterator::DifferenceIterator(
    std::unique_ptr<source::IntervalIteratorInterface> &&l,
    std::unique_ptr<source::IntervalIteratorInterface> &&r)
    : l_(std::move(l)), r_(std::move(r)), started_(false) {}

void DifferenceIterator::subtract(const interval::IntervalPtr &x) const {
  std::deque<interval::IntervalPtr>::iterator it = window_.begin();
  while (it != window_.end()) {
    if (interval::start_end_compare(x->start(), (*it)->end()) >= 0)
      it = window_.erase(it);
    else
      ++it;
  }
  while (r_head_ &&
         interval::start_end_compare(r_head_->start(), x->end()) < 0) {
    window_.push_back(r_head_);
    r_head_ = r_->next() ? r_->at() : nullptr;
  }

  if (x->duration() && *x->duration() == 0) {
    // A point survives unless some right interval contains it.
    for (const interval::IntervalPtr &r : window_) {
      if (interval::start_compare(r->start(), x->start()) <= 0 &&
          interval::start_end_compare(x->start(), r->end()) < 0)
        return;
    }
    buf_.insert(x);
    return;
  }

  interval::Bound cursor = x->start();
  bool cut = false;
  for (const interval::IntervalPtr &r : window_) {
    if (!interval::overlaps(*x, *r)) continue;
    cut = true;
    if (interval::start_compare(r->start(), cursor) > 0)
      buf_.insert(x->with_bounds(cursor, r->start()));
    if (!r->end()) return;
    if (!cursor || *cursor < *r->end()) cursor = r->end();
  }
  if (!cut) {
    buf_.insert(x);
    return;
  }
  if (interval::start_end_compare(cursor, x->end()) < 0)
    buf_.insert(x->with_bounds(cursor, x->end()));
}

bool DifferenceIterator::next() const {
  if (!started_) {
    started_ = true;
    l_head_ = l_->next() ? l_->at() : nullptr;
    r_head_ = r_->next() ? r_->at() : nullptr;
  }
  while (true) {
    bool pending = l_head_ != nullptr;
    if (release(buf_, pending,
                pending ? l_head_->start() : interval::UNBOUNDED, cur_))
      return true;
    if (!pending) return false;
    interval::IntervalPtr x = l_head_;
    l_head_ = l_->next() ? l_->at() : nullptr;
    subtract(x);
  }
}

DifferenceSource::DifferenceSource(const source::SourcePtr &left,
                                   const source::Sources &right)
    : source::SourceInterface(checked(left, "difference")->is_mask(),
                              checked(left, "difference")->coercer()),
      left_(left),
      right_(checked(right, "difference")) {}

std::unique_ptr<source::IntervalIteratorInterface> DifferenceSource::fetch(
    const interval::Bound &start, const interval::Bound &end) const {
  std::unique_ptr<source::IntervalIteratorInterface> l =
      left_->fetch(start, end);
  if (right_.empty()) return l;
  std::deque<std::unique_ptr<source::IntervalIteratorInterface>> rs;
  for (const source::SourcePtr &r : right_) rs.push_back(r->fetch(start, end));
  std::unique_ptr<source::IntervalIteratorInterface> r(
      new UnionIterator(std::move(rs)));
  return std::unique_ptr<source::IntervalIteratorInterface>(
      new DifferenceIterator(std::move(l), std::move(r)));
}

}  // namespace ops
}  // namespace timealg
