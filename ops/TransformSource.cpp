#include "ops/TransformSource.hpp"

#include <limits>

#include "ops/OpsUtils.hpp"

namespace timealg {
namespace ops {

namespace {

int64_t saturating_add(int64_t v, int64_t d) {
  if (v > std::numeric_limits<int64_t>::max() - d)
    return std::numeric_limits<int64_t>::max();
  return v + d;
}

int64_t saturating_sub(int64_t v, int64_t d) {
  if (v < std::numeric_limits<int64_t>::min() + d)
    return std::numeric_limits<int64_t>::min();
  return v - d;
}

interval::Bound shift_down(const interval::Bound &b, int64_t d) {
  if (!b) return b;
  return saturating_sub(*b, d);
}

interval::Bound shift_up(const interval::Bound &b, int64_t d) {
  if (!b) return b;
  return saturating_add(*b, d);
}

class BufferIterator : public source::IntervalIteratorInterface {
 private:
  std::unique_ptr<source::IntervalIteratorInterface> it_;
  int64_t before_;
  int64_t after_;
  mutable interval::IntervalPtr cur_;

 public:
  BufferIterator(std::unique_ptr<source::IntervalIteratorInterface> &&it,
                 int64_t before, int64_t after)
      : it_(std::move(it)), before_(before), after_(after) {}

  bool next() const {
    if (!it_->next()) return false;
    interval::IntervalPtr x = it_->at();
    if (before_ == 0 && after_ == 0)
      cur_ = x;
    else
      cur_ = x->with_bounds(shift_down(x->start(), before_),
                            shift_up(x->end(), after_));
    return true;
  }

  interval::IntervalPtr at() const { return cur_; }
};

class MergeWithinIterator : public source::IntervalIteratorInterface {
 private:
  std::unique_ptr<source::IntervalIteratorInterface> it_;
  int64_t gap_;
  source::MaskFactory factory_;

  mutable interval::IntervalPtr head_;
  mutable bool started_;
  mutable interval::IntervalPtr cur_;

 public:
  MergeWithinIterator(std::unique_ptr<source::IntervalIteratorInterface> &&it,
                      int64_t gap, const source::MaskFactory &factory)
      : it_(std::move(it)), gap_(gap), factory_(factory), started_(false) {}

  bool next() const {
    if (!started_) {
      started_ = true;
      head_ = it_->next() ? it_->at() : nullptr;
    }
    if (!head_) return false;

    interval::Bound s = head_->start();
    interval::Bound e = head_->end();
    while (true) {
      head_ = it_->next() ? it_->at() : nullptr;
      if (!head_) break;
      // An unbounded span covers everything still to come.
      if (!e) continue;
      // Unbounded start joins anything; otherwise the gap must fit.
      if (head_->start() && *head_->start() > saturating_add(*e, gap_)) break;
      e = interval::max_end(e, head_->end());
    }
    cur_ = factory_(s, e);
    return true;
  }

  interval::IntervalPtr at() const { return cur_; }
};

}  // namespace

BufferSource::BufferSource(const source::SourcePtr &child, int64_t before,
                           int64_t after)
    : source::SourceInterface(checked(child, "buffer")->is_mask(),
                              checked(child, "buffer")->coercer()),
      child_(child),
      before_(before),
      after_(after) {
  if (before_ < 0 || after_ < 0)
    throw base::InvalidArgument("buffer amounts must be non-negative, got " +
                                std::to_string(before_) + "/" +
                                std::to_string(after_));
}

std::unique_ptr<source::IntervalIteratorInterface> BufferSource::fetch(
    const interval::Bound &start, const interval::Bound &end) const {
  // An interval reaching [start, end) after widening started before
  // end + before and ended after start - after.
  return std::unique_ptr<source::IntervalIteratorInterface>(new BufferIterator(
      child_->fetch(shift_down(start, after_), shift_up(end, before_)),
      before_, after_));
}

MergeWithinSource::MergeWithinSource(const source::SourcePtr &child,
                                     int64_t gap)
    : source::SourceInterface(true, checked(child, "merge_within")->coercer()),
      child_(child),
      gap_(gap),
      factory_(source::default_mask_factory()) {
  if (gap_ < 0)
    throw base::InvalidArgument("merge gap must be non-negative, got " +
                                std::to_string(gap_));
}

MergeWithinSource::MergeWithinSource(const source::SourcePtr &child,
                                     int64_t gap,
                                     const source::MaskFactory &factory)
    : source::SourceInterface(true, checked(child, "merge_within")->coercer()),
      child_(child),
      gap_(gap),
      factory_(factory) {
  if (gap_ < 0)
    throw base::InvalidArgument("merge gap must be non-negative, got " +
                                std::to_string(gap_));
  if (factory_.empty()) throw base::InvalidArgument("empty mask factory");
}

std::unique_ptr<source::IntervalIteratorInterface> MergeWithinSource::fetch(
    const interval::Bound &start, const interval::Bound &end) const {
  // Neighbours within gap of the range can still join a span that reaches it.
  return std::unique_ptr<source::IntervalIteratorInterface>(
      new MergeWithinIterator(
          child_->fetch(shift_down(start, gap_), shift_up(end, gap_)), gap_,
          factory_));
}

}  // namespace ops
}  // namespace timealg
