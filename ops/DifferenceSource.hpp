#ifndef DIFFERENCESOURCE_H
#define DIFFERENCESOURCE_H

#include <deque>

#include "ops/OpsUtils.hpp"
#include "source/SourceInterface.hpp"

namespace timealg {
namespace ops {

// Cuts every left interval by the right intervals overlapping it. Fragments
// keep the left interval's type and metadata.
class DifferenceIterator : public source::IntervalIteratorInterface {
 private:
  std::unique_ptr<source::IntervalIteratorInterface> l_;
  std::unique_ptr<source::IntervalIteratorInterface> r_;

  mutable interval::IntervalPtr l_head_;
  mutable interval::IntervalPtr r_head_;
  // Right intervals that may still overlap a coming left interval, by start.
  mutable std::deque<interval::IntervalPtr> window_;
  mutable ReorderBuffer buf_;
  mutable interval::IntervalPtr cur_;
  mutable bool started_;

  void subtract(const interval::IntervalPtr &x) const;

 public:
  DifferenceIterator(std::unique_ptr<source::IntervalIteratorInterface> &&l,
                     std::unique_ptr<source::IntervalIteratorInterface> &&r);

  bool next() const;

  interval::IntervalPtr at() const { return cur_; }
};

class DifferenceSource : public source::SourceInterface {
 private:
  source::SourcePtr left_;
  source::Sources right_;

 public:
  DifferenceSource(const source::SourcePtr &left, const source::Sources &right);

  std::unique_ptr<source::IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const;

  const source::SourcePtr &left() const { return left_; }
  const source::Sources &right() const { return right_; }
};

}  // namespace ops
}  // namespace timealg

#endif
