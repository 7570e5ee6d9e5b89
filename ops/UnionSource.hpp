#ifndef UNIONSOURCE_H
#define UNIONSOURCE_H

#include <deque>
#include <vector>

#include "source/SourceInterface.hpp"

namespace timealg {
namespace ops {

// Merges N sorted streams. Equal intervals come out in child order and
// duplicates across children are all kept.
class UnionIterator : public source::IntervalIteratorInterface {
 private:
  std::deque<std::unique_ptr<source::IntervalIteratorInterface>> its_;
  mutable std::vector<bool> valid_;
  mutable int idx_;
  mutable bool started_;

 public:
  UnionIterator(
      std::deque<std::unique_ptr<source::IntervalIteratorInterface>> &&its);

  bool next() const;

  interval::IntervalPtr at() const { return its_[idx_]->at(); }
};

class UnionSource : public source::SourceInterface {
 private:
  source::Sources children_;

 public:
  // Children that are unions themselves are spliced in place.
  UnionSource(const source::Sources &children);

  std::unique_ptr<source::IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const;

  const source::Sources &children() const { return children_; }
};

}  // namespace ops
}  // namespace timealg

#endif
