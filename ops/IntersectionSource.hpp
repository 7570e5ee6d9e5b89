#ifndef INTERSECTIONSOURCE_H
#define INTERSECTIONSOURCE_H

#include <deque>
#include <set>
#include <vector>

#include "ops/OpsUtils.hpp"
#include "source/SourceInterface.hpp"

namespace timealg {
namespace ops {

// A region shared by one interval of every child intersected so far: its
// span and the interval each child contributed, in child order.
struct Overlap {
  interval::IntervalPtr span;
  std::vector<interval::IntervalPtr> members;
};

typedef std::shared_ptr<const Overlap> OverlapPtr;

class OverlapIteratorInterface {
 public:
  virtual bool next() const = 0;
  virtual OverlapPtr at() const = 0;
  virtual ~OverlapIteratorInterface() = default;
};

// Lifts a child stream into single member overlaps.
class LeafOverlapIterator : public OverlapIteratorInterface {
 private:
  std::unique_ptr<source::IntervalIteratorInterface> it_;
  mutable OverlapPtr cur_;

 public:
  LeafOverlapIterator(std::unique_ptr<source::IntervalIteratorInterface> &&it);

  bool next() const;

  OverlapPtr at() const { return cur_; }
};

struct OverlapLess {
  bool operator()(const OverlapPtr &a, const OverlapPtr &b) const {
    return interval::compare(*a->span, *b->span) < 0;
  }
};

// Intersects two sorted overlap streams with a sweep over their start
// bounds. Each side keeps the overlaps that can still meet something to
// come; every overlapping pair is produced exactly once, when its later
// starting member arrives. The joined overlap carries the members of the
// left side followed by those of the right side.
class OverlapSweepIterator : public OverlapIteratorInterface {
 private:
  std::unique_ptr<OverlapIteratorInterface> l_;
  std::unique_ptr<OverlapIteratorInterface> r_;

  mutable OverlapPtr l_head_;
  mutable OverlapPtr r_head_;
  mutable std::deque<OverlapPtr> l_active_;
  mutable std::deque<OverlapPtr> r_active_;
  mutable std::multiset<OverlapPtr, OverlapLess> buf_;
  mutable OverlapPtr cur_;
  mutable bool started_;

  bool has_pending() const;
  interval::Bound pending_start() const;
  void step() const;
  void join(const OverlapPtr &l, const OverlapPtr &r) const;

 public:
  OverlapSweepIterator(std::unique_ptr<OverlapIteratorInterface> &&l,
                       std::unique_ptr<OverlapIteratorInterface> &&r);

  bool next() const;

  OverlapPtr at() const { return cur_; }
};

// Intersection of N child streams. Per overlap of one interval from every
// child, clipped to the shared span:
//   all masks -> one copy of the first child's interval,
//   otherwise -> a copy of each rich child's interval, in child order.
class IntersectIterator : public source::IntervalIteratorInterface {
 private:
  std::unique_ptr<OverlapIteratorInterface> overlaps_;
  std::vector<bool> masks_;
  bool all_masks_;

  mutable std::deque<interval::IntervalPtr> copies_;
  mutable interval::IntervalPtr cur_;

 public:
  IntersectIterator(
      std::deque<std::unique_ptr<source::IntervalIteratorInterface>> &&children,
      const std::vector<bool> &masks);

  bool next() const;

  interval::IntervalPtr at() const { return cur_; }
};

// N-way intersection. Zero children produce nothing, one child is passed
// through.
class IntersectionSource : public source::SourceInterface {
 private:
  source::Sources children_;

 public:
  // Children that are intersections themselves are spliced in place.
  IntersectionSource(const source::Sources &children);

  std::unique_ptr<source::IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const;

  const source::Sources &children() const { return children_; }
};

}  // namespace ops
}  // namespace timealg

#endif
