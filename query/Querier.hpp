#ifndef QUERIER_H
#define QUERIER_H

#include "source/BoundCoercion.hpp"
#include "source/SourceInterface.hpp"

namespace timealg {
namespace query {

enum Direction { ASCENDING, DESCENDING };

// Clips every child interval to [start, end), dropping disjoint ones.
// Intervals beginning at or before start all clip to start, so that leading
// run is buffered and re-sorted by end.
class ClipIterator : public source::IntervalIteratorInterface {
 private:
  std::unique_ptr<source::IntervalIteratorInterface> it_;
  interval::Bound start_;
  interval::Bound end_;
  mutable interval::Intervals head_;
  mutable bool started_;
  mutable interval::IntervalPtr cur_;

  void fill_head() const;

 public:
  ClipIterator(std::unique_ptr<source::IntervalIteratorInterface> &&it,
               const interval::Bound &start, const interval::Bound &end)
      : it_(std::move(it)), start_(start), end_(end), started_(false) {}

  bool next() const;

  interval::IntervalPtr at() const { return cur_; }
};

// Entry point of a query: coerces the caller's bounds with the root's
// coercer, runs the tree once per select() and clips to the range.
class Querier {
 private:
  source::SourcePtr source_;
  interval::Bound start_;
  interval::Bound end_;
  Direction direction_;

 public:
  // Throws base::InvalidArgument for a null source or uncoercible bounds.
  Querier(const source::SourcePtr &source, const source::QueryBound &start,
          const source::QueryBound &end, Direction direction = ASCENDING);

  // Ascending results stream lazily; descending ones are materialized
  // first.
  std::unique_ptr<source::IntervalIteratorInterface> select() const;

  interval::Intervals expand() const;

  const interval::Bound &start() const { return start_; }
  const interval::Bound &end() const { return end_; }
  Direction direction() const { return direction_; }
};

interval::Intervals query(const source::SourcePtr &source,
                          const source::QueryBound &start,
                          const source::QueryBound &end,
                          Direction direction = ASCENDING);

}  // namespace query
}  // namespace timealg

#endif
