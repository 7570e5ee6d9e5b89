#ifndef COMPLEMENTSOURCE_H
#define COMPLEMENTSOURCE_H

#include "source/SourceInterface.hpp"

namespace timealg {
namespace ops {

// Gaps of the child's coverage inside [start, end). A missing bound with no
// child interval to stop it yields a gap running to the sentinel.
class ComplementIterator : public source::IntervalIteratorInterface {
 private:
  std::unique_ptr<source::IntervalIteratorInterface> it_;
  interval::Bound end_;
  source::MaskFactory factory_;

  // Start of the next gap, in start position.
  mutable interval::Bound cursor_;
  mutable bool done_;
  mutable interval::IntervalPtr cur_;

 public:
  ComplementIterator(std::unique_ptr<source::IntervalIteratorInterface> &&it,
                     const interval::Bound &start, const interval::Bound &end,
                     const source::MaskFactory &factory);

  bool next() const;

  interval::IntervalPtr at() const { return cur_; }
};

class ComplementSource : public source::SourceInterface {
 private:
  source::SourcePtr child_;
  source::MaskFactory factory_;

 public:
  ComplementSource(const source::SourcePtr &child);
  ComplementSource(const source::SourcePtr &child,
                   const source::MaskFactory &factory);

  std::unique_ptr<source::IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const;

  const source::SourcePtr &child() const { return child_; }
};

// Minimal non-overlapping spans covering the child; touching spans merge.
source::SourcePtr flatten(const source::SourcePtr &child);
source::SourcePtr flatten(const source::SourcePtr &child,
                          const source::MaskFactory &factory);

}  // namespace ops
}  // namespace timealg

#endif
