#ifndef TRANSFORMSOURCE_H
#define TRANSFORMSOURCE_H

#include <stdint.h>

#include "source/SourceInterface.hpp"

namespace timealg {
namespace ops {

// Widens every child interval by before/after seconds. Unbounded sides stay
// unbounded, type and metadata are kept.
class BufferSource : public source::SourceInterface {
 private:
  source::SourcePtr child_;
  int64_t before_;
  int64_t after_;

 public:
  // Negative amounts throw base::InvalidArgument.
  BufferSource(const source::SourcePtr &child, int64_t before, int64_t after);

  std::unique_ptr<source::IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const;
};

// Coalesces child intervals whose gap is at most gap seconds into one span.
// Output spans come from the mask factory.
class MergeWithinSource : public source::SourceInterface {
 private:
  source::SourcePtr child_;
  int64_t gap_;
  source::MaskFactory factory_;

 public:
  // A negative gap throws base::InvalidArgument.
  MergeWithinSource(const source::SourcePtr &child, int64_t gap);
  MergeWithinSource(const source::SourcePtr &child, int64_t gap,
                    const source::MaskFactory &factory);

  std::unique_ptr<source::IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const;
};

}  // namespace ops
}  // namespace timealg

#endif
