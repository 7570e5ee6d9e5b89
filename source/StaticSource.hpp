#ifndef STATICSOURCE_H
#define STATICSOURCE_H

#include <stdint.h>

#include <vector>

#include "source/SourceInterface.hpp"

namespace timealg {
namespace source {

// In-memory timeline. Intervals are sorted once at construction; a running
// maximum of end bounds lets fetch() skip every interval ending before the
// requested start.
class StaticSource : public SourceInterface {
 private:
  std::shared_ptr<const interval::Intervals> intervals_;
  std::vector<int64_t> max_ends_;

  void init(const interval::Intervals &intervals);

 public:
  StaticSource(const interval::Intervals &intervals, bool is_mask);
  StaticSource(const interval::Intervals &intervals, bool is_mask,
               const BoundCoercer &coercer);

  std::unique_ptr<IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const;

  size_t size() const { return intervals_->size(); }
};

// Source over intervals that carry data.
SourcePtr timeline_of(const interval::Intervals &intervals);
// Source over plain spans, treated as a mask by intersections.
SourcePtr mask_of(const interval::Intervals &intervals);

}  // namespace source
}  // namespace timealg

#endif
