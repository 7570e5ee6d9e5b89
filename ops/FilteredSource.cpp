#include "ops/FilteredSource.hpp"

#include "ops/OpsUtils.hpp"

namespace timealg {
namespace ops {

FilteredSource::FilteredSource(const source::SourcePtr &child,
                               const filter::FilterPtr &filter)
    : source::SourceInterface(checked(child, "filtered")->is_mask(),
                              checked(child, "filtered")->coercer()),
      child_(child),
      filter_(filter) {
  if (!filter_) throw base::InvalidArgument("null filter");
}

std::unique_ptr<source::IntervalIteratorInterface> FilteredSource::fetch(
    const interval::Bound &start, const interval::Bound &end) const {
  return std::unique_ptr<source::IntervalIteratorInterface>(
      new FilteredIterator(child_->fetch(start, end), filter_));
}

}  // namespace ops
}  // namespace timealg
