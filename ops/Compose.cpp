#include "ops/Compose.hpp"

#include "base/TimeAlgException.hpp"
#include "ops/DifferenceSource.hpp"
#include "ops/FilteredSource.hpp"
#include "ops/IntersectionSource.hpp"
#include "ops/TransformSource.hpp"
#include "ops/UnionSource.hpp"

namespace timealg {
namespace ops {

source::SourcePtr union_of(const source::Sources &children) {
  if (children.empty())
    throw base::ConstructionError("union needs at least one operand");
  return source::SourcePtr(new UnionSource(children));
}

source::SourcePtr union_of(const source::SourcePtr &s1,
                           const source::SourcePtr &s2) {
  return union_of(source::Sources({s1, s2}));
}

source::SourcePtr intersection_of(const source::Sources &children) {
  if (children.empty())
    throw base::ConstructionError("intersection needs at least one operand");
  return source::SourcePtr(new IntersectionSource(children));
}

source::SourcePtr intersection_of(const source::SourcePtr &s1,
                                  const source::SourcePtr &s2) {
  return intersection_of(source::Sources({s1, s2}));
}

source::SourcePtr difference_of(const source::SourcePtr &left,
                                const source::Sources &right) {
  return source::SourcePtr(new DifferenceSource(left, right));
}

source::SourcePtr difference_of(const source::SourcePtr &left,
                                const source::SourcePtr &right) {
  return difference_of(left, source::Sources({right}));
}

source::SourcePtr complement_of(const source::SourcePtr &child) {
  return source::SourcePtr(new ComplementSource(child));
}

source::SourcePtr complement_of(const source::SourcePtr &child,
                                const source::MaskFactory &factory) {
  return source::SourcePtr(new ComplementSource(child, factory));
}

source::SourcePtr filtered(const source::SourcePtr &child,
                           const filter::FilterPtr &filter) {
  return source::SourcePtr(new FilteredSource(child, filter));
}

source::SourcePtr buffer(const source::SourcePtr &child, int64_t before,
                         int64_t after) {
  return source::SourcePtr(new BufferSource(child, before, after));
}

source::SourcePtr merge_within(const source::SourcePtr &child, int64_t gap) {
  return source::SourcePtr(new MergeWithinSource(child, gap));
}

source::SourcePtr operator|(const source::SourcePtr &s1,
                            const source::SourcePtr &s2) {
  return union_of(s1, s2);
}

source::SourcePtr operator&(const source::SourcePtr &s1,
                            const source::SourcePtr &s2) {
  return intersection_of(s1, s2);
}

source::SourcePtr operator-(const source::SourcePtr &s1,
                            const source::SourcePtr &s2) {
  return difference_of(s1, s2);
}

source::SourcePtr operator~(const source::SourcePtr &s) {
  return complement_of(s);
}

source::SourcePtr operator&(const source::SourcePtr &s,
                            const filter::FilterPtr &f) {
  return filtered(s, f);
}

source::SourcePtr operator&(const filter::FilterPtr &f,
                            const source::SourcePtr &s) {
  return filtered(s, f);
}

source::SourcePtr operator|(const source::SourcePtr &, const filter::FilterPtr &) {
  throw base::ConstructionError(
      "cannot union a source with a filter, use & to apply a filter");
}

source::SourcePtr operator|(const filter::FilterPtr &, const source::SourcePtr &) {
  throw base::ConstructionError(
      "cannot union a filter with a source, use & to apply a filter");
}

}  // namespace ops
}  // namespace timealg
