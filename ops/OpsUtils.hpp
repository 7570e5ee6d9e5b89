#ifndef OPSUTILS_H
#define OPSUTILS_H

#include <set>
#include <string>

#include "base/TimeAlgException.hpp"
#include "source/SourceInterface.hpp"

namespace timealg {
namespace ops {

inline const source::Sources &checked(const source::Sources &children,
                                      const std::string &op) {
  for (const source::SourcePtr &c : children)
    if (!c) throw base::InvalidArgument("null child in " + op);
  return children;
}

inline const source::SourcePtr &checked(const source::SourcePtr &child,
                                        const std::string &op) {
  if (!child) throw base::InvalidArgument("null child in " + op);
  return child;
}

inline bool all_masks(const source::Sources &children) {
  for (const source::SourcePtr &c : children)
    if (!c->is_mask()) return false;
  return true;
}

// Composite nodes interpret bounds the way their first child does.
inline source::BoundCoercer first_coercer(const source::Sources &children) {
  if (children.empty()) return &source::default_coerce;
  return children.front()->coercer();
}

typedef std::multiset<interval::IntervalPtr, interval::IntervalLess>
    ReorderBuffer;

// Pops the smallest buffered interval when nothing still to come can sort
// before it, i.e. its start is below the lowest start of pending input.
// Pass has_pending = false once input is exhausted.
inline bool release(ReorderBuffer &buf, bool has_pending,
                    const interval::Bound &pending_start,
                    interval::IntervalPtr &out) {
  if (buf.empty()) return false;
  if (has_pending &&
      interval::start_compare((*buf.begin())->start(), pending_start) >= 0)
    return false;
  out = *buf.begin();
  buf.erase(buf.begin());
  return true;
}

}  // namespace ops
}  // namespace timealg

#endif
