#ifndef COMPOSE_H
#define COMPOSE_H

#include <stdint.h>

#include "filter/FilterInterface.hpp"
#include "ops/ComplementSource.hpp"
#include "source/SourceInterface.hpp"

namespace timealg {
namespace ops {

// Throws base::ConstructionError when children is empty.
source::SourcePtr union_of(const source::Sources &children);
source::SourcePtr union_of(const source::SourcePtr &s1,
                           const source::SourcePtr &s2);

// Throws base::ConstructionError when children is empty.
source::SourcePtr intersection_of(const source::Sources &children);
source::SourcePtr intersection_of(const source::SourcePtr &s1,
                                  const source::SourcePtr &s2);

source::SourcePtr difference_of(const source::SourcePtr &left,
                                const source::Sources &right);
source::SourcePtr difference_of(const source::SourcePtr &left,
                                const source::SourcePtr &right);

source::SourcePtr complement_of(const source::SourcePtr &child);
source::SourcePtr complement_of(const source::SourcePtr &child,
                                const source::MaskFactory &factory);

source::SourcePtr filtered(const source::SourcePtr &child,
                           const filter::FilterPtr &filter);

source::SourcePtr buffer(const source::SourcePtr &child, int64_t before,
                         int64_t after);

source::SourcePtr merge_within(const source::SourcePtr &child, int64_t gap);

source::SourcePtr operator|(const source::SourcePtr &s1,
                            const source::SourcePtr &s2);
source::SourcePtr operator&(const source::SourcePtr &s1,
                            const source::SourcePtr &s2);
source::SourcePtr operator-(const source::SourcePtr &s1,
                            const source::SourcePtr &s2);
source::SourcePtr operator~(const source::SourcePtr &s);

// & with a filter on either side filters the source.
source::SourcePtr operator&(const source::SourcePtr &s,
                            const filter::FilterPtr &f);
source::SourcePtr operator&(const filter::FilterPtr &f,
                            const source::SourcePtr &s);

// Filters only combine with filters under |; these always throw
// base::ConstructionError.
source::SourcePtr operator|(const source::SourcePtr &s,
                            const filter::FilterPtr &f);
source::SourcePtr operator|(const filter::FilterPtr &f,
                            const source::SourcePtr &s);

}  // namespace ops
}  // namespace timealg

#endif
