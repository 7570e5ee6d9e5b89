#ifndef CACHEDSOURCE_H
#define CACHEDSOURCE_H

#include <stdint.h>

#include <boost/noncopyable.hpp>
#include <map>

#include "cache/CacheOptions.hpp"
#include "source/SourceInterface.hpp"

namespace timealg {
namespace cache {

// Coverage fetched from the wrapped source in one call.
class CacheSegment {
 public:
  interval::Bound start;
  interval::Bound end;
  // Everything the upstream returned that touches [start, end), unclipped.
  interval::Intervals intervals;
  base::TimeStamp fetched_at;

  CacheSegment() = default;
  CacheSegment(const interval::Bound &start, const interval::Bound &end,
               const interval::Intervals &intervals,
               const base::TimeStamp &fetched_at)
      : start(start), end(end), intervals(intervals), fetched_at(fetched_at) {}
};

// TTL cache in front of a source.
//
// Segments never overlap and are keyed by finite start. A fetch only asks
// upstream for the parts of the range not covered by a fresh segment; stale
// segments cut by such a part keep their remainders and timestamps.
//
// Not thread safe, callers serialize access.
class CachedSource : public source::SourceInterface, boost::noncopyable {
 private:
  source::SourcePtr child_;
  CacheOptions options_;
  mutable std::map<int64_t, CacheSegment> segments_;
  mutable uint64_t upstream_calls_;

  bool fresh(const CacheSegment &seg, const base::TimeStamp &now) const;
  std::map<int64_t, CacheSegment>::iterator first_overlapping(
      const interval::Bound &start) const;
  void fill(const interval::Bound &start, const interval::Bound &end,
            const base::TimeStamp &now) const;
  interval::Intervals collect(const interval::Bound &start,
                              const interval::Bound &end) const;

 public:
  // Throws base::InvalidArgument for a null child or invalid options.
  CachedSource(const source::SourcePtr &child,
               const CacheOptions &options = DefaultCacheOptions);

  std::unique_ptr<source::IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const;

  // Drops every segment.
  void clear();

  size_t num_segments() const { return segments_.size(); }
  uint64_t upstream_calls() const { return upstream_calls_; }

  const CacheOptions &options() const { return options_; }
};

source::SourcePtr cached(const source::SourcePtr &child,
                         const CacheOptions &options = DefaultCacheOptions);

}  // namespace cache
}  // namespace timealg

#endif
