#include "cache/CachedSource.hpp"

#include <algorithm>
#include <vector>

#include "base/Logging.hpp"
#include "base/TimeAlgException.hpp"

namespace timealg {
namespace cache {

namespace {

const source::SourcePtr &checked(const source::SourcePtr &child) {
  if (!child) throw base::InvalidArgument("null child in cache");
  return child;
}

bool range_overlaps(const interval::Bound &s1, const interval::Bound &e1,
                    const interval::Bound &s2, const interval::Bound &e2) {
  return interval::start_end_compare(s1, e2) < 0 &&
         interval::start_end_compare(s2, e1) < 0;
}

std::string range_string(const interval::Bound &start,
                         const interval::Bound &end) {
  return "[" + interval::bound_string(start, true) + ", " +
         interval::bound_string(end, false) + ")";
}

// Intervals of a segment that still touch the remainder [start, end).
interval::Intervals slice(const interval::Intervals &itvls,
                          const interval::Bound &start,
                          const interval::Bound &end) {
  interval::Intervals r;
  for (const interval::IntervalPtr &p : itvls)
    if (interval::clip(p, start, end)) r.push_back(p);
  return r;
}

}  // namespace

CachedSource::CachedSource(const source::SourcePtr &child,
                           const CacheOptions &options)
    : source::SourceInterface(checked(child)->is_mask(),
                              checked(child)->coercer()),
      child_(child),
      options_(options),
      upstream_calls_(0) {
  error::Error err = options_.validate();
  if (err) throw base::InvalidArgument(error::wrap(err, "cache options"));
}

bool CachedSource::fresh(const CacheSegment &seg,
                         const base::TimeStamp &now) const {
  return base::timeDifference(now, seg.fetched_at) <
         static_cast<double>(options_.ttl_seconds);
}

std::map<int64_t, CacheSegment>::iterator CachedSource::first_overlapping(
    const interval::Bound &start) const {
  std::map<int64_t, CacheSegment>::iterator it =
      segments_.upper_bound(interval::finite_start(start));
  if (it != segments_.begin()) {
    std::map<int64_t, CacheSegment>::iterator prev = it;
    --prev;
    if (interval::start_end_compare(start, prev->second.end) < 0) return prev;
  }
  return it;
}

void CachedSource::fill(const interval::Bound &start,
                        const interval::Bound &end,
                        const base::TimeStamp &now) const {
  // Parts of [start, end) with no fresh coverage.
  std::vector<std::pair<interval::Bound, interval::Bound>> misses;
  interval::Bound cursor = start;
  bool covered = false;
  for (std::map<int64_t, CacheSegment>::iterator it = first_overlapping(start);
       it != segments_.end() &&
       interval::start_end_compare(it->second.start, end) < 0;
       ++it) {
    const CacheSegment &seg = it->second;
    if (!fresh(seg, now)) continue;
    if (interval::start_compare(seg.start, cursor) > 0)
      misses.push_back(std::make_pair(cursor, seg.start));
    if (!seg.end) {
      covered = true;
      break;
    }
    if (interval::start_end_compare(cursor, seg.end) < 0) cursor = seg.end;
  }
  if (!covered && interval::start_end_compare(cursor, end) < 0)
    misses.push_back(std::make_pair(cursor, end));

  if (misses.empty()) {
    LOG_DEBUG << "cache hit " << range_string(start, end);
    return;
  }

  for (size_t i = 0; i < misses.size(); ++i) {
    const interval::Bound &ms = misses[i].first;
    const interval::Bound &me = misses[i].second;
    LOG_DEBUG << "cache miss " << range_string(ms, me);

    interval::Intervals fetched =
        source::expand_intervals(child_->fetch(ms, me).get());
    ++upstream_calls_;

    // Whatever still overlaps the miss is stale: fracture it.
    std::vector<CacheSegment> remainders;
    std::map<int64_t, CacheSegment>::iterator it = first_overlapping(ms);
    while (it != segments_.end() &&
           interval::start_end_compare(it->second.start, me) < 0) {
      const CacheSegment &seg = it->second;
      if (!range_overlaps(seg.start, seg.end, ms, me)) {
        ++it;
        continue;
      }
      size_t kept = remainders.size();
      if (interval::start_compare(seg.start, ms) < 0)
        remainders.push_back(CacheSegment(seg.start, ms,
                                          slice(seg.intervals, seg.start, ms),
                                          seg.fetched_at));
      if (interval::end_compare(seg.end, me) > 0)
        remainders.push_back(CacheSegment(me, seg.end,
                                          slice(seg.intervals, me, seg.end),
                                          seg.fetched_at));
      if (remainders.size() == kept) {
        LOG_TRACE << "evict " << range_string(seg.start, seg.end);
      } else {
        LOG_TRACE << "fracture " << range_string(seg.start, seg.end)
                  << " around " << range_string(ms, me);
      }
      it = segments_.erase(it);
    }
    for (const CacheSegment &r : remainders)
      segments_[interval::finite_start(r.start)] = r;
    segments_[interval::finite_start(ms)] = CacheSegment(ms, me, fetched, now);
  }
}

interval::Intervals CachedSource::collect(const interval::Bound &start,
                                          const interval::Bound &end) const {
  interval::Intervals merged;
  for (std::map<int64_t, CacheSegment>::iterator it = first_overlapping(start);
       it != segments_.end() &&
       interval::start_end_compare(it->second.start, end) < 0;
       ++it) {
    const CacheSegment &seg = it->second;
    size_t prior = merged.size();
    for (const interval::IntervalPtr &p : seg.intervals) {
      bool dup = false;
      // Straddlers were also returned for the neighbouring segment.
      if (interval::start_compare(p->start(), seg.start) < 0) {
        for (size_t j = 0; j < prior; ++j) {
          if (merged[j]->same_as(*p)) {
            dup = true;
            break;
          }
        }
      }
      if (!dup) merged.push_back(p);
    }
  }

  std::stable_sort(merged.begin(), merged.end(), interval::IntervalLess());
  interval::Intervals r;
  for (const interval::IntervalPtr &p : merged) {
    interval::IntervalPtr c = interval::clip(p, start, end);
    if (c) r.push_back(c);
  }
  // Intervals starting before start all clip to it and may now be out of
  // order by end.
  std::stable_sort(r.begin(), r.end(), interval::IntervalLess());
  return r;
}

std::unique_ptr<source::IntervalIteratorInterface> CachedSource::fetch(
    const interval::Bound &start, const interval::Bound &end) const {
  if (interval::start_end_compare(start, end) >= 0)
    return std::unique_ptr<source::IntervalIteratorInterface>(
        new source::EmptyIntervalIterator());
  fill(start, end, options_.clock());
  std::shared_ptr<const interval::Intervals> r(
      new interval::Intervals(collect(start, end)));
  return std::unique_ptr<source::IntervalIteratorInterface>(
      new source::ListIntervalIterator(r));
}

void CachedSource::clear() { segments_.clear(); }

source::SourcePtr cached(const source::SourcePtr &child,
                         const CacheOptions &options) {
  return source::SourcePtr(new CachedSource(child, options));
}

}  // namespace cache
}  // namespace timealg
