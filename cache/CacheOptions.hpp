#ifndef CACHEOPTIONS_H
#define CACHEOPTIONS_H

#include <stdint.h>

#include <boost/function.hpp>

#include "base/Error.hpp"
#include "base/TimeStamp.hpp"

namespace timealg {
namespace cache {

typedef boost::function<base::TimeStamp()> Clock;

class CacheOptions {
 public:
  // Seconds a fetched segment is served before it is fetched again.
  int64_t ttl_seconds;

  // Source of "now" for aging segments.
  Clock clock;

  CacheOptions();
  CacheOptions(int64_t ttl_seconds);
  CacheOptions(int64_t ttl_seconds, const Clock &clock);

  error::Error validate() const;
};

extern const CacheOptions DefaultCacheOptions;

}  // namespace cache
}  // namespace timealg

#endif
