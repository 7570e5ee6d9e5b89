#include "cache/CacheOptions.hpp"

#include <string>

namespace timealg {
namespace cache {

CacheOptions::CacheOptions() : ttl_seconds(300), clock(&base::TimeStamp::now) {}

CacheOptions::CacheOptions(int64_t ttl_seconds)
    : ttl_seconds(ttl_seconds), clock(&base::TimeStamp::now) {}

CacheOptions::CacheOptions(int64_t ttl_seconds, const Clock &clock)
    : ttl_seconds(ttl_seconds), clock(clock) {}

error::Error CacheOptions::validate() const {
  if (ttl_seconds <= 0)
    return error::Error("ttl must be positive, got " +
                        std::to_string(ttl_seconds));
  if (clock.empty()) return error::Error("no clock");
  return error::Error();
}

const CacheOptions DefaultCacheOptions = CacheOptions(5 * 60);  // 5 minutes

}  // namespace cache
}  // namespace timealg
