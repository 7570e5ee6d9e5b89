#ifndef BOUNDCOERCION_H
#define BOUNDCOERCION_H

#include <stdint.h>

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/function.hpp>
#include <boost/variant.hpp>
#include <string>

#include "interval/Interval.hpp"

namespace timealg {
namespace source {

enum BoundEdge { START_EDGE, END_EDGE };

// A bound as handed in by a caller, before it is turned into canonical
// seconds: absent, raw seconds, a zoned instant or a calendar day.
class QueryBound {
 public:
  typedef boost::variant<boost::blank, int64_t,
                         boost::local_time::local_date_time,
                         boost::gregorian::date>
      Value;

  QueryBound() : value_(boost::blank()) {}
  QueryBound(boost::none_t) : value_(boost::blank()) {}
  QueryBound(int64_t seconds) : value_(seconds) {}
  QueryBound(const interval::Bound &b) {
    if (b)
      value_ = *b;
    else
      value_ = boost::blank();
  }
  QueryBound(const boost::local_time::local_date_time &t) : value_(t) {}
  QueryBound(const boost::gregorian::date &d) : value_(d) {}

  const Value &value() const { return value_; }

  bool unbounded() const { return value_.which() == 0; }

 private:
  Value value_;
};

typedef boost::function<interval::Bound(const QueryBound &, BoundEdge)>
    BoundCoercer;

int64_t to_unix_seconds(const boost::posix_time::ptime &utc);

// Seconds pass through, zoned instants are converted through UTC, a date
// covers [00:00 UTC of that day, 00:00 UTC of the next day).
// Special values (not-a-date-time, infinities) throw base::InvalidArgument.
interval::Bound default_coerce(const QueryBound &b, BoundEdge edge);

// Parses a POSIX time zone string ("UTC0", "EST-05EDT,M3.2.0,M11.1.0").
// Throws base::InvalidArgument on malformed input.
boost::local_time::time_zone_ptr make_zone(const std::string &posix_tz);

// Like default_coerce but dates are days in the given zone.
BoundCoercer zone_coercer(const std::string &posix_tz);

// UTC instant of a local wall clock time. Times inside a DST gap or overlap
// resolve with the zone's standard offset.
int64_t local_to_unix_seconds(const boost::gregorian::date &d,
                              const boost::posix_time::time_duration &td,
                              const boost::local_time::time_zone_ptr &tz);

}  // namespace source
}  // namespace timealg

#endif
