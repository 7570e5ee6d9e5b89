#include "source/BoundCoercion.hpp"

#include <boost/bind.hpp>
#include <exception>

#include "base/Logging.hpp"
#include "base/TimeAlgException.hpp"

namespace timealg {
namespace source {

namespace {

const boost::posix_time::ptime EPOCH(boost::gregorian::date(1970, 1, 1));

class DefaultVisitor : public boost::static_visitor<interval::Bound> {
 private:
  BoundEdge edge_;

 public:
  DefaultVisitor(BoundEdge edge) : edge_(edge) {}

  interval::Bound operator()(const boost::blank &) const {
    return interval::UNBOUNDED;
  }

  interval::Bound operator()(int64_t seconds) const { return seconds; }

  interval::Bound operator()(const boost::local_time::local_date_time &t) const {
    if (t.is_special()) {
      LOG_WARN << "cannot coerce special zoned time " << t.to_string();
      throw base::InvalidArgument("query bound is not a valid instant");
    }
    return to_unix_seconds(t.utc_time());
  }

  interval::Bound operator()(const boost::gregorian::date &d) const {
    if (d.is_special()) {
      LOG_WARN << "cannot coerce special date";
      throw base::InvalidArgument("query bound is not a valid date");
    }
    if (edge_ == START_EDGE) return to_unix_seconds(boost::posix_time::ptime(d));
    return to_unix_seconds(
        boost::posix_time::ptime(d + boost::gregorian::days(1)));
  }
};

interval::Bound coerce_in_zone(const boost::local_time::time_zone_ptr &tz,
                               const QueryBound &b, BoundEdge edge) {
  const boost::gregorian::date *d =
      boost::get<boost::gregorian::date>(&b.value());
  if (d == nullptr || d->is_special()) return default_coerce(b, edge);
  boost::gregorian::date day =
      edge == START_EDGE ? *d : *d + boost::gregorian::days(1);
  return local_to_unix_seconds(day, boost::posix_time::time_duration(0, 0, 0),
                               tz);
}

}  // namespace

int64_t to_unix_seconds(const boost::posix_time::ptime &utc) {
  return static_cast<int64_t>((utc - EPOCH).total_seconds());
}

interval::Bound default_coerce(const QueryBound &b, BoundEdge edge) {
  return boost::apply_visitor(DefaultVisitor(edge), b.value());
}

boost::local_time::time_zone_ptr make_zone(const std::string &posix_tz) {
  try {
    return boost::local_time::time_zone_ptr(
        new boost::local_time::posix_time_zone(posix_tz));
  } catch (const std::exception &e) {
    LOG_WARN << "bad time zone \"" << posix_tz << "\": " << e.what();
    throw base::InvalidArgument("invalid posix time zone \"" + posix_tz +
                                "\"");
  }
}

BoundCoercer zone_coercer(const std::string &posix_tz) {
  return boost::bind(&coerce_in_zone, make_zone(posix_tz), _1, _2);
}

int64_t local_to_unix_seconds(const boost::gregorian::date &d,
                              const boost::posix_time::time_duration &td,
                              const boost::local_time::time_zone_ptr &tz) {
  boost::local_time::local_date_time t(
      d, td, tz, boost::local_time::local_date_time::NOT_DATE_TIME_ON_ERROR);
  if (!t.is_special()) return to_unix_seconds(t.utc_time());
  return to_unix_seconds(boost::posix_time::ptime(d, td) -
                         tz->base_utc_offset());
}

}  // namespace source
}  // namespace timealg
