#include "source/DailyWindowSource.hpp"

#include "base/Logging.hpp"
#include "base/TimeAlgException.hpp"

namespace timealg {
namespace source {

namespace {

const boost::posix_time::ptime EPOCH(boost::gregorian::date(1970, 1, 1));

boost::gregorian::date local_date(int64_t seconds,
                                  const boost::local_time::time_zone_ptr &tz) {
  boost::posix_time::ptime utc = EPOCH + boost::posix_time::seconds(seconds);
  return boost::local_time::local_date_time(utc, tz).local_time().date();
}

class DailyWindowIterator : public IntervalIteratorInterface {
 private:
  WindowOptions options_;
  boost::local_time::time_zone_ptr zone_;
  mutable boost::gregorian::date day_;
  boost::gregorian::date last_;
  int64_t min_end_;
  int64_t max_start_;
  mutable interval::IntervalPtr cur_;

 public:
  DailyWindowIterator(const WindowOptions &options,
                      const boost::local_time::time_zone_ptr &zone,
                      const boost::gregorian::date &first,
                      const boost::gregorian::date &last, int64_t min_end,
                      int64_t max_start)
      : options_(options),
        zone_(zone),
        day_(first),
        last_(last),
        min_end_(min_end),
        max_start_(max_start) {}

  bool next() const {
    while (day_ <= last_) {
      boost::gregorian::date d = day_;
      day_ += boost::gregorian::days(1);
      if ((options_.days & (1u << d.day_of_week().as_number())) == 0) continue;

      int64_t s = local_to_unix_seconds(
          d, boost::posix_time::hours(options_.start_hour), zone_);
      int64_t e;
      if (options_.end_hour == 24)
        e = local_to_unix_seconds(d + boost::gregorian::days(1),
                                  boost::posix_time::hours(0), zone_);
      else
        e = local_to_unix_seconds(
            d, boost::posix_time::hours(options_.end_hour), zone_);
      // Windows only move later from here on.
      if (s >= max_start_) {
        day_ = last_ + boost::gregorian::days(1);
        return false;
      }
      if (e <= s || e <= min_end_) continue;
      cur_ = interval::make_interval(s, e);
      return true;
    }
    return false;
  }

  interval::IntervalPtr at() const { return cur_; }
};

}  // namespace

WindowOptions::WindowOptions()
    : tz("UTC0"), start_hour(0), end_hour(24), days(ALL_DAYS) {}

error::Error WindowOptions::validate() const {
  if (tz.empty()) return error::Error("empty time zone");
  if (start_hour < 0 || start_hour > 23)
    return error::Error("start hour " + std::to_string(start_hour) +
                        " outside [0, 23]");
  if (end_hour <= start_hour || end_hour > 24)
    return error::Error("end hour " + std::to_string(end_hour) +
                        " outside (start hour, 24]");
  if (days == 0 || (days & ~static_cast<unsigned>(ALL_DAYS)) != 0)
    return error::Error("invalid day mask");
  return error::Error();
}

const WindowOptions DefaultWindowOptions;

DailyWindowSource::DailyWindowSource(const WindowOptions &options)
    : SourceInterface(true), options_(options) {
  error::Error err = options_.validate();
  if (err) throw base::InvalidArgument(error::wrap(err, "window options"));
  zone_ = make_zone(options_.tz);
}

std::unique_ptr<IntervalIteratorInterface> DailyWindowSource::fetch(
    const interval::Bound &start, const interval::Bound &end) const {
  if (!start || !end) {
    LOG_WARN << "daily windows fetched over ["
             << interval::bound_string(start, true) << ", "
             << interval::bound_string(end, false) << ")";
    throw base::InvalidArgument("daily window source needs a finite range");
  }
  if (*start >= *end)
    return std::unique_ptr<IntervalIteratorInterface>(
        new EmptyIntervalIterator());
  // The day before covers windows starting late the previous local day.
  boost::gregorian::date first =
      local_date(*start, zone_) - boost::gregorian::days(1);
  boost::gregorian::date last = local_date(*end - 1, zone_);
  return std::unique_ptr<IntervalIteratorInterface>(
      new DailyWindowIterator(options_, zone_, first, last, *start, *end));
}

SourcePtr weekdays(const std::string &tz) {
  WindowOptions options;
  options.tz = tz;
  options.days = WEEKDAYS;
  return SourcePtr(new DailyWindowSource(options));
}

SourcePtr weekends(const std::string &tz) {
  WindowOptions options;
  options.tz = tz;
  options.days = WEEKENDS;
  return SourcePtr(new DailyWindowSource(options));
}

SourcePtr business_hours(const std::string &tz, int start_hour, int end_hour) {
  WindowOptions options;
  options.tz = tz;
  options.start_hour = start_hour;
  options.end_hour = end_hour;
  options.days = WEEKDAYS;
  return SourcePtr(new DailyWindowSource(options));
}

}  // namespace source
}  // namespace timealg
