#ifndef DAILYWINDOWSOURCE_H
#define DAILYWINDOWSOURCE_H

#include <string>

#include "base/Error.hpp"
#include "source/SourceInterface.hpp"

namespace timealg {
namespace source {

// Day-of-week bits, bit n is boost's day_of_week n (Sunday = 0).
enum DayMask {
  SUNDAY = 1 << 0,
  MONDAY = 1 << 1,
  TUESDAY = 1 << 2,
  WEDNESDAY = 1 << 3,
  THURSDAY = 1 << 4,
  FRIDAY = 1 << 5,
  SATURDAY = 1 << 6,
  WEEKDAYS = MONDAY | TUESDAY | WEDNESDAY | THURSDAY | FRIDAY,
  WEEKENDS = SATURDAY | SUNDAY,
  ALL_DAYS = WEEKDAYS | WEEKENDS
};

class WindowOptions {
 public:
  // POSIX time zone string, e.g. "UTC0" or "CET+01CEST,M3.5.0,M10.5.0/3".
  std::string tz;
  // Local window [start_hour, end_hour) on each selected day.
  int start_hour;
  int end_hour;
  unsigned days;

  WindowOptions();

  error::Error validate() const;
};

extern const WindowOptions DefaultWindowOptions;

// Recurring mask windows, one per selected local day. Only finite ranges can
// be fetched; generation is lazy, day by day.
class DailyWindowSource : public SourceInterface {
 private:
  WindowOptions options_;
  boost::local_time::time_zone_ptr zone_;

 public:
  // Throws base::InvalidArgument when the options do not validate.
  DailyWindowSource(const WindowOptions &options);

  std::unique_ptr<IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const;

  const WindowOptions &options() const { return options_; }
};

SourcePtr weekdays(const std::string &tz = "UTC0");
SourcePtr weekends(const std::string &tz = "UTC0");
SourcePtr business_hours(const std::string &tz = "UTC0", int start_hour = 9,
                         int end_hour = 17);

}  // namespace source
}  // namespace timealg

#endif
