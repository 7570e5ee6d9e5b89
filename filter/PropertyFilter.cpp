#include "filter/PropertyFilter.hpp"

#include <limits>

#include "base/TimeAlgException.hpp"

namespace timealg {
namespace filter {

Property::Property(PropertyKind kind, int64_t unit) : kind_(kind), unit_(unit) {
  if (unit_ <= 0)
    throw base::InvalidArgument("property unit must be positive, got " +
                                std::to_string(unit_));
}

double Property::value(const interval::Interval &itvl) const {
  const double inf = std::numeric_limits<double>::infinity();
  switch (kind_) {
    case DURATION: {
      boost::optional<int64_t> d = itvl.duration();
      if (!d) return inf;
      return static_cast<double>(*d) / static_cast<double>(unit_);
    }
    case START:
      if (!itvl.start()) return -inf;
      return static_cast<double>(*itvl.start()) / static_cast<double>(unit_);
    case END:
      if (!itvl.end()) return inf;
      return static_cast<double>(*itvl.end()) / static_cast<double>(unit_);
  }
  return 0;
}

FilterPtr Property::operator==(double v) const {
  return FilterPtr(new PropertyFilter(*this, EQ, v));
}
FilterPtr Property::operator!=(double v) const {
  return FilterPtr(new PropertyFilter(*this, NE, v));
}
FilterPtr Property::operator<(double v) const {
  return FilterPtr(new PropertyFilter(*this, LT, v));
}
FilterPtr Property::operator<=(double v) const {
  return FilterPtr(new PropertyFilter(*this, LE, v));
}
FilterPtr Property::operator>(double v) const {
  return FilterPtr(new PropertyFilter(*this, GT, v));
}
FilterPtr Property::operator>=(double v) const {
  return FilterPtr(new PropertyFilter(*this, GE, v));
}

PropertyFilter::PropertyFilter(const Property &property, CompareOp op,
                               double value)
    : property_(property), op_(op), value_(value) {}

bool PropertyFilter::apply(const interval::Interval &itvl) const {
  double v = property_.value(itvl);
  switch (op_) {
    case EQ:
      return v == value_;
    case NE:
      return v != value_;
    case LT:
      return v < value_;
    case LE:
      return v <= value_;
    case GT:
      return v > value_;
    case GE:
      return v >= value_;
  }
  return false;
}

const Property seconds(DURATION, SECOND);
const Property minutes(DURATION, MINUTE);
const Property hours(DURATION, HOUR);
const Property days(DURATION, DAY);
const Property weeks(DURATION, WEEK);
const Property start_time(START);
const Property end_time(END);

}  // namespace filter
}  // namespace timealg
