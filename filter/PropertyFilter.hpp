#ifndef PROPERTYFILTER_H
#define PROPERTYFILTER_H

#include <stdint.h>

#include "filter/FilterInterface.hpp"

namespace timealg {
namespace filter {

enum PropertyKind { DURATION, START, END };

enum CompareOp { EQ, NE, LT, LE, GT, GE };

const int64_t SECOND = 1;
const int64_t MINUTE = 60;
const int64_t HOUR = 3600;
const int64_t DAY = 86400;
const int64_t WEEK = 7 * DAY;

// A numeric view of an interval. Unbounded sides read as -inf/+inf; the
// duration of an unbounded interval is +inf.
class Property {
 private:
  PropertyKind kind_;
  int64_t unit_;

 public:
  Property(PropertyKind kind, int64_t unit = SECOND);

  double value(const interval::Interval &itvl) const;

  PropertyKind kind() const { return kind_; }
  int64_t unit() const { return unit_; }

  FilterPtr operator==(double v) const;
  FilterPtr operator!=(double v) const;
  FilterPtr operator<(double v) const;
  FilterPtr operator<=(double v) const;
  FilterPtr operator>(double v) const;
  FilterPtr operator>=(double v) const;
};

class PropertyFilter : public FilterInterface {
 private:
  Property property_;
  CompareOp op_;
  double value_;

 public:
  PropertyFilter(const Property &property, CompareOp op, double value);

  bool apply(const interval::Interval &itvl) const;
};

extern const Property seconds;
extern const Property minutes;
extern const Property hours;
extern const Property days;
extern const Property weeks;
extern const Property start_time;
extern const Property end_time;

}  // namespace filter
}  // namespace timealg

#endif
