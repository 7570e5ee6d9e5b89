#ifndef FILTERINTERFACE_H
#define FILTERINTERFACE_H

#include <deque>
#include <memory>

#include "interval/Interval.hpp"

namespace timealg {
namespace filter {

class FilterInterface {
 public:
  virtual bool apply(const interval::Interval &itvl) const = 0;
  virtual ~FilterInterface() = default;
};

typedef std::shared_ptr<FilterInterface> FilterPtr;
typedef std::deque<FilterPtr> Filters;

// True when every member accepts. Empty accepts everything.
class AndFilter : public FilterInterface {
 private:
  Filters filters_;

 public:
  AndFilter(const Filters &filters);

  const Filters &filters() const { return filters_; }

  bool apply(const interval::Interval &itvl) const;
};

// True when any member accepts. Empty accepts nothing.
class OrFilter : public FilterInterface {
 private:
  Filters filters_;

 public:
  OrFilter(const Filters &filters);

  const Filters &filters() const { return filters_; }

  bool apply(const interval::Interval &itvl) const;
};

FilterPtr and_of(const FilterPtr &f1, const FilterPtr &f2);
FilterPtr or_of(const FilterPtr &f1, const FilterPtr &f2);

FilterPtr operator&(const FilterPtr &f1, const FilterPtr &f2);
FilterPtr operator|(const FilterPtr &f1, const FilterPtr &f2);

}  // namespace filter
}  // namespace timealg

#endif
