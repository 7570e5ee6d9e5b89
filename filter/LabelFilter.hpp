#ifndef LABELFILTER_H
#define LABELFILTER_H

#include <set>
#include <string>

#include "filter/FilterInterface.hpp"
#include "label/MatcherInterface.hpp"

namespace timealg {
namespace filter {

// Runs a label matcher against the interval's value for matcher->name().
// Intervals without that label, or without labels at all, are matched
// against the empty string.
class LabelFilter : public FilterInterface {
 private:
  label::MatcherPtr matcher_;

 public:
  LabelFilter(const label::MatcherPtr &matcher);

  bool apply(const interval::Interval &itvl) const;
};

FilterPtr label_equal(const std::string &name, const std::string &value);
FilterPtr label_regex(const std::string &name, const std::string &pattern);
FilterPtr label_not_equal(const std::string &name, const std::string &value);
// Label value is one of the given values.
FilterPtr label_one_of(const std::string &name,
                       const std::set<std::string> &values);

// For multi-valued labels holding a comma separated list, e.g.
// tags=work,urgent. True when the list shares any value with values, or
// contains all of them.
FilterPtr label_has_any(const std::string &name,
                        const std::set<std::string> &values);
FilterPtr label_has_all(const std::string &name,
                        const std::set<std::string> &values);

}  // namespace filter
}  // namespace timealg

#endif
