#include "test/TestUtils.hpp"

#include <stdlib.h>

#include <boost/tokenizer.hpp>

namespace timealg {
namespace test {

namespace {

interval::Bound parse_bound(const std::string &s) {
  if (s.empty()) return interval::UNBOUNDED;
  return static_cast<int64_t>(strtoll(s.c_str(), NULL, 10));
}

}  // namespace

BoundPairs parse_bounds(const std::string &s) {
  BoundPairs r;
  boost::char_separator<char> tokenSep(",");
  boost::tokenizer<boost::char_separator<char>> tokens(s, tokenSep);
  for (auto const &token : tokens) {
    std::string::size_type n = token.find(':');
    if (n == std::string::npos) continue;
    r.push_back(BoundPair(parse_bound(token.substr(0, n)),
                          parse_bound(token.substr(n + 1))));
  }
  return r;
}

interval::Intervals parse_intervals(const std::string &s) {
  interval::Intervals r;
  for (const BoundPair &b : parse_bounds(s))
    r.push_back(interval::make_interval(b.first, b.second));
  return r;
}

BoundPairs bounds_of(const interval::Intervals &itvls) {
  BoundPairs r;
  for (const interval::IntervalPtr &p : itvls)
    r.push_back(BoundPair(p->start(), p->end()));
  return r;
}

std::string format_bounds(const interval::Intervals &itvls) {
  std::string r;
  for (const interval::IntervalPtr &p : itvls) {
    if (!r.empty()) r += ",";
    if (p->start()) r += std::to_string(*p->start());
    r += ":";
    if (p->end()) r += std::to_string(*p->end());
  }
  return r;
}

interval::IntervalPtr labeled(const interval::Bound &start,
                              const interval::Bound &end,
                              const std::string &name,
                              const std::string &value) {
  return interval::make_labeled(start, end,
                                label::lbs_from_string({name, value}));
}

}  // namespace test
}  // namespace timealg
