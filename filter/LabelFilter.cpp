#include "filter/LabelFilter.hpp"

#include <boost/tokenizer.hpp>

#include "base/TimeAlgException.hpp"
#include "label/EqualMatcher.hpp"
#include "label/NotMatcher.hpp"
#include "label/RegexMatcher.hpp"

namespace timealg {
namespace filter {

namespace {

class SetMatcher : public label::MatcherInterface {
 private:
  std::string name_;
  std::set<std::string> values_;

 public:
  SetMatcher(const std::string &name, const std::set<std::string> &values)
      : name_(name), values_(values) {}

  const std::string &name() const { return name_; }

  std::string value() const {
    std::string r;
    for (const std::string &v : values_) {
      if (!r.empty()) r += "|";
      r += v;
    }
    return r;
  }

  bool match(const std::string &s) const { return values_.count(s) > 0; }

  std::string class_name() const { return "set"; }
};

class ListMatcher : public label::MatcherInterface {
 private:
  std::string name_;
  std::set<std::string> values_;
  bool all_;

 public:
  ListMatcher(const std::string &name, const std::set<std::string> &values,
              bool all)
      : name_(name), values_(values), all_(all) {}

  const std::string &name() const { return name_; }

  std::string value() const {
    std::string r;
    for (const std::string &v : values_) {
      if (!r.empty()) r += ",";
      r += v;
    }
    return r;
  }

  bool match(const std::string &s) const {
    typedef boost::tokenizer<boost::char_separator<char>> Tokenizer;
    boost::char_separator<char> sep(",");
    Tokenizer tokens(s, sep);
    std::set<std::string> present(tokens.begin(), tokens.end());
    size_t found = 0;
    for (const std::string &v : values_)
      if (present.count(v) > 0) ++found;
    return all_ ? found == values_.size() : found > 0;
  }

  std::string class_name() const { return all_ ? "has_all" : "has_any"; }
};

}  // namespace

LabelFilter::LabelFilter(const label::MatcherPtr &matcher) : matcher_(matcher) {
  if (!matcher_) throw base::InvalidArgument("null label matcher");
}

bool LabelFilter::apply(const interval::Interval &itvl) const {
  const interval::LabeledInterval *l =
      dynamic_cast<const interval::LabeledInterval *>(&itvl);
  if (l == nullptr) return matcher_->match("");
  const std::string *v = l->get(matcher_->name());
  return matcher_->match(v ? *v : std::string());
}

FilterPtr label_equal(const std::string &name, const std::string &value) {
  return FilterPtr(new LabelFilter(
      label::MatcherPtr(new label::EqualMatcher(name, value))));
}

FilterPtr label_regex(const std::string &name, const std::string &pattern) {
  return FilterPtr(new LabelFilter(
      label::MatcherPtr(new label::RegexMatcher(name, pattern))));
}

FilterPtr label_not_equal(const std::string &name, const std::string &value) {
  return FilterPtr(new LabelFilter(label::MatcherPtr(new label::NotMatcher(
      label::MatcherPtr(new label::EqualMatcher(name, value))))));
}

FilterPtr label_one_of(const std::string &name,
                       const std::set<std::string> &values) {
  return FilterPtr(
      new LabelFilter(label::MatcherPtr(new SetMatcher(name, values))));
}

FilterPtr label_has_any(const std::string &name,
                        const std::set<std::string> &values) {
  return FilterPtr(new LabelFilter(
      label::MatcherPtr(new ListMatcher(name, values, false))));
}

FilterPtr label_has_all(const std::string &name,
                        const std::set<std::string> &values) {
  return FilterPtr(new LabelFilter(
      label::MatcherPtr(new ListMatcher(name, values, true))));
}

}  // namespace filter
}  // namespace timealg
