#ifndef REGEXMATCHER_H
#define REGEXMATCHER_H

#include <regex>

#include "base/TimeAlgException.hpp"
#include "label/MatcherInterface.hpp"

namespace timealg {
namespace label {

// Full-match semantics. An invalid pattern throws base::InvalidArgument.
class RegexMatcher : public MatcherInterface {
 private:
  std::string name_;
  std::string pattern_;
  std::regex re;

 public:
  RegexMatcher(const std::string &name, const std::string &pattern)
      : name_(name), pattern_(pattern) {
    try {
      re.assign(pattern);
    } catch (const std::regex_error &e) {
      throw base::InvalidArgument("invalid label pattern \"" + pattern +
                                  "\": " + e.what());
    }
  }

  const std::string &name() const { return name_; }

  std::string value() const { return pattern_; }

  bool match(const std::string &s) const { return std::regex_match(s, re); }

  std::string class_name() const { return "regex"; }
};

}  // namespace label
}  // namespace timealg

#endif
