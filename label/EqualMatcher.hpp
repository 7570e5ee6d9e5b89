#ifndef EQUALMATCHER_H
#define EQUALMATCHER_H

#include "label/MatcherInterface.hpp"

namespace timealg {
namespace label {

class EqualMatcher : public MatcherInterface {
 private:
  std::string name_;
  std::string value_;

 public:
  EqualMatcher(const std::string &name, const std::string &value)
      : name_(name), value_(value) {}

  const std::string &name() const { return name_; }

  std::string value() const { return value_; }

  bool match(const std::string &s) const { return (s.compare(value_) == 0); }

  std::string class_name() const { return "equal"; }
};

}  // namespace label
}  // namespace timealg

#endif
