#ifndef MATCHERINTERFACE_H
#define MATCHERINTERFACE_H

#include <memory>
#include <string>

namespace timealg {
namespace label {

class MatcherInterface {
 public:
  virtual const std::string &name() const = 0;
  virtual std::string value() const = 0;
  virtual bool match(const std::string &s) const = 0;

  virtual std::string class_name() const = 0;
  virtual ~MatcherInterface() = default;
};

typedef std::shared_ptr<MatcherInterface> MatcherPtr;

}  // namespace label
}  // namespace timealg

#endif
