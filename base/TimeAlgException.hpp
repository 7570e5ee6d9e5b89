#ifndef TIMEALGEXCEPTION_H
#define TIMEALGEXCEPTION_H

#include <exception>
#include <string>

#include "base/Error.hpp"

namespace timealg {
namespace base {

class TimeAlgException : public std::exception {
 public:
  std::string err;

  TimeAlgException(const char *err) : err(err) {}
  TimeAlgException(const std::string &err) : err(err) {}
  TimeAlgException(const error::Error &err) : err(err.error()) {}

  const char *what() const throw() { return err.c_str(); }
};

// Interval built with finite start > end.
class ValidationError : public TimeAlgException {
 public:
  ValidationError(const std::string &err) : TimeAlgException(err) {}
};

// Out of range parameter: negative buffer/gap, non-positive ttl, ...
class InvalidArgument : public TimeAlgException {
 public:
  InvalidArgument(const char *err) : TimeAlgException(std::string(err)) {}
  InvalidArgument(const std::string &err) : TimeAlgException(err) {}
  InvalidArgument(const error::Error &err) : TimeAlgException(err) {}
};

// Operands that cannot be composed, e.g. a source joined to a filter with |.
class ConstructionError : public TimeAlgException {
 public:
  ConstructionError(const std::string &err) : TimeAlgException(err) {}
};

}  // namespace base
}  // namespace timealg

#endif
