#ifndef TIMEALG_ERROR_H
#define TIMEALG_ERROR_H

#include <string>

namespace timealg {
namespace error {

class Error {
 private:
  std::string err_;

 public:
  Error() = default;
  Error(const std::string &err_) : err_(err_) {}
  Error(const char *err_) : err_(err_) {}
  Error(const error::Error &err) : err_(err.error()) {}

  void wrap(const std::string &msg) { err_ = msg + ": " + err_; }

  void unwrap() {
    std::string::size_type n = err_.find(":");
    if (n != std::string::npos) err_ = err_.substr(n + 2);
  }

  void set(const std::string &s) { err_ = s; }
  void set(const char *s) { err_ = s; }

  void set(const Error &e) { err_ = e.error(); }

  const std::string &error() const { return err_; }

  operator bool() const { return !err_.empty(); }

  bool operator==(const std::string &err) const { return err_ == err; }
  bool operator==(const Error &err) const { return err_ == err.error(); }

  bool operator!=(const std::string &err) const { return err_ != err; }
  bool operator!=(const Error &err) const { return err_ != err.error(); }
};

inline Error unwrap(const Error &e) {
  std::string::size_type n = e.error().find(":");
  if (n == std::string::npos)
    return e.error();
  else
    return e.error().substr(n + 2);
}

inline Error wrap(const Error &e, const std::string &msg) {
  std::string r;
  r.reserve(e.error().length() + msg.length() + 3);
  r += msg;
  r += ": ";
  r += e.error();
  return r;
}

}  // namespace error
}  // namespace timealg

#endif
