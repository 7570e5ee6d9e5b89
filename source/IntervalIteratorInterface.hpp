#ifndef INTERVALITERATORINTERFACE_H
#define INTERVALITERATORINTERFACE_H

#include <memory>

#include "interval/Interval.hpp"

namespace timealg {
namespace source {

// Pull cursor over a sorted interval stream. next() must be called before the
// first at(); at() is only valid after next() returned true.
class IntervalIteratorInterface {
 public:
  virtual bool next() const = 0;
  virtual interval::IntervalPtr at() const = 0;
  virtual ~IntervalIteratorInterface() = default;
};

class EmptyIntervalIterator : public IntervalIteratorInterface {
 public:
  bool next() const { return false; }
  interval::IntervalPtr at() const { return nullptr; }
};

// Iterates a shared, already sorted list.
class ListIntervalIterator : public IntervalIteratorInterface {
 private:
  std::shared_ptr<const interval::Intervals> list_;
  size_t end_;
  mutable size_t index_;
  mutable bool started_;

 public:
  ListIntervalIterator(const std::shared_ptr<const interval::Intervals> &list)
      : list_(list), end_(list->size()), index_(0), started_(false) {}
  ListIntervalIterator(const std::shared_ptr<const interval::Intervals> &list,
                       size_t begin, size_t end)
      : list_(list), end_(end), index_(begin), started_(false) {}

  bool next() const {
    if (started_)
      ++index_;
    else
      started_ = true;
    return index_ < end_;
  }

  interval::IntervalPtr at() const { return (*list_)[index_]; }
};

inline interval::Intervals expand_intervals(
    const IntervalIteratorInterface *it) {
  interval::Intervals d;
  while (it->next()) d.push_back(it->at());
  return d;
}

}  // namespace source
}  // namespace timealg

#endif
