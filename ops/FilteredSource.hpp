#ifndef FILTEREDSOURCE_H
#define FILTEREDSOURCE_H

#include "filter/FilterInterface.hpp"
#include "source/SourceInterface.hpp"

namespace timealg {
namespace ops {

class FilteredIterator : public source::IntervalIteratorInterface {
 private:
  std::unique_ptr<source::IntervalIteratorInterface> it_;
  filter::FilterPtr filter_;

 public:
  FilteredIterator(std::unique_ptr<source::IntervalIteratorInterface> &&it,
                   const filter::FilterPtr &filter)
      : it_(std::move(it)), filter_(filter) {}

  bool next() const {
    while (it_->next())
      if (filter_->apply(*it_->at())) return true;
    return false;
  }

  interval::IntervalPtr at() const { return it_->at(); }
};

// Child intervals accepted by the filter, passed through unmodified.
class FilteredSource : public source::SourceInterface {
 private:
  source::SourcePtr child_;
  filter::FilterPtr filter_;

 public:
  FilteredSource(const source::SourcePtr &child,
                 const filter::FilterPtr &filter);

  std::unique_ptr<source::IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const;
};

}  // namespace ops
}  // namespace timealg

#endif
