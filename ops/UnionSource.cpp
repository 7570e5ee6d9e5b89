#include "ops/UnionSource.hpp"

#include "ops/OpsUtils.hpp"

namespace timealg {
namespace ops {

UnionIterator::UnionIterator(
    std::deque<std::unique_ptr<source::IntervalIteratorInterface>> &&its)
    : its_(std::move(its)), valid_(its_.size(), false), idx_(-1),
      started_(false) {}

bool UnionIterator::next() const {
  if (!started_) {
    started_ = true;
    for (size_t i = 0; i < its_.size(); ++i) valid_[i] = its_[i]->next();
  } else if (idx_ >= 0) {
    valid_[idx_] = its_[idx_]->next();
  }

  idx_ = -1;
  interval::IntervalPtr min;
  for (size_t i = 0; i < its_.size(); ++i) {
    if (!valid_[i]) continue;
    interval::IntervalPtr cur = its_[i]->at();
    if (idx_ == -1 || interval::compare(*cur, *min) < 0) {
      idx_ = i;
      min = cur;
    }
  }
  return idx_ != -1;
}

UnionSource::UnionSource(const source::Sources &children)
    : source::SourceInterface(all_masks(checked(children, "union")),
                              first_coercer(checked(children, "union"))) {
  for (const source::SourcePtr &c : children) {
    const UnionSource *u = dynamic_cast<const UnionSource *>(c.get());
    if (u)
      children_.insert(children_.end(), u->children().begin(),
                       u->children().end());
    else
      children_.push_back(c);
  }
}

std::unique_ptr<source::IntervalIteratorInterface> UnionSource::fetch(
    const interval::Bound &start, const interval::Bound &end) const {
  std::deque<std::unique_ptr<source::IntervalIteratorInterface>> its;
  for (const source::SourcePtr &c : children_) its.push_back(c->fetch(start, end));
  return std::unique_ptr<source::IntervalIteratorInterface>(
      new UnionIterator(std::move(its)));
}

}  // namespace ops
}  // namespace timealg
