#include "ops/ComplementSource.hpp"

#include "ops/OpsUtils.hpp"

namespace timealg {
namespace ops {

ComplementIterator::ComplementIterator(
    std::unique_ptr<source::IntervalIteratorInterface> &&it,
    const interval::Bound &start, const interval::Bound &end,
    const source::MaskFactory &factory)
    : it_(std::move(it)),
      end_(end),
      factory_(factory),
      cursor_(start),
      done_(interval::start_end_compare(start, end) >= 0) {}

bool ComplementIterator::next() const {
  while (!done_) {
    if (!it_->next()) {
      done_ = true;
      if (interval::start_end_compare(cursor_, end_) < 0) {
        cur_ = factory_(cursor_, end_);
        return true;
      }
      return false;
    }

    interval::IntervalPtr x = it_->at();
    if (x->duration() && *x->duration() == 0) continue;

    interval::IntervalPtr gap;
    if (interval::start_compare(x->start(), cursor_) > 0) {
      if (interval::start_end_compare(x->start(), end_) >= 0) {
        // Child moved past the range: the rest of it is one gap.
        done_ = true;
        cur_ = factory_(cursor_, end_);
        return true;
      }
      gap = factory_(cursor_, x->start());
    }

    if (!x->end()) {
      done_ = true;
    } else if (!cursor_ || *cursor_ < *x->end()) {
      cursor_ = x->end();
      if (interval::start_end_compare(cursor_, end_) >= 0) done_ = true;
    }

    if (gap) {
      cur_ = gap;
      return true;
    }
  }
  return false;
}

ComplementSource::ComplementSource(const source::SourcePtr &child)
    : source::SourceInterface(true, checked(child, "complement")->coercer()),
      child_(child),
      factory_(source::default_mask_factory()) {}

ComplementSource::ComplementSource(const source::SourcePtr &child,
                                   const source::MaskFactory &factory)
    : source::SourceInterface(true, checked(child, "complement")->coercer()),
      child_(child),
      factory_(factory) {
  if (factory_.empty()) throw base::InvalidArgument("empty mask factory");
}

std::unique_ptr<source::IntervalIteratorInterface> ComplementSource::fetch(
    const interval::Bound &start, const interval::Bound &end) const {
  return std::unique_ptr<source::IntervalIteratorInterface>(
      new ComplementIterator(child_->fetch(start, end), start, end, factory_));
}

source::SourcePtr flatten(const source::SourcePtr &child) {
  return source::SourcePtr(
      new ComplementSource(source::SourcePtr(new ComplementSource(child))));
}

source::SourcePtr flatten(const source::SourcePtr &child,
                          const source::MaskFactory &factory) {
  return source::SourcePtr(new ComplementSource(
      source::SourcePtr(new ComplementSource(child, factory)), factory));
}

}  // namespace ops
}  // namespace timealg
