#include "ops/IntersectionSource.hpp"

namespace timealg {
namespace ops {

namespace {

// Drops entries that end at or before start; they cannot overlap anything
// arriving later.
void prune(std::deque<OverlapPtr> &active, const interval::Bound &start) {
  std::deque<OverlapPtr>::iterator it = active.begin();
  while (it != active.end()) {
    if (interval::start_end_compare(start, (*it)->span->end()) >= 0)
      it = active.erase(it);
    else
      ++it;
  }
}

bool same_overlap(const Overlap &a, const Overlap &b) {
  if (!a.span->same_as(*b.span) || a.members.size() != b.members.size())
    return false;
  for (size_t i = 0; i < a.members.size(); ++i)
    if (!a.members[i]->same_as(*b.members[i])) return false;
  return true;
}

bool seen(const std::deque<OverlapPtr> &active, const OverlapPtr &x) {
  for (const OverlapPtr &p : active)
    if (same_overlap(*p, *x)) return true;
  return false;
}

}  // namespace

LeafOverlapIterator::LeafOverlapIterator(
    std::unique_ptr<source::IntervalIteratorInterface> &&it)
    : it_(std::move(it)) {}

bool LeafOverlapIterator::next() const {
  if (!it_->next()) return false;
  std::shared_ptr<Overlap> o(new Overlap());
  o->span = it_->at();
  o->members.push_back(it_->at());
  cur_ = o;
  return true;
}

OverlapSweepIterator::OverlapSweepIterator(
    std::unique_ptr<OverlapIteratorInterface> &&l,
    std::unique_ptr<OverlapIteratorInterface> &&r)
    : l_(std::move(l)), r_(std::move(r)), started_(false) {}

bool OverlapSweepIterator::has_pending() const {
  // Once a side has nothing ahead and nothing active, no pair can form.
  if (!l_head_ && l_active_.empty()) return false;
  if (!r_head_ && r_active_.empty()) return false;
  return l_head_ || r_head_;
}

interval::Bound OverlapSweepIterator::pending_start() const {
  if (!l_head_) return r_head_->span->start();
  if (!r_head_) return l_head_->span->start();
  return interval::start_compare(l_head_->span->start(),
                                 r_head_->span->start()) <= 0
             ? l_head_->span->start()
             : r_head_->span->start();
}

void OverlapSweepIterator::join(const OverlapPtr &l,
                                const OverlapPtr &r) const {
  if (!interval::overlaps(*l->span, *r->span)) return;
  std::shared_ptr<Overlap> o(new Overlap());
  o->span = interval::make_interval(
      interval::max_start(l->span->start(), r->span->start()),
      interval::min_end(l->span->end(), r->span->end()));
  o->members = l->members;
  o->members.insert(o->members.end(), r->members.begin(), r->members.end());
  buf_.insert(o);
}

void OverlapSweepIterator::step() const {
  bool take_left =
      !r_head_ ||
      (l_head_ && interval::start_compare(l_head_->span->start(),
                                          r_head_->span->start()) <= 0);
  OverlapPtr x;
  if (take_left) {
    x = l_head_;
    l_head_ = l_->next() ? l_->at() : nullptr;
  } else {
    x = r_head_;
    r_head_ = r_->next() ? r_->at() : nullptr;
  }

  prune(l_active_, x->span->start());
  prune(r_active_, x->span->start());

  std::deque<OverlapPtr> &own = take_left ? l_active_ : r_active_;
  std::deque<OverlapPtr> &other = take_left ? r_active_ : l_active_;
  if (seen(own, x)) return;

  for (const OverlapPtr &o : other) {
    if (take_left)
      join(x, o);
    else
      join(o, x);
  }
  own.push_back(x);
}

bool OverlapSweepIterator::next() const {
  if (!started_) {
    started_ = true;
    l_head_ = l_->next() ? l_->at() : nullptr;
    r_head_ = r_->next() ? r_->at() : nullptr;
  }
  while (true) {
    bool pending = has_pending();
    // The smallest buffered overlap is final once no pending input starts
    // at or before it.
    if (!buf_.empty() &&
        (!pending || interval::start_compare((*buf_.begin())->span->start(),
                                             pending_start()) < 0)) {
      cur_ = *buf_.begin();
      buf_.erase(buf_.begin());
      return true;
    }
    if (!pending) return false;
    step();
  }
}

IntersectIterator::IntersectIterator(
    std::deque<std::unique_ptr<source::IntervalIteratorInterface>> &&children,
    const std::vector<bool> &masks)
    : masks_(masks), all_masks_(true) {
  for (size_t i = 0; i < masks_.size(); ++i)
    if (!masks_[i]) all_masks_ = false;

  overlaps_.reset(new LeafOverlapIterator(std::move(children.front())));
  for (size_t i = 1; i < children.size(); ++i)
    overlaps_.reset(new OverlapSweepIterator(
        std::move(overlaps_), std::unique_ptr<OverlapIteratorInterface>(
                                  new LeafOverlapIterator(
                                      std::move(children[i])))));
}

bool IntersectIterator::next() const {
  while (copies_.empty()) {
    if (!overlaps_->next()) return false;
    OverlapPtr o = overlaps_->at();
    const interval::Bound &s = o->span->start();
    const interval::Bound &e = o->span->end();
    if (all_masks_) {
      copies_.push_back(o->members.front()->with_bounds(s, e));
      continue;
    }
    for (size_t i = 0; i < o->members.size(); ++i)
      if (!masks_[i]) copies_.push_back(o->members[i]->with_bounds(s, e));
  }
  cur_ = copies_.front();
  copies_.pop_front();
  return true;
}

IntersectionSource::IntersectionSource(const source::Sources &children)
    : source::SourceInterface(
          all_masks(checked(children, "intersection")),
          first_coercer(checked(children, "intersection"))) {
  for (const source::SourcePtr &c : children) {
    const IntersectionSource *i =
        dynamic_cast<const IntersectionSource *>(c.get());
    if (i)
      children_.insert(children_.end(), i->children().begin(),
                       i->children().end());
    else
      children_.push_back(c);
  }
}

std::unique_ptr<source::IntervalIteratorInterface> IntersectionSource::fetch(
    const interval::Bound &start, const interval::Bound &end) const {
  if (children_.empty())
    return std::unique_ptr<source::IntervalIteratorInterface>(
        new source::EmptyIntervalIterator());
  if (children_.size() == 1) return children_[0]->fetch(start, end);

  std::deque<std::unique_ptr<source::IntervalIteratorInterface>> its;
  std::vector<bool> masks;
  for (const source::SourcePtr &c : children_) {
    its.push_back(c->fetch(start, end));
    masks.push_back(c->is_mask());
  }
  return std::unique_ptr<source::IntervalIteratorInterface>(
      new IntersectIterator(std::move(its), masks));
}

}  // namespace ops
}  // namespace timealg
