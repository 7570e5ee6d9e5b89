#include "filter/FilterInterface.hpp"

#include "base/TimeAlgException.hpp"

namespace timealg {
namespace filter {

namespace {

void check(const Filters &filters) {
  for (const FilterPtr &f : filters)
    if (!f) throw base::InvalidArgument("null filter");
}

// Nested combinations of the same kind collapse into one level.
template <typename T>
Filters combine(const FilterPtr &f1, const FilterPtr &f2) {
  Filters r;
  const FilterPtr *parts[2] = {&f1, &f2};
  for (int i = 0; i < 2; ++i) {
    if (!*parts[i]) throw base::InvalidArgument("null filter");
    const T *same = dynamic_cast<const T *>(parts[i]->get());
    if (same)
      r.insert(r.end(), same->filters().begin(), same->filters().end());
    else
      r.push_back(*parts[i]);
  }
  return r;
}

}  // namespace

AndFilter::AndFilter(const Filters &filters) : filters_(filters) {
  check(filters_);
}

bool AndFilter::apply(const interval::Interval &itvl) const {
  for (const FilterPtr &f : filters_)
    if (!f->apply(itvl)) return false;
  return true;
}

OrFilter::OrFilter(const Filters &filters) : filters_(filters) {
  check(filters_);
}

bool OrFilter::apply(const interval::Interval &itvl) const {
  for (const FilterPtr &f : filters_)
    if (f->apply(itvl)) return true;
  return false;
}

FilterPtr and_of(const FilterPtr &f1, const FilterPtr &f2) {
  return FilterPtr(new AndFilter(combine<AndFilter>(f1, f2)));
}

FilterPtr or_of(const FilterPtr &f1, const FilterPtr &f2) {
  return FilterPtr(new OrFilter(combine<OrFilter>(f1, f2)));
}

FilterPtr operator&(const FilterPtr &f1, const FilterPtr &f2) {
  return and_of(f1, f2);
}

FilterPtr operator|(const FilterPtr &f1, const FilterPtr &f2) {
  return or_of(f1, f2);
}

}  // namespace filter
}  // namespace timealg
