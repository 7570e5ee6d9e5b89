#ifndef SOURCEINTERFACE_H
#define SOURCEINTERFACE_H

#include <boost/function.hpp>
#include <deque>
#include <memory>

#include "interval/Interval.hpp"
#include "source/BoundCoercion.hpp"
#include "source/IntervalIteratorInterface.hpp"

namespace timealg {
namespace source {

// Builds the interval emitted for a gap or a coalesced span.
typedef boost::function<interval::IntervalPtr(const interval::Bound &,
                                              const interval::Bound &)>
    MaskFactory;

inline MaskFactory default_mask_factory() { return &interval::make_interval; }

// Anything that can produce a sorted interval stream for a half-open range.
//
// fetch() may return intervals reaching outside [start, end); the querier
// clips. Every call starts a fresh cursor.
class SourceInterface {
 public:
  SourceInterface(bool is_mask) : mask_(is_mask), coercer_(&default_coerce) {}
  SourceInterface(bool is_mask, const BoundCoercer &coercer)
      : mask_(is_mask), coercer_(coercer) {}
  virtual ~SourceInterface() = default;

  virtual std::unique_ptr<IntervalIteratorInterface> fetch(
      const interval::Bound &start, const interval::Bound &end) const = 0;

  // True when every interval this source yields is metadata free.
  bool is_mask() const { return mask_; }

  const BoundCoercer &coercer() const { return coercer_; }

 private:
  bool mask_;
  BoundCoercer coercer_;
};

typedef std::shared_ptr<SourceInterface> SourcePtr;
typedef std::deque<SourcePtr> Sources;

}  // namespace source
}  // namespace timealg

#endif
