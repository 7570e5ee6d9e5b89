#ifndef LABEL_H
#define LABEL_H

#include <deque>
#include <initializer_list>
#include <string>

namespace timealg {
namespace label {

class Label {
 public:
  std::string label;
  std::string value;

  Label() = default;

  Label(const std::initializer_list<std::string> &l);

  Label(const std::string &label, const std::string &value);

  bool operator<(const Label &l2) const;
  bool operator<=(const Label &l2) const;
  bool operator==(const Label &l2) const;
};

// Kept sorted by (label, value).
typedef std::deque<Label> Labels;

Labels lbs_add(const Labels &lset, const Label &l);

// Value of the label called name, nullptr when absent.
const std::string *lbs_get(const Labels &lbs, const std::string &name);

std::string lbs_string(const Labels &lbs);

Labels lbs_from_string(const std::initializer_list<std::string> &list);

int lbs_compare(const Labels &lbs1, const Labels &lbs2);

}  // namespace label
}  // namespace timealg

#endif
