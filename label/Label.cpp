#include "label/Label.hpp"

#include <algorithm>

namespace timealg {
namespace label {

Label::Label(const std::initializer_list<std::string> &l) {
  if (l.size() == 2) {
    label = *l.begin();
    value = *(l.begin() + 1);
  }
}

Label::Label(const std::string &label, const std::string &value)
    : label(label), value(value) {}

bool Label::operator<(const Label &l2) const {
  int c = label.compare(l2.label);
  if (c != 0) return c < 0;
  return value.compare(l2.value) < 0;
}

bool Label::operator<=(const Label &l2) const {
  int c = label.compare(l2.label);
  if (c != 0) return c < 0;
  return value.compare(l2.value) <= 0;
}

bool Label::operator==(const Label &l2) const {
  return label == l2.label && value == l2.value;
}

Labels lbs_add(const Labels &lset, const Label &l) {
  for (size_t i = 0; i < lset.size(); ++i) {
    if (lset[i].label == l.label) return lset;
  }
  Labels r(lset);
  r.push_back(l);
  std::sort(r.begin(), r.end());
  return r;
}

const std::string *lbs_get(const Labels &lbs, const std::string &name) {
  for (auto const &l : lbs) {
    if (l.label == name) return &l.value;
  }
  return nullptr;
}

std::string lbs_string(const Labels &lbs) {
  std::string r = "{";
  for (size_t i = 0; i < lbs.size(); i++) {
    if (i > 0) r += ",";
    r += lbs[i].label + "=" + lbs[i].value;
  }
  r += "}";
  return r;
}

Labels lbs_from_string(const std::initializer_list<std::string> &list) {
  Labels r;
  if (list.size() % 2 != 0) return r;
  std::initializer_list<std::string>::iterator it = list.begin();
  while (it != list.end()) {
    r.push_back(Label(*(it), *(it + 1)));
    ++it;
    ++it;
  }
  std::sort(r.begin(), r.end());
  return r;
}

int lbs_compare(const Labels &lbs1, const Labels &lbs2) {
  size_t len = (lbs1.size() < lbs2.size() ? lbs1.size() : lbs2.size());
  for (size_t i = 0; i < len; i++) {
    int c = lbs1[i].label.compare(lbs2[i].label);
    if (c != 0) return c;
    c = lbs1[i].value.compare(lbs2[i].value);
    if (c != 0) return c;
  }
  return static_cast<int>(lbs1.size()) - static_cast<int>(lbs2.size());
}

}  // namespace label
}  // namespace timealg
