#include "internal/model/candidate.hpp"

#include <tuple>

namespace stpa::model {

std::string JoinIds(const std::vector<std::string>& ids, char separator) {
  std::string out;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    for (const char c : ids[i]) {
      if (c == '\\' || c == '|' || c == separator)
        out += '\\';
      out += c;
    }
  }
  return out;
}

std::string CandidateCombination::Signature() const {
  std::string out(ToString(type));
  out += '|';
  out += JoinIds(controller_ids, ',');
  out += '|';
  out += JoinIds(control_action_ids, ',');
  return out;
}

bool CanonicalLess(const CandidateCombination& a, const CandidateCombination& b) {
  return std::tie(a.controller_ids, a.control_action_ids, a.type, a.abstraction) <
         std::tie(b.controller_ids, b.control_action_ids, b.type, b.abstraction);
}

} // namespace stpa::model
