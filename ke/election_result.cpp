#include "ke/election_result.hpp"

#include <iostream>

namespace ke {

std::ostream& operator<<(std::ostream& os, election_result x) {
  char const* values[] = {"elected", "already_leader", "cancelled"};
  return os << values[int(x)];
}

} // namespace ke
