#include "ke/assert_throw.hpp"

#include <sstream>
#include <stdexcept>

namespace ke {

[[noreturn]] void assert_throw_impl(char const* what, char const* function, char const* filename, int lineno) {
  std::ostringstream os;
  os << "internal invariant (" << what << ") violated in " << function << " @ (" << filename << ":" << lineno << ")";
  throw std::logic_error(os.str());
}

} // namespace ke
