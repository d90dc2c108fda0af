#include "ke/token_store.hpp"

namespace ke {
token_store::~token_store() {
}
} // namespace ke
