#ifndef ke_assert_throw_hpp
#define ke_assert_throw_hpp

/**
 * @file
 *
 * Define a macro to check internal invariants at runtime.
 */

#ifndef KE_ASSERT_THROW
/**
 * Check the predicate @a P and if false raises a std::logic_error describing the problem.
 *
 * Used for invariants that only a bug in Kubelect could violate, such as an invalid state transition.
 */
#define KE_ASSERT_THROW(P)                                                                                             \
  do {                                                                                                                 \
    if (not(P)) {                                                                                                      \
      ke::assert_throw_impl(#P, __func__, __FILE__, __LINE__);                                                         \
    }                                                                                                                  \
  } while (false)
#endif // KE_ASSERT_THROW

namespace ke {

/**
 * Implement the @c KE_ASSERT_THROW macro out-of-line.
 *
 * @param what the text description of the predicate
 * @param function the location (function) where the predicate was asserted.
 * @param filename the location (source code filename) where the predicate was asserted.
 * @param lineno the location (line number) where the predicate was asserted.
 */
[[noreturn]] void assert_throw_impl(char const* what, char const* function, char const* filename, int lineno);
} // namespace ke

#endif // ke_assert_throw_hpp
