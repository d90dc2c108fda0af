#ifndef ke_detail_append_annotations_hpp
#define ke_detail_append_annotations_hpp

#include <utility>

namespace ke {
namespace detail {

/**
 * Append an (empty) list of annotations to a stream.
 *
 * @tparam Stream the type of the stream, typically std::ostream.
 * @param os the value of the stream.
 */
template <typename Stream>
inline void append_annotations(Stream& os) {
}

/**
 * Append a list of annotations to a stream.
 *
 * Used to build exception messages such as "get_token(my-lock) api error: forbidden [7] namespace=ns".
 *
 * @tparam Stream the type of the stream, typically std::ostream.
 * @tparam H the type of the first annotation in the list.
 * @tparam Tail the type of the remaining annotations in the list.
 * @param os the value of the stream.
 * @param h the value of the first annotation.
 * @param t the value of the remaining annotations.
 */
template <typename Stream, typename H, typename... Tail>
inline void append_annotations(Stream& os, H&& h, Tail&&... t) {
  os << std::forward<H>(h);
  append_annotations(os, std::forward<Tail>(t)...);
}

} // namespace detail
} // namespace ke

#endif // ke_detail_append_annotations_hpp
