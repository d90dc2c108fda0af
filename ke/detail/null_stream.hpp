#ifndef ke_detail_null_stream_hpp
#define ke_detail_null_stream_hpp

namespace ke {
namespace detail {
/**
 * Implements operator<< for all types, without any effect.
 *
 * The KE_LOG() macros return an object of this class when the particular log-line is disabled at compile-time, so
 * the trace messages in the election engine cost nothing in production builds.
 */
struct null_stream {
  /// Generic do-nothing streaming operator
  template <typename T>
  null_stream& operator<<(T const&) {
    return *this;
  }

  /// Do-nothing streaming operator for string literals.
  null_stream& operator<<(char const*) {
    return *this;
  }
};

} // namespace detail
} // namespace ke

#endif // ke_detail_null_stream_hpp
