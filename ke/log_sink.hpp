#ifndef ke_log_sink_hpp
#define ke_log_sink_hpp

#include <ke/log_severity.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <utility>

namespace ke {

/**
 * A destination for logging messages.
 *
 * Applications configure where the election progress is reported by adding one or more instances of ke::log_sink to
 * the global logger.  Kubelect does not configure any sink by default, a library should not write to stderr unless the
 * application asks for it.
 */
class log_sink {
public:
  virtual ~log_sink() {}

  /**
   * Log the given message to the sink.
   *
   * @param sev the severity of the message.
   * @param message the message value.
   */
  virtual void log(severity sev, std::string&& message) = 0;
};

/**
 * An adaptor that converts any Functor into a @c ke::log_sink.
 *
 * @tparam Functor the type of the functor to adapt.
 */
template <typename Functor>
class log_to_functor : public log_sink {
public:
  log_to_functor(Functor&& f)
      : functor(std::move(f)) {
  }
  log_to_functor(Functor const& f)
      : functor(f) {
  }

  /// Forward logging to the functor.
  virtual void log(severity sev, std::string&& message) override {
    functor(sev, std::move(message));
  }

private:
  Functor functor;
};

/**
 * Create a @c ke::log_sink shared pointer from a functor.
 *
 * @tparam Functor the type of the functor object @a f.
 * @param f the functor object to forward calls to.
 * @return a log_sink that forwards log() calls to the given functor @a f.
 */
template <typename Functor>
std::shared_ptr<log_sink> make_log_sink(Functor&& f) {
  using functor_type = typename std::decay<Functor>::type;
  return std::shared_ptr<log_sink>(new log_to_functor<functor_type>(std::forward<Functor>(f)));
}

/**
 * Create a sink that writes each message, one per line, to an existing iostream.
 *
 * The stream must outlive the sink, typically this is used with std::clog or std::cerr in main().  Writes are
 * flushed after each message so the log is useful when the orchestrator kills the process.
 */
std::shared_ptr<log_sink> make_ostream_log_sink(std::ostream& os);

} // namespace ke

#endif // ke_log_sink_hpp
