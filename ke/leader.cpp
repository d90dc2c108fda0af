#include "ke/leader.hpp"
#include <ke/api_config.hpp>
#include <ke/detail/exponential_backoff.hpp>
#include <ke/detail/http_client.hpp>
#include <ke/detail/kube_token_store.hpp>
#include <ke/log.hpp>

namespace {
/// The backoff policy: 1s, 2s, 4s, 8s, 16s, 16s, ... each perturbed by up to 20%.
std::chrono::seconds const initial_backoff(1);
std::chrono::seconds const maximum_backoff(16);
double const backoff_jitter = 0.2;

std::unique_ptr<ke::token_store> make_kube_token_store(std::string const& ns) {
  return std::unique_ptr<ke::token_store>(
      new ke::detail::kube_token_store(ns, ke::detail::make_curl_http_client(ke::in_cluster_config())));
}
} // anonymous namespace

namespace ke {

election_result become_leader(std::string const& lock_name) {
  cancellation never_cancelled;
  return become_leader(lock_name, never_cancelled);
}

election_result become_leader(std::string const& lock_name, cancellation& cancel) {
  if (cancel.cancelled()) {
    KE_LOG(info) << "election for lock " << lock_name << " cancelled before it started";
    return election_result::cancelled;
  }
  detail::exponential_backoff backoff(initial_backoff, maximum_backoff, backoff_jitter);
  return detail::become_leader(
      lock_name, identity_config(), &make_kube_token_store, backoff,
      [&cancel](std::chrono::milliseconds d) { return cancel.wait_for(d); },
      [&cancel]() { return cancel.cancelled(); });
}

namespace detail {
election_result become_leader(
    std::string const& lock_name, identity_config const& config, token_store_factory const& make_store,
    backoff_strategy& backoff, election_engine::sleep_function sleep, election_engine::cancelled_function cancelled) {
  auto ns = read_namespace(config.namespace_file);
  auto pod_name = pod_name_from_environment(config.pod_name_variable);
  if (cancelled and cancelled()) {
    KE_LOG(info) << "election for lock " << lock_name << " cancelled before contacting the API server";
    return election_result::cancelled;
  }
  auto store = make_store(ns);
  auto self = resolve_identity(*store, ns, pod_name);

  election_engine engine(*store, std::move(self), lock_name, backoff, std::move(sleep), std::move(cancelled));
  return engine.run();
}
} // namespace detail

} // namespace ke
