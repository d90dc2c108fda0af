#ifndef ke_detail_fake_token_store_hpp
#define ke_detail_fake_token_store_hpp

#include <ke/token_store.hpp>

#include <map>
#include <mutex>
#include <vector>

namespace ke {
namespace detail {

/**
 * An in-memory token store that behaves like a (very small) API server.
 *
 * All operations are atomic with respect to each other, in particular create_token() succeeds for exactly one caller
 * when multiple threads race to create the same lock.  Deleting a pod also deletes every lock owned by that pod,
 * which is what the garbage collector eventually does in a real cluster.
 */
class fake_token_store : public token_store {
public:
  explicit fake_token_store(std::string ns)
      : mu_()
      , ns_(std::move(ns))
      , tokens_()
      , pods_()
      , create_calls_(0)
      , deleted_peers_() {
  }

  grpc::Status get_token(std::string const& name, k8s::ConfigMap& token) override {
    std::lock_guard<std::mutex> lock(mu_);
    auto i = tokens_.find(name);
    if (i == tokens_.end()) {
      return grpc::Status(grpc::StatusCode::NOT_FOUND, "configmaps \"" + name + "\" not found");
    }
    token = i->second;
    return grpc::Status::OK;
  }

  grpc::Status create_token(std::string const& name, k8s::OwnerReference const& owner) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++create_calls_;
    if (tokens_.count(name) != 0) {
      return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, "configmaps \"" + name + "\" already exists");
    }
    k8s::ConfigMap token;
    token.set_api_version("v1");
    token.set_kind("ConfigMap");
    token.mutable_metadata()->set_name(name);
    token.mutable_metadata()->set_namespace_(ns_);
    *token.mutable_metadata()->add_owner_references() = owner;
    tokens_.emplace(name, std::move(token));
    return grpc::Status::OK;
  }

  grpc::Status get_peer(std::string const& name, k8s::Pod& pod) override {
    std::lock_guard<std::mutex> lock(mu_);
    auto i = pods_.find(name);
    if (i == pods_.end()) {
      return grpc::Status(grpc::StatusCode::NOT_FOUND, "pods \"" + name + "\" not found");
    }
    pod = i->second;
    return grpc::Status::OK;
  }

  grpc::Status delete_peer(std::string const& name) override {
    std::lock_guard<std::mutex> lock(mu_);
    deleted_peers_.push_back(name);
    auto i = pods_.find(name);
    if (i == pods_.end()) {
      return grpc::Status(grpc::StatusCode::NOT_FOUND, "pods \"" + name + "\" not found");
    }
    auto uid = i->second.metadata().uid();
    pods_.erase(i);
    collect_garbage(uid);
    return grpc::Status::OK;
  }

  //@{
  /// @name Helpers to setup and inspect the state in tests.
  k8s::Pod& add_pod(std::string const& name, std::string const& uid, std::string const& phase) {
    std::lock_guard<std::mutex> lock(mu_);
    k8s::Pod pod;
    pod.set_api_version("v1");
    pod.set_kind("Pod");
    pod.mutable_metadata()->set_name(name);
    pod.mutable_metadata()->set_namespace_(ns_);
    pod.mutable_metadata()->set_uid(uid);
    pod.mutable_status()->set_phase(phase);
    return pods_[name] = std::move(pod);
  }

  void put_token(k8s::ConfigMap token) {
    std::lock_guard<std::mutex> lock(mu_);
    auto name = token.metadata().name();
    tokens_[name] = std::move(token);
  }

  bool has_token(std::string const& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return tokens_.count(name) != 0;
  }

  int create_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return create_calls_;
  }

  std::vector<std::string> deleted_peers() const {
    std::lock_guard<std::mutex> lock(mu_);
    return deleted_peers_;
  }
  //@}

private:
  /// Remove the locks owned by the pod with @a uid, must be called with the mutex held.
  void collect_garbage(std::string const& uid) {
    for (auto i = tokens_.begin(); i != tokens_.end();) {
      bool owned = false;
      for (auto const& o : i->second.metadata().owner_references()) {
        owned = owned or o.uid() == uid;
      }
      if (owned) {
        i = tokens_.erase(i);
      } else {
        ++i;
      }
    }
  }

private:
  mutable std::mutex mu_;
  std::string ns_;
  std::map<std::string, k8s::ConfigMap> tokens_;
  std::map<std::string, k8s::Pod> pods_;
  int create_calls_;
  std::vector<std::string> deleted_peers_;
};

} // namespace detail
} // namespace ke

#endif // ke_detail_fake_token_store_hpp
