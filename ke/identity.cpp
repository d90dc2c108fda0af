#include "ke/identity.hpp"
#include <ke/detail/status_errors.hpp>
#include <ke/errors.hpp>
#include <ke/log.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {
std::string trim(std::string const& s) {
  char const* whitespace = " \t\r\n\f\v";
  auto begin = s.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return std::string();
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(begin, end - begin + 1);
}
} // anonymous namespace

namespace ke {

std::string read_namespace(std::string const& path) {
  std::ifstream is(path);
  if (not is) {
    throw configuration_error("namespace not found for current environment, cannot open " + path);
  }
  std::ostringstream contents;
  contents << is.rdbuf();
  auto ns = trim(contents.str());
  if (ns.empty()) {
    throw configuration_error("namespace file " + path + " is empty");
  }
  return ns;
}

std::string pod_name_from_environment(std::string const& variable) {
  char const* value = std::getenv(variable.c_str());
  if (value == nullptr or *value == '\0') {
    throw configuration_error("required env " + variable + " not set, please configure downward API");
  }
  return value;
}

peer_identity resolve_identity(token_store& store, std::string const& ns, std::string const& pod_name) {
  k8s::Pod pod;
  auto status = store.get_peer(pod_name, pod);
  if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
    std::ostringstream os;
    os << "pod " << ns << "/" << pod_name << " not found, cannot resolve own identity";
    throw configuration_error(os.str());
  }
  if (not status.ok()) {
    KE_LOG(error) << "failed to get pod, namespace=" << ns << ", name=" << pod_name;
  }
  detail::check_status(status, "resolve_identity()", " namespace=", ns, " pod=", pod_name);

  peer_identity self;
  self.ns = ns;
  self.name = pod_name;
  self.uid = pod.metadata().uid();
  if (self.uid.empty()) {
    throw configuration_error("pod " + ns + "/" + pod_name + " has no uid, cannot use it as a lock owner");
  }
  KE_LOG(debug) << "resolved own identity " << self;
  return self;
}

} // namespace ke
