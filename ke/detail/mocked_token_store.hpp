#ifndef ke_detail_mocked_token_store_hpp
#define ke_detail_mocked_token_store_hpp

#include <ke/token_store.hpp>

#include <gmock/gmock.h>

namespace ke {
namespace detail {

/**
 * A token store where each operation is a mock, to verify the exact requests made by the election.
 */
class mocked_token_store : public token_store {
public:
  MOCK_METHOD2(get_token, grpc::Status(std::string const& name, k8s::ConfigMap& token));
  MOCK_METHOD2(create_token, grpc::Status(std::string const& name, k8s::OwnerReference const& owner));
  MOCK_METHOD2(get_peer, grpc::Status(std::string const& name, k8s::Pod& pod));
  MOCK_METHOD1(delete_peer, grpc::Status(std::string const& name));
};

} // namespace detail
} // namespace ke

#endif // ke_detail_mocked_token_store_hpp
