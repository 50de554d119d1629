#ifndef AUTHBRIDGE_SRC_SERVICE_LOGIN_SERVICE_IMPL_H_
#define AUTHBRIDGE_SRC_SERVICE_LOGIN_SERVICE_IMPL_H_

#include <memory>

#include "absl/status/status.h"
#include "api/login/v1/login.grpc.pb.h"
#include "src/login/login_session_initiator.h"
#include "src/login/session_waiter.h"

namespace authbridge {
namespace service {

/**
 * Translate a login error into the status returned to gRPC clients. The
 * message is generic and names the state token only.
 */
::grpc::Status ToGrpcStatus(const absl::Status &status,
                            absl::string_view state);

class LoginServiceImpl final : public api::login::v1::LoginService::Service {
 private:
  std::shared_ptr<login::LoginSessionInitiator> initiator_;
  std::shared_ptr<login::SessionWaiter> waiter_;

 public:
  LoginServiceImpl(std::shared_ptr<login::LoginSessionInitiator> initiator,
                   std::shared_ptr<login::SessionWaiter> waiter);

  ::grpc::Status GetLoginUrl(
      ::grpc::ServerContext *context,
      const api::login::v1::GetLoginUrlRequest *request,
      api::login::v1::GetLoginUrlResponse *response) override;

  // Blocks the calling handler thread until the login attempt is terminal
  // or the client cancels the call.
  ::grpc::Status Authenticate(
      ::grpc::ServerContext *context,
      const api::login::v1::AuthenticateRequest *request,
      api::login::v1::AuthenticateResponse *response) override;
};

}  // namespace service
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_SERVICE_LOGIN_SERVICE_IMPL_H_
