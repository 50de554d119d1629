#include "src/service/login_service_impl.h"

#include <grpcpp/grpcpp.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>

#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"

namespace authbridge {
namespace service {

::grpc::Status ToGrpcStatus(const absl::Status &status,
                            absl::string_view state) {
  std::string token = state.empty() ? "none" : std::string(state);
  switch (status.code()) {
    case absl::StatusCode::kOk:
      return ::grpc::Status::OK;
    case absl::StatusCode::kFailedPrecondition:
      return ::grpc::Status(::grpc::StatusCode::FAILED_PRECONDITION,
                            "no identity provider configured");
    case absl::StatusCode::kUnavailable:
      return ::grpc::Status(
          ::grpc::StatusCode::UNAVAILABLE,
          absl::StrCat("temporary error, try again (state token: ", token,
                       ")"));
    case absl::StatusCode::kDeadlineExceeded:
      return ::grpc::Status(
          ::grpc::StatusCode::DEADLINE_EXCEEDED,
          absl::StrCat("login session expired (state token: ", token, ")"));
    case absl::StatusCode::kUnauthenticated:
      return ::grpc::Status(
          ::grpc::StatusCode::UNAUTHENTICATED,
          absl::StrCat("authorization failed (state token: ", token, ")"));
    case absl::StatusCode::kCancelled:
      return ::grpc::Status(::grpc::StatusCode::CANCELLED,
                            absl::StrCat("cancelled (state token: ", token,
                                         ")"));
    case absl::StatusCode::kInvalidArgument:
      return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT,
                            "invalid request");
    default:
      return ::grpc::Status(
          ::grpc::StatusCode::INTERNAL,
          absl::StrCat("internal error (state token: ", token, ")"));
  }
}

LoginServiceImpl::LoginServiceImpl(
    std::shared_ptr<login::LoginSessionInitiator> initiator,
    std::shared_ptr<login::SessionWaiter> waiter)
    : initiator_(initiator), waiter_(waiter) {}

::grpc::Status LoginServiceImpl::GetLoginUrl(
    ::grpc::ServerContext *, const api::login::v1::GetLoginUrlRequest *,
    api::login::v1::GetLoginUrlResponse *response) {
  spdlog::trace("{}", __func__);
  try {
    auto started = initiator_->BeginLogin();
    if (!started.ok()) {
      spdlog::info("{}: login could not be started: {}", __func__,
                   started.status().ToString());
      return ToGrpcStatus(started.status(), "");
    }
    response->set_login_url(started->login_url);
    response->set_state(started->state);
    return ::grpc::Status::OK;
  } catch (const std::exception &exception) {
    spdlog::error("{}: unexpected error: {}", __func__, exception.what());
  }
  return ::grpc::Status(::grpc::StatusCode::INTERNAL, "internal error");
}

::grpc::Status LoginServiceImpl::Authenticate(
    ::grpc::ServerContext *context,
    const api::login::v1::AuthenticateRequest *request,
    api::login::v1::AuthenticateResponse *response) {
  spdlog::trace("{}", __func__);
  const std::string &state = request->state();
  if (state.empty()) {
    return ToGrpcStatus(absl::InvalidArgumentError("missing state"), state);
  }

  absl::Status result = absl::OkStatus();
  try {
    // Each call runs on its own io_context so that waiting suspends this
    // handler thread only.
    boost::asio::io_context ioc;
    boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
      auto identity = waiter_->Resolve(state, ioc, yield, [context]() {
        return context != nullptr && context->IsCancelled();
      });
      if (!identity.ok()) {
        result = identity.status();
        return;
      }
      response->set_email(identity->email);
      response->set_subject(identity->subject);
    });
    ioc.run();
  } catch (const std::exception &exception) {
    spdlog::error("{}: unexpected error: {}", __func__, exception.what());
    return ToGrpcStatus(absl::InternalError(exception.what()), state);
  }

  if (!result.ok()) {
    spdlog::info("{}: state token {} not resolved: {}", __func__, state,
                 result.ToString());
  }
  return ToGrpcStatus(result, state);
}

}  // namespace service
}  // namespace authbridge
