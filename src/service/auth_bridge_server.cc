#include "src/service/auth_bridge_server.h"

#include <grpcpp/server_builder.h>

#include "spdlog/spdlog.h"
#include "src/common/http/http.h"
#include "src/common/session/session_string_generator.h"
#include "src/common/utilities/time_service.h"
#include "src/config/get_config.h"
#include "src/login/callback_exchanger.h"
#include "src/login/login_session_initiator.h"
#include "src/login/oidc_client_impl.h"
#include "src/login/session_waiter.h"
#include "src/login/token_response.h"
#include "src/store/coordination_store_factory.h"

namespace authbridge {
namespace service {

AuthBridgeServer::AuthBridgeServer(const config::Config &config)
    : config_(config),
      address_and_port_(fmt::format("{}:{}", config::GetListenAddress(config),
                                    config::GetListenPort(config))),
      io_context_(std::make_shared<boost::asio::io_context>()),
      signals_(*io_context_, SIGINT, SIGTERM),
      interval_in_seconds_(60),
      timer_(*io_context_, interval_in_seconds_) {
  auto store = store::GetCoordinationStoreFactory(config_)->create();
  session_store_ = std::make_shared<login::SessionStore>(store);

  if (config_.has_oidc()) {
    auto http = std::make_shared<common::http::HttpImpl>();
    jwks_resolver_ =
        login::CreateJwksResolver(config_.oidc(), http, *io_context_);
    auto parser =
        std::make_shared<login::TokenResponseParserImpl>(jwks_resolver_);
    oidc_client_ = std::make_shared<login::OidcClientImpl>(
        config_.oidc(), http, jwks_resolver_, parser);
  } else {
    spdlog::warn("{}: no identity provider configured", __func__);
  }

  auto initiator = std::make_shared<login::LoginSessionInitiator>(
      oidc_client_, session_store_,
      std::make_shared<common::session::SessionStringGenerator>(),
      config::GetSessionTtl(config_));
  auto waiter = std::make_shared<login::SessionWaiter>(
      oidc_client_, session_store_, config::GetWatchBackOffPolicy(config_),
      std::chrono::milliseconds(config::GetWatchPollInterval(config_)));
  service_ = std::make_unique<LoginServiceImpl>(initiator, waiter);

  auto exchanger =
      std::make_shared<login::CallbackExchanger>(oidc_client_, session_store_);
  callback_server_ = std::make_unique<CallbackHttpServer>(
      *io_context_, oidc_client_, exchanger,
      config::GetCallbackAddress(config_), config::GetCallbackPort(config_),
      config::GetCallbackPath(config_));

  grpc::ServerBuilder builder;
  builder.AddListeningPort(address_and_port_,
                           grpc::InsecureServerCredentials());
  builder.RegisterService(service_.get());
  server_ = builder.BuildAndStart();
  if (server_ == nullptr) {
    throw std::runtime_error(
        fmt::format("failed to listen on {}", address_and_port_));
  }
}

AuthBridgeServer::~AuthBridgeServer() { Shutdown(); }

void AuthBridgeServer::Run() {
  // Add a work object to the IO service so it will not shut down when it has
  // nothing left to do
  work_ = std::make_unique<boost::asio::io_context::work>(*io_context_);

  signals_.async_wait([this](const boost::system::error_code &ec, int signal) {
    if (ec) {
      return;
    }
    spdlog::info("{}: received signal {}", "Run", signal);
    // Unblocks Wait() below. In-flight Authenticate calls are cancelled.
    server_->Shutdown(std::chrono::system_clock::now());
  });

  SchedulePeriodicCleanupTask();

  const int threads = config::GetThreads(config_);
  for (int i = 0; i < threads; ++i) {
    thread_pool_.create_thread([this]() {
      while (true) {
        try {
          this->io_context_->run();
          break;
        } catch (std::exception &e) {
          spdlog::error("Unexpected error in worker thread: {}", e.what());
        }
      }
    });
  }

  spdlog::info("{}: Callback server listening on {}:{}{}", __func__,
               config::GetCallbackAddress(config_),
               callback_server_->getPort(), config::GetCallbackPath(config_));
  callback_server_->startAccept();

  spdlog::info("{}: Server listening on {}", __func__, address_and_port_);
  server_->Wait();

  Shutdown();
}

void AuthBridgeServer::SchedulePeriodicCleanupTask() {
  timer_handler_function_ = [this](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    spdlog::info("{}: Starting periodic cleanup (period of {} seconds)",
                 __func__, interval_in_seconds_.count());

    session_store_->RemoveAllExpired();

    // Reset the timer for some seconds in the future
    timer_.expires_at(std::chrono::steady_clock::now() + interval_in_seconds_);

    // Schedule the next invocation of this same handler on the same timer
    timer_.async_wait(timer_handler_function_);
  };

  // Schedule the first invocation of the handler on the timer
  timer_.async_wait(timer_handler_function_);
}

void AuthBridgeServer::Shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  spdlog::info("Server shutting down");

  if (server_ != nullptr) {
    server_->Shutdown(std::chrono::system_clock::now());
  }

  if (callback_server_ != nullptr) {
    callback_server_->stop();
  }

  auto dynamic_resolver =
      std::dynamic_pointer_cast<login::DynamicJwksResolverImpl>(jwks_resolver_);
  if (dynamic_resolver != nullptr) {
    dynamic_resolver->Stop();
  }

  boost::system::error_code ec;
  timer_.cancel(ec);
  signals_.cancel(ec);

  if (work_ != nullptr) {
    work_.reset();
  }

  if (io_context_ != nullptr) {
    // Stopping explicitly keeps the periodic task from being scheduled again
    // so that the worker threads can be joined.
    io_context_->stop();
  }
  thread_pool_.join_all();
}

}  // namespace service
}  // namespace authbridge
