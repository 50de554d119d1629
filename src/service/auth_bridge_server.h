#ifndef AUTHBRIDGE_SRC_SERVICE_AUTH_BRIDGE_SERVER_H_
#define AUTHBRIDGE_SRC_SERVICE_AUTH_BRIDGE_SERVER_H_

#include <grpcpp/grpcpp.h>

#include <boost/asio.hpp>
#include <boost/thread/thread.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "src/login/jwks_resolver.h"
#include "src/login/oidc_client.h"
#include "src/login/session_store.h"
#include "src/service/callback_http_server.h"
#include "src/service/login_service_impl.h"

namespace authbridge {
namespace service {

/**
 * Hosts the Login gRPC API, the callback HTTP server and the periodic
 * maintenance of the session store on one worker pool.
 */
class AuthBridgeServer {
 public:
  explicit AuthBridgeServer(const config::Config &config);

  ~AuthBridgeServer();

  // Serve until SIGINT or SIGTERM, then shut down.
  void Run();

  void Shutdown();

 private:
  void SchedulePeriodicCleanupTask();

  config::Config config_;
  std::string address_and_port_;

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::io_context::work> work_;
  boost::thread_group thread_pool_;
  boost::asio::signal_set signals_;

  std::chrono::seconds interval_in_seconds_;
  boost::asio::steady_timer timer_;
  std::function<void(const boost::system::error_code &ec)>
      timer_handler_function_;

  login::JwksResolverPtr jwks_resolver_;
  login::OidcClientPtr oidc_client_;
  login::SessionStorePtr session_store_;

  std::unique_ptr<LoginServiceImpl> service_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<CallbackHttpServer> callback_server_;
  bool shut_down_ = false;
};

}  // namespace service
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_SERVICE_AUTH_BRIDGE_SERVER_H_
