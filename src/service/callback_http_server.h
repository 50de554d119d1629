#ifndef AUTHBRIDGE_SRC_SERVICE_CALLBACK_HTTP_SERVER_H_
#define AUTHBRIDGE_SRC_SERVICE_CALLBACK_HTTP_SERVER_H_

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <string>

#include "src/login/callback_exchanger.h"
#include "src/login/oidc_client.h"

namespace authbridge {
namespace service {

namespace beast = boost::beast;    // from <boost/beast.hpp>
namespace http = beast::http;      // from <boost/beast/http.hpp>
using tcp = boost::asio::ip::tcp;  // from <boost/asio/ip/tcp.hpp>

class CallbackHttpServer;

/**
 * A single HTTP request/response exchange with a browser or a probe.
 */
class CallbackHttpConnection
    : public std::enable_shared_from_this<CallbackHttpConnection> {
 public:
  CallbackHttpConnection(CallbackHttpServer& parent, tcp::socket sock);

  void start();

 private:
  void onReadDone();
  void startWrite();

  CallbackHttpServer& parent_;
  tcp::socket sock_;
  http::request<http::string_body> request_;
  http::response<http::string_body> response_;
  beast::flat_buffer read_buffer_{8192};
};

/**
 * Serves the identity provider's redirect target and the health check.
 */
class CallbackHttpServer {
 public:
  /**
   * @param oidc_client the identity provider, null when none is configured.
   * @param callback_path the path of the redirect target.
   */
  CallbackHttpServer(boost::asio::io_context& ioc,
                     login::OidcClientPtr oidc_client,
                     std::shared_ptr<login::CallbackExchanger> exchanger,
                     const std::string& address, uint16_t port,
                     std::string callback_path);

  ~CallbackHttpServer();

  int getPort() const { return acceptor_.local_endpoint().port(); }

  void startAccept();

  void stop();

  /**
   * Produce the response to a request. To be used inside a Boost co-routine.
   */
  void handleRequest(const http::request<http::string_body>& request,
                     http::response<http::string_body>& response,
                     boost::asio::yield_context yield);

  boost::asio::io_context& ioc() { return ioc_; }

 private:
  boost::asio::io_context& ioc_;
  login::OidcClientPtr oidc_client_;
  std::shared_ptr<login::CallbackExchanger> exchanger_;
  const std::string callback_path_;
  tcp::acceptor acceptor_;
};

}  // namespace service
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_SERVICE_CALLBACK_HTTP_SERVER_H_
