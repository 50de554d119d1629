#include "src/service/callback_http_server.h"

#include "spdlog/spdlog.h"
#include "src/common/http/headers.h"
#include "src/common/http/http.h"

namespace authbridge {
namespace service {
namespace {
const char* kHealthCheckPath = "/healthz";
const char* kCodeParameter = "code";
const char* kStateParameter = "state";

std::string FindParameter(const std::multimap<std::string, std::string>& query,
                          const char* name) {
  auto found = query.find(name);
  return found == query.end() ? "" : found->second;
}
}  // namespace

CallbackHttpConnection::CallbackHttpConnection(CallbackHttpServer& parent,
                                               tcp::socket sock)
    : parent_(parent), sock_(std::move(sock)) {}

void CallbackHttpConnection::start() {
  auto self = shared_from_this();
  http::async_read(sock_, read_buffer_, request_,
                   [self](beast::error_code ec, std::size_t) {
                     if (!ec) {
                       self->onReadDone();
                     } else {
                       beast::error_code close_ec;
                       self->sock_.close(close_ec);
                     }
                   });
}

void CallbackHttpConnection::onReadDone() {
  auto self = shared_from_this();
  boost::asio::spawn(parent_.ioc(), [self](boost::asio::yield_context yield) {
    self->response_.version(self->request_.version());
    self->response_.keep_alive(false);
    try {
      self->parent_.handleRequest(self->request_, self->response_, yield);
    } catch (const std::exception& e) {
      spdlog::error("{}: unexpected error: {}", "onReadDone", e.what());
      self->response_.result(http::status::internal_server_error);
      self->response_.body() = "internal error";
    }
    self->response_.prepare_payload();
    self->startWrite();
  });
}

void CallbackHttpConnection::startWrite() {
  auto self = shared_from_this();
  http::async_write(sock_, response_,
                    [self](beast::error_code ec, std::size_t) {
                      beast::error_code close_ec;
                      self->sock_.shutdown(tcp::socket::shutdown_send,
                                           close_ec);
                      self->sock_.close(close_ec);
                      if (ec) {
                        spdlog::debug("{}: write failed: {}", "startWrite",
                                      ec.message());
                      }
                    });
}

CallbackHttpServer::CallbackHttpServer(
    boost::asio::io_context& ioc, login::OidcClientPtr oidc_client,
    std::shared_ptr<login::CallbackExchanger> exchanger,
    const std::string& address, uint16_t port, std::string callback_path)
    : ioc_(ioc),
      oidc_client_(oidc_client),
      exchanger_(exchanger),
      callback_path_(std::move(callback_path)),
      acceptor_(ioc, {boost::asio::ip::make_address(address), port}) {}

CallbackHttpServer::~CallbackHttpServer() { stop(); }

void CallbackHttpServer::stop() {
  beast::error_code ec;
  acceptor_.close(ec);
}

void CallbackHttpServer::startAccept() {
  acceptor_.async_accept([this](beast::error_code ec, tcp::socket sock) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (!ec) {
      std::make_shared<CallbackHttpConnection>(*this, std::move(sock))
          ->start();
    }
    startAccept();
  });
}

void CallbackHttpServer::handleRequest(
    const http::request<http::string_body>& request,
    http::response<http::string_body>& response,
    boost::asio::yield_context yield) {
  response.set(http::field::content_type,
               common::http::headers::ContentTypeDirectives::TextPlain);
  response.set(http::field::cache_control,
               common::http::headers::CacheControlDirectives::NoCache);

  auto target = std::string(request.target());
  common::http::PathQueryFragment path_query_fragment(target);

  if (request.method() != http::verb::get) {
    response.result(http::status::bad_request);
    return;
  }

  if (path_query_fragment.Path() == kHealthCheckPath) {
    if (oidc_client_ != nullptr && !oidc_client_->JwksActive()) {
      spdlog::warn("{}: JWKS is not ready", __func__);
      response.result(http::status::not_found);
      return;
    }
    response.result(http::status::ok);
    return;
  }

  if (path_query_fragment.Path() != callback_path_) {
    response.result(http::status::bad_request);
    return;
  }

  if (oidc_client_ == nullptr) {
    response.result(http::status::conflict);
    response.body() = "no identity provider configured";
    return;
  }

  auto query =
      common::http::Http::DecodeQueryData(path_query_fragment.Query());
  if (!query.has_value()) {
    spdlog::info("{}: callback query could not be decoded", __func__);
    response.result(http::status::bad_request);
    response.body() = "malformed query";
    return;
  }

  auto result = exchanger_->HandleCallback(FindParameter(*query, kCodeParameter),
                                           FindParameter(*query, kStateParameter),
                                           ioc_, yield);
  response.result(result.status);
  response.body() = result.body;
}

}  // namespace service
}  // namespace authbridge
