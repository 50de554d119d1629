#ifndef AUTHBRIDGE_SRC_COMMON_HTTP_HTTP_H_
#define AUTHBRIDGE_SRC_COMMON_HTTP_HTTP_H_

#include <boost/asio/spawn.hpp>
#include <boost/beast.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace beast = boost::beast;  // from <boost/beast.hpp>

namespace authbridge {
namespace common {
namespace http {

class Http;

typedef std::shared_ptr<Http> ptr_t;
typedef std::unique_ptr<beast::http::response<beast::http::string_body>>
    response_t;

class PathQueryFragment {
 private:
  std::string path_;
  std::string query_;
  std::string fragment_;

 public:
  explicit PathQueryFragment(absl::string_view path_query_fragment);

  inline const std::string &Path() const { return path_; }

  inline const std::string &Query() const { return query_; }

  inline bool HasQuery() const { return !query_.empty(); }

  inline const std::string &Fragment() const { return fragment_; }

  inline bool HasFragment() const { return !fragment_.empty(); }
};

class Uri {
 private:
  static const std::string https_prefix_;
  static const std::string http_prefix_;
  std::string host_;
  std::string scheme_;
  int32_t port_;
  std::string pathQueryFragmentString_;  // includes the path, query, and
                                         // fragment (if any)
  PathQueryFragment pathQueryFragment_;

 public:
  explicit Uri(absl::string_view uri);

  inline const std::string &GetScheme() const { return scheme_; }

  inline const std::string &GetHost() const { return host_; }

  inline int32_t GetPort() const { return port_; }

  inline const std::string &GetPathQueryFragment() const {
    return pathQueryFragmentString_;
  }

  inline const std::string &GetPath() const {
    return pathQueryFragment_.Path();
  }

  inline const std::string &GetQuery() const {
    return pathQueryFragment_.Query();
  }

  inline bool HasQuery() const { return pathQueryFragment_.HasQuery(); };

  inline bool HasFragment() const { return pathQueryFragment_.HasFragment(); };
};

class Http {
 public:
  /**
   *
   * encode the given url for use e.g. in an http query field.
   *
   * @param url the url to encode.
   * @return the encoded url.
   */
  static std::string UrlSafeEncode(absl::string_view url);

  /**
   *
   * decode the given url
   *
   * @param url the url to decode.
   * @return the decoded url.
   */
  static absl::optional<std::string> UrlSafeDecode(absl::string_view url);

  /** @brief encode query data.
   *
   * @param data the data to encode.
   * @return the encoded data.
   */
  static std::string EncodeQueryData(
      const std::multimap<absl::string_view, absl::string_view> &data);

  /**
   * @brief decode query data.
   *
   * @param query the query to be decoded
   * @return the decoded query
   */
  static absl::optional<std::multimap<std::string, std::string>>
  DecodeQueryData(absl::string_view query);

  /** @brief encode form data.
   *
   * @param data the data to encode.
   * @return the encoded data.
   */
  static std::string EncodeFormData(
      const std::multimap<absl::string_view, absl::string_view> &data);

  /** @brief Encode basic auth parameters for use in an authorization header.
   *
   * Encode basic auth parameters for use in an authorization header as defined
   * in https://tools.ietf.org/html/rfc7617.
   *
   * @param username the username to encode
   * @param password the password to encode
   * @return the encoded username and password
   */
  static std::string EncodeBasicAuth(absl::string_view username,
                                     absl::string_view password);

  /** @brief Encode a bearer credential for use in an authorization header.
   *
   * See https://tools.ietf.org/html/rfc6750#section-2.1.
   */
  static std::string EncodeBearer(absl::string_view token);

  /**
   * Virtual destructor
   */
  virtual ~Http() = default;

  /** @brief Asynchronously send a Post http message with a certificate
   * authority. To be used inside a Boost co-routine.
   * @param uri the https uri to call
   * @param headers the http headers
   * @param body the http request body
   * @param ca_cert the ca cert to be trusted in the http call
   * @return http response, or null on a transport error.
   */
  virtual response_t Post(
      absl::string_view uri,
      const std::map<absl::string_view, absl::string_view> &headers,
      absl::string_view body, absl::string_view ca_cert,
      boost::asio::io_context &ioc,
      boost::asio::yield_context yield) const = 0;

  /** @brief Asynchronously send a Get http message with a certificate
   * authority. To be used inside a Boost co-routine.
   * @param uri the https uri to call
   * @param headers the http headers
   * @param ca_cert the ca cert to be trusted in the http call
   * @return http response, or null on a transport error.
   */
  virtual response_t Get(
      absl::string_view uri,
      const std::map<absl::string_view, absl::string_view> &headers,
      absl::string_view ca_cert, boost::asio::io_context &ioc,
      boost::asio::yield_context yield) const = 0;

  /** @brief Asynchronously send a non-SSL Get http message.
   * To be used inside a Boost co-routine.
   * @param uri the http uri to call
   * @param headers the http headers
   * @return http response, or null on a transport error.
   */
  virtual response_t SimpleGet(
      absl::string_view uri,
      const std::map<absl::string_view, absl::string_view> &headers,
      boost::asio::io_context &ioc,
      boost::asio::yield_context yield) const = 0;
};

/**
 * HTTP request implementation
 */
class HttpImpl : public Http {
 private:
  response_t SecureRequest(
      beast::http::verb method, absl::string_view uri,
      const std::map<absl::string_view, absl::string_view> &headers,
      absl::string_view body, absl::string_view ca_cert,
      boost::asio::io_context &ioc, boost::asio::yield_context yield) const;

 public:
  response_t Post(absl::string_view uri,
                  const std::map<absl::string_view, absl::string_view> &headers,
                  absl::string_view body, absl::string_view ca_cert,
                  boost::asio::io_context &ioc,
                  boost::asio::yield_context yield) const override;

  response_t Get(absl::string_view uri,
                 const std::map<absl::string_view, absl::string_view> &headers,
                 absl::string_view ca_cert, boost::asio::io_context &ioc,
                 boost::asio::yield_context yield) const override;

  response_t SimpleGet(
      absl::string_view uri,
      const std::map<absl::string_view, absl::string_view> &headers,
      boost::asio::io_context &ioc,
      boost::asio::yield_context yield) const override;
};

}  // namespace http
}  // namespace common
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_COMMON_HTTP_HTTP_H_
