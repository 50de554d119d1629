#include "src/common/http/http.h"

#include <boost/algorithm/string.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/ssl.hpp>
#include <algorithm>
#include <sstream>

#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "spdlog/spdlog.h"

namespace beast = boost::beast;    // from <boost/beast.hpp>
namespace net = boost::asio;       // from <boost/asio.hpp>
namespace ssl = boost::asio::ssl;  // from <boost/asio/ssl.hpp>
using tcp = boost::asio::ip::tcp;  // from <boost/asio/ip/tcp.hpp>

namespace authbridge {
namespace common {
namespace http {
namespace {
const char forward_alphabet[] = {
    '0', '1', '2', '3', '4', '5', '6', '7',
    '8', '9', 'A', 'B', 'C', 'D', 'E', 'F',
};
const uint8_t reverse_alphabet[] = {
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
    255, 255, 255, 0,   1,   2,   3,   4,   5,   6,   7,   8,   9,   255, 255,
    255, 255, 255, 255, 255, 10,  11,  12,  13,  14,  15,  255, 255, 255, 255,
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
    255, 255, 255, 255, 255, 255, 255, 10,  11,  12,  13,  14,  15,  255, 255,
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255,
    255, 255, 255, 255, 255, 255, 255, 255,
};

typedef bool (*SafeCharacterFunc)(const char);

bool IsUrlSafeCharacter(const char character) {
  return ((character >= 'A' && character <= 'Z') ||
          (character >= 'a' && character <= 'z') ||
          (character >= '0' && character <= '9') || (character == '-') ||
          (character == '_') || (character == '.') || (character == '~'));
}

bool IsFormDataSafeCharacter(const char character) {
  return IsUrlSafeCharacter(character) || (character == '+');
}

std::string SafeEncode(absl::string_view in, SafeCharacterFunc IsSafe) {
  std::stringstream builder;
  for (auto character : in) {
    // unreserved characters: see https://www.ietf.org/rfc/rfc3986.txt
    if (IsSafe(character)) {
      builder << character;
    } else {
      builder << '%' << forward_alphabet[(character & 0xf0u) >> 4u]
              << forward_alphabet[character & 0x0fu];
    }
  }
  return builder.str();
}

absl::optional<std::string> SafeDecode(absl::string_view in,
                                       SafeCharacterFunc IsSafe) {
  std::stringstream builder;
  auto iter = in.cbegin();
  while (iter != in.cend()) {
    char character = *iter;
    if (IsSafe(character)) {
      builder << character;
    } else {
      // Must be percent encoding.
      if (character != '%') {
        return absl::nullopt;
      }
      auto first = ++iter;
      if (first == in.cend() || (*first & 0x80)) {
        return absl::nullopt;
      }
      auto second = ++iter;
      if (second == in.cend() || (*second & 0x80)) {
        return absl::nullopt;
      }
      auto top_nibble = reverse_alphabet[uint8_t(*first) & 0x7fu];
      auto bottom_nibble = reverse_alphabet[uint8_t(*second) & 0x7fu];
      if ((top_nibble == 255) || (bottom_nibble == 255)) {
        return absl::nullopt;
      }
      builder << char(((top_nibble << 4u) | bottom_nibble));
    }
    iter++;
  }
  return builder.str();
}

}  // namespace

std::string Http::UrlSafeEncode(absl::string_view url) {
  return SafeEncode(url, IsUrlSafeCharacter);
}

absl::optional<std::string> Http::UrlSafeDecode(absl::string_view url) {
  return SafeDecode(url, IsUrlSafeCharacter);
}

std::string Http::EncodeQueryData(
    const std::multimap<absl::string_view, absl::string_view> &data) {
  std::stringstream builder;
  auto pair = data.cbegin();
  while (pair != data.cend()) {
    builder << SafeEncode(pair->first, IsUrlSafeCharacter) << '='
            << SafeEncode(pair->second, IsUrlSafeCharacter);
    if (++pair != data.cend()) {
      builder << "&";
    }
  }
  return builder.str();
}

absl::optional<std::multimap<std::string, std::string>> Http::DecodeQueryData(
    absl::string_view query) {
  std::multimap<std::string, std::string> result;
  if (query.empty()) {
    return result;
  }
  std::vector<std::string> parts;
  boost::split(parts, query, boost::is_any_of("&"));
  for (const auto &part : parts) {
    std::vector<std::string> pair;
    boost::split(pair, part, boost::is_any_of("="));
    if (pair.size() != 2) {
      return absl::nullopt;
    }
    // Browsers encode spaces in query strings as '+'.
    auto escaped_key = SafeDecode(absl::StrReplaceAll(pair[0], {{"+", "%20"}}),
                                  IsUrlSafeCharacter);
    if (!escaped_key.has_value()) {
      return absl::nullopt;
    }
    auto escaped_value = SafeDecode(
        absl::StrReplaceAll(pair[1], {{"+", "%20"}}), IsUrlSafeCharacter);
    if (!escaped_value.has_value()) {
      return absl::nullopt;
    }
    result.insert(std::make_pair(*escaped_key, *escaped_value));
  }
  return result;
}

std::string Http::EncodeFormData(
    const std::multimap<absl::string_view, absl::string_view> &data) {
  std::stringstream builder;
  auto pair = data.cbegin();
  while (pair != data.cend()) {
    std::string key(pair->first);
    std::replace(key.begin(), key.end(), ' ', '+');
    std::string value(pair->second);
    std::replace(value.begin(), value.end(), ' ', '+');
    builder << SafeEncode(key, IsFormDataSafeCharacter) << '='
            << SafeEncode(value, IsFormDataSafeCharacter);
    if (++pair != data.end()) {
      builder << "&";
    }
  }
  return builder.str();
}

std::string Http::EncodeBasicAuth(absl::string_view username,
                                  absl::string_view password) {
  return absl::StrCat(
      "Basic", " ", absl::Base64Escape(absl::StrCat(username, ":", password)));
}

std::string Http::EncodeBearer(absl::string_view token) {
  return absl::StrCat("Bearer", " ", token);
}

const std::string Uri::https_prefix_ = "https://";
const std::string Uri::http_prefix_ = "http://";

Uri::Uri(absl::string_view uri) : pathQueryFragment_("/") {
  absl::string_view uri_without_scheme;
  if (absl::StartsWith(uri, https_prefix_)) {
    scheme_ = "https";
    port_ = 443;
    uri_without_scheme = uri.substr(https_prefix_.length());
  } else if (absl::StartsWith(uri, http_prefix_)) {
    scheme_ = "http";
    port_ = 80;
    uri_without_scheme = uri.substr(http_prefix_.length());
  } else {
    throw std::runtime_error(
        absl::StrCat("uri must be http or https scheme: ", uri));
  }
  if (uri_without_scheme.empty()) {
    throw std::runtime_error(absl::StrCat("no host in uri: ", uri));
  }

  auto end_of_host_and_port = uri_without_scheme.find_first_of("/?#");
  if (end_of_host_and_port == absl::string_view::npos) {
    end_of_host_and_port = uri_without_scheme.length();
  }
  std::string host_and_port(uri_without_scheme.substr(0, end_of_host_and_port));
  pathQueryFragmentString_ =
      std::string(uri_without_scheme.substr(end_of_host_and_port));
  if (!absl::StartsWith(pathQueryFragmentString_, "/")) {
    pathQueryFragmentString_ = "/" + pathQueryFragmentString_;
  }
  pathQueryFragment_ = http::PathQueryFragment(pathQueryFragmentString_);

  auto colon_position = host_and_port.find(':');
  if (colon_position == 0 || host_and_port.empty()) {
    throw std::runtime_error(absl::StrCat("no host in uri: ", uri));
  }
  if (colon_position != std::string::npos) {
    auto port = host_and_port.substr(colon_position + 1);
    try {
      port_ = std::stoi(port);
    } catch (const std::exception &e) {
      throw std::runtime_error(absl::StrCat("port not valid in uri: ", uri));
    }
    if (port_ > 65535 || port_ < 0) {
      throw std::runtime_error(
          absl::StrCat("port value must be between 0 and 65535: ", uri));
    }
    host_ = host_and_port.substr(0, colon_position);
  } else {
    host_ = host_and_port;
  }
}

PathQueryFragment::PathQueryFragment(absl::string_view path_query_fragment) {
  // See https://tools.ietf.org/html/rfc3986#section-3.4 and
  // https://tools.ietf.org/html/rfc3986#section-3.5
  auto question_mark_position = path_query_fragment.find('?');
  auto hashtag_position = path_query_fragment.find('#');
  if (question_mark_position != absl::string_view::npos &&
      hashtag_position != absl::string_view::npos &&
      hashtag_position < question_mark_position) {
    // A '?' inside the fragment does not start a query.
    question_mark_position = absl::string_view::npos;
  }
  auto end_of_path = std::min(question_mark_position, hashtag_position);
  path_ = std::string(path_query_fragment.substr(0, end_of_path));
  if (question_mark_position != absl::string_view::npos) {
    auto query_length = hashtag_position == absl::string_view::npos
                            ? absl::string_view::npos
                            : hashtag_position - question_mark_position - 1;
    query_ = std::string(
        path_query_fragment.substr(question_mark_position + 1, query_length));
  }
  if (hashtag_position != absl::string_view::npos) {
    fragment_ = std::string(path_query_fragment.substr(hashtag_position + 1));
  }
}

response_t HttpImpl::Post(
    absl::string_view uri,
    const std::map<absl::string_view, absl::string_view> &headers,
    absl::string_view body, absl::string_view ca_cert,
    boost::asio::io_context &ioc, boost::asio::yield_context yield) const {
  return SecureRequest(beast::http::verb::post, uri, headers, body, ca_cert,
                       ioc, yield);
}

response_t HttpImpl::Get(
    absl::string_view uri,
    const std::map<absl::string_view, absl::string_view> &headers,
    absl::string_view ca_cert, boost::asio::io_context &ioc,
    boost::asio::yield_context yield) const {
  return SecureRequest(beast::http::verb::get, uri, headers, "", ca_cert, ioc,
                       yield);
}

response_t HttpImpl::SecureRequest(
    beast::http::verb method, absl::string_view uri,
    const std::map<absl::string_view, absl::string_view> &headers,
    absl::string_view body, absl::string_view ca_cert,
    boost::asio::io_context &ioc, boost::asio::yield_context yield) const {
  spdlog::trace("{}", __func__);
  try {
    int version = 11;

    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_verify_mode(ssl::verify_peer);
    ctx.set_default_verify_paths();

    if (!ca_cert.empty()) {
      spdlog::info("{}: Trusting the provided certificate authority", __func__);
      beast::error_code ca_ec;
      ctx.add_certificate_authority(
          boost::asio::buffer(ca_cert.data(), ca_cert.size()), ca_ec);
      if (ca_ec) {
        throw boost::system::system_error{ca_ec};
      }
    }

    auto parsed_uri = http::Uri(uri);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                  parsed_uri.GetHost().c_str())) {
      throw boost::system::system_error{
          boost::system::error_code{static_cast<int>(::ERR_get_error()),
                                    boost::asio::error::get_ssl_category()}};
    }
    const auto results = resolver.async_resolve(
        parsed_uri.GetHost(), std::to_string(parsed_uri.GetPort()), yield);
    beast::get_lowest_layer(stream).async_connect(results, yield);
    stream.async_handshake(ssl::stream_base::client, yield);

    beast::http::request<beast::http::string_body> req{
        method, parsed_uri.GetPathQueryFragment(), version};
    req.set(beast::http::field::host, parsed_uri.GetHost());
    for (const auto &header : headers) {
      req.set(boost::beast::string_view(header.first.data(),
                                        header.first.size()),
              boost::beast::string_view(header.second.data(),
                                        header.second.size()));
    }
    if (method == beast::http::verb::post) {
      auto &req_body = req.body();
      req_body.reserve(body.size());
      req_body.append(body.begin(), body.end());
      req.prepare_payload();
    }
    beast::http::async_write(stream, req, yield);

    beast::flat_buffer buffer;
    response_t res(new beast::http::response<beast::http::string_body>);
    beast::http::async_read(stream, buffer, *res, yield);

    // Receive an error code instead of throwing an exception if this fails,
    // so we can ignore some expected not_connected errors.
    boost::system::error_code ec;
    stream.async_shutdown(yield[ec]);

    if (ec && ec != beast::errc::not_connected) {
      // stream_truncated is ignored, see
      // https://github.com/boostorg/beast/issues/824
      if (ca_cert.empty() || ec != boost::asio::ssl::error::stream_truncated) {
        spdlog::info("{}: HTTP error encountered: {}", __func__, ec.message());
        return response_t();
      }
    }

    return res;
  } catch (std::exception const &e) {
    spdlog::info("{}: unexpected exception: {}", __func__, e.what());
    return response_t();
  }
}

response_t HttpImpl::SimpleGet(
    absl::string_view uri,
    const std::map<absl::string_view, absl::string_view> &headers,
    boost::asio::io_context &ioc, boost::asio::yield_context yield) const {
  spdlog::trace("{}", __func__);
  try {
    int version = 11;
    auto parsed_uri = http::Uri(uri);

    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    const auto results = resolver.async_resolve(
        parsed_uri.GetHost(), std::to_string(parsed_uri.GetPort()), yield);
    stream.async_connect(results, yield);

    beast::http::request<beast::http::string_body> req{
        beast::http::verb::get, parsed_uri.GetPathQueryFragment(), version};
    req.set(beast::http::field::host, parsed_uri.GetHost());
    for (const auto &header : headers) {
      req.set(boost::beast::string_view(header.first.data(),
                                        header.first.size()),
              boost::beast::string_view(header.second.data(),
                                        header.second.size()));
    }
    beast::http::async_write(stream, req, yield);

    beast::flat_buffer buffer;
    response_t res(new beast::http::response<beast::http::string_body>);
    beast::http::async_read(stream, buffer, *res, yield);

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
      spdlog::info("{}: HTTP error encountered: {}", __func__, ec.message());
      return response_t();
    }
    return res;
  } catch (std::exception const &e) {
    spdlog::info("{}: unexpected exception: {}", __func__, e.what());
    return response_t();
  }
}

}  // namespace http
}  // namespace common
}  // namespace authbridge
