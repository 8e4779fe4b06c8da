#pragma once
#ifndef CHUNKUP_HTTP_HPP
#define CHUNKUP_HTTP_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace chunkup {
namespace http {

// Status codes mapping, used for log output only
const std::unordered_map<int, std::string> statusCode = {
    {200, "OK"},
    {201, "Created"},
    {204, "No Content"},
    {301, "Moved Permanently"},
    {302, "Found"},
    {400, "Bad Request"},
    {401, "Unauthorized"},
    {403, "Forbidden"},
    {404, "Not Found"},
    {408, "Request Timeout"},
    {413, "Payload Too Large"},
    {429, "Too Many Requests"},
    {500, "Internal Server Error"},
    {502, "Bad Gateway"},
    {503, "Service Unavailable"},
    {504, "Gateway Timeout"}};

enum class HttpMethod { GET, POST, PUT, DELETE, INVALID };

// Function to convert a string to HttpMethod enum
HttpMethod StringToHttpMethod(const std::string &methodStr);

// Function to convert HttpMethod enum to a string
std::string HttpMethodToString(HttpMethod method);

struct Request {
  HttpMethod method{HttpMethod::GET};
  /// Path relative to the API root, or an absolute URL.
  std::string path;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

struct Response {
  int status{0};
  std::unordered_map<std::string, std::string> headers;
  std::string body;

  bool isSuccess() const { return status >= 200 && status < 300; }
};

/// Reason phrase for @p status, or "Unknown".
std::string ReasonPhrase(int status);

/// One-line description of a request for logs ("POST /path (123 bytes)").
std::string DescribeRequest(const Request &request);

/// 408, 429 and 5xx may succeed when repeated.
bool IsTransientStatus(int status);

/// 301/302 are reported as errors and never followed.
bool IsRedirectStatus(int status);

/**
 * @brief Failure below the HTTP layer (timeouts, resets, DNS, TLS).
 */
class TransportError : public std::runtime_error {
public:
  TransportError(const std::string &message, bool transient = true)
      : std::runtime_error(message), transient_(transient) {}

  bool isTransient() const { return transient_; }

private:
  bool transient_;
};

/**
 * @brief Generic request capability consumed by the upload engine.
 *
 * Implementations must be safe to call from several threads at once; the
 * upload workers share a single instance. Non-2xx statuses are returned, not
 * thrown. Failures below HTTP throw TransportError.
 */
class Transport {
public:
  virtual ~Transport() = default;
  virtual Response send(const Request &request) = 0;
};

/**
 * @brief Decorator that attaches a bearer token to every request.
 */
class AuthenticatedTransport : public Transport {
public:
  AuthenticatedTransport(Transport &inner, std::string token)
      : inner_(inner), token_(std::move(token)) {}

  Response send(const Request &request) override;

private:
  Transport &inner_;
  std::string token_;
};

} // namespace http
} // namespace chunkup

#endif // CHUNKUP_HTTP_HPP
