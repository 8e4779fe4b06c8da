#include "chunkup/transport/http.hpp"

#include <sstream>

namespace chunkup {
namespace http {

// Converts a method string to HttpMethod enum
HttpMethod StringToHttpMethod(const std::string &methodStr) {
  if (methodStr == "GET")
    return HttpMethod::GET;
  else if (methodStr == "POST")
    return HttpMethod::POST;
  else if (methodStr == "PUT")
    return HttpMethod::PUT;
  else if (methodStr == "DELETE")
    return HttpMethod::DELETE;
  else
    return HttpMethod::INVALID;
}

// Converts HttpMethod enum to a method string
std::string HttpMethodToString(HttpMethod method) {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::POST:
    return "POST";
  case HttpMethod::PUT:
    return "PUT";
  case HttpMethod::DELETE:
    return "DELETE";
  default:
    return "INVALID";
  }
}

std::string ReasonPhrase(int status) {
  auto it = statusCode.find(status);
  return it == statusCode.end() ? "Unknown" : it->second;
}

std::string DescribeRequest(const Request &request) {
  std::ostringstream oss;
  oss << HttpMethodToString(request.method) << " " << request.path << " ("
      << request.body.size() << " bytes)";
  return oss.str();
}

bool IsTransientStatus(int status) {
  return status == 408 || status == 429 || (status >= 500 && status < 600);
}

bool IsRedirectStatus(int status) { return status == 301 || status == 302; }

Response AuthenticatedTransport::send(const Request &request) {
  Request authed = request;
  if (authed.headers.find("Authorization") == authed.headers.end()) {
    authed.headers["Authorization"] = "Bearer " + token_;
  }
  return inner_.send(authed);
}

} // namespace http
} // namespace chunkup
