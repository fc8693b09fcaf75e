#pragma once

#include <string>
#include <utility>
#include <vector>

namespace sqlrag::net {

struct HttpResponse {
  long status{0};    // NOLINT(readability-identifier-naming)
  std::string body;  // NOLINT(readability-identifier-naming)
};

struct HttpPostRequest {
  std::string url;                                          // NOLINT(readability-identifier-naming)
  std::string json_body;                                    // NOLINT(readability-identifier-naming)
  std::vector<std::pair<std::string, std::string>> headers;  // NOLINT(readability-identifier-naming)
  long timeout_ms{30000};                                   // NOLINT(readability-identifier-naming)
};

// IHttpClient posts JSON and returns the raw response.
// Throws core::TransportError when no response was received (DNS, refused
// connection, timeout). Non-2xx statuses are returned, not thrown.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  [[nodiscard]] virtual HttpResponse post_json(const HttpPostRequest& request) = 0;
};

// CurlHttpClient is a libcurl easy-handle client. One handle per request; safe to
// share between threads once constructed.
class CurlHttpClient final : public IHttpClient {
 public:
  CurlHttpClient();

  [[nodiscard]] HttpResponse post_json(const HttpPostRequest& request) override;
};

// Joins a base URL and a path with exactly one '/' between them.
[[nodiscard]] std::string join_url(const std::string& base, const std::string& path);

}  // namespace sqlrag::net
