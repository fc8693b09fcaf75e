#include "sqlrag/core/errors.h"
#include "sqlrag/net/http_client.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace sqlrag::net {

namespace {

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
  const size_t total = size * nmemb;
  auto* buffer = static_cast<std::string*>(userp);
  buffer->append(static_cast<char*>(contents), total);
  return total;
}

struct CurlDeleter {
  void operator()(CURL* curl) const {
    if (curl != nullptr) {
      curl_easy_cleanup(curl);
    }
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::once_flag g_curl_init_once;

}  // namespace

CurlHttpClient::CurlHttpClient() {
  std::call_once(g_curl_init_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::post_json(const HttpPostRequest& request) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw core::TransportError("curl_easy_init failed");
  }

  curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  for (const auto& [name, value] : request.headers) {
    const std::string line = name + ": " + value;
    raw_headers = curl_slist_append(raw_headers, line.c_str());
  }
  std::unique_ptr<curl_slist, HeaderListDeleter> headers(raw_headers);

  std::string buffer;
  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.json_body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.json_body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, request.timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    throw core::TransportError("POST " + request.url + " failed: " + curl_easy_strerror(code));
  }

  HttpResponse response;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  response.body = std::move(buffer);
  return response;
}

std::string join_url(const std::string& base, const std::string& path) {
  std::string left = base;
  while (!left.empty() && left.back() == '/') {
    left.pop_back();
  }
  std::string right = path;
  while (!right.empty() && right.front() == '/') {
    right.erase(right.begin());
  }
  return left + "/" + right;
}

}  // namespace sqlrag::net
