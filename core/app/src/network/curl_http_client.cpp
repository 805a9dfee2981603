#include "swapcore/network/curl_http_client.hpp"

#include "swapcore/errors/errors.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace swapcore {

namespace {

struct CurlHandleDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
struct CurlListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlList = std::unique_ptr<curl_slist, CurlListDeleter>;

std::once_flag g_curl_init_once;

std::size_t writeCallback(char* contents, std::size_t size, std::size_t nmemb,
                          void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(contents, size * nmemb);
  return size * nmemb;
}

std::string escape(CURL* handle, const std::string& text) {
  char* escaped =
      curl_easy_escape(handle, text.c_str(), static_cast<int>(text.size()));
  if (escaped == nullptr) {
    throw SwapCoreError("curl_easy_escape failed");
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

[[noreturn]] void throwTransportError(CURLcode code, const std::string& url,
                                      const char* detail) {
  std::string message = std::string(curl_easy_strerror(code));
  if (detail != nullptr && detail[0] != '\0') {
    message += " (";
    message += detail;
    message += ")";
  }
  message += " for " + url;

  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
      throw TimeoutError(message);
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_SSL_CONNECT_ERROR:
      throw ConnectionError(message);
    default:
      throw SwapCoreError(message);
  }
}

}  // namespace

void throwForStatus(const HttpResponse& response, const std::string& context) {
  const long status = response.status_code;
  if (status >= 200 && status < 300) {
    return;
  }

  std::string message =
      context + " returned HTTP " + std::to_string(status);
  if (!response.body.empty()) {
    message += ": " + response.body.substr(0, 256);
  }

  if (status == 429) {
    throw RateLimitError(message);
  }
  if (status >= 500 && status < 600) {
    throw ServerError(message, status);
  }
  throw HttpClientError(message, status);
}

CurlHttpClient::CurlHttpClient(HttpTimeouts timeouts) : timeouts_(timeouts) {
  std::call_once(g_curl_init_once,
                 [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string CurlHttpClient::buildUrl(const std::string& url,
                                     const QueryParams& params) {
  if (params.empty()) {
    return url;
  }

  CurlHandle handle(curl_easy_init());
  if (!handle) {
    throw SwapCoreError("curl_easy_init failed");
  }

  std::string full = url;
  char separator = url.find('?') == std::string::npos ? '?' : '&';
  for (const auto& [key, value] : params) {
    full += separator;
    full += escape(handle.get(), key);
    full += '=';
    full += escape(handle.get(), value);
    separator = '&';
  }
  return full;
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const QueryParams& params) {
  return perform(buildUrl(url, params), nullptr);
}

HttpResponse CurlHttpClient::postJson(const std::string& url,
                                      const nlohmann::json& body) {
  const std::string payload = body.dump();
  return perform(url, &payload);
}

// -----------------------------------------------------------------------------
// perform(): one request on a dedicated easy handle
// -----------------------------------------------------------------------------
HttpResponse CurlHttpClient::perform(const std::string& url,
                                     const std::string* post_body) {
  CurlHandle handle(curl_easy_init());
  if (!handle) {
    throw SwapCoreError("curl_easy_init failed");
  }

  CurlList headers;
  curl_slist* raw = curl_slist_append(nullptr, "Accept: application/json");
  if (post_body != nullptr) {
    raw = curl_slist_append(raw, "Content-Type: application/json");
  }
  headers.reset(raw);

  HttpResponse response;
  char error_buffer[CURL_ERROR_SIZE] = {0};

  CURL* h = handle.get();
  curl_easy_setopt(h, CURLOPT_URL, url.c_str());
  curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, timeouts_.connect_timeout_ms);
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeouts_.total_timeout_ms);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");

  if (post_body != nullptr) {
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, post_body->c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(post_body->size()));
  }

  const CURLcode code = curl_easy_perform(h);
  if (code != CURLE_OK) {
    throwTransportError(code, url, error_buffer);
  }

  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

}  // namespace swapcore
