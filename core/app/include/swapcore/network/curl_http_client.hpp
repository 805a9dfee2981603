#pragma once

#include "swapcore/network/http_client.hpp"

#include <string>

namespace swapcore {

struct HttpTimeouts {
  long connect_timeout_ms{5000};
  long total_timeout_ms{15000};
};

// -----------------------------------------------------------------------------
// CurlHttpClient: libcurl implementation of IHttpClient
// -----------------------------------------------------------------------------
//
// @brief  Performs each request on a fresh easy handle.
//
// @details
// A fresh handle per request keeps the client free of shared mutable state,
// so concurrent trade executions (a dry run next to a live trade that
// is polling) can use one instance without locking. curl_global_init() runs
// once per process on first construction.
//
// Error mapping of CURLcode:
//   CURLE_OPERATION_TIMEDOUT                         → TimeoutError
//   COULDNT_CONNECT, COULDNT_RESOLVE_HOST/PROXY,
//   SEND_ERROR, RECV_ERROR, GOT_NOTHING,
//   SSL_CONNECT_ERROR                                → ConnectionError
//   anything else                                    → SwapCoreError
//
// TLS peer and host verification stay on.
// -----------------------------------------------------------------------------
class CurlHttpClient final : public IHttpClient {
 public:
  explicit CurlHttpClient(HttpTimeouts timeouts = {});

  HttpResponse get(const std::string& url, const QueryParams& params) override;

  HttpResponse postJson(const std::string& url,
                        const nlohmann::json& body) override;

  // url + "?" + k1=v1&k2=v2 with keys and values percent-encoded. Returns url
  // unchanged when params is empty.
  static std::string buildUrl(const std::string& url, const QueryParams& params);

 private:
  HttpResponse perform(const std::string& url, const std::string* post_body);

  HttpTimeouts timeouts_;
};

}  // namespace swapcore
