#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace swapcore {

struct HttpResponse {
  long status_code{0};
  std::string body;
};

using QueryParams = std::map<std::string, std::string>;

// -----------------------------------------------------------------------------
// IHttpClient: transport seam for the aggregator and RPC adapters
// -----------------------------------------------------------------------------
//
// @brief  Minimal blocking HTTP interface: GET with query parameters and POST
//         with a JSON body.
//
// @details
// Implementations throw TimeoutError / ConnectionError for transport faults
// and return every HTTP response, whatever its status, as an HttpResponse.
// Status interpretation is the caller's job (see throwForStatus).
//
// Tests substitute a scripted fake; production uses CurlHttpClient.
//
// Thread-safety: implementations must allow concurrent calls.
// -----------------------------------------------------------------------------
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  virtual HttpResponse get(const std::string& url,
                           const QueryParams& params) = 0;

  virtual HttpResponse postJson(const std::string& url,
                                const nlohmann::json& body) = 0;
};

// -----------------------------------------------------------------------------
// throwForStatus(response, context)
// -----------------------------------------------------------------------------
// 2xx returns normally. Otherwise:
//   429         → RateLimitError   (transient)
//   500..599    → ServerError      (transient)
//   anything else → HttpClientError (not retried)
// `context` names the call ("quote", "swap build", ...) in the message.
// -----------------------------------------------------------------------------
void throwForStatus(const HttpResponse& response, const std::string& context);

}  // namespace swapcore
