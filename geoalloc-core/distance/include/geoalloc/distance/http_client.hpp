#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace geoalloc::distance {

  struct HttpResponse {
    long status = 0;
    std::string body;
  };

  // Blocking GET. Transport failures throw ExternalServiceError; a response
  // with any status code is returned as-is.
  class HttpClient {
  public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual HttpResponse get(const std::string& url,
                                           std::chrono::milliseconds timeout)
        = 0;
  };

  // libcurl client. Throws ValidationError when built without libcurl.
  [[nodiscard]] std::shared_ptr<HttpClient> create_http_client();

  // 2xx passes. 408, 429 and 5xx are transient, every other status permanent.
  void check_http_status(std::string_view service, const HttpResponse& response);

}  // namespace geoalloc::distance
