#include <fmt/format.h>

#include <geoalloc/common/errors.hpp>
#include <geoalloc/distance/http_client.hpp>
#include <string>

#ifdef GEOALLOC_HAS_CURL
#  include <curl/curl.h>

#  include <mutex>
#endif

namespace geoalloc::distance {

  void check_http_status(std::string_view service, const HttpResponse& response) {
    const long status = response.status;
    if (status >= 200 && status < 300) return;

    const bool transient = status == 408 || status == 429 || (status >= 500 && status < 600);
    std::string excerpt = response.body.substr(0, 200);
    throw ExternalServiceError(std::string(service),
                               excerpt.empty() ? "request failed" : excerpt,
                               static_cast<int>(status), transient);
  }

#ifdef GEOALLOC_HAS_CURL

  namespace {

    size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
      auto* body = static_cast<std::string*>(userdata);
      body->append(ptr, size * nmemb);
      return size * nmemb;
    }

    bool is_transient(CURLcode code) noexcept {
      switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
          return true;
        default:
          return false;
      }
    }

  }  // namespace

  // =============================================================================
  // libcurl client
  // =============================================================================

  class CurlHttpClient : public HttpClient {
  public:
    CurlHttpClient() {
      static std::once_flag init_flag;
      std::call_once(init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    [[nodiscard]] HttpResponse get(const std::string& url,
                                   std::chrono::milliseconds timeout) override {
      std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                               &curl_easy_cleanup);
      if (!curl) [[unlikely]] {
        throw ExternalServiceError("http", "curl_easy_init failed", 0, false);
      }

      HttpResponse response;
      curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
      curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
      curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
      curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
      curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
      curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "geoalloc/1.0");

      const CURLcode res = curl_easy_perform(curl.get());
      if (res != CURLE_OK) {
        throw ExternalServiceError("http", curl_easy_strerror(res), 0, is_transient(res));
      }
      curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
      return response;
    }
  };

  std::shared_ptr<HttpClient> create_http_client() { return std::make_shared<CurlHttpClient>(); }

#else

  std::shared_ptr<HttpClient> create_http_client() {
    throw ValidationError("HTTP client not compiled; rebuild with libcurl for external metrics",
                          "distance");
  }

#endif

}  // namespace geoalloc::distance
