#pragma once
#include <atomic>
#include <functional>
#include <geoalloc/distance/http_client.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace geoalloc::testing {

  // Scripted HttpClient. The handler may be called from several threads.
  class FakeHttpClient : public distance::HttpClient {
  public:
    using Handler = std::function<distance::HttpResponse(const std::string& url, size_t call)>;

    explicit FakeHttpClient(Handler handler) : handler_(std::move(handler)) {}

    [[nodiscard]] distance::HttpResponse get(const std::string& url,
                                             std::chrono::milliseconds) override {
      size_t call = calls_.fetch_add(1);
      {
        std::lock_guard<std::mutex> lock(mutex_);
        urls_.push_back(url);
      }
      return handler_(url, call);
    }

    [[nodiscard]] size_t calls() const noexcept { return calls_.load(); }

    [[nodiscard]] std::vector<std::string> urls() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return urls_;
    }

  private:
    Handler handler_;
    std::atomic<size_t> calls_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> urls_;
  };

  // Coordinates of an OSRM-style URL: ".../driving/{lon,lat;...}?..."
  inline std::vector<std::pair<double, double>> osrm_coordinates(const std::string& url) {
    std::vector<std::pair<double, double>> out;
    const auto begin = url.find("/driving/") + 9;
    const auto end = url.find('?', begin);
    std::string coords = url.substr(begin, end - begin);
    size_t pos = 0;
    while (pos <= coords.size()) {
      auto next = coords.find(';', pos);
      if (next == std::string::npos) next = coords.size();
      const auto item = coords.substr(pos, next - pos);
      const auto comma = item.find(',');
      out.emplace_back(std::stod(item.substr(0, comma)), std::stod(item.substr(comma + 1)));
      pos = next + 1;
    }
    return out;
  }

  inline std::vector<size_t> osrm_indices(const std::string& url, const std::string& key) {
    std::vector<size_t> out;
    auto pos = url.find(key + "=");
    if (pos == std::string::npos) return out;
    pos += key.size() + 1;
    const auto end = url.find('&', pos);
    std::string list = url.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    size_t p = 0;
    while (p < list.size()) {
      auto next = list.find(';', p);
      if (next == std::string::npos) next = list.size();
      out.push_back(std::stoul(list.substr(p, next - p)));
      p = next + 1;
    }
    return out;
  }

}  // namespace geoalloc::testing
