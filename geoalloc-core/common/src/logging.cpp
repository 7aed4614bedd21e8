#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/logging.hpp>
#include <string>
#include <utility>

namespace geoalloc {

  namespace {

    constexpr const char* kLoggerName = "geoalloc";

    constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 6> kLevels{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"off", spdlog::level::off},
    }};

  }  // namespace

  std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
      if (auto existing = spdlog::get(kLoggerName)) return existing;
      auto created = spdlog::stderr_color_mt(kLoggerName);
      created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      created->set_level(spdlog::level::warn);
      return created;
    }();
    return instance;
  }

  bool is_log_level(std::string_view level) noexcept {
    for (const auto& [name, _] : kLevels) {
      if (name == level) return true;
    }
    return false;
  }

  void set_log_level(std::string_view level) {
    for (const auto& [name, value] : kLevels) {
      if (name == level) {
        logger()->set_level(value);
        return;
      }
    }
    throw ValidationError("unknown log level '" + std::string(level) + "'", "log_level");
  }

}  // namespace geoalloc
