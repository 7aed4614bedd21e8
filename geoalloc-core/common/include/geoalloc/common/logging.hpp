#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace geoalloc {

  // Shared "geoalloc" logger writing to stderr.
  [[nodiscard]] std::shared_ptr<spdlog::logger> logger();

  [[nodiscard]] bool is_log_level(std::string_view level) noexcept;

  // Accepts trace, debug, info, warn, error, off. Throws ValidationError otherwise.
  void set_log_level(std::string_view level);

}  // namespace geoalloc
