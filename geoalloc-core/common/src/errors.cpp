#include <fmt/format.h>

#include <geoalloc/common/errors.hpp>
#include <utility>

namespace geoalloc {

  std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
      case ErrorKind::validation:
        return "validation";
      case ErrorKind::external_service:
        return "external_service";
      case ErrorKind::solver:
        return "solver";
      case ErrorKind::capacity_exhausted:
        return "capacity_exhausted";
      case ErrorKind::internal:
        return "internal";
    }
    return "unknown";
  }

  Error::Error(ErrorKind kind, const std::string& message, std::string subject)
      : std::runtime_error(message), kind_(kind), subject_(std::move(subject)) {}

  ExternalServiceError::ExternalServiceError(std::string service, const std::string& message,
                                             int http_status, bool transient, std::string subject)
      : Error(ErrorKind::external_service,
              fmt::format("{} ({}{}): {}", service, transient ? "transient" : "permanent",
                          http_status > 0 ? fmt::format(", HTTP {}", http_status) : "", message),
              std::move(subject)),
        service_(std::move(service)),
        http_status_(http_status),
        transient_(transient) {}

  SolverError::SolverError(std::string stage, size_t input_size, const std::string& message,
                           std::string subject)
      : Error(ErrorKind::solver,
              fmt::format("{} stage failed on {} points: {}", stage, input_size, message),
              std::move(subject)),
        stage_(std::move(stage)),
        input_size_(input_size) {}

  CapacityExhaustionError::CapacityExhaustionError(const std::string& point_id)
      : Error(ErrorKind::capacity_exhausted,
              fmt::format("no worker has remaining capacity for point '{}'", point_id), point_id) {}

}  // namespace geoalloc
