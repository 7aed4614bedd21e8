#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace geoalloc {

  // `internal` marks failures that are not engine errors (I/O, library faults).
  enum class ErrorKind { validation, external_service, solver, capacity_exhausted, internal };

  [[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

  // Root of every error raised by the engine. subject() names the offending
  // input (point id, cluster id, worker id, column, config key) when known.
  class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& message, std::string subject = {});

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }

  private:
    ErrorKind kind_;
    std::string subject_;
  };

  // Bad input or configuration, raised before any computation starts.
  class ValidationError : public Error {
  public:
    explicit ValidationError(const std::string& message, std::string subject = {})
        : Error(ErrorKind::validation, message, std::move(subject)) {}
  };

  class ExternalServiceError : public Error {
  public:
    ExternalServiceError(std::string service, const std::string& message, int http_status,
                         bool transient, std::string subject = {});

    [[nodiscard]] const std::string& service() const noexcept { return service_; }
    [[nodiscard]] int http_status() const noexcept { return http_status_; }
    [[nodiscard]] bool transient() const noexcept { return transient_; }

  private:
    std::string service_;
    int http_status_;
    bool transient_;
  };

  class SolverError : public Error {
  public:
    SolverError(std::string stage, size_t input_size, const std::string& message,
                std::string subject = {});

    [[nodiscard]] const std::string& stage() const noexcept { return stage_; }
    [[nodiscard]] size_t input_size() const noexcept { return input_size_; }

  private:
    std::string stage_;
    size_t input_size_;
  };

  // The external graph partitioner failed; no fallback is attempted.
  class PartitionError : public SolverError {
  public:
    PartitionError(size_t input_size, const std::string& message)
        : SolverError("partition", input_size, message) {}
  };

  class CapacityExhaustionError : public Error {
  public:
    explicit CapacityExhaustionError(const std::string& point_id);

    [[nodiscard]] const std::string& point_id() const noexcept { return subject(); }
  };

}  // namespace geoalloc
