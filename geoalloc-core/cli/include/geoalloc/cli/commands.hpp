#pragma once
#include <cxxopts.hpp>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/engine/config.hpp>
#include <geoalloc/engine/engine.hpp>

namespace geoalloc::cli {

  // 0 success, 2 validation, 3 external service, 4 solver, 5 capacity exhausted, 1 otherwise.
  inline constexpr int EXIT_OK = 0;
  inline constexpr int EXIT_OTHER = 1;

  [[nodiscard]] int exit_code(ErrorKind kind) noexcept;

  [[nodiscard]] cxxopts::Options make_options();

  // Loads --config when given, then applies every flag on top of it.
  [[nodiscard]] engine::EngineConfig build_config(const cxxopts::ParseResult& result);

  // Parses argv, runs the command and returns the process exit code. Errors
  // are reported on stderr.
  [[nodiscard]] int run_cli(int argc, const char* const* argv);

}  // namespace geoalloc::cli
