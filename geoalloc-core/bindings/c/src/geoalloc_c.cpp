#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <exception>
#include <geoalloc/engine/engine.hpp>
#include <new>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "geoalloc.h"

using geoalloc::engine::Engine;
using geoalloc::engine::EngineError;

namespace {

  thread_local std::string last_error;
  thread_local std::string last_error_subject;
  thread_local GeoallocErrorCode last_error_code = GEOALLOC_OK;

  GeoallocErrorCode code_of(geoalloc::ErrorKind kind) {
    switch (kind) {
      case geoalloc::ErrorKind::validation:
        return GEOALLOC_ERROR_VALIDATION;
      case geoalloc::ErrorKind::external_service:
        return GEOALLOC_ERROR_EXTERNAL_SERVICE;
      case geoalloc::ErrorKind::solver:
        return GEOALLOC_ERROR_SOLVER;
      case geoalloc::ErrorKind::capacity_exhausted:
        return GEOALLOC_ERROR_CAPACITY_EXHAUSTED;
      case geoalloc::ErrorKind::internal:
        return GEOALLOC_ERROR_INTERNAL;
    }
    return GEOALLOC_ERROR_INTERNAL;
  }

  void report(GeoallocErrorCode* error_out, GeoallocErrorCode code, std::string message,
              std::string subject = {}) {
    last_error = std::move(message);
    last_error_subject = std::move(subject);
    last_error_code = code;
    if (error_out) *error_out = code;
  }

  void report(GeoallocErrorCode* error_out, const EngineError& error) {
    report(error_out, code_of(error.kind), error.message, error.subject);
  }

  void clear(GeoallocErrorCode* error_out) {
    last_error.clear();
    last_error_subject.clear();
    last_error_code = GEOALLOC_OK;
    if (error_out) *error_out = GEOALLOC_OK;
  }

  // Point ids are the decimal input indices so rows map back without a lookup.
  std::vector<geoalloc::Point> points_of(const double* coordinates, size_t n) {
    std::vector<geoalloc::Point> points(n);
    for (size_t i = 0; i < n; ++i) {
      points[i].id = std::to_string(i);
      points[i].longitude = coordinates[2 * i];
      points[i].latitude = coordinates[2 * i + 1];
    }
    return points;
  }

  std::vector<geoalloc::Worker> workers_of(const double* coordinates, size_t n,
                                           const int* capacities) {
    std::vector<geoalloc::Worker> workers(n);
    for (size_t i = 0; i < n; ++i) {
      workers[i].id = std::to_string(i);
      workers[i].longitude = coordinates[2 * i];
      workers[i].latitude = coordinates[2 * i + 1];
      if (capacities && capacities[i] >= 0) workers[i].capacity = capacities[i];
    }
    return workers;
  }

  size_t index_of(const std::string& id) {
    size_t index = 0;
    std::from_chars(id.data(), id.data() + id.size(), index);
    return index;
  }

  template <typename T> T* allocate(size_t count) {
    if (count == 0) return nullptr;
    auto* ptr = static_cast<T*>(malloc(sizeof(T) * count));
    if (!ptr) throw std::bad_alloc();
    return ptr;
  }

  const Engine* engine_of(const GeoallocEngine* engine) {
    return reinterpret_cast<const Engine*>(engine);
  }

  GeoallocEngine* wrap(std::expected<Engine, EngineError> result) {
    if (!result) {
      report(nullptr, result.error());
      return nullptr;
    }
    clear(nullptr);
    return reinterpret_cast<GeoallocEngine*>(new Engine(std::move(*result)));
  }

}  // namespace

// C API implementation
extern "C" {

GeoallocEngine* geoalloc_engine_create(const char* config_path) {
  if (!config_path) {
    report(nullptr, GEOALLOC_ERROR_NULL_INPUT, "config path is null");
    return nullptr;
  }
  try {
    return wrap(Engine::from_file(config_path));
  } catch (const std::exception& e) {
    report(nullptr, GEOALLOC_ERROR_INTERNAL, e.what());
    return nullptr;
  }
}

GeoallocEngine* geoalloc_engine_create_from_json(const char* json_str) {
  if (!json_str) {
    report(nullptr, GEOALLOC_ERROR_NULL_INPUT, "config string is null");
    return nullptr;
  }
  try {
    return wrap(Engine::from_json_string(json_str));
  } catch (const std::exception& e) {
    report(nullptr, GEOALLOC_ERROR_INTERNAL, e.what());
    return nullptr;
  }
}

void geoalloc_engine_destroy(GeoallocEngine* engine) {
  delete reinterpret_cast<Engine*>(engine);
}

GeoallocClusterResult* geoalloc_cluster(const GeoallocEngine* engine, const double* coordinates,
                                        size_t n_points, GeoallocErrorCode* error_out) {
  if (!engine) {
    report(error_out, GEOALLOC_ERROR_NULL_ENGINE, "engine is null");
    return nullptr;
  }
  if (!coordinates && n_points > 0) {
    report(error_out, GEOALLOC_ERROR_NULL_INPUT, "coordinates are null");
    return nullptr;
  }

  GeoallocClusterResult* result = nullptr;
  try {
    auto response = engine_of(engine)->cluster(points_of(coordinates, n_points));
    if (!response) {
      report(error_out, response.error());
      return nullptr;
    }

    result = allocate<GeoallocClusterResult>(1);
    result->labels = nullptr;
    result->count = response->rows.size();
    result->n_clusters = engine_of(engine)->config().clustering.k;
    result->inertia = response->metadata.inertia.value_or(0.0);
    result->labels = allocate<int>(result->count);
    for (const auto& row : response->rows) {
      result->labels[row.point] = row.cluster.value_or(-1);
    }
    clear(error_out);
    return result;
  } catch (const std::exception& e) {
    geoalloc_cluster_result_free(result);
    report(error_out, GEOALLOC_ERROR_ALLOCATION_FAILED, e.what());
    return nullptr;
  }
}

GeoallocRouteResult* geoalloc_route(const GeoallocEngine* engine, const double* coordinates,
                                    size_t n_points, long start, GeoallocErrorCode* error_out) {
  if (!engine) {
    report(error_out, GEOALLOC_ERROR_NULL_ENGINE, "engine is null");
    return nullptr;
  }
  if (!coordinates && n_points > 0) {
    report(error_out, GEOALLOC_ERROR_NULL_INPUT, "coordinates are null");
    return nullptr;
  }

  GeoallocRouteResult* result = nullptr;
  try {
    std::optional<std::string> start_id;
    if (start >= 0) start_id = std::to_string(start);
    auto response = engine_of(engine)->route(points_of(coordinates, n_points), start_id);
    if (!response) {
      report(error_out, response.error());
      return nullptr;
    }

    result = allocate<GeoallocRouteResult>(1);
    result->order = nullptr;
    result->count = response->rows.size();
    result->total_distance = response->metadata.total_distance.value_or(0.0);
    result->order = allocate<size_t>(result->count);
    std::ranges::transform(response->rows, result->order,
                           [](const auto& row) { return row.point; });
    clear(error_out);
    return result;
  } catch (const std::exception& e) {
    geoalloc_route_result_free(result);
    report(error_out, GEOALLOC_ERROR_ALLOCATION_FAILED, e.what());
    return nullptr;
  }
}

GeoallocAssignResult* geoalloc_assign(const GeoallocEngine* engine, const double* points,
                                      size_t n_points, const double* workers, size_t n_workers,
                                      const int* capacities, GeoallocErrorCode* error_out) {
  if (!engine) {
    report(error_out, GEOALLOC_ERROR_NULL_ENGINE, "engine is null");
    return nullptr;
  }
  if ((!points && n_points > 0) || (!workers && n_workers > 0)) {
    report(error_out, GEOALLOC_ERROR_NULL_INPUT, "coordinates are null");
    return nullptr;
  }

  GeoallocAssignResult* result = nullptr;
  try {
    auto response = engine_of(engine)->assign(points_of(points, n_points),
                                              workers_of(workers, n_workers, capacities));
    if (!response) {
      report(error_out, response.error());
      return nullptr;
    }

    result = allocate<GeoallocAssignResult>(1);
    result->assignments = nullptr;
    result->count = response->rows.size();
    result->assignments = allocate<GeoallocAssignment>(result->count);
    std::ranges::transform(response->rows, result->assignments, [](const auto& row) {
      return GeoallocAssignment{row.point, index_of(row.worker.value_or("0")),
                                row.distance.value_or(0.0), row.rank.value_or(1)};
    });
    clear(error_out);
    return result;
  } catch (const std::exception& e) {
    geoalloc_assign_result_free(result);
    report(error_out, GEOALLOC_ERROR_ALLOCATION_FAILED, e.what());
    return nullptr;
  }
}

void geoalloc_cluster_result_free(GeoallocClusterResult* result) {
  if (!result) return;
  free(result->labels);
  free(result);
}

void geoalloc_route_result_free(GeoallocRouteResult* result) {
  if (!result) return;
  free(result->order);
  free(result);
}

void geoalloc_assign_result_free(GeoallocAssignResult* result) {
  if (!result) return;
  free(result->assignments);
  free(result);
}

const char* geoalloc_last_error(void) { return last_error.c_str(); }

GeoallocErrorCode geoalloc_last_error_kind(void) { return last_error_code; }

const char* geoalloc_last_error_subject(void) { return last_error_subject.c_str(); }

}  // extern "C"
