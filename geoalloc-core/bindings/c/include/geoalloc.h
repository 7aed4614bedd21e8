#ifndef GEOALLOC_H
#define GEOALLOC_H

#include <stddef.h>

/* Cross-platform DLL export/import macros */
#if defined(_WIN32) || defined(_WIN64)
#  ifdef GEOALLOC_C_EXPORTS
#    define GEOALLOC_API __declspec(dllexport)
#  else
#    define GEOALLOC_API __declspec(dllimport)
#  endif
#else
#  if __GNUC__ >= 4
#    define GEOALLOC_API __attribute__((visibility("default")))
#  else
#    define GEOALLOC_API
#  endif
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Opaque handle to an Engine instance
 */
typedef struct GeoallocEngine GeoallocEngine;

/**
 * Error codes. The engine error kinds map onto VALIDATION through CAPACITY_EXHAUSTED.
 */
typedef enum {
  GEOALLOC_OK = 0,
  GEOALLOC_ERROR_NULL_ENGINE,
  GEOALLOC_ERROR_NULL_INPUT,
  GEOALLOC_ERROR_VALIDATION,
  GEOALLOC_ERROR_EXTERNAL_SERVICE,
  GEOALLOC_ERROR_SOLVER,
  GEOALLOC_ERROR_CAPACITY_EXHAUSTED,
  GEOALLOC_ERROR_ALLOCATION_FAILED,
  GEOALLOC_ERROR_INTERNAL
} GeoallocErrorCode;

/**
 * Cluster result: one label per input point, in input order
 */
typedef struct {
  int* labels;    /**< Cluster id per point */
  size_t count;   /**< Number of points */
  int n_clusters; /**< Number of clusters requested */
  double inertia; /**< Sum of squared distances to centroids (0 for graph partitioning) */
} GeoallocClusterResult;

/**
 * Route result: visiting order as indices into the input points
 */
typedef struct {
  size_t* order;         /**< Point indices in visiting order */
  size_t count;          /**< Number of points */
  double total_distance; /**< Path length, including the closing leg when closed */
} GeoallocRouteResult;

/**
 * One point-to-worker pairing
 */
typedef struct {
  size_t point;    /**< Index into the input points */
  size_t worker;   /**< Index into the input workers */
  double distance; /**< Distance under the configured metric */
  int rank;        /**< 1 for the point's closest worker */
} GeoallocAssignment;

/**
 * Assignment result
 */
typedef struct {
  GeoallocAssignment* assignments; /**< One per point (point_order) or per pair (ranking) */
  size_t count;                    /**< Number of assignments */
} GeoallocAssignResult;

/**
 * Create an engine from a JSON config file
 * @param config_path Path to the JSON config file
 * @return Engine handle, or NULL on error (see geoalloc_last_error)
 */
GEOALLOC_API GeoallocEngine* geoalloc_engine_create(const char* config_path);

/**
 * Create an engine from a JSON config string
 * @param json_str JSON config
 * @return Engine handle, or NULL on error (see geoalloc_last_error)
 */
GEOALLOC_API GeoallocEngine* geoalloc_engine_create_from_json(const char* json_str);

/**
 * Destroy an engine and free its resources
 * @param engine Engine handle
 */
GEOALLOC_API void geoalloc_engine_destroy(GeoallocEngine* engine);

/**
 * Partition points into the configured number of clusters
 * @param engine Engine handle
 * @param coordinates Row-major (longitude, latitude) pairs, 2 * n_points values
 * @param n_points Number of points
 * @param error_out Optional error code output (can be NULL)
 * @return Cluster result (caller must free with geoalloc_cluster_result_free)
 */
GEOALLOC_API GeoallocClusterResult* geoalloc_cluster(const GeoallocEngine* engine,
                                                     const double* coordinates, size_t n_points,
                                                     GeoallocErrorCode* error_out);

/**
 * Order points into a single route
 * @param engine Engine handle
 * @param coordinates Row-major (longitude, latitude) pairs, 2 * n_points values
 * @param n_points Number of points
 * @param start Index of the first point, or a negative value for none
 * @param error_out Optional error code output (can be NULL)
 * @return Route result (caller must free with geoalloc_route_result_free)
 */
GEOALLOC_API GeoallocRouteResult* geoalloc_route(const GeoallocEngine* engine,
                                                 const double* coordinates, size_t n_points,
                                                 long start, GeoallocErrorCode* error_out);

/**
 * Assign points to workers
 * @param engine Engine handle
 * @param points Row-major (longitude, latitude) pairs, 2 * n_points values
 * @param n_points Number of points
 * @param workers Row-major (longitude, latitude) pairs, 2 * n_workers values
 * @param n_workers Number of workers
 * @param capacities Per-worker capacity, negative for unbounded; NULL for all unbounded
 * @param error_out Optional error code output (can be NULL)
 * @return Assignment result (caller must free with geoalloc_assign_result_free)
 */
GEOALLOC_API GeoallocAssignResult* geoalloc_assign(const GeoallocEngine* engine,
                                                   const double* points, size_t n_points,
                                                   const double* workers, size_t n_workers,
                                                   const int* capacities,
                                                   GeoallocErrorCode* error_out);

GEOALLOC_API void geoalloc_cluster_result_free(GeoallocClusterResult* result);
GEOALLOC_API void geoalloc_route_result_free(GeoallocRouteResult* result);
GEOALLOC_API void geoalloc_assign_result_free(GeoallocAssignResult* result);

/**
 * Message of the last failed call on this thread
 * @return Error message, or an empty string. Owned by the library.
 */
GEOALLOC_API const char* geoalloc_last_error(void);

/**
 * Error code of the last call on this thread (GEOALLOC_OK after a success)
 */
GEOALLOC_API GeoallocErrorCode geoalloc_last_error_kind(void);

/**
 * Offending input of the last failed call on this thread (point id, worker id, config key)
 * @return Subject, or an empty string. Owned by the library.
 */
GEOALLOC_API const char* geoalloc_last_error_subject(void);

#ifdef __cplusplus
}
#endif

#endif /* GEOALLOC_H */
