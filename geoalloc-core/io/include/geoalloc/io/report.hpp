#pragma once
#include <cstdint>
#include <geoalloc/clustering/stats.hpp>
#include <geoalloc/common/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace geoalloc::io {

  // One output record. Stage fields are set only by the stage that produced them.
  struct OutputRow {
    size_t point = 0;  // index into Report::points
    std::optional<int> cluster;
    std::optional<size_t> route_index;
    std::optional<std::string> worker;
    std::optional<double> distance;
    std::optional<int> rank;
  };

  struct RouteSummary {
    std::optional<int> cluster;
    size_t size = 0;
    double total_distance = 0.0;
    bool closed = false;
    std::string backend;
  };

  struct Metadata {
    std::string stage;   // cluster, route, cluster_and_route, assign
    std::string method;  // partition method, route backend or assignment mode
    std::string metric;
    double elapsed_ms = 0.0;
    std::optional<int> iterations;
    std::optional<bool> converged;
    std::optional<uint64_t> seed;
    std::optional<double> inertia;
    std::optional<double> total_distance;
    std::optional<clustering::BalanceSummary> balance;
    std::vector<RouteSummary> routes;
  };

  struct Report {
    std::vector<Point> points;
    std::vector<OutputRow> rows;
    Metadata metadata;
  };

}  // namespace geoalloc::io
