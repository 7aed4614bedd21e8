#include <array>
#include <geoalloc/common/errors.hpp>
#include <geoalloc/common/overloaded.hpp>
#include <geoalloc/distance/metric.hpp>
#include <string>
#include <utility>

namespace geoalloc::distance {

  namespace {

    const std::array<std::pair<std::string_view, DistanceMetric>, 8> kMetricNames{{
        {"planar", Planar{}},
        {"great-circle", GreatCircle{}},
        {"external-routing", ExternalRouting{}},
        {"external-mapping", ExternalMapping{}},
        {"euclidean", Planar{}},
        {"haversine", GreatCircle{}},
        {"osrm", ExternalRouting{}},
        {"google", ExternalMapping{}},
    }};

  }  // namespace

  std::string_view metric_name(const DistanceMetric& metric) noexcept {
    return std::visit(overloaded{[](Planar) -> std::string_view { return "planar"; },
                                 [](GreatCircle) -> std::string_view { return "great-circle"; },
                                 [](ExternalRouting) -> std::string_view {
                                   return "external-routing";
                                 },
                                 [](ExternalMapping) -> std::string_view {
                                   return "external-mapping";
                                 }},
                      metric);
  }

  DistanceMetric parse_metric(std::string_view name) {
    for (const auto& [key, metric] : kMetricNames) {
      if (key == name) return metric;
    }
    throw ValidationError("unknown distance metric '" + std::string(name) + "'", "distance");
  }

  bool is_external(const DistanceMetric& metric) noexcept {
    return std::holds_alternative<ExternalRouting>(metric)
           || std::holds_alternative<ExternalMapping>(metric);
  }

}  // namespace geoalloc::distance
