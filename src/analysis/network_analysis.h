#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "engine/inference_engine.h"
#include "serialization/optional.h"

namespace transit_router {

struct RouteRecord {
  std::string origin;
  std::string destination;
  Route route;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RouteRecord, origin, destination, route);

// The notable routes of a survey. Ties go to the pair surveyed first. All
// empty when no route was found.
struct ExtremeRoutes {
  std::optional<RouteRecord> longest;
  std::optional<RouteRecord> most_transfers;
  std::optional<RouteRecord> fastest;
  std::optional<RouteRecord> most_efficient;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    ExtremeRoutes, longest, most_transfers, fastest, most_efficient
);

// A pair for which the heuristic estimate exceeds the true shortest distance.
struct HeuristicViolation {
  std::string origin;
  std::string destination;
  double estimate_km;
  double shortest_distance_km;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    HeuristicViolation, origin, destination, estimate_km, shortest_distance_km
);

struct NetworkAnalysis {
  int total_pairs = 0;
  int routes_found = 0;
  double success_rate = 0.0;

  double average_path_length = 0.0;
  int min_path_length = 0;
  int max_path_length = 0;
  double average_transfers = 0.0;
  double average_distance_km = 0.0;
  double average_time_min = 0.0;
  double average_nodes_expanded = 0.0;

  ExtremeRoutes extremes;

  // Reachable pairs with coordinates on both ends that were checked for
  // heuristic admissibility, and the ones that failed.
  int heuristic_checks = 0;
  std::vector<HeuristicViolation> heuristic_violations;

  std::vector<RouteRecord> routes;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    NetworkAnalysis,
    total_pairs,
    routes_found,
    success_rate,
    average_path_length,
    min_path_length,
    max_path_length,
    average_transfers,
    average_distance_km,
    average_time_min,
    average_nodes_expanded,
    extremes,
    heuristic_checks,
    heuristic_violations,
    routes
);

// Route every ordered pair of distinct stations in `stations` (all registered
// stations, sorted by name, when empty) and summarize the results.
//
// Disconnected pairs count against the success rate. Throws
// UnknownStationError if a station in `stations` is not registered.
NetworkAnalysis AnalyzeNetwork(
    const InferenceEngine& engine,
    std::vector<std::string> stations = {},
    const TextLogger& logger = NullLogger()
);

}  // namespace transit_router
