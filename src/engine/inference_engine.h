#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

#include "log.h"
#include "network/knowledge_base.h"

namespace transit_router {

struct InferenceEngineOptions {
  // Cost added once for every traversal that changes lines, in the same unit
  // as connection distances (km).
  double transfer_penalty = 2.0;

  // When false, h(n) = 0 and the search degrades to uniform-cost search.
  bool use_heuristic = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    InferenceEngineOptions, transfer_penalty, use_heuristic
);

struct RouteStatistics {
  // Number of stations in the path, endpoints included.
  int station_count = 0;
  int transfer_count = 0;
  double total_distance_km = 0.0;
  double total_time_min = 0.0;

  // Stations finalized by the search, including the destination.
  int nodes_expanded = 0;

  // nodes_expanded / number of stations in the network.
  double efficiency_ratio = 0.0;

  bool operator==(const RouteStatistics& other) const = default;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    RouteStatistics,
    station_count,
    transfer_count,
    total_distance_km,
    total_time_min,
    nodes_expanded,
    efficiency_ratio
);

struct Route {
  std::vector<std::string> path;

  // Total distance plus one transfer penalty per line change.
  double total_cost = 0.0;

  RouteStatistics statistics;

  bool operator==(const Route& other) const = default;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Route, path, total_cost, statistics);

struct RouteSegment {
  std::string from;
  std::string to;
  std::string from_line;
  std::string to_line;
  double distance_km;
  double time_min;
  bool is_transfer;

  bool operator==(const RouteSegment& other) const = default;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    RouteSegment,
    from,
    to,
    from_line,
    to_line,
    distance_km,
    time_min,
    is_transfer
);

struct RouteExplanation {
  std::string origin;
  std::string origin_line;
  std::string destination;
  std::string destination_line;

  // One segment per consecutive pair of stations in the path.
  std::vector<RouteSegment> segments;

  // Indices into `segments` of the segments that change lines.
  std::vector<int> transfer_points;

  RouteStatistics statistics;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    RouteExplanation,
    origin,
    origin_line,
    destination,
    destination_line,
    segments,
    transfer_points,
    statistics
);

inline std::ostream& operator<<(std::ostream& os, const Route& value) {
  os << "Route{";
  for (size_t i = 0; i < value.path.size(); ++i) {
    if (i > 0) os << " -> ";
    os << value.path[i];
  }
  return os << ", cost: " << value.total_cost << "}";
}

// A* search over a KnowledgeBase.
//
// The engine borrows the knowledge base; it must outlive the engine. No state
// is kept between calls, so one engine can serve concurrent queries as long as
// nobody mutates the knowledge base meanwhile.
class InferenceEngine {
 public:
  // Throws std::invalid_argument if the transfer penalty is negative or NaN.
  explicit InferenceEngine(
      const KnowledgeBase& knowledge_base,
      InferenceEngineOptions options = {},
      TextLogger logger = NullLogger()
  );

  // Find the lowest cost route from `origin` to `destination`.
  //
  // The cost of traversing a connection is its distance, plus the transfer
  // penalty when its endpoints are on different lines. h(n) is the
  // great-circle distance from n to the destination. It ignores future
  // transfers, so it never overestimates as long as connection distances are
  // at least the great-circle distance between their endpoints. If any
  // registered station lacks coordinates, h = 0 everywhere and the search is
  // uniform-cost.
  //
  // Frontier entries with equal f are extracted in insertion order.
  //
  // Throws UnknownStationError if an endpoint is not registered and
  // RouteNotFoundError if the destination is unreachable.
  Route FindOptimalRoute(
      const std::string& origin, const std::string& destination
  ) const;

  // Describe `path` segment by segment, marking line changes. Performs no
  // search.
  //
  // Throws UnknownStationError if a station in `path` is no longer
  // registered, and std::invalid_argument if `path` is empty or two
  // consecutive stations are not connected.
  RouteExplanation ExplainRoute(
      const std::vector<std::string>& path, const RouteStatistics& statistics
  ) const;

  const KnowledgeBase& knowledge_base() const { return knowledge_base_; }
  const InferenceEngineOptions& options() const { return options_; }

 private:
  double Heuristic(
      const std::string& station, const std::string& destination, bool informed
  ) const;

  const KnowledgeBase& knowledge_base_;
  InferenceEngineOptions options_;
  TextLogger logger_;
};

}  // namespace transit_router
