#include "engine/inference_engine.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace transit_router {

namespace {

// The data we keep at each station reached during one search. Enough to
// reconstruct the best known path to it and report on that path.
struct SearchState {
  // Cost from the origin along the best known path.
  double g;

  // Estimated remaining cost to the destination.
  double h;

  std::optional<std::string> predecessor;

  double distance_km;
  double time_min;
  int transfers;

  double f() const { return g + h; }
};

// The heap has no decrease-key, so improving a station pushes a new entry and
// the old one goes stale. Stale entries are recognized on extraction by a `g`
// that no longer matches the station's SearchState.
struct FrontierEntry {
  double f;
  double g;
  uint64_t sequence;
  std::string station;
};

// Orders the heap so that the top is the lowest f, then the earliest
// insertion.
struct FrontierEntryComparator {
  bool operator()(const FrontierEntry& a, const FrontierEntry& b) const {
    if (a.f != b.f) {
      return a.f > b.f;
    }
    return a.sequence > b.sequence;
  }
};

std::vector<std::string> ReconstructPath(
    const std::unordered_map<std::string, SearchState>& states,
    const std::string& destination
) {
  std::vector<std::string> path;
  std::optional<std::string> current = destination;
  while (current.has_value()) {
    path.push_back(*current);
    current = states.at(*current).predecessor;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

}  // namespace

InferenceEngine::InferenceEngine(
    const KnowledgeBase& knowledge_base,
    InferenceEngineOptions options,
    TextLogger logger
)
    : knowledge_base_(knowledge_base),
      options_(options),
      logger_(std::move(logger)) {
  if (std::isnan(options_.transfer_penalty) ||
      options_.transfer_penalty < 0.0) {
    throw std::invalid_argument("Transfer penalty must be non-negative");
  }
}

double InferenceEngine::Heuristic(
    const std::string& station, const std::string& destination, bool informed
) const {
  if (!informed) {
    return 0.0;
  }
  return knowledge_base_.TryEstimateHeuristic(station, destination)
      .value_or(0.0);
}

Route InferenceEngine::FindOptimalRoute(
    const std::string& origin, const std::string& destination
) const {
  if (!knowledge_base_.HasStation(origin)) {
    throw UnknownStationError(origin);
  }
  if (!knowledge_base_.HasStation(destination)) {
    throw UnknownStationError(destination);
  }
  const double network_size =
      static_cast<double>(knowledge_base_.StationCount());

  if (origin == destination) {
    return Route{
        .path = {origin},
        .total_cost = 0.0,
        .statistics =
            RouteStatistics{
                .station_count = 1,
                .transfer_count = 0,
                .total_distance_km = 0.0,
                .total_time_min = 0.0,
                .nodes_expanded = 1,
                .efficiency_ratio = 1.0 / network_size,
            },
    };
  }

  // The closed set is only safe with a consistent h, and mixing great-circle
  // estimates with zeros for stations without coordinates is not consistent.
  // Estimate only when every station can be estimated.
  const bool informed =
      options_.use_heuristic && knowledge_base_.AllStationsHaveCoordinates();

  std::unordered_map<std::string, SearchState> states;
  std::unordered_set<std::string> finalized;
  auto frontier_cmp = FrontierEntryComparator{};
  std::vector<FrontierEntry> frontier;
  uint64_t next_sequence = 0;

  const SearchState initial_state{
      .g = 0.0,
      .h = Heuristic(origin, destination, informed),
      .predecessor = std::nullopt,
      .distance_km = 0.0,
      .time_min = 0.0,
      .transfers = 0,
  };
  states.emplace(origin, initial_state);
  frontier.push_back(
      FrontierEntry{initial_state.f(), 0.0, next_sequence++, origin}
  );

  int nodes_expanded = 0;
  while (!frontier.empty()) {
    std::pop_heap(frontier.begin(), frontier.end(), frontier_cmp);
    FrontierEntry current = std::move(frontier.back());
    frontier.pop_back();

    if (finalized.contains(current.station)) {
      continue;
    }
    const SearchState current_state = states.at(current.station);
    if (current.g > current_state.g) {
      continue;
    }
    finalized.insert(current.station);
    ++nodes_expanded;

    if (current.station == destination) {
      Route route{
          .path = ReconstructPath(states, destination),
          .total_cost = current_state.g,
          .statistics = {},
      };
      route.statistics = RouteStatistics{
          .station_count = static_cast<int>(route.path.size()),
          .transfer_count = current_state.transfers,
          .total_distance_km = current_state.distance_km,
          .total_time_min = current_state.time_min,
          .nodes_expanded = nodes_expanded,
          .efficiency_ratio = nodes_expanded / network_size,
      };
      Logf(
          logger_,
          "{} -> {}: cost {:.2f}, {} stations, {} transfers, expanded {}/{}",
          origin,
          destination,
          route.total_cost,
          route.statistics.station_count,
          route.statistics.transfer_count,
          nodes_expanded,
          knowledge_base_.StationCount()
      );
      return route;
    }

    for (const Neighbor& neighbor :
         knowledge_base_.NeighborsOf(current.station)) {
      if (finalized.contains(neighbor.station)) {
        continue;
      }
      const bool transfer =
          knowledge_base_.RequiresTransfer(current.station, neighbor.station);
      const double tentative_g =
          current_state.g + neighbor.distance_km +
          (transfer ? options_.transfer_penalty : 0.0);

      auto it = states.find(neighbor.station);
      if (it != states.end() && tentative_g >= it->second.g) {
        continue;
      }
      const double h = it != states.end()
                           ? it->second.h
                           : Heuristic(neighbor.station, destination, informed);
      const SearchState next_state{
          .g = tentative_g,
          .h = h,
          .predecessor = current.station,
          .distance_km = current_state.distance_km + neighbor.distance_km,
          .time_min = current_state.time_min + neighbor.time_min,
          .transfers = current_state.transfers + (transfer ? 1 : 0),
      };
      states.insert_or_assign(neighbor.station, next_state);
      frontier.push_back(FrontierEntry{
          next_state.f(), tentative_g, next_sequence++, neighbor.station
      });
      std::push_heap(frontier.begin(), frontier.end(), frontier_cmp);
    }
  }

  Logf(
      logger_,
      "{} -> {}: no route, expanded {}/{}",
      origin,
      destination,
      nodes_expanded,
      knowledge_base_.StationCount()
  );
  throw RouteNotFoundError(origin, destination);
}

RouteExplanation InferenceEngine::ExplainRoute(
    const std::vector<std::string>& path, const RouteStatistics& statistics
) const {
  if (path.empty()) {
    throw std::invalid_argument("Cannot explain an empty path");
  }

  std::vector<Station> stations;
  stations.reserve(path.size());
  for (const std::string& name : path) {
    stations.push_back(knowledge_base_.GetStation(name));
  }

  RouteExplanation explanation{
      .origin = stations.front().name,
      .origin_line = stations.front().line,
      .destination = stations.back().name,
      .destination_line = stations.back().line,
      .segments = {},
      .transfer_points = {},
      .statistics = statistics,
  };

  for (size_t i = 0; i + 1 < stations.size(); ++i) {
    const Station& from = stations[i];
    const Station& to = stations[i + 1];

    std::optional<Neighbor> link;
    for (const Neighbor& neighbor : knowledge_base_.NeighborsOf(from.name)) {
      if (neighbor.station == to.name) {
        link = neighbor;
        break;
      }
    }
    if (!link.has_value()) {
      throw std::invalid_argument(
          "Stations '" + from.name + "' and '" + to.name +
          "' are not connected"
      );
    }

    const bool transfer = from.line != to.line;
    if (transfer) {
      explanation.transfer_points.push_back(
          static_cast<int>(explanation.segments.size())
      );
    }
    explanation.segments.push_back(RouteSegment{
        .from = from.name,
        .to = to.name,
        .from_line = from.line,
        .to_line = to.line,
        .distance_km = link->distance_km,
        .time_min = link->time_min,
        .is_transfer = transfer,
    });
  }

  return explanation;
}

}  // namespace transit_router
