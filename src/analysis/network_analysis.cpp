#include "analysis/network_analysis.h"

#include <algorithm>
#include <functional>
#include <unordered_map>

#include "analysis/shortest_costs.h"

namespace transit_router {

namespace {

// Replace `current` with `candidate` when `better` says so, or when empty.
void KeepExtreme(
    std::optional<RouteRecord>& current,
    const RouteRecord& candidate,
    const std::function<bool(const Route&, const Route&)>& better
) {
  if (!current.has_value() || better(candidate.route, current->route)) {
    current = candidate;
  }
}

void AuditHeuristic(
    const KnowledgeBase& knowledge_base,
    const std::vector<std::string>& stations,
    NetworkAnalysis& analysis
) {
  for (const std::string& origin : stations) {
    std::unordered_map<std::string, double> distances =
        ComputeShortestDistances(knowledge_base, origin);
    for (const std::string& destination : stations) {
      if (origin == destination) {
        continue;
      }
      auto it = distances.find(destination);
      if (it == distances.end()) {
        continue;
      }
      std::optional<double> estimate =
          knowledge_base.TryEstimateHeuristic(origin, destination);
      if (!estimate.has_value()) {
        continue;
      }
      ++analysis.heuristic_checks;
      // Tolerate rounding in the coordinates and distances.
      if (*estimate > it->second + 1e-9) {
        analysis.heuristic_violations.push_back(HeuristicViolation{
            origin, destination, *estimate, it->second
        });
      }
    }
  }
}

}  // namespace

NetworkAnalysis AnalyzeNetwork(
    const InferenceEngine& engine,
    std::vector<std::string> stations,
    const TextLogger& logger
) {
  const KnowledgeBase& knowledge_base = engine.knowledge_base();
  if (stations.empty()) {
    for (const Station& station : knowledge_base.Stations()) {
      stations.push_back(station.name);
    }
  }
  for (const std::string& station : stations) {
    if (!knowledge_base.HasStation(station)) {
      throw UnknownStationError(station);
    }
  }
  Logf(logger, "Surveying routes between {} stations", stations.size());

  NetworkAnalysis analysis;
  for (const std::string& origin : stations) {
    for (const std::string& destination : stations) {
      if (origin == destination) {
        continue;
      }
      ++analysis.total_pairs;
      try {
        analysis.routes.push_back(RouteRecord{
            origin, destination, engine.FindOptimalRoute(origin, destination)
        });
      } catch (const RouteNotFoundError& e) {
        Logf(logger, "  {}", e.what());
      }
    }
  }

  analysis.routes_found = static_cast<int>(analysis.routes.size());
  if (analysis.total_pairs > 0) {
    analysis.success_rate =
        static_cast<double>(analysis.routes_found) / analysis.total_pairs;
  }

  if (!analysis.routes.empty()) {
    analysis.min_path_length = analysis.routes[0].route.statistics.station_count;
    analysis.max_path_length = analysis.min_path_length;
    for (const RouteRecord& record : analysis.routes) {
      const RouteStatistics& s = record.route.statistics;
      analysis.average_path_length += s.station_count;
      analysis.min_path_length =
          std::min(analysis.min_path_length, s.station_count);
      analysis.max_path_length =
          std::max(analysis.max_path_length, s.station_count);
      analysis.average_transfers += s.transfer_count;
      analysis.average_distance_km += s.total_distance_km;
      analysis.average_time_min += s.total_time_min;
      analysis.average_nodes_expanded += s.nodes_expanded;

      KeepExtreme(
          analysis.extremes.longest,
          record,
          [](const Route& a, const Route& b) {
            return a.statistics.station_count > b.statistics.station_count;
          }
      );
      KeepExtreme(
          analysis.extremes.most_transfers,
          record,
          [](const Route& a, const Route& b) {
            return a.statistics.transfer_count > b.statistics.transfer_count;
          }
      );
      KeepExtreme(
          analysis.extremes.fastest,
          record,
          [](const Route& a, const Route& b) {
            return a.statistics.total_time_min < b.statistics.total_time_min;
          }
      );
      KeepExtreme(
          analysis.extremes.most_efficient,
          record,
          [](const Route& a, const Route& b) {
            return a.statistics.nodes_expanded < b.statistics.nodes_expanded;
          }
      );
    }
    const double n = static_cast<double>(analysis.routes.size());
    analysis.average_path_length /= n;
    analysis.average_transfers /= n;
    analysis.average_distance_km /= n;
    analysis.average_time_min /= n;
    analysis.average_nodes_expanded /= n;
  }

  AuditHeuristic(knowledge_base, stations, analysis);

  Logf(
      logger,
      "Found {}/{} routes, {} heuristic violations in {} checks",
      analysis.routes_found,
      analysis.total_pairs,
      analysis.heuristic_violations.size(),
      analysis.heuristic_checks
  );
  return analysis;
}

}  // namespace transit_router
