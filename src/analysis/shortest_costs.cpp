#include "analysis/shortest_costs.h"

#include <algorithm>
#include <functional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace transit_router {

std::unordered_map<std::string, double> ComputeShortestCosts(
    const KnowledgeBase& knowledge_base,
    const std::string& origin,
    double transfer_penalty
) {
  if (!knowledge_base.HasStation(origin)) {
    throw UnknownStationError(origin);
  }

  std::unordered_map<std::string, double> costs;
  std::unordered_set<std::string> finalized;

  // Priority queue: (cost, station)
  using Entry = std::pair<double, std::string>;
  auto frontier_cmp = std::greater<Entry>{};
  std::vector<Entry> frontier;

  costs[origin] = 0.0;
  frontier.push_back({0.0, origin});

  while (!frontier.empty()) {
    std::pop_heap(frontier.begin(), frontier.end(), frontier_cmp);
    auto [current_cost, current_station] = std::move(frontier.back());
    frontier.pop_back();

    if (!finalized.insert(current_station).second) {
      continue;
    }

    for (const Neighbor& neighbor :
         knowledge_base.NeighborsOf(current_station)) {
      double new_cost = current_cost + neighbor.distance_km;
      if (transfer_penalty > 0.0 &&
          knowledge_base.RequiresTransfer(current_station, neighbor.station)) {
        new_cost += transfer_penalty;
      }
      auto it = costs.find(neighbor.station);
      if (it == costs.end() || new_cost < it->second) {
        costs[neighbor.station] = new_cost;
        frontier.push_back({new_cost, neighbor.station});
        std::push_heap(frontier.begin(), frontier.end(), frontier_cmp);
      }
    }
  }

  return costs;
}

std::unordered_map<std::string, double> ComputeShortestDistances(
    const KnowledgeBase& knowledge_base, const std::string& origin
) {
  return ComputeShortestCosts(knowledge_base, origin, 0.0);
}

}  // namespace transit_router
