#pragma once

#include <string>
#include <unordered_map>

#include "network/knowledge_base.h"

namespace transit_router {

// Find the lowest cost from `origin` to every reachable station using
// Dijkstra's algorithm, with the same cost model as InferenceEngine: the
// distance of each connection plus `transfer_penalty` whenever it changes
// lines. Unreachable stations are absent from the result.
//
// Throws UnknownStationError if `origin` (or a station it reaches) is not
// registered.
std::unordered_map<std::string, double> ComputeShortestCosts(
    const KnowledgeBase& knowledge_base,
    const std::string& origin,
    double transfer_penalty
);

// Shortest physical distances from `origin`, ignoring line changes. This is
// the quantity the heuristic must never exceed.
std::unordered_map<std::string, double> ComputeShortestDistances(
    const KnowledgeBase& knowledge_base, const std::string& origin
);

}  // namespace transit_router
