#include "network/knowledge_base.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace transit_router {

namespace {

bool IsValidWeight(double value) { return !std::isnan(value) && value >= 0.0; }

const Neighbor* FindNeighbor(
    const std::vector<Neighbor>& neighbors, const std::string& station
) {
  auto it = std::find_if(
      neighbors.begin(),
      neighbors.end(),
      [&](const Neighbor& n) { return n.station == station; }
  );
  return it == neighbors.end() ? nullptr : &*it;
}

std::string DescribeViolations(
    const std::vector<ConsistencyViolation>& violations
) {
  if (violations.empty()) {
    return "Network is inconsistent";
  }
  return std::format(
      "Network is inconsistent: {} violation(s), first: {}",
      violations.size(),
      violations.front().message
  );
}

}  // namespace

InconsistentNetworkError::InconsistentNetworkError(
    std::vector<ConsistencyViolation> violations
)
    : RoutingError(DescribeViolations(violations)),
      violations_(std::move(violations)) {}

void KnowledgeBase::AddStation(
    const std::string& name,
    const std::string& line,
    std::optional<Coordinates> coordinates
) {
  if (name.empty()) {
    throw InvalidStationError("Station name must not be empty");
  }
  std::unique_lock lock(mutex_);
  stations_[name] = Station{name, line, coordinates};
}

void KnowledgeBase::AddConnection(
    const std::string& a,
    const std::string& b,
    double distance_km,
    double time_min
) {
  if (!IsValidWeight(distance_km)) {
    throw InvalidConnectionError(std::format(
        "Connection {} <-> {} has invalid distance {}", a, b, distance_km
    ));
  }
  if (!IsValidWeight(time_min)) {
    throw InvalidConnectionError(
        std::format("Connection {} <-> {} has invalid time {}", a, b, time_min)
    );
  }
  std::unique_lock lock(mutex_);
  auto a_it = adjacent_.find(a);
  bool is_new = a_it == adjacent_.end() || !FindNeighbor(a_it->second, b);
  UpsertDirected(a, b, distance_km, time_min);
  UpsertDirected(b, a, distance_km, time_min);
  if (is_new) {
    connection_order_.emplace_back(a, b);
  }
}

void KnowledgeBase::UpsertDirected(
    const std::string& from,
    const std::string& to,
    double distance_km,
    double time_min
) {
  std::vector<Neighbor>& neighbors = adjacent_[from];
  for (Neighbor& neighbor : neighbors) {
    if (neighbor.station == to) {
      neighbor.distance_km = distance_km;
      neighbor.time_min = time_min;
      return;
    }
  }
  neighbors.push_back(Neighbor{to, distance_km, time_min});
}

const Station& KnowledgeBase::StationOrThrow(const std::string& name) const {
  auto it = stations_.find(name);
  if (it == stations_.end()) {
    throw UnknownStationError(name);
  }
  return it->second;
}

std::vector<Neighbor> KnowledgeBase::NeighborsOf(
    const std::string& station
) const {
  std::shared_lock lock(mutex_);
  StationOrThrow(station);
  auto it = adjacent_.find(station);
  if (it == adjacent_.end()) {
    return {};
  }
  return it->second;
}

bool KnowledgeBase::RequiresTransfer(
    const std::string& a, const std::string& b
) const {
  std::shared_lock lock(mutex_);
  return StationOrThrow(a).line != StationOrThrow(b).line;
}

double KnowledgeBase::EstimateHeuristic(
    const std::string& a, const std::string& b
) const {
  std::shared_lock lock(mutex_);
  const Station& from = StationOrThrow(a);
  const Station& to = StationOrThrow(b);
  if (!from.coordinates.has_value()) {
    throw MissingCoordinatesError(a);
  }
  if (!to.coordinates.has_value()) {
    throw MissingCoordinatesError(b);
  }
  return HaversineKm(*from.coordinates, *to.coordinates);
}

std::optional<double> KnowledgeBase::TryEstimateHeuristic(
    const std::string& a, const std::string& b
) const {
  std::shared_lock lock(mutex_);
  const Station& from = StationOrThrow(a);
  const Station& to = StationOrThrow(b);
  if (!from.coordinates.has_value() || !to.coordinates.has_value()) {
    return std::nullopt;
  }
  return HaversineKm(*from.coordinates, *to.coordinates);
}

std::vector<ConsistencyViolation> KnowledgeBase::ValidateConsistency() const {
  std::shared_lock lock(mutex_);
  std::vector<ConsistencyViolation> violations;

  // Sort the origins so that the report is stable across runs.
  std::vector<std::string> origins;
  origins.reserve(adjacent_.size());
  for (const auto& [origin, neighbors] : adjacent_) {
    origins.push_back(origin);
  }
  std::sort(origins.begin(), origins.end());

  for (const std::string& origin : origins) {
    const std::vector<Neighbor>& neighbors = adjacent_.at(origin);
    if (!stations_.contains(origin)) {
      violations.push_back(ConsistencyViolation{
          ViolationKind::kUnknownStation,
          std::format(
              "Station '{}' has connections but is not registered", origin
          )
      });
    }

    std::unordered_set<std::string> seen;
    for (const Neighbor& neighbor : neighbors) {
      if (!seen.insert(neighbor.station).second) {
        violations.push_back(ConsistencyViolation{
            ViolationKind::kDuplicateConnection,
            std::format(
                "Station '{}' lists '{}' more than once", origin, neighbor.station
            )
        });
      }

      // Dangling origins are reported once above; report dangling targets
      // only when they have no adjacency entry of their own.
      if (!stations_.contains(neighbor.station) &&
          !adjacent_.contains(neighbor.station)) {
        violations.push_back(ConsistencyViolation{
            ViolationKind::kUnknownStation,
            std::format(
                "Station '{}' referenced from '{}' is not registered",
                neighbor.station,
                origin
            )
        });
      }

      if (!IsValidWeight(neighbor.distance_km) ||
          !IsValidWeight(neighbor.time_min)) {
        violations.push_back(ConsistencyViolation{
            ViolationKind::kNegativeWeight,
            std::format(
                "Connection {} -> {} has invalid weights ({} km, {} min)",
                origin,
                neighbor.station,
                neighbor.distance_km,
                neighbor.time_min
            )
        });
      }

      const Neighbor* reverse = nullptr;
      auto reverse_it = adjacent_.find(neighbor.station);
      if (reverse_it != adjacent_.end()) {
        reverse = FindNeighbor(reverse_it->second, origin);
      }
      if (reverse == nullptr) {
        violations.push_back(ConsistencyViolation{
            ViolationKind::kAsymmetricConnection,
            std::format(
                "Connection {} -> {} has no reverse connection",
                origin,
                neighbor.station
            )
        });
      } else if (reverse->distance_km != neighbor.distance_km ||
                 reverse->time_min != neighbor.time_min) {
        violations.push_back(ConsistencyViolation{
            ViolationKind::kAsymmetricConnection,
            std::format(
                "Connection {} -> {} ({} km, {} min) differs from its reverse "
                "({} km, {} min)",
                origin,
                neighbor.station,
                neighbor.distance_km,
                neighbor.time_min,
                reverse->distance_km,
                reverse->time_min
            )
        });
      }
    }
  }

  return violations;
}

bool KnowledgeBase::AllStationsHaveCoordinates() const {
  std::shared_lock lock(mutex_);
  return std::all_of(stations_.begin(), stations_.end(), [](const auto& entry) {
    return entry.second.coordinates.has_value();
  });
}

bool KnowledgeBase::HasStation(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return stations_.contains(name);
}

Station KnowledgeBase::GetStation(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return StationOrThrow(name);
}

std::vector<Station> KnowledgeBase::Stations() const {
  std::shared_lock lock(mutex_);
  std::vector<Station> result;
  result.reserve(stations_.size());
  for (const auto& [name, station] : stations_) {
    result.push_back(station);
  }
  std::sort(result.begin(), result.end(), [](const Station& x, const Station& y) {
    return x.name < y.name;
  });
  return result;
}

std::vector<Connection> KnowledgeBase::Connections() const {
  std::shared_lock lock(mutex_);
  std::vector<Connection> result;
  result.reserve(connection_order_.size());
  for (const auto& [a, b] : connection_order_) {
    const Neighbor* neighbor = FindNeighbor(adjacent_.at(a), b);
    if (neighbor != nullptr) {
      result.push_back(
          Connection{a, b, neighbor->distance_km, neighbor->time_min}
      );
    }
  }
  return result;
}

std::vector<std::string> KnowledgeBase::ConnectionFacts() const {
  std::vector<std::string> facts;
  for (const Connection& c : Connections()) {
    facts.push_back(std::format(
        "connects({}, {}, {}, {})", c.a, c.b, c.distance_km, c.time_min
    ));
  }
  return facts;
}

size_t KnowledgeBase::StationCount() const {
  std::shared_lock lock(mutex_);
  return stations_.size();
}

size_t KnowledgeBase::ConnectionCount() const {
  std::shared_lock lock(mutex_);
  return connection_order_.size();
}

}  // namespace transit_router
