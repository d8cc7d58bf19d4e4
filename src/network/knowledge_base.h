#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "network/errors.h"
#include "network/station.h"

namespace transit_router {

enum class ViolationKind {
  // A connection endpoint is not a registered station.
  kUnknownStation,
  // A connection has a negative (or NaN) distance or time.
  kNegativeWeight,
  // A -> B is stored but B -> A is missing or has different weights.
  kAsymmetricConnection,
  // One station lists the same neighbor more than once.
  kDuplicateConnection,
};
NLOHMANN_JSON_SERIALIZE_ENUM(
    ViolationKind,
    {
        {ViolationKind::kUnknownStation, "unknown_station"},
        {ViolationKind::kNegativeWeight, "negative_weight"},
        {ViolationKind::kAsymmetricConnection, "asymmetric_connection"},
        {ViolationKind::kDuplicateConnection, "duplicate_connection"},
    }
);

struct ConsistencyViolation {
  ViolationKind kind;
  std::string message;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ConsistencyViolation, kind, message);

inline std::ostream& operator<<(
    std::ostream& os, const ConsistencyViolation& value
) {
  return os << nlohmann::json(value.kind).get<std::string>() << ": "
            << value.message;
}

// A network failed ValidateConsistency where a consistent one is required.
class InconsistentNetworkError : public RoutingError {
 public:
  explicit InconsistentNetworkError(
      std::vector<ConsistencyViolation> violations
  );

  const std::vector<ConsistencyViolation>& violations() const {
    return violations_;
  }

 private:
  std::vector<ConsistencyViolation> violations_;
};

// The transit network: stations keyed by name plus a symmetric adjacency map
// of connections.
//
// Connections may name stations that are not registered yet, so that callers
// can load a network in any order. `ValidateConsistency` reports such
// dangling references and should be checked before trusting query results.
//
// Reads take a shared lock for the duration of one lookup and return copies.
// Mutations take an exclusive lock. Any number of concurrent readers is fine,
// but callers must not rely on a query seeing a consistent snapshot while
// another thread is mutating.
class KnowledgeBase {
 public:
  KnowledgeBase() = default;
  KnowledgeBase(const KnowledgeBase&) = delete;
  KnowledgeBase& operator=(const KnowledgeBase&) = delete;

  // Register a station, or overwrite the line and coordinates of an already
  // registered station with the same name.
  //
  // Throws InvalidStationError if `name` is empty.
  void AddStation(
      const std::string& name,
      const std::string& line,
      std::optional<Coordinates> coordinates = std::nullopt
  );

  // Register a connection usable in both directions, replacing any previous
  // weights between the same two stations.
  //
  // Throws InvalidConnectionError if either weight is negative or NaN. The
  // knowledge base is unchanged when this throws.
  void AddConnection(
      const std::string& a,
      const std::string& b,
      double distance_km,
      double time_min
  );

  // All connections incident to `station`, in registration order.
  //
  // Throws UnknownStationError if `station` is not registered.
  std::vector<Neighbor> NeighborsOf(const std::string& station) const;

  // Whether travelling between `a` and `b` means changing lines.
  //
  // Throws UnknownStationError if either station is not registered.
  bool RequiresTransfer(const std::string& a, const std::string& b) const;

  // Great-circle distance in kilometers between the two stations.
  //
  // Throws UnknownStationError or MissingCoordinatesError.
  double EstimateHeuristic(const std::string& a, const std::string& b) const;

  // Like EstimateHeuristic, but returns nullopt when either station has no
  // coordinates. Still throws UnknownStationError.
  std::optional<double> TryEstimateHeuristic(
      const std::string& a, const std::string& b
  ) const;

  // Scan all stored connections for dangling references, invalid weights,
  // asymmetric storage and duplicates. Never throws. An empty result means the
  // network is consistent.
  std::vector<ConsistencyViolation> ValidateConsistency() const;

  // True when every registered station has coordinates. Vacuously true for
  // an empty knowledge base.
  bool AllStationsHaveCoordinates() const;

  bool HasStation(const std::string& name) const;

  // Throws UnknownStationError if `name` is not registered.
  Station GetStation(const std::string& name) const;

  // All stations, sorted by name.
  std::vector<Station> Stations() const;

  // One entry per connected pair, in registration order.
  std::vector<Connection> Connections() const;

  // Each connection rendered as "connects(A, B, distance, time)", in
  // registration order.
  std::vector<std::string> ConnectionFacts() const;

  size_t StationCount() const;
  size_t ConnectionCount() const;

 private:
  // Caller holds the lock.
  const Station& StationOrThrow(const std::string& name) const;

  // Insert or overwrite the `from` -> `to` direction. Caller holds the lock.
  void UpsertDirected(
      const std::string& from,
      const std::string& to,
      double distance_km,
      double time_min
  );

  mutable std::shared_mutex mutex_;

  std::unordered_map<std::string, Station> stations_;

  // Station name -> connections leaving it, in registration order.
  std::unordered_map<std::string, std::vector<Neighbor>> adjacent_;

  // Unordered pairs in registration order, stored with the endpoint order of
  // their first registration.
  std::vector<std::pair<std::string, std::string>> connection_order_;
};

}  // namespace transit_router
