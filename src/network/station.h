#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>

#include "serialization/optional.h"

namespace transit_router {

struct Coordinates {
  double lat;
  double lon;

  bool operator==(const Coordinates& other) const {
    return lat == other.lat && lon == other.lon;
  }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Coordinates, lat, lon);

struct Station {
  std::string name;
  std::string line;
  std::optional<Coordinates> coordinates;

  bool operator==(const Station& other) const {
    return name == other.name && line == other.line &&
           coordinates == other.coordinates;
  }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Station, name, line, coordinates);

// One direction of a registered connection, as seen from the station whose
// adjacency list holds it.
struct Neighbor {
  std::string station;
  double distance_km;
  double time_min;

  bool operator==(const Neighbor& other) const {
    return station == other.station && distance_km == other.distance_km &&
           time_min == other.time_min;
  }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Neighbor, station, distance_km, time_min);

// A registered connection between two stations. Traversable in both
// directions with the same weights.
struct Connection {
  std::string a;
  std::string b;
  double distance_km;
  double time_min;

  bool operator==(const Connection& other) const {
    return a == other.a && b == other.b && distance_km == other.distance_km &&
           time_min == other.time_min;
  }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Connection, a, b, distance_km, time_min);

// Great-circle distance in kilometers.
double HaversineKm(const Coordinates& from, const Coordinates& to);

// Output operators for debugging/logging
inline std::ostream& operator<<(std::ostream& os, const Coordinates& value) {
  return os << "(" << value.lat << ", " << value.lon << ")";
}

inline std::ostream& operator<<(std::ostream& os, const Station& value) {
  os << "Station{" << value.name << ", line: " << value.line;
  if (value.coordinates.has_value()) {
    os << ", at: " << *value.coordinates;
  }
  return os << "}";
}

inline std::ostream& operator<<(std::ostream& os, const Neighbor& value) {
  return os << "Neighbor{" << value.station << ", " << value.distance_km
            << " km, " << value.time_min << " min}";
}

inline std::ostream& operator<<(std::ostream& os, const Connection& value) {
  return os << "Connection{" << value.a << " <-> " << value.b << ", "
            << value.distance_km << " km, " << value.time_min << " min}";
}

}  // namespace transit_router
