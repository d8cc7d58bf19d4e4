#pragma once

#include <stdexcept>
#include <string>

namespace transit_router {

// Base class for all errors raised by the knowledge base and the engine.
class RoutingError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A referenced station name is not registered.
class UnknownStationError : public RoutingError {
 public:
  explicit UnknownStationError(const std::string& station)
      : RoutingError("Station '" + station + "' is not registered"),
        station_(station) {}

  const std::string& station() const { return station_; }

 private:
  std::string station_;
};

// A station registration with an unusable name.
class InvalidStationError : public RoutingError {
 public:
  using RoutingError::RoutingError;
};

// A connection registration with a negative (or NaN) distance or time.
class InvalidConnectionError : public RoutingError {
 public:
  using RoutingError::RoutingError;
};

// A heuristic estimate was requested for a station without coordinates.
class MissingCoordinatesError : public RoutingError {
 public:
  explicit MissingCoordinatesError(const std::string& station)
      : RoutingError("Station '" + station + "' has no coordinates"),
        station_(station) {}

  const std::string& station() const { return station_; }

 private:
  std::string station_;
};

// The origin and destination are not connected.
class RouteNotFoundError : public RoutingError {
 public:
  RouteNotFoundError(const std::string& origin, const std::string& destination)
      : RoutingError(
            "No route from '" + origin + "' to '" + destination + "'"
        ),
        origin_(origin),
        destination_(destination) {}

  const std::string& origin() const { return origin_; }
  const std::string& destination() const { return destination_; }

 private:
  std::string origin_;
  std::string destination_;
};

}  // namespace transit_router
