#include "network/station.h"

#include <cmath>
#include <numbers>

namespace transit_router {

namespace {

constexpr double kEarthRadiusKm = 6371.0;

double ToRadians(double degrees) { return degrees * std::numbers::pi / 180.0; }

}  // namespace

double HaversineKm(const Coordinates& from, const Coordinates& to) {
  double d_lat = ToRadians(to.lat - from.lat);
  double d_lon = ToRadians(to.lon - from.lon);
  double lat1 = ToRadians(from.lat);
  double lat2 = ToRadians(to.lat);
  double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
             std::sin(d_lon / 2) * std::sin(d_lon / 2) * std::cos(lat1) *
                 std::cos(lat2);
  double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return kEarthRadiusKm * c;
}

}  // namespace transit_router
