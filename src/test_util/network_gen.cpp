#include "test_util/network_gen.h"

#include <rapidcheck.h>

#include <string>
#include <utility>
#include <vector>

namespace transit_router {

namespace {

struct StationSeed {
  int line;
  int lat_millis;
  int lon_millis;
  // Only consulted for WithCoordinates::kSome.
  bool has_coordinates;
};

struct ConnectionSeed {
  int a;
  int b;
  // Distance is the great-circle distance stretched by (1 + slack / 10).
  int slack;
  int time_min;
};

std::string StationName(int index) { return "S" + std::to_string(index); }

}  // namespace

rc::Gen<NetworkConfig> GenNetworkConfig(
    std::optional<rc::Gen<WithCoordinates>> with_coordinates_gen
) {
  rc::Gen<WithCoordinates> with_coordinates_gen_defaulted =
      with_coordinates_gen.value_or(
          rc::gen::element(
              WithCoordinates::kNo, WithCoordinates::kYes, WithCoordinates::kSome
          )
      );

  return rc::gen::mapcat(std::move(with_coordinates_gen_defaulted), [](WithCoordinates with_coordinates) -> rc::Gen<NetworkConfig> {
    return rc::gen::mapcat(rc::gen::inRange(2, 10), [with_coordinates](int num_stations) -> rc::Gen<NetworkConfig> {
      auto station_gen = rc::gen::apply([](int line, int lat, int lon, bool has_coordinates) -> StationSeed {
        return StationSeed{line, lat, lon, has_coordinates};
      }, rc::gen::inRange(0, 3), rc::gen::inRange(0, 100), rc::gen::inRange(0, 100), rc::gen::arbitrary<bool>());

      auto connection_gen = rc::gen::apply([num_stations](int a, int b_offset, int slack, int time_min) -> ConnectionSeed {
        return ConnectionSeed{a, (a + b_offset) % num_stations, slack, time_min};
      }, rc::gen::inRange(0, num_stations), rc::gen::inRange(1, num_stations), rc::gen::inRange(0, 20), rc::gen::inRange(0, 30));

      return rc::gen::apply([with_coordinates](std::vector<StationSeed> stations, std::vector<ConnectionSeed> connections) -> NetworkConfig {
        NetworkConfig config;
        config.name = "generated";
        for (size_t i = 0; i < stations.size(); ++i) {
          Station station{
              .name = StationName(static_cast<int>(i)),
              .line = std::string(1, static_cast<char>('A' + stations[i].line)),
              .coordinates = std::nullopt,
          };
          if (with_coordinates == WithCoordinates::kYes ||
              (with_coordinates == WithCoordinates::kSome &&
               stations[i].has_coordinates)) {
            station.coordinates = Coordinates{
                4.6 + stations[i].lat_millis / 1000.0,
                -74.1 + stations[i].lon_millis / 1000.0,
            };
          }
          config.stations.push_back(std::move(station));
        }
        for (const ConnectionSeed& seed : connections) {
          const Station& a = config.stations[seed.a];
          const Station& b = config.stations[seed.b];
          double base_km = 1.0;
          if (a.coordinates.has_value() && b.coordinates.has_value()) {
            base_km = HaversineKm(*a.coordinates, *b.coordinates);
          }
          config.connections.push_back(Connection{
              .a = a.name,
              .b = b.name,
              .distance_km = base_km * (1.0 + seed.slack / 10.0),
              .time_min = static_cast<double>(seed.time_min),
          });
        }
        return config;
      }, rc::gen::container<std::vector<StationSeed>>(num_stations, station_gen), rc::gen::container<std::vector<ConnectionSeed>>(connection_gen));
    });
  });
}

void showValue(const NetworkConfig& config, std::ostream& os) {
  os << "NetworkConfig{\n";
  os << "  stations=[\n";
  for (const Station& station : config.stations) {
    os << "    " << station << "\n";
  }
  os << "  ]\n";
  os << "  connections=[\n";
  for (const Connection& connection : config.connections) {
    os << "    " << connection << "\n";
  }
  os << "  ]\n";
  os << "}";
}

}  // namespace transit_router
