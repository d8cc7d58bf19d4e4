#include "config/network_config.h"

#include <format>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
#include <toml++/toml.hpp>

namespace transit_router {

namespace {

template <typename T>
T Required(
    const toml::table& entry,
    std::string_view key,
    std::string_view what,
    std::string_view source
) {
  std::optional<T> value = entry[key].value<T>();
  if (!value.has_value()) {
    throw std::runtime_error(std::format(
        "{}: {} is missing '{}' (line {})",
        source,
        what,
        key,
        entry.source().begin.line
    ));
  }
  return *value;
}

const toml::table& AsTable(
    const toml::node& node, std::string_view what, std::string_view source
) {
  const toml::table* table = node.as_table();
  if (table == nullptr) {
    throw std::runtime_error(std::format(
        "{}: {} must be a table (line {})",
        source,
        what,
        node.source().begin.line
    ));
  }
  return *table;
}

Station ParseStation(const toml::table& entry, std::string_view source) {
  Station station{
      .name = Required<std::string>(entry, "name", "station", source),
      .line = Required<std::string>(entry, "line", "station", source),
      .coordinates = std::nullopt,
  };

  std::optional<double> lat = entry["lat"].value<double>();
  std::optional<double> lon = entry["lon"].value<double>();
  if (lat.has_value() != lon.has_value()) {
    throw std::runtime_error(std::format(
        "{}: station '{}' must have both lat and lon or neither (line {})",
        source,
        station.name,
        entry.source().begin.line
    ));
  }
  if (lat.has_value()) {
    station.coordinates = Coordinates{*lat, *lon};
  }
  return station;
}

Connection ParseConnection(const toml::table& entry, std::string_view source) {
  return Connection{
      .a = Required<std::string>(entry, "from", "connection", source),
      .b = Required<std::string>(entry, "to", "connection", source),
      .distance_km = Required<double>(entry, "distance_km", "connection", source),
      .time_min = Required<double>(entry, "time_min", "connection", source),
  };
}

NetworkConfig FromTable(const toml::table& config, std::string_view source) {
  NetworkConfig result;
  result.name = config["name"].value_or(std::string{});
  result.transfer_penalty = config["transfer_penalty"].value_or(2.0);

  if (const toml::array* stations = config["stations"].as_array()) {
    for (const toml::node& elem : *stations) {
      result.stations.push_back(
          ParseStation(AsTable(elem, "station", source), source)
      );
    }
  }
  if (const toml::array* connections = config["connections"].as_array()) {
    for (const toml::node& elem : *connections) {
      result.connections.push_back(
          ParseConnection(AsTable(elem, "connection", source), source)
      );
    }
  }

  if (result.stations.empty()) {
    throw std::runtime_error(
        std::format("{}: network must contain at least one station", source)
    );
  }
  return result;
}

}  // namespace

NetworkConfig NetworkConfigLoad(const std::string& config_path) {
  toml::table config;
  try {
    config = toml::parse_file(config_path);
  } catch (const toml::parse_error& err) {
    throw std::runtime_error(
        "Failed to parse network config file '" + config_path +
        "': " + std::string(err.description())
    );
  }
  return FromTable(config, config_path);
}

NetworkConfig NetworkConfigParse(
    std::string_view toml_text, std::string_view source
) {
  toml::table config;
  try {
    config = toml::parse(toml_text, source);
  } catch (const toml::parse_error& err) {
    throw std::runtime_error(std::format(
        "Failed to parse network config '{}': {}", source, err.description()
    ));
  }
  return FromTable(config, source);
}

void PopulateKnowledgeBase(
    const NetworkConfig& config,
    KnowledgeBase& knowledge_base,
    const TextLogger& logger
) {
  for (const Station& station : config.stations) {
    knowledge_base.AddStation(station.name, station.line, station.coordinates);
  }
  for (const Connection& connection : config.connections) {
    knowledge_base.AddConnection(
        connection.a, connection.b, connection.distance_km, connection.time_min
    );
  }
  Logf(
      logger,
      "Loaded network '{}': {} stations, {} connections",
      config.name,
      knowledge_base.StationCount(),
      knowledge_base.ConnectionCount()
  );
}

void RequireConsistentNetwork(const KnowledgeBase& knowledge_base) {
  std::vector<ConsistencyViolation> violations =
      knowledge_base.ValidateConsistency();
  if (!violations.empty()) {
    throw InconsistentNetworkError(std::move(violations));
  }
}

}  // namespace transit_router
