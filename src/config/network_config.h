#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "log.h"
#include "network/knowledge_base.h"
#include "network/station.h"

namespace transit_router {

// A network description, as read from a TOML file:
//
//   name = "Example"
//   transfer_penalty = 2.0
//
//   [[stations]]
//   name = "A"
//   line = "1"
//   lat = 4.7656    # lat and lon are optional, but go together
//   lon = -74.0467
//
//   [[connections]]
//   from = "A"
//   to = "B"
//   distance_km = 1.5
//   time_min = 3
struct NetworkConfig {
  std::string name;
  double transfer_penalty = 2.0;
  std::vector<Station> stations;
  std::vector<Connection> connections;
};

// Parse a TOML network file. Throws std::runtime_error naming the file and the
// offending entry when the file is malformed or incomplete.
NetworkConfig NetworkConfigLoad(const std::string& config_path);

// Parse TOML text. `source` is used in error messages.
NetworkConfig NetworkConfigParse(
    std::string_view toml_text, std::string_view source = "<string>"
);

// Register every station, then every connection, of `config`. Errors from the
// knowledge base (empty names, negative weights) propagate.
void PopulateKnowledgeBase(
    const NetworkConfig& config,
    KnowledgeBase& knowledge_base,
    const TextLogger& logger = NullLogger()
);

// Run ValidateConsistency and throw InconsistentNetworkError carrying every
// violation if there are any. Call before trusting query results on a loaded
// network.
void RequireConsistentNetwork(const KnowledgeBase& knowledge_base);

}  // namespace transit_router
