#pragma once

#include <rapidcheck.h>

#include <optional>
#include <ostream>

#include "config/network_config.h"

namespace transit_router {

// Which stations get coordinates: none, all, or each one by a coin flip.
enum class WithCoordinates { kNo, kYes, kSome };

// Generate a small random network of 2 to 9 stations named "S0", "S1", ...
// spread over three lines.
//
// A connection between two stations with coordinates is at least as long as
// the great-circle distance between them, so with coordinates everywhere the
// A* heuristic is admissible. Other connections get a base length of 1 km.
rc::Gen<NetworkConfig> GenNetworkConfig(
    std::optional<rc::Gen<WithCoordinates>> with_coordinates_gen =
        std::nullopt
);

void showValue(const NetworkConfig& config, std::ostream& os);

}  // namespace transit_router
