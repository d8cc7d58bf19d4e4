#include <CLI/CLI.hpp>
#include <format>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "analysis/network_analysis.h"
#include "config/network_config.h"
#include "engine/inference_engine.h"
#include "log.h"
#include "network/knowledge_base.h"

using namespace transit_router;

void PrintExplanation(const RouteExplanation& explanation, double total_cost) {
  std::cout << explanation.origin << " (" << explanation.origin_line
            << ") -> " << explanation.destination << " ("
            << explanation.destination_line << ")\n";
  for (size_t i = 0; i < explanation.segments.size(); ++i) {
    const RouteSegment& segment = explanation.segments[i];
    std::cout << std::format(
        "  {:>2}. {} -> {}  {:.1f} km, {:.0f} min",
        i + 1,
        segment.from,
        segment.to,
        segment.distance_km,
        segment.time_min
    );
    if (segment.is_transfer) {
      std::cout << "  [transfer " << segment.from_line << " -> "
                << segment.to_line << "]";
    }
    std::cout << "\n";
  }

  const RouteStatistics& s = explanation.statistics;
  std::cout << std::format(
      "Stations: {}  Transfers: {}  Distance: {:.1f} km  Time: {:.0f} min  "
      "Cost: {:.2f}\n",
      s.station_count,
      s.transfer_count,
      s.total_distance_km,
      s.total_time_min,
      total_cost
  );
  std::cout << std::format(
      "Expanded {} stations (efficiency {:.1f}%)\n",
      s.nodes_expanded,
      s.efficiency_ratio * 100.0
  );
}

void PrintViolations(const std::vector<ConsistencyViolation>& violations) {
  for (const ConsistencyViolation& violation : violations) {
    std::cout << violation.message << std::endl;
  }
}

void PrintRecord(const char* label, const std::optional<RouteRecord>& record) {
  if (!record.has_value()) {
    return;
  }
  const RouteStatistics& s = record->route.statistics;
  std::cout << std::format(
      "  {:<15} {} -> {} ({} stations, {} transfers, {:.0f} min, "
      "expanded {})\n",
      label,
      record->origin,
      record->destination,
      s.station_count,
      s.transfer_count,
      s.total_time_min,
      s.nodes_expanded
  );
}

void PrintAnalysis(const NetworkAnalysis& analysis) {
  std::cout << std::format(
      "Routes found: {}/{} ({:.1f}%)\n",
      analysis.routes_found,
      analysis.total_pairs,
      analysis.success_rate * 100.0
  );
  if (analysis.routes_found > 0) {
    std::cout << std::format(
        "Path length: avg {:.2f}, min {}, max {}\n",
        analysis.average_path_length,
        analysis.min_path_length,
        analysis.max_path_length
    );
    std::cout << std::format(
        "Averages: {:.2f} transfers, {:.2f} km, {:.1f} min, {:.1f} stations "
        "expanded\n",
        analysis.average_transfers,
        analysis.average_distance_km,
        analysis.average_time_min,
        analysis.average_nodes_expanded
    );
    std::cout << "Extremes:\n";
    PrintRecord("longest", analysis.extremes.longest);
    PrintRecord("most transfers", analysis.extremes.most_transfers);
    PrintRecord("fastest", analysis.extremes.fastest);
    PrintRecord("most efficient", analysis.extremes.most_efficient);
  }
  std::cout << std::format(
      "Heuristic: {} violations in {} checks\n",
      analysis.heuristic_violations.size(),
      analysis.heuristic_checks
  );
  for (const HeuristicViolation& v : analysis.heuristic_violations) {
    std::cout << std::format(
        "  {} -> {}: estimate {:.3f} km > shortest {:.3f} km\n",
        v.origin,
        v.destination,
        v.estimate_km,
        v.shortest_distance_km
    );
  }
}

int main(int argc, char* argv[]) {
  CLI::App app{"Find and analyze routes in a transit network"};
  app.require_subcommand(1);
  app.fallthrough();

  std::string network_path;
  bool verbose = false;
  double transfer_penalty = 0.0;

  app.add_option("network_path", network_path, "Path to TOML network file")
      ->required()
      ->check(CLI::ExistingFile);
  app.add_flag("--verbose", verbose, "Log loading and search progress");
  CLI::Option* transfer_penalty_opt = app.add_option(
      "--transfer-penalty",
      transfer_penalty,
      "Override the network's transfer penalty (km)"
  );

  CLI::App* route_cmd =
      app.add_subcommand("route", "Find the optimal route between stations");
  std::string origin;
  std::string destination;
  bool route_json = false;
  bool no_heuristic = false;
  route_cmd->add_option("--from", origin, "Origin station")->required();
  route_cmd->add_option("--to", destination, "Destination station")
      ->required();
  route_cmd->add_flag("--json", route_json, "Print JSON");
  route_cmd->add_flag(
      "--no-heuristic", no_heuristic, "Use uniform-cost search (h = 0)"
  );

  CLI::App* validate_cmd =
      app.add_subcommand("validate", "Check the network for inconsistencies");

  CLI::App* analyze_cmd =
      app.add_subcommand("analyze", "Route every pair of stations");
  bool analyze_json = false;
  analyze_cmd->add_flag("--json", analyze_json, "Print JSON");

  CLI::App* facts_cmd =
      app.add_subcommand("facts", "Print the registered connections");

  CLI11_PARSE(app, argc, argv);

  try {
    TextLogger logger = verbose ? OstreamLogger(std::cerr) : NullLogger();

    NetworkConfig config = NetworkConfigLoad(network_path);
    KnowledgeBase kb;
    PopulateKnowledgeBase(config, kb, logger);

    // Queries on a network with dangling or asymmetric connections can fail
    // halfway through an unrelated search. Refuse them up front.
    if (route_cmd->parsed() || analyze_cmd->parsed()) {
      RequireConsistentNetwork(kb);
    }

    InferenceEngineOptions options{
        .transfer_penalty = transfer_penalty_opt->count() > 0
                                ? transfer_penalty
                                : config.transfer_penalty,
        .use_heuristic = !no_heuristic,
    };
    InferenceEngine engine(kb, options, logger);

    if (route_cmd->parsed()) {
      Route route = engine.FindOptimalRoute(origin, destination);
      RouteExplanation explanation =
          engine.ExplainRoute(route.path, route.statistics);
      if (route_json) {
        nlohmann::json output;
        output["route"] = route;
        output["explanation"] = explanation;
        std::cout << output.dump(2) << std::endl;
      } else {
        PrintExplanation(explanation, route.total_cost);
      }
    } else if (validate_cmd->parsed()) {
      std::vector<ConsistencyViolation> violations = kb.ValidateConsistency();
      PrintViolations(violations);
      if (!violations.empty()) {
        std::cerr << violations.size() << " violations found" << std::endl;
        return 1;
      }
      std::cout << "Network '" << config.name << "' is consistent: "
                << kb.StationCount() << " stations, " << kb.ConnectionCount()
                << " connections" << std::endl;
    } else if (analyze_cmd->parsed()) {
      NetworkAnalysis analysis = AnalyzeNetwork(engine, {}, logger);
      if (analyze_json) {
        std::cout << nlohmann::json(analysis).dump(2) << std::endl;
      } else {
        PrintAnalysis(analysis);
      }
    } else if (facts_cmd->parsed()) {
      for (const std::string& fact : kb.ConnectionFacts()) {
        std::cout << fact << std::endl;
      }
    }
  } catch (const InconsistentNetworkError& e) {
    PrintViolations(e.violations());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
