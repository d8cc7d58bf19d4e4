#include "analysis/network_analysis.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "test_util/sample_network.h"

using ::testing::AllOf;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::SizeIs;

namespace transit_router {

TEST(NetworkAnalysisTest, TransMilenioSample) {
  KnowledgeBase kb;
  BuildTransMilenioSample(kb);
  InferenceEngine engine(kb);

  NetworkAnalysis analysis = AnalyzeNetwork(engine);

  EXPECT_EQ(analysis.total_pairs, 240);
  EXPECT_EQ(analysis.routes_found, 240);
  EXPECT_DOUBLE_EQ(analysis.success_rate, 1.0);
  EXPECT_THAT(analysis.routes, SizeIs(240));
  EXPECT_EQ(analysis.min_path_length, 2);
  EXPECT_EQ(analysis.max_path_length, 11);
  EXPECT_NEAR(analysis.average_transfers, 278.0 / 240.0, 1e-9);

  ASSERT_TRUE(analysis.extremes.longest.has_value());
  EXPECT_EQ(analysis.extremes.longest->origin, "Portal Americas");
  EXPECT_EQ(analysis.extremes.longest->destination, "Portal Norte");
  EXPECT_EQ(analysis.extremes.longest->route.statistics.station_count, 11);

  ASSERT_TRUE(analysis.extremes.most_transfers.has_value());
  EXPECT_EQ(analysis.extremes.most_transfers->origin, "Alcala");
  EXPECT_EQ(analysis.extremes.most_transfers->destination, "CAD");
  EXPECT_EQ(analysis.extremes.most_transfers->route.statistics.transfer_count, 2);

  ASSERT_TRUE(analysis.extremes.fastest.has_value());
  EXPECT_EQ(analysis.extremes.fastest->origin, "CAD");
  EXPECT_EQ(analysis.extremes.fastest->destination, "Centro Memoria");
  EXPECT_DOUBLE_EQ(
      analysis.extremes.fastest->route.statistics.total_time_min, 2.0
  );

  ASSERT_TRUE(analysis.extremes.most_efficient.has_value());
  EXPECT_EQ(analysis.extremes.most_efficient->origin, "Alcala");
  EXPECT_EQ(analysis.extremes.most_efficient->destination, "Calle 100");
}

TEST(NetworkAnalysisTest, TransMilenioHeuristicAudit) {
  KnowledgeBase kb;
  BuildTransMilenioSample(kb);
  InferenceEngine engine(kb);

  NetworkAnalysis analysis = AnalyzeNetwork(engine);

  // A few of the sample's connections are shorter than the great-circle
  // distance between their endpoints.
  EXPECT_EQ(analysis.heuristic_checks, 240);
  EXPECT_THAT(analysis.heuristic_violations, SizeIs(96));
  EXPECT_THAT(
      analysis.heuristic_violations,
      Contains(AllOf(
          Field(&HeuristicViolation::origin, "Zona Industrial"),
          Field(&HeuristicViolation::destination, "Centro Memoria"),
          Field(&HeuristicViolation::shortest_distance_km, 1.2)
      ))
  );
  for (const HeuristicViolation& v : analysis.heuristic_violations) {
    EXPECT_GT(v.estimate_km, v.shortest_distance_km);
  }
}

TEST(NetworkAnalysisTest, DisconnectedStationLowersSuccessRate) {
  KnowledgeBase kb;
  BuildThreeStationLine(kb);
  kb.AddStation("S", "3");
  InferenceEngine engine(kb);

  NetworkAnalysis analysis = AnalyzeNetwork(engine);

  EXPECT_EQ(analysis.total_pairs, 12);
  EXPECT_EQ(analysis.routes_found, 6);
  EXPECT_DOUBLE_EQ(analysis.success_rate, 0.5);
  EXPECT_EQ(analysis.min_path_length, 2);
  EXPECT_EQ(analysis.max_path_length, 3);

  // S has no coordinates and no routes, so only the line is audited. Its
  // 1 km connections span a degree of longitude each.
  EXPECT_EQ(analysis.heuristic_checks, 6);
  EXPECT_THAT(analysis.heuristic_violations, SizeIs(6));
}

TEST(NetworkAnalysisTest, SelectedStations) {
  KnowledgeBase kb;
  BuildThreeStationLine(kb);
  InferenceEngine engine(kb);

  NetworkAnalysis analysis = AnalyzeNetwork(engine, {"P", "R"});

  EXPECT_EQ(analysis.total_pairs, 2);
  ASSERT_THAT(analysis.routes, SizeIs(2));
  EXPECT_EQ(analysis.routes[0].origin, "P");
  EXPECT_EQ(analysis.routes[0].destination, "R");
  EXPECT_THAT(analysis.routes[0].route.path, ElementsAre("P", "Q", "R"));
  EXPECT_DOUBLE_EQ(analysis.routes[0].route.total_cost, 4.0);
  EXPECT_DOUBLE_EQ(analysis.average_path_length, 3.0);
  EXPECT_DOUBLE_EQ(analysis.average_transfers, 1.0);
  EXPECT_DOUBLE_EQ(analysis.average_time_min, 4.0);

  EXPECT_THROW(AnalyzeNetwork(engine, {"P", "Nowhere"}), UnknownStationError);
}

TEST(NetworkAnalysisTest, NoRoutes) {
  KnowledgeBase kb;
  kb.AddStation("A", "1");
  kb.AddStation("B", "2");
  InferenceEngine engine(kb);

  NetworkAnalysis analysis = AnalyzeNetwork(engine);

  EXPECT_EQ(analysis.total_pairs, 2);
  EXPECT_EQ(analysis.routes_found, 0);
  EXPECT_DOUBLE_EQ(analysis.success_rate, 0.0);
  EXPECT_FALSE(analysis.extremes.longest.has_value());
  EXPECT_FALSE(analysis.extremes.fastest.has_value());
  EXPECT_EQ(analysis.heuristic_checks, 0);
  EXPECT_THAT(analysis.routes, IsEmpty());
}

TEST(NetworkAnalysisTest, SerializesToJson) {
  KnowledgeBase kb;
  kb.AddStation("A", "1");
  kb.AddStation("B", "2");
  kb.AddConnection("A", "B", 1.5, 3.0);
  InferenceEngine engine(kb);

  nlohmann::json j = AnalyzeNetwork(engine);

  EXPECT_EQ(j["total_pairs"], 2);
  EXPECT_EQ(j["routes_found"], 2);
  EXPECT_EQ(j["extremes"]["longest"]["origin"], "A");
  EXPECT_EQ(j["extremes"]["longest"]["route"]["path"][1], "B");
  EXPECT_DOUBLE_EQ(j["routes"][0]["route"]["total_cost"].get<double>(), 3.5);
  EXPECT_TRUE(j["heuristic_violations"].empty());
}

}  // namespace transit_router
