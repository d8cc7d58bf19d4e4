#include "analysis/shortest_costs.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_util/sample_network.h"

using ::testing::Pair;
using ::testing::UnorderedElementsAre;

namespace transit_router {

TEST(ShortestCostsTest, ThreeStationLine) {
  //   P --1-- Q --1-- R
  //   line 1  line 1  line 2
  KnowledgeBase kb;
  BuildThreeStationLine(kb);
  kb.AddStation("S", "3");

  EXPECT_THAT(
      ComputeShortestCosts(kb, "P", 2.0),
      UnorderedElementsAre(Pair("P", 0.0), Pair("Q", 1.0), Pair("R", 4.0))
  );
  EXPECT_THAT(
      ComputeShortestDistances(kb, "P"),
      UnorderedElementsAre(Pair("P", 0.0), Pair("Q", 1.0), Pair("R", 2.0))
  );
  EXPECT_THAT(
      ComputeShortestCosts(kb, "S", 2.0), UnorderedElementsAre(Pair("S", 0.0))
  );
  EXPECT_THROW(ComputeShortestCosts(kb, "Nowhere", 2.0), UnknownStationError);
}

TEST(ShortestCostsTest, TransMilenioFromPortalNorte) {
  KnowledgeBase kb;
  BuildTransMilenioSample(kb);

  auto costs = ComputeShortestCosts(kb, "Portal Norte", 2.0);
  EXPECT_EQ(costs.size(), kb.StationCount());
  EXPECT_NEAR(costs.at("CAD"), 18.2, 1e-9);
  EXPECT_NEAR(costs.at("Virrey"), 11.6, 1e-9);

  auto distances = ComputeShortestDistances(kb, "Portal Norte");
  EXPECT_NEAR(distances.at("CAD"), 14.2, 1e-9);
}

}  // namespace transit_router
