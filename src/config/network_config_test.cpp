#include "config/network_config.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "engine/inference_engine.h"
#include "test_util/sample_network.h"

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace transit_router {

namespace {

constexpr std::string_view kSmallNetwork = R"(
name = "Small"
transfer_penalty = 3.5

[[stations]]
name = "A"
line = "1"
lat = 4.5
lon = -74

[[stations]]
name = "B"
line = "2"

[[connections]]
from = "A"
to = "B"
distance_km = 1.5
time_min = 3
)";

std::string ParseError(std::string_view toml_text) {
  try {
    NetworkConfigParse(toml_text, "test.toml");
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return "";
}

}  // namespace

TEST(NetworkConfigTest, Parse) {
  NetworkConfig config = NetworkConfigParse(kSmallNetwork);

  EXPECT_EQ(config.name, "Small");
  EXPECT_DOUBLE_EQ(config.transfer_penalty, 3.5);
  EXPECT_THAT(
      config.stations,
      ElementsAre(
          Station{"A", "1", Coordinates{4.5, -74.0}},
          Station{"B", "2", std::nullopt}
      )
  );
  EXPECT_THAT(config.connections, ElementsAre(Connection{"A", "B", 1.5, 3.0}));
}

TEST(NetworkConfigTest, Defaults) {
  NetworkConfig config = NetworkConfigParse(R"(
[[stations]]
name = "A"
line = "1"
)");

  EXPECT_EQ(config.name, "");
  EXPECT_DOUBLE_EQ(config.transfer_penalty, 2.0);
  EXPECT_EQ(config.stations.size(), 1);
  EXPECT_THAT(config.connections, IsEmpty());
}

TEST(NetworkConfigTest, MissingKeys) {
  EXPECT_THAT(
      ParseError(R"(
[[stations]]
name = "A"
)"),
      AllOf(HasSubstr("test.toml"), HasSubstr("'line'"))
  );
  EXPECT_THAT(
      ParseError(R"(
[[stations]]
name = "A"
line = "1"

[[connections]]
from = "A"
to = "A"
time_min = 1
)"),
      HasSubstr("'distance_km'")
  );
}

TEST(NetworkConfigTest, LatitudeWithoutLongitude) {
  EXPECT_THAT(
      ParseError(R"(
[[stations]]
name = "A"
line = "1"
lat = 4.5
)"),
      HasSubstr("both lat and lon")
  );
}

TEST(NetworkConfigTest, RequiresStations) {
  EXPECT_THAT(
      ParseError("name = \"Empty\"\n"), HasSubstr("at least one station")
  );
}

TEST(NetworkConfigTest, MalformedToml) {
  EXPECT_THAT(ParseError("[[stations]\nname = "), HasSubstr("test.toml"));
  EXPECT_THAT(ParseError("stations = [1, 2]\n"), HasSubstr("must be a table"));
}

TEST(NetworkConfigTest, LoadMissingFile) {
  EXPECT_THROW(
      NetworkConfigLoad("../data/does_not_exist.toml"), std::runtime_error
  );
}

TEST(NetworkConfigTest, PopulateKnowledgeBase) {
  KnowledgeBase kb;
  std::ostringstream log;
  PopulateKnowledgeBase(
      NetworkConfigParse(kSmallNetwork), kb, OstreamLogger(log)
  );

  EXPECT_EQ(kb.StationCount(), 2);
  EXPECT_EQ(kb.ConnectionCount(), 1);
  EXPECT_THAT(kb.NeighborsOf("B"), ElementsAre(Neighbor{"A", 1.5, 3.0}));
  EXPECT_THAT(
      log.str(), HasSubstr("Loaded network 'Small': 2 stations, 1 connections")
  );
}

TEST(NetworkConfigTest, PopulateRejectsNegativeDistance) {
  NetworkConfig config = NetworkConfigParse(kSmallNetwork);
  config.connections[0].distance_km = -1.0;
  KnowledgeBase kb;
  EXPECT_THROW(PopulateKnowledgeBase(config, kb), InvalidConnectionError);
}

TEST(NetworkConfigTest, DanglingConnectionFailsConsistencyCheck) {
  NetworkConfig config = NetworkConfigParse(R"(
[[stations]]
name = "A"
line = "1"

[[stations]]
name = "B"
line = "1"

[[connections]]
from = "A"
to = "B"
distance_km = 1
time_min = 1

[[connections]]
from = "A"
to = "X"
distance_km = 1
time_min = 1
)");
  KnowledgeBase kb;
  // Loading accepts connections to unregistered stations.
  PopulateKnowledgeBase(config, kb);

  try {
    RequireConsistentNetwork(kb);
    FAIL() << "Expected InconsistentNetworkError";
  } catch (const InconsistentNetworkError& e) {
    EXPECT_THAT(
        e.violations(),
        ElementsAre(AllOf(
            Field(&ConsistencyViolation::kind, ViolationKind::kUnknownStation),
            Field(&ConsistencyViolation::message, HasSubstr("'X'"))
        ))
    );
    EXPECT_THAT(e.what(), HasSubstr("1 violation"));
  }
}

TEST(NetworkConfigTest, ConsistentNetworkPassesCheck) {
  KnowledgeBase kb;
  PopulateKnowledgeBase(NetworkConfigLoad("../data/transmilenio.toml"), kb);
  EXPECT_NO_THROW(RequireConsistentNetwork(kb));
}

TEST(NetworkConfigTest, TransMilenioFileMatchesSample) {
  NetworkConfig config = NetworkConfigLoad("../data/transmilenio.toml");
  EXPECT_EQ(config.name, "TransMilenio");

  KnowledgeBase from_file;
  PopulateKnowledgeBase(config, from_file);
  KnowledgeBase sample;
  BuildTransMilenioSample(sample);

  EXPECT_EQ(from_file.Stations(), sample.Stations());
  EXPECT_EQ(from_file.Connections(), sample.Connections());

  InferenceEngine engine(
      from_file,
      InferenceEngineOptions{.transfer_penalty = config.transfer_penalty}
  );
  Route route = engine.FindOptimalRoute("Portal Norte", "CAD");
  EXPECT_NEAR(route.total_cost, 18.2, 1e-9);
  EXPECT_EQ(route.statistics.transfer_count, 2);
}

}  // namespace transit_router
