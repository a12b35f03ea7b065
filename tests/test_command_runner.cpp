#include <gtest/gtest.h>
#include "../platform/desktop/CommandRunner.hpp"
#include "../core/adapters/InMemoryTrackingStore.hpp"
#include "../core/adapters/InMemoryCache.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <sstream>

using namespace geotrack;

class CommandRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        auto store = std::make_shared<adapters::InMemoryTrackingStore>();
        auto cache = std::make_shared<adapters::InMemoryCache>(clock_);
        engine_ = std::make_unique<domain::TrackingEngine>(
            EngineConfig{}, store, cache, clock_, std::make_shared<StandardRng>(3));
        runner_ = std::make_unique<CommandRunner>(*engine_);
    }

    nlohmann::json run(const std::string& line) {
        return runner_->executeLine(line);
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::unique_ptr<domain::TrackingEngine> engine_;
    std::unique_ptr<CommandRunner> runner_;
};

TEST_F(CommandRunnerTest, StartIngestStop) {
    auto started = run(R"({"cmd":"start","tripId":"t1","userId":"u1"})");
    ASSERT_TRUE(started["ok"].get<bool>());
    EXPECT_EQ(started["result"]["status"], "active");
    EXPECT_EQ(started["events"][0]["type"], "tracking_started");

    auto ingested = run(R"({"cmd":"ingest","tripId":"t1","userId":"u1",
        "sample":{"coordinates":{"lat":40.7128,"lon":-74.006},"ts":"2023-11-14T22:13:20Z"}})");
    ASSERT_TRUE(ingested["ok"].get<bool>());
    EXPECT_TRUE(ingested["result"].contains("sampleId"));
    EXPECT_DOUBLE_EQ(ingested["result"]["totalDistanceKm"].get<double>(), 0.0);
    EXPECT_TRUE(ingested["result"]["latest"].get<bool>());

    auto stopped = run(R"({"cmd":"stop","tripId":"t1","reason":"done"})");
    ASSERT_TRUE(stopped["ok"].get<bool>());
    EXPECT_EQ(stopped["result"]["status"], "stopped");
    EXPECT_EQ(stopped["result"]["stopReason"], "done");
}

TEST_F(CommandRunnerTest, ErrorsCarryKindName) {
    run(R"({"cmd":"start","tripId":"t1","userId":"u1"})");

    auto bad = run(R"({"cmd":"ingest","tripId":"t1","userId":"u1","sample":{"coordinates":{"lat":95,"lon":0}}})");
    EXPECT_FALSE(bad["ok"].get<bool>());
    EXPECT_EQ(bad["error"], "invalid_coordinates");

    auto again = run(R"({"cmd":"start","tripId":"t1","userId":"u1"})");
    EXPECT_EQ(again["error"], "session_already_active");

    auto missing = run(R"({"cmd":"stop","tripId":"nope"})");
    EXPECT_EQ(missing["error"], "session_not_found");
}

TEST_F(CommandRunnerTest, BadRequests) {
    EXPECT_EQ(run("{not json")["error"], "bad_request");
    EXPECT_EQ(run(R"({"tripId":"t1"})")["error"], "bad_request");
    EXPECT_EQ(run(R"({"cmd":"teleport"})")["error"], "bad_request");
    EXPECT_EQ(run(R"({"cmd":"start","tripId":"t1"})")["error"], "bad_request");
}

TEST_F(CommandRunnerTest, BatchEchoesRejectedInput) {
    run(R"({"cmd":"start","tripId":"t1","userId":"u1"})");

    auto result = run(R"({"cmd":"batch","tripId":"t1","userId":"u1","samples":[
        {"coordinates":{"lat":40.0,"lon":-74.0}},
        {"coordinates":{"lat":40.0,"lon":-74.0},"speed":900}
    ]})");

    ASSERT_TRUE(result["ok"].get<bool>());
    EXPECT_EQ(result["result"]["successful"], 1);
    EXPECT_EQ(result["result"]["failed"], 1);

    const auto& rejected = result["result"]["items"][1];
    EXPECT_FALSE(rejected["success"].get<bool>());
    EXPECT_EQ(rejected["error"], "invalid_speed");
    EXPECT_DOUBLE_EQ(rejected["input"]["speed"].get<double>(), 900.0);
}

TEST_F(CommandRunnerTest, GeofenceInspectAndSweep) {
    auto created = run(R"({"cmd":"geofence","geofence":{"name":"Depot","tripId":"t1","kind":"pickup",
        "geometry":{"type":"circle","center":{"lat":40.0,"lon":-74.0},"radius":100}}})");
    ASSERT_TRUE(created["ok"].get<bool>());
    const std::string id = created["result"]["id"].get<std::string>();

    nlohmann::json inspect = {
        {"cmd", "inspect"},
        {"point", {{"lat", 40.0}, {"lon", -74.0}}},
        {"geofenceIds", nlohmann::json::array({id})}
    };
    auto inspected = runner_->execute(inspect);
    ASSERT_TRUE(inspected["ok"].get<bool>());
    EXPECT_TRUE(inspected["result"][0]["isInside"].get<bool>());

    auto presets = run(R"({"cmd":"delivery_geofences","tripId":"t1",
        "pickup":{"lat":40.0,"lon":-74.0},"dropoff":{"lat":40.1,"lon":-74.1}})");
    ASSERT_TRUE(presets["ok"].get<bool>());
    EXPECT_EQ(presets["result"].size(), 2u);

    auto badZone = run(R"({"cmd":"geofence","geofence":{"name":"Bad",
        "geometry":{"type":"circle","center":{"lat":40.0,"lon":-74.0},"radius":20000}}})");
    EXPECT_EQ(badZone["error"], "geofence_geometry_error");

    auto sweep = run(R"({"cmd":"sweep"})");
    EXPECT_EQ(sweep["result"]["staleSessionsStopped"], 0);
}

TEST_F(CommandRunnerTest, RunCountsFailures) {
    std::istringstream input(
        "{\"cmd\":\"start\",\"tripId\":\"t1\",\"userId\":\"u1\"}\n"
        "\n"
        "{\"cmd\":\"pause\",\"tripId\":\"t1\"}\n"
        "{\"cmd\":\"pause\",\"tripId\":\"t1\"}\n"
        "{\"cmd\":\"history\",\"tripId\":\"t1\"}\n");
    std::ostringstream output;

    EXPECT_EQ(runner_->run(input, output), 1u);

    std::istringstream lines(output.str());
    std::string line;
    int responses = 0;
    while (std::getline(lines, line)) {
        ++responses;
    }
    EXPECT_EQ(responses, 4);
}
