#include "gtest/gtest.h"

#include <sqlite3.h>
#include <cstdio>
#include <fstream>

#include "schedule_store.hpp"

using json = nlohmann::json;

namespace {

std::string temp_path(const std::string &name) {
    return ::testing::TempDir() + "transit_router_" + name;
}

void exec_all(const std::string &db_path, const char *sql) {
    sqlite3 *db = nullptr;
    ASSERT_EQ(SQLITE_OK, sqlite3_open(db_path.c_str(), &db));
    char *err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db);
    ASSERT_EQ(SQLITE_OK, rc) << msg;
}

// Same layout as the tables the GTFS import writes.
const char *SCHEMA = R"(
CREATE TABLE stops (stop_id TEXT, stop_name TEXT, stop_lat REAL, stop_lon REAL,
                    location_type INTEGER, parent_station TEXT);
CREATE TABLE trip_segments (trip_id TEXT, from_stop_id TEXT, to_stop_id TEXT,
                            start_time_sec INTEGER, end_time_sec INTEGER,
                            duration_sec INTEGER, route_id TEXT, service_id TEXT,
                            direction_id INTEGER);
)";

const char *TRANSFERS = R"(
CREATE TABLE transfers (from_stop_id TEXT, to_stop_id TEXT, transfer_type INTEGER,
                        min_transfer_time REAL);
INSERT INTO transfers VALUES ('101S', '103S', 2, 300.0);
INSERT INTO transfers VALUES ('103S', '104S', 2, NULL);
INSERT INTO transfers VALUES ('104S', '104S', 2, 0.0);
)";

const TravelSegmentRecord *find_segment(const std::vector<TravelSegmentRecord> &v,
                                        const std::string &from, const std::string &to) {
    for (const auto &r : v)
        if (r.from_stop_id == from && r.to_stop_id == to) return &r;
    return nullptr;
}

}  // namespace

TEST(AggregateTripSegments, KeepsMinimumPerPair) {
    std::vector<TripSegmentRow> rows = {
        {"A", "B", 120, "1"},
        {"A", "B", 90, "2"},
        {"A", "B", 90, "3"},
        {"B", "C", 60, "1"},
        {"A", "B", 150, "1"},
    };
    auto out = aggregate_trip_segments(rows);
    ASSERT_EQ(2u, out.size());

    EXPECT_EQ("A", out[0].from_stop_id);
    EXPECT_EQ("B", out[0].to_stop_id);
    EXPECT_EQ(90, out[0].weight);
    EXPECT_EQ("2", out[0].route_id);   // first row holding the minimum

    EXPECT_EQ("B", out[1].from_stop_id);
    EXPECT_EQ(60, out[1].weight);
}

TEST(AggregateTripSegments, DirectionMatters) {
    auto out = aggregate_trip_segments({{"A", "B", 10, "1"}, {"B", "A", 20, "1"}});
    ASSERT_EQ(2u, out.size());
    EXPECT_EQ(10, *find_segment(out, "A", "B")->weight);
    EXPECT_EQ(20, *find_segment(out, "B", "A")->weight);
}

TEST(AggregateTripSegments, DropsAndCountsBadRows) {
    size_t dropped = 0;
    auto out = aggregate_trip_segments({
        {"A", "B", std::nullopt, "1"},
        {"A", "B", -30, "1"},
        {"A", "B", 45, "2"},
        {"C", "D", std::nullopt, "3"},
        {"", "D", 10, "3"},
        {"", "D", 12, "3"},
    }, &dropped);
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(45, *find_segment(out, "A", "B")->weight);
    EXPECT_EQ("2", find_segment(out, "A", "B")->route_id);
    EXPECT_EQ(nullptr, find_segment(out, "C", "D"));
    EXPECT_EQ(5u, dropped);
}

TEST(SnapshotJson, BadSegmentRowsNextToGoodOnesAreCounted) {
    json j = json::parse(R"({
        "stops": [{"stop_id": "A", "stop_name": "A"}, {"stop_id": "B", "stop_name": "B"}],
        "trip_segments": [
            {"trip_id": "t1", "from_stop_id": "A", "to_stop_id": "B", "duration_sec": 120, "route_id": "1"},
            {"trip_id": "t2", "from_stop_id": "A", "to_stop_id": "B", "duration_sec": "garbage", "route_id": "1"},
            {"trip_id": "t3", "from_stop_id": "A", "to_stop_id": "B", "duration_sec": null, "route_id": "1"},
            {"trip_id": "t4", "from_stop_id": "A", "to_stop_id": "B", "duration_sec": 1e300, "route_id": "1"}
        ]
    })");

    ScheduleSnapshot snap;
    std::string err;
    ASSERT_TRUE(snapshot_from_json(j, snap, err)) << err;
    EXPECT_EQ(3u, snap.malformed_rows);
    ASSERT_EQ(1u, snap.segments.size());
    EXPECT_EQ(120, *snap.segments[0].weight);
}

TEST(SnapshotJson, OutOfRangeSecondsAreMalformed) {
    json j = json::parse(R"({
        "stops": [{"stop_id": "A"}, {"stop_id": "B"}],
        "transfers": [
            {"from_stop_id": "A", "to_stop_id": "B", "min_transfer_time": 1e300},
            {"from_stop_id": "B", "to_stop_id": "A", "min_transfer_time": 18446744073709551615},
            {"from_stop_id": "A", "to_stop_id": "B", "min_transfer_time": "soon"},
            {"from_stop_id": "B", "to_stop_id": "A", "min_transfer_time": null},
            {"from_stop_id": "A", "to_stop_id": "B", "min_transfer_time": 9.0e18}
        ]
    })");

    ScheduleSnapshot snap;
    std::string err;
    ASSERT_TRUE(snapshot_from_json(j, snap, err)) << err;
    EXPECT_EQ(3u, snap.malformed_rows);
    ASSERT_EQ(2u, snap.transfers.size());
    EXPECT_FALSE(snap.transfers[0].min_transfer_time.has_value());
    ASSERT_TRUE(snap.transfers[1].min_transfer_time.has_value());
    EXPECT_EQ(9000000000000000000L, *snap.transfers[1].min_transfer_time);
}

TEST(SnapshotJson, ParsesAllRecordSets) {
    json j = json::parse(R"({
        "stops": [
            {"stop_id": "101S", "stop_name": "Van Cortlandt Park-242 St", "stop_lat": 40.889248, "stop_lon": -73.898583},
            {"stop_id": "103S", "stop_name": "238 St", "stop_lat": null, "stop_lon": null},
            {"stop_id": 104, "stop_name": "231 St"}
        ],
        "trip_segments": [
            {"trip_id": "t1", "from_stop_id": "101S", "to_stop_id": "103S", "duration_sec": 90, "route_id": "1"},
            {"trip_id": "t2", "from_stop_id": "101S", "to_stop_id": "103S", "duration_sec": 80.0, "route_id": "1"},
            {"from_stop_id": "103S", "to_stop_id": "104", "weight": 70, "route_id": "1"},
            {"from_stop_id": "104", "to_stop_id": "103S", "weight": "fast", "route_id": "1"}
        ],
        "transfers": [
            {"from_stop_id": "101S", "to_stop_id": "103S", "min_transfer_time": 0},
            {"from_stop_id": "103S", "to_stop_id": "101S", "weight": 240}
        ]
    })");

    ScheduleSnapshot snap;
    std::string err;
    ASSERT_TRUE(snapshot_from_json(j, snap, err)) << err;

    ASSERT_EQ(3u, snap.stops.size());
    EXPECT_EQ("101S", snap.stops[0].stop_id);
    EXPECT_DOUBLE_EQ(40.889248, *snap.stops[0].stop_lat);
    EXPECT_FALSE(snap.stops[1].stop_lat.has_value());
    EXPECT_EQ("104", snap.stops[2].stop_id);
    EXPECT_FALSE(snap.stops[2].stop_lon.has_value());

    ASSERT_EQ(3u, snap.segments.size());
    EXPECT_EQ(80, *find_segment(snap.segments, "101S", "103S")->weight);
    EXPECT_EQ(70, *find_segment(snap.segments, "103S", "104")->weight);
    EXPECT_FALSE(find_segment(snap.segments, "104", "103S")->weight.has_value());

    ASSERT_EQ(2u, snap.transfers.size());
    EXPECT_EQ(0, *snap.transfers[0].min_transfer_time);
    EXPECT_EQ(240, *snap.transfers[1].min_transfer_time);
}

TEST(SnapshotJson, RejectsMissingStops) {
    ScheduleSnapshot snap;
    std::string err;
    EXPECT_FALSE(snapshot_from_json(json::parse(R"({"trip_segments": []})"), snap, err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(snapshot_from_json(json::array(), snap, err));
}

TEST(SnapshotJson, MissingFileIsDataUnavailable) {
    ScheduleSnapshot snap;
    EXPECT_EQ(LoadStatus::DataUnavailable, load_snapshot(temp_path("does_not_exist.json"), snap));
}

TEST(SnapshotJson, GarbageFileIsDataUnavailable) {
    std::string path = temp_path("garbage.json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    ScheduleSnapshot snap;
    EXPECT_EQ(LoadStatus::DataUnavailable, load_snapshot_json(path, snap));
    std::remove(path.c_str());
}

TEST(SnapshotJson, EmptyStopsIsDataUnavailable) {
    std::string path = temp_path("empty.json");
    {
        std::ofstream out(path);
        out << R"({"stops": [], "trip_segments": [], "transfers": []})";
    }
    ScheduleSnapshot snap;
    EXPECT_EQ(LoadStatus::DataUnavailable, load_snapshot(path, snap));
    std::remove(path.c_str());
}

class SqliteStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = temp_path(std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".db");
        std::remove(path_.c_str());
        exec_all(path_, SCHEMA);
    }
    void TearDown() override { std::remove(path_.c_str()); }

    std::string path_;
};

TEST_F(SqliteStoreTest, ReadsAndAggregates) {
    exec_all(path_, R"(
        INSERT INTO stops VALUES ('101S', 'Van Cortlandt Park-242 St', 40.889248, -73.898583, 0, '101');
        INSERT INTO stops VALUES ('103S', '238 St', 40.884667, -73.90087, 0, '103');
        INSERT INTO stops VALUES ('104S', '231 St', NULL, NULL, 0, '104');
        INSERT INTO trip_segments VALUES ('t1', '101S', '103S', 0, 90, 90, '1', 'Weekday', 1);
        INSERT INTO trip_segments VALUES ('t2', '101S', '103S', 600, 675, 75, '1', 'Weekday', 1);
        INSERT INTO trip_segments VALUES ('t3', '101S', '103S', 900, 800, -100, '1', 'Weekday', 1);
        INSERT INTO trip_segments VALUES ('t1', '103S', '104S', 90, 180, 90, '1', 'Weekday', 1);
        INSERT INTO trip_segments VALUES ('t4', '103S', '104S', 90, 150, 60, '9', 'Weekday', 1);
    )");
    exec_all(path_, TRANSFERS);

    ScheduleSnapshot snap;
    ASSERT_EQ(LoadStatus::Ok, load_snapshot(path_, snap));

    ASSERT_EQ(3u, snap.stops.size());
    const StopRecord *s104 = nullptr;
    for (const auto &s : snap.stops)
        if (s.stop_id == "104S") s104 = &s;
    ASSERT_NE(nullptr, s104);
    EXPECT_EQ("231 St", s104->stop_name);
    EXPECT_FALSE(s104->stop_lat.has_value());

    ASSERT_EQ(2u, snap.segments.size());
    const auto *a = find_segment(snap.segments, "101S", "103S");
    ASSERT_NE(nullptr, a);
    EXPECT_EQ(75, *a->weight);
    const auto *b = find_segment(snap.segments, "103S", "104S");
    ASSERT_NE(nullptr, b);
    EXPECT_EQ(60, *b->weight);
    EXPECT_EQ("9", b->route_id);

    ASSERT_EQ(3u, snap.transfers.size());
    EXPECT_EQ(300, *snap.transfers[0].min_transfer_time);
    EXPECT_FALSE(snap.transfers[1].min_transfer_time.has_value());
    EXPECT_EQ(0, *snap.transfers[2].min_transfer_time);

    // t3 runs backwards past midnight
    EXPECT_EQ(1u, snap.malformed_rows);
}

TEST_F(SqliteStoreTest, BadRowsAreCountedNotMerged) {
    exec_all(path_, R"(
        INSERT INTO stops VALUES ('A', 'A', 1.0, 2.0, 0, NULL);
        INSERT INTO stops VALUES ('B', 'B', 1.1, 2.1, 0, NULL);
        INSERT INTO trip_segments VALUES ('t1', 'A', 'B', 0, 120, 120, 'R', 'S', 0);
        INSERT INTO trip_segments VALUES ('t2', 'A', 'B', 0, NULL, NULL, 'R', 'S', 0);
        INSERT INTO trip_segments VALUES ('t3', 'A', 'B', 0, 0, 'garbage', 'R', 'S', 0);
        INSERT INTO trip_segments VALUES ('t4', 'A', 'B', 0, 0, -5, 'R', 'S', 0);
        INSERT INTO trip_segments VALUES ('t5', '', 'B', 0, 10, 10, 'R', 'S', 0);
        INSERT INTO trip_segments VALUES ('t6', NULL, 'B', 0, 10, 10, 'R', 'S', 0);
    )");
    exec_all(path_, R"(
        CREATE TABLE transfers (from_stop_id TEXT, to_stop_id TEXT, transfer_type INTEGER,
                                min_transfer_time REAL);
        INSERT INTO transfers VALUES ('A', 'B', 2, 1e300);
        INSERT INTO transfers VALUES ('B', 'A', 2, 9e999);
        INSERT INTO transfers VALUES ('A', 'B', 2, 'soon');
        INSERT INTO transfers VALUES ('B', 'A', 2, NULL);
    )");

    ScheduleSnapshot snap;
    ASSERT_EQ(LoadStatus::Ok, load_snapshot_sqlite(path_, snap));
    ASSERT_EQ(1u, snap.segments.size());
    EXPECT_EQ(120, *snap.segments[0].weight);
    ASSERT_EQ(1u, snap.transfers.size());
    EXPECT_FALSE(snap.transfers[0].min_transfer_time.has_value());
    EXPECT_EQ(8u, snap.malformed_rows);
}

TEST_F(SqliteStoreTest, TransfersTableIsOptional) {
    exec_all(path_, "INSERT INTO stops VALUES ('A', 'A', 1.0, 2.0, 0, NULL);");
    ScheduleSnapshot snap;
    ASSERT_EQ(LoadStatus::Ok, load_snapshot_sqlite(path_, snap));
    EXPECT_EQ(1u, snap.stops.size());
    EXPECT_TRUE(snap.transfers.empty());
}

TEST_F(SqliteStoreTest, EmptyStopsIsDataUnavailable) {
    ScheduleSnapshot snap;
    EXPECT_EQ(LoadStatus::DataUnavailable, load_snapshot_sqlite(path_, snap));
}

TEST_F(SqliteStoreTest, MissingSegmentsTableIsDataUnavailable) {
    exec_all(path_, "DROP TABLE trip_segments; INSERT INTO stops VALUES ('A', 'A', 1.0, 2.0, 0, NULL);");
    ScheduleSnapshot snap;
    EXPECT_EQ(LoadStatus::DataUnavailable, load_snapshot_sqlite(path_, snap));
}

TEST(SqliteStore, MissingDatabaseIsDataUnavailable) {
    ScheduleSnapshot snap;
    EXPECT_EQ(LoadStatus::DataUnavailable, load_snapshot_sqlite(temp_path("nope.db"), snap));
}
