#pragma once
#include <optional>
#include <string>
#include <vector>
#include "graph.hpp"
#include "nlohmann/json.hpp"

// Point-in-time copy of the three record sets the graph is built from.
struct ScheduleSnapshot {
    std::vector<StopRecord> stops;
    std::vector<TravelSegmentRecord> segments;
    std::vector<TransferRecord> transfers;
    // raw rows dropped while reading: bad per-trip segment rows and
    // transfers whose time is present but unreadable
    size_t malformed_rows = 0;
};

enum class LoadStatus { Ok, DataUnavailable };

// One row of the per-trip trip_segments table, before aggregation.
struct TripSegmentRow {
    std::string from_stop_id, to_stop_id;
    std::optional<long> duration_sec;
    std::string route_id;
};

// GROUP BY (from, to) keeping MIN(duration_sec). Rows with an empty stop id
// or a missing or negative duration are dropped one by one and counted in
// *dropped. The route is the one on the first row holding the minimum.
// Output is ordered by (from, to).
std::vector<TravelSegmentRecord> aggregate_trip_segments(const std::vector<TripSegmentRow> &rows,
                                                         size_t *dropped = nullptr);

// Parses {"stops": [...], "trip_segments": [...], "transfers": [...]}.
// trip_segments rows carrying "duration_sec" are aggregated; rows carrying
// "weight" are taken as already aggregated.
bool snapshot_from_json(const nlohmann::json &j, ScheduleSnapshot &snap, std::string &err);

LoadStatus load_snapshot_json(const std::string &filename, ScheduleSnapshot &snap);
LoadStatus load_snapshot_sqlite(const std::string &filename, ScheduleSnapshot &snap);

// Picks the reader from the file extension (.json, anything else is SQLite).
LoadStatus load_snapshot(const std::string &path, ScheduleSnapshot &snap);
