#include "schedule_store.hpp"
#include <sqlite3.h>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <memory>

using json = nlohmann::json;
using namespace std;

std::vector<TravelSegmentRecord> aggregate_trip_segments(const std::vector<TripSegmentRow> &rows,
                                                         size_t *dropped) {
    map<pair<string, string>, TravelSegmentRecord> best;
    size_t bad = 0;

    for (const auto &r : rows) {
        if (r.from_stop_id.empty() || r.to_stop_id.empty() || !r.duration_sec || *r.duration_sec < 0) {
            bad++;
            continue;
        }
        auto key = make_pair(r.from_stop_id, r.to_stop_id);
        auto it = best.find(key);
        if (it == best.end()) {
            best.emplace(key, TravelSegmentRecord{r.from_stop_id, r.to_stop_id, r.duration_sec, r.route_id});
        } else if (*r.duration_sec < *it->second.weight) {
            it->second.weight = r.duration_sec;
            it->second.route_id = r.route_id;
        }
    }

    if (dropped) *dropped = bad;
    vector<TravelSegmentRecord> out;
    out.reserve(best.size());
    for (auto &[key, rec] : best) out.push_back(std::move(rec));
    return out;
}

// Whole seconds held in a double, if it is one and fits a long.
static optional<long> whole_seconds(double d) {
    const double lo = static_cast<double>(numeric_limits<long>::min());   // -2^63, exact
    if (!std::isfinite(d) || d != std::floor(d) || d < lo || d >= -lo) return nullopt;
    return static_cast<long>(d);
}

// ------------------------------------------------------------
// JSON snapshot
// ------------------------------------------------------------
static string json_id(const json &row, const char *key) {
    if (!row.contains(key)) return "";
    const auto &v = row[key];
    if (v.is_string()) return v.get<string>();
    if (v.is_number_integer()) return to_string(v.get<long long>());
    return "";
}

static optional<double> json_real(const json &row, const char *key) {
    if (!row.contains(key) || !row[key].is_number()) return nullopt;
    double d = row[key].get<double>();
    if (!std::isfinite(d)) return nullopt;
    return d;
}

// pandas writes integer columns with gaps as floats, so 120.0 is accepted
static optional<long> json_seconds(const json &row, const char *key) {
    if (!row.contains(key)) return nullopt;
    const auto &v = row[key];
    if (v.is_number_unsigned())
        return v.get<unsigned long long>() <= static_cast<unsigned long long>(numeric_limits<long>::max())
                   ? optional<long>(static_cast<long>(v.get<unsigned long long>())) : nullopt;
    if (v.is_number_integer()) return v.get<long>();
    if (v.is_number_float()) return whole_seconds(v.get<double>());
    return nullopt;
}

// Present, not null, and still not a duration.
static bool json_bad_seconds(const json &row, const char *key) {
    return row.contains(key) && !row[key].is_null() && !json_seconds(row, key);
}

bool snapshot_from_json(const json &j, ScheduleSnapshot &snap, std::string &err) {
    if (!j.is_object() || !j.contains("stops") || !j["stops"].is_array()) {
        err = "snapshot has no \"stops\" array";
        return false;
    }

    ScheduleSnapshot s;
    for (const auto &row : j["stops"]) {
        StopRecord r;
        r.stop_id = json_id(row, "stop_id");
        r.stop_name = row.contains("stop_name") && row["stop_name"].is_string()
                          ? row["stop_name"].get<string>() : "";
        r.stop_lat = json_real(row, "stop_lat");
        r.stop_lon = json_real(row, "stop_lon");
        s.stops.push_back(std::move(r));
    }

    if (j.contains("trip_segments")) {
        vector<TripSegmentRow> raw;
        for (const auto &row : j["trip_segments"]) {
            string from = json_id(row, "from_stop_id");
            string to = json_id(row, "to_stop_id");
            string route = json_id(row, "route_id");
            if (row.contains("duration_sec")) {
                raw.push_back({from, to, json_seconds(row, "duration_sec"), route});
            } else {
                s.segments.push_back({from, to, json_seconds(row, "weight"), route});
            }
        }
        size_t dropped = 0;
        auto agg = aggregate_trip_segments(raw, &dropped);
        s.malformed_rows += dropped;
        s.segments.insert(s.segments.end(), agg.begin(), agg.end());
    }

    if (j.contains("transfers")) {
        for (const auto &row : j["transfers"]) {
            const char *key = row.contains("min_transfer_time") ? "min_transfer_time" : "weight";
            // null means "use the default"; anything else unreadable is dropped
            if (json_bad_seconds(row, key)) {
                s.malformed_rows++;
                continue;
            }
            TransferRecord r;
            r.from_stop_id = json_id(row, "from_stop_id");
            r.to_stop_id = json_id(row, "to_stop_id");
            r.min_transfer_time = json_seconds(row, key);
            s.transfers.push_back(std::move(r));
        }
    }

    snap = std::move(s);
    return true;
}

LoadStatus load_snapshot_json(const std::string &filename, ScheduleSnapshot &snap) {
    ifstream fin(filename);
    if (!fin) {
        cerr << "Could not open snapshot file: " << filename << "\n";
        return LoadStatus::DataUnavailable;
    }

    json j;
    try {
        fin >> j;
    } catch (const exception &e) {
        cerr << "Error parsing JSON: " << e.what() << "\n";
        return LoadStatus::DataUnavailable;
    }

    string err;
    if (!snapshot_from_json(j, snap, err)) {
        cerr << "Bad snapshot " << filename << ": " << err << "\n";
        return LoadStatus::DataUnavailable;
    }
    if (snap.stops.empty()) {
        cerr << "Snapshot " << filename << " has no stops\n";
        return LoadStatus::DataUnavailable;
    }
    return LoadStatus::Ok;
}

// ------------------------------------------------------------
// SQLite schedule store
// ------------------------------------------------------------
namespace {

struct DbCloser {
    void operator()(sqlite3 *db) const { sqlite3_close(db); }
};
struct StmtFinalizer {
    void operator()(sqlite3_stmt *st) const { sqlite3_finalize(st); }
};
using DbPtr = unique_ptr<sqlite3, DbCloser>;
using StmtPtr = unique_ptr<sqlite3_stmt, StmtFinalizer>;

const char *STOPS_SQL =
    "SELECT stop_id, stop_name, stop_lat, stop_lon FROM stops";

// bare route_id next to MIN() comes from the row holding the minimum
const char *SEGMENTS_SQL =
    "SELECT from_stop_id, to_stop_id, MIN(duration_sec) AS weight, route_id "
    "FROM trip_segments "
    "WHERE from_stop_id IS NOT NULL AND to_stop_id IS NOT NULL "
    "AND from_stop_id <> '' AND to_stop_id <> '' "
    "AND typeof(duration_sec) IN ('integer', 'real') AND duration_sec >= 0 "
    "GROUP BY from_stop_id, to_stop_id";

// every row SEGMENTS_SQL leaves out
const char *BAD_SEGMENTS_SQL =
    "SELECT COUNT(*) FROM trip_segments "
    "WHERE from_stop_id IS NULL OR to_stop_id IS NULL "
    "OR from_stop_id = '' OR to_stop_id = '' "
    "OR typeof(duration_sec) NOT IN ('integer', 'real') OR duration_sec < 0";

const char *TRANSFERS_SQL =
    "SELECT from_stop_id, to_stop_id, min_transfer_time FROM transfers";

string col_text(sqlite3_stmt *st, int i) {
    const unsigned char *t = sqlite3_column_text(st, i);
    return t ? string(reinterpret_cast<const char *>(t), sqlite3_column_bytes(st, i)) : "";
}

optional<double> col_real(sqlite3_stmt *st, int i) {
    switch (sqlite3_column_type(st, i)) {
    case SQLITE_INTEGER:
    case SQLITE_FLOAT:
        return sqlite3_column_double(st, i);
    default:
        return nullopt;
    }
}

optional<long> col_seconds(sqlite3_stmt *st, int i) {
    switch (sqlite3_column_type(st, i)) {
    case SQLITE_INTEGER:
        return static_cast<long>(sqlite3_column_int64(st, i));
    case SQLITE_FLOAT:
        return whole_seconds(sqlite3_column_double(st, i));
    case SQLITE_TEXT: {
        string s = col_text(st, i);
        char *end = nullptr;
        errno = 0;
        long v = strtol(s.c_str(), &end, 10);
        if (s.empty() || *end != '\0' || errno == ERANGE) return nullopt;
        return v;
    }
    default:
        return nullopt;
    }
}

bool table_exists(sqlite3 *db, const char *name) {
    sqlite3_stmt *raw = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT 1 FROM sqlite_master WHERE type IN ('table','view') AND name = ?",
                           -1, &raw, nullptr) != SQLITE_OK)
        return false;
    StmtPtr st(raw);
    sqlite3_bind_text(st.get(), 1, name, -1, SQLITE_STATIC);
    return sqlite3_step(st.get()) == SQLITE_ROW;
}

// Runs sql and hands every row to fn. Returns false on any sqlite error.
template <typename Fn>
bool for_each_row(sqlite3 *db, const char *sql, Fn fn) {
    sqlite3_stmt *raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        cerr << "SQLite prepare failed: " << sqlite3_errmsg(db) << "\n";
        return false;
    }
    StmtPtr st(raw);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) fn(st.get());
    if (rc != SQLITE_DONE) {
        cerr << "SQLite step failed: " << sqlite3_errmsg(db) << "\n";
        return false;
    }
    return true;
}

}  // namespace

LoadStatus load_snapshot_sqlite(const std::string &filename, ScheduleSnapshot &snap) {
    sqlite3 *raw = nullptr;
    int rc = sqlite3_open_v2(filename.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
    DbPtr db(raw);
    if (rc != SQLITE_OK) {
        cerr << "Could not open schedule store " << filename << ": "
             << (raw ? sqlite3_errmsg(raw) : "out of memory") << "\n";
        return LoadStatus::DataUnavailable;
    }

    if (!table_exists(db.get(), "stops") || !table_exists(db.get(), "trip_segments")) {
        cerr << "Schedule store " << filename << " lacks stops or trip_segments\n";
        return LoadStatus::DataUnavailable;
    }

    ScheduleSnapshot s;
    bool ok = for_each_row(db.get(), STOPS_SQL, [&](sqlite3_stmt *st) {
        s.stops.push_back({col_text(st, 0), col_text(st, 1), col_real(st, 2), col_real(st, 3)});
    });
    ok = ok && for_each_row(db.get(), SEGMENTS_SQL, [&](sqlite3_stmt *st) {
        s.segments.push_back({col_text(st, 0), col_text(st, 1), col_seconds(st, 2), col_text(st, 3)});
    });
    ok = ok && for_each_row(db.get(), BAD_SEGMENTS_SQL, [&](sqlite3_stmt *st) {
        s.malformed_rows += static_cast<size_t>(sqlite3_column_int64(st, 0));
    });

    // transfers.txt is optional in a feed
    if (ok && table_exists(db.get(), "transfers")) {
        ok = for_each_row(db.get(), TRANSFERS_SQL, [&](sqlite3_stmt *st) {
            optional<long> t = col_seconds(st, 2);
            // NULL means "use the default"; anything else unreadable is dropped
            if (!t && sqlite3_column_type(st, 2) != SQLITE_NULL) {
                s.malformed_rows++;
                return;
            }
            s.transfers.push_back({col_text(st, 0), col_text(st, 1), t});
        });
    }

    if (!ok) return LoadStatus::DataUnavailable;
    if (s.stops.empty()) {
        cerr << "Schedule store " << filename << " has no stops\n";
        return LoadStatus::DataUnavailable;
    }

    snap = std::move(s);
    return LoadStatus::Ok;
}

LoadStatus load_snapshot(const std::string &path, ScheduleSnapshot &snap) {
    auto dot = path.rfind('.');
    if (dot != string::npos && path.substr(dot) == ".json")
        return load_snapshot_json(path, snap);
    return load_snapshot_sqlite(path, snap);
}
