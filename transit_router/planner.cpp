#include "planner.hpp"

using json = nlohmann::json;

LoadResult load_graph(const ScheduleSnapshot &snap, const RouterConfig &cfg) {
    LoadResult out;
    if (snap.stops.empty()) return out;

    out.graph = build_graph(snap.stops, snap.segments, snap.transfers, cfg.build, &out.stats);
    out.stats.malformed_skipped += snap.malformed_rows;
    if (out.graph.nodeCount() == 0) return out;

    out.status = LoadStatus::Ok;
    return out;
}

LoadResult load_graph(const std::string &store_path, const RouterConfig &cfg) {
    ScheduleSnapshot snap;
    if (load_snapshot(store_path, snap) != LoadStatus::Ok) return LoadResult{};
    return load_graph(snap, cfg);
}

RouteResult plan_route(const Graph &g, const std::string &origin, const std::string &destination,
                       const RouterConfig &cfg, SearchMode mode) {
    SPResult sp;
    if (mode == SearchMode::Dijkstra) {
        sp = dijkstra(g, origin, destination);
    } else {
        SearchOptions opt;
        opt.time_budget_ms = cfg.search.time_budget_ms;
        sp = astar(g, origin, destination, make_haversine_heuristic(g, cfg.heuristic), opt);
    }

    RouteResult r;
    r.possible = sp.possible;
    r.error = sp.error;
    r.stats = sp.stats;
    if (!sp.possible) return r;

    r.total_seconds = sp.cost;
    r.path = std::move(sp.path);
    for (size_t i = 0; i + 1 < r.path.size(); i++) {
        const Edge *e = g.findEdge(r.path[i], r.path[i + 1]);
        if (e) r.legs.push_back(*e);
    }
    return r;
}

json route_to_json(const RouteResult &r) {
    json out;
    out["possible"] = r.possible;
    if (!r.possible) {
        out["error"] = search_error_name(r.error);
        return out;
    }

    out["total_seconds"] = r.total_seconds;
    out["path"] = r.path;
    json legs = json::array();
    for (const auto &e : r.legs) {
        json leg;
        leg["from"] = e.from;
        leg["to"] = e.to;
        leg["kind"] = edge_kind_name(e.kind);
        leg["weight"] = e.weight;
        if (e.route) leg["route"] = *e.route;
        legs.push_back(leg);
    }
    out["legs"] = legs;
    return out;
}
