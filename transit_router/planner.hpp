#pragma once
#include <string>
#include <vector>
#include "algorithms.hpp"
#include "config.hpp"
#include "graph.hpp"
#include "schedule_store.hpp"
#include "nlohmann/json.hpp"

struct LoadResult {
    LoadStatus status = LoadStatus::DataUnavailable;
    Graph graph;
    BuildStats stats;
};

LoadResult load_graph(const ScheduleSnapshot &snap, const RouterConfig &cfg);
LoadResult load_graph(const std::string &store_path, const RouterConfig &cfg);

enum class SearchMode { AStar, Dijkstra };

struct RouteResult {
    bool possible = false;
    SearchError error = SearchError::None;
    double total_seconds = 0.0;
    std::vector<std::string> path;
    std::vector<Edge> legs;     // path[i] -> path[i+1]
    SearchStats stats;
};

RouteResult plan_route(const Graph &g, const std::string &origin, const std::string &destination,
                       const RouterConfig &cfg, SearchMode mode = SearchMode::AStar);

nlohmann::json route_to_json(const RouteResult &r);
