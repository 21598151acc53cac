#pragma once
#include "graph.hpp"
#include "heuristic.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

enum class SearchError {
    None,
    NodeNotFound,       // origin or destination not in the graph
    NoPathFound,        // frontier exhausted
    DeadlineExceeded    // time budget ran out
};

const char *search_error_name(SearchError e);

struct SearchStats {
    size_t popped = 0;
    size_t finalized = 0;
    size_t pushed = 0;
};

struct SPResult {
    bool possible = false;
    SearchError error = SearchError::None;
    double cost = 0.0;                  // seconds
    std::vector<std::string> path;      // origin .. destination
    SearchStats stats;
};

struct SearchOptions {
    double time_budget_ms = 0.0;        // 0 = unbounded
};

// A* from origin to destination. Frontier ties on f are broken by insertion
// order, so identical input always yields the identical path.
SPResult astar(const Graph &g, const std::string &origin, const std::string &destination,
               const Heuristic &h, const SearchOptions &opt = {});

// Plain uniform-cost search, kept independent of astar() as a baseline.
SPResult dijkstra(const Graph &g, const std::string &origin, const std::string &destination);

// Minimum seconds from origin to every reachable station (origin included).
std::unordered_map<std::string, double> shortest_times_from(const Graph &g, const std::string &origin);
