#pragma once
#include <functional>
#include <string>
#include "config.hpp"
#include "graph.hpp"

// Estimated seconds from u to v. Must never overestimate.
using Heuristic = std::function<double(const std::string &u, const std::string &v)>;

// Great-circle distance in meters.
double haversine(double lat1, double lon1, double lat2, double lon2, double earth_radius_m);

// Straight-line time at cfg.speed_mps. 0 if either station is unknown or
// has no coordinates.
double estimate(const Graph &g, const std::string &u, const std::string &v,
                const HeuristicConfig &cfg = {});

// Binds estimate() to a graph. The graph must outlive the returned function.
Heuristic make_haversine_heuristic(const Graph &g, const HeuristicConfig &cfg = {});
Heuristic zero_heuristic();
