#include "heuristic.hpp"
#include <algorithm>
#include <cmath>

static double to_rad(double deg) {
    static const double PI = std::acos(-1.0);
    return deg * PI / 180.0;
}

double haversine(double lat1, double lon1, double lat2, double lon2, double earth_radius_m) {
    double phi1 = to_rad(lat1), phi2 = to_rad(lat2);
    double dphi = to_rad(lat2 - lat1);
    double dlambda = to_rad(lon2 - lon1);

    double a = std::sin(dphi / 2) * std::sin(dphi / 2) +
               std::cos(phi1) * std::cos(phi2) *
               std::sin(dlambda / 2) * std::sin(dlambda / 2);
    a = std::min(1.0, a);
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    return earth_radius_m * c;
}

double estimate(const Graph &g, const std::string &u, const std::string &v,
                const HeuristicConfig &cfg) {
    const Station *a = g.station(u);
    const Station *b = g.station(v);
    if (!a || !b || !a->hasCoords() || !b->hasCoords())
        return 0.0;

    double dist = haversine(*a->lat, *a->lon, *b->lat, *b->lon, cfg.earth_radius_m);
    return dist / cfg.speed_mps;
}

Heuristic make_haversine_heuristic(const Graph &g, const HeuristicConfig &cfg) {
    return [&g, cfg](const std::string &u, const std::string &v) {
        return estimate(g, u, v, cfg);
    };
}

Heuristic zero_heuristic() {
    return [](const std::string &, const std::string &) { return 0.0; };
}
