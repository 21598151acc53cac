#pragma once
#include <string>
#include "nlohmann/json.hpp"

struct HeuristicConfig {
    double earth_radius_m = 6371000.0;
    double speed_mps = 10.0;   // assumed max cruising speed
};

struct BuildConfig {
    long default_transfer_s = 180;
};

struct SearchConfig {
    double time_budget_ms = 0.0;   // 0 = no deadline
};

struct RouterConfig {
    HeuristicConfig heuristic;
    BuildConfig build;
    SearchConfig search;
};

// Missing keys keep their defaults. Returns false (and leaves cfg untouched)
// if a value is present but out of range.
bool config_from_json(const nlohmann::json &j, RouterConfig &cfg, std::string &err);
bool load_config(const std::string &filename, RouterConfig &cfg);
