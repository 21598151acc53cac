#include "config.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

bool config_from_json(const json &j, RouterConfig &cfg, std::string &err) {
    if (!j.is_object()) {
        err = "config must be a JSON object";
        return false;
    }

    RouterConfig c = cfg;
    try {
        if (j.contains("heuristic")) {
            const auto &h = j["heuristic"];
            c.heuristic.earth_radius_m = h.value("earth_radius_m", c.heuristic.earth_radius_m);
            c.heuristic.speed_mps = h.value("speed_mps", c.heuristic.speed_mps);
        }
        if (j.contains("build")) {
            c.build.default_transfer_s = j["build"].value("default_transfer_s", c.build.default_transfer_s);
        }
        if (j.contains("search")) {
            c.search.time_budget_ms = j["search"].value("time_budget_ms", c.search.time_budget_ms);
        }
    } catch (const json::exception &e) {
        err = e.what();
        return false;
    }

    if (c.heuristic.earth_radius_m <= 0) {
        err = "heuristic.earth_radius_m must be positive";
        return false;
    }
    if (c.heuristic.speed_mps <= 0) {
        err = "heuristic.speed_mps must be positive";
        return false;
    }
    if (c.build.default_transfer_s < 0) {
        err = "build.default_transfer_s must not be negative";
        return false;
    }
    if (c.search.time_budget_ms < 0) {
        err = "search.time_budget_ms must not be negative";
        return false;
    }

    cfg = c;
    return true;
}

bool load_config(const std::string &filename, RouterConfig &cfg) {
    std::ifstream fin(filename);
    if (!fin) {
        std::cerr << "Could not open config file: " << filename << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
    } catch (const std::exception &e) {
        std::cerr << "Error parsing config JSON: " << e.what() << "\n";
        return false;
    }

    std::string err;
    if (!config_from_json(j, cfg, err)) {
        std::cerr << "Invalid config " << filename << ": " << err << "\n";
        return false;
    }
    return true;
}
