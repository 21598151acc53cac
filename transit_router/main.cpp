#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "config.hpp"
#include "graph.hpp"
#include "planner.hpp"

using json = nlohmann::json;

static std::string station_label(const Graph &g, const std::string &id) {
    const Station *s = g.station(id);
    return (s && !s->name.empty()) ? s->name : id;
}

static void print_route(const Graph &g, const std::string &src, const std::string &tgt,
                        const RouteResult &r) {
    if (!r.possible) {
        if (r.error == SearchError::NodeNotFound)
            std::cout << "Start or end station not found in graph: " << src << " -> " << tgt << "\n";
        else if (r.error == SearchError::DeadlineExceeded)
            std::cout << "Search ran out of time between " << src << " and " << tgt << ".\n";
        else
            std::cout << "No path found between " << src << " and " << tgt << ".\n";
        return;
    }

    std::ostringstream minutes;
    minutes << std::fixed << std::setprecision(1) << r.total_seconds / 60.0;
    std::cout << "Origin:      " << station_label(g, src) << " (" << src << ")\n"
              << "Destination: " << station_label(g, tgt) << " (" << tgt << ")\n"
              << "Total Time:  " << minutes.str() << " minutes\n"
              << "Stops:       " << r.legs.size() << "\n";

    for (size_t i = 0; i < r.legs.size() && i < 5; i++) {
        const Edge &e = r.legs[i];
        std::string mode = e.kind == EdgeKind::Travel
                               ? "Take " + e.route.value_or("?") + " line"
                               : "Transfer/Walk";
        std::cout << "  " << i + 1 << ". " << station_label(g, e.from) << " -> "
                  << station_label(g, e.to) << " (" << mode << ", " << e.weight << "s)\n";
    }
}

static json process_query(const Graph &g, const RouterConfig &cfg, const json &query) {
    json result;
    result["id"] = (query.is_object() && query.contains("id")) ? query["id"] : json();

    try {
        std::string type = query.value("type", "plan_route");
        if (type != "plan_route") {
            result["error"] = "unknown query type: " + type;
            return result;
        }

        std::string src = query.at("origin");
        std::string tgt = query.at("destination");
        std::string mode = query.value("mode", "astar");

        RouteResult r = plan_route(g, src, tgt, cfg,
                                   mode == "dijkstra" ? SearchMode::Dijkstra : SearchMode::AStar);
        print_route(g, src, tgt, r);

        json body = route_to_json(r);
        for (auto it = body.begin(); it != body.end(); ++it) result[it.key()] = it.value();
        result["expanded"] = r.stats.finalized;
    } catch (const std::exception &e) {
        result["error"] = e.what();
    }

    return result;
}

int main(int argc, char *argv[]) {
    if (argc != 4 && argc != 5) {
        std::cerr << "Usage: " << argv[0]
                  << " <schedule.db|snapshot.json> <queries.json> <output.json> [config.json]" << std::endl;
        return 1;
    }

    RouterConfig cfg;
    if (argc == 5 && !load_config(argv[4], cfg)) return 1;

    LoadResult loaded = load_graph(argv[1], cfg);
    if (loaded.status != LoadStatus::Ok) {
        std::cerr << "Schedule data unavailable: " << argv[1] << std::endl;
        return 1;
    }
    const Graph &G = loaded.graph;
    const BuildStats &st = loaded.stats;

    std::cout << "Graph built: " << G.nodeCount() << " nodes, " << G.edgeCount() << " edges ("
              << st.travel_edges << " travel, " << st.transfer_edges << " transfer).\n";
    if (st.malformed_skipped || st.dangling_skipped)
        std::cout << "Skipped " << st.malformed_skipped << " malformed and "
                  << st.dangling_skipped << " dangling records.\n";

    std::ifstream queries_file(argv[2]);
    if (!queries_file.is_open()) {
        std::cerr << "Failed to open " << argv[2] << std::endl;
        return 1;
    }

    json queries_json;
    try {
        queries_file >> queries_json;
    } catch (const std::exception &e) {
        std::cerr << "Error parsing queries JSON: " << e.what() << std::endl;
        return 1;
    }
    queries_file.close();
    if (!queries_json.is_object()) {
        std::cerr << "Queries file must hold a JSON object" << std::endl;
        return 1;
    }

    json meta = queries_json.value("meta", json::object());
    std::vector<json> results;

    for (const auto &query : queries_json.value("events", json::array())) {
        auto start_time = std::chrono::high_resolution_clock::now();

        json result = process_query(G, cfg, query);

        auto end_time = std::chrono::high_resolution_clock::now();
        result["processing_time"] = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        results.push_back(result);
    }

    std::ofstream output_file(argv[3]);
    if (!output_file.is_open()) {
        std::cerr << "Failed to open " << argv[3] << " for writing" << std::endl;
        return 1;
    }

    json output;
    output["meta"] = meta;
    output["results"] = results;
    output["graph"] = {{"nodes", G.nodeCount()},
                       {"edges", G.edgeCount()},
                       {"malformed_skipped", st.malformed_skipped},
                       {"dangling_skipped", st.dangling_skipped},
                       {"self_loops_skipped", st.self_loops_skipped},
                       {"overwritten", st.overwritten}};
    output_file << output.dump(4) << std::endl;

    output_file.close();
    return 0;
}
