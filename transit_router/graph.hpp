#pragma once
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "config.hpp"

struct Station {
    std::string id;
    std::string name;
    std::optional<double> lat, lon;

    bool hasCoords() const { return lat.has_value() && lon.has_value(); }
};

enum class EdgeKind { Travel, Transfer };

struct Edge {
    std::string from, to;
    long weight;                        // seconds
    EdgeKind kind;
    std::optional<std::string> route;   // Travel only
};

// Raw schedule records, as read from the schedule store.
struct StopRecord {
    std::string stop_id;
    std::string stop_name;
    std::optional<double> stop_lat, stop_lon;
};

struct TravelSegmentRecord {
    std::string from_stop_id, to_stop_id;
    std::optional<long> weight;         // min duration for the pair
    std::string route_id;
};

struct TransferRecord {
    std::string from_stop_id, to_stop_id;
    std::optional<long> min_transfer_time;
};

struct BuildStats {
    size_t stations = 0;
    size_t travel_edges = 0;
    size_t transfer_edges = 0;
    size_t malformed_skipped = 0;
    size_t dangling_skipped = 0;
    size_t self_loops_skipped = 0;
    size_t overwritten = 0;
};

const char *edge_kind_name(EdgeKind k);

class Graph {
public:
    using EdgeKey = std::pair<std::string, std::string>;

    bool hasNode(const std::string &id) const { return nodes_.count(id) != 0; }
    const Station *station(const std::string &id) const;
    const Edge *findEdge(const std::string &u, const std::string &v) const;

    // Outgoing edges of u, ordered by target id. Empty for unknown ids.
    const std::vector<Edge> &outEdges(const std::string &u) const;

    const std::unordered_map<std::string, Station> &stations() const { return nodes_; }
    const std::map<EdgeKey, Edge> &edges() const { return edges_; }
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

private:
    friend class GraphBuilder;

    std::unordered_map<std::string, Station> nodes_;
    std::map<EdgeKey, Edge> edges_;
    std::unordered_map<std::string, std::vector<Edge>> adj_;
};

class GraphBuilder {
public:
    explicit GraphBuilder(BuildConfig cfg = {}) : cfg_(cfg) {}

    void addStations(const std::vector<StopRecord> &stops);
    void addTravelEdges(const std::vector<TravelSegmentRecord> &segments);
    void addTransferEdges(const std::vector<TransferRecord> &transfers);

    // Seals the graph; the builder is left empty.
    Graph finish();

    const BuildStats &stats() const { return stats_; }

private:
    // Keyed insert: an existing edge for (from, to) is replaced, whatever
    // its kind. Travel edges go in before transfers, so a transfer between
    // the same pair of stops wins over the travel edge.
    void putEdge(Edge e);

    BuildConfig cfg_;
    Graph g_;
    BuildStats stats_;
};

Graph build_graph(const std::vector<StopRecord> &stops,
                  const std::vector<TravelSegmentRecord> &segments,
                  const std::vector<TransferRecord> &transfers,
                  const BuildConfig &cfg = {},
                  BuildStats *stats = nullptr);
