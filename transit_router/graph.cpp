#include "graph.hpp"
#include <algorithm>

const char *edge_kind_name(EdgeKind k) {
    return k == EdgeKind::Travel ? "travel" : "transfer";
}

const Station *Graph::station(const std::string &id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const Edge *Graph::findEdge(const std::string &u, const std::string &v) const {
    auto it = edges_.find({u, v});
    return it == edges_.end() ? nullptr : &it->second;
}

const std::vector<Edge> &Graph::outEdges(const std::string &u) const {
    static const std::vector<Edge> none;
    auto it = adj_.find(u);
    return it == adj_.end() ? none : it->second;
}

void GraphBuilder::addStations(const std::vector<StopRecord> &stops) {
    g_.nodes_.reserve(g_.nodes_.size() + stops.size());

    for (const auto &s : stops) {
        if (s.stop_id.empty() || g_.nodes_.count(s.stop_id)) {
            stats_.malformed_skipped++;
            continue;
        }
        Station st;
        st.id = s.stop_id;
        st.name = s.stop_name;
        // a half-present coordinate pair is as good as none
        if (s.stop_lat && s.stop_lon) {
            st.lat = s.stop_lat;
            st.lon = s.stop_lon;
        }
        g_.nodes_.emplace(s.stop_id, std::move(st));
    }
}

void GraphBuilder::addTravelEdges(const std::vector<TravelSegmentRecord> &segments) {
    for (const auto &r : segments) {
        if (r.from_stop_id.empty() || r.to_stop_id.empty() || !r.weight || *r.weight < 0) {
            stats_.malformed_skipped++;
            continue;
        }
        if (!g_.hasNode(r.from_stop_id) || !g_.hasNode(r.to_stop_id)) {
            stats_.dangling_skipped++;
            continue;
        }

        Edge e;
        e.from = r.from_stop_id;
        e.to = r.to_stop_id;
        e.weight = *r.weight;
        e.kind = EdgeKind::Travel;
        if (!r.route_id.empty()) e.route = r.route_id;
        putEdge(std::move(e));
    }
}

void GraphBuilder::addTransferEdges(const std::vector<TransferRecord> &transfers) {
    for (const auto &r : transfers) {
        if (r.from_stop_id.empty() || r.to_stop_id.empty()) {
            stats_.malformed_skipped++;
            continue;
        }
        if (r.from_stop_id == r.to_stop_id) {
            stats_.self_loops_skipped++;
            continue;
        }
        if (!g_.hasNode(r.from_stop_id) || !g_.hasNode(r.to_stop_id)) {
            stats_.dangling_skipped++;
            continue;
        }

        Edge e;
        e.from = r.from_stop_id;
        e.to = r.to_stop_id;
        e.weight = (r.min_transfer_time && *r.min_transfer_time > 0)
                       ? *r.min_transfer_time
                       : cfg_.default_transfer_s;
        e.kind = EdgeKind::Transfer;
        putEdge(std::move(e));
    }
}

void GraphBuilder::putEdge(Edge e) {
    Graph::EdgeKey key{e.from, e.to};
    auto it = g_.edges_.find(key);
    if (it != g_.edges_.end()) {
        stats_.overwritten++;
        it->second = std::move(e);
    } else {
        g_.edges_.emplace(std::move(key), std::move(e));
    }
}

Graph GraphBuilder::finish() {
    g_.adj_.clear();
    stats_.travel_edges = 0;
    stats_.transfer_edges = 0;

    // edges_ is ordered by (from, to), so each adjacency list comes out
    // sorted by target id
    for (const auto &[key, e] : g_.edges_) {
        g_.adj_[e.from].push_back(e);
        if (e.kind == EdgeKind::Travel)
            stats_.travel_edges++;
        else
            stats_.transfer_edges++;
    }
    stats_.stations = g_.nodes_.size();

    Graph out = std::move(g_);
    g_ = Graph();
    return out;
}

Graph build_graph(const std::vector<StopRecord> &stops,
                  const std::vector<TravelSegmentRecord> &segments,
                  const std::vector<TransferRecord> &transfers,
                  const BuildConfig &cfg,
                  BuildStats *stats) {
    GraphBuilder b(cfg);
    b.addStations(stops);
    b.addTravelEdges(segments);
    b.addTransferEdges(transfers);
    Graph g = b.finish();
    if (stats) *stats = b.stats();
    return g;
}
