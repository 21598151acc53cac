#include "algorithms.hpp"
#include <algorithm>
#include <chrono>
#include <limits>
#include <queue>
#include <unordered_set>

using namespace std;

const char *search_error_name(SearchError e) {
    switch (e) {
    case SearchError::None: return "none";
    case SearchError::NodeNotFound: return "node_not_found";
    case SearchError::NoPathFound: return "no_path_found";
    case SearchError::DeadlineExceeded: return "deadline_exceeded";
    }
    return "unknown";
}

static vector<string> reconstruct(const unordered_map<string, string> &parent,
                                  const string &source, const string &target) {
    vector<string> path;
    for (string cur = target;;) {
        path.push_back(cur);
        if (cur == source) break;
        cur = parent.at(cur);
    }
    reverse(path.begin(), path.end());
    return path;
}

// --------------------------------------------------
// A*
// --------------------------------------------------
namespace {

struct FrontierEntry {
    double f;
    uint64_t seq;
    string node;
};

struct FrontierAfter {
    bool operator()(const FrontierEntry &a, const FrontierEntry &b) const {
        if (a.f != b.f) return a.f > b.f;
        return a.seq > b.seq;
    }
};

}  // namespace

SPResult astar(const Graph &g, const string &origin, const string &destination,
               const Heuristic &h, const SearchOptions &opt) {
    SPResult res;

    if (!g.hasNode(origin) || !g.hasNode(destination)) {
        res.error = SearchError::NodeNotFound;
        return res;
    }

    auto start = chrono::steady_clock::now();

    unordered_map<string, double> g_score;
    unordered_map<string, string> parent;
    unordered_set<string> closed;
    priority_queue<FrontierEntry, vector<FrontierEntry>, FrontierAfter> open;
    uint64_t seq = 0;

    g_score[origin] = 0.0;
    open.push({h(origin, destination), seq++, origin});
    res.stats.pushed++;

    while (!open.empty()) {
        if (opt.time_budget_ms > 0) {
            double elapsed = chrono::duration<double, milli>(chrono::steady_clock::now() - start).count();
            if (elapsed > opt.time_budget_ms) {
                res.error = SearchError::DeadlineExceeded;
                return res;
            }
        }

        FrontierEntry top = open.top();
        open.pop();
        res.stats.popped++;
        const string &u = top.node;

        if (u == destination) {
            res.possible = true;
            res.cost = g_score[u];
            res.path = reconstruct(parent, origin, destination);
            return res;
        }

        // stale duplicate
        if (closed.count(u)) continue;
        closed.insert(u);
        res.stats.finalized++;

        double gu = g_score[u];
        for (const auto &e : g.outEdges(u)) {
            double cand = gu + e.weight;
            auto it = g_score.find(e.to);
            if (it != g_score.end() && cand >= it->second) continue;

            g_score[e.to] = cand;
            parent[e.to] = u;
            open.push({cand + h(e.to, destination), seq++, e.to});
            res.stats.pushed++;
        }
    }

    res.error = SearchError::NoPathFound;
    return res;
}

// --------------------------------------------------
// Dijkstra
// --------------------------------------------------
SPResult dijkstra(const Graph &g, const string &source, const string &target) {
    SPResult res;

    if (!g.hasNode(source) || !g.hasNode(target)) {
        res.error = SearchError::NodeNotFound;
        return res;
    }

    const double INF = numeric_limits<double>::infinity();
    unordered_map<string, double> dist;
    unordered_map<string, string> parent;
    dist[source] = 0.0;

    using P = pair<double, string>;
    priority_queue<P, vector<P>, greater<P>> pq;
    pq.push({0.0, source});

    while (!pq.empty()) {
        auto [d, u] = pq.top(); pq.pop();
        res.stats.popped++;
        if (d > dist[u]) continue;
        res.stats.finalized++;
        if (u == target) break;

        for (const auto &e : g.outEdges(u)) {
            auto it = dist.find(e.to);
            double cur = it == dist.end() ? INF : it->second;
            if (d + e.weight < cur) {
                dist[e.to] = d + e.weight;
                parent[e.to] = u;
                pq.push({d + e.weight, e.to});
                res.stats.pushed++;
            }
        }
    }

    if (!dist.count(target)) {
        res.error = SearchError::NoPathFound;
        return res;
    }

    res.possible = true;
    res.cost = dist[target];
    res.path = reconstruct(parent, source, target);
    return res;
}

unordered_map<string, double> shortest_times_from(const Graph &g, const string &origin) {
    unordered_map<string, double> dist;
    if (!g.hasNode(origin)) return dist;

    using P = pair<double, string>;
    priority_queue<P, vector<P>, greater<P>> pq;
    dist[origin] = 0.0;
    pq.push({0.0, origin});

    while (!pq.empty()) {
        auto [d, u] = pq.top(); pq.pop();
        if (d > dist[u]) continue;
        for (const auto &e : g.outEdges(u)) {
            auto it = dist.find(e.to);
            if (it == dist.end() || d + e.weight < it->second) {
                dist[e.to] = d + e.weight;
                pq.push({d + e.weight, e.to});
            }
        }
    }
    return dist;
}
