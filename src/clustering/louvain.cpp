#include "clustering/louvain.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <unordered_map>

namespace affinity {

namespace {

// Relabel communities 0..k-1 in order of first appearance; returns k
size_t renumber_communities(std::vector<int>& community) {
    std::unordered_map<int, int> remap;
    int next_id = 0;
    for (auto& c : community) {
        auto it = remap.find(c);
        if (it == remap.end()) {
            it = remap.emplace(c, next_id++).first;
        }
        c = it->second;
    }
    return static_cast<size_t>(next_id);
}

}  // namespace

// ==========================================
// LevelGraph
// ==========================================

double LevelGraph::degree(size_t node) const {
    double sum = 2.0 * self_loops[node];
    for (const auto& [_, w] : adj[node]) sum += w;
    return sum;
}

double LevelGraph::total_weight() const {
    double twice_links = 0.0;
    double loops = 0.0;
    for (size_t i = 0; i < adj.size(); ++i) {
        for (const auto& [_, w] : adj[i]) twice_links += w;
        loops += self_loops[i];
    }
    return twice_links / 2.0 + loops;
}

LevelGraph LevelGraph::from_interest_graph(const InterestGraph& graph) {
    LevelGraph level;
    size_t n = graph.num_nodes();
    level.adj.resize(n);
    level.self_loops.assign(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        for (const auto& [j, w] : graph.neighbors(i)) {
            level.adj[i][j] = static_cast<double>(w);
        }
    }
    return level;
}

LevelGraph LevelGraph::aggregate(const std::vector<int>& community, size_t num_communities) const {
    LevelGraph next;
    next.adj.resize(num_communities);
    next.self_loops.assign(num_communities, 0.0);

    for (size_t i = 0; i < adj.size(); ++i) {
        size_t ci = static_cast<size_t>(community[i]);
        next.self_loops[ci] += self_loops[i];

        for (const auto& [j, w] : adj[i]) {
            if (j < i) continue;  // each undirected edge once
            size_t cj = static_cast<size_t>(community[j]);
            if (ci == cj) {
                next.self_loops[ci] += w;
            } else {
                next.adj[ci][cj] += w;
                next.adj[cj][ci] += w;
            }
        }
    }

    return next;
}

// ==========================================
// ClusteringResult
// ==========================================

size_t ClusteringResult::num_clusters() const {
    return cluster_ids(partition).size();
}

nlohmann::json ClusteringResult::to_json() const {
    nlohmann::json j;
    j["partition"] = partition;
    j["modularity"] = modularity;
    j["levels"] = levels;
    j["num_clusters"] = num_clusters();
    j["pass_modularity"] = pass_modularity;
    return j;
}

// ==========================================
// Modularity
// ==========================================

double compute_modularity(const LevelGraph& graph, const std::vector<int>& community, double resolution) {
    double m = graph.total_weight();
    if (m <= 0.0) return 0.0;

    std::map<int, double> inner;
    std::map<int, double> tot;
    for (size_t i = 0; i < graph.size(); ++i) {
        int ci = community[i];
        tot[ci] += graph.degree(i);
        inner[ci] += graph.self_loops[i];
        for (const auto& [j, w] : graph.adj[i]) {
            if (j > i && community[j] == ci) inner[ci] += w;
        }
    }

    double q = 0.0;
    for (const auto& [c, total] : tot) {
        double frac = total / (2.0 * m);
        q += inner[c] / m - resolution * frac * frac;
    }
    return q;
}

double compute_modularity(const InterestGraph& graph, const Partition& partition, double resolution) {
    std::vector<int> community(graph.num_nodes());
    int next_free = 0;
    for (const auto& [_, c] : partition) next_free = std::max(next_free, c + 1);

    for (size_t i = 0; i < graph.num_nodes(); ++i) {
        auto it = partition.find(graph.node(i));
        community[i] = (it != partition.end()) ? it->second : next_free++;
    }
    return compute_modularity(LevelGraph::from_interest_graph(graph), community, resolution);
}

// ==========================================
// ModularityClusterer
// ==========================================

ModularityClusterer::ModularityClusterer(LouvainConfig config)
    : config_(std::move(config)) {
    if (!std::isfinite(config_.resolution) || config_.resolution <= 0.0) {
        throw std::invalid_argument("Resolution must be a positive number");
    }
    if (config_.max_passes < 1) {
        throw std::invalid_argument("max_passes must be at least 1");
    }
    if (config_.max_levels < 1) {
        throw std::invalid_argument("max_levels must be at least 1");
    }
    if (config_.min_gain < 0.0) {
        throw std::invalid_argument("min_gain must be non-negative");
    }
}

void ModularityClusterer::report_progress(const std::string& stage, int current, int total) const {
    if (progress_cb_) {
        progress_cb_(stage, current, total);
    }
}

size_t ModularityClusterer::move_nodes(
    const LevelGraph& graph,
    std::vector<int>& community,
    std::vector<double>& trace,
    std::mt19937_64* rng) const {

    const size_t n = graph.size();
    community.resize(n);
    std::iota(community.begin(), community.end(), 0);

    trace.push_back(compute_modularity(graph, community, config_.resolution));

    const double m2 = 2.0 * graph.total_weight();
    if (n == 0 || m2 == 0.0) {
        return 0;
    }

    std::vector<double> k(n, 0.0);
    std::vector<double> tot(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        k[i] = graph.degree(i);
        tot[i] = k[i];
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    if (rng) {
        std::shuffle(order.begin(), order.end(), *rng);
    }

    // Gain of inserting node i into a cluster, up to the constant factor 1/m
    auto modularity_gain = [&](size_t i, double ki_in, double totc) {
        return ki_in - config_.resolution * totc * k[i] / m2;
    };

    size_t total_moves = 0;
    for (int pass = 0; pass < config_.max_passes; ++pass) {
        size_t moves = 0;

        for (size_t i : order) {
            int ci = community[i];

            // Ordered by cluster id, so the first maximum is the smallest id
            std::map<int, double> neigh;
            for (const auto& [j, w] : graph.adj[i]) {
                neigh[community[j]] += w;
            }

            tot[ci] -= k[i];

            auto own = neigh.find(ci);
            int best_c = ci;
            double best_gain = modularity_gain(i, own == neigh.end() ? 0.0 : own->second, tot[ci]);

            for (const auto& [c, ki_in] : neigh) {
                if (c == ci) continue;
                double gain = modularity_gain(i, ki_in, tot[c]);
                if (gain > best_gain + config_.min_gain) {
                    best_gain = gain;
                    best_c = c;
                }
            }

            tot[best_c] += k[i];
            if (best_c != ci) {
                community[i] = best_c;
                ++moves;
            }
        }

        trace.push_back(compute_modularity(graph, community, config_.resolution));
        report_progress("Local moving", pass + 1, config_.max_passes);

        total_moves += moves;
        if (moves == 0) break;
    }

    return total_moves;
}

ClusteringResult ModularityClusterer::cluster(const InterestGraph& graph) const {
    ClusteringResult result;
    const size_t n = graph.num_nodes();
    if (n == 0) {
        return result;
    }

    LevelGraph level = LevelGraph::from_interest_graph(graph);

    // original node -> node of the current level
    std::vector<int> membership(n);
    std::iota(membership.begin(), membership.end(), 0);

    std::optional<std::mt19937_64> rng;
    if (config_.seed) {
        rng.emplace(*config_.seed);
    }

    for (int lvl = 0; lvl < config_.max_levels; ++lvl) {
        std::vector<int> community;
        std::vector<double> trace;
        size_t moves = move_nodes(level, community, trace, rng ? &*rng : nullptr);

        result.pass_modularity.push_back(std::move(trace));
        result.levels = lvl + 1;
        report_progress("Aggregation", lvl + 1, config_.max_levels);

        size_t num_communities = renumber_communities(community);
        for (auto& node : membership) {
            node = community[static_cast<size_t>(node)];
        }

        if (moves == 0 || num_communities == level.size()) break;

        level = level.aggregate(community, num_communities);
        if (level.size() == 1) break;
    }

    renumber_communities(membership);
    for (size_t i = 0; i < n; ++i) {
        result.partition[graph.node(i)] = membership[i];
    }
    result.modularity = compute_modularity(graph, result.partition, config_.resolution);

    return result;
}

} // namespace affinity
