#pragma once

#include "clustering/partition.hpp"
#include "graph/interest_graph.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace affinity {

// Louvain configuration
struct LouvainConfig {
    double resolution = 1.0;             // gamma in the modularity objective
    std::optional<uint64_t> seed;        // Shuffles the visiting order when set
    int max_passes = 1000;               // Local-moving passes per level
    int max_levels = 100;                // Aggregation levels
    double min_gain = 1e-10;             // A move must beat staying by more than this
};

/**
 * @brief Weighted graph of one aggregation level
 *
 * Level 0 mirrors the interest graph. At higher levels each node is a cluster
 * of the level below: inter-cluster weights are summed and intra-cluster
 * weight is kept as a self-loop. A self-loop counts twice in the degree and
 * never towards neighbouring-cluster weights.
 */
struct LevelGraph {
    std::vector<std::map<size_t, double>> adj;         // no self entries
    std::vector<double> self_loops;

    size_t size() const { return adj.size(); }
    double degree(size_t node) const;

    /**
     * @brief Total edge weight m (each edge once, self-loops once)
     */
    double total_weight() const;

    static LevelGraph from_interest_graph(const InterestGraph& graph);

    /**
     * @brief Build the next level from a community assignment
     * @param community node -> community id in [0, num_communities)
     */
    LevelGraph aggregate(const std::vector<int>& community, size_t num_communities) const;
};

/**
 * @brief Result of a Louvain run
 */
struct ClusteringResult {
    Partition partition;
    double modularity = 0.0;
    int levels = 0;

    // Per level: modularity before the first pass, then after every pass
    std::vector<std::vector<double>> pass_modularity;

    size_t num_clusters() const;
    nlohmann::json to_json() const;
};

// Progress callback
using ClusteringProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

/**
 * @brief Modularity maximization by local moving and aggregation (Louvain)
 *
 * Nodes are visited in index order (the pool's sorted tag order) unless a
 * seed is configured, in which case each level's order is a shuffle drawn
 * from a single seeded std::mt19937_64. A node moves only to the
 * neighbouring cluster with the strictly largest gain over staying; ties keep
 * the current cluster, then prefer the smallest cluster id.
 *
 * Levels repeat until a level merges nothing, one node remains, or
 * max_levels is hit. Final cluster ids are 0..k-1 in order of first
 * appearance over the sorted tags.
 */
class ModularityClusterer {
public:
    /**
     * @throws std::invalid_argument if the configuration is unusable
     */
    explicit ModularityClusterer(LouvainConfig config = {});

    void set_progress_callback(ClusteringProgressCallback cb) { progress_cb_ = std::move(cb); }
    const LouvainConfig& config() const { return config_; }

    ClusteringResult cluster(const InterestGraph& graph) const;

    /**
     * @brief Local moving phase on one level
     * @param community Output: node -> community id (not renumbered)
     * @param trace Receives the modularity before the first pass and after each pass
     * @param rng Visiting-order shuffle source, or nullptr for index order
     * @return Number of moves made over all passes
     */
    size_t move_nodes(
        const LevelGraph& graph,
        std::vector<int>& community,
        std::vector<double>& trace,
        std::mt19937_64* rng
    ) const;

private:
    LouvainConfig config_;
    ClusteringProgressCallback progress_cb_;

    void report_progress(const std::string& stage, int current, int total) const;
};

/**
 * @brief Q = sum over clusters of in_c / m - gamma * (tot_c / 2m)^2
 *
 * Returns 0 for a graph without edges. Tags missing from the partition are
 * treated as singletons.
 */
double compute_modularity(const InterestGraph& graph, const Partition& partition, double resolution = 1.0);

double compute_modularity(const LevelGraph& graph, const std::vector<int>& community, double resolution = 1.0);

} // namespace affinity
