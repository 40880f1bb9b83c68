#ifndef INTEREST_GRAPH_HPP
#define INTEREST_GRAPH_HPP

#include "clustering/partition.hpp"
#include "roster/student_roster.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace affinity {

/**
 * @brief An undirected weighted edge between two interest tags
 */
struct InterestEdge {
    std::string a;                                     // Lexicographically smaller tag
    std::string b;
    int weight = 0;                                    // Number of students holding both tags

    nlohmann::json to_json() const;
};

/**
 * @brief Statistics about the co-occurrence graph
 */
struct InterestGraphStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;
    size_t num_isolated_nodes = 0;
    long total_weight = 0;
    int max_edge_weight = 0;
    double avg_weighted_degree = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Weighted co-occurrence graph over the interest pool
 *
 * Nodes are the pool tags in sorted order; the node index is the tag's
 * position in that order. Edge weight counts the students in whom both tags
 * co-occurred. No self-loops. The dense co-occurrence matrix is kept next to
 * the adjacency lists and the two always agree.
 *
 * Built once per run and read-only during clustering.
 */
class InterestGraph {
public:
    InterestGraph() = default;

    /**
     * @brief Create a graph with every pool tag as an (isolated) node
     */
    explicit InterestGraph(const InterestPool& pool);

    /**
     * @brief Accumulate co-occurrences of the given students
     * @param pool Interest pool; tags outside it are ignored
     * @param students Target students, in any order
     *
     * Each student contributes one increment per unordered pair of distinct
     * pool interests. A student with fewer than two pool interests adds no
     * edges.
     */
    static InterestGraph build(
        const InterestPool& pool,
        const std::vector<StudentRecord>& students
    );

    /**
     * @brief Add one co-occurrence between two distinct pool tags
     * @throws std::invalid_argument for unknown tags or a self-pair
     */
    void add_cooccurrence(const std::string& a, const std::string& b);

    // ==========================================
    // Queries
    // ==========================================

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return num_edges_; }
    bool empty() const { return nodes_.empty(); }

    const std::vector<std::string>& nodes() const { return nodes_; }
    const std::string& node(size_t index) const { return nodes_.at(index); }
    std::optional<size_t> index_of(const std::string& tag) const;
    bool has_node(const std::string& tag) const { return index_of(tag).has_value(); }

    int edge_weight(size_t a, size_t b) const;
    int edge_weight(const std::string& a, const std::string& b) const;

    /**
     * @brief Neighbours of a node, keyed by node index (ascending)
     */
    const std::map<size_t, int>& neighbors(size_t index) const { return adj_.at(index); }

    /**
     * @brief Sum of the weights of all edges incident to a node
     */
    long weighted_degree(size_t index) const;

    /**
     * @brief Sum of all edge weights (m)
     */
    long total_weight() const { return total_weight_; }

    /**
     * @brief Symmetric |pool| x |pool| co-occurrence matrix, zero diagonal
     */
    const std::vector<std::vector<int>>& matrix() const { return matrix_; }

    /**
     * @brief All edges with a < b, sorted by (a, b)
     */
    std::vector<InterestEdge> edges() const;

    InterestGraphStatistics compute_statistics() const;

    // ==========================================
    // Export
    // ==========================================

    /**
     * @brief Pool, matrix and edge list as JSON
     */
    nlohmann::json to_json() const;

    /**
     * @brief Export to Graphviz DOT
     * @param partition When given, nodes are coloured and labelled by cluster
     */
    void export_to_dot(const std::string& filename, const Partition* partition = nullptr) const;

private:
    std::vector<std::string> nodes_;                   // sorted pool tags
    std::map<std::string, size_t> node_index_;         // tag -> index
    std::vector<std::map<size_t, int>> adj_;           // index -> {neighbour index -> weight}
    std::vector<std::vector<int>> matrix_;             // dense co-occurrence counts
    size_t num_edges_ = 0;
    long total_weight_ = 0;

    void increment(size_t a, size_t b);
};

} // namespace affinity

#endif // INTEREST_GRAPH_HPP
