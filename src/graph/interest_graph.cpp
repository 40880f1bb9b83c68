#include "graph/interest_graph.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace affinity {

namespace {

// Graphviz X11 colour names, cycled per cluster id
const std::vector<std::string> CLUSTER_COLORS = {
    "lightblue", "orange", "palegreen", "salmon", "plum",
    "tan", "pink", "lightgray", "khaki", "cyan"
};

std::string dot_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

}  // namespace

// ==========================================
// InterestEdge / Statistics
// ==========================================

nlohmann::json InterestEdge::to_json() const {
    return {{"source", a}, {"target", b}, {"weight", weight}};
}

nlohmann::json InterestGraphStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["num_isolated_nodes"] = num_isolated_nodes;
    j["total_weight"] = total_weight;
    j["max_edge_weight"] = max_edge_weight;
    j["avg_weighted_degree"] = avg_weighted_degree;
    return j;
}

// ==========================================
// Construction
// ==========================================

InterestGraph::InterestGraph(const InterestPool& pool)
    : nodes_(pool.tags()),
      adj_(pool.size()),
      matrix_(pool.size(), std::vector<int>(pool.size(), 0)) {
    for (size_t i = 0; i < nodes_.size(); ++i) {
        node_index_[nodes_[i]] = i;
    }
}

InterestGraph InterestGraph::build(
    const InterestPool& pool,
    const std::vector<StudentRecord>& students) {

    InterestGraph graph(pool);

    for (const auto& student : students) {
        // restrict() drops duplicates, so each unordered pair is visited once
        std::vector<std::string> interests = pool.restrict(student.interests);
        for (size_t i = 0; i < interests.size(); ++i) {
            size_t a = graph.node_index_.at(interests[i]);
            for (size_t j = i + 1; j < interests.size(); ++j) {
                graph.increment(a, graph.node_index_.at(interests[j]));
            }
        }
    }

    return graph;
}

void InterestGraph::add_cooccurrence(const std::string& a, const std::string& b) {
    auto ia = index_of(a);
    auto ib = index_of(b);
    if (!ia || !ib) {
        throw std::invalid_argument("Interest is not in the pool: " + (!ia ? a : b));
    }
    if (*ia == *ib) {
        throw std::invalid_argument("Self co-occurrence is not allowed: " + a);
    }
    increment(*ia, *ib);
}

void InterestGraph::increment(size_t a, size_t b) {
    auto [it, inserted] = adj_[a].emplace(b, 0);
    if (inserted) ++num_edges_;
    it->second += 1;
    adj_[b][a] += 1;

    matrix_[a][b] += 1;
    matrix_[b][a] += 1;
    total_weight_ += 1;
}

// ==========================================
// Queries
// ==========================================

std::optional<size_t> InterestGraph::index_of(const std::string& tag) const {
    auto it = node_index_.find(tag);
    if (it == node_index_.end()) return std::nullopt;
    return it->second;
}

int InterestGraph::edge_weight(size_t a, size_t b) const {
    const auto& neigh = adj_.at(a);
    auto it = neigh.find(b);
    return it == neigh.end() ? 0 : it->second;
}

int InterestGraph::edge_weight(const std::string& a, const std::string& b) const {
    auto ia = index_of(a);
    auto ib = index_of(b);
    if (!ia || !ib) return 0;
    return edge_weight(*ia, *ib);
}

long InterestGraph::weighted_degree(size_t index) const {
    long degree = 0;
    for (const auto& [_, w] : adj_.at(index)) degree += w;
    return degree;
}

std::vector<InterestEdge> InterestGraph::edges() const {
    std::vector<InterestEdge> result;
    result.reserve(num_edges_);
    for (size_t i = 0; i < adj_.size(); ++i) {
        for (const auto& [j, w] : adj_[i]) {
            if (j <= i) continue;
            result.push_back({nodes_[i], nodes_[j], w});
        }
    }
    return result;
}

InterestGraphStatistics InterestGraph::compute_statistics() const {
    InterestGraphStatistics stats;
    stats.num_nodes = num_nodes();
    stats.num_edges = num_edges();
    stats.total_weight = total_weight_;

    for (size_t i = 0; i < adj_.size(); ++i) {
        if (adj_[i].empty()) stats.num_isolated_nodes++;
        for (const auto& [_, w] : adj_[i]) {
            stats.max_edge_weight = std::max(stats.max_edge_weight, w);
        }
    }
    if (!nodes_.empty()) {
        stats.avg_weighted_degree = (2.0 * total_weight_) / static_cast<double>(nodes_.size());
    }
    return stats;
}

// ==========================================
// Export
// ==========================================

nlohmann::json InterestGraph::to_json() const {
    nlohmann::json j;
    j["interest_pool"] = nodes_;
    j["cooccurrence_matrix"] = matrix_;

    nlohmann::json edges_arr = nlohmann::json::array();
    for (const auto& edge : edges()) {
        edges_arr.push_back(edge.to_json());
    }
    j["edges"] = edges_arr;
    j["statistics"] = compute_statistics().to_json();
    return j;
}

void InterestGraph::export_to_dot(const std::string& filename, const Partition* partition) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << "graph InterestCooccurrence {\n";
    file << "  layout=neato;\n";
    file << "  overlap=false;\n";
    file << "  node [shape=ellipse, style=filled, color=lightblue];\n\n";

    for (const auto& tag : nodes_) {
        file << "  \"" << dot_escape(tag) << "\"";
        if (partition) {
            auto it = partition->find(tag);
            if (it != partition->end()) {
                const auto& color = CLUSTER_COLORS[static_cast<size_t>(it->second) % CLUSTER_COLORS.size()];
                file << " [color=" << color
                     << ", label=\"" << dot_escape(tag) << "\\n(cluster " << it->second << ")\"]";
            }
        }
        file << ";\n";
    }

    file << "\n";

    for (const auto& edge : edges()) {
        file << "  \"" << dot_escape(edge.a) << "\" -- \"" << dot_escape(edge.b) << "\""
             << " [weight=" << edge.weight << ", penwidth=" << edge.weight
             << ", label=\"" << edge.weight << "\"];\n";
    }

    file << "}\n";
}

} // namespace affinity
