#pragma once

#include "assignment/cluster_assigner.hpp"
#include "clustering/louvain.hpp"
#include "graph/interest_graph.hpp"
#include "roster/student_roster.hpp"
#include "summary/summary_aggregator.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace affinity {

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Configuration for a matchmaking run
 */
struct MatchmakingConfig {
    // Clustering
    double resolution = 1.0;                ///< Modularity resolution (gamma)
    std::optional<uint64_t> seed;           ///< Seeded visiting order (default: sorted tag order)
    int max_passes = 1000;                  ///< Local-moving passes per level
    int max_levels = 100;                   ///< Aggregation levels

    // Interest pool
    std::set<std::string> excluded_interests = {
        "AI & machine learning",
        "something not listed",
        "still figuring it out"
    };

    // Target subset columns
    std::string id_column = "Email";
    std::string group_column = "Track";

    // Summaries
    int top_n = 5;                          ///< Interests listed per cluster

    bool verbose = true;                    ///< Progress and warnings on stdout/stderr

    /**
     * @brief Load configuration from JSON file; absent keys keep defaults
     */
    static MatchmakingConfig from_json_file(const std::string& path);
    static MatchmakingConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
    void to_json_file(const std::string& path) const;

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    LouvainConfig louvain_config() const;
};

// ============================================================================
// Run Statistics
// ============================================================================

struct RunStatistics {
    size_t targets = 0;
    size_t missing_records = 0;             ///< Target ids without a record (skipped)
    size_t excluded_no_overlap = 0;         ///< Students without any pool interest
    size_t assigned = 0;

    size_t pool_size = 0;
    size_t graph_edges = 0;
    long graph_weight = 0;
    size_t clusters = 0;
    int levels = 0;
    double modularity = 0.0;

    double graph_time_seconds = 0.0;
    double clustering_time_seconds = 0.0;
    double assignment_time_seconds = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

// ============================================================================
// Result
// ============================================================================

struct MatchmakingResult {
    InterestPool pool;
    InterestGraph graph;
    ClusteringResult clustering;
    ClusterInterestSets clusters;
    std::vector<Assignment> assignments;
    MatchmakingSummary summary;
    RunStatistics stats;

    nlohmann::json to_json() const;
    void save_to_json(const std::string& path) const;

    /**
     * @brief One row per assigned student:
     *        email, firstName, lastName, track, cluster, matched_interests
     *
     * Matched interests are joined with "; ".
     */
    void export_assignments_csv(const std::string& path) const;
};

// ============================================================================
// Pipeline
// ============================================================================

/**
 * @brief records + target subset -> pool -> graph -> clusters -> assignments -> summary
 *
 * Targets are processed group by group (groups in order of first appearance,
 * rows in input order). Missing records are skipped; students without pool
 * interests are left out of the assignments.
 */
class MatchmakingPipeline {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit MatchmakingPipeline(MatchmakingConfig config);

    MatchmakingResult run(const StudentRecords& records, const std::vector<TargetEntry>& targets) const;

    /**
     * @brief Stable regrouping of targets by group label
     */
    static std::vector<TargetEntry> order_by_group(const std::vector<TargetEntry>& targets);

    const MatchmakingConfig& config() const { return config_; }

private:
    MatchmakingConfig config_;
};

} // namespace affinity
