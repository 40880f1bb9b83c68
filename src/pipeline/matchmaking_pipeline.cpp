#include "pipeline/matchmaking_pipeline.hpp"
#include "io/csv.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

}  // namespace

namespace affinity {

// ============================================================================
// MatchmakingConfig
// ============================================================================

MatchmakingConfig MatchmakingConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    return from_json(j);
}

MatchmakingConfig MatchmakingConfig::from_json(const json& j) {
    MatchmakingConfig config;

    // Clustering config
    if (j.contains("resolution")) config.resolution = j["resolution"];
    if (j.contains("seed") && !j["seed"].is_null()) config.seed = j["seed"].get<uint64_t>();
    if (j.contains("max_passes")) config.max_passes = j["max_passes"];
    if (j.contains("max_levels")) config.max_levels = j["max_levels"];

    // Pool config
    if (j.contains("excluded_interests")) {
        config.excluded_interests = j["excluded_interests"].get<std::set<std::string>>();
    }

    // Input config
    if (j.contains("id_column")) config.id_column = j["id_column"];
    if (j.contains("group_column")) config.group_column = j["group_column"];

    // Output config
    if (j.contains("top_n")) config.top_n = j["top_n"];
    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

json MatchmakingConfig::to_json() const {
    json j;
    j["resolution"] = resolution;
    j["seed"] = seed ? json(*seed) : json(nullptr);
    j["max_passes"] = max_passes;
    j["max_levels"] = max_levels;
    j["excluded_interests"] = excluded_interests;
    j["id_column"] = id_column;
    j["group_column"] = group_column;
    j["top_n"] = top_n;
    j["verbose"] = verbose;
    return j;
}

void MatchmakingConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

bool MatchmakingConfig::validate(std::string& error_message) const {
    if (!std::isfinite(resolution) || resolution <= 0.0) {
        error_message = "Resolution must be a positive number";
        return false;
    }

    if (top_n < 0) {
        error_message = "top_n must be non-negative";
        return false;
    }

    if (max_passes < 1 || max_levels < 1) {
        error_message = "max_passes and max_levels must be at least 1";
        return false;
    }

    if (id_column.empty() || group_column.empty()) {
        error_message = "Identifier and group column names must not be empty";
        return false;
    }

    return true;
}

LouvainConfig MatchmakingConfig::louvain_config() const {
    LouvainConfig lc;
    lc.resolution = resolution;
    lc.seed = seed;
    lc.max_passes = max_passes;
    lc.max_levels = max_levels;
    return lc;
}

// ============================================================================
// RunStatistics
// ============================================================================

void RunStatistics::print_summary() const {
    std::ios_base::fmtflags flags = std::cout.flags();
    std::streamsize precision = std::cout.precision();

    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Matchmaking Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Students:\n";
    std::cout << "  Targets:            " << targets << "\n";
    std::cout << "  Missing records:    " << missing_records << "\n";
    std::cout << "  No pool overlap:    " << excluded_no_overlap << "\n";
    std::cout << "  Assigned:           " << assigned << "\n\n";

    std::cout << "Interest Graph:\n";
    std::cout << "  Pool size:          " << pool_size << "\n";
    std::cout << "  Edges:              " << graph_edges << "\n";
    std::cout << "  Total weight:       " << graph_weight << "\n\n";

    std::cout << "Clustering:\n";
    std::cout << "  Clusters:           " << clusters << "\n";
    std::cout << "  Levels:             " << levels << "\n";
    std::cout << "  Modularity:         " << std::fixed << std::setprecision(4) << modularity << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Graph:              " << std::setprecision(3) << graph_time_seconds << "s\n";
    std::cout << "  Clustering:         " << clustering_time_seconds << "s\n";
    std::cout << "  Assignment:         " << assignment_time_seconds << "s\n";

    std::cout.flags(flags);
    std::cout.precision(precision);
}

json RunStatistics::to_json() const {
    json j;
    j["targets"] = targets;
    j["missing_records"] = missing_records;
    j["excluded_no_overlap"] = excluded_no_overlap;
    j["assigned"] = assigned;
    j["pool_size"] = pool_size;
    j["graph_edges"] = graph_edges;
    j["graph_weight"] = graph_weight;
    j["clusters"] = clusters;
    j["levels"] = levels;
    j["modularity"] = modularity;
    j["graph_time_seconds"] = graph_time_seconds;
    j["clustering_time_seconds"] = clustering_time_seconds;
    j["assignment_time_seconds"] = assignment_time_seconds;
    return j;
}

// ============================================================================
// MatchmakingResult
// ============================================================================

json MatchmakingResult::to_json() const {
    json j = graph.to_json();
    j["clustering"] = clustering.to_json();
    j["clusters"] = clusters_to_json(clusters);

    json assignments_arr = json::array();
    for (const auto& a : assignments) {
        assignments_arr.push_back(a.to_json());
    }
    j["assignments"] = assignments_arr;
    j["summary"] = summary.to_json();
    j["statistics"] = stats.to_json();
    return j;
}

void MatchmakingResult::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

void MatchmakingResult::export_assignments_csv(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }

    write_csv_row(file, {"email", "firstName", "lastName", "track", "cluster", "matched_interests"});
    for (const auto& a : assignments) {
        write_csv_row(file, {
            a.identifier,
            a.first_name,
            a.last_name,
            a.group,
            std::to_string(a.cluster_id),
            join(a.matched_interests, "; ")
        });
    }
}

// ============================================================================
// MatchmakingPipeline
// ============================================================================

MatchmakingPipeline::MatchmakingPipeline(MatchmakingConfig config)
    : config_(std::move(config)) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
}

std::vector<TargetEntry> MatchmakingPipeline::order_by_group(const std::vector<TargetEntry>& targets) {
    std::vector<std::string> groups;
    std::map<std::string, std::vector<TargetEntry>> by_group;
    for (const auto& t : targets) {
        auto it = by_group.find(t.group);
        if (it == by_group.end()) {
            groups.push_back(t.group);
            it = by_group.emplace(t.group, std::vector<TargetEntry>{}).first;
        }
        it->second.push_back(t);
    }

    std::vector<TargetEntry> ordered;
    ordered.reserve(targets.size());
    for (const auto& g : groups) {
        const auto& rows = by_group[g];
        ordered.insert(ordered.end(), rows.begin(), rows.end());
    }
    return ordered;
}

MatchmakingResult MatchmakingPipeline::run(
    const StudentRecords& records,
    const std::vector<TargetEntry>& targets) const {

    MatchmakingResult result;
    result.stats.targets = targets.size();

    // Stage 1: resolve targets to records
    std::vector<TargetEntry> ordered = order_by_group(targets);
    std::vector<StudentRecord> cohort;
    std::vector<std::string> cohort_groups;
    for (const auto& target : ordered) {
        auto it = records.find(target.identifier);
        if (it == records.end()) {
            result.stats.missing_records++;
            if (config_.verbose) {
                std::cerr << "Warning: no student record for " << target.identifier << ", skipping\n";
            }
            continue;
        }
        cohort.push_back(it->second);
        cohort_groups.push_back(target.group);
    }

    // Stage 2: interest pool and co-occurrence graph
    auto graph_start = std::chrono::steady_clock::now();
    result.pool = InterestPool::build(records, targets, config_.excluded_interests);
    result.graph = InterestGraph::build(result.pool, cohort);
    result.stats.graph_time_seconds = seconds_since(graph_start);

    result.stats.pool_size = result.pool.size();
    result.stats.graph_edges = result.graph.num_edges();
    result.stats.graph_weight = result.graph.total_weight();

    if (config_.verbose) {
        std::cout << "Interest pool: " << result.pool.size() << " interests, "
                  << result.graph.num_edges() << " co-occurring pairs\n";
    }

    // Stage 3: Louvain clustering
    auto cluster_start = std::chrono::steady_clock::now();
    ModularityClusterer clusterer(config_.louvain_config());
    result.clustering = clusterer.cluster(result.graph);
    result.clusters = group_by_cluster(result.clustering.partition);
    result.stats.clustering_time_seconds = seconds_since(cluster_start);

    result.stats.clusters = result.clusters.size();
    result.stats.levels = result.clustering.levels;
    result.stats.modularity = result.clustering.modularity;

    if (config_.verbose) {
        std::cout << "Found " << result.clusters.size() << " interest clusters (modularity "
                  << result.clustering.modularity << ")\n";
    }

    // Stage 4: assign students
    auto assign_start = std::chrono::steady_clock::now();
    ClusterAssigner assigner(result.pool, result.clustering.partition);
    for (size_t i = 0; i < cohort.size(); ++i) {
        auto assignment = assigner.assign(cohort[i], cohort_groups[i]);
        if (!assignment) {
            result.stats.excluded_no_overlap++;
            continue;
        }
        result.assignments.push_back(std::move(*assignment));
    }
    result.stats.assigned = result.assignments.size();
    result.stats.assignment_time_seconds = seconds_since(assign_start);

    // Stage 5: summaries
    SummaryAggregator aggregator(config_.top_n);
    result.summary = aggregator.summarize(result.assignments, result.clusters);

    return result;
}

} // namespace affinity
