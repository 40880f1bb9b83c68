#include "cli/cli.hpp"
#include "pipeline/matchmaking_pipeline.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

using namespace affinity;

// ============== Helper Functions ==============

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

// Config file first, then command-line overrides
MatchmakingConfig resolve_config(const Args& args) {
    MatchmakingConfig config;
    if (args.has("config")) {
        config = MatchmakingConfig::from_json_file(args.require("config"));
    }

    if (args.has("resolution")) config.resolution = args.get("resolution").as_double();
    if (args.has("top-n")) config.top_n = args.get("top-n").as_int();
    if (args.has("seed")) config.seed = args.get("seed").as_uint64();
    if (args.has("id-column")) config.id_column = args.require("id-column");
    if (args.has("group-column")) config.group_column = args.require("group-column");
    if (args.has("exclude")) {
        auto items = split_interest_list(args.require("exclude"));
        config.excluded_interests = std::set<std::string>(items.begin(), items.end());
    }
    if (args.has("quiet")) config.verbose = false;

    if (config.verbose && args.has("config")) {
        std::cout << "Loaded config from: " << args.require("config") << "\n";
    }
    return config;
}

MatchmakingResult load_and_run(const Args& args, const MatchmakingConfig& config) {
    // Validates before any input is read
    MatchmakingPipeline pipeline(config);

    std::string records_path = args.require("records");
    std::string targets_path = args.require("targets");

    if (config.verbose) std::cout << "Loading student data from: " << records_path << "\n";
    StudentRecords records = load_student_records(records_path);

    if (config.verbose) std::cout << "Loading target subset from: " << targets_path << "\n";
    auto targets = load_target_subset(targets_path, config.id_column, config.group_column);
    if (config.verbose) {
        std::cout << "Loaded " << records.size() << " records and " << targets.size() << " targets\n";
    }

    return pipeline.run(records, targets);
}

// ============== affinity run ==============
int cmd_run(const Args& args) {
    auto start = std::chrono::steady_clock::now();
    MatchmakingConfig config = resolve_config(args);
    std::string output_dir = args.get("output", "output/").value;

    MatchmakingResult result = load_and_run(args, config);

    fs::create_directories(output_dir);
    fs::path out(output_dir);

    std::string csv_path = (out / "student_interest_clusters.csv").string();
    result.export_assignments_csv(csv_path);
    std::cout << "  Saved: " << csv_path << "\n";

    std::string json_path = (out / "matchmaking_result.json").string();
    result.save_to_json(json_path);
    std::cout << "  Saved: " << json_path << "\n";

    std::string dot_path = (out / "interest_graph.dot").string();
    result.graph.export_to_dot(dot_path, &result.clustering.partition);
    std::cout << "  Saved: " << dot_path << "\n";

    result.summary.print_summary(std::cout);
    if (config.verbose) {
        result.stats.print_summary();
    }

    std::cout << "\nMatchmaking complete in " << format_duration(std::chrono::steady_clock::now() - start) << "\n";
    return 0;
}

// ============== affinity graph ==============
int cmd_graph(const Args& args) {
    MatchmakingConfig config = resolve_config(args);
    std::string output_path = args.require("output");

    MatchmakingResult result = load_and_run(args, config);

    fs::path out_path(output_path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }

    nlohmann::json j = result.graph.to_json();
    j["clustering"] = result.clustering.to_json();
    j["clusters"] = clusters_to_json(result.clusters);

    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + output_path);
    }
    file << j.dump(2);
    std::cout << "Saved interest graph to: " << output_path << "\n";

    if (args.has("dot")) {
        std::string dot_path = args.require("dot");
        result.graph.export_to_dot(dot_path, &result.clustering.partition);
        std::cout << "Saved DOT graph to: " << dot_path << "\n";
    }

    auto stats = result.graph.compute_statistics();
    std::cout << "\nInterest Graph Statistics:\n";
    std::cout << "  Interests:        " << stats.num_nodes << "\n";
    std::cout << "  Edges:            " << stats.num_edges << "\n";
    std::cout << "  Isolated:         " << stats.num_isolated_nodes << "\n";
    std::cout << "  Total weight:     " << stats.total_weight << "\n";
    std::cout << "  Max edge weight:  " << stats.max_edge_weight << "\n";
    std::cout << "  Clusters:         " << result.clusters.size() << "\n";
    std::ostringstream modularity;
    modularity << std::fixed << std::setprecision(4) << result.clustering.modularity;
    std::cout << "  Modularity:       " << modularity.str() << "\n";
    return 0;
}

// ============== affinity config ==============
int cmd_config(const Args& args) {
    MatchmakingConfig config = resolve_config(args);
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    std::string output_path = args.require("output");
    config.to_json_file(output_path);
    std::cout << "Saved config to: " << output_path << "\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("affinity", "1.0.0");

    const std::vector<ArgDef> tuning_args = {
        {"config", "c", "JSON config file (optional)", "", false, false},
        {"resolution", "g", "Modularity resolution (gamma)", "", false, false},
        {"top-n", "n", "Top interests listed per cluster", "", false, false},
        {"seed", "s", "Seed for the node visiting order", "", false, false},
        {"exclude", "x", "';'-separated interests left out of the pool", "", false, false},
        {"id-column", "", "Identifier column of the target CSV", "", false, false},
        {"group-column", "", "Group column of the target CSV", "", false, false},
        {"quiet", "q", "Suppress progress and warnings", "", false, true}
    };

    auto with_tuning = [&](std::vector<ArgDef> args) {
        args.insert(args.end(), tuning_args.begin(), tuning_args.end());
        return args;
    };

    // affinity run
    cli.register_command({
        "run",
        "Cluster interests and assign students: graph -> Louvain -> assignment -> summary",
        with_tuning({
            {"records", "r", "Student data JSON (object keyed by email)", "", true, false},
            {"targets", "t", "Target subset CSV with identifier and group columns", "", true, false},
            {"output", "o", "Output directory", "output/", false, false}
        }),
        cmd_run
    });

    // affinity graph
    cli.register_command({
        "graph",
        "Export the interest pool, co-occurrence matrix and clusters",
        with_tuning({
            {"records", "r", "Student data JSON (object keyed by email)", "", true, false},
            {"targets", "t", "Target subset CSV with identifier and group columns", "", true, false},
            {"output", "o", "Output path for graph JSON", "", true, false},
            {"dot", "d", "Output path for a Graphviz DOT file (optional)", "", false, false}
        }),
        cmd_graph
    });

    // affinity config
    cli.register_command({
        "config",
        "Write the effective configuration to a JSON file",
        with_tuning({
            {"output", "o", "Output path for the config JSON", "", true, false}
        }),
        cmd_config
    });

    return cli.run(argc, argv);
}
