#include "pipeline/matchmaking_pipeline.hpp"
#include <iostream>
#include <iomanip>

using namespace affinity;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

StudentRecord make_student(const std::string& email, const std::string& first, const std::string& last,
                           const std::vector<std::string>& interests) {
    StudentRecord s;
    s.identifier = normalize_identifier(email);
    s.first_name = first;
    s.last_name = last;
    s.interests = interests;
    return s;
}

int main() {
    print_separator("Interest Clustering Example - Micro-Community Matchmaking");

    // A small cohort with two obvious interest themes and one bridge student
    StudentRecords records;
    for (const auto& s : {
            make_student("ada@school.edu", "Ada", "L", {"robotics", "3D printing", "electronics"}),
            make_student("alan@school.edu", "Alan", "T", {"robotics", "electronics", "AI & machine learning"}),
            make_student("grace@school.edu", "Grace", "H", {"3D printing", "robotics", "electronics"}),
            make_student("frida@school.edu", "Frida", "K", {"painting", "photography", "film"}),
            make_student("pablo@school.edu", "Pablo", "P", {"painting", "film", "photography"}),
            make_student("agnes@school.edu", "Agnes", "V", {"film", "photography"}),
            make_student("leo@school.edu", "Leo", "D", {"painting", "electronics"}),
            make_student("nobody@school.edu", "No", "Body", {"something not listed"})
        }) {
        records[s.identifier] = s;
    }

    std::vector<TargetEntry> targets = {
        {"ada@school.edu", "Engineering"},
        {"frida@school.edu", "Arts"},
        {"alan@school.edu", "Engineering"},
        {"pablo@school.edu", "Arts"},
        {"grace@school.edu", "Engineering"},
        {"agnes@school.edu", "Arts"},
        {"leo@school.edu", "Arts"},
        {"nobody@school.edu", "Arts"},
        {"missing@school.edu", "Arts"}
    };

    std::cout << "1. Running the matchmaking pipeline (gamma = 1.0, sorted visiting order)\n\n";
    MatchmakingConfig config;
    MatchmakingPipeline pipeline(config);
    MatchmakingResult result = pipeline.run(records, targets);

    print_separator("Interest Pool and Co-occurrence Matrix");
    const auto& pool = result.graph.nodes();
    for (size_t i = 0; i < pool.size(); ++i) {
        std::cout << std::setw(14) << pool[i];
        for (size_t j = 0; j < pool.size(); ++j) {
            std::cout << std::setw(3) << result.graph.matrix()[i][j];
        }
        std::cout << "\n";
    }

    print_separator("Interest Clusters");
    for (const auto& [cluster_id, interests] : result.clusters) {
        std::cout << "Cluster " << cluster_id << ":";
        for (const auto& interest : interests) std::cout << " [" << interest << "]";
        std::cout << "\n";
    }
    std::cout << "\nModularity: " << result.clustering.modularity << "\n";

    print_separator("Student Assignments");
    for (const auto& a : result.assignments) {
        std::cout << std::left << std::setw(20) << a.identifier << std::setw(13) << a.group
                  << "cluster " << a.cluster_id << "  matched:";
        for (const auto& m : a.matched_interests) std::cout << " " << m;
        std::cout << "\n";
    }

    result.summary.print_summary(std::cout);
    result.stats.print_summary();

    return 0;
}
