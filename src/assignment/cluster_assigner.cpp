#include "assignment/cluster_assigner.hpp"

namespace affinity {

nlohmann::json Assignment::to_json() const {
    nlohmann::json j;
    j["email"] = identifier;
    j["firstName"] = first_name;
    j["lastName"] = last_name;
    j["track"] = group;
    j["cluster"] = cluster_id;
    j["matched_interests"] = matched_interests;
    return j;
}

ClusterAssigner::ClusterAssigner(const InterestPool& pool, const Partition& partition)
    : pool_(pool), partition_(partition), clusters_(group_by_cluster(partition)) {}

std::map<int, size_t> ClusterAssigner::overlap_scores(const std::vector<std::string>& pool_interests) const {
    std::map<int, size_t> scores;
    for (const auto& [cluster_id, _] : clusters_) {
        scores[cluster_id] = 0;
    }
    for (const auto& interest : pool_interests) {
        auto it = partition_.find(interest);
        if (it != partition_.end()) {
            scores[it->second]++;
        }
    }
    return scores;
}

std::optional<Assignment> ClusterAssigner::assign(const StudentRecord& student, const std::string& group) const {
    std::vector<std::string> interests = pool_.restrict(student.interests);
    if (interests.empty()) {
        return std::nullopt;
    }

    // Ascending id with a strict comparison: the first maximum wins
    int best_cluster = -1;
    size_t best_score = 0;
    for (const auto& [cluster_id, score] : overlap_scores(interests)) {
        if (score > best_score) {
            best_score = score;
            best_cluster = cluster_id;
        }
    }
    if (best_cluster < 0) {
        return std::nullopt;
    }

    Assignment assignment;
    assignment.identifier = student.identifier;
    assignment.first_name = student.first_name;
    assignment.last_name = student.last_name;
    assignment.group = group;
    assignment.cluster_id = best_cluster;
    for (const auto& interest : interests) {
        auto it = partition_.find(interest);
        if (it != partition_.end() && it->second == best_cluster) {
            assignment.matched_interests.push_back(interest);
        }
    }
    return assignment;
}

} // namespace affinity
