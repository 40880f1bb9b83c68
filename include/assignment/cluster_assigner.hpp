#pragma once

#include "clustering/partition.hpp"
#include "roster/student_roster.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace affinity {

/**
 * @brief A student placed in the cluster their interests overlap most
 */
struct Assignment {
    std::string identifier;
    std::string first_name;
    std::string last_name;
    std::string group;
    int cluster_id = -1;
    std::vector<std::string> matched_interests;    // Pool interests inside the chosen cluster

    nlohmann::json to_json() const;
};

/**
 * @brief Maps students onto interest clusters
 *
 * Holds references to the pool and partition; both must outlive the assigner.
 */
class ClusterAssigner {
public:
    ClusterAssigner(const InterestPool& pool, const Partition& partition);

    /**
     * @brief Pick the cluster with the largest interest overlap
     * @return std::nullopt when the student has no pool interests
     *
     * Ties go to the lowest cluster id. Matched interests keep the student's
     * own order.
     */
    std::optional<Assignment> assign(const StudentRecord& student, const std::string& group = "") const;

    /**
     * @brief Overlap size with every cluster of the partition (zeros included)
     */
    std::map<int, size_t> overlap_scores(const std::vector<std::string>& pool_interests) const;

    const ClusterInterestSets& clusters() const { return clusters_; }

private:
    const InterestPool& pool_;
    const Partition& partition_;
    ClusterInterestSets clusters_;
};

} // namespace affinity
