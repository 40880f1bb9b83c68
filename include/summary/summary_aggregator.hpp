#pragma once

#include "assignment/cluster_assigner.hpp"
#include "clustering/partition.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace affinity {

// (group label, cluster id)
using GroupClusterKey = std::pair<std::string, int>;

// Interest with its occurrence count
using InterestCount = std::pair<std::string, size_t>;

/**
 * @brief Grouped views over the assignments
 */
struct MatchmakingSummary {
    std::map<GroupClusterKey, size_t> counts;                  // students per (group, cluster)
    std::map<int, std::vector<InterestCount>> top_interests;   // most shared interests per cluster
    std::map<GroupClusterKey, std::string> identifier_lists;   // ", "-joined emails per (group, cluster)

    nlohmann::json to_json() const;

    /**
     * @brief Render the three sections as plain text
     */
    void print_summary(std::ostream& out) const;
};

class SummaryAggregator {
public:
    /**
     * @throws std::invalid_argument if top_n is negative
     */
    explicit SummaryAggregator(int top_n = 5);

    MatchmakingSummary summarize(
        const std::vector<Assignment>& assignments,
        const ClusterInterestSets& clusters
    ) const;

    std::map<GroupClusterKey, size_t> count_by_group_and_cluster(
        const std::vector<Assignment>& assignments) const;

    /**
     * @brief Top-N interests of every cluster
     *
     * Counts each assigned student's interests that belong to their cluster.
     * Equal counts keep first-encountered order. Clusters without students
     * get an empty list.
     */
    std::map<int, std::vector<InterestCount>> top_interests(
        const std::vector<Assignment>& assignments,
        const ClusterInterestSets& clusters) const;

    std::map<GroupClusterKey, std::string> identifier_lists(
        const std::vector<Assignment>& assignments,
        const std::string& separator = ", ") const;

    int top_n() const { return top_n_; }

private:
    int top_n_;
};

} // namespace affinity
