#include "clustering/partition.hpp"
#include <set>

namespace affinity {

ClusterInterestSets group_by_cluster(const Partition& partition) {
    ClusterInterestSets clusters;
    for (const auto& [tag, cluster_id] : partition) {
        clusters[cluster_id].push_back(tag);
    }
    return clusters;
}

std::vector<int> cluster_ids(const Partition& partition) {
    std::set<int> ids;
    for (const auto& [_, cluster_id] : partition) {
        ids.insert(cluster_id);
    }
    return std::vector<int>(ids.begin(), ids.end());
}

nlohmann::json clusters_to_json(const ClusterInterestSets& clusters) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& [cluster_id, tags] : clusters) {
        j.push_back({
            {"cluster", cluster_id},
            {"interests", tags}
        });
    }
    return j;
}

} // namespace affinity
