#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace affinity {

// Interest tag -> cluster id. Every pool tag appears exactly once.
using Partition = std::map<std::string, int>;

// Cluster id -> tags in that cluster (sorted)
using ClusterInterestSets = std::map<int, std::vector<std::string>>;

/**
 * @brief Invert a partition into per-cluster interest sets
 *
 * Tags inside each cluster keep the partition's (sorted) key order.
 */
ClusterInterestSets group_by_cluster(const Partition& partition);

/**
 * @brief Distinct cluster ids of a partition, ascending
 */
std::vector<int> cluster_ids(const Partition& partition);

nlohmann::json clusters_to_json(const ClusterInterestSets& clusters);

} // namespace affinity
