#include "summary/summary_aggregator.hpp"
#include <algorithm>
#include <stdexcept>

namespace affinity {

// ==========================================
// MatchmakingSummary
// ==========================================

nlohmann::json MatchmakingSummary::to_json() const {
    nlohmann::json j;

    nlohmann::json counts_arr = nlohmann::json::array();
    for (const auto& [key, count] : counts) {
        counts_arr.push_back({{"track", key.first}, {"cluster", key.second}, {"count", count}});
    }
    j["counts"] = counts_arr;

    nlohmann::json top_arr = nlohmann::json::array();
    for (const auto& [cluster_id, interests] : top_interests) {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& [interest, count] : interests) {
            items.push_back({{"interest", interest}, {"count", count}});
        }
        top_arr.push_back({{"cluster", cluster_id}, {"top_interests", items}});
    }
    j["top_interests"] = top_arr;

    nlohmann::json lists_arr = nlohmann::json::array();
    for (const auto& [key, emails] : identifier_lists) {
        lists_arr.push_back({{"track", key.first}, {"cluster", key.second}, {"emails", emails}});
    }
    j["email_lists"] = lists_arr;

    return j;
}

void MatchmakingSummary::print_summary(std::ostream& out) const {
    out << "\nCluster Summary (students per track and cluster):\n";
    for (const auto& [key, count] : counts) {
        out << "  " << key.first << " | cluster " << key.second << ": " << count << "\n";
    }

    out << "\nTop Interests in Each Cluster:\n";
    for (const auto& [cluster_id, interests] : top_interests) {
        out << "\nCluster " << cluster_id << ":\n";
        for (const auto& [interest, count] : interests) {
            out << "  " << interest << " (" << count << ")\n";
        }
    }

    out << "\nEmail lists for calendar invites:\n";
    for (const auto& [key, emails] : identifier_lists) {
        out << "Track: " << key.first << " | Cluster: " << key.second << "\n";
        out << "Emails: " << emails << "\n\n";
    }
}

// ==========================================
// SummaryAggregator
// ==========================================

SummaryAggregator::SummaryAggregator(int top_n) : top_n_(top_n) {
    if (top_n < 0) {
        throw std::invalid_argument("top_n must be non-negative");
    }
}

MatchmakingSummary SummaryAggregator::summarize(
    const std::vector<Assignment>& assignments,
    const ClusterInterestSets& clusters) const {

    MatchmakingSummary summary;
    summary.counts = count_by_group_and_cluster(assignments);
    summary.top_interests = top_interests(assignments, clusters);
    summary.identifier_lists = identifier_lists(assignments);
    return summary;
}

std::map<GroupClusterKey, size_t> SummaryAggregator::count_by_group_and_cluster(
    const std::vector<Assignment>& assignments) const {

    std::map<GroupClusterKey, size_t> counts;
    for (const auto& a : assignments) {
        counts[{a.group, a.cluster_id}]++;
    }
    return counts;
}

std::map<int, std::vector<InterestCount>> SummaryAggregator::top_interests(
    const std::vector<Assignment>& assignments,
    const ClusterInterestSets& clusters) const {

    std::map<int, std::vector<InterestCount>> result;

    for (const auto& [cluster_id, tags] : clusters) {
        std::vector<InterestCount> counts;       // first-seen order
        std::map<std::string, size_t> position;

        for (const auto& a : assignments) {
            if (a.cluster_id != cluster_id) continue;
            for (const auto& interest : a.matched_interests) {
                if (!std::binary_search(tags.begin(), tags.end(), interest)) continue;
                auto it = position.find(interest);
                if (it == position.end()) {
                    position[interest] = counts.size();
                    counts.emplace_back(interest, 1);
                } else {
                    counts[it->second].second++;
                }
            }
        }

        std::stable_sort(counts.begin(), counts.end(),
                         [](const auto& x, const auto& y) { return x.second > y.second; });
        if (counts.size() > static_cast<size_t>(top_n_)) {
            counts.resize(static_cast<size_t>(top_n_));
        }
        result[cluster_id] = std::move(counts);
    }

    return result;
}

std::map<GroupClusterKey, std::string> SummaryAggregator::identifier_lists(
    const std::vector<Assignment>& assignments,
    const std::string& separator) const {

    std::map<GroupClusterKey, std::string> lists;
    for (const auto& a : assignments) {
        auto& joined = lists[{a.group, a.cluster_id}];
        if (!joined.empty()) joined += separator;
        joined += a.identifier;
    }
    return lists;
}

} // namespace affinity
