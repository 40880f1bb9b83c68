#pragma once

#include <nlohmann/json.hpp>
#include <istream>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace affinity {

/**
 * @brief One surveyed individual
 *
 * Interests are deduplicated on load but keep the order the student gave them.
 */
struct StudentRecord {
    std::string identifier;                 // Normalized email
    std::string first_name;
    std::string last_name;
    std::vector<std::string> interests;     // Raw tags, may lie outside the pool

    /**
     * @brief Create a record from a survey JSON object
     *
     * Accepts `interests` either as an array or as a single ';'-separated string.
     * Null or non-string names read as empty; non-string interest items are
     * skipped. A value that is not an object yields an empty record.
     */
    static StudentRecord from_json(const nlohmann::json& j);
};

// identifier -> record
using StudentRecords = std::map<std::string, StudentRecord>;

// One row of the target subset: who to cluster and under which group label
struct TargetEntry {
    std::string identifier;
    std::string group;
};

/**
 * @brief Trim surrounding whitespace and lower-case an identifier
 */
std::string normalize_identifier(const std::string& raw);

/**
 * @brief Split a delimited interest string, trimming items and dropping empties
 */
std::vector<std::string> split_interest_list(const std::string& raw, char delim = ';');

StudentRecords parse_student_records(const nlohmann::json& j);

/**
 * @brief Load the record map (JSON object keyed by email)
 * @throws std::runtime_error if the file cannot be opened or parsed
 */
StudentRecords load_student_records(const std::string& path);

/**
 * @brief Parse the target subset from CSV
 * @param id_column Header of the identifier column
 * @param group_column Header of the group label column
 *
 * Blank identifiers are skipped; a repeated identifier keeps its first row.
 * @throws std::runtime_error if a required column is missing
 */
std::vector<TargetEntry> parse_target_subset(
    std::istream& in,
    const std::string& id_column = "Email",
    const std::string& group_column = "Track"
);

std::vector<TargetEntry> load_target_subset(
    const std::string& path,
    const std::string& id_column = "Email",
    const std::string& group_column = "Track"
);

/**
 * @brief The universe of interest tags for one run
 *
 * Union of the interests of every target individual that has a record, minus
 * the exclusion set. Stored sorted; immutable once built.
 */
class InterestPool {
public:
    InterestPool() = default;
    explicit InterestPool(const std::set<std::string>& tags);

    static InterestPool build(
        const StudentRecords& records,
        const std::vector<TargetEntry>& targets,
        const std::set<std::string>& excluded
    );

    bool contains(const std::string& tag) const;

    /**
     * @brief Keep only pool tags, in the given order, without duplicates
     */
    std::vector<std::string> restrict(const std::vector<std::string>& interests) const;

    const std::vector<std::string>& tags() const { return tags_; }
    size_t size() const { return tags_.size(); }
    bool empty() const { return tags_.empty(); }

private:
    std::vector<std::string> tags_;
};

} // namespace affinity
