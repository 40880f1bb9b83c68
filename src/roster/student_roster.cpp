#include "roster/student_roster.hpp"
#include "io/csv.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace affinity {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

void append_unique(std::vector<std::string>& out, const std::string& item) {
    if (item.empty()) return;
    if (std::find(out.begin(), out.end(), item) == out.end()) {
        out.push_back(item);
    }
}

// Null or non-string fields read as empty
std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

int find_column(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (trim(header[i]) == name) return static_cast<int>(i);
    }
    return -1;
}

}  // namespace

// ==========================================
// StudentRecord
// ==========================================

StudentRecord StudentRecord::from_json(const nlohmann::json& j) {
    StudentRecord record;
    if (!j.is_object()) {
        return record;
    }

    record.identifier = normalize_identifier(string_field(j, "email"));
    record.first_name = string_field(j, "firstName");
    record.last_name = string_field(j, "lastName");

    auto it = j.find("interests");
    if (it == j.end()) {
        return record;
    }
    if (it->is_array()) {
        for (const auto& item : *it) {
            if (!item.is_string()) continue;
            append_unique(record.interests, trim(item.get<std::string>()));
        }
    } else if (it->is_string()) {
        for (const auto& item : split_interest_list(it->get<std::string>())) {
            append_unique(record.interests, item);
        }
    }

    return record;
}

// ==========================================
// Parsing helpers
// ==========================================

std::string normalize_identifier(const std::string& raw) {
    std::string id = trim(raw);
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return id;
}

std::vector<std::string> split_interest_list(const std::string& raw, char delim) {
    std::vector<std::string> items;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

StudentRecords parse_student_records(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Student data must be a JSON object keyed by email");
    }

    StudentRecords records;
    for (const auto& [key, value] : j.items()) {
        std::string id = normalize_identifier(key);
        if (id.empty()) continue;

        StudentRecord record = StudentRecord::from_json(value);
        record.identifier = id;
        records.emplace(id, std::move(record));
    }
    return records;
}

StudentRecords load_student_records(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open student data file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed student data in " + path + ": " + e.what());
    }
    return parse_student_records(j);
}

std::vector<TargetEntry> parse_target_subset(
    std::istream& in,
    const std::string& id_column,
    const std::string& group_column) {

    std::vector<std::string> header;
    if (!read_csv_row(in, header)) {
        throw std::runtime_error("Target subset is empty (no header row)");
    }

    // Strip a UTF-8 byte order mark from the first header cell
    if (!header.empty() && header[0].rfind("\xEF\xBB\xBF", 0) == 0) {
        header[0] = header[0].substr(3);
    }

    int id_idx = find_column(header, id_column);
    int group_idx = find_column(header, group_column);
    if (id_idx < 0) {
        throw std::runtime_error("Target subset is missing column: " + id_column);
    }
    if (group_idx < 0) {
        throw std::runtime_error("Target subset is missing column: " + group_column);
    }

    std::vector<TargetEntry> targets;
    std::set<std::string> seen;
    std::vector<std::string> row;
    while (read_csv_row(in, row)) {
        if (row.size() <= static_cast<size_t>(id_idx)) continue;

        std::string id = normalize_identifier(row[id_idx]);
        if (id.empty()) continue;
        if (!seen.insert(id).second) continue;

        std::string group;
        if (row.size() > static_cast<size_t>(group_idx)) {
            group = trim(row[group_idx]);
        }
        targets.push_back({id, group});
    }

    return targets;
}

std::vector<TargetEntry> load_target_subset(
    const std::string& path,
    const std::string& id_column,
    const std::string& group_column) {

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open target subset file: " + path);
    }
    return parse_target_subset(file, id_column, group_column);
}

// ==========================================
// InterestPool
// ==========================================

InterestPool::InterestPool(const std::set<std::string>& tags)
    : tags_(tags.begin(), tags.end()) {}

InterestPool InterestPool::build(
    const StudentRecords& records,
    const std::vector<TargetEntry>& targets,
    const std::set<std::string>& excluded) {

    std::set<std::string> tags;
    for (const auto& target : targets) {
        auto it = records.find(target.identifier);
        if (it == records.end()) continue;

        for (const auto& interest : it->second.interests) {
            if (excluded.count(interest) == 0) {
                tags.insert(interest);
            }
        }
    }
    return InterestPool(tags);
}

bool InterestPool::contains(const std::string& tag) const {
    return std::binary_search(tags_.begin(), tags_.end(), tag);
}

std::vector<std::string> InterestPool::restrict(const std::vector<std::string>& interests) const {
    std::vector<std::string> result;
    for (const auto& interest : interests) {
        if (contains(interest)) {
            append_unique(result, interest);
        }
    }
    return result;
}

} // namespace affinity
