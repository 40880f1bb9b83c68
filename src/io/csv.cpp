#include "io/csv.hpp"

namespace affinity {

bool read_csv_row(std::istream& in, std::vector<std::string>& row) {
    row.clear();

    std::string line;
    if (!std::getline(in, line)) {
        return false;
    }

    std::string field;
    bool in_quotes = false;

    while (true) {
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        field += '"';
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field += c;
                }
            } else if (c == '"') {
                in_quotes = true;
            } else if (c == ',') {
                row.push_back(field);
                field.clear();
            } else if (c != '\r') {
                field += c;
            }
        }

        if (!in_quotes) break;

        // Quoted field continues on the next physical line
        field += '\n';
        if (!std::getline(in, line)) break;
    }

    row.push_back(field);
    return true;
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

void write_csv_row(std::ostream& out, const std::vector<std::string>& row) {
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out << ',';
        out << csv_escape(row[i]);
    }
    out << '\n';
}

} // namespace affinity
