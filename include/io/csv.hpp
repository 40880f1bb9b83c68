#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace affinity {

/**
 * @brief Read one CSV record (RFC 4180 quoting, quoted fields may span lines)
 * @return false at end of input
 */
bool read_csv_row(std::istream& in, std::vector<std::string>& row);

// Quote a field when it contains a delimiter, quote or line break
std::string csv_escape(const std::string& field);

void write_csv_row(std::ostream& out, const std::vector<std::string>& row);

} // namespace affinity
