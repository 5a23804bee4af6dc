#pragma once

#include <string>
#include <utility>
#include <vector>

namespace costbook {

std::string trim(std::string value);

std::string to_upper_copy(std::string value);

std::string to_lower_copy(std::string value);

bool contains(const std::string& haystack, const std::string& needle);

// Removes a leading UTF-8 byte order mark.
std::string strip_bom(std::string value);

// Splits one CSV record. Handles double-quoted fields with embedded commas
// and doubled quotes. Fields are returned trimmed.
std::vector<std::string> split_csv_line(const std::string& line);

// Replaces every "{name}" in the template with the matching value.
std::string expand_template(std::string text,
                            const std::vector<std::pair<std::string, std::string>>& values);

} // namespace costbook
