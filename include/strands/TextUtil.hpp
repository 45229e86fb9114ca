// File: TextUtil.hpp
// Description: Declares the small string helpers shared by the file readers.

#pragma once

#include <string>
#include <vector>

namespace strands {

std::string trim(const std::string& input);
std::string toLowerCopy(std::string value);
std::vector<std::string> splitWhitespace(const std::string& line);

// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> readLines(const std::string& path);

}  // namespace strands
