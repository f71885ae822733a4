#ifndef HAND_FILE_HPP
#define HAND_FILE_HPP

#include "util/result.hpp"

#include <string>
#include <vector>

Result<std::string> readTextFile(const std::string& filePath);

// Rooms write one hand after another separated by blank lines
std::vector<std::string> splitHandHistories(const std::string& fileText);

#endif // HAND_FILE_HPP
