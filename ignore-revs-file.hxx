#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Reads a list of revisions to ignore, in the format of git blame --ignore-revs-file
 *
 * @throws std::runtime_error if the file cannot be read or contains something else than revisions
 */
std::vector<std::string> loadIgnoreRevsFile(const std::filesystem::path& filePath);
