#include "ignore-revs-file.hxx"

#include "utility.hxx"

#include <spdlog/spdlog.h>

#include <format>
#include <fstream>
#include <stdexcept>

namespace {
	constexpr std::size_t minimalRevisionLength{4};
}

std::vector<std::string> loadIgnoreRevsFile(const std::filesystem::path& filePath)
{
	std::ifstream file{filePath};
	if (!file) {
		throw std::runtime_error(std::format("Could not read ignore-revs file {}", filePath.string()));
	}

	/*
	 * Format of the ignore-revs file:
	 *
	 * # comment
	 * <full or abbreviated commit id>
	 *
	 * One revision per line, empty lines and lines starting with '#' are ignored
	 */

	std::vector<std::string> result;

	std::string line;
	std::size_t currentLineNumber{};

	while (std::getline(file, line)) {
		++currentLineNumber;
		trimWhitespace(line);
		if (line.starts_with('#') || line.empty()) {
			continue;
		}
		if (line.size() < minimalRevisionLength || !ishex(line)) {
			throw std::runtime_error(
				std::format("Could not parse ignore-revs file at {}:{}", filePath.string(), currentLineNumber));
		}
		result.push_back(toLowerCopy(line));
	}

	spdlog::debug("Read {} revisions from {}", result.size(), filePath.string());
	return result;
}
