#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

using Timestamp = std::chrono::sys_seconds;

/// Point in time with sub-second precision, used for date bounds given by the user
using Instant = std::chrono::sys_time<std::chrono::nanoseconds>;

/**
 * @brief Snapshot of commit metadata as handed out by a RepositoryBackend
 *
 * Identifiers are lowercase hexadecimal object ids.
 */
struct Commit {
	std::string id;
	std::string author;
	Timestamp time;
	std::string message;
	std::vector<std::string> parents;

	bool isRoot() const { return parents.empty(); }

	std::string_view shortId() const;
};

constexpr std::size_t shortIdLength{8};

std::string_view abbreviate(std::string_view id);

/// YYYY-MM-DD HH:MM:SS in UTC
std::string formatTimestamp(Timestamp time);
