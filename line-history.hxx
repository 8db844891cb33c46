#pragma once

#include "commit.hxx"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class ChangeType { Created, Modified, Deleted };

std::string_view toString(ChangeType type);

enum class SortOrder { Ascending, Descending };

std::string_view toString(SortOrder order);

struct LineEvent {
	std::string commitId;
	std::string author;
	Timestamp time;
	std::string message;
	ChangeType change;
	std::string content;

	std::string_view shortId() const { return abbreviate(commitId); }

	bool operator==(const LineEvent&) const = default;
};

/**
 * @brief Ordered edit history of one line of one file
 *
 * Built once by LineHistoryEngine, read-only afterwards.
 */
class LineHistory {
public:
	LineHistory(std::string filePath, std::uint32_t lineNumber, std::vector<LineEvent> events);

	const std::string& filePath() const { return filePath_; }

	std::uint32_t lineNumber() const { return lineNumber_; }

	const std::vector<LineEvent>& events() const { return events_; }

	bool empty() const { return events_.empty(); }

	std::size_t size() const { return events_.size(); }

	bool operator==(const LineHistory&) const = default;

private:
	std::string filePath_;
	std::uint32_t lineNumber_;
	std::vector<LineEvent> events_;
};
