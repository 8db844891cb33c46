#include "line-history.hxx"

#include <utility>

std::string_view toString(ChangeType type)
{
	switch (type) {
		case ChangeType::Created:
			return "Created";
		case ChangeType::Modified:
			return "Modified";
		case ChangeType::Deleted:
			return "Deleted";
	}
	return "Unknown";
}

std::string_view toString(SortOrder order)
{
	return order == SortOrder::Ascending ? "asc" : "desc";
}

LineHistory::LineHistory(std::string filePath, std::uint32_t lineNumber, std::vector<LineEvent> events)
	: filePath_{std::move(filePath)}
	, lineNumber_{lineNumber}
	, events_{std::move(events)}
{
}
