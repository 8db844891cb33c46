#pragma once

#include "line-history.hxx"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct RepositoryBackend;

struct HistoryQuery {
	std::string filePath;
	std::uint32_t lineNumber{1};
	SortOrder sortOrder{SortOrder::Ascending};
	/// Full or abbreviated commit ids
	std::vector<std::string> ignoreRevs;
	std::optional<std::string> since;
	std::optional<std::string> until;
	/// Maximum number of commits to walk, 0 walks the whole history
	std::size_t limit{0};
	/// Fill LineEvent::content with the text of the line at each commit
	bool includeContent{false};
};

/**
 * @brief Collects the commits that touched a file and turns them into a LineHistory
 *
 * A commit is relevant if the file exists in its tree and it either is a root commit or changed the file
 * relative to at least one of its parents. This works on file level: every commit touching the file is
 * reported, not only those that altered the requested line.
 *
 * The chronologically earliest reported commit is classified as ChangeType::Created, all others as
 * ChangeType::Modified. Ignored and date-filtered commits take no part in that decision.
 */
class LineHistoryEngine {
public:
	explicit LineHistoryEngine(const RepositoryBackend& backend);

	/**
	 * @throws std::invalid_argument for a line number of 0 or an empty path
	 * @throws InvalidDateFormat, RepositoryEmpty, FileNotFound, BackendError
	 */
	LineHistory getLineHistory(const HistoryQuery& query) const;

	LineHistory getLineHistory(
		const std::string& filePath,
		std::uint32_t lineNumber,
		SortOrder sortOrder,
		const std::vector<std::string>& ignoreRevs,
		const std::optional<std::string>& since = std::nullopt,
		const std::optional<std::string>& until = std::nullopt) const;

private:
	bool isRelevant(const Commit& commit, std::string_view path) const;
	LineEvent toEvent(const Commit& commit, const HistoryQuery& query) const;

	const RepositoryBackend& backend_;
};
