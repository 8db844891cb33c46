#include "history-engine.hxx"

#include "date-parser.hxx"
#include "errors.hxx"
#include "filters.hxx"
#include "repository-backend.hxx"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <functional>
#include <memory>
#include <stdexcept>
#include <unordered_set>

namespace {
	std::optional<Instant> parseBound(const std::optional<std::string>& text)
	{
		if (!text) {
			return std::nullopt;
		}
		return parseDate(*text);
	}
} // namespace

LineHistoryEngine::LineHistoryEngine(const RepositoryBackend& backend)
	: backend_{backend}
{
}

LineHistory LineHistoryEngine::getLineHistory(
	const std::string& filePath,
	std::uint32_t lineNumber,
	SortOrder sortOrder,
	const std::vector<std::string>& ignoreRevs,
	const std::optional<std::string>& since,
	const std::optional<std::string>& until) const
{
	return getLineHistory(HistoryQuery{
		.filePath = filePath,
		.lineNumber = lineNumber,
		.sortOrder = sortOrder,
		.ignoreRevs = ignoreRevs,
		.since = since,
		.until = until,
	});
}

LineHistory LineHistoryEngine::getLineHistory(const HistoryQuery& query) const
{
	if (query.lineNumber < 1) {
		throw std::invalid_argument{"Line numbers start at 1"};
	}
	if (query.filePath.empty()) {
		throw std::invalid_argument{"File path must not be empty"};
	}

	IgnoreRevisionsFilter ignoreFilter{query.ignoreRevs};
	DateRangeFilter dateFilter{parseBound(query.since), parseBound(query.until)};

	spdlog::debug(
		"Line history of {}:{}, sort {}, {} ignored revisions, since '{}', until '{}', limit {}", query.filePath,
		query.lineNumber, toString(query.sortOrder), query.ignoreRevs.size(), query.since.value_or(""),
		query.until.value_or(""), query.limit);

	const Commit head{backend_.headCommit()};

	// newest first, as walked
	std::vector<LineEvent> events;
	std::unordered_set<std::string> seen;
	std::size_t examined{};

	std::unique_ptr<CommitStream> commits{backend_.walkCommits(head)};
	while (query.limit == 0 || examined < query.limit) {
		std::optional<Commit> commit{commits->next()};
		if (!commit) {
			break;
		}
		if (!seen.insert(commit->id).second) {
			continue;
		}
		++examined;

		if (!ignoreFilter(*commit)) {
			spdlog::trace("{} is ignored", commit->shortId());
			continue;
		}
		if (!dateFilter(*commit)) {
			spdlog::trace("{} is outside of the date range", commit->shortId());
			continue;
		}
		if (isRelevant(*commit, query.filePath)) {
			events.push_back(toEvent(*commit, query));
		}
	}

	if (query.limit != 0 && examined == query.limit) {
		spdlog::debug("Stopped after the limit of {} commits", query.limit);
	}
	spdlog::debug("Examined {} commits, {} touched {}", examined, events.size(), query.filePath);

	if (events.empty() && !backend_.pathExistsInTree(head, query.filePath)) {
		throw FileNotFound{std::format("File not found in repository: {}", query.filePath)};
	}

	// oldest first; commits with equal time stay in reverse walk order
	std::ranges::reverse(events);
	std::ranges::stable_sort(events, std::ranges::less{}, &LineEvent::time);

	if (!events.empty()) {
		events.front().change = ChangeType::Created;
	}

	if (query.sortOrder == SortOrder::Descending) {
		std::ranges::reverse(events);
	}

	return LineHistory{query.filePath, query.lineNumber, std::move(events)};
}

bool LineHistoryEngine::isRelevant(const Commit& commit, std::string_view path) const
{
	return backend_.pathExistsInTree(commit, path) && (commit.isRoot() || backend_.pathChanged(commit, path));
}

LineEvent LineHistoryEngine::toEvent(const Commit& commit, const HistoryQuery& query) const
{
	LineEvent event{
		.commitId = commit.id,
		.author = commit.author,
		.time = commit.time,
		.message = commit.message,
		.change = ChangeType::Modified,
		.content = {},
	};
	if (query.includeContent) {
		event.content = backend_.readLine(commit, query.filePath, query.lineNumber).value_or("");
	}
	return event;
}
