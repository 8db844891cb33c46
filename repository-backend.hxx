#pragma once

#include "commit.hxx"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>

/**
 * @brief Lazy newest-first sequence of commits
 *
 * Every commit is yielded once, even when reachable through several parents.
 */
struct CommitStream {
	virtual ~CommitStream() = default;

	/// Next commit or std::nullopt when the history is exhausted
	virtual std::optional<Commit> next() = 0;
};

/**
 * @brief Read-only query surface of a version control repository
 *
 * Paths are repository relative and use '/' as separator.
 */
struct RepositoryBackend {
	virtual ~RepositoryBackend() = default;

	/**
	 * @throws RepositoryEmpty if HEAD has no reachable commit
	 */
	virtual Commit headCommit() const = 0;

	/// Commits reachable from @p from ordered by commit time, newest first
	virtual std::unique_ptr<CommitStream> walkCommits(const Commit& from) const = 0;

	virtual bool pathExistsInTree(const Commit& commit, std::string_view path) const = 0;

	/**
	 * @brief Paths changed relative to each parent
	 *
	 * For a root commit this is every file of its tree.
	 */
	virtual std::set<std::string, std::less<>> changedPaths(const Commit& commit) const = 0;

	/**
	 * @brief True if @p path is among changedPaths(commit)
	 *
	 * Backends may override this with a cheaper path-limited lookup.
	 */
	virtual bool pathChanged(const Commit& commit, std::string_view path) const
	{
		return changedPaths(commit).contains(path);
	}

	/**
	 * @brief Text of line @p lineNumber (1-based) of @p path in @p commit, without the line terminator
	 *
	 * std::nullopt if the file is missing, binary or shorter than @p lineNumber.
	 */
	virtual std::optional<std::string> readLine(
		const Commit& commit, std::string_view path, std::uint32_t lineNumber) const = 0;
};
