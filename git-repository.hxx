#pragma once

#include "repository-backend.hxx"

#include <git2/types.h>

#include <filesystem>
#include <memory>

/**
 * @brief Keeps libgit2 initialised while alive
 */
struct libgit2 {
	libgit2();
	~libgit2();

	libgit2(const libgit2&) = delete;
	libgit2& operator=(const libgit2&) = delete;
};

struct git_repo_deleter {
	void operator()(git_repository* repo) const;
};

/**
 * @brief RepositoryBackend on top of libgit2
 *
 * Commit streams returned by walkCommits() refer to this repository and must not outlive it.
 */
class GitRepository: public RepositoryBackend {
public:
	/**
	 * @throws RepositoryNotFound if @p path is not a git repository
	 */
	static GitRepository open(const std::filesystem::path& path);

	/// Takes ownership of @p repo
	explicit GitRepository(git_repository* repo);

	git_repository& native() const { return *repo_; }

	Commit headCommit() const override;
	std::unique_ptr<CommitStream> walkCommits(const Commit& from) const override;
	bool pathExistsInTree(const Commit& commit, std::string_view path) const override;
	std::set<std::string, std::less<>> changedPaths(const Commit& commit) const override;
	bool pathChanged(const Commit& commit, std::string_view path) const override;
	std::optional<std::string> readLine(
		const Commit& commit, std::string_view path, std::uint32_t lineNumber) const override;

private:
	std::unique_ptr<git_repository, git_repo_deleter> repo_;
};
