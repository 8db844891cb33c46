#include "git-repository.hxx"

#include "utility.hxx"

#include <git2/blob.h>
#include <git2/commit.h>
#include <git2/diff.h>
#include <git2/global.h>
#include <git2/oid.h>
#include <git2/refs.h>
#include <git2/repository.h>
#include <git2/revwalk.h>
#include <git2/tree.h>

#include <format>
#include <unordered_set>
#include <utility>

namespace {
	template <typename T, void (*Free)(T*)>
	struct git_deleter {
		void operator()(T* object) const
		{
			if (object) {
				Free(object);
			}
		}
	};

	template <typename T, void (*Free)(T*)>
	using git_ptr = std::unique_ptr<T, git_deleter<T, Free>>;

	using CommitPtr = git_ptr<git_commit, git_commit_free>;
	using TreePtr = git_ptr<git_tree, git_tree_free>;
	using TreeEntryPtr = git_ptr<git_tree_entry, git_tree_entry_free>;
	using DiffPtr = git_ptr<git_diff, git_diff_free>;
	using BlobPtr = git_ptr<git_blob, git_blob_free>;
	using RevwalkPtr = git_ptr<git_revwalk, git_revwalk_free>;

	git_oid parseOid(std::string_view id)
	{
		git_oid oid;
		LibgitError::check(git_oid_fromstrn(&oid, id.data(), id.size()));
		return oid;
	}

	CommitPtr lookupCommit(git_repository& repo, const git_oid& id)
	{
		git_commit* commit;
		LibgitError::check(git_commit_lookup(&commit, &repo, &id));
		return CommitPtr{commit};
	}

	TreePtr commitTree(const git_commit& commit)
	{
		git_tree* tree;
		LibgitError::check(git_commit_tree(&tree, &commit));
		return TreePtr{tree};
	}

	/// nullptr if there is no entry at @p path
	TreeEntryPtr treeEntry(const git_tree& tree, std::string_view path)
	{
		if (path.empty()) {
			return nullptr;
		}
		git_tree_entry* entry;
		int error = git_tree_entry_bypath(&entry, &tree, std::string{path}.c_str());
		if (error == GIT_ENOTFOUND) {
			return nullptr;
		}
		LibgitError::check(error);
		return TreeEntryPtr{entry};
	}

	Commit toCommit(const git_commit& commit)
	{
		Commit result;
		result.id = oidToString(*git_commit_id(&commit));

		const git_signature* author = git_commit_author(&commit);
		result.author = author && author->name && *author->name ? author->name : "Unknown";
		result.time = Timestamp{std::chrono::seconds{author ? author->when.time : git_commit_time(&commit)}};

		const char* message = git_commit_message(&commit);
		result.message = message ? message : "";

		const unsigned int parentCount = git_commit_parentcount(&commit);
		result.parents.reserve(parentCount);
		for (unsigned int i = 0; i < parentCount; ++i) {
			result.parents.push_back(oidToString(*git_commit_parent_id(&commit, i)));
		}
		return result;
	}

	/**
	 * @brief Diff of @p tree against the tree of parent number @p index of @p commit
	 *
	 * With a non-empty @p path the diff is limited to exactly that path.
	 */
	DiffPtr diffAgainstParent(
		git_repository& repo, const git_commit& commit, git_tree& tree, unsigned int index, std::string_view path)
	{
		git_commit* parent;
		LibgitError::check(git_commit_parent(&parent, &commit, index));
		CommitPtr parentCommit{parent};
		TreePtr parentTree{commitTree(*parent)};

		git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
		std::string pathspec{path};
		char* pathspecs[] = {pathspec.data()};
		if (!path.empty()) {
			opts.pathspec.strings = pathspecs;
			opts.pathspec.count = 1;
			opts.flags |= GIT_DIFF_DISABLE_PATHSPEC_MATCH;
		}

		git_diff* diff;
		LibgitError::check(git_diff_tree_to_tree(&diff, &repo, parentTree.get(), &tree, &opts));
		return DiffPtr{diff};
	}

	int collectBlobPath(const char* root, const git_tree_entry* entry, void* payload)
	{
		if (git_tree_entry_type(entry) == GIT_OBJECT_BLOB) {
			static_cast<std::set<std::string, std::less<>>*>(payload)->emplace(
				std::string{root} + git_tree_entry_name(entry));
		}
		return 0;
	}

	class GitCommitStream: public CommitStream {
	public:
		GitCommitStream(git_repository& repo, const git_oid& start)
			: repo_{repo}
		{
			git_revwalk* walk;
			LibgitError::check(git_revwalk_new(&walk, &repo));
			walk_.reset(walk);
			LibgitError::check(git_revwalk_sorting(walk, GIT_SORT_TIME));
			LibgitError::check(git_revwalk_push(walk, &start));
		}

		std::optional<Commit> next() override
		{
			git_oid oid;
			for (;;) {
				int error = git_revwalk_next(&oid, walk_.get());
				if (error == GIT_ITEROVER) {
					return std::nullopt;
				}
				LibgitError::check(error);
				if (!seen_.insert(oidToString(oid)).second) {
					continue;
				}
				CommitPtr commit{lookupCommit(repo_, oid)};
				return toCommit(*commit);
			}
		}

	private:
		git_repository& repo_;
		RevwalkPtr walk_;
		std::unordered_set<std::string> seen_;
	};
} // namespace

libgit2::libgit2()
{
	git_libgit2_init();
}

libgit2::~libgit2()
{
	git_libgit2_shutdown();
}

void git_repo_deleter::operator()(git_repository* repo) const
{
	if (repo) {
		git_repository_free(repo);
	}
}

GitRepository GitRepository::open(const std::filesystem::path& path)
{
	git_repository* result;
	int error = git_repository_open(&result, path.c_str());
	if (error == GIT_ENOTFOUND) {
		throw RepositoryNotFound{std::format("Not a git repository: {}", path.string())};
	}
	LibgitError::check(error);
	return GitRepository{result};
}

GitRepository::GitRepository(git_repository* repo)
	: repo_{repo}
{
}

Commit GitRepository::headCommit() const
{
	git_oid id;
	int error = git_reference_name_to_id(&id, repo_.get(), "HEAD");
	if (error == GIT_ENOTFOUND || error == GIT_EUNBORNBRANCH) {
		throw RepositoryEmpty{"Repository has no commits"};
	}
	LibgitError::check(error);
	CommitPtr commit{lookupCommit(*repo_, id)};
	return toCommit(*commit);
}

std::unique_ptr<CommitStream> GitRepository::walkCommits(const Commit& from) const
{
	return std::make_unique<GitCommitStream>(*repo_, parseOid(from.id));
}

bool GitRepository::pathExistsInTree(const Commit& commit, std::string_view path) const
{
	CommitPtr c{lookupCommit(*repo_, parseOid(commit.id))};
	TreePtr tree{commitTree(*c)};
	return treeEntry(*tree, path) != nullptr;
}

std::set<std::string, std::less<>> GitRepository::changedPaths(const Commit& commit) const
{
	std::set<std::string, std::less<>> result;

	CommitPtr c{lookupCommit(*repo_, parseOid(commit.id))};
	TreePtr tree{commitTree(*c)};

	const unsigned int parentCount = git_commit_parentcount(c.get());
	if (parentCount == 0) {
		LibgitError::check(git_tree_walk(tree.get(), GIT_TREEWALK_PRE, &collectBlobPath, &result));
		return result;
	}

	for (unsigned int i = 0; i < parentCount; ++i) {
		DiffPtr diff{diffAgainstParent(*repo_, *c, *tree, i, {})};
		const std::size_t deltas = git_diff_num_deltas(diff.get());
		for (std::size_t d = 0; d < deltas; ++d) {
			const git_diff_delta* delta = git_diff_get_delta(diff.get(), d);
			if (delta->old_file.path) {
				result.emplace(delta->old_file.path);
			}
			if (delta->new_file.path) {
				result.emplace(delta->new_file.path);
			}
		}
	}
	return result;
}

bool GitRepository::pathChanged(const Commit& commit, std::string_view path) const
{
	CommitPtr c{lookupCommit(*repo_, parseOid(commit.id))};
	TreePtr tree{commitTree(*c)};

	const unsigned int parentCount = git_commit_parentcount(c.get());
	if (parentCount == 0) {
		TreeEntryPtr entry{treeEntry(*tree, path)};
		return entry && git_tree_entry_type(entry.get()) == GIT_OBJECT_BLOB;
	}

	if (path.empty()) {
		return false;
	}
	for (unsigned int i = 0; i < parentCount; ++i) {
		DiffPtr diff{diffAgainstParent(*repo_, *c, *tree, i, path)};
		if (git_diff_num_deltas(diff.get()) > 0) {
			return true;
		}
	}
	return false;
}

std::optional<std::string> GitRepository::readLine(
	const Commit& commit, std::string_view path, std::uint32_t lineNumber) const
{
	CommitPtr c{lookupCommit(*repo_, parseOid(commit.id))};
	TreePtr tree{commitTree(*c)};
	TreeEntryPtr entry{treeEntry(*tree, path)};
	if (!entry || git_tree_entry_type(entry.get()) != GIT_OBJECT_BLOB) {
		return std::nullopt;
	}

	git_blob* b;
	LibgitError::check(git_blob_lookup(&b, repo_.get(), git_tree_entry_id(entry.get())));
	BlobPtr blob{b};
	if (git_blob_is_binary(b)) {
		return std::nullopt;
	}

	std::string_view content{
		static_cast<const char*>(git_blob_rawcontent(b)), static_cast<std::size_t>(git_blob_rawsize(b))};
	for (std::uint32_t current = 1; !content.empty(); ++current) {
		std::string_view::size_type eol = content.find('\n');
		std::string_view line = content.substr(0, eol);
		if (current == lineNumber) {
			if (line.ends_with('\r')) {
				line.remove_suffix(1);
			}
			return std::string{line};
		}
		if (eol == std::string_view::npos) {
			break;
		}
		content.remove_prefix(eol + 1);
	}
	return std::nullopt;
}
