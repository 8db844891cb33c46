#pragma once

#include <git2/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Read-only snapshot of the git configuration of a repository, all levels merged
 */
class RepositoryConfig {
public:
	explicit RepositoryConfig(git_repository& repo);
	RepositoryConfig(RepositoryConfig&& other) noexcept;
	RepositoryConfig& operator=(RepositoryConfig&& other) noexcept;
	~RepositoryConfig();

	RepositoryConfig(const RepositoryConfig&) = delete;
	RepositoryConfig& operator=(const RepositoryConfig&) = delete;

	/// Effective value of @p key, std::nullopt if it is not set
	std::optional<std::string> value(const char* key) const;

	/// Every value of the multi-valued @p key, in configuration order
	std::vector<std::string> values(const char* key) const;

	/**
	 * @brief Non-empty values of @p key as paths
	 *
	 * A leading '~/' is expanded to the home directory, remaining relative paths are taken relative to @p base.
	 */
	std::vector<std::filesystem::path> paths(const char* key, const std::filesystem::path& base) const;

private:
	git_config* config_;
};
