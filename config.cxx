#include "config.hxx"

#include "utility.hxx"

#include <git2/buffer.h>
#include <git2/config.h>
#include <git2/repository.h>

#include <utility>

RepositoryConfig::RepositoryConfig(git_repository& repo)
{
	LibgitError::check(git_repository_config_snapshot(&config_, &repo));
}

RepositoryConfig::RepositoryConfig(RepositoryConfig&& other) noexcept
	: config_{std::exchange(other.config_, nullptr)}
{
}

RepositoryConfig& RepositoryConfig::operator=(RepositoryConfig&& other) noexcept
{
	std::swap(config_, other.config_);
	return *this;
}

RepositoryConfig::~RepositoryConfig()
{
	if (config_) {
		git_config_free(config_);
	}
}

std::optional<std::string> RepositoryConfig::value(const char* key) const
{
	git_config_entry* entry;
	int error = git_config_get_entry(&entry, config_, key);
	if (error == GIT_ENOTFOUND) {
		return std::nullopt;
	}
	LibgitError::check(error);

	std::string value{entry->value};
	git_config_entry_free(entry);
	return value;
}

namespace {
	int collectValue(const git_config_entry* entry, void* payload)
	{
		static_cast<std::vector<std::string>*>(payload)->emplace_back(entry->value);
		return 0;
	}
} // namespace

std::vector<std::string> RepositoryConfig::values(const char* key) const
{
	std::vector<std::string> result;
	int error = git_config_get_multivar_foreach(config_, key, nullptr, &collectValue, &result);
	if (error == GIT_ENOTFOUND) {
		return {};
	}
	LibgitError::check(error);
	return result;
}

std::vector<std::filesystem::path> RepositoryConfig::paths(const char* key, const std::filesystem::path& base) const
{
	std::vector<std::filesystem::path> result;
	for (const std::string& configured: values(key)) {
		if (trimWhitespace(std::string_view{configured}).empty()) {
			continue;
		}

		git_buf expanded{};
		LibgitError::check(git_config_parse_path(&expanded, configured.c_str()));
		std::filesystem::path path{std::string{expanded.ptr, expanded.size}};
		git_buf_dispose(&expanded);

		result.push_back(path.is_relative() ? base / path : path);
	}
	return result;
}
