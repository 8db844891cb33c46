#pragma once

#include "errors.hxx"

#include <git2/errors.h>
#include <git2/types.h>

#include <string>
#include <string_view>

void toLower(std::string& s);
std::string toLowerCopy(std::string_view s);

bool ishex(std::string_view s);

class LibgitError: public BackendError {
public:
	LibgitError(int errorCode, const git_error* error);
	LibgitError(int error);

	/**
	 * @brief Throws LibgitError if error < 0
	 */
	static void check(int error);
};

std::string oidToString(const git_oid& id);

std::string& trimWhitespace(std::string& s);
std::string_view trimWhitespace(std::string_view s);

/// First line of a commit message without the trailing newline
std::string_view messageSummary(std::string_view message);
